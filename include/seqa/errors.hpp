#pragma once

/// @file include/seqa/errors.hpp
/// @brief ValidationError: data-contract violation in an input record.
///
/// Thrown for malformed input only (missing required field, category outside
/// the declared domain, degenerate self-pair, duplicate period, out-of-order
/// streaming input). It aborts the enclosing report; nothing retries it.
///
/// Undefined ratios are not errors: they surface as `std::nullopt` in the
/// affected output field.

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace seqa {

class ValidationError : public std::runtime_error {
public:
    /// # Arguments
    /// * `record_index`: Position of the offending record in its input, if known
    /// * `field`       : Name of the offending field
    /// * `reason`      : What is wrong with it
    ValidationError(std::optional<std::size_t> record_index,
                    std::string field,
                    const std::string& reason);

    [[nodiscard]] const std::optional<std::size_t>& record_index() const noexcept {
        return record_index_;
    }
    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::optional<std::size_t> record_index_;
    std::string                field_;
};

} // namespace seqa
