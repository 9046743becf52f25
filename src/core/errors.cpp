/// @file src/core/errors.cpp
/// @brief ValidationError message formatting.

#include "seqa/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace seqa {

namespace {

[[nodiscard]] std::string describe(const std::optional<std::size_t>& record_index,
                                   const std::string& field,
                                   const std::string& reason) {
    if (record_index) {
        return fmt::format("record {}: field '{}': {}", *record_index, field, reason);
    }
    return fmt::format("field '{}': {}", field, reason);
}

}  // namespace

ValidationError::ValidationError(std::optional<std::size_t> record_index,
                                 std::string field,
                                 const std::string& reason)
    : std::runtime_error(describe(record_index, field, reason))
    , record_index_(record_index)
    , field_(std::move(field))
{}

}  // namespace seqa
