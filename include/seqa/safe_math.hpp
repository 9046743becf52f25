#pragma once

/// @file include/seqa/safe_math.hpp
/// @brief Safe division and SQL-style rounding shared by every ratio.
///
/// # Policy
/// A ratio whose denominator is zero, absent or non-finite is undefined and
/// is returned as `nullopt`. Nothing here throws, and no ratio ever yields
/// ±infinity or NaN.
///
/// Rounding is half away from zero, matching SQL `ROUND`.

#include "seqa/constants.hpp"

#include <optional>

namespace seqa {

/// numerator / denominator, or `nullopt` when either side is absent or
/// non-finite, or the denominator is zero.
[[nodiscard]] std::optional<double>
safe_divide(std::optional<double> numerator,
            std::optional<double> denominator) noexcept;

/// Round to `digits` decimal places, half away from zero.
/// Negative `digits` are treated as 0; digits above MAX_PRECISION clamp.
[[nodiscard]] double round_half_away(double x, int digits) noexcept;

/// round(numerator / denominator * 100, digits), or `nullopt` when the
/// division is undefined. Used for answer rate, acceptance rate, win rate.
[[nodiscard]] std::optional<double>
rate_pct(std::optional<double> numerator,
         std::optional<double> denominator,
         int digits = constants::RATE_PRECISION) noexcept;

/// round((current - prior) / prior * 100, digits), or `nullopt` when the
/// prior value is zero or either value is absent.
[[nodiscard]] std::optional<double>
change_pct(std::optional<double> current,
           std::optional<double> prior,
           int digits = constants::RATE_PRECISION) noexcept;

} // namespace seqa
