/// @file src/core/safe_math.cpp
/// @brief Safe division and half-away-from-zero rounding.

#include "seqa/safe_math.hpp"

#include <algorithm>
#include <cmath>

namespace seqa {

std::optional<double>
safe_divide(std::optional<double> numerator,
            std::optional<double> denominator) noexcept {
    if (!numerator || !denominator)        return std::nullopt;
    if (!std::isfinite(*numerator))        return std::nullopt;
    if (!std::isfinite(*denominator))      return std::nullopt;
    if (*denominator == 0.0)               return std::nullopt;  // NULLIF(den, 0)

    const double q = *numerator / *denominator;
    if (!std::isfinite(q)) return std::nullopt;  // overflow on tiny denominators
    return q;
}

double round_half_away(double x, int digits) noexcept {
    if (!std::isfinite(x)) return x;
    digits = std::clamp(digits, 0, constants::MAX_PRECISION);

    const double scale = std::pow(10.0, digits);
    const double scaled = x * scale;
    if (!std::isfinite(scaled)) return x;

    // std::round rounds halfway cases away from zero.
    return std::round(scaled) / scale;
}

std::optional<double>
rate_pct(std::optional<double> numerator,
         std::optional<double> denominator,
         int digits) noexcept {
    const auto q = safe_divide(numerator, denominator);
    if (!q) return std::nullopt;
    return round_half_away(*q * 100.0, digits);
}

std::optional<double>
change_pct(std::optional<double> current,
           std::optional<double> prior,
           int digits) noexcept {
    if (!current || !prior) return std::nullopt;
    const auto q = safe_divide(*current - *prior, prior);
    if (!q) return std::nullopt;
    return round_half_away(*q * 100.0, digits);
}

}  // namespace seqa
