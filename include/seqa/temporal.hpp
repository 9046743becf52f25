#pragma once

/// @file include/seqa/temporal.hpp
/// @brief Temporal Normalizer: peak normalization and period-over-period change.
///
/// # Module: Temporal Normalizer
///
/// ## Responsibility
/// For every point of a uniquely keyed, ordered series of (period, value):
///   - pct_of_peak            = round(value / peak × 100, precision)
///   - period_over_period_pct = round((v − v[−lag]) / v[−lag] × 100, precision)
///   - label                  = configured LabelClassifier over a measure
///
/// ## Peak Scope
///   - Series : max over the point's own series (per tag)
///   - Global : max over every point of the input
///   - ToDate : running max up to and including the point's period
///
/// ## Lag
/// `v[−lag]` is the value `lag` POSITIONS earlier in the sorted series, not
/// `lag` calendar periods earlier: a missing month shifts the comparison.
/// Year-over-year on monthly data is `lag = 12`.
///
/// ## Safe Divide
/// Division by zero or by an absent value yields `nullopt` in the affected
/// field. Nothing here raises for undefined ratios.
///
/// ## Guarantees
/// - The point holding the series maximum has pct_of_peak exactly 100.0
///   (Series scope, positive peak)
/// - Output grouped by series (first appearance), periods ascending
/// - Stateless: TemporalNormalizer is pure; StreamingPeriodChange is the
///   incremental form

#include "seqa/constants.hpp"
#include "seqa/labels.hpp"
#include "seqa/types.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace seqa::temporal {

// ─── Types ────────────────────────────────────────────────────────────────────

/// One input row of a series.
struct SeriesPoint {
    std::string           series;  ///< Grouping key (tag); "global" for one series
    OrderKey              period;  ///< Month or day key; unique per series
    std::optional<double> value;   ///< nullopt = NULL
};

/// One output row.
struct TemporalPoint {
    std::string                series;
    OrderKey                   period;
    std::optional<double>      value;
    std::optional<double>      peak;                    ///< Peak the percentage is taken of
    std::optional<double>      pct_of_peak;             ///< nullopt when peak is 0 / undefined
    std::optional<double>      period_over_period_pct;  ///< nullopt for the first `lag` points
    std::optional<std::string> label;

    /// Percentages are rendered with `precision` decimals.
    [[nodiscard]] std::string to_string(int precision = constants::RATE_PRECISION) const;
};

enum class PeakScope {
    Series,
    Global,
    ToDate,
};

/// Which measure of a point the label classifier sees.
enum class LabelMeasure {
    Period,  ///< period as epoch seconds (compare with OrderKey::value bounds)
    Year,    ///< calendar year of the period
    Month,   ///< calendar month (1–12) of the period
    Value,   ///< the point's value (NaN when absent)
};

struct TemporalConfig {
    /// Positional lag for period-over-period change. 0 is treated as 1.
    std::size_t lag = constants::DEFAULT_LAG;

    /// Decimal places for both percentages.
    int precision = constants::RATE_PRECISION;

    PeakScope peak_scope = PeakScope::Series;

    /// Era labels; an empty classifier leaves `label` unset.
    LabelClassifier labels;
    LabelMeasure    label_measure = LabelMeasure::Period;
};

// ─── TemporalNormalizer ───────────────────────────────────────────────────────

class TemporalNormalizer {
public:
    TemporalNormalizer() = delete;  // pure static

    /// Compute derived fields for every point.
    ///
    /// # Throws
    /// `ValidationError` when a period appears twice within one series.
    [[nodiscard]] static std::vector<TemporalPoint>
    compute(std::span<const SeriesPoint> points,
            const TemporalConfig& config = TemporalConfig{});

    /// Series points from normalized events: series = entity_id,
    /// period = occurred_at, value = value.
    [[nodiscard]] static std::vector<SeriesPoint>
    from_events(std::span<const Event> events);

    /// The measure a label classifier sees for `point`.
    [[nodiscard]] static double
    measure_of(const TemporalPoint& point, LabelMeasure measure) noexcept;
};

// ─── StreamingPeriodChange ────────────────────────────────────────────────────

/// Incremental period-over-period change.
///
/// Holds, per series, a window of the last `lag` values. Each `push` returns
/// the change against the value `lag` positions back, then slides the window.
///
/// Not thread-safe.
class StreamingPeriodChange {
public:
    explicit StreamingPeriodChange(std::size_t lag = constants::DEFAULT_LAG,
                                   int precision   = constants::RATE_PRECISION) noexcept;

    /// # Returns
    /// The change in percent, or `nullopt` while fewer than `lag` prior
    /// values exist or when the prior value is zero / absent.
    ///
    /// # Throws
    /// `ValidationError` if `point.period` does not increase strictly within
    /// its series.
    [[nodiscard]] std::optional<double> push(const SeriesPoint& point);

    /// Forget every series.
    void reset() noexcept;

    [[nodiscard]] std::size_t lag() const noexcept { return lag_; }

private:
    struct Window {
        std::deque<std::optional<double>> values;
        OrderKey                          last_period;
    };

    std::size_t                             lag_;
    int                                     precision_;
    std::unordered_map<std::string, Window> windows_;
};

}  // namespace seqa::temporal
