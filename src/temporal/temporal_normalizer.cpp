/// @file src/temporal/temporal_normalizer.cpp
/// @brief TemporalNormalizer: peak percentages and lagged change per series.
///
/// Each series is copied into an Eigen array with a presence mask, so the
/// ratio arithmetic runs as whole-array expressions. Division by a zero peak
/// or prior value produces ±inf/NaN in the scratch arrays; those lanes are
/// masked out before rounding and never reach the output.

#include "seqa/temporal.hpp"
#include "seqa/errors.hpp"
#include "seqa/safe_math.hpp"

#include <Eigen/Dense>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace seqa::temporal {

namespace {

using Mask = Eigen::Array<bool, Eigen::Dynamic, 1>;

constexpr double NEG_INF = -std::numeric_limits<double>::infinity();

/// Max over present lanes, or nullopt if no lane is present.
[[nodiscard]] std::optional<double>
masked_max(const Eigen::ArrayXd& values, const Mask& present) {
    if (!present.any()) return std::nullopt;
    return present.select(values, Eigen::ArrayXd::Constant(values.size(), NEG_INF)).maxCoeff();
}

[[nodiscard]] std::string format_opt(const std::optional<double>& v, int precision) {
    if (!v) return "NULL";
    return fmt::format("{:.{}f}", *v, precision);
}

struct SeriesGroup {
    std::string              key;
    std::vector<std::size_t> members;  ///< indices into the input span
};

}  // namespace

// ─── TemporalPoint ────────────────────────────────────────────────────────────

std::string TemporalPoint::to_string(int precision) const {
    return fmt::format("{:<16} {:<10} value={:<10} pct_of_peak={:<7} change={:<7}{}",
        series, period.to_string(),
        format_opt(value, 0), format_opt(pct_of_peak, precision),
        format_opt(period_over_period_pct, precision),
        label ? fmt::format(" [{}]", *label) : std::string{});
}

// ─── TemporalNormalizer::measure_of ───────────────────────────────────────────

double TemporalNormalizer::measure_of(const TemporalPoint& point,
                                      LabelMeasure measure) noexcept {
    switch (measure) {
        case LabelMeasure::Period: return static_cast<double>(point.period.value);
        case LabelMeasure::Year:   return static_cast<double>(point.period.year());
        case LabelMeasure::Month:  return static_cast<double>(point.period.month());
        case LabelMeasure::Value:  return point.value.value_or(std::nan(""));
    }
    return std::nan("");
}

// ─── TemporalNormalizer::from_events ──────────────────────────────────────────

std::vector<SeriesPoint>
TemporalNormalizer::from_events(std::span<const Event> events) {
    std::vector<SeriesPoint> out;
    out.reserve(events.size());
    for (const auto& ev : events) {
        out.push_back(SeriesPoint{
            .series = ev.entity_id,
            .period = ev.occurred_at,
            .value  = ev.value,
        });
    }
    return out;
}

// ─── TemporalNormalizer::compute ──────────────────────────────────────────────

std::vector<TemporalPoint>
TemporalNormalizer::compute(std::span<const SeriesPoint> points,
                            const TemporalConfig& config) {
    const std::size_t lag = std::max<std::size_t>(config.lag, 1);

    // ── Group by series and order each group by period ────────────────────────
    std::vector<SeriesGroup> groups;
    std::unordered_map<std::string, std::size_t> group_of;
    for (std::size_t k = 0; k < points.size(); ++k) {
        const auto [it, inserted] = group_of.try_emplace(points[k].series, groups.size());
        if (inserted) groups.push_back(SeriesGroup{points[k].series, {}});
        groups[it->second].members.push_back(k);
    }

    for (auto& g : groups) {
        std::stable_sort(g.members.begin(), g.members.end(), [&](std::size_t a, std::size_t b) {
            return points[a].period < points[b].period;
        });
        for (std::size_t k = 1; k < g.members.size(); ++k) {
            if (points[g.members[k]].period == points[g.members[k - 1]].period) {
                throw ValidationError(g.members[k], "period",
                    fmt::format("duplicate period {} in series '{}'",
                                points[g.members[k]].period.to_string(), g.key));
            }
        }
    }

    // ── Global peak (only needed for PeakScope::Global) ───────────────────────
    std::optional<double> global_peak;
    if (config.peak_scope == PeakScope::Global) {
        for (const auto& p : points) {
            if (p.value && std::isfinite(*p.value)) {
                global_peak = global_peak ? std::max(*global_peak, *p.value) : *p.value;
            }
        }
    }

    std::vector<TemporalPoint> out;
    out.reserve(points.size());

    for (const auto& g : groups) {
        const auto n = static_cast<Eigen::Index>(g.members.size());

        Eigen::ArrayXd values(n);
        Mask present(n);
        for (Eigen::Index k = 0; k < n; ++k) {
            const auto& v = points[g.members[static_cast<std::size_t>(k)]].value;
            present[k] = v.has_value() && std::isfinite(*v);
            values[k]  = present[k] ? *v : 0.0;
        }

        // ── Peak per point ────────────────────────────────────────────────────
        Eigen::ArrayXd peaks(n);
        Mask has_peak(n);
        switch (config.peak_scope) {
            case PeakScope::Series: {
                const auto peak = masked_max(values, present);
                peaks.setConstant(peak.value_or(0.0));
                has_peak.setConstant(peak.has_value());
                break;
            }
            case PeakScope::Global:
                peaks.setConstant(global_peak.value_or(0.0));
                has_peak.setConstant(global_peak.has_value());
                break;
            case PeakScope::ToDate: {
                std::optional<double> running;
                for (Eigen::Index k = 0; k < n; ++k) {
                    if (present[k]) running = running ? std::max(*running, values[k]) : values[k];
                    peaks[k]    = running.value_or(0.0);
                    has_peak[k] = running.has_value();
                }
                break;
            }
        }

        // pct_of_peak = value / peak × 100, defined where value and a non-zero
        // peak are both present.
        const Eigen::ArrayXd pct = values / peaks * 100.0;
        const Mask pct_ok = present && has_peak && (peaks != 0.0);

        // period-over-period, positional lag.
        Eigen::ArrayXd change = Eigen::ArrayXd::Zero(n);
        Mask change_ok = Mask::Constant(n, false);
        if (lag < g.members.size()) {
            const auto m = static_cast<Eigen::Index>(g.members.size() - lag);
            const auto prior   = values.head(m);
            const auto current = values.tail(m);
            change.tail(m)    = (current - prior) / prior * 100.0;
            change_ok.tail(m) = present.head(m) && present.tail(m) && (prior != 0.0);
        }

        for (Eigen::Index k = 0; k < n; ++k) {
            const auto& src = points[g.members[static_cast<std::size_t>(k)]];
            TemporalPoint tp{
                .series                 = src.series,
                .period                 = src.period,
                .value                  = present[k] ? std::optional<double>{values[k]} : std::nullopt,
                .peak                   = has_peak[k] ? std::optional<double>{peaks[k]} : std::nullopt,
                .pct_of_peak            = std::nullopt,
                .period_over_period_pct = std::nullopt,
                .label                  = std::nullopt,
            };
            if (pct_ok[k] && std::isfinite(pct[k])) {
                tp.pct_of_peak = round_half_away(pct[k], config.precision);
            }
            if (change_ok[k] && std::isfinite(change[k])) {
                tp.period_over_period_pct = round_half_away(change[k], config.precision);
            }
            if (!config.labels.empty()) {
                tp.label = config.labels.classify(measure_of(tp, config.label_measure));
            }
            out.push_back(std::move(tp));
        }
    }

    return out;
}

// ─── StreamingPeriodChange ────────────────────────────────────────────────────

StreamingPeriodChange::StreamingPeriodChange(std::size_t lag, int precision) noexcept
    : lag_(lag < 1 ? 1 : lag)
    , precision_(precision)
{}

std::optional<double> StreamingPeriodChange::push(const SeriesPoint& point) {
    auto [it, inserted] = windows_.try_emplace(point.series);
    Window& w = it->second;

    if (!inserted && !(w.last_period < point.period)) {
        throw ValidationError(std::nullopt, "period",
            fmt::format("period {} does not follow {} in series '{}'",
                        point.period.to_string(), w.last_period.to_string(), point.series));
    }
    w.last_period = point.period;

    std::optional<double> result;
    if (w.values.size() == lag_) {
        result = change_pct(point.value, w.values.front(), precision_);
        w.values.pop_front();
    }
    w.values.push_back(point.value);
    return result;
}

void StreamingPeriodChange::reset() noexcept {
    windows_.clear();
}

}  // namespace seqa::temporal
