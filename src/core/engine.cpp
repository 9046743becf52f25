/// @file src/core/engine.cpp
/// @brief Report Engine: normalization wired to each analytical component.

#include "seqa/engine.hpp"

#include <fmt/format.h>

#include <utility>

namespace seqa::core {

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
{}

// ─── Engine::normalize ────────────────────────────────────────────────────────

std::vector<Event>
Engine::normalize(std::span<const ingest::RawRecord> records, const char* report) const {
    auto events = ingest::EventNormalizer::normalize(records, config_.schema);
    if (config_.verbose) {
        fmt::print(stderr, "[seqa] {}: normalized {} records into {} events\n",
                   report, records.size(), events.size());
    }
    return events;
}

// ─── Engine::streak_report ────────────────────────────────────────────────────

StreakReport
Engine::streak_report(std::span<const ingest::RawRecord> records) const {
    auto events = normalize(records, "streaks");

    if (config_.schema.category_source == ingest::CategorySource::Winner) {
        // One win/loss/draw event per tracked player.
        events = ingest::EventNormalizer::player_perspectives(
            events, config_.runs.allow_list, config_.matchup.id_case);
        if (config_.verbose) {
            fmt::print(stderr, "[seqa] streaks: expanded into {} player events\n",
                       events.size());
        }
    }

    StreakReport report;
    report.runs      = runs::RunDetector::detect(events, config_.runs);
    report.summaries = runs::RunDetector::summarize(report.runs, config_.streak_threshold);

    if (config_.verbose) {
        fmt::print(stderr, "[seqa] streaks: {} runs, {} entity/category summaries\n",
                   report.runs.size(), report.summaries.size());
    }
    return report;
}

// ─── Engine::trend_report ─────────────────────────────────────────────────────

std::vector<temporal::TemporalPoint>
Engine::trend_report(std::span<const ingest::RawRecord> records) const {
    const auto events = normalize(records, "trend");
    const auto series = temporal::TemporalNormalizer::from_events(events);
    auto points = temporal::TemporalNormalizer::compute(series, config_.temporal);

    if (config_.verbose) {
        fmt::print(stderr, "[seqa] trend: {} points (lag {})\n",
                   points.size(), config_.temporal.lag);
    }
    return points;
}

// ─── Engine::head_to_head_report ──────────────────────────────────────────────

std::vector<matchup::MatchupAggregate>
Engine::head_to_head_report(std::span<const ingest::RawRecord> records) const {
    const auto events = normalize(records, "h2h");
    auto pairs = matchup::PairwiseAggregator::aggregate(events, config_.matchup);

    if (config_.verbose) {
        fmt::print(stderr, "[seqa] h2h: {} pairs with at least {} games\n",
                   pairs.size(), config_.matchup.min_games);
    }
    return pairs;
}

// ─── StreakReport ─────────────────────────────────────────────────────────────

std::string StreakReport::to_string() const {
    std::string out = fmt::format("{} runs across {} entity/category pairs\n",
                                  runs.size(), summaries.size());
    for (const auto& s : summaries) {
        out += s.to_string();
        out += '\n';
    }
    return out;
}

}  // namespace seqa::core
