#pragma once

/// @file include/seqa/engine.hpp
/// @brief Report Engine: one normalization + one analytical component per job.
///
/// # Module: Report Engine
///
/// ## Responsibility
/// Wire the EventNormalizer to each analytical component with an explicit
/// configuration, the way a scheduled report job invokes the library:
///
///   raw records ─► EventNormalizer ─┬─► RunDetector          (streak_report)
///                                   ├─► TemporalNormalizer   (trend_report)
///                                   └─► PairwiseAggregator   (head_to_head_report)
///
/// ## Usage
/// ```cpp
/// EngineConfig cfg;
/// cfg.schema.entity_field = "player";
/// cfg.schema.time_field   = "end_time";
/// cfg.schema.domain       = {"win", "loss", "draw"};
/// Engine engine(cfg);
/// auto report = engine.streak_report(*DataLoader::load_csv("games.csv"));
/// ```
///
/// ## Errors
/// A ValidationError from any stage aborts the report; no partial result is
/// returned.
///
/// ## Guarantees
/// - No global state: everything comes from the EngineConfig
/// - Report methods are const and safe to call concurrently

#include "seqa/constants.hpp"
#include "seqa/matchup.hpp"
#include "seqa/normalizer.hpp"
#include "seqa/runs.hpp"
#include "seqa/temporal.hpp"
#include "seqa/types.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace seqa::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

struct EngineConfig {
    /// Field mapping and coercion rules for the raw records.
    ingest::Schema schema{};

    runs::RunConfig          runs{};
    temporal::TemporalConfig temporal{};
    matchup::MatchupConfig   matchup{};

    /// Runs at least this long count as streaks in StreakReport::summaries.
    std::size_t streak_threshold = constants::DEFAULT_STREAK_THRESHOLD;

    /// If true, print per-stage row counts to stderr.
    bool verbose = false;
};

// ─── Reports ──────────────────────────────────────────────────────────────────

struct StreakReport {
    std::vector<runs::Run>        runs;
    std::vector<runs::RunSummary> summaries;

    /// Summary table.
    [[nodiscard]] std::string to_string() const;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Normalize, then detect runs per entity.
    ///
    /// With `CategorySource::Winner` the matchup events are first expanded
    /// into one win/loss/draw event per player (restricted to
    /// `config.runs.allow_list` when set).
    [[nodiscard]] StreakReport
    streak_report(std::span<const ingest::RawRecord> records) const;

    /// Normalize, then compute peak and period-over-period percentages with
    /// one series per entity.
    [[nodiscard]] std::vector<temporal::TemporalPoint>
    trend_report(std::span<const ingest::RawRecord> records) const;

    /// Normalize (winner-derived slot outcomes), then aggregate head-to-head
    /// records.
    [[nodiscard]] std::vector<matchup::MatchupAggregate>
    head_to_head_report(std::span<const ingest::RawRecord> records) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::vector<Event>
    normalize(std::span<const ingest::RawRecord> records, const char* report) const;

    EngineConfig config_;
};

}  // namespace seqa::core
