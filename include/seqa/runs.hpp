#pragma once

/// @file include/seqa/runs.hpp
/// @brief Run Detector: maximal runs of a constant category per entity.
///
/// # Module: Run Detector
///
/// ## Responsibility
/// For each entity, scan its time-ordered events once and emit every maximal
/// run of constant `category` (consecutive wins, consecutive gloomy days).
///
/// ## Algorithm (gaps and islands)
/// Within one entity, event k gets two counters:
///   i = position of k in the entity's ordered sequence
///   j = position of k among the entity's events with the same category
/// The island id `i − j` is constant inside a maximal run and changes exactly
/// at a category transition, so `(entity, category, i − j)` identifies a run.
///
/// Example: [win, win, loss, win, win, win]
///   i     = 0 1 2 3 4 5
///   j     = 0 1 0 2 3 4
///   i − j = 0 0 2 1 1 1   →  (win,2) (loss,1) (win,3)
///
/// ## Edge Cases
/// - Single-event entity: one run of length 1
/// - Empty input: no runs (not an error)
/// - Any number of categories
///
/// ## Guarantees
/// - Pure and idempotent; RunDetector keeps no state
/// - Sum of run lengths per entity = number of the entity's events
/// - Adjacent runs of one entity always differ in category
///
/// ## NOT Responsible For
/// - Picking the longest run (callers aggregate with `longest` / `summarize`)

#include "seqa/constants.hpp"
#include "seqa/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace seqa::runs {

// ─── Types ────────────────────────────────────────────────────────────────────

/// A maximal contiguous run of one entity's events sharing a category.
struct Run {
    std::string entity_id;
    std::string category;
    std::size_t length;  ///< ≥ 1
    OrderKey    start;   ///< occurred_at of the first event in the run
    OrderKey    end;     ///< occurred_at of the last event in the run

    bool operator==(const Run&) const = default;

    /// One-line rendering, e.g. `hikaru win ×3 [2024-01-02 → 2024-01-05]`.
    [[nodiscard]] std::string to_string() const;
};

/// Per (entity, category) aggregate over detected runs.
struct RunSummary {
    std::string entity_id;
    std::string category;
    std::size_t longest;        ///< MAX(length)
    std::size_t run_count;      ///< Number of runs
    std::size_t streak_count;   ///< Runs with length ≥ threshold

    [[nodiscard]] std::string to_string() const;
};

struct RunConfig {
    /// Declared categorical domain; a category outside it is a
    /// ValidationError. Empty = unrestricted.
    std::vector<std::string> domain;

    /// Entities to keep; others are skipped. Unset = every entity.
    std::optional<AllowList> allow_list;
};

// ─── RunDetector ──────────────────────────────────────────────────────────────

class RunDetector {
public:
    RunDetector() = delete;  // pure static

    /// Detect every maximal run in `events`.
    ///
    /// Events need not be pre-sorted: they are grouped by entity (first
    /// appearance) and stably ordered by `occurred_at` before the scan.
    ///
    /// # Returns
    /// Runs grouped by entity, chronological within an entity.
    ///
    /// # Throws
    /// `ValidationError` if a category is outside `config.domain`.
    [[nodiscard]] static std::vector<Run>
    detect(std::span<const Event> events, const RunConfig& config = RunConfig{});

    /// Runs of `category`, longest first (ties: earlier start first),
    /// truncated to `limit` when given.
    [[nodiscard]] static std::vector<Run>
    longest(std::span<const Run> runs,
            const std::string& category,
            std::optional<std::size_t> limit = std::nullopt);

    /// Longest run, run count and streak count per (entity, category), in
    /// order of first appearance.
    [[nodiscard]] static std::vector<RunSummary>
    summarize(std::span<const Run> runs,
              std::size_t streak_threshold = constants::DEFAULT_STREAK_THRESHOLD);
};

// ─── StreamingRunDetector ─────────────────────────────────────────────────────

/// Incremental run detection for a stream of events.
///
/// Keeps one small accumulator per entity (current category, length and
/// boundaries). A run is emitted only once it is known to be maximal: when
/// a differing category arrives for its entity, or at `finish()`.
///
/// Not thread-safe; one owner feeds the stream.
class StreamingRunDetector {
public:
    explicit StreamingRunDetector(RunConfig config = RunConfig{});

    /// Feed the next event.
    ///
    /// # Returns
    /// The run closed by this event, or `nullopt` if it extended the open run
    /// (or opened the entity's first run, or its entity is not allowed).
    ///
    /// # Throws
    /// `ValidationError` if the category is outside the domain or the event
    /// is older than the previous event of the same entity.
    [[nodiscard]] std::optional<Run> push(const Event& event);

    /// End of stream: flush every open run (entities in first-seen order)
    /// and reset all state.
    [[nodiscard]] std::vector<Run> finish();

    /// Number of entities with an open run.
    [[nodiscard]] std::size_t open_runs() const noexcept { return open_.size(); }

    /// Events accepted since construction or the last finish().
    [[nodiscard]] std::size_t events_seen() const noexcept { return seen_; }

private:
    RunConfig                            config_;
    std::unordered_map<std::string, Run> open_;   ///< entity → current run
    std::vector<std::string>             order_;  ///< entities, first-seen order
    std::size_t                          seen_ = 0;
};

}  // namespace seqa::runs
