#pragma once

#include <cstddef>
#include <string_view>

/// @file include/seqa/constants.hpp
/// @brief Defaults and shared vocabulary for the SEQA engine.
///
/// Every value here is a default only: each config struct takes its own
/// copy and callers override per report.

namespace seqa::constants {

// ─── Outcome Vocabulary ───────────────────────────────────────────────────────

/// Slot outcomes of a matchup event, relative to the recorded participant
/// order (first = white/home, second = black/away).
static constexpr std::string_view OUTCOME_FIRST  = "first";
static constexpr std::string_view OUTCOME_SECOND = "second";
static constexpr std::string_view OUTCOME_DRAW   = "draw";

/// Per-player outcomes produced when a matchup event is expanded into one
/// event per participant.
static constexpr std::string_view OUTCOME_WIN  = "win";
static constexpr std::string_view OUTCOME_LOSS = "loss";

/// Entity id used when a schema tracks a single, global series.
static constexpr std::string_view GLOBAL_ENTITY = "global";

// ─── Rounding ─────────────────────────────────────────────────────────────────

/// Decimal places for rates and period-over-period changes.
static constexpr int RATE_PRECISION = 1;

/// Decimal places for generic ratios.
static constexpr int RATIO_PRECISION = 2;

/// Largest precision accepted by round_half_away(); larger requests clamp.
static constexpr int MAX_PRECISION = 12;

// ─── Temporal Defaults ────────────────────────────────────────────────────────

/// Lag for year-over-year change on monthly data.
static constexpr std::size_t YEAR_OVER_YEAR_LAG = 12;

/// Default period-over-period lag.
static constexpr std::size_t DEFAULT_LAG = 1;

// ─── Matchup Defaults ─────────────────────────────────────────────────────────

/// Minimum number of games for a pair to be reported.
static constexpr std::size_t DEFAULT_MIN_GAMES = 1;

/// A side dominates when its wins exceed the other side's by this factor.
static constexpr double DEFAULT_DOMINANCE_FACTOR = 1.5;

// ─── Run Defaults ─────────────────────────────────────────────────────────────

/// Minimum run length counted as a "hot" or "tilt" streak in summaries.
static constexpr std::size_t DEFAULT_STREAK_THRESHOLD = 3;

} // namespace seqa::constants
