#pragma once

/// @file include/seqa/matchup.hpp
/// @brief Pairwise Aggregator: head-to-head records over canonical pairs.
///
/// # Module: Pairwise Aggregator
///
/// ## Responsibility
/// Fold matchup events (two participants + slot outcome) into per-pair
/// win/draw counts keyed by an order-independent MatchupKey.
///
/// ## Canonicalization
///   key = (min(a, b), max(a, b))   after the identifier case policy
/// Outcomes are attributed to the canonical first/second side; the recorded
/// slots (white/black, home/away) are discarded once the key is built, so
/// (A, B, A wins) and (B, A, A wins) land on the same side of the same key.
///
/// ## Edge Cases
/// - a == b after case normalization: degenerate, rejected (ValidationError)
/// - Pairs with fewer than `min_games` games: filtered out
///
/// ## Output Ordering
/// `total` descending, ties by key (lexicographic) for determinism.

#include "seqa/constants.hpp"
#include "seqa/types.hpp"

#include <compare>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace seqa::matchup {

// ─── MatchupKey ───────────────────────────────────────────────────────────────

/// Canonical unordered pair: `first < second` always holds.
struct MatchupKey {
    std::string first;
    std::string second;

    auto operator<=>(const MatchupKey&) const = default;

    /// Canonicalize `(a, b)` under `policy`.
    ///
    /// # Returns
    /// `nullopt` if either side is empty or both sides are equal after case
    /// normalization.
    [[nodiscard]] static std::optional<MatchupKey>
    make(std::string_view a, std::string_view b, IdCase policy = IdCase::Lower);

    /// `first vs second`
    [[nodiscard]] std::string to_string() const;
};

// ─── MatchupAggregate ─────────────────────────────────────────────────────────

struct MatchupAggregate {
    MatchupKey  key;
    std::size_t first_wins  = 0;
    std::size_t second_wins = 0;
    std::size_t draws       = 0;
    std::size_t total       = 0;  ///< first_wins + second_wins + draws, ≥ 1
    OrderKey    first_played;     ///< Earliest occurred_at
    OrderKey    last_played;      ///< Latest occurred_at

    /// First side's wins as a percentage of decisive games (1 decimal).
    /// `nullopt` when every game was drawn.
    [[nodiscard]] std::optional<double> first_win_pct() const noexcept;

    /// first_wins / second_wins (2 decimals); `nullopt` when the second side
    /// never won.
    [[nodiscard]] std::optional<double> win_ratio() const noexcept;

    /// first_wins − second_wins.
    [[nodiscard]] long long win_differential() const noexcept;

    [[nodiscard]] std::string to_string() const;
};

// ─── Dominance ────────────────────────────────────────────────────────────────

enum class Dominance {
    FirstDominates,
    SecondDominates,
    CloseRivalry,
};

/// `FirstDominates` when first_wins > second_wins × factor, the mirror case
/// for `SecondDominates`, otherwise `CloseRivalry`.
[[nodiscard]] Dominance
classify_dominance(const MatchupAggregate& agg,
                   double factor = constants::DEFAULT_DOMINANCE_FACTOR) noexcept;

/// `"<id> DOMINATES"` or `"CLOSE RIVALRY"`.
[[nodiscard]] std::string describe(const MatchupAggregate& agg, Dominance d);

// ─── Configuration ────────────────────────────────────────────────────────────

/// How the allow-list restricts a pair.
enum class AllowMode {
    Either,  ///< At least one participant is tracked
    Both,    ///< Both participants are tracked
};

struct MatchupConfig {
    std::size_t              min_games        = constants::DEFAULT_MIN_GAMES;
    IdCase                   id_case          = IdCase::Lower;
    std::optional<AllowList> allow_list;
    AllowMode                allow_mode       = AllowMode::Either;
    double                   dominance_factor = constants::DEFAULT_DOMINANCE_FACTOR;
};

// ─── PairwiseAggregator ───────────────────────────────────────────────────────

class PairwiseAggregator {
public:
    PairwiseAggregator() = delete;  // pure static

    /// Aggregate head-to-head records.
    ///
    /// Each event must carry participants and a slot outcome category
    /// (`first`, `second` or `draw`).
    ///
    /// # Throws
    /// `ValidationError` for an event without participants, with an unknown
    /// outcome, or whose participants are equal after case normalization.
    [[nodiscard]] static std::vector<MatchupAggregate>
    aggregate(std::span<const Event> events,
              const MatchupConfig& config = MatchupConfig{});
};

}  // namespace seqa::matchup
