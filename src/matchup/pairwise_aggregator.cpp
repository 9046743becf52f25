/// @file src/matchup/pairwise_aggregator.cpp
/// @brief MatchupKey, MatchupAggregate and PairwiseAggregator.

#include "seqa/matchup.hpp"
#include "seqa/errors.hpp"
#include "seqa/safe_math.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <map>
#include <utility>

namespace seqa::matchup {

// ─── MatchupKey ───────────────────────────────────────────────────────────────

std::optional<MatchupKey>
MatchupKey::make(std::string_view a, std::string_view b, IdCase policy) {
    if (a.empty() || b.empty()) return std::nullopt;

    std::string x = normalize_id(a, policy);
    std::string y = normalize_id(b, policy);
    if (x == y) return std::nullopt;  // self-pair

    if (y < x) std::swap(x, y);
    return MatchupKey{std::move(x), std::move(y)};
}

std::string MatchupKey::to_string() const {
    return fmt::format("{} vs {}", first, second);
}

// ─── MatchupAggregate ─────────────────────────────────────────────────────────

std::optional<double> MatchupAggregate::first_win_pct() const noexcept {
    // NULLIF(decisive, 0)
    return rate_pct(static_cast<double>(first_wins),
                    static_cast<double>(first_wins + second_wins));
}

std::optional<double> MatchupAggregate::win_ratio() const noexcept {
    const auto q = safe_divide(static_cast<double>(first_wins),
                               static_cast<double>(second_wins));
    if (!q) return std::nullopt;
    return round_half_away(*q, constants::RATIO_PRECISION);
}

long long MatchupAggregate::win_differential() const noexcept {
    return static_cast<long long>(first_wins) - static_cast<long long>(second_wins);
}

std::string MatchupAggregate::to_string() const {
    const auto pct = first_win_pct();
    return fmt::format("{:<36} {:>4}-{:<4} draws={:<4} total={:<5} p1%={:<6} [{} -> {}]",
        key.to_string(), first_wins, second_wins, draws, total,
        pct ? fmt::format("{:.1f}", *pct) : std::string("NULL"),
        first_played.to_string(), last_played.to_string());
}

// ─── Dominance ────────────────────────────────────────────────────────────────

Dominance classify_dominance(const MatchupAggregate& agg, double factor) noexcept {
    const auto first  = static_cast<double>(agg.first_wins);
    const auto second = static_cast<double>(agg.second_wins);
    if (first > second * factor)  return Dominance::FirstDominates;
    if (second > first * factor)  return Dominance::SecondDominates;
    return Dominance::CloseRivalry;
}

std::string describe(const MatchupAggregate& agg, Dominance d) {
    switch (d) {
        case Dominance::FirstDominates:  return agg.key.first  + " DOMINATES";
        case Dominance::SecondDominates: return agg.key.second + " DOMINATES";
        case Dominance::CloseRivalry:    break;
    }
    return "CLOSE RIVALRY";
}

// ─── PairwiseAggregator::aggregate ────────────────────────────────────────────

std::vector<MatchupAggregate>
PairwiseAggregator::aggregate(std::span<const Event> events, const MatchupConfig& config) {
    std::map<MatchupKey, MatchupAggregate> by_key;

    for (std::size_t i = 0; i < events.size(); ++i) {
        const Event& ev = events[i];
        if (!ev.participants) {
            throw ValidationError(i, "participants", "matchup event has no participants");
        }
        const Participants& p = *ev.participants;

        auto key = MatchupKey::make(p.first, p.second, config.id_case);
        if (!key) {
            throw ValidationError(i, "participants",
                fmt::format("degenerate matchup '{}' vs '{}'", p.first, p.second));
        }

        // Winner in canonical terms: the slot label is dropped here.
        std::optional<std::string> winner;
        if (ev.category == constants::OUTCOME_FIRST) {
            winner = normalize_id(p.first, config.id_case);
        } else if (ev.category == constants::OUTCOME_SECOND) {
            winner = normalize_id(p.second, config.id_case);
        } else if (ev.category != constants::OUTCOME_DRAW) {
            throw ValidationError(i, "category",
                fmt::format("'{}' is not a matchup outcome", ev.category));
        }

        if (config.allow_list) {
            const bool a = config.allow_list->contains(p.first);
            const bool b = config.allow_list->contains(p.second);
            const bool keep = config.allow_mode == AllowMode::Both ? (a && b) : (a || b);
            if (!keep) continue;
        }

        auto [it, inserted] = by_key.try_emplace(*key);
        MatchupAggregate& agg = it->second;
        if (inserted) {
            agg.key          = *key;
            agg.first_played = ev.occurred_at;
            agg.last_played  = ev.occurred_at;
        }

        if (!winner) {
            ++agg.draws;
        } else if (*winner == key->first) {
            ++agg.first_wins;
        } else {
            ++agg.second_wins;
        }
        ++agg.total;

        agg.first_played = std::min(agg.first_played, ev.occurred_at);
        agg.last_played  = std::max(agg.last_played,  ev.occurred_at);
    }

    std::vector<MatchupAggregate> out;
    out.reserve(by_key.size());
    for (auto& [key, agg] : by_key) {
        if (agg.total >= config.min_games) {
            out.push_back(std::move(agg));
        }
    }

    // by_key iterates in key order, so a stable sort on total alone leaves
    // ties ordered by key.
    std::stable_sort(out.begin(), out.end(),
        [](const MatchupAggregate& a, const MatchupAggregate& b) {
            return a.total > b.total;
        });
    return out;
}

}  // namespace seqa::matchup
