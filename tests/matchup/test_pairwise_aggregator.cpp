/// @file tests/matchup/test_pairwise_aggregator.cpp
/// @brief Unit tests for MatchupKey canonicalization and PairwiseAggregator.
///
/// Verifies:
///   - Swapping the recorded slots lands on the same key and side
///   - Case-insensitive identifiers collapse to one key
///   - min_games keeps pairs at the boundary and drops those below it
///   - Output ordered by total desc, ties by key
///   - Dominance classification at the 1.5× factor
///   - Degenerate, unknown-outcome and participant-less events are rejected

#include <gtest/gtest.h>
#include "seqa/matchup.hpp"
#include "seqa/errors.hpp"

#include <string>
#include <vector>

using namespace seqa;
using namespace seqa::matchup;

// ─── Helpers ─────────────────────────────────────────────────────────────────

/// A matchup event; `outcome` is "first", "second" or "draw" in slot terms.
static Event game(const std::string& first, const std::string& second,
                  const std::string& outcome, unsigned day = 1) {
    return Event{
        .entity_id    = "global",
        .occurred_at  = OrderKey::from_date(2024, 5, day),
        .category     = outcome,
        .value        = std::nullopt,
        .participants = Participants{first, second},
    };
}

// ─── MatchupKey ──────────────────────────────────────────────────────────────

TEST(MatchupKey_Make, Canonical) {
    const auto k1 = MatchupKey::make("magnus", "hikaru");
    const auto k2 = MatchupKey::make("hikaru", "magnus");
    ASSERT_TRUE(k1.has_value());
    ASSERT_TRUE(k2.has_value());
    EXPECT_EQ(*k1, *k2);
    EXPECT_EQ(k1->first, "hikaru");
    EXPECT_EQ(k1->second, "magnus");
    EXPECT_EQ(k1->to_string(), "hikaru vs magnus");
}

TEST(MatchupKey_Make, CaseNormalized) {
    EXPECT_EQ(MatchupKey::make("Hikaru", "magnus"), MatchupKey::make("hikaru", "MAGNUS"));
}

TEST(MatchupKey_Make, PreserveCaseKeepsDistinctIds) {
    const auto k = MatchupKey::make("Bob", "bob", IdCase::Preserve);
    ASSERT_TRUE(k.has_value());
    EXPECT_EQ(k->first, "Bob");
}

TEST(MatchupKey_Make, Degenerate_Nullopt) {
    EXPECT_FALSE(MatchupKey::make("hikaru", "HIKARU").has_value());
    EXPECT_FALSE(MatchupKey::make("", "hikaru").has_value());
}

// ─── aggregate: symmetry ────────────────────────────────────────────────────

TEST(PairwiseAggregator, SwappedSlotsSameSide) {
    const std::vector<Event> events{
        game("A", "B", "first", 1),   // A wins as first slot
        game("B", "A", "second", 2),  // A wins as second slot
    };
    const auto out = PairwiseAggregator::aggregate(events);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].key.first, "a");
    EXPECT_EQ(out[0].first_wins, 2u);
    EXPECT_EQ(out[0].second_wins, 0u);
    EXPECT_EQ(out[0].total, 2u);
}

TEST(PairwiseAggregator, CountsAndDates) {
    const std::vector<Event> events{
        game("hikaru", "magnus", "second", 3),
        game("magnus", "hikaru", "first", 1),
        game("hikaru", "magnus", "draw", 7),
        game("hikaru", "magnus", "first", 5),
    };
    const auto out = PairwiseAggregator::aggregate(events);
    ASSERT_EQ(out.size(), 1u);
    const auto& agg = out[0];
    EXPECT_EQ(agg.first_wins, 1u);   // hikaru
    EXPECT_EQ(agg.second_wins, 2u);  // magnus
    EXPECT_EQ(agg.draws, 1u);
    EXPECT_EQ(agg.total, 4u);
    EXPECT_EQ(agg.first_wins + agg.second_wins + agg.draws, agg.total);
    EXPECT_EQ(agg.first_played, OrderKey::from_date(2024, 5, 1));
    EXPECT_EQ(agg.last_played, OrderKey::from_date(2024, 5, 7));
    EXPECT_EQ(agg.win_differential(), -1);
}

TEST(PairwiseAggregator, FirstWinPct) {
    const std::vector<Event> events{
        game("a", "b", "first"),
        game("a", "b", "first"),
        game("a", "b", "second"),
        game("a", "b", "draw"),
    };
    const auto out = PairwiseAggregator::aggregate(events);
    ASSERT_EQ(out.size(), 1u);
    ASSERT_TRUE(out[0].first_win_pct().has_value());
    EXPECT_DOUBLE_EQ(*out[0].first_win_pct(), 66.7);
}

TEST(PairwiseAggregator, WinRatio) {
    const std::vector<Event> events{
        game("a", "b", "first"),
        game("a", "b", "first"),
        game("a", "b", "second"),
        game("a", "b", "second"),
        game("a", "b", "second"),
    };
    const auto out = PairwiseAggregator::aggregate(events);
    ASSERT_EQ(out.size(), 1u);
    ASSERT_TRUE(out[0].win_ratio().has_value());
    EXPECT_DOUBLE_EQ(*out[0].win_ratio(), 0.67);
}

TEST(PairwiseAggregator, AllDraws_NoWinPct) {
    const std::vector<Event> events{game("a", "b", "draw")};
    const auto out = PairwiseAggregator::aggregate(events);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_FALSE(out[0].first_win_pct().has_value());
    EXPECT_FALSE(out[0].win_ratio().has_value());
}

// ─── aggregate: min_games and ordering ──────────────────────────────────────

TEST(PairwiseAggregator, MinGamesBoundary) {
    std::vector<Event> events;
    for (int k = 0; k < 3; ++k) events.push_back(game("a", "b", "first"));
    for (int k = 0; k < 2; ++k) events.push_back(game("c", "d", "first"));

    MatchupConfig cfg;
    cfg.min_games = 3;
    const auto out = PairwiseAggregator::aggregate(events, cfg);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].key.first, "a");
    EXPECT_EQ(out[0].total, 3u);
}

TEST(PairwiseAggregator, OrderedByTotalThenKey) {
    const std::vector<Event> events{
        game("y", "z", "first"),
        game("c", "d", "first"),
        game("c", "d", "first"),
        game("a", "b", "draw"),
    };
    const auto out = PairwiseAggregator::aggregate(events);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].key.to_string(), "c vs d");
    EXPECT_EQ(out[1].key.to_string(), "a vs b");
    EXPECT_EQ(out[2].key.to_string(), "y vs z");
}

TEST(PairwiseAggregator, Empty) {
    EXPECT_TRUE(PairwiseAggregator::aggregate(std::vector<Event>{}).empty());
}

// ─── aggregate: allow-list ──────────────────────────────────────────────────

TEST(PairwiseAggregator, AllowListEither) {
    const std::vector<Event> events{
        game("hikaru", "x", "first"),
        game("y", "z", "first"),
    };
    MatchupConfig cfg;
    cfg.allow_list = AllowList({"Hikaru", "Magnus"});
    const auto out = PairwiseAggregator::aggregate(events, cfg);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].key.to_string(), "hikaru vs x");
}

TEST(PairwiseAggregator, AllowListBoth) {
    const std::vector<Event> events{
        game("hikaru", "x", "first"),
        game("hikaru", "magnus", "first"),
    };
    MatchupConfig cfg;
    cfg.allow_list = AllowList({"hikaru", "magnus"});
    cfg.allow_mode = AllowMode::Both;
    const auto out = PairwiseAggregator::aggregate(events, cfg);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].key.to_string(), "hikaru vs magnus");
}

// ─── aggregate: rejection ───────────────────────────────────────────────────

TEST(PairwiseAggregator, SelfPair_Throws) {
    const std::vector<Event> events{game("Hikaru", "hikaru", "draw")};
    EXPECT_THROW((void)PairwiseAggregator::aggregate(events), ValidationError);
}

TEST(PairwiseAggregator, UnknownOutcome_Throws) {
    const std::vector<Event> events{game("a", "b", "win")};
    EXPECT_THROW((void)PairwiseAggregator::aggregate(events), ValidationError);
}

TEST(PairwiseAggregator, NoParticipants_Throws) {
    std::vector<Event> events{game("a", "b", "first")};
    events[0].participants.reset();
    EXPECT_THROW((void)PairwiseAggregator::aggregate(events), ValidationError);
}

TEST(PairwiseAggregator, ValidationPrecedesAllowList) {
    MatchupConfig cfg;
    cfg.allow_list = AllowList({"someone_else"});
    const std::vector<Event> events{game("a", "a", "draw")};
    EXPECT_THROW((void)PairwiseAggregator::aggregate(events, cfg), ValidationError);
}

// ─── Dominance ───────────────────────────────────────────────────────────────

static MatchupAggregate record(std::size_t first_wins, std::size_t second_wins) {
    MatchupAggregate agg;
    agg.key         = *MatchupKey::make("a", "b");
    agg.first_wins  = first_wins;
    agg.second_wins = second_wins;
    agg.total       = first_wins + second_wins;
    return agg;
}

TEST(Dominance, Classification) {
    EXPECT_EQ(classify_dominance(record(4, 2)), Dominance::FirstDominates);
    EXPECT_EQ(classify_dominance(record(3, 2)), Dominance::CloseRivalry);  // 3 is not > 3
    EXPECT_EQ(classify_dominance(record(2, 4)), Dominance::SecondDominates);
    EXPECT_EQ(classify_dominance(record(0, 0)), Dominance::CloseRivalry);
    EXPECT_EQ(classify_dominance(record(1, 0)), Dominance::FirstDominates);
}

TEST(Dominance, CustomFactor) {
    EXPECT_EQ(classify_dominance(record(3, 2), 1.2), Dominance::FirstDominates);
    EXPECT_EQ(classify_dominance(record(4, 2), 2.0), Dominance::CloseRivalry);
}

TEST(Dominance, Describe) {
    const auto agg = record(5, 1);
    EXPECT_EQ(describe(agg, Dominance::FirstDominates), "a DOMINATES");
    EXPECT_EQ(describe(agg, Dominance::SecondDominates), "b DOMINATES");
    EXPECT_EQ(describe(agg, Dominance::CloseRivalry), "CLOSE RIVALRY");
}
