/// @file tests/runs/test_streaming_run_detector.cpp
/// @brief Unit tests for StreamingRunDetector.
///
/// Verifies:
///   - Closed runs are emitted on category transitions, the rest on finish()
///   - Output matches batch RunDetector::detect on time-ordered input
///   - Out-of-order events and out-of-domain categories are rejected
///   - finish() resets all state

#include <gtest/gtest.h>
#include "seqa/runs.hpp"
#include "seqa/errors.hpp"

#include <string>
#include <vector>

using namespace seqa;
using namespace seqa::runs;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static Event make_event(const std::string& entity, unsigned day, const std::string& category) {
    return Event{
        .entity_id    = entity,
        .occurred_at  = OrderKey::from_date(2024, 3, day),
        .category     = category,
        .value        = std::nullopt,
        .participants = std::nullopt,
    };
}

static std::vector<Run> drain(StreamingRunDetector& det, const std::vector<Event>& events) {
    std::vector<Run> out;
    for (const auto& e : events) {
        if (auto closed = det.push(e)) out.push_back(std::move(*closed));
    }
    for (auto& r : det.finish()) out.push_back(std::move(r));
    return out;
}

// ─── push / finish ───────────────────────────────────────────────────────────

TEST(StreamingRunDetector, EmitsOnTransition) {
    StreamingRunDetector det;
    EXPECT_FALSE(det.push(make_event("a", 1, "win")).has_value());
    EXPECT_FALSE(det.push(make_event("a", 2, "win")).has_value());

    const auto closed = det.push(make_event("a", 3, "loss"));
    ASSERT_TRUE(closed.has_value());
    EXPECT_EQ(closed->category, "win");
    EXPECT_EQ(closed->length, 2u);
    EXPECT_EQ(det.open_runs(), 1u);
    EXPECT_EQ(det.events_seen(), 3u);
}

TEST(StreamingRunDetector, MatchesBatchForSingleEntity) {
    std::vector<Event> events;
    const std::vector<std::string> cats{"win", "win", "loss", "win", "win", "win"};
    for (std::size_t i = 0; i < cats.size(); ++i) {
        events.push_back(make_event("hikaru", static_cast<unsigned>(i + 1), cats[i]));
    }

    StreamingRunDetector det;
    EXPECT_EQ(drain(det, events), RunDetector::detect(events));
}

TEST(StreamingRunDetector, FinishFlushesInFirstSeenOrder) {
    StreamingRunDetector det;
    (void)det.push(make_event("b", 1, "win"));
    (void)det.push(make_event("a", 1, "loss"));
    (void)det.push(make_event("b", 2, "win"));

    const auto rest = det.finish();
    ASSERT_EQ(rest.size(), 2u);
    EXPECT_EQ(rest[0].entity_id, "b");
    EXPECT_EQ(rest[0].length, 2u);
    EXPECT_EQ(rest[1].entity_id, "a");
}

TEST(StreamingRunDetector, FinishResetsState) {
    StreamingRunDetector det;
    (void)det.push(make_event("a", 1, "win"));
    (void)det.finish();
    EXPECT_EQ(det.open_runs(), 0u);
    EXPECT_EQ(det.events_seen(), 0u);
    EXPECT_TRUE(det.finish().empty());
}

TEST(StreamingRunDetector, EqualTimestampsAccepted) {
    StreamingRunDetector det;
    (void)det.push(make_event("a", 1, "win"));
    EXPECT_NO_THROW((void)det.push(make_event("a", 1, "win")));
    const auto rest = det.finish();
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0].length, 2u);
}

// ─── Rejection ───────────────────────────────────────────────────────────────

TEST(StreamingRunDetector, OutOfOrder_Throws) {
    StreamingRunDetector det;
    (void)det.push(make_event("a", 5, "win"));
    EXPECT_THROW((void)det.push(make_event("a", 4, "win")), ValidationError);
}

TEST(StreamingRunDetector, OtherEntityMayBeEarlier) {
    StreamingRunDetector det;
    (void)det.push(make_event("a", 5, "win"));
    EXPECT_NO_THROW((void)det.push(make_event("b", 1, "win")));
}

TEST(StreamingRunDetector, DomainViolation_Throws) {
    RunConfig cfg;
    cfg.domain = {"win", "loss"};
    StreamingRunDetector det(cfg);
    EXPECT_THROW((void)det.push(make_event("a", 1, "draw")), ValidationError);
}

TEST(StreamingRunDetector, AllowListSkipsEntities) {
    RunConfig cfg;
    cfg.allow_list = AllowList({"a"});
    StreamingRunDetector det(cfg);
    EXPECT_FALSE(det.push(make_event("b", 1, "win")).has_value());
    EXPECT_EQ(det.open_runs(), 0u);
    EXPECT_EQ(det.events_seen(), 0u);
}
