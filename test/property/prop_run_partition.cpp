/**
 * @file  prop_run_partition.cpp
 * @brief Property: detected runs partition each entity's sequence.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_run_partition
 *
 * For any category sequence of length n:
 *   Σ run.length = n
 *   adjacent runs of one entity never share a category
 *   streaming detection produces the same runs as batch detection
 */

#include <rapidcheck.h>
#include <cstdint>
#include <string>
#include <vector>

#include "seqa/runs.hpp"

using namespace seqa;
using namespace seqa::runs;

namespace {

const char* const CATEGORIES[] = {"win", "loss", "draw"};

std::vector<Event> to_events(const std::vector<std::uint8_t>& raw) {
    std::vector<Event> events;
    events.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        events.push_back(Event{
            .entity_id    = "p",
            .occurred_at  = OrderKey{static_cast<std::int64_t>(i) * 86'400},
            .category     = CATEGORIES[raw[i] % 3],
            .value        = std::nullopt,
            .participants = std::nullopt,
        });
    }
    return events;
}

}  // namespace

int main() {
    bool ok = true;

    // ── Property 1: lengths sum to n ─────────────────────────────────────────
    ok &= rc::check(
        "run_partition: run lengths sum to the event count",
        [](const std::vector<std::uint8_t>& raw) {
            const auto events = to_events(raw);
            std::size_t total = 0;
            for (const auto& r : RunDetector::detect(events)) {
                RC_ASSERT(r.length >= 1u);
                total += r.length;
            }
            RC_ASSERT(total == events.size());
        }
    );

    // ── Property 2: maximality ───────────────────────────────────────────────
    ok &= rc::check(
        "run_partition: adjacent runs differ in category",
        [](const std::vector<std::uint8_t>& raw) {
            const auto runs = RunDetector::detect(to_events(raw));
            for (std::size_t k = 1; k < runs.size(); ++k) {
                RC_ASSERT(runs[k].category != runs[k - 1].category);
                RC_ASSERT(runs[k - 1].end < runs[k].start);
            }
        }
    );

    // ── Property 3: streaming == batch on ordered input ──────────────────────
    ok &= rc::check(
        "run_partition: streaming detector agrees with batch detector",
        [](const std::vector<std::uint8_t>& raw) {
            const auto events = to_events(raw);
            StreamingRunDetector det;
            std::vector<Run> streamed;
            for (const auto& e : events) {
                if (auto closed = det.push(e)) streamed.push_back(*closed);
            }
            for (auto& r : det.finish()) streamed.push_back(r);
            RC_ASSERT(streamed == RunDetector::detect(events));
        }
    );

    return ok ? 0 : 1;
}
