/// @file src/runs/run_detector.cpp
/// @brief RunDetector: batch gaps-and-islands run detection.
///
/// detect():
///   1. Validate categories against the domain and apply the allow-list
///   2. Group event indices by entity, stable-sort each group by time
///   3. Forward scan per group with the (i, j) counters; close a run whenever
///      the (category, i − j) island key changes

#include "seqa/runs.hpp"
#include "seqa/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <map>
#include <utility>

namespace seqa::runs {

namespace {

void check_domain(const std::vector<std::string>& domain,
                  const Event& event,
                  std::optional<std::size_t> index) {
    if (domain.empty()) return;
    if (std::find(domain.begin(), domain.end(), event.category) == domain.end()) {
        throw ValidationError(index, "category",
            fmt::format("category '{}' of entity '{}' is outside the declared domain",
                        event.category, event.entity_id));
    }
}

/// Scan one entity's time-ordered events and append its runs to `out`.
void scan_entity(std::span<const Event> events,
                 const std::vector<std::size_t>& ordered,
                 std::vector<Run>& out) {
    std::unordered_map<std::string, std::size_t> same_category_seen;  // category → j

    std::optional<Run> current;
    std::size_t current_island = 0;

    for (std::size_t i = 0; i < ordered.size(); ++i) {
        const Event& ev = events[ordered[i]];
        const std::size_t j = same_category_seen[ev.category]++;
        const std::size_t island = i - j;

        if (current && current->category == ev.category && current_island == island) {
            ++current->length;
            current->end = ev.occurred_at;
            continue;
        }

        if (current) out.push_back(std::move(*current));
        current = Run{
            .entity_id = ev.entity_id,
            .category  = ev.category,
            .length    = 1,
            .start     = ev.occurred_at,
            .end       = ev.occurred_at,
        };
        current_island = island;
    }

    if (current) out.push_back(std::move(*current));
}

}  // namespace

// ─── Run / RunSummary ─────────────────────────────────────────────────────────

std::string Run::to_string() const {
    return fmt::format("{} {} x{} [{} -> {}]",
        entity_id, category, length, start.to_string(), end.to_string());
}

std::string RunSummary::to_string() const {
    return fmt::format("{:<24} {:<10} longest={:<4} runs={:<5} streaks={}",
        entity_id, category, longest, run_count, streak_count);
}

// ─── RunDetector::detect ──────────────────────────────────────────────────────

std::vector<Run>
RunDetector::detect(std::span<const Event> events, const RunConfig& config) {
    std::unordered_map<std::string, std::size_t> group_of;
    std::vector<std::vector<std::size_t>> groups;

    for (std::size_t k = 0; k < events.size(); ++k) {
        const Event& ev = events[k];
        check_domain(config.domain, ev, k);
        if (config.allow_list && !config.allow_list->contains(ev.entity_id)) {
            continue;
        }
        const auto [it, inserted] = group_of.try_emplace(ev.entity_id, groups.size());
        if (inserted) groups.emplace_back();
        groups[it->second].push_back(k);
    }

    std::vector<Run> out;
    for (auto& group : groups) {
        // Ties on occurred_at keep input order.
        std::stable_sort(group.begin(), group.end(), [&](std::size_t a, std::size_t b) {
            return events[a].occurred_at < events[b].occurred_at;
        });
        scan_entity(events, group, out);
    }
    return out;
}

// ─── RunDetector::longest ─────────────────────────────────────────────────────

std::vector<Run>
RunDetector::longest(std::span<const Run> runs,
                     const std::string& category,
                     std::optional<std::size_t> limit) {
    std::vector<Run> out;
    for (const auto& r : runs) {
        if (r.category == category) out.push_back(r);
    }
    std::stable_sort(out.begin(), out.end(), [](const Run& a, const Run& b) {
        if (a.length != b.length) return a.length > b.length;
        return a.start < b.start;
    });
    if (limit && out.size() > *limit) {
        out.resize(*limit);
    }
    return out;
}

// ─── RunDetector::summarize ───────────────────────────────────────────────────

std::vector<RunSummary>
RunDetector::summarize(std::span<const Run> runs, std::size_t streak_threshold) {
    std::vector<RunSummary> out;
    std::map<std::pair<std::string, std::string>, std::size_t> slot;

    for (const auto& r : runs) {
        const auto [it, inserted] =
            slot.try_emplace(std::make_pair(r.entity_id, r.category), out.size());
        if (inserted) {
            out.push_back(RunSummary{
                .entity_id    = r.entity_id,
                .category     = r.category,
                .longest      = 0,
                .run_count    = 0,
                .streak_count = 0,
            });
        }
        RunSummary& s = out[it->second];
        s.longest = std::max(s.longest, r.length);
        ++s.run_count;
        if (r.length >= streak_threshold) ++s.streak_count;
    }
    return out;
}

}  // namespace seqa::runs
