/// @file src/runs/streaming_run_detector.cpp
/// @brief StreamingRunDetector: per-entity run accumulators.

#include "seqa/runs.hpp"
#include "seqa/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace seqa::runs {

StreamingRunDetector::StreamingRunDetector(RunConfig config)
    : config_(std::move(config))
{}

std::optional<Run> StreamingRunDetector::push(const Event& event) {
    const std::size_t position = seen_;

    if (!config_.domain.empty() &&
        std::find(config_.domain.begin(), config_.domain.end(), event.category) ==
            config_.domain.end()) {
        throw ValidationError(position, "category",
            fmt::format("category '{}' is outside the declared domain", event.category));
    }
    if (config_.allow_list && !config_.allow_list->contains(event.entity_id)) {
        return std::nullopt;
    }

    auto it = open_.find(event.entity_id);
    if (it == open_.end()) {
        open_.emplace(event.entity_id, Run{
            .entity_id = event.entity_id,
            .category  = event.category,
            .length    = 1,
            .start     = event.occurred_at,
            .end       = event.occurred_at,
        });
        order_.push_back(event.entity_id);
        ++seen_;
        return std::nullopt;
    }

    Run& run = it->second;
    if (event.occurred_at < run.end) {
        throw ValidationError(position, "occurred_at",
            fmt::format("event for '{}' at {} arrived after {}",
                        event.entity_id, event.occurred_at.to_string(), run.end.to_string()));
    }
    ++seen_;

    if (event.category == run.category) {
        ++run.length;
        run.end = event.occurred_at;
        return std::nullopt;
    }

    // Category transition: the open run is now known to be maximal.
    Run closed = std::move(run);
    run = Run{
        .entity_id = event.entity_id,
        .category  = event.category,
        .length    = 1,
        .start     = event.occurred_at,
        .end       = event.occurred_at,
    };
    return closed;
}

std::vector<Run> StreamingRunDetector::finish() {
    std::vector<Run> out;
    out.reserve(order_.size());
    for (const auto& entity : order_) {
        auto it = open_.find(entity);
        if (it != open_.end()) {
            out.push_back(std::move(it->second));
        }
    }
    open_.clear();
    order_.clear();
    seen_ = 0;
    return out;
}

}  // namespace seqa::runs
