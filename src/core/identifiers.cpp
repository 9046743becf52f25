/// @file src/core/identifiers.cpp
/// @brief Identifier case policy and AllowList.

#include "seqa/types.hpp"

#include <algorithm>
#include <cctype>

namespace seqa {

std::string normalize_id(std::string_view id, IdCase policy) {
    std::string out(id);
    if (policy == IdCase::Lower) {
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
    }
    return out;
}

// ─── AllowList ────────────────────────────────────────────────────────────────

AllowList::AllowList(const std::vector<std::string>& ids, IdCase policy)
    : policy_(policy)
{
    ids_.reserve(ids.size());
    for (const auto& id : ids) {
        ids_.insert(normalize_id(id, policy_));
    }
}

bool AllowList::contains(std::string_view id) const {
    return ids_.count(normalize_id(id, policy_)) != 0;
}

}  // namespace seqa
