/// @file src/temporal/label_classifier.cpp
/// @brief LabelClassifier: first-match ordered boundary rules.

#include "seqa/labels.hpp"

#include <algorithm>
#include <utility>

namespace seqa::temporal {

bool compare(double measure, Comparison op, double bound) noexcept {
    // Every comparison with NaN is false, so a NaN measure matches no rule.
    switch (op) {
        case Comparison::Less:         return measure <  bound;
        case Comparison::LessEqual:    return measure <= bound;
        case Comparison::Greater:      return measure >  bound;
        case Comparison::GreaterEqual: return measure >= bound;
        case Comparison::Equal:        return measure == bound;
    }
    return false;
}

LabelClassifier::LabelClassifier(std::vector<LabelRule> rules,
                                 std::optional<std::string> otherwise)
    : rules_(std::move(rules))
    , otherwise_(std::move(otherwise))
{}

std::optional<std::string> LabelClassifier::classify(double measure) const {
    for (const auto& rule : rules_) {
        if (compare(measure, rule.op, rule.bound)) {
            return rule.label;
        }
    }
    return otherwise_;
}

std::vector<std::string> LabelClassifier::labels() const {
    std::vector<std::string> out;
    auto add = [&out](const std::string& label) {
        if (std::find(out.begin(), out.end(), label) == out.end()) {
            out.push_back(label);
        }
    };
    for (const auto& rule : rules_) add(rule.label);
    if (otherwise_) add(*otherwise_);
    return out;
}

}  // namespace seqa::temporal
