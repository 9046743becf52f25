#pragma once

/// @file include/seqa/labels.hpp
/// @brief LabelClassifier: ordered boundary rules, first match wins.
///
/// # Module: Era / Label Classification
///
/// ## Responsibility
/// Map a numeric measure to one label out of a fixed, configured set. Rules
/// are evaluated top to bottom; the first rule whose comparison holds wins.
/// This is the engine-side form of a priority-ordered SQL `CASE`:
///
/// ```
/// CASE WHEN year <= 2014          THEN 'Growth (2008-2014)'
///      WHEN month < '2022-12-01'  THEN 'Plateau (2015-2022)'
///      ELSE 'Post-ChatGPT (2023+)' END
/// ```
///
/// ## Edge Cases
/// - No rule matches and no `otherwise` label: `nullopt` (SQL `CASE` without
///   `ELSE` yields NULL)
/// - NaN measure: never matches a rule; falls through to `otherwise`
///
/// ## Guarantees
/// - Immutable after construction; `classify` is const and thread-safe

#include <optional>
#include <string>
#include <vector>

namespace seqa::temporal {

/// Comparison applied as `measure <op> bound`.
enum class Comparison {
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    Equal,
};

/// One `WHEN measure <op> bound THEN label` clause.
struct LabelRule {
    Comparison  op;
    double      bound;
    std::string label;
};

class LabelClassifier {
public:
    LabelClassifier() = default;

    /// # Arguments
    /// * `rules`    : Clauses in priority order
    /// * `otherwise`: `ELSE` label; `nullopt` leaves unmatched measures unlabeled
    explicit LabelClassifier(std::vector<LabelRule> rules,
                             std::optional<std::string> otherwise = std::nullopt);

    /// Label for `measure`, or `nullopt` when nothing matches.
    [[nodiscard]] std::optional<std::string> classify(double measure) const;

    /// Every label this classifier can produce, rules first, then `otherwise`,
    /// without duplicates. Used as a categorical domain.
    [[nodiscard]] std::vector<std::string> labels() const;

    [[nodiscard]] const std::vector<LabelRule>& rules() const noexcept { return rules_; }
    [[nodiscard]] bool empty() const noexcept { return rules_.empty() && !otherwise_; }

private:
    std::vector<LabelRule>     rules_;
    std::optional<std::string> otherwise_;
};

/// Whether `measure <op> bound` holds.
[[nodiscard]] bool compare(double measure, Comparison op, double bound) noexcept;

} // namespace seqa::temporal
