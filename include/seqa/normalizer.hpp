#pragma once

/// @file include/seqa/normalizer.hpp
/// @brief EventNormalizer: raw heterogeneous records → ordered Events.
///
/// # Module: Event Normalizer
///
/// ## Responsibility
/// Validate and shape source records (game results, monthly counts, daily
/// observations) into the uniform `Event` type consumed by the run detector,
/// the temporal normalizer and the pairwise aggregator.
///
/// ## Schema
/// A `Schema` names the source field for every Event attribute and carries
/// the coercion rules:
///   - `time_format`     : how `occurred_at` text is parsed
///   - `domain`          : declared categorical domain (empty = unrestricted)
///   - `category_source` : read the category, derive it from a winner
///                          column, or classify the numeric value
///   - `dedup_field`     : keep one record per key (latest `occurred_at`)
///
/// ## Validation
/// `ValidationError` for a record missing `entity_id` or `occurred_at`
/// (null, empty or unparseable), or whose category falls outside the domain.
/// A non-numeric `value` is not an error: it becomes `nullopt` (safe cast).
///
/// ## Output Ordering
/// Grouped by `entity_id` in order of first appearance; within a group,
/// stably sorted by `occurred_at` so ties keep input order.
///
/// ## Guarantees
/// - Pure: no side effects, no retained state
/// - All-or-nothing: the first invalid record aborts the whole batch

#include "seqa/labels.hpp"
#include "seqa/types.hpp"
#include "seqa/constants.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace seqa::ingest {

// ─── Raw Input ────────────────────────────────────────────────────────────────

/// One source cell. `std::monostate` is SQL NULL.
using RawValue = std::variant<std::monostate, std::string, double, std::int64_t>;

/// One source row, keyed by column name. Absent keys read as NULL.
using RawRecord = std::unordered_map<std::string, RawValue>;

// ─── Schema ───────────────────────────────────────────────────────────────────

/// Where an Event's category comes from.
enum class CategorySource {
    Field,      ///< Read `category_field` verbatim
    Winner,     ///< Compare `winner_field` with the participants → first/second/draw
    ValueRule,  ///< Classify the numeric value with `value_rule`
};

struct Schema {
    /// Source of `entity_id`. When unset every record gets `entity_constant`.
    std::optional<std::string> entity_field;
    std::string                entity_constant = std::string(constants::GLOBAL_ENTITY);

    std::string time_field  = "occurred_at";
    TimeFormat  time_format = TimeFormat::Auto;

    CategorySource           category_source = CategorySource::Field;
    std::string              category_field  = "category";
    std::vector<std::string> domain;  ///< Allowed categories; empty = any

    std::optional<std::string> value_field;

    /// Matchup participants in slot order; both or neither.
    std::optional<std::string> first_field;
    std::optional<std::string> second_field;

    /// Winner identifier column (CategorySource::Winner). NULL or empty = draw.
    std::optional<std::string> winner_field;

    /// Case policy used when matching the winner against the participants.
    IdCase winner_case = IdCase::Lower;

    /// Value classifier (CategorySource::ValueRule), e.g. `< 1 → gloomy`.
    temporal::LabelClassifier value_rule;

    /// Deduplication key: among records sharing it, the one with the latest
    /// `occurred_at` survives (first seen on ties). NULL keys are never merged.
    std::optional<std::string> dedup_field;
};

// ─── EventNormalizer ──────────────────────────────────────────────────────────

class EventNormalizer {
public:
    EventNormalizer() = delete;  // pure static

    /// Validate and convert `records` into ordered Events.
    ///
    /// # Throws
    /// `ValidationError` naming the record index and field of the first
    /// invalid record.
    [[nodiscard]] static std::vector<Event>
    normalize(std::span<const RawRecord> records, const Schema& schema);

    /// Expand matchup events into one event per participant.
    ///
    /// Each participant becomes the `entity_id` of its own event, with the
    /// slot outcome translated to its point of view (`win`, `loss`, `draw`).
    /// Participants not on `allow_list` (when given) are dropped.
    ///
    /// # Throws
    /// `ValidationError` if an event has no participants, names the same
    /// participant twice under `id_case`, or its category is not a slot outcome.
    [[nodiscard]] static std::vector<Event>
    player_perspectives(std::span<const Event> matchups,
                        const std::optional<AllowList>& allow_list = std::nullopt,
                        IdCase id_case = IdCase::Lower);

    /// Group by entity (first appearance) and stably sort each group by
    /// `occurred_at`.
    [[nodiscard]] static std::vector<Event> order_by_entity(std::vector<Event> events);

    /// Safe numeric cast: `nullopt` for NULL, non-numeric or non-finite cells.
    [[nodiscard]] static std::optional<double> coerce_number(const RawValue& cell) noexcept;

    /// Text form of a cell: `nullopt` for NULL and empty strings.
    [[nodiscard]] static std::optional<std::string> coerce_text(const RawValue& cell);
};

} // namespace seqa::ingest
