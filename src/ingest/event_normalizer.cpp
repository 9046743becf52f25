/// @file src/ingest/event_normalizer.cpp
/// @brief EventNormalizer: schema-driven validation of raw records.
///
/// normalize() runs in three passes:
///   1. Convert each record to an Event, throwing on the first invalid one
///   2. Drop superseded duplicates when the schema names a dedup key
///   3. Group by entity and stable-sort each group by occurred_at

#include "seqa/normalizer.hpp"
#include "seqa/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>
#include <unordered_map>
#include <utility>

namespace seqa::ingest {

namespace {

const RawValue NULL_CELL{};

[[nodiscard]] const RawValue& cell(const RawRecord& record, const std::string& field) {
    const auto it = record.find(field);
    return it == record.end() ? NULL_CELL : it->second;
}

[[nodiscard]] bool in_domain(const std::vector<std::string>& domain,
                             const std::string& category) {
    return domain.empty() ||
           std::find(domain.begin(), domain.end(), category) != domain.end();
}

[[nodiscard]] std::optional<OrderKey>
coerce_time(const RawValue& value, TimeFormat format) {
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        if (format == TimeFormat::Auto || format == TimeFormat::EpochSeconds) {
            return OrderKey{*i};
        }
        return std::nullopt;
    }
    if (const auto* d = std::get_if<double>(&value)) {
        // Numeric timestamps must be whole seconds within the int64 range.
        constexpr double lo = static_cast<double>(std::numeric_limits<std::int64_t>::min());
        if ((format == TimeFormat::Auto || format == TimeFormat::EpochSeconds) &&
            std::isfinite(*d) && std::trunc(*d) == *d && *d >= lo && *d < -lo) {
            return OrderKey{static_cast<std::int64_t>(*d)};
        }
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return OrderKey::parse(*s, format);
    }
    return std::nullopt;
}

/// first / second / draw from the winner column.
[[nodiscard]] std::string winner_outcome(const RawRecord& record,
                                         const Schema& schema,
                                         const Participants& players,
                                         std::size_t index) {
    const auto winner = EventNormalizer::coerce_text(cell(record, *schema.winner_field));
    if (!winner) {
        return std::string(constants::OUTCOME_DRAW);
    }
    const auto w = normalize_id(*winner, schema.winner_case);
    if (w == normalize_id(players.first, schema.winner_case)) {
        return std::string(constants::OUTCOME_FIRST);
    }
    if (w == normalize_id(players.second, schema.winner_case)) {
        return std::string(constants::OUTCOME_SECOND);
    }
    throw ValidationError(index, *schema.winner_field,
        fmt::format("winner '{}' is neither '{}' nor '{}'",
                    *winner, players.first, players.second));
}

[[nodiscard]] Event to_event(const RawRecord& record, const Schema& schema, std::size_t index) {
    Event ev;

    // ── entity_id ─────────────────────────────────────────────────────────────
    if (schema.entity_field) {
        auto id = EventNormalizer::coerce_text(cell(record, *schema.entity_field));
        if (!id) {
            throw ValidationError(index, *schema.entity_field, "missing entity id");
        }
        ev.entity_id = std::move(*id);
    } else {
        ev.entity_id = schema.entity_constant;
    }

    // ── occurred_at ───────────────────────────────────────────────────────────
    const auto& time_cell = cell(record, schema.time_field);
    if (std::holds_alternative<std::monostate>(time_cell)) {
        throw ValidationError(index, schema.time_field, "missing ordering key");
    }
    const auto key = coerce_time(time_cell, schema.time_format);
    if (!key) {
        throw ValidationError(index, schema.time_field,
            fmt::format("unparseable ordering key '{}'",
                        EventNormalizer::coerce_text(time_cell).value_or("")));
    }
    ev.occurred_at = *key;

    // ── value (safe cast) ─────────────────────────────────────────────────────
    if (schema.value_field) {
        ev.value = EventNormalizer::coerce_number(cell(record, *schema.value_field));
    }

    // ── participants ──────────────────────────────────────────────────────────
    if (schema.first_field && schema.second_field) {
        auto first  = EventNormalizer::coerce_text(cell(record, *schema.first_field));
        auto second = EventNormalizer::coerce_text(cell(record, *schema.second_field));
        if (!first)  throw ValidationError(index, *schema.first_field,  "missing participant");
        if (!second) throw ValidationError(index, *schema.second_field, "missing participant");
        ev.participants = Participants{std::move(*first), std::move(*second)};
    }

    // ── category ──────────────────────────────────────────────────────────────
    switch (schema.category_source) {
        case CategorySource::Field: {
            auto cat = EventNormalizer::coerce_text(cell(record, schema.category_field));
            if (!cat) {
                throw ValidationError(index, schema.category_field, "missing category");
            }
            ev.category = std::move(*cat);
            break;
        }
        case CategorySource::Winner: {
            if (!schema.winner_field) {
                throw ValidationError(index, "winner", "schema has no winner field");
            }
            if (!ev.participants) {
                throw ValidationError(index, *schema.winner_field,
                    "winner outcome requires first and second participant fields");
            }
            ev.category = winner_outcome(record, schema, *ev.participants, index);
            break;
        }
        case CategorySource::ValueRule: {
            const double measure = ev.value.value_or(std::nan(""));
            auto label = schema.value_rule.classify(measure);
            if (!label) {
                throw ValidationError(index, schema.value_field.value_or("value"),
                    "value matches no classification rule");
            }
            ev.category = std::move(*label);
            break;
        }
    }

    if (!in_domain(schema.domain, ev.category)) {
        throw ValidationError(index,
            schema.category_source == CategorySource::Field ? schema.category_field
                                                            : std::string("category"),
            fmt::format("category '{}' is outside the declared domain", ev.category));
    }

    return ev;
}

/// Index positions surviving deduplication, in input order.
[[nodiscard]] std::vector<std::size_t>
dedup_keep(std::span<const RawRecord> records,
           const std::vector<Event>& events,
           const std::string& dedup_field) {
    std::unordered_map<std::string, std::size_t> best;  // key → winning index
    std::vector<bool> keep(events.size(), true);

    for (std::size_t i = 0; i < events.size(); ++i) {
        const auto key = EventNormalizer::coerce_text(cell(records[i], dedup_field));
        if (!key) continue;

        auto [it, inserted] = best.try_emplace(*key, i);
        if (inserted) continue;

        // Later occurred_at wins; on ties the first record seen stays.
        if (events[i].occurred_at > events[it->second].occurred_at) {
            keep[it->second] = false;
            it->second = i;
        } else {
            keep[i] = false;
        }
    }

    std::vector<std::size_t> out;
    out.reserve(events.size());
    for (std::size_t i = 0; i < keep.size(); ++i) {
        if (keep[i]) out.push_back(i);
    }
    return out;
}

}  // namespace

// ─── Coercion ─────────────────────────────────────────────────────────────────

std::optional<double> EventNormalizer::coerce_number(const RawValue& value) noexcept {
    if (const auto* d = std::get_if<double>(&value)) {
        if (!std::isfinite(*d)) return std::nullopt;
        return *d;
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        const auto first = s->find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return std::nullopt;
        const auto last = s->find_last_not_of(" \t\r\n");
        const std::string token = s->substr(first, last - first + 1);

        char* end = nullptr;
        const double v = std::strtod(token.c_str(), &end);
        if (end != token.c_str() + token.size()) return std::nullopt;  // trailing garbage
        if (!std::isfinite(v)) return std::nullopt;
        return v;
    }
    return std::nullopt;
}

std::optional<std::string> EventNormalizer::coerce_text(const RawValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        if (s->empty()) return std::nullopt;
        return *s;
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return fmt::format("{}", *d);
    }
    return std::nullopt;
}

// ─── normalize ────────────────────────────────────────────────────────────────

std::vector<Event>
EventNormalizer::normalize(std::span<const RawRecord> records, const Schema& schema) {
    std::vector<Event> events;
    events.reserve(records.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        events.push_back(to_event(records[i], schema, i));
    }

    if (schema.dedup_field) {
        const auto kept = dedup_keep(records, events, *schema.dedup_field);
        if (kept.size() != events.size()) {
            std::vector<Event> unique;
            unique.reserve(kept.size());
            for (std::size_t i : kept) {
                unique.push_back(std::move(events[i]));
            }
            events = std::move(unique);
        }
    }

    return order_by_entity(std::move(events));
}

// ─── order_by_entity ──────────────────────────────────────────────────────────

std::vector<Event> EventNormalizer::order_by_entity(std::vector<Event> events) {
    std::unordered_map<std::string, std::size_t> group_of;
    std::vector<std::size_t> group(events.size());
    for (std::size_t i = 0; i < events.size(); ++i) {
        const auto [it, inserted] = group_of.try_emplace(events[i].entity_id, group_of.size());
        group[i] = it->second;
    }

    std::vector<std::size_t> order(events.size());
    for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;

    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        if (group[a] != group[b]) return group[a] < group[b];
        return events[a].occurred_at < events[b].occurred_at;
    });

    std::vector<Event> out;
    out.reserve(events.size());
    for (std::size_t i : order) {
        out.push_back(std::move(events[i]));
    }
    return out;
}

// ─── player_perspectives ──────────────────────────────────────────────────────

std::vector<Event>
EventNormalizer::player_perspectives(std::span<const Event> matchups,
                                     const std::optional<AllowList>& allow_list,
                                     IdCase id_case) {
    std::vector<Event> out;
    out.reserve(matchups.size() * 2);

    for (std::size_t i = 0; i < matchups.size(); ++i) {
        const Event& m = matchups[i];
        if (!m.participants) {
            throw ValidationError(i, "participants", "matchup event has no participants");
        }
        if (normalize_id(m.participants->first, id_case) ==
            normalize_id(m.participants->second, id_case)) {
            throw ValidationError(i, "participants",
                fmt::format("degenerate matchup '{}' vs '{}'",
                            m.participants->first, m.participants->second));
        }

        const bool draw         = m.category == constants::OUTCOME_DRAW;
        const bool first_won    = m.category == constants::OUTCOME_FIRST;
        const bool second_won   = m.category == constants::OUTCOME_SECOND;
        if (!draw && !first_won && !second_won) {
            throw ValidationError(i, "category",
                fmt::format("'{}' is not a matchup outcome", m.category));
        }

        auto emit = [&](const std::string& player, bool won) {
            if (allow_list && !allow_list->contains(player)) return;
            Event ev;
            ev.entity_id   = normalize_id(player, id_case);
            ev.occurred_at = m.occurred_at;
            ev.value       = m.value;
            ev.category    = std::string(draw ? constants::OUTCOME_DRAW
                                        : won ? constants::OUTCOME_WIN
                                              : constants::OUTCOME_LOSS);
            out.push_back(std::move(ev));
        };
        emit(m.participants->first,  first_won);
        emit(m.participants->second, second_won);
    }

    return order_by_entity(std::move(out));
}

}  // namespace seqa::ingest
