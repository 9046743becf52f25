#pragma once

/// @file include/seqa/types.hpp
/// @brief Shared value types for the Sequential Event Analytics (SEQA) engine.
///
/// Every component includes this file. It defines the ordering key, the
/// normalized Event record and the identifier policy types used by the run
/// detector, the temporal normalizer and the pairwise aggregator.

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace seqa {

// ─── Ordering Key ─────────────────────────────────────────────────────────────

/// How a textual ordering key is interpreted.
enum class TimeFormat {
    Auto,          ///< Detect from shape: integer, YYYY-MM, YYYY-MM-DD, date-time
    EpochSeconds,  ///< Signed integer seconds since 1970-01-01T00:00:00Z
    Date,          ///< YYYY-MM-DD
    Month,         ///< YYYY-MM (first day of the month)
    DateTime,      ///< YYYY-MM-DD[T ]HH:MM[:SS][Z]
};

/// Totally ordered event key: seconds since the Unix epoch, UTC.
///
/// Dates map to midnight and months to midnight of their first day, so
/// daily and monthly series share one representation.
struct OrderKey {
    std::int64_t value = 0;

    auto operator<=>(const OrderKey&) const = default;

    /// Parse a textual key.
    ///
    /// # Returns
    /// `nullopt` for empty text, text that does not match `format`, or an
    /// out-of-range calendar date (e.g. 2023-02-30).
    [[nodiscard]] static std::optional<OrderKey>
    parse(std::string_view text, TimeFormat format = TimeFormat::Auto) noexcept;

    /// Midnight UTC of a civil date. Caller guarantees the date is valid.
    [[nodiscard]] static OrderKey
    from_date(int year, unsigned month, unsigned day) noexcept;

    [[nodiscard]] int      year()  const noexcept;
    [[nodiscard]] unsigned month() const noexcept;

    /// ISO date when the key falls on midnight, ISO date-time otherwise.
    [[nodiscard]] std::string to_string() const;
};

// ─── Identifiers ──────────────────────────────────────────────────────────────

/// Case policy applied to entity identifiers before they are compared.
enum class IdCase {
    Lower,     ///< ASCII lower-case (usernames)
    Preserve,  ///< Compare byte-for-byte
};

/// Apply an identifier case policy.
[[nodiscard]] std::string normalize_id(std::string_view id, IdCase policy);

/// Set of tracked entity identifiers.
///
/// Replaces hard-coded player lists: one list, passed to whichever
/// component needs to restrict its input.
class AllowList {
public:
    AllowList(const std::vector<std::string>& ids, IdCase policy = IdCase::Lower);

    /// True if `id` (after applying the list's case policy) is listed.
    [[nodiscard]] bool contains(std::string_view id) const;

    [[nodiscard]] std::size_t size()   const noexcept { return ids_.size(); }
    [[nodiscard]] IdCase      policy() const noexcept { return policy_; }

private:
    std::unordered_set<std::string> ids_;
    IdCase                          policy_;
};

// ─── Event ────────────────────────────────────────────────────────────────────

/// The two sides of a matchup, in recorded slot order (white/black,
/// home/away).
struct Participants {
    std::string first;
    std::string second;
};

/// Normalized input record consumed by every analytical component.
struct Event {
    std::string                 entity_id;     ///< Tracked subject ("global" for one series)
    OrderKey                    occurred_at;   ///< Ordering key, always present
    std::string                 category;      ///< Value from a bounded domain
    std::optional<double>       value;         ///< Numeric measure; nullopt = NULL
    std::optional<Participants> participants;  ///< Set for matchup events only
};

} // namespace seqa
