/// @file src/core/order_key.cpp
/// @brief OrderKey parsing and civil-calendar accessors.
///
/// Calendar arithmetic goes through std::chrono (year_month_day / sys_days),
/// so leap years and month lengths are validated by the standard library.

#include "seqa/types.hpp"

#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <cstdint>

namespace seqa {

namespace {

constexpr std::int64_t SECONDS_PER_DAY = 86'400;

/// Parse exactly `text` as an unsigned decimal. No sign, no whitespace.
[[nodiscard]] std::optional<unsigned> parse_digits(std::string_view text) noexcept {
    if (text.empty()) return std::nullopt;
    unsigned out = 0;
    const auto* first = text.data();
    const auto* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return out;
}

[[nodiscard]] std::optional<std::int64_t> parse_epoch(std::string_view text) noexcept {
    if (text.empty()) return std::nullopt;
    std::int64_t out = 0;
    const auto* first = text.data();
    const auto* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return out;
}

/// YYYY-MM (with_day = false) or YYYY-MM-DD (with_day = true).
[[nodiscard]] std::optional<std::chrono::sys_days>
parse_civil(std::string_view text, bool with_day) noexcept {
    const std::size_t expected = with_day ? 10 : 7;
    if (text.size() != expected || text[4] != '-') return std::nullopt;
    if (with_day && text[7] != '-') return std::nullopt;

    const auto y = parse_digits(text.substr(0, 4));
    const auto m = parse_digits(text.substr(5, 2));
    const auto d = with_day ? parse_digits(text.substr(8, 2))
                            : std::optional<unsigned>{1u};
    if (!y || !m || !d) return std::nullopt;

    const std::chrono::year_month_day ymd{
        std::chrono::year{static_cast<int>(*y)},
        std::chrono::month{*m},
        std::chrono::day{*d}};
    if (!ymd.ok()) return std::nullopt;
    return std::chrono::sys_days{ymd};
}

[[nodiscard]] std::int64_t to_seconds(std::chrono::sys_days days) noexcept {
    return static_cast<std::int64_t>(days.time_since_epoch().count()) * SECONDS_PER_DAY;
}

/// YYYY-MM-DD[T ]HH:MM[:SS[.fff]][Z]
[[nodiscard]] std::optional<std::int64_t> parse_date_time(std::string_view text) noexcept {
    if (text.size() < 16) return std::nullopt;
    const auto date = parse_civil(text.substr(0, 10), true);
    if (!date) return std::nullopt;
    if (text[10] != 'T' && text[10] != ' ') return std::nullopt;

    std::string_view clock = text.substr(11);
    if (!clock.empty() && clock.back() == 'Z') clock.remove_suffix(1);
    // Fractional seconds are truncated.
    if (const auto dot = clock.find('.'); dot != std::string_view::npos) {
        if (!parse_digits(clock.substr(dot + 1))) return std::nullopt;
        clock = clock.substr(0, dot);
    }
    if (clock.size() != 5 && clock.size() != 8) return std::nullopt;
    if (clock[2] != ':') return std::nullopt;

    const auto hh = parse_digits(clock.substr(0, 2));
    const auto mm = parse_digits(clock.substr(3, 2));
    std::optional<unsigned> ss{0u};
    if (clock.size() == 8) {
        if (clock[5] != ':') return std::nullopt;
        ss = parse_digits(clock.substr(6, 2));
    }
    if (!hh || !mm || !ss) return std::nullopt;
    if (*hh > 23 || *mm > 59 || *ss > 60) return std::nullopt;

    return to_seconds(*date) + *hh * 3600 + *mm * 60 + *ss;
}

[[nodiscard]] std::chrono::year_month_day civil(std::int64_t seconds) noexcept {
    const auto days = std::chrono::floor<std::chrono::days>(
        std::chrono::sys_seconds{std::chrono::seconds{seconds}});
    return std::chrono::year_month_day{days};
}

}  // namespace

// ─── OrderKey::parse ──────────────────────────────────────────────────────────

std::optional<OrderKey>
OrderKey::parse(std::string_view text, TimeFormat format) noexcept {
    // Surrounding whitespace is never significant.
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' ||
                             text.back() == '\r' || text.back() == '\n')) {
        text.remove_suffix(1);
    }
    if (text.empty()) return std::nullopt;

    if (format == TimeFormat::Auto) {
        if (parse_epoch(text))       format = TimeFormat::EpochSeconds;
        else if (text.size() == 7)   format = TimeFormat::Month;
        else if (text.size() == 10)  format = TimeFormat::Date;
        else                         format = TimeFormat::DateTime;
    }

    switch (format) {
        case TimeFormat::EpochSeconds:
            if (auto v = parse_epoch(text)) return OrderKey{*v};
            return std::nullopt;
        case TimeFormat::Month:
            if (auto d = parse_civil(text, false)) return OrderKey{to_seconds(*d)};
            return std::nullopt;
        case TimeFormat::Date:
            if (auto d = parse_civil(text, true)) return OrderKey{to_seconds(*d)};
            return std::nullopt;
        case TimeFormat::DateTime:
            if (auto v = parse_date_time(text)) return OrderKey{*v};
            return std::nullopt;
        case TimeFormat::Auto:
            break;
    }
    return std::nullopt;
}

// ─── OrderKey::from_date ──────────────────────────────────────────────────────

OrderKey OrderKey::from_date(int year, unsigned month, unsigned day) noexcept {
    const std::chrono::year_month_day ymd{
        std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
    return OrderKey{to_seconds(std::chrono::sys_days{ymd})};
}

// ─── Calendar accessors ───────────────────────────────────────────────────────

int OrderKey::year() const noexcept {
    return static_cast<int>(civil(value).year());
}

unsigned OrderKey::month() const noexcept {
    return static_cast<unsigned>(civil(value).month());
}

std::string OrderKey::to_string() const {
    const auto ymd = civil(value);
    const std::string date = fmt::format("{:04d}-{:02d}-{:02d}",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()));

    std::int64_t secs = value % SECONDS_PER_DAY;
    if (secs < 0) secs += SECONDS_PER_DAY;
    if (secs == 0) return date;

    return fmt::format("{}T{:02d}:{:02d}:{:02d}",
        date, secs / 3600, (secs / 60) % 60, secs % 60);
}

}  // namespace seqa
