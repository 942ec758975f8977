/// @file src/core/calendar.cpp
/// @brief Calendar decomposition and timestamp parsing.

#include "bridget/calendar.hpp"

#include <fmt/format.h>

#include <array>
#include <charconv>
#include <cstdint>

namespace bridget {

namespace {

/// Parse all of `text` as a base-10 integer.
template <typename Int>
[[nodiscard]] bool parse_int(std::string_view text, Int& out) noexcept {
    if (text.empty()) return false;
    const auto* first = text.data();
    const auto* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}  // namespace

// ─── calendar_parts ───────────────────────────────────────────────────────────

CalendarParts calendar_parts(Timestamp t, std::chrono::minutes utc_offset) noexcept {
    using namespace std::chrono;

    const auto local     = t + utc_offset;
    const auto day_point = floor<days>(local);
    const year_month_day ymd{day_point};
    const weekday        wd{day_point};
    const hh_mm_ss       hms{local - day_point};

    return CalendarParts{
        .year        = static_cast<int>(ymd.year()),
        .month       = static_cast<int>(static_cast<unsigned>(ymd.month())),
        .day         = static_cast<int>(static_cast<unsigned>(ymd.day())),
        .day_of_week = static_cast<int>(wd.c_encoding()) + 1,
        .hour        = static_cast<int>(hms.hours().count()),
        .minute      = static_cast<int>(hms.minutes().count()),
    };
}

// ─── weekday_name ─────────────────────────────────────────────────────────────

std::string_view weekday_name(int day_of_week) noexcept {
    static constexpr std::array<std::string_view, 7> NAMES = {
        "Sunday", "Monday", "Tuesday", "Wednesday",
        "Thursday", "Friday", "Saturday",
    };
    if (day_of_week < 1 || day_of_week > 7) return "Unknown";
    return NAMES[static_cast<std::size_t>(day_of_week - 1)];
}

// ─── parse_timestamp ──────────────────────────────────────────────────────────

std::optional<Timestamp> parse_timestamp(std::string_view text) noexcept {
    using namespace std::chrono;

    text = trim(text);
    if (text.empty()) return std::nullopt;

    // Epoch seconds.
    std::int64_t epoch = 0;
    if (parse_int(text, epoch)) {
        return Timestamp{seconds{epoch}};
    }

    // ISO-8601: YYYY-MM-DD[T ]HH:MM[:SS][Z]
    if (text.back() == 'Z' || text.back() == 'z') {
        text.remove_suffix(1);
    }
    if (text.size() != 16 && text.size() != 19) return std::nullopt;
    if (text[4] != '-' || text[7] != '-' || text[13] != ':') return std::nullopt;
    if (text[10] != 'T' && text[10] != 't' && text[10] != ' ') return std::nullopt;

    int y = 0;
    unsigned mo = 0, d = 0;
    int h = 0, mi = 0, s = 0;
    if (!parse_int(text.substr(0, 4), y))  return std::nullopt;
    if (!parse_int(text.substr(5, 2), mo)) return std::nullopt;
    if (!parse_int(text.substr(8, 2), d))  return std::nullopt;
    if (!parse_int(text.substr(11, 2), h)) return std::nullopt;
    if (!parse_int(text.substr(14, 2), mi)) return std::nullopt;
    if (text.size() == 19) {
        if (text[16] != ':' || !parse_int(text.substr(17, 2), s)) return std::nullopt;
    }

    const year_month_day ymd{year{y}, month{mo}, day{d}};
    if (!ymd.ok()) return std::nullopt;
    if (h < 0 || h > 23 || mi < 0 || mi > 59 || s < 0 || s > 60) return std::nullopt;

    return Timestamp{sys_days{ymd}} + hours{h} + minutes{mi} + seconds{s};
}

// ─── format_timestamp ─────────────────────────────────────────────────────────

std::string format_timestamp(Timestamp t) {
    using namespace std::chrono;
    const auto p   = calendar_parts(t);
    const auto sec = (t - floor<minutes>(t)).count();
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z",
                       p.year, p.month, p.day, p.hour, p.minute, sec);
}

}  // namespace bridget
