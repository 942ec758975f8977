#pragma once

/// @file include/bridget/calendar.hpp
/// @brief Calendar decomposition of timestamps into aggregation buckets.
///
/// Bucketing happens in a fixed-offset local calendar: the host passes the
/// offset of the locale in which "rush hour" and "weekend" are meaningful
/// (e.g. −420 for Pacific Daylight Time). No time-zone database is consulted.

#include "bridget/types.hpp"

#include <chrono>
#include <optional>
#include <string_view>

namespace bridget {

/// Calendar fields of an instant in a fixed-offset local calendar.
struct CalendarParts {
    int year        = 0;
    int month       = 0;  ///< 1 … 12
    int day         = 0;  ///< 1 … 31
    int day_of_week = 0;  ///< 1 = Sunday … 7 = Saturday
    int hour        = 0;  ///< 0 … 23
    int minute      = 0;  ///< 0 … 59
};

/// Decompose `t` shifted by `utc_offset` into calendar fields.
[[nodiscard]] CalendarParts
calendar_parts(Timestamp t, std::chrono::minutes utc_offset = {}) noexcept;

/// Sunday or Saturday.
[[nodiscard]] constexpr bool is_weekend_day(int day_of_week) noexcept {
    return day_of_week == 1 || day_of_week == 7;
}

/// Weekday 07:00–09:59 or 16:00–18:59.
[[nodiscard]] constexpr bool is_rush_hour(int day_of_week, int hour) noexcept {
    return !is_weekend_day(day_of_week) &&
           ((hour >= 7 && hour <= 9) || (hour >= 16 && hour <= 18));
}

/// May through September.
[[nodiscard]] constexpr bool is_summer_month(int month) noexcept {
    return month >= 5 && month <= 9;
}

/// English weekday name for a 1-based (Sunday = 1) day of week.
[[nodiscard]] std::string_view weekday_name(int day_of_week) noexcept;

/// Parse "YYYY-MM-DDTHH:MM[:SS][Z]" (a space may replace 'T') or a plain
/// integer count of seconds since the Unix epoch.
///
/// # Returns
/// `nullopt` if the text matches neither form or names an invalid date.
[[nodiscard]] std::optional<Timestamp> parse_timestamp(std::string_view text) noexcept;

/// Format as "YYYY-MM-DDTHH:MM:SSZ".
[[nodiscard]] std::string format_timestamp(Timestamp t);

}  // namespace bridget
