#include <gtest/gtest.h>
#include "bridget/calendar.hpp"
#include "bridget/types.hpp"

#include <chrono>
#include <limits>

using namespace bridget;
using namespace std::chrono;

// ─── parse_timestamp ──────────────────────────────────────────────────────────

TEST(Calendar_Parse, EpochSeconds) {
    const auto t = parse_timestamp("86400");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->time_since_epoch().count(), 86400);
}

TEST(Calendar_Parse, NegativeEpoch) {
    const auto t = parse_timestamp("-60");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->time_since_epoch().count(), -60);
}

TEST(Calendar_Parse, IsoWithSecondsAndZ) {
    const auto t = parse_timestamp("2025-06-02T07:15:30Z");
    ASSERT_TRUE(t.has_value());
    const Timestamp expected = sys_days{2025y / June / 2} + 7h + 15min + 30s;
    EXPECT_EQ(*t, expected);
}

TEST(Calendar_Parse, IsoWithoutSeconds_SpaceSeparator) {
    const auto t = parse_timestamp(" 2025-06-02 07:15 ");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, Timestamp{sys_days{2025y / June / 2} + 7h + 15min});
}

TEST(Calendar_Parse, InvalidInputs_Nullopt) {
    EXPECT_FALSE(parse_timestamp("").has_value());
    EXPECT_FALSE(parse_timestamp("yesterday").has_value());
    EXPECT_FALSE(parse_timestamp("2025-02-30T00:00:00Z").has_value());
    EXPECT_FALSE(parse_timestamp("2025-06-02T24:00:00Z").has_value());
    EXPECT_FALSE(parse_timestamp("2025/06/02T07:15:00").has_value());
    EXPECT_FALSE(parse_timestamp("12abc").has_value());
}

TEST(Calendar_Format, RoundTripsIso) {
    const auto t = parse_timestamp("2024-02-29T23:59:59Z");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(format_timestamp(*t), "2024-02-29T23:59:59Z");
}

// ─── calendar_parts ───────────────────────────────────────────────────────────

TEST(Calendar_Parts, UnixEpochIsThursday) {
    const auto p = calendar_parts(Timestamp{});
    EXPECT_EQ(p.year, 1970);
    EXPECT_EQ(p.month, 1);
    EXPECT_EQ(p.day, 1);
    EXPECT_EQ(p.day_of_week, 5);
    EXPECT_EQ(p.hour, 0);
}

TEST(Calendar_Parts, SundayIsOne_SaturdayIsSeven) {
    EXPECT_EQ(calendar_parts(sys_days{2025y / June / 1}).day_of_week, 1);
    EXPECT_EQ(calendar_parts(sys_days{2025y / June / 7}).day_of_week, 7);
}

TEST(Calendar_Parts, NegativeOffset_ShiftsIntoPreviousDay) {
    // 03:00 UTC Monday is 20:00 Sunday at UTC−7.
    const Timestamp t = sys_days{2025y / June / 2} + 3h;
    const auto p = calendar_parts(t, minutes{-420});
    EXPECT_EQ(p.day, 1);
    EXPECT_EQ(p.day_of_week, 1);
    EXPECT_EQ(p.hour, 20);
}

TEST(Calendar_Parts, OffsetAcrossYearBoundary) {
    const Timestamp t = sys_days{2025y / January / 1} + 1h;
    const auto p = calendar_parts(t, minutes{-120});
    EXPECT_EQ(p.year, 2024);
    EXPECT_EQ(p.month, 12);
    EXPECT_EQ(p.day, 31);
    EXPECT_EQ(p.hour, 23);
}

// ─── Flags ────────────────────────────────────────────────────────────────────

TEST(Calendar_Flags, Weekend) {
    EXPECT_TRUE(is_weekend_day(1));
    EXPECT_TRUE(is_weekend_day(7));
    for (int d = 2; d <= 6; ++d) EXPECT_FALSE(is_weekend_day(d));
}

TEST(Calendar_Flags, RushHour_WeekdayWindowsOnly) {
    EXPECT_TRUE(is_rush_hour(2, 7));
    EXPECT_TRUE(is_rush_hour(4, 9));
    EXPECT_TRUE(is_rush_hour(6, 16));
    EXPECT_TRUE(is_rush_hour(6, 18));
    EXPECT_FALSE(is_rush_hour(2, 6));
    EXPECT_FALSE(is_rush_hour(2, 10));
    EXPECT_FALSE(is_rush_hour(2, 15));
    EXPECT_FALSE(is_rush_hour(2, 19));
    EXPECT_FALSE(is_rush_hour(1, 8));
    EXPECT_FALSE(is_rush_hour(7, 17));
}

TEST(Calendar_Flags, SummerIsMayThroughSeptember) {
    EXPECT_FALSE(is_summer_month(4));
    for (int m = 5; m <= 9; ++m) EXPECT_TRUE(is_summer_month(m));
    EXPECT_FALSE(is_summer_month(10));
}

TEST(Calendar_Names, Weekdays) {
    EXPECT_EQ(weekday_name(1), "Sunday");
    EXPECT_EQ(weekday_name(7), "Saturday");
    EXPECT_EQ(weekday_name(0), "Unknown");
}

// ─── Types ────────────────────────────────────────────────────────────────────

TEST(Types_Event, KnownDuration_PrefersReportedMinutes) {
    Event e;
    e.open_time    = Timestamp{};
    e.close_time   = Timestamp{} + 10min;
    e.minutes_open = 12.0;
    ASSERT_TRUE(e.known_duration().has_value());
    EXPECT_DOUBLE_EQ(*e.known_duration(), 12.0);

    e.minutes_open.reset();
    EXPECT_DOUBLE_EQ(*e.known_duration(), 10.0);
}

TEST(Types_Event, OpenEvent_NoDuration) {
    Event e;
    e.minutes_open = 5.0;
    EXPECT_TRUE(e.is_open());
    EXPECT_FALSE(e.known_duration().has_value());
}

TEST(Types_Event, Malformed) {
    Event e;
    e.open_time  = Timestamp{} + 1h;
    e.close_time = Timestamp{};
    EXPECT_TRUE(e.is_malformed());

    Event neg;
    neg.close_time   = Timestamp{} + 1min;
    neg.minutes_open = -1.0;
    EXPECT_TRUE(neg.is_malformed());
    EXPECT_FALSE(neg.known_duration().has_value());
}

TEST(Types_Tier, ParseAndNormalize) {
    EXPECT_TRUE(parse_tier("expert") == ComputeTier::Expert);
    EXPECT_FALSE(parse_tier("Expert").has_value());
    EXPECT_EQ(normalize_tier(static_cast<ComputeTier>(42)), ComputeTier::Standard);
    EXPECT_STREQ(to_string(static_cast<ComputeTier>(-1)), "standard");
}

TEST(Types_Forecast, DisplayText) {
    Forecast f;
    f.probability = 0.9;
    f.confidence  = 0.5;
    f.expected_duration_minutes = 0.4;
    EXPECT_EQ(f.probability_text(), "Very High");
    EXPECT_EQ(f.confidence_text(), "Low Confidence");
    EXPECT_EQ(f.duration_text(), "< 1 min");

    f.expected_duration_minutes = 75.0;
    EXPECT_EQ(f.duration_text(), "1h 15m");
    f.expected_duration_minutes = 12.7;
    EXPECT_EQ(f.duration_text(), "12 min");
}

TEST(Types_Forecast, DurationTextBeyondIntRange) {
    Forecast f;
    f.expected_duration_minutes = 1e12;
    EXPECT_EQ(f.duration_text(), "16666666666h 40m");
    f.expected_duration_minutes = 59.9;
    EXPECT_EQ(f.duration_text(), "59 min");
    f.expected_duration_minutes = std::numeric_limits<double>::infinity();
    EXPECT_EQ(f.duration_text(), "unknown");
    f.expected_duration_minutes = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(f.duration_text(), "< 1 min");
}
