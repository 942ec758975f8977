#include <gtest/gtest.h>
#include "bridget/analytics.hpp"

#include <chrono>
#include <vector>

using namespace bridget;
using namespace bridget::analytics;
using namespace std::chrono;

// ─── Helpers ─────────────────────────────────────────────────────────────────

/// Wednesday 4 June 2025, noon UTC. The week began on Sunday 1 June.
static const Timestamp NOW = sys_days{2025y / June / 4} + 12h;

static Event opened(EntityId id, Timestamp open, double minutes = -1.0) {
    Event e;
    e.entity_id = id;
    e.open_time = open;
    if (minutes >= 0.0) {
        e.close_time   = open + seconds{static_cast<long long>(minutes * 60.0)};
        e.minutes_open = minutes;
    }
    return e;
}

static Event malformed(Timestamp open) {
    Event e = opened(1, open, 5.0);
    e.close_time = open - 1min;
    return e;
}

// ─── daily ────────────────────────────────────────────────────────────────────

TEST(Trends_Daily, CountsAndAveragesPerDay) {
    const std::vector<Event> events = {
        opened(1, sys_days{2025y / June / 2} + 8h, 10.0),
        opened(2, sys_days{2025y / June / 2} + 20h, 20.0),
        malformed(sys_days{2025y / June / 3} + 9h),
        opened(1, sys_days{2025y / June / 4} + 9h),          // still open
        opened(1, sys_days{2025y / June / 4} + 13h, 5.0),    // after now
        opened(1, sys_days{2025y / May / 31} + 9h, 5.0),     // before the window
    };

    const auto points = TrendCalculator::daily(events, NOW, 3);
    ASSERT_EQ(points.size(), 3u);

    EXPECT_EQ(points[0].date, Timestamp{sys_days{2025y / June / 2}});
    EXPECT_EQ(points[0].count, 2);
    EXPECT_DOUBLE_EQ(points[0].average_duration, 15.0);

    EXPECT_EQ(points[1].date, Timestamp{sys_days{2025y / June / 3}});
    EXPECT_EQ(points[1].count, 0);
    EXPECT_DOUBLE_EQ(points[1].average_duration, 0.0);

    EXPECT_EQ(points[2].count, 1);
    EXPECT_DOUBLE_EQ(points[2].average_duration, 0.0);
}

TEST(Trends_Daily, LocalCalendarOffset) {
    // 02:00 UTC on 3 June is 19:00 on 2 June at UTC−7.
    const std::vector<Event> events = {opened(1, sys_days{2025y / June / 3} + 2h, 6.0)};
    const auto points = TrendCalculator::daily(events, NOW, 3, minutes{-420});

    ASSERT_EQ(points.size(), 3u);
    EXPECT_EQ(points[0].date, sys_days{2025y / June / 2} + 7h);
    EXPECT_EQ(points[0].count, 1);
    EXPECT_EQ(points[1].count, 0);
}

TEST(Trends_Daily, NonPositiveDays_Empty) {
    const std::vector<Event> events = {opened(1, NOW - 1h, 5.0)};
    EXPECT_TRUE(TrendCalculator::daily(events, NOW, 0).empty());
    EXPECT_TRUE(TrendCalculator::daily(events, NOW, -4).empty());
}

TEST(Trends_Daily, DefaultWindowIsThirtyDays) {
    const auto points = TrendCalculator::daily(std::vector<Event>{}, NOW);
    ASSERT_EQ(points.size(), 30u);
    EXPECT_EQ(points.back().date, Timestamp{sys_days{2025y / June / 4}});
    for (const auto& p : points) EXPECT_EQ(p.count, 0);
}

// ─── weekly ───────────────────────────────────────────────────────────────────

TEST(Trends_Weekly, SundayStartedWeeksWithDistinctEntities) {
    const std::vector<Event> events = {
        opened(1, sys_days{2025y / May / 24} + 9h, 4.0),   // Saturday, previous week
        opened(1, sys_days{2025y / May / 27} + 9h, 4.0),
        opened(2, sys_days{2025y / May / 28} + 9h, 8.0),
        opened(1, sys_days{2025y / May / 29} + 9h, 6.0),
        opened(1, sys_days{2025y / June / 2} + 9h, 10.0),
    };

    const auto points = TrendCalculator::weekly(events, NOW, 2);
    ASSERT_EQ(points.size(), 2u);

    EXPECT_EQ(points[0].week_start, Timestamp{sys_days{2025y / May / 25}});
    EXPECT_EQ(points[0].count, 3);
    EXPECT_DOUBLE_EQ(points[0].average_duration, 6.0);
    EXPECT_EQ(points[0].entity_count, 2);

    EXPECT_EQ(points[1].week_start, Timestamp{sys_days{2025y / June / 1}});
    EXPECT_EQ(points[1].count, 1);
    EXPECT_EQ(points[1].entity_count, 1);
}

// ─── data_range ───────────────────────────────────────────────────────────────

TEST(Trends_DataRange, SpansEarliestDayToNow) {
    const std::vector<Event> events = {opened(1, sys_days{2025y / June / 2} + 9h, 5.0),
                                       opened(1, NOW - 1h, 5.0)};
    const auto points = TrendCalculator::data_range(events, NOW);
    ASSERT_EQ(points.size(), 3u);
    EXPECT_EQ(points.front().date, Timestamp{sys_days{2025y / June / 2}});
}

TEST(Trends_DataRange, CappedAtThirtyDays) {
    const std::vector<Event> events = {opened(1, NOW - days{60}, 5.0)};
    EXPECT_EQ(TrendCalculator::data_range(events, NOW).size(), 30u);
}

TEST(Trends_DataRange, NoUsableEvents_Empty) {
    const std::vector<Event> events = {opened(1, NOW + 1h, 5.0), malformed(NOW - 1h)};
    EXPECT_TRUE(TrendCalculator::data_range(events, NOW).empty());
}

// ─── summaries ────────────────────────────────────────────────────────────────

TEST(Trends_Summary, DirectionAndPercent) {
    const auto up = TrendCalculator::summarize(12, 8);
    EXPECT_EQ(up.change, 4);
    EXPECT_DOUBLE_EQ(up.change_percent, 50.0);
    EXPECT_EQ(up.direction, TrendDirection::Up);

    const auto down = TrendCalculator::summarize(2, 4);
    EXPECT_EQ(down.change, -2);
    EXPECT_DOUBLE_EQ(down.change_percent, -50.0);
    EXPECT_EQ(down.direction, TrendDirection::Down);

    EXPECT_EQ(TrendCalculator::summarize(5, 5).direction, TrendDirection::Stable);
    EXPECT_STREQ(to_string(TrendDirection::Stable), "stable");
}

TEST(Trends_Summary, NoPreviousActivity_ZeroPercent) {
    const auto s = TrendCalculator::summarize(3, 0);
    EXPECT_EQ(s.change, 3);
    EXPECT_DOUBLE_EQ(s.change_percent, 0.0);
    EXPECT_EQ(s.direction, TrendDirection::Up);
}

TEST(Trends_Summary, OpeningCountComparesConsecutivePeriods) {
    const std::vector<Event> events = {
        opened(1, NOW - 1h, 5.0),
        opened(2, NOW - days{3}, 5.0),
        opened(1, NOW - days{7}, 5.0),   // boundary belongs to the previous period
        opened(1, NOW - days{10}, 5.0),
        opened(1, NOW - days{15}, 5.0),  // outside both
        opened(1, NOW + 1h, 5.0),        // after now
    };

    const auto s = TrendCalculator::opening_count_trend(events, NOW, 7);
    EXPECT_EQ(s.current_value, 2);
    EXPECT_EQ(s.previous_value, 2);
    EXPECT_EQ(s.direction, TrendDirection::Stable);
}

TEST(Trends_Summary, EntityCountComparesDistinctEntities) {
    const std::vector<Event> events = {
        opened(1, NOW - 1h, 5.0),
        opened(1, NOW - 2h, 5.0),
        opened(2, NOW - days{2}, 5.0),
        opened(3, NOW - days{9}, 5.0),
    };

    const auto s = TrendCalculator::entity_count_trend(events, NOW);
    EXPECT_EQ(s.current_value, 2);
    EXPECT_EQ(s.previous_value, 1);
    EXPECT_EQ(s.change, 1);
    EXPECT_DOUBLE_EQ(s.change_percent, 100.0);
    EXPECT_EQ(s.direction, TrendDirection::Up);
}
