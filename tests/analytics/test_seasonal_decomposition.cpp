#include <gtest/gtest.h>
#include "bridget/analytics.hpp"
#include "bridget/calendar.hpp"
#include "bridget/constants.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace bridget;
using namespace bridget::analytics;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static AnalyticsRecord bucket(EntityId id, int month, int dow, int hour, int count) {
    AnalyticsRecord r;
    r.entity_id     = id;
    r.entity_label  = "Fremont";
    r.year          = 2025;
    r.month         = month;
    r.day_of_week   = dow;
    r.hour          = hour;
    r.opening_count = count;
    r.is_weekend    = is_weekend_day(dow);
    r.is_rush_hour  = is_rush_hour(dow, hour);
    r.is_summer     = is_summer_month(month);
    return r;
}

static bool contains_text(const std::vector<std::string>& lines, const std::string& needle) {
    return std::any_of(lines.begin(), lines.end(), [&](const std::string& s) {
        return s.find(needle) != std::string::npos;
    });
}

// ─── holiday_adjustment ───────────────────────────────────────────────────────

TEST(SeasonalDecomposition_Holiday, JulyAndHolidayMondays) {
    EXPECT_DOUBLE_EQ(SeasonalDecomposition::holiday_adjustment(7, 4), constants::HOLIDAY_ADJUSTMENT);
    EXPECT_DOUBLE_EQ(SeasonalDecomposition::holiday_adjustment(5, 2), constants::HOLIDAY_ADJUSTMENT);
    EXPECT_DOUBLE_EQ(SeasonalDecomposition::holiday_adjustment(9, 2), constants::HOLIDAY_ADJUSTMENT);
    EXPECT_DOUBLE_EQ(SeasonalDecomposition::holiday_adjustment(5, 3), 0.0);
    EXPECT_DOUBLE_EQ(SeasonalDecomposition::holiday_adjustment(12, 2), 0.0);
}

// ─── decompose ────────────────────────────────────────────────────────────────

TEST(SeasonalDecomposition_Decompose, EmptyInput_EmptyOutput) {
    EXPECT_TRUE(SeasonalDecomposition::decompose({}).empty());
}

TEST(SeasonalDecomposition_Decompose, KnownComponents) {
    // Deliberately out of order: decomposition sorts each entity's series.
    const std::vector<AnalyticsRecord> records = {
        bucket(1, 6, 3, 8, 6),
        bucket(1, 6, 2, 8, 4),
        bucket(1, 6, 2, 9, 2),
    };
    const auto c = SeasonalDecomposition::decompose(records);
    ASSERT_EQ(c.size(), 3u);

    // Series order: (dow 2, h 8), (dow 2, h 9), (dow 3, h 8)
    EXPECT_EQ(c[0].day_of_week, 2);
    EXPECT_EQ(c[0].hour, 8);
    EXPECT_EQ(c[1].hour, 9);
    EXPECT_EQ(c[2].day_of_week, 3);

    for (const auto& x : c) EXPECT_DOUBLE_EQ(x.trend, 4.0);

    EXPECT_DOUBLE_EQ(c[0].weekly_seasonality, 3.0);
    EXPECT_DOUBLE_EQ(c[2].weekly_seasonality, 6.0);
    EXPECT_DOUBLE_EQ(c[0].monthly_seasonality, 4.0);
    EXPECT_DOUBLE_EQ(c[0].hourly_seasonality, 5.0);
    EXPECT_DOUBLE_EQ(c[1].hourly_seasonality, 2.0);

    EXPECT_NEAR(c[0].seasonal, 0.0, 1e-12);
    EXPECT_NEAR(c[1].seasonal, -3.0, 1e-12);
    EXPECT_NEAR(c[2].seasonal, 3.0, 1e-12);

    EXPECT_NEAR(c[0].residual, 0.0, 1e-12);
    EXPECT_NEAR(c[1].residual, 1.0, 1e-12);
    EXPECT_NEAR(c[2].residual, -1.0, 1e-12);
}

TEST(SeasonalDecomposition_Decompose, NarrowWindow_TruncatedAtEnds) {
    const std::vector<AnalyticsRecord> records = {
        bucket(1, 6, 2, 8, 4),
        bucket(1, 6, 2, 9, 2),
        bucket(1, 6, 3, 8, 6),
    };
    const auto c = SeasonalDecomposition::decompose(records, 2);
    ASSERT_EQ(c.size(), 3u);
    EXPECT_DOUBLE_EQ(c[0].trend, 3.0);
    EXPECT_DOUBLE_EQ(c[1].trend, 4.0);
    EXPECT_DOUBLE_EQ(c[2].trend, 4.0);
}

TEST(SeasonalDecomposition_Decompose, EntitiesDecomposedIndependently) {
    const std::vector<AnalyticsRecord> records = {
        bucket(2, 1, 4, 12, 100),
        bucket(1, 1, 4, 12, 1),
    };
    const auto c = SeasonalDecomposition::decompose(records);
    ASSERT_EQ(c.size(), 2u);
    EXPECT_EQ(c[0].entity_id, 1);
    EXPECT_DOUBLE_EQ(c[0].trend, 1.0);
    EXPECT_DOUBLE_EQ(c[1].trend, 100.0);
    EXPECT_DOUBLE_EQ(c[0].seasonal, 0.0);
    EXPECT_DOUBLE_EQ(c[1].residual, 0.0);
}

TEST(SeasonalDecomposition_Decompose, HolidayAdjustmentCarried) {
    const std::vector<AnalyticsRecord> records = {bucket(1, 7, 5, 14, 3)};
    const auto c = SeasonalDecomposition::decompose(records);
    ASSERT_EQ(c.size(), 1u);
    EXPECT_DOUBLE_EQ(c[0].holiday_adjustment, constants::HOLIDAY_ADJUSTMENT);
}

// ─── insights ─────────────────────────────────────────────────────────────────

TEST(SeasonalDecomposition_Insights, UnknownEntity_Empty) {
    const std::vector<AnalyticsRecord> records = {bucket(1, 6, 2, 8, 4)};
    EXPECT_TRUE(SeasonalDecomposition::insights(99, records).empty());
}

TEST(SeasonalDecomposition_Insights, WeekendHeavy) {
    const std::vector<AnalyticsRecord> records = {
        bucket(1, 3, 1, 12, 10),
        bucket(1, 3, 7, 12, 10),
        bucket(1, 3, 4, 12, 2),
    };
    const auto lines = SeasonalDecomposition::insights(1, records);
    EXPECT_TRUE(contains_text(lines, "weekends"));
    EXPECT_FALSE(contains_text(lines, "weekdays"));
    EXPECT_TRUE(contains_text(lines, "Busiest hour is 12:00 (22 openings)"));
}

TEST(SeasonalDecomposition_Insights, SummerAndRushHourSuppression) {
    const std::vector<AnalyticsRecord> records = {
        bucket(1, 7, 3, 11, 8),   // summer, off-peak
        bucket(1, 7, 3, 14, 8),   // summer, off-peak
        bucket(1, 1, 3, 8, 1),    // winter, rush hour
        bucket(1, 1, 3, 17, 1),   // winter, rush hour
    };
    const auto lines = SeasonalDecomposition::insights(1, records);
    EXPECT_TRUE(contains_text(lines, "Summer boating season"));
    EXPECT_TRUE(contains_text(lines, "suppressed during weekday rush hours"));
    EXPECT_TRUE(contains_text(lines, "Busiest hour is 11:00"));
}

TEST(SeasonalDecomposition_Insights, BalancedPattern_OnlyBusiestHour) {
    const std::vector<AnalyticsRecord> records = {
        bucket(1, 3, 1, 12, 5),
        bucket(1, 3, 4, 12, 5),
    };
    const auto lines = SeasonalDecomposition::insights(1, records);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "Busiest hour is 12:00 (10 openings)");
}
