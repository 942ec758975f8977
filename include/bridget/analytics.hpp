#pragma once

/// @file include/bridget/analytics.hpp
/// @brief Analytics Aggregator: per-entity, per-time-bucket statistics.
///
/// # Module: Analytics Aggregator
///
/// ## Responsibility
/// Group raw opening events into (entity, year, month, weekday, hour)
/// buckets and compute count, duration, probability and confidence
/// statistics usable for opening-probability and duration forecasting.
///
/// ## Probability
/// The opening probability of bucket B is a historical frequency normalised
/// within its weekday/hour slice:
///
///     P(B) = n(B) / Σ n(B')   over all B' of the same entity with the
///                             same (day_of_week, hour), any year / month
///
/// so rush-hour and off-peak hours are never compared with each other.
///
/// ## Confidence
///     confidence(B) = min(1, n(B) / min_sample_for_full_confidence)
///
/// ## Guarantees
/// - Never throws; buckets with no observations are simply not emitted
/// - Idempotent: output is sorted by bucket key, so repeated calls on the
///   same input compare equal element by element
/// - Malformed events (negative duration, close before open) are ignored;
///   still-open events count as openings but not toward duration statistics
///
/// ## Trends and Streaks
/// `TrendCalculator` rolls openings up per local day and per Sunday-started
/// local week and compares consecutive periods. `StreakAnalytics` measures
/// the quiet spells between an entity's openings. Both take the reference
/// instant explicitly, so their output depends only on their arguments.
///
/// ## NOT Responsible For
/// - Cascade relationships between entities (see cascade.hpp)
/// - Forecasting (see prediction.hpp)

#include "bridget/types.hpp"
#include "bridget/constants.hpp"

#include <chrono>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

namespace bridget::analytics {

// ─── AggregatorConfig ─────────────────────────────────────────────────────────

struct AggregatorConfig {
    /// Bucket size at which confidence saturates at 1.0. Values < 1 act as 1.
    int min_sample_for_full_confidence = constants::MIN_SAMPLE_FOR_FULL_CONFIDENCE;

    /// Offset of the local calendar used for bucketing.
    std::chrono::minutes utc_offset{0};

    /// Emit progress diagnostics to stderr.
    bool verbose = false;
};

// ─── AnalyticsAggregator ──────────────────────────────────────────────────────

/// Stateless bucket aggregator. Safe to share between threads.
class AnalyticsAggregator {
public:
    explicit AnalyticsAggregator(AggregatorConfig config = AggregatorConfig{});

    /// Aggregate `events` into one record per observed bucket.
    ///
    /// # Returns
    /// Records sorted by (entity_id, year, month, day_of_week, hour).
    /// Empty if `events` is empty, contains only malformed events, or if
    /// `stop` is requested before completion.
    [[nodiscard]] std::vector<AnalyticsRecord>
    aggregate(std::span<const Event> events,
              std::stop_token stop = {}) const noexcept;

    [[nodiscard]] const AggregatorConfig& config() const noexcept { return config_; }

private:
    AggregatorConfig config_;
};

// ─── Seasonal Decomposition ───────────────────────────────────────────────────

/// Additive decomposition of a bucket's opening count.
struct SeasonalComponents {
    EntityId entity_id   = 0;
    int      year        = 0;
    int      month       = 0;
    int      day_of_week = 0;
    int      hour        = 0;

    double trend              = 0.0;  ///< Centred moving average of counts
    double weekly_seasonality = 0.0;  ///< Mean count of the weekday group
    double monthly_seasonality = 0.0; ///< Mean count of the month group
    double hourly_seasonality = 0.0;  ///< Mean count of the hour group
    double seasonal           = 0.0;  ///< Σ group deviations from grand means
    double residual           = 0.0;  ///< count − trend − seasonal
    double holiday_adjustment = 0.0;  ///< Fixed uplift in holiday periods
};

/// Per-entity trend / seasonal / residual decomposition of analytics records.
class SeasonalDecomposition {
public:
    SeasonalDecomposition() = delete;

    /// Decompose each entity's bucket series independently.
    ///
    /// # Returns
    /// One entry per input record, grouped by entity and ordered by
    /// (year, month, day_of_week, hour) within each entity.
    [[nodiscard]] static std::vector<SeasonalComponents>
    decompose(std::span<const AnalyticsRecord> records,
              std::size_t trend_window = constants::TREND_WINDOW) noexcept;

    /// Holiday uplift for a bucket: July, and Mondays in May / September.
    [[nodiscard]] static double
    holiday_adjustment(int month, int day_of_week) noexcept;

    /// Human-readable seasonal observations for one entity (weekend vs.
    /// weekday, summer vs. rest of year, rush-hour suppression).
    [[nodiscard]] static std::vector<std::string>
    insights(EntityId entity, std::span<const AnalyticsRecord> records);
};

// ─── Severity Classification ──────────────────────────────────────────────────

enum class ImpactLevel { Low, Moderate, High, Severe };

[[nodiscard]] const char* to_string(ImpactLevel level) noexcept;

/// Impact classification of one closed event.
struct EventSeverity {
    EntityId    entity_id = 0;
    Timestamp   open_time{};
    double      duration_minutes = 0.0;
    ImpactLevel level            = ImpactLevel::Low;
    bool        rush_hour        = false;
};

/// Band each closed event's duration against the quantile cut points of all
/// closed durations in `events`, escalating one level during rush hour.
///
/// Open and malformed events are skipped. Output follows input order.
[[nodiscard]] std::vector<EventSeverity>
classify_severity(std::span<const Event> events,
                  std::chrono::minutes utc_offset = {}) noexcept;

// ─── Trends ───────────────────────────────────────────────────────────────────

/// Openings on one local calendar day.
struct DailyTrendPoint {
    Timestamp date{};               ///< Local midnight, as a UTC instant
    int       count            = 0;
    double    average_duration = 0.0;  ///< Minutes, over closed openings; 0 if none

    bool operator==(const DailyTrendPoint&) const = default;
};

/// Openings in one local week (Sunday to Saturday).
struct WeeklyTrendPoint {
    Timestamp week_start{};         ///< Local Sunday midnight, as a UTC instant
    int       count            = 0;
    double    average_duration = 0.0;
    int       entity_count     = 0;  ///< Distinct entities that opened

    bool operator==(const WeeklyTrendPoint&) const = default;
};

enum class TrendDirection { Up, Down, Stable };

[[nodiscard]] const char* to_string(TrendDirection direction) noexcept;

/// Comparison of a current period's value with the previous period's.
struct TrendSummary {
    int            current_value  = 0;
    int            previous_value = 0;
    int            change         = 0;
    double         change_percent = 0.0;  ///< 0 when the previous value is 0
    TrendDirection direction      = TrendDirection::Stable;

    bool operator==(const TrendSummary&) const = default;
};

/// Period roll-ups of opening activity. Malformed events and openings after
/// `now` are ignored throughout.
class TrendCalculator {
public:
    TrendCalculator() = delete;

    /// One point per local day, oldest first, for the `days` days ending
    /// with the day containing `now`. Days without openings are present
    /// with a zero count. `days` < 1 yields an empty series.
    [[nodiscard]] static std::vector<DailyTrendPoint>
    daily(std::span<const Event> events, Timestamp now,
          int days = constants::DAILY_TREND_DAYS,
          std::chrono::minutes utc_offset = {});

    /// One point per local week, oldest first, for the `weeks` weeks ending
    /// with the week containing `now`.
    [[nodiscard]] static std::vector<WeeklyTrendPoint>
    weekly(std::span<const Event> events, Timestamp now,
           int weeks = constants::WEEKLY_TREND_WEEKS,
           std::chrono::minutes utc_offset = {});

    /// Daily series spanning the data: from the earliest opening's day to
    /// the day of `now`, capped at 30 days.
    [[nodiscard]] static std::vector<DailyTrendPoint>
    data_range(std::span<const Event> events, Timestamp now,
               std::chrono::minutes utc_offset = {});

    [[nodiscard]] static TrendSummary summarize(int current, int previous) noexcept;

    /// Openings in (now − days, now] against (now − 2·days, now − days].
    [[nodiscard]] static TrendSummary
    opening_count_trend(std::span<const Event> events, Timestamp now,
                        int days = constants::TREND_PERIOD_DAYS) noexcept;

    /// Distinct opening entities over the same two periods.
    [[nodiscard]] static TrendSummary
    entity_count_trend(std::span<const Event> events, Timestamp now,
                       int days = constants::TREND_PERIOD_DAYS);
};

// ─── Streaks ──────────────────────────────────────────────────────────────────

/// A quiet spell of at least `MIN_STREAK_HOURS` between two openings.
struct StreakPattern {
    Timestamp start{};
    Timestamp end{};
    double    duration_hours = 0.0;
};

/// How a current streak compares with the entity's history.
enum class StreakStanding { NearRecord, AboveAverage, Typical, BelowAverage };

[[nodiscard]] const char* to_string(StreakStanding standing) noexcept;

struct StreakData {
    EntityId    entity_id = 0;
    std::string entity_label;

    double      current_streak_hours = 0.0;  ///< Since the last opening; 0 without one
    double      longest_streak_hours = 0.0;
    double      average_streak_hours = 0.0;
    std::size_t streak_count         = 0;

    std::optional<Timestamp> last_opening;
    std::optional<Timestamp> next_predicted_opening;
    double prediction_confidence = 0.0;  ///< [0.1, 0.95] from interval regularity
    double confidence            = 0.1;  ///< [0.1, 0.95] from data density

    std::vector<StreakPattern> history;  ///< Oldest first
};

struct WeeklyChampion {
    EntityId       entity_id = 0;
    std::string    entity_label;
    double         streak_hours = 0.0;
    double         confidence   = 0.0;
    StreakStanding standing     = StreakStanding::Typical;
};

/// Quiet-spell statistics over an entity's openings.
class StreakAnalytics {
public:
    StreakAnalytics() = delete;

    /// Streak statistics of `entity` from its openings in
    /// [now − lookback_days, now]. A `lookback_days` below 1 acts as 1.
    [[nodiscard]] static StreakData
    streak(EntityId entity, std::span<const Event> events, Timestamp now,
           int lookback_days = constants::STREAK_LOOKBACK_DAYS);

    /// Entity whose last opening in the past week lies furthest behind
    /// `now`. Ties go to the lowest entity id.
    ///
    /// # Returns
    /// `nullopt` when no entity opened in the past week before `now`.
    [[nodiscard]] static std::optional<WeeklyChampion>
    weekly_champion(std::span<const Event> events, Timestamp now);

    [[nodiscard]] static StreakStanding standing(const StreakData& data) noexcept;

    /// "Nh" below a day, "Dd Hh" from a day on; fractions are truncated.
    [[nodiscard]] static std::string format_hours(double hours);
};

}  // namespace bridget::analytics
