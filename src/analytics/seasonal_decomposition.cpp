/// @file src/analytics/seasonal_decomposition.cpp
/// @brief Trend / seasonal / residual decomposition of bucket counts.
///
/// Each entity is treated as its own series of bucket opening counts,
/// ordered by (year, month, day_of_week, hour):
///
///     trend_i    = mean(count_j)  for j ∈ [i − w/2, i + w/2] ∩ [0, n)
///     weekly_i   = mean count of records sharing record i's weekday
///     monthly_i  = mean count of records sharing record i's month
///     hourly_i   = mean count of records sharing record i's hour
///     seasonal_i = Σ (group_mean − grand mean of that grouping's means)
///     residual_i = count_i − trend_i − seasonal_i

#include "bridget/analytics.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <map>
#include <tuple>

namespace bridget::analytics {

namespace {

/// Mean count per group and the unweighted mean of those group means.
struct GroupMeans {
    std::map<int, double> by_key;
    double                grand = 0.0;
};

template <typename KeyFn>
[[nodiscard]] GroupMeans group_means(std::span<const AnalyticsRecord* const> series,
                                     KeyFn key_of) {
    std::map<int, std::pair<double, int>> sums;
    for (const auto* r : series) {
        auto& [sum, n] = sums[key_of(*r)];
        sum += static_cast<double>(r->opening_count);
        ++n;
    }

    GroupMeans out;
    for (const auto& [key, acc] : sums) {
        const double m = acc.first / static_cast<double>(acc.second);
        out.by_key.emplace(key, m);
        out.grand += m;
    }
    if (!out.by_key.empty()) out.grand /= static_cast<double>(out.by_key.size());
    return out;
}

/// Mean opening count over the records selected by `pred`, or nullopt.
template <typename Pred>
[[nodiscard]] std::optional<double> mean_count(std::span<const AnalyticsRecord* const> series,
                                               Pred pred) noexcept {
    double sum = 0.0;
    int    n   = 0;
    for (const auto* r : series) {
        if (!pred(*r)) continue;
        sum += static_cast<double>(r->opening_count);
        ++n;
    }
    if (n == 0) return std::nullopt;
    return sum / static_cast<double>(n);
}

[[nodiscard]] auto series_order(const AnalyticsRecord* r) noexcept {
    return std::tuple{r->year, r->month, r->day_of_week, r->hour};
}

}  // namespace

// ─── holiday_adjustment ───────────────────────────────────────────────────────

double SeasonalDecomposition::holiday_adjustment(int month, int day_of_week) noexcept {
    // July, plus the Mondays of Memorial Day (May) and Labor Day (September).
    constexpr int MONDAY = 2;
    if (month == 7) return constants::HOLIDAY_ADJUSTMENT;
    if ((month == 5 || month == 9) && day_of_week == MONDAY) {
        return constants::HOLIDAY_ADJUSTMENT;
    }
    return 0.0;
}

// ─── decompose ────────────────────────────────────────────────────────────────

std::vector<SeasonalComponents>
SeasonalDecomposition::decompose(std::span<const AnalyticsRecord> records,
                                 std::size_t trend_window) noexcept {
    std::map<EntityId, std::vector<const AnalyticsRecord*>> by_entity;
    for (const auto& r : records) by_entity[r.entity_id].push_back(&r);

    const std::size_t half = trend_window / 2;

    std::vector<SeasonalComponents> out;
    out.reserve(records.size());

    for (auto& [entity, series] : by_entity) {
        std::stable_sort(series.begin(), series.end(),
                         [](const AnalyticsRecord* a, const AnalyticsRecord* b) {
                             return series_order(a) < series_order(b);
                         });

        const auto weekly  = group_means(series, [](const AnalyticsRecord& r) { return r.day_of_week; });
        const auto monthly = group_means(series, [](const AnalyticsRecord& r) { return r.month; });
        const auto hourly  = group_means(series, [](const AnalyticsRecord& r) { return r.hour; });

        const std::size_t n = series.size();
        for (std::size_t i = 0; i < n; ++i) {
            const auto& r = *series[i];

            const std::size_t lo = i >= half ? i - half : 0;
            const std::size_t hi = std::min(n - 1, i + half);
            double window_sum = 0.0;
            for (std::size_t j = lo; j <= hi; ++j) {
                window_sum += static_cast<double>(series[j]->opening_count);
            }

            SeasonalComponents c;
            c.entity_id   = entity;
            c.year        = r.year;
            c.month       = r.month;
            c.day_of_week = r.day_of_week;
            c.hour        = r.hour;

            c.trend               = window_sum / static_cast<double>(hi - lo + 1);
            c.weekly_seasonality  = weekly.by_key.find(r.day_of_week)->second;
            c.monthly_seasonality = monthly.by_key.find(r.month)->second;
            c.hourly_seasonality  = hourly.by_key.find(r.hour)->second;
            c.seasonal = (c.weekly_seasonality - weekly.grand) +
                         (c.monthly_seasonality - monthly.grand) +
                         (c.hourly_seasonality - hourly.grand);
            c.residual = static_cast<double>(r.opening_count) - c.trend - c.seasonal;
            c.holiday_adjustment = holiday_adjustment(r.month, r.day_of_week);

            out.push_back(c);
        }
    }

    return out;
}

// ─── insights ─────────────────────────────────────────────────────────────────

std::vector<std::string>
SeasonalDecomposition::insights(EntityId entity, std::span<const AnalyticsRecord> records) {
    std::vector<const AnalyticsRecord*> series;
    for (const auto& r : records) {
        if (r.entity_id == entity) series.push_back(&r);
    }

    std::vector<std::string> out;
    if (series.empty()) return out;

    // A pattern is reported when one side exceeds the other by 20 %.
    constexpr double RATIO = 1.2;

    const auto weekend = mean_count(series, [](const AnalyticsRecord& r) { return r.is_weekend; });
    const auto weekday = mean_count(series, [](const AnalyticsRecord& r) { return !r.is_weekend; });
    if (weekend && weekday) {
        if (*weekend > RATIO * *weekday) {
            out.push_back(fmt::format(
                "Opens more often on weekends ({:.1f} vs {:.1f} openings per hour)",
                *weekend, *weekday));
        } else if (*weekday > RATIO * *weekend) {
            out.push_back(fmt::format(
                "Opens more often on weekdays ({:.1f} vs {:.1f} openings per hour)",
                *weekday, *weekend));
        }
    }

    const auto summer = mean_count(series, [](const AnalyticsRecord& r) { return r.is_summer; });
    const auto rest   = mean_count(series, [](const AnalyticsRecord& r) { return !r.is_summer; });
    if (summer && rest && *summer > RATIO * *rest) {
        out.push_back(fmt::format(
            "Summer boating season raises activity ({:.1f} vs {:.1f} openings per hour)",
            *summer, *rest));
    }

    const auto rush = mean_count(series, [](const AnalyticsRecord& r) { return r.is_rush_hour; });
    const auto off_peak = mean_count(series, [](const AnalyticsRecord& r) {
        return !r.is_weekend && !r.is_rush_hour;
    });
    if (rush && off_peak && *off_peak > RATIO * *rush) {
        out.push_back("Openings are suppressed during weekday rush hours");
    }

    // Busiest hour of day by total openings; ties go to the earlier hour.
    std::map<int, int> per_hour;
    for (const auto* r : series) per_hour[r->hour] += r->opening_count;
    const auto peak = std::max_element(per_hour.begin(), per_hour.end(),
                                       [](const auto& a, const auto& b) {
                                           return a.second < b.second;
                                       });
    if (peak != per_hour.end() && peak->second > 0) {
        out.push_back(fmt::format("Busiest hour is {:02}:00 ({} openings)",
                                  peak->first, peak->second));
    }

    return out;
}

}  // namespace bridget::analytics
