/// @file src/analytics/streaks.cpp
/// @brief Quiet spells between openings and the weekly streak champion.

#include "bridget/analytics.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <set>

namespace bridget::analytics {

namespace {

double hours_between(Timestamp from, Timestamp to) noexcept {
    return minutes_between(from, to) / 60.0;
}

/// Confidence from how densely the look-back window is populated.
double density_confidence(std::size_t openings, std::size_t streaks, int lookback_days) noexcept {
    const double days = static_cast<double>(lookback_days);
    const double c = 0.6 * static_cast<double>(openings) / days +
                     0.4 * static_cast<double>(streaks) / days;
    return std::clamp(c, 0.1, 0.95);
}

/// Confidence from the regularity of the gaps between sorted openings.
double regularity_confidence(const std::vector<Timestamp>& opens, double mean_gap) noexcept {
    if (opens.size() < 3) return 0.3;
    if (mean_gap <= 0.0) return 0.1;

    double deviation = 0.0;
    for (std::size_t i = 0; i + 1 < opens.size(); ++i) {
        deviation += std::abs(hours_between(opens[i], opens[i + 1]) - mean_gap);
    }
    const double cv = deviation / static_cast<double>(opens.size() - 1) / mean_gap;
    return std::clamp(1.0 - cv, 0.1, 0.95);
}

}  // namespace

const char* to_string(StreakStanding standing) noexcept {
    switch (standing) {
        case StreakStanding::NearRecord:   return "near record";
        case StreakStanding::AboveAverage: return "above average";
        case StreakStanding::Typical:      return "typical";
        case StreakStanding::BelowAverage: return "below average";
    }
    return "unknown";
}

StreakData StreakAnalytics::streak(EntityId entity, std::span<const Event> events,
                                   Timestamp now, int lookback_days) {
    const int lookback = std::max(1, lookback_days);
    const Timestamp from = now - std::chrono::days{lookback};

    StreakData d;
    d.entity_id = entity;

    std::vector<Timestamp> opens;
    Timestamp labelled_at{};
    for (const auto& e : events) {
        if (e.entity_id != entity || e.is_malformed()) continue;
        if (e.open_time < from || e.open_time > now) continue;
        opens.push_back(e.open_time);
        if (!e.entity_label.empty() && (d.entity_label.empty() || e.open_time >= labelled_at)) {
            d.entity_label = e.entity_label;
            labelled_at    = e.open_time;
        }
    }
    std::sort(opens.begin(), opens.end());

    if (opens.empty()) {
        d.confidence = density_confidence(0, 0, lookback);
        return d;
    }

    d.last_opening         = opens.back();
    d.current_streak_hours = std::max(0.0, hours_between(opens.back(), now));

    double gap_total = 0.0;
    for (std::size_t i = 0; i + 1 < opens.size(); ++i) {
        const double gap = hours_between(opens[i], opens[i + 1]);
        gap_total += gap;
        if (gap >= constants::MIN_STREAK_HOURS) {
            d.history.push_back(StreakPattern{opens[i], opens[i + 1], gap});
        }
    }

    d.streak_count = d.history.size();
    for (const auto& s : d.history) {
        d.longest_streak_hours = std::max(d.longest_streak_hours, s.duration_hours);
        d.average_streak_hours += s.duration_hours;
    }
    if (!d.history.empty()) d.average_streak_hours /= static_cast<double>(d.history.size());

    const double mean_gap = opens.size() >= 2 ? gap_total / static_cast<double>(opens.size() - 1) : 0.0;
    const double ahead    = std::max(0.0, mean_gap - d.current_streak_hours);
    d.next_predicted_opening =
        now + std::chrono::seconds{static_cast<long long>(std::llround(ahead * 3600.0))};

    d.prediction_confidence = regularity_confidence(opens, mean_gap);
    d.confidence            = density_confidence(opens.size(), d.history.size(), lookback);
    return d;
}

std::optional<WeeklyChampion>
StreakAnalytics::weekly_champion(std::span<const Event> events, Timestamp now) {
    std::set<EntityId> ids;
    for (const auto& e : events) ids.insert(e.entity_id);

    std::optional<WeeklyChampion> champion;
    double best = 0.0;
    for (EntityId id : ids) {
        const auto d = streak(id, events, now, constants::CHAMPION_LOOKBACK_DAYS);
        if (d.current_streak_hours <= best) continue;
        best     = d.current_streak_hours;
        champion = WeeklyChampion{
            .entity_id    = id,
            .entity_label = d.entity_label,
            .streak_hours = d.current_streak_hours,
            .confidence   = d.confidence,
            .standing     = standing(d),
        };
    }
    return champion;
}

StreakStanding StreakAnalytics::standing(const StreakData& data) noexcept {
    const double current = data.current_streak_hours;
    if (current > data.longest_streak_hours * 0.8) return StreakStanding::NearRecord;
    if (current > data.average_streak_hours * 1.5) return StreakStanding::AboveAverage;
    if (current < data.average_streak_hours * 0.5) return StreakStanding::BelowAverage;
    return StreakStanding::Typical;
}

std::string StreakAnalytics::format_hours(double hours) {
    if (std::isnan(hours) || hours < 0.0) hours = 0.0;
    if (!std::isfinite(hours)) return "unknown";
    if (hours < 24.0) return fmt::format("{:.0f}h", std::floor(hours));
    return fmt::format("{:.0f}d {:.0f}h", std::floor(hours / 24.0),
                       std::floor(std::fmod(hours, 24.0)));
}

}  // namespace bridget::analytics
