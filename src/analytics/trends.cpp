/// @file src/analytics/trends.cpp
/// @brief Daily and weekly opening roll-ups and period-over-period trends.

#include "bridget/analytics.hpp"

#include <algorithm>
#include <set>

namespace bridget::analytics {

namespace {

using std::chrono::sys_days;

sys_days local_day(Timestamp t, std::chrono::minutes utc_offset) noexcept {
    return std::chrono::floor<std::chrono::days>(t + utc_offset);
}

Timestamp utc_instant(sys_days local, std::chrono::minutes utc_offset) noexcept {
    return Timestamp{local} - utc_offset;
}

sys_days week_start(sys_days d) noexcept {
    return d - std::chrono::days{std::chrono::weekday{d}.c_encoding()};
}

bool counts_before(const Event& e, Timestamp now) noexcept {
    return !e.is_malformed() && e.open_time <= now;
}

/// Running count / duration totals of one period.
struct Tally {
    int    count  = 0;
    int    closed = 0;
    double total  = 0.0;

    void add(const Event& e) noexcept {
        ++count;
        if (const auto d = e.known_duration()) {
            ++closed;
            total += *d;
        }
    }

    [[nodiscard]] double average() const noexcept { return closed > 0 ? total / closed : 0.0; }
};

}  // namespace

const char* to_string(TrendDirection direction) noexcept {
    switch (direction) {
        case TrendDirection::Up:     return "up";
        case TrendDirection::Down:   return "down";
        case TrendDirection::Stable: return "stable";
    }
    return "unknown";
}

// ─── Series ───────────────────────────────────────────────────────────────────

std::vector<DailyTrendPoint>
TrendCalculator::daily(std::span<const Event> events, Timestamp now, int day_count,
                       std::chrono::minutes utc_offset) {
    if (day_count < 1) return {};

    const sys_days today = local_day(now, utc_offset);
    const sys_days first = today - std::chrono::days{day_count - 1};

    std::vector<Tally> tallies(static_cast<std::size_t>(day_count));
    for (const auto& e : events) {
        if (!counts_before(e, now)) continue;
        const sys_days d = local_day(e.open_time, utc_offset);
        if (d < first) continue;
        tallies[static_cast<std::size_t>((d - first).count())].add(e);
    }

    std::vector<DailyTrendPoint> out;
    out.reserve(tallies.size());
    for (std::size_t i = 0; i < tallies.size(); ++i) {
        out.push_back(DailyTrendPoint{
            .date             = utc_instant(first + std::chrono::days{i}, utc_offset),
            .count            = tallies[i].count,
            .average_duration = tallies[i].average(),
        });
    }
    return out;
}

std::vector<WeeklyTrendPoint>
TrendCalculator::weekly(std::span<const Event> events, Timestamp now, int week_count,
                        std::chrono::minutes utc_offset) {
    if (week_count < 1) return {};

    const sys_days this_week = week_start(local_day(now, utc_offset));
    const sys_days first     = this_week - std::chrono::weeks{week_count - 1};

    std::vector<Tally> tallies(static_cast<std::size_t>(week_count));
    std::vector<std::set<EntityId>> entities(tallies.size());
    for (const auto& e : events) {
        if (!counts_before(e, now)) continue;
        const sys_days w = week_start(local_day(e.open_time, utc_offset));
        if (w < first) continue;
        const auto i = static_cast<std::size_t>((w - first).count() / 7);
        tallies[i].add(e);
        entities[i].insert(e.entity_id);
    }

    std::vector<WeeklyTrendPoint> out;
    out.reserve(tallies.size());
    for (std::size_t i = 0; i < tallies.size(); ++i) {
        out.push_back(WeeklyTrendPoint{
            .week_start       = utc_instant(first + std::chrono::weeks{i}, utc_offset),
            .count            = tallies[i].count,
            .average_duration = tallies[i].average(),
            .entity_count     = static_cast<int>(entities[i].size()),
        });
    }
    return out;
}

std::vector<DailyTrendPoint>
TrendCalculator::data_range(std::span<const Event> events, Timestamp now,
                            std::chrono::minutes utc_offset) {
    std::optional<Timestamp> earliest;
    for (const auto& e : events) {
        if (!counts_before(e, now)) continue;
        if (!earliest || e.open_time < *earliest) earliest = e.open_time;
    }
    if (!earliest) return {};

    const auto span_days = (local_day(now, utc_offset) - local_day(*earliest, utc_offset)).count();
    return daily(events, now, static_cast<int>(std::min<long long>(span_days + 1, 30)), utc_offset);
}

// ─── Period comparison ────────────────────────────────────────────────────────

TrendSummary TrendCalculator::summarize(int current, int previous) noexcept {
    TrendSummary s;
    s.current_value  = current;
    s.previous_value = previous;
    s.change         = current - previous;
    s.change_percent = previous > 0 ? 100.0 * s.change / previous : 0.0;
    s.direction      = s.change > 0   ? TrendDirection::Up
                       : s.change < 0 ? TrendDirection::Down
                                      : TrendDirection::Stable;
    return s;
}

TrendSummary
TrendCalculator::opening_count_trend(std::span<const Event> events, Timestamp now,
                                     int day_count) noexcept {
    const std::chrono::days period{std::max(1, day_count)};
    int current = 0, previous = 0;
    for (const auto& e : events) {
        if (!counts_before(e, now)) continue;
        if (e.open_time > now - period) {
            ++current;
        } else if (e.open_time > now - 2 * period) {
            ++previous;
        }
    }
    return summarize(current, previous);
}

TrendSummary
TrendCalculator::entity_count_trend(std::span<const Event> events, Timestamp now,
                                    int day_count) {
    const std::chrono::days period{std::max(1, day_count)};
    std::set<EntityId> current, previous;
    for (const auto& e : events) {
        if (!counts_before(e, now)) continue;
        if (e.open_time > now - period) {
            current.insert(e.entity_id);
        } else if (e.open_time > now - 2 * period) {
            previous.insert(e.entity_id);
        }
    }
    return summarize(static_cast<int>(current.size()), static_cast<int>(previous.size()));
}

}  // namespace bridget::analytics
