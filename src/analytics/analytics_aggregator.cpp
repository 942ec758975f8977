/// @file src/analytics/analytics_aggregator.cpp
/// @brief Implementation of AnalyticsAggregator.

#include "bridget/analytics.hpp"
#include "bridget/calendar.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <limits>
#include <map>
#include <tuple>

namespace bridget::analytics {

namespace {

/// Aggregation key, ordered lexicographically.
struct BucketKey {
    EntityId entity_id;
    int      year;
    int      month;
    int      day_of_week;
    int      hour;

    auto operator<=>(const BucketKey&) const = default;
};

/// Running sums for one bucket.
struct BucketAccumulator {
    int         count       = 0;
    int         known_count = 0;
    double      total       = 0.0;
    double      longest     = 0.0;
    double      shortest    = std::numeric_limits<double>::infinity();
    std::string label;
    Timestamp   label_time  = Timestamp::max();
};

/// (entity, weekday, hour) slice used to normalise probabilities.
using SliceKey = std::tuple<EntityId, int, int>;

}  // namespace

// ─── Constructor ──────────────────────────────────────────────────────────────

AnalyticsAggregator::AnalyticsAggregator(AggregatorConfig config)
    : config_(std::move(config)) {}

// ─── aggregate ────────────────────────────────────────────────────────────────

std::vector<AnalyticsRecord>
AnalyticsAggregator::aggregate(std::span<const Event> events,
                               std::stop_token stop) const noexcept {
    const auto started = std::chrono::steady_clock::now();

    std::map<BucketKey, BucketAccumulator> buckets;
    std::map<SliceKey, int>                slice_totals;
    std::size_t skipped = 0;

    // ── Pass 1: bucket every well-formed event ────────────────────────────────
    for (std::size_t i = 0; i < events.size(); ++i) {
        if (i % constants::CANCEL_CHECK_INTERVAL == 0 && stop.stop_requested()) {
            return {};
        }

        const Event& e = events[i];
        if (e.is_malformed()) {
            ++skipped;
            continue;
        }

        const auto p = calendar_parts(e.open_time, config_.utc_offset);
        const BucketKey key{e.entity_id, p.year, p.month, p.day_of_week, p.hour};
        auto& acc = buckets[key];

        ++acc.count;
        ++slice_totals[SliceKey{e.entity_id, p.day_of_week, p.hour}];

        if (const auto d = e.known_duration()) {
            ++acc.known_count;
            acc.total   += *d;
            acc.longest  = std::max(acc.longest, *d);
            acc.shortest = std::min(acc.shortest, *d);
        }

        // Label from the earliest event keeps the output independent of
        // input order when a source renames an entity mid-history.
        if (e.open_time < acc.label_time ||
            (e.open_time == acc.label_time && e.entity_label < acc.label)) {
            acc.label      = e.entity_label;
            acc.label_time = e.open_time;
        }
    }

    // ── Pass 2: derive per-bucket statistics ──────────────────────────────────
    const double full_confidence_n =
        static_cast<double>(std::max(1, config_.min_sample_for_full_confidence));

    std::vector<AnalyticsRecord> out;
    out.reserve(buckets.size());

    for (const auto& [key, acc] : buckets) {
        const int slice_n =
            slice_totals[SliceKey{key.entity_id, key.day_of_week, key.hour}];

        AnalyticsRecord r;
        r.entity_id    = key.entity_id;
        r.entity_label = acc.label;
        r.year         = key.year;
        r.month        = key.month;
        r.day_of_week  = key.day_of_week;
        r.hour         = key.hour;

        r.opening_count      = acc.count;
        r.total_minutes_open = acc.total;
        if (acc.known_count > 0) {
            r.average_minutes_per_opening = acc.total / static_cast<double>(acc.known_count);
            r.longest_minutes             = acc.longest;
            r.shortest_minutes            = acc.shortest;
        }

        // slice_n ≥ acc.count > 0 because this bucket is part of its slice.
        r.probability_of_opening =
            std::clamp(static_cast<double>(acc.count) / static_cast<double>(slice_n), 0.0, 1.0);
        r.expected_duration = std::max(0.0, r.average_minutes_per_opening);
        r.confidence =
            std::min(1.0, static_cast<double>(acc.count) / full_confidence_n);

        r.is_weekend   = is_weekend_day(key.day_of_week);
        r.is_rush_hour = is_rush_hour(key.day_of_week, key.hour);
        r.is_summer    = is_summer_month(key.month);

        out.push_back(std::move(r));
    }

    if (config_.verbose) {
        const auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started).count();
        fmt::print(stderr,
                   "[analytics] {} events -> {} buckets ({} malformed skipped) in {:.2f} ms\n",
                   events.size(), out.size(), skipped, elapsed);
    }

    return out;
}

}  // namespace bridget::analytics
