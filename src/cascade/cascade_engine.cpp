/// @file src/cascade/cascade_engine.cpp
/// @brief Implementation of CascadeEngine.

#include "bridget/cascade.hpp"
#include "bridget/calendar.hpp"
#include "bridget/thresholds.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>
#include <tuple>
#include <utility>

namespace bridget::cascade {

namespace {

/// Running (qualifying, total) trial counts of one ordered entity pair.
struct PairHistory {
    int qualifying = 0;
    int total      = 0;
};

using PairKey    = std::pair<EntityId, EntityId>;
using BucketKey  = std::tuple<EntityId, int, int, int, int>;
using BucketConf = std::map<BucketKey, double>;

[[nodiscard]] double clamp01(double x) noexcept {
    if (!std::isfinite(x)) return 0.0;
    return std::clamp(x, 0.0, 1.0);
}

[[nodiscard]] BucketKey bucket_of(EntityId id, Timestamp t,
                                  std::chrono::minutes utc_offset) noexcept {
    const auto p = calendar_parts(t, utc_offset);
    return {id, p.year, p.month, p.day_of_week, p.hour};
}

[[nodiscard]] CascadeStrengthClass strength_class_of(stats::StrengthBand b) noexcept {
    switch (b) {
        case stats::StrengthBand::Weak:       return CascadeStrengthClass::Weak;
        case stats::StrengthBand::Moderate:   return CascadeStrengthClass::Moderate;
        case stats::StrengthBand::Strong:
        case stats::StrengthBand::VeryStrong: return CascadeStrengthClass::Strong;
    }
    return CascadeStrengthClass::Weak;
}

/// Weighted mean of the four factors; non-positive weights are ignored and
/// an all-zero weighting falls back to equal weights.
[[nodiscard]] double combine(const FactorWeights& w, double temporal, double spatial,
                             double duration, double historical) noexcept {
    const auto pos = [](double x) { return std::isfinite(x) ? std::max(0.0, x) : 0.0; };
    double wt = pos(w.temporal), ws = pos(w.spatial), wd = pos(w.duration), wh = pos(w.historical);
    double sum = wt + ws + wd + wh;
    if (sum <= constants::FLOAT_EPSILON) {
        wt = ws = wd = wh = 1.0;
        sum = 4.0;
    }
    return clamp01((wt * temporal + ws * spatial + wd * duration + wh * historical) / sum);
}

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

CascadeEngine::CascadeEngine(CascadeConfig config)
    : config_(std::move(config)) {}

// ─── Factors ──────────────────────────────────────────────────────────────────

double CascadeEngine::temporal_factor(double delay, const CascadeWindow& window) noexcept {
    const double half = (window.max_minutes - window.min_minutes) / 2.0;
    if (half <= constants::FLOAT_EPSILON) return 1.0;
    const double mid = (window.min_minutes + window.max_minutes) / 2.0;
    return clamp01(1.0 - std::abs(delay - mid) / half);
}

double CascadeEngine::spatial_factor(double distance_km, double max_distance_km) noexcept {
    if (max_distance_km <= constants::FLOAT_EPSILON) {
        return distance_km <= max_distance_km ? 1.0 : 0.0;
    }
    return clamp01(1.0 - distance_km / max_distance_km);
}

double CascadeEngine::duration_correlation(std::optional<double> a,
                                           std::optional<double> b) noexcept {
    if (!a || !b) return constants::NEUTRAL_PRIOR;
    const double denom = std::max({*a, *b, 1.0});
    return clamp01(1.0 - std::abs(*a - *b) / denom);
}

// ─── detect ───────────────────────────────────────────────────────────────────

std::vector<CascadeRecord>
CascadeEngine::detect(std::span<const Event> events,
                      std::span<const EntityLocation> locations,
                      std::stop_token stop) const noexcept {
    if (events.size() < 2 || locations.empty()) return {};

    const auto started = std::chrono::steady_clock::now();
    const ProximityGraph graph(locations, config_.max_distance_km);
    const CascadeWindow& window = config_.window;

    // ── Chronological order of the usable events ──────────────────────────────
    std::vector<const Event*> ordered;
    ordered.reserve(events.size());
    for (const auto& e : events) {
        if (!e.is_malformed() && graph.contains(e.entity_id)) ordered.push_back(&e);
    }
    if (ordered.size() < 2) return {};

    std::stable_sort(ordered.begin(), ordered.end(), [](const Event* a, const Event* b) {
        return std::tie(a->open_time, a->entity_id) < std::tie(b->open_time, b->entity_id);
    });

    std::map<EntityId, std::vector<EntityId>> neighbor_cache;
    std::map<PairKey, PairHistory>             history;

    std::vector<CascadeRecord> out;
    std::size_t scanned = 0;

    // ── Candidate scan ────────────────────────────────────────────────────────
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        const Event& trigger = *ordered[i];

        auto cached = neighbor_cache.find(trigger.entity_id);
        if (cached == neighbor_cache.end()) {
            cached = neighbor_cache.emplace(trigger.entity_id,
                                            graph.neighbors(trigger.entity_id)).first;
        }
        const auto& neighbors = cached->second;
        if (neighbors.empty()) continue;

        // Historical prior for every neighbour, frozen before this trigger.
        std::map<EntityId, double> prior;
        std::map<EntityId, bool>   qualified;
        for (EntityId n : neighbors) {
            const auto h = history.find({trigger.entity_id, n});
            prior[n] = (h == history.end() || h->second.total == 0)
                           ? constants::NEUTRAL_PRIOR
                           : static_cast<double>(h->second.qualifying) /
                                 static_cast<double>(h->second.total);
            qualified[n] = false;
        }

        for (std::size_t j = i + 1; j < ordered.size(); ++j) {
            if (++scanned % constants::CANCEL_CHECK_INTERVAL == 0 && stop.stop_requested()) {
                return {};
            }

            const Event& target = *ordered[j];
            const double delay  = minutes_between(trigger.open_time, target.open_time);
            if (delay > window.max_minutes) break;
            if (delay <= 0.0 || !window.contains(delay)) continue;
            if (target.entity_id == trigger.entity_id) continue;

            const auto p = prior.find(target.entity_id);
            if (p == prior.end()) continue;  // not adjacent

            const double dist = graph.distance_km(trigger.entity_id, target.entity_id).value_or(0.0);

            CascadeRecord r;
            r.trigger_entity_id = trigger.entity_id;
            r.trigger_label     = trigger.entity_label;
            r.trigger_time      = trigger.open_time;
            r.trigger_duration  = trigger.known_duration();
            r.target_entity_id  = target.entity_id;
            r.target_label      = target.entity_label;
            r.target_time       = target.open_time;
            r.target_duration   = target.known_duration();
            r.delay_minutes     = delay;
            r.distance_km       = dist;

            r.temporal_factor      = temporal_factor(delay, window);
            r.spatial_factor       = spatial_factor(dist, graph.max_distance_km());
            r.duration_correlation = duration_correlation(r.trigger_duration, r.target_duration);
            r.historical_factor    = p->second;
            r.strength = combine(config_.weights, r.temporal_factor, r.spatial_factor,
                                 r.duration_correlation, r.historical_factor);
            r.timing_class = delay < config_.immediate_threshold_minutes
                                 ? CascadeTimingClass::Immediate
                                 : CascadeTimingClass::Delayed;

            qualified[target.entity_id] = true;
            out.push_back(std::move(r));
        }

        for (EntityId n : neighbors) {
            auto& h = history[{trigger.entity_id, n}];
            ++h.total;
            if (qualified[n]) ++h.qualifying;
        }
    }

    if (stop.stop_requested()) return {};

    // ── Run-local dynamic classification ──────────────────────────────────────
    std::vector<double> strengths;
    strengths.reserve(out.size());
    for (const auto& r : out) strengths.push_back(r.strength);
    const auto cuts = stats::ThresholdCalculator::strength_cut_points(strengths);

    for (auto& r : out) {
        r.strength_class = strength_class_of(stats::ThresholdCalculator::band(r.strength, cuts));
    }

    if (config_.verbose) {
        const auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started).count();
        fmt::print(stderr,
                   "[cascade] {} events, graph {} nodes / {} edges, {} cascades "
                   "(cuts {:.3f} / {:.3f} / {:.3f}) in {:.2f} ms\n",
                   ordered.size(), graph.size(), graph.edge_count(), out.size(),
                   cuts[0], cuts[1], cuts[2], elapsed);
    }

    return out;
}

std::vector<CascadeRecord>
CascadeEngine::detect(std::span<const Event> events,
                      std::span<const EntityLocation> locations,
                      std::span<const AnalyticsRecord> analytics,
                      std::stop_token stop) const noexcept {
    auto out = detect(events, locations, stop);
    if (out.empty()) return out;

    BucketConf confidence;
    for (const auto& a : analytics) {
        confidence.emplace(BucketKey{a.entity_id, a.year, a.month, a.day_of_week, a.hour},
                           clamp01(a.confidence));
    }

    const auto lookup = [&](EntityId id, Timestamp t) {
        const auto it = confidence.find(bucket_of(id, t, config_.utc_offset));
        return it == confidence.end() ? 0.0 : it->second;
    };

    for (auto& r : out) {
        const double a = lookup(r.trigger_entity_id, r.trigger_time);
        const double b = lookup(r.target_entity_id, r.target_time);
        r.confidence = std::sqrt(a * b);
    }
    return out;
}

}  // namespace bridget::cascade
