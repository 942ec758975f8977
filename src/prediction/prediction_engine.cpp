/// @file src/prediction/prediction_engine.cpp
/// @brief Implementation of PredictionEngine.

#include "bridget/prediction.hpp"
#include "bridget/calendar.hpp"
#include "arma_model.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <numeric>
#include <utility>
#include <vector>

namespace bridget::prediction {

namespace {

/// Strongest recently-active cascade trigger of the forecast entity.
struct CascadeBoost {
    EntityId    trigger = 0;
    std::string label;
    double      mean_strength = 0.0;
    double      minutes_ago   = 0.0;
};

[[nodiscard]] double mean_of(std::span<const double> v) noexcept {
    if (v.empty()) return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

/// Exact (entity, year, month, weekday, hour) bucket for `now`, else the
/// most confident bucket sharing its month, weekday and hour.
[[nodiscard]] const AnalyticsRecord*
matching_bucket(EntityId entity, const CalendarParts& p,
                std::span<const AnalyticsRecord> analytics) noexcept {
    const AnalyticsRecord* best = nullptr;
    for (const auto& a : analytics) {
        if (a.entity_id != entity || a.month != p.month ||
            a.day_of_week != p.day_of_week || a.hour != p.hour) {
            continue;
        }
        if (a.year == p.year) return &a;
        if (best == nullptr || a.confidence > best->confidence) best = &a;
    }
    return best;
}

[[nodiscard]] std::optional<CascadeBoost>
strongest_recent_trigger(EntityId entity, std::span<const Event> events,
                         std::span<const CascadeRecord> cascades,
                         const CascadeWindow& window, Timestamp now) {
    const auto lookback = std::chrono::seconds{
        static_cast<std::int64_t>(std::llround(std::max(0.0, window.max_minutes) * 60.0))};
    const Timestamp since = now - lookback;

    // Latest opening inside [since, now] of every other entity.
    std::map<EntityId, Timestamp> recent;
    for (const auto& e : events) {
        if (e.entity_id == entity || e.is_malformed()) continue;
        if (e.open_time < since || e.open_time > now) continue;
        auto [it, inserted] = recent.try_emplace(e.entity_id, e.open_time);
        if (!inserted) it->second = std::max(it->second, e.open_time);
    }

    struct Relationship {
        double      strength_sum = 0.0;
        int         count        = 0;
        std::string label;
        std::optional<Timestamp> last_active;
    };
    std::map<EntityId, Relationship> incoming;

    for (const auto& c : cascades) {
        if (c.target_entity_id != entity || c.trigger_entity_id == entity) continue;
        auto& r = incoming[c.trigger_entity_id];
        r.strength_sum += c.strength;
        ++r.count;
        if (r.label.empty()) r.label = c.trigger_label;
        if (c.trigger_time >= since && c.trigger_time <= now) {
            r.last_active = std::max(r.last_active.value_or(c.trigger_time), c.trigger_time);
        }
    }

    std::optional<CascadeBoost> best;
    for (auto& [trigger, r] : incoming) {
        if (const auto it = recent.find(trigger); it != recent.end()) {
            r.last_active = std::max(r.last_active.value_or(it->second), it->second);
        }
        if (!r.last_active || r.count == 0) continue;

        const double mean = r.strength_sum / static_cast<double>(r.count);
        if (!best || mean > best->mean_strength) {
            best = CascadeBoost{
                .trigger       = trigger,
                .label         = r.label.empty() ? fmt::format("entity {}", trigger) : r.label,
                .mean_strength = mean,
                .minutes_ago   = minutes_between(*r.last_active, now),
            };
        }
    }
    return best;
}

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

PredictionEngine::PredictionEngine(PredictionConfig config)
    : config_(std::move(config)) {}

double PredictionEngine::logistic(double x) noexcept {
    if (std::isnan(x)) return 0.5;
    if (x >= 0.0) return 1.0 / (1.0 + std::exp(-x));
    const double z = std::exp(x);
    return z / (1.0 + z);
}

// ─── forecast ─────────────────────────────────────────────────────────────────

std::optional<Forecast>
PredictionEngine::forecast(EntityId entity,
                           std::span<const Event> events,
                           std::span<const AnalyticsRecord> analytics,
                           std::span<const CascadeRecord> cascades,
                           ComputeTier tier,
                           Timestamp now,
                           std::stop_token stop) const noexcept {
    return forecast(entity, events, analytics, cascades, tier, now,
                    config_.horizon_minutes, std::move(stop));
}

std::optional<Forecast>
PredictionEngine::forecast(EntityId entity,
                           std::span<const Event> events,
                           std::span<const AnalyticsRecord> analytics,
                           std::span<const CascadeRecord> cascades,
                           ComputeTier tier,
                           Timestamp now,
                           double horizon_minutes,
                           std::stop_token stop) const noexcept {
    if (stop.stop_requested()) return std::nullopt;

    const double horizon = std::isfinite(horizon_minutes)
                               ? std::max(0.0, horizon_minutes)
                               : std::max(0.0, config_.horizon_minutes);

    // ── History ───────────────────────────────────────────────────────────────
    std::vector<const Event*> history;
    for (const auto& e : events) {
        if (e.entity_id == entity && !e.is_malformed() && e.open_time <= now) {
            history.push_back(&e);
        }
    }
    const std::size_t min_events = std::max(config_.min_events, constants::MIN_FORECAST_EVENTS);
    if (history.size() < min_events) return std::nullopt;

    std::stable_sort(history.begin(), history.end(), [](const Event* a, const Event* b) {
        return a->open_time < b->open_time;
    });

    std::vector<double> intervals;
    intervals.reserve(history.size() - 1);
    for (std::size_t i = 1; i < history.size(); ++i) {
        intervals.push_back(minutes_between(history[i - 1]->open_time, history[i]->open_time));
    }

    std::vector<double> durations;
    for (const auto* e : history) {
        if (const auto d = e->known_duration()) durations.push_back(*d);
    }

    // ── Model fitting ─────────────────────────────────────────────────────────
    const ComputeTier requested = normalize_tier(tier);
    const FitOptions options{
        .lm_max_iterations     = config_.lm_max_iterations,
        .lm_tolerance          = config_.lm_tolerance,
        .singularity_threshold = config_.singularity_threshold,
    };

    const auto interval_fit = ArmaFitter::fit(intervals, requested, options, stop);
    if (!interval_fit) return std::nullopt;

    // ── Probability of opening within the horizon ─────────────────────────────
    const Timestamp last_open = history.back()->open_time;
    const double elapsed      = minutes_between(last_open, now);
    const double next_gap     = std::max(0.0, interval_fit->forecast_next(intervals));
    const double mean_gap     = mean_of(intervals);

    double wait = 0.0;
    if (next_gap > elapsed) {
        wait = next_gap - elapsed;
    } else if (mean_gap > constants::FLOAT_EPSILON) {
        // Overdue: assume the next opening follows the historical cadence.
        wait = mean_gap - std::fmod(elapsed - next_gap, mean_gap);
    }

    const double scale    = std::max(interval_fit->rmse, constants::MIN_PRESSURE_SCALE_MINUTES);
    const double pressure = (horizon - wait) / scale;
    double probability    = std::clamp(logistic(pressure), 0.0, 1.0);

    // ── Expected duration ─────────────────────────────────────────────────────
    double expected_duration = mean_of(durations);
    double quality           = interval_fit->quality;
    if (durations.size() >= constants::MIN_FORECAST_EVENTS) {
        if (const auto duration_fit = ArmaFitter::fit(durations, requested, options, stop)) {
            expected_duration = duration_fit->forecast_next(durations);
            quality           = (quality + duration_fit->quality) / 2.0;
        }
    }
    expected_duration = std::isfinite(expected_duration) ? std::max(0.0, expected_duration) : 0.0;

    // ── Confidence ────────────────────────────────────────────────────────────
    const auto parts  = calendar_parts(now, config_.utc_offset);
    const auto* prior = matching_bucket(entity, parts, analytics);

    double confidence = prior != nullptr
                            ? (std::clamp(prior->confidence, 0.0, 1.0) + quality) / 2.0
                            : config_.missing_prior_penalty * quality;
    confidence = std::isfinite(confidence) ? std::clamp(confidence, 0.0, 1.0) : 0.0;

    // ── Cascade boost ─────────────────────────────────────────────────────────
    const auto boost = strongest_recent_trigger(entity, events, cascades,
                                                config_.cascade_window, now);
    double boost_amount = 0.0;
    if (boost) {
        boost_amount = boost->mean_strength * config_.cascade_boost_factor;
        probability  = std::min(probability + boost_amount, config_.boosted_probability_cap);
        probability  = std::clamp(probability, 0.0, 1.0);
    }

    // ── Assemble ──────────────────────────────────────────────────────────────
    Forecast f;
    f.entity_id                 = entity;
    f.entity_label              = history.back()->entity_label;
    f.probability               = probability;
    f.expected_duration_minutes = expected_duration;
    f.confidence                = confidence;
    f.model_tier                = interval_fit->tier;
    f.requested_tier            = requested;
    f.horizon_minutes           = horizon;
    f.rmse                      = interval_fit->rmse;
    if (boost) f.cascade_trigger = boost->trigger;

    f.rationale = fmt::format(
        "{} model on {} openings: next opening expected in ~{:.0f} min "
        "(mean interval {:.0f} min, RMSE {:.1f} min)",
        to_string(f.model_tier), history.size(), wait, mean_gap, f.rmse);
    if (f.model_tier != requested) {
        f.rationale += fmt::format("; fell back from {}", to_string(requested));
    }
    if (prior != nullptr) {
        f.rationale += fmt::format("; {} historical openings on {}s at {:02}:00",
                                   prior->opening_count, weekday_name(prior->day_of_week),
                                   prior->hour);
        if (prior->is_rush_hour) f.rationale += " (rush hour)";
        if (prior->is_summer)    f.rationale += " (summer pattern)";
    } else {
        f.rationale += "; no historical bucket for this hour";
    }
    if (boost) {
        f.rationale += fmt::format("; cascade boost +{:.0f}% from {} opening {:.0f} min ago",
                                   boost_amount * 100.0, boost->label, boost->minutes_ago);
    }

    if (config_.verbose) {
        fmt::print(stderr,
                   "[predict] entity {} tier {}->{} p={:.3f} dur={:.1f} conf={:.3f} rmse={:.2f}\n",
                   entity, to_string(requested), to_string(f.model_tier),
                   f.probability, f.expected_duration_minutes, f.confidence, f.rmse);
    }

    return f;
}

}  // namespace bridget::prediction
