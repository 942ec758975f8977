/// @file src/cascade/cascade_insights.cpp
/// @brief CascadeAnalysis: per-entity profiles, insight strings and alerts.

#include "bridget/cascade.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>

namespace bridget::cascade {

namespace {

/// Count, strength sum, delay sum and a display label for one counterpart.
struct Tally {
    std::size_t count    = 0;
    double      strength = 0.0;
    double      delay    = 0.0;
    std::string label;
};

/// Entry with the highest count; ties go to the lowest entity id.
[[nodiscard]] const std::pair<const EntityId, Tally>*
most_frequent(const std::map<EntityId, Tally>& tallies) noexcept {
    const std::pair<const EntityId, Tally>* best = nullptr;
    for (const auto& entry : tallies) {
        if (best == nullptr || entry.second.count > best->second.count) best = &entry;
    }
    return best;
}

[[nodiscard]] std::string display_name(EntityId id, const std::string& label) {
    return label.empty() ? fmt::format("entity {}", id) : label;
}

}  // namespace

// ─── CascadeAlert ─────────────────────────────────────────────────────────────

std::string CascadeAlert::time_until_text() const {
    const int minutes = static_cast<int>(minutes_until);
    if (minutes <= 0) return "Now";
    if (minutes == 1) return "1 minute";
    return fmt::format("{} minutes", minutes);
}

std::string CascadeAlert::probability_text() const {
    if (probability < 0.3) return "Low";
    if (probability < 0.6) return "Moderate";
    if (probability < 0.8) return "High";
    return "Very High";
}

// ─── summarize ────────────────────────────────────────────────────────────────

CascadeProfile
CascadeAnalysis::summarize(EntityId entity,
                           std::span<const CascadeRecord> cascades,
                           std::span<const AnalyticsRecord> analytics) noexcept {
    CascadeProfile p;
    p.entity_id = entity;

    std::map<EntityId, Tally> targets;
    std::map<EntityId, Tally> triggers;
    double      influence_sum      = 0.0;
    double      susceptibility_sum = 0.0;
    std::size_t immediate          = 0;

    for (const auto& c : cascades) {
        if (c.trigger_entity_id == entity) {
            ++p.triggered_count;
            influence_sum += c.strength;
            if (c.timing_class == CascadeTimingClass::Immediate) ++immediate;

            auto& t = targets[c.target_entity_id];
            ++t.count;
            t.strength += c.strength;
            t.delay    += c.delay_minutes;
            if (t.label.empty()) t.label = c.target_label;
        }
        if (c.target_entity_id == entity) {
            ++p.received_count;
            susceptibility_sum += c.strength;

            auto& t = triggers[c.trigger_entity_id];
            ++t.count;
            t.strength += c.strength;
            if (t.label.empty()) t.label = c.trigger_label;
        }
    }

    if (p.triggered_count > 0) {
        const auto n = static_cast<double>(p.triggered_count);
        p.influence       = influence_sum / n;
        p.immediate_share = static_cast<double>(immediate) / n;
    }
    if (p.received_count > 0) {
        p.susceptibility = susceptibility_sum / static_cast<double>(p.received_count);
    }

    int openings = 0;
    for (const auto& a : analytics) {
        if (a.entity_id == entity) openings += a.opening_count;
    }
    if (openings > 0) {
        p.cascade_probability = std::min(
            1.0, static_cast<double>(p.triggered_count) / static_cast<double>(openings));
    }

    if (const auto* best = most_frequent(targets)) {
        p.primary_target               = best->first;
        p.primary_target_label         = best->second.label;
        p.primary_target_count         = best->second.count;
        p.mean_delay_to_primary_target = best->second.delay / static_cast<double>(best->second.count);
    }
    if (const auto* best = most_frequent(triggers)) {
        p.primary_trigger       = best->first;
        p.primary_trigger_label = best->second.label;
        p.primary_trigger_count = best->second.count;
    }

    return p;
}

// ─── insights ─────────────────────────────────────────────────────────────────

std::vector<std::string>
CascadeAnalysis::insights(EntityId entity, std::span<const CascadeRecord> cascades) {
    const auto p = summarize(entity, cascades, {});
    std::vector<std::string> out;

    if (p.triggered_count > 0) {
        if (p.influence > constants::HIGH_CASCADE_STRENGTH) {
            out.emplace_back("High cascade influence - frequently triggers other openings");
        }
        if (p.primary_target) {
            out.push_back(fmt::format(
                "Most frequently triggers {} ({} cascade events, mean delay {:.0f} min)",
                display_name(*p.primary_target, p.primary_target_label),
                p.primary_target_count, p.mean_delay_to_primary_target));
        }
    }

    if (p.received_count > 0) {
        if (p.susceptibility > constants::HIGH_CASCADE_STRENGTH) {
            out.emplace_back("High cascade susceptibility - often opens in response to neighbours");
        }
        if (p.primary_trigger) {
            out.push_back(fmt::format("Most frequently triggered by {} ({} cascade events)",
                                      display_name(*p.primary_trigger, p.primary_trigger_label),
                                      p.primary_trigger_count));
        }
    }

    if (p.triggered_count > 0 && p.immediate_share > 0.5) {
        out.push_back(fmt::format("Tends to trigger immediate cascade responses (< {:.0f} minutes)",
                                  constants::IMMEDIATE_CASCADE_MINUTES));
    }

    return out;
}

// ─── alerts ───────────────────────────────────────────────────────────────────

std::vector<CascadeAlert>
CascadeAnalysis::alerts(std::span<const Event> recent_events,
                        std::span<const CascadeRecord> cascades,
                        Timestamp now,
                        const CascadeWindow& window,
                        double lead_minutes) {
    // Relationship summary per ordered (trigger, target) pair.
    struct Relationship {
        Tally       tally;
        std::size_t immediate = 0;
        std::string trigger_label;
    };
    std::map<std::pair<EntityId, EntityId>, Relationship> relationships;
    for (const auto& c : cascades) {
        auto& r = relationships[{c.trigger_entity_id, c.target_entity_id}];
        ++r.tally.count;
        r.tally.strength += c.strength;
        r.tally.delay    += c.delay_minutes;
        if (r.tally.label.empty()) r.tally.label = c.target_label;
        if (r.trigger_label.empty()) r.trigger_label = c.trigger_label;
        if (c.timing_class == CascadeTimingClass::Immediate) ++r.immediate;
    }

    std::vector<CascadeAlert> out;
    for (const auto& e : recent_events) {
        if (e.is_open() || e.is_malformed()) continue;
        const double since = minutes_between(e.open_time, now);
        if (since < 0.0 || since >= window.max_minutes) continue;

        for (auto it = relationships.lower_bound({e.entity_id, std::numeric_limits<EntityId>::min()});
             it != relationships.end() && it->first.first == e.entity_id; ++it) {
            const auto& rel = it->second;
            const auto  n   = static_cast<double>(rel.tally.count);
            const double strength = rel.tally.strength / n;
            if (strength <= constants::CASCADE_ALERT_MIN_STRENGTH) continue;

            const double mean_delay = rel.tally.delay / n;
            const double until      = mean_delay - since;
            if (until <= 0.0 || until >= lead_minutes) continue;

            CascadeAlert a;
            a.trigger_entity_id = e.entity_id;
            a.trigger_label     = e.entity_label.empty() ? rel.trigger_label : e.entity_label;
            a.target_entity_id  = it->first.second;
            a.target_label      = rel.tally.label;
            a.expected_time     = e.open_time + std::chrono::seconds{
                static_cast<std::int64_t>(std::llround(mean_delay * 60.0))};
            a.probability   = strength;
            a.minutes_until = until;
            a.timing_class  = 2 * rel.immediate > rel.tally.count ? CascadeTimingClass::Immediate
                                                                  : CascadeTimingClass::Delayed;
            out.push_back(std::move(a));
        }
    }

    std::stable_sort(out.begin(), out.end(), [](const CascadeAlert& a, const CascadeAlert& b) {
        return a.expected_time < b.expected_time;
    });
    return out;
}

}  // namespace bridget::cascade
