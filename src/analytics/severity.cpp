/// @file src/analytics/severity.cpp
/// @brief Duration-based impact classification of closed events.

#include "bridget/analytics.hpp"
#include "bridget/calendar.hpp"
#include "bridget/thresholds.hpp"

#include <algorithm>

namespace bridget::analytics {

const char* to_string(ImpactLevel level) noexcept {
    switch (level) {
        case ImpactLevel::Low:      return "low";
        case ImpactLevel::Moderate: return "moderate";
        case ImpactLevel::High:     return "high";
        case ImpactLevel::Severe:   return "severe";
    }
    return "unknown";
}

std::vector<EventSeverity>
classify_severity(std::span<const Event> events, std::chrono::minutes utc_offset) noexcept {
    std::vector<double> durations;
    durations.reserve(events.size());
    for (const auto& e : events) {
        if (const auto d = e.known_duration()) durations.push_back(*d);
    }

    std::vector<EventSeverity> out;
    if (durations.empty()) return out;

    const auto cuts = stats::ThresholdCalculator::strength_cut_points(durations);
    out.reserve(durations.size());

    for (const auto& e : events) {
        const auto d = e.known_duration();
        if (!d) continue;

        const auto p    = calendar_parts(e.open_time, utc_offset);
        const bool rush = is_rush_hour(p.day_of_week, p.hour);

        // StrengthBand and ImpactLevel share ordinal positions.
        int level = static_cast<int>(stats::ThresholdCalculator::band(*d, cuts));
        if (rush) level = std::min(level + 1, static_cast<int>(ImpactLevel::Severe));

        out.push_back(EventSeverity{
            .entity_id        = e.entity_id,
            .open_time        = e.open_time,
            .duration_minutes = *d,
            .level            = static_cast<ImpactLevel>(level),
            .rush_hour        = rush,
        });
    }
    return out;
}

}  // namespace bridget::analytics
