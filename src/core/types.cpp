/// @file src/core/types.cpp
/// @brief Enum names and display labels for the shared value types.

#include "bridget/types.hpp"

#include <fmt/format.h>

#include <cmath>

namespace bridget {

// ─── ComputeTier ──────────────────────────────────────────────────────────────

const char* to_string(ComputeTier tier) noexcept {
    switch (normalize_tier(tier)) {
        case ComputeTier::Minimal:  return "minimal";
        case ComputeTier::Standard: return "standard";
        case ComputeTier::Advanced: return "advanced";
        case ComputeTier::Expert:   return "expert";
    }
    return "standard";
}

std::optional<ComputeTier> parse_tier(const std::string& name) noexcept {
    if (name == "minimal")  return ComputeTier::Minimal;
    if (name == "standard") return ComputeTier::Standard;
    if (name == "advanced") return ComputeTier::Advanced;
    if (name == "expert")   return ComputeTier::Expert;
    return std::nullopt;
}

// ─── Cascade classes ──────────────────────────────────────────────────────────

const char* to_string(CascadeStrengthClass c) noexcept {
    switch (c) {
        case CascadeStrengthClass::Weak:     return "weak";
        case CascadeStrengthClass::Moderate: return "moderate";
        case CascadeStrengthClass::Strong:   return "strong";
    }
    return "unknown";
}

const char* to_string(CascadeTimingClass c) noexcept {
    switch (c) {
        case CascadeTimingClass::Immediate: return "immediate";
        case CascadeTimingClass::Delayed:   return "delayed";
    }
    return "unknown";
}

// ─── Forecast labels ──────────────────────────────────────────────────────────

std::string Forecast::probability_text() const {
    if (probability < 0.15) return "Very Low";
    if (probability < 0.35) return "Low";
    if (probability < 0.65) return "Moderate";
    if (probability < 0.85) return "High";
    return "Very High";
}

std::string Forecast::confidence_text() const {
    if (confidence < 0.6) return "Low Confidence";
    if (confidence < 0.8) return "Medium Confidence";
    return "High Confidence";
}

std::string Forecast::duration_text() const {
    const double m = expected_duration_minutes;
    if (std::isnan(m) || m < 1.0) return "< 1 min";
    if (!std::isfinite(m)) return "unknown";
    if (m < 60.0) return fmt::format("{:.0f} min", std::floor(m));

    // Whole minutes stay in double; hours may exceed any integer type.
    const double total = std::floor(m);
    return fmt::format("{:.0f}h {:.0f}m", std::floor(total / 60.0), std::fmod(total, 60.0));
}

}  // namespace bridget
