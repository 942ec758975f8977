/// @file src/stats/threshold_calculator.cpp
/// @brief Implementation of ThresholdCalculator.

#include "bridget/thresholds.hpp"

#include <algorithm>
#include <cmath>

namespace bridget::stats {

const char* to_string(StrengthBand b) noexcept {
    switch (b) {
        case StrengthBand::Weak:       return "weak";
        case StrengthBand::Moderate:   return "moderate";
        case StrengthBand::Strong:     return "strong";
        case StrengthBand::VeryStrong: return "very-strong";
    }
    return "unknown";
}

// ─── quantile_thresholds ──────────────────────────────────────────────────────

std::vector<double>
ThresholdCalculator::quantile_thresholds(std::span<const double> samples,
                                         std::span<const double> quantiles) noexcept {
    std::vector<double> sorted;
    sorted.reserve(samples.size());
    for (double s : samples) {
        if (std::isfinite(s)) sorted.push_back(s);
    }
    std::sort(sorted.begin(), sorted.end());

    std::vector<double> out;
    out.reserve(quantiles.size());

    if (sorted.empty()) {
        out.assign(quantiles.size(), 0.0);
        return out;
    }

    const double last = static_cast<double>(sorted.size() - 1);
    for (double q : quantiles) {
        const double level = std::isnan(q) ? 0.0 : std::clamp(q, 0.0, 1.0);
        // ⌊(n−1)·q⌋; the floor keeps the index inside [0, n−1] for q ∈ [0,1].
        const auto idx = static_cast<std::size_t>(std::floor(last * level));
        out.push_back(sorted[std::min(idx, sorted.size() - 1)]);
    }
    return out;
}

// ─── strength_cut_points ──────────────────────────────────────────────────────

CutPoints
ThresholdCalculator::strength_cut_points(std::span<const double> samples) noexcept {
    static constexpr std::array<double, 3> LEVELS = {
        constants::QUANTILE_LOW,
        constants::QUANTILE_MID,
        constants::QUANTILE_HIGH,
    };
    const auto t = quantile_thresholds(samples, LEVELS);
    return CutPoints{t[0], t[1], t[2]};
}

// ─── band ─────────────────────────────────────────────────────────────────────

StrengthBand ThresholdCalculator::band(double value, const CutPoints& cuts) noexcept {
    if (value < cuts[0]) return StrengthBand::Weak;
    if (value < cuts[1]) return StrengthBand::Moderate;
    if (value < cuts[2]) return StrengthBand::Strong;
    return StrengthBand::VeryStrong;
}

}  // namespace bridget::stats
