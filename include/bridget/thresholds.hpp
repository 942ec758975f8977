#pragma once

/// @file include/bridget/thresholds.hpp
/// @brief Quantile-based dynamic thresholds.
///
/// # Module: Threshold Calculator
///
/// ## Responsibility
/// Compute data-driven cut points over an empirical sample and place values
/// into the bands those cut points define. Used by the cascade engine to
/// classify relationship strengths and by severity classification to band
/// opening durations.
///
/// ## Formula
/// For n sorted samples s₀ ≤ … ≤ sₙ₋₁ and a quantile q ∈ [0, 1]:
///
///     threshold(q) = s[⌊(n − 1)·q⌋]
///
/// ## Guarantees
/// - Never throws; empty input yields 0.0 for every requested quantile
/// - Order-invariant: the samples are fully sorted before indexing
/// - Monotone: a higher quantile never yields a lower threshold

#include "bridget/constants.hpp"

#include <array>
#include <span>
#include <vector>

namespace bridget::stats {

/// Band of a value relative to three ascending cut points.
enum class StrengthBand {
    Weak,        ///< value < cut[0]
    Moderate,    ///< cut[0] ≤ value < cut[1]
    Strong,      ///< cut[1] ≤ value < cut[2]
    VeryStrong,  ///< value ≥ cut[2]
};

[[nodiscard]] const char* to_string(StrengthBand b) noexcept;

/// The 25th, 50th and 75th percentile cut points of a sample.
using CutPoints = std::array<double, 3>;

/// Stateless quantile utility.
class ThresholdCalculator {
public:
    ThresholdCalculator() = delete;

    /// Quantile thresholds of `samples` at each level in `quantiles`.
    ///
    /// Non-finite samples are ignored. Quantile levels are clamped into
    /// [0, 1]; a NaN level is treated as 0.
    ///
    /// # Returns
    /// One threshold per requested quantile, in request order. All zeros if
    /// no finite sample is present.
    [[nodiscard]] static std::vector<double>
    quantile_thresholds(std::span<const double> samples,
                        std::span<const double> quantiles) noexcept;

    /// Cut points at {0.25, 0.50, 0.75}.
    [[nodiscard]] static CutPoints
    strength_cut_points(std::span<const double> samples) noexcept;

    /// Band `value` against `cuts` (assumed ascending).
    [[nodiscard]] static StrengthBand
    band(double value, const CutPoints& cuts) noexcept;
};

}  // namespace bridget::stats
