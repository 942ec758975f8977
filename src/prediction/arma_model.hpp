#pragma once

/// @file src/prediction/arma_model.hpp
/// @brief Tiered ARMA(p, 1) fitting used by the prediction engine.
///
/// # Model
/// On the demeaned series yₜ = xₜ − μ:
///
///     yₜ = φ₁yₜ₋₁ + … + φₚyₜ₋ₚ + eₜ + θeₜ₋₁
///
/// Residuals are computed recursively from t = p with e₍ₚ₋₁₎ = 0.
///
/// # Tiers
/// | Tier     | AR order | AR estimate                | MA estimate                   |
/// |----------|----------|----------------------------|-------------------------------|
/// | Minimal  | 1        | lag-1 autocorrelation      | fixed default                 |
/// | Standard | 2        | Yule-Walker                | residual lag-1 autocorrelation|
/// | Advanced | 3        | Yule-Walker                | residual lag-1 autocorrelation|
/// | Expert   | 4        | Yule-Walker → LM refine    | jointly refined by LM         |
///
/// A tier whose linear system is near-singular (σ_min/σ_max below the
/// configured threshold), whose series is too short, or whose coefficients
/// come out non-finite falls back to the next lower tier. Minimal never fails.
///
/// Internal header: not installed, not part of the public API.

#include "bridget/types.hpp"
#include "bridget/constants.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <stop_token>
#include <vector>

namespace bridget::prediction {

/// Numerical knobs forwarded from PredictionConfig.
struct FitOptions {
    int    lm_max_iterations     = constants::LM_MAX_ITERATIONS;
    double lm_tolerance          = constants::LM_TOLERANCE;
    double singularity_threshold = constants::SINGULARITY_THRESHOLD;
};

/// A fitted model together with its in-sample diagnostics.
struct ArmaFit {
    ComputeTier tier = ComputeTier::Minimal;  ///< Tier actually fitted
    Vector      ar;                           ///< φ₁ … φₚ
    double      ma   = 0.0;                   ///< θ
    double      mean = 0.0;                   ///< μ

    double rss     = 0.0;  ///< Residual sum of squares
    double rmse    = 0.0;  ///< √(rss / residual count)
    double quality = 0.0;  ///< 1 − rmse / range, clamped to [0, 1]

    int iterations = 0;  ///< Accepted LM steps (Expert only)

    /// One-step-ahead forecast of the value following `series`.
    [[nodiscard]] double forecast_next(std::span<const double> series) const noexcept;
};

class ArmaFitter {
public:
    ArmaFitter() = delete;

    /// Fit the model for `tier` (normalised), falling back as needed.
    ///
    /// # Returns
    /// `nullopt` only for an empty or non-finite series.
    [[nodiscard]] static std::optional<ArmaFit>
    fit(std::span<const double> series,
        ComputeTier tier,
        const FitOptions& options = FitOptions{},
        std::stop_token stop = {}) noexcept;

    /// Sample autocorrelation at `lag` of the demeaned series. 0 for a
    /// constant series or a lag beyond its length.
    [[nodiscard]] static double
    autocorrelation(std::span<const double> series, std::size_t lag) noexcept;

    /// Solve the order-p Yule-Walker system. `nullopt` when the Toeplitz
    /// matrix is near-singular or the solution is non-finite.
    [[nodiscard]] static std::optional<Vector>
    yule_walker(std::span<const double> series, std::size_t order,
                double singularity_threshold = constants::SINGULARITY_THRESHOLD) noexcept;

    /// σ_min / σ_max of `m` from a Jacobi SVD; 0 for an empty or zero matrix.
    [[nodiscard]] static double reciprocal_condition(const Matrix& m) noexcept;

    /// Recursive residuals e_p … e_{n−1} of `series` under (μ, φ, θ).
    [[nodiscard]] static std::vector<double>
    residuals(std::span<const double> series, double mean,
              const Vector& ar, double ma);

    /// Minimum series length for an order-p Yule-Walker fit.
    [[nodiscard]] static constexpr std::size_t min_length(std::size_t order) noexcept {
        return 2 * order + 1;
    }
};

}  // namespace bridget::prediction
