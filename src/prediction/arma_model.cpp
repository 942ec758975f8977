/// @file src/prediction/arma_model.cpp
/// @brief Implementation of ArmaFitter.
///
/// Fallible fits return std::nullopt and the dispatcher in `fit` drops to
/// the next lower tier; nothing here throws or aborts.

#include "arma_model.hpp"

#include <Eigen/SVD>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace bridget::prediction {

namespace {

constexpr double MAX_MA_FROM_RESIDUALS = 0.95;
constexpr double MAX_LM_DAMPING        = 1e8;
constexpr double MIN_LM_DAMPING        = 1e-12;

[[nodiscard]] double mean_of(std::span<const double> v) noexcept {
    if (v.empty()) return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

/// Fill rss / rmse / quality of `fit` from its residuals on `series`.
void diagnose(ArmaFit& fit, std::span<const double> series) {
    const auto e = ArmaFitter::residuals(series, fit.mean, fit.ar, fit.ma);
    double rss = 0.0;
    for (double x : e) rss += x * x;

    fit.rss  = rss;
    fit.rmse = e.empty() ? 0.0 : std::sqrt(rss / static_cast<double>(e.size()));

    const auto [lo, hi] = std::minmax_element(series.begin(), series.end());
    const double range  = *hi - *lo;
    fit.quality = range <= constants::FLOAT_EPSILON
                      ? 1.0
                      : std::clamp(1.0 - fit.rmse / range, 0.0, 1.0);
}

[[nodiscard]] ArmaFit fit_minimal(std::span<const double> series) {
    ArmaFit fit;
    fit.tier = ComputeTier::Minimal;
    fit.mean = mean_of(series);
    fit.ar   = Vector::Constant(1, std::clamp(ArmaFitter::autocorrelation(series, 1),
                                              -constants::MAX_COEFFICIENT_MAGNITUDE,
                                              constants::MAX_COEFFICIENT_MAGNITUDE));
    fit.ma   = constants::DEFAULT_MA_COEFFICIENT;
    diagnose(fit, series);
    return fit;
}

[[nodiscard]] std::optional<ArmaFit>
fit_yule_walker(std::span<const double> series, std::size_t order, ComputeTier tier,
                const FitOptions& options) {
    auto phi = ArmaFitter::yule_walker(series, order, options.singularity_threshold);
    if (!phi) return std::nullopt;

    ArmaFit fit;
    fit.tier = tier;
    fit.mean = mean_of(series);
    fit.ar   = std::move(*phi);

    // MA(1) approximated from the lag-1 autocorrelation of the AR residuals.
    const auto e = ArmaFitter::residuals(series, fit.mean, fit.ar, 0.0);
    fit.ma = std::clamp(ArmaFitter::autocorrelation(e, 1),
                        -MAX_MA_FROM_RESIDUALS, MAX_MA_FROM_RESIDUALS);

    diagnose(fit, series);
    if (!std::isfinite(fit.rss)) return std::nullopt;
    return fit;
}

/// Residuals and their Jacobian with respect to β = (φ₁ … φₚ, θ).
///
///     ∂eₜ/∂φᵢ = −yₜ₋ᵢ − θ·∂eₜ₋₁/∂φᵢ
///     ∂eₜ/∂θ  = −eₜ₋₁ − θ·∂eₜ₋₁/∂θ
void residual_jacobian(std::span<const double> series, double mean, const Vector& beta,
                       Vector& e, Matrix& jac) {
    const auto p  = static_cast<std::size_t>(beta.size() - 1);
    const auto n  = series.size();
    const auto m  = static_cast<Eigen::Index>(n - p);
    const double theta = beta(beta.size() - 1);

    e.setZero(m);
    jac.setZero(m, beta.size());

    double prev_e = 0.0;
    Vector prev_d = Vector::Zero(beta.size());

    for (std::size_t t = p; t < n; ++t) {
        const auto row = static_cast<Eigen::Index>(t - p);

        double pred = 0.0;
        for (std::size_t i = 0; i < p; ++i) {
            pred += beta(static_cast<Eigen::Index>(i)) * (series[t - 1 - i] - mean);
        }
        const double et = (series[t] - mean) - pred - theta * prev_e;

        for (std::size_t i = 0; i < p; ++i) {
            const auto c = static_cast<Eigen::Index>(i);
            jac(row, c) = -(series[t - 1 - i] - mean) - theta * prev_d(c);
        }
        const auto tc = beta.size() - 1;
        jac(row, tc) = -prev_e - theta * prev_d(tc);

        e(row)  = et;
        prev_e  = et;
        prev_d  = jac.row(row).transpose();
    }
}

/// AR(4) + MA(1) refined by Levenberg-Marquardt on the conditional sum of
/// squares, started from the Yule-Walker AR(4) estimate.
[[nodiscard]] std::optional<ArmaFit>
fit_expert(std::span<const double> series, const FitOptions& options, std::stop_token stop) {
    constexpr std::size_t ORDER = 4;

    auto init = fit_yule_walker(series, ORDER, ComputeTier::Expert, options);
    if (!init) return std::nullopt;

    const double mean = init->mean;
    Vector beta(ORDER + 1);
    beta.head(ORDER) = init->ar;
    beta(ORDER)      = init->ma;

    Vector e;
    Matrix jac;
    residual_jacobian(series, mean, beta, e, jac);
    double rss = e.squaredNorm();
    if (!std::isfinite(rss)) return std::nullopt;

    double lambda   = constants::LM_INITIAL_DAMPING;
    int    accepted = 0;

    for (int it = 0; it < options.lm_max_iterations; ++it) {
        if (stop.stop_requested()) break;

        const Matrix a = jac.transpose() * jac;
        const Vector g = jac.transpose() * e;

        // Marquardt scaling: damp along diag(JᵀJ), floored to stay positive.
        const Vector d = a.diagonal().cwiseMax(constants::FLOAT_EPSILON);
        const Matrix m = a + lambda * Matrix(d.asDiagonal());

        if (ArmaFitter::reciprocal_condition(m) < options.singularity_threshold) {
            if (accepted == 0) return std::nullopt;
            break;
        }

        const Vector delta = m.ldlt().solve(-g);
        if (!delta.allFinite()) {
            if (accepted == 0) return std::nullopt;
            break;
        }

        Vector candidate = beta + delta;
        candidate(ORDER) = std::clamp(candidate(ORDER),
                                      -constants::MAX_COEFFICIENT_MAGNITUDE,
                                      constants::MAX_COEFFICIENT_MAGNITUDE);

        Vector e_new;
        Matrix jac_new;
        residual_jacobian(series, mean, candidate, e_new, jac_new);
        const double rss_new = e_new.squaredNorm();

        if (std::isfinite(rss_new) && rss_new < rss) {
            const double improvement = (rss - rss_new) / std::max(rss, constants::FLOAT_EPSILON);
            beta   = std::move(candidate);
            e      = std::move(e_new);
            jac    = std::move(jac_new);
            rss    = rss_new;
            lambda = std::max(lambda / 10.0, MIN_LM_DAMPING);
            ++accepted;
            if (improvement < options.lm_tolerance) break;
        } else {
            lambda *= 10.0;
            if (lambda > MAX_LM_DAMPING) break;
        }
    }

    ArmaFit fit;
    fit.tier       = ComputeTier::Expert;
    fit.mean       = mean;
    fit.ar         = beta.head(ORDER);
    fit.ma         = beta(ORDER);
    fit.iterations = accepted;
    diagnose(fit, series);
    if (!fit.ar.allFinite() || !std::isfinite(fit.rss)) return std::nullopt;
    return fit;
}

}  // namespace

// ─── ArmaFit ──────────────────────────────────────────────────────────────────

double ArmaFit::forecast_next(std::span<const double> series) const noexcept {
    const std::size_t n = series.size();
    if (n == 0) return mean;

    const auto e = ArmaFitter::residuals(series, mean, ar, ma);
    const double last_e = e.empty() ? 0.0 : e.back();

    double pred = 0.0;
    for (Eigen::Index i = 0; i < ar.size() && static_cast<std::size_t>(i) < n; ++i) {
        pred += ar(i) * (series[n - 1 - static_cast<std::size_t>(i)] - mean);
    }
    const double next = mean + pred + ma * last_e;
    return std::isfinite(next) ? next : mean;
}

// ─── ArmaFitter: statistics ───────────────────────────────────────────────────

double ArmaFitter::autocorrelation(std::span<const double> series, std::size_t lag) noexcept {
    const std::size_t n = series.size();
    if (lag >= n) return 0.0;

    const double mu = mean_of(series);
    double c0 = 0.0;
    for (double x : series) c0 += (x - mu) * (x - mu);
    if (c0 <= constants::FLOAT_EPSILON) return 0.0;

    double ck = 0.0;
    for (std::size_t t = lag; t < n; ++t) ck += (series[t] - mu) * (series[t - lag] - mu);
    return ck / c0;
}

double ArmaFitter::reciprocal_condition(const Matrix& m) noexcept {
    if (m.size() == 0) return 0.0;
    const Eigen::JacobiSVD<Matrix> svd(m);
    const auto& sv = svd.singularValues();
    const double hi = sv(0);
    const double lo = sv(sv.size() - 1);
    if (!(hi > 0.0) || !std::isfinite(hi)) return 0.0;
    return lo / hi;
}

std::optional<Vector>
ArmaFitter::yule_walker(std::span<const double> series, std::size_t order,
                        double singularity_threshold) noexcept {
    if (order == 0 || series.size() < min_length(order)) return std::nullopt;

    // r(0) = 1 even for a constant series, keeping R = I well conditioned.
    std::vector<double> r(order + 1, 0.0);
    r[0] = 1.0;
    for (std::size_t k = 1; k <= order; ++k) r[k] = autocorrelation(series, k);

    const auto p = static_cast<Eigen::Index>(order);
    Matrix toeplitz(p, p);
    Vector rhs(p);
    for (Eigen::Index i = 0; i < p; ++i) {
        for (Eigen::Index j = 0; j < p; ++j) {
            toeplitz(i, j) = r[static_cast<std::size_t>(std::abs(i - j))];
        }
        rhs(i) = r[static_cast<std::size_t>(i + 1)];
    }

    if (reciprocal_condition(toeplitz) < singularity_threshold) return std::nullopt;

    Vector phi = toeplitz.colPivHouseholderQr().solve(rhs);
    if (!phi.allFinite()) return std::nullopt;
    return phi;
}

std::vector<double>
ArmaFitter::residuals(std::span<const double> series, double mean,
                      const Vector& ar, double ma) {
    const auto p = static_cast<std::size_t>(ar.size());
    const auto n = series.size();
    std::vector<double> e;
    if (n <= p) return e;
    e.reserve(n - p);

    double prev = 0.0;
    for (std::size_t t = p; t < n; ++t) {
        double pred = 0.0;
        for (std::size_t i = 0; i < p; ++i) {
            pred += ar(static_cast<Eigen::Index>(i)) * (series[t - 1 - i] - mean);
        }
        const double et = (series[t] - mean) - pred - ma * prev;
        e.push_back(et);
        prev = et;
    }
    return e;
}

// ─── ArmaFitter: dispatch ─────────────────────────────────────────────────────

std::optional<ArmaFit>
ArmaFitter::fit(std::span<const double> series, ComputeTier tier,
                const FitOptions& options, std::stop_token stop) noexcept {
    if (series.empty()) return std::nullopt;
    for (double x : series) {
        if (!std::isfinite(x)) return std::nullopt;
    }

    switch (normalize_tier(tier)) {
        case ComputeTier::Expert:
            if (auto f = fit_expert(series, options, stop)) return f;
            [[fallthrough]];
        case ComputeTier::Advanced:
            if (auto f = fit_yule_walker(series, 3, ComputeTier::Advanced, options)) return f;
            [[fallthrough]];
        case ComputeTier::Standard:
            if (auto f = fit_yule_walker(series, 2, ComputeTier::Standard, options)) return f;
            [[fallthrough]];
        case ComputeTier::Minimal:
            break;
    }
    return fit_minimal(series);
}

}  // namespace bridget::prediction
