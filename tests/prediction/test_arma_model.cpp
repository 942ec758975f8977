#include <gtest/gtest.h>
#include "prediction/arma_model.hpp"

#include <cmath>
#include <limits>
#include <random>
#include <stop_token>
#include <vector>

using namespace bridget;
using namespace bridget::prediction;

// ─── Helpers ─────────────────────────────────────────────────────────────────

/// yₜ = μ + φ₁(yₜ₋₁ − μ) + φ₂(yₜ₋₂ − μ) + εₜ with Gaussian noise.
static std::vector<double> simulate_ar2(std::size_t n, double phi1, double phi2,
                                        double mu = 60.0, double sigma = 4.0,
                                        unsigned seed = 42) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> noise(0.0, sigma);
    std::vector<double> y(n, mu);
    for (std::size_t t = 2; t < n; ++t) {
        y[t] = mu + phi1 * (y[t - 1] - mu) + phi2 * (y[t - 2] - mu) + noise(rng);
    }
    return y;
}

// ─── autocorrelation ──────────────────────────────────────────────────────────

TEST(ArmaFitter_Autocorrelation, ConstantSeries_Zero) {
    const std::vector<double> s(20, 7.0);
    EXPECT_DOUBLE_EQ(ArmaFitter::autocorrelation(s, 1), 0.0);
}

TEST(ArmaFitter_Autocorrelation, LagZero_One) {
    const std::vector<double> s = {1.0, 4.0, 2.0, 8.0};
    EXPECT_DOUBLE_EQ(ArmaFitter::autocorrelation(s, 0), 1.0);
}

TEST(ArmaFitter_Autocorrelation, LagBeyondLength_Zero) {
    const std::vector<double> s = {1.0, 2.0, 3.0};
    EXPECT_DOUBLE_EQ(ArmaFitter::autocorrelation(s, 3), 0.0);
}

TEST(ArmaFitter_Autocorrelation, AlternatingSeries_StronglyNegative) {
    std::vector<double> s;
    for (int i = 0; i < 100; ++i) s.push_back(i % 2 == 0 ? 1.0 : -1.0);
    EXPECT_NEAR(ArmaFitter::autocorrelation(s, 1), -0.99, 1e-12);
}

// ─── reciprocal_condition ─────────────────────────────────────────────────────

TEST(ArmaFitter_Condition, IdentityIsOne_ZeroIsZero) {
    EXPECT_NEAR(ArmaFitter::reciprocal_condition(Matrix::Identity(3, 3)), 1.0, 1e-15);
    EXPECT_DOUBLE_EQ(ArmaFitter::reciprocal_condition(Matrix::Zero(2, 2)), 0.0);
    EXPECT_DOUBLE_EQ(ArmaFitter::reciprocal_condition(Matrix()), 0.0);
}

TEST(ArmaFitter_Condition, DiagonalRatio) {
    Matrix m = Matrix::Zero(2, 2);
    m(0, 0) = 1.0;
    m(1, 1) = 1e-10;
    EXPECT_NEAR(ArmaFitter::reciprocal_condition(m), 1e-10, 1e-20);
}

// ─── yule_walker ──────────────────────────────────────────────────────────────

TEST(ArmaFitter_YuleWalker, RecoversAr1Coefficient) {
    const auto s = simulate_ar2(4000, 0.7, 0.0);
    const auto phi = ArmaFitter::yule_walker(s, 1);
    ASSERT_TRUE(phi.has_value());
    EXPECT_NEAR((*phi)(0), 0.7, 0.05);
}

TEST(ArmaFitter_YuleWalker, RecoversAr2Coefficients) {
    const auto s = simulate_ar2(6000, 0.5, 0.3);
    const auto phi = ArmaFitter::yule_walker(s, 2);
    ASSERT_TRUE(phi.has_value());
    EXPECT_NEAR((*phi)(0), 0.5, 0.06);
    EXPECT_NEAR((*phi)(1), 0.3, 0.06);
}

TEST(ArmaFitter_YuleWalker, TooShortOrZeroOrder_Nullopt) {
    const std::vector<double> s = {1.0, 3.0, 2.0, 5.0};
    EXPECT_EQ(ArmaFitter::min_length(2), 5u);
    EXPECT_FALSE(ArmaFitter::yule_walker(s, 2).has_value());
    EXPECT_FALSE(ArmaFitter::yule_walker(s, 0).has_value());
}

TEST(ArmaFitter_YuleWalker, ConstantSeries_ZeroCoefficients) {
    const std::vector<double> s(30, 45.0);
    const auto phi = ArmaFitter::yule_walker(s, 3);
    ASSERT_TRUE(phi.has_value());
    EXPECT_TRUE(phi->isZero());
}

TEST(ArmaFitter_YuleWalker, ThresholdAboveOne_AlwaysSingular) {
    const auto s = simulate_ar2(200, 0.5, 0.2);
    EXPECT_FALSE(ArmaFitter::yule_walker(s, 2, 1.1).has_value());
}

// ─── residuals / forecast_next ────────────────────────────────────────────────

TEST(ArmaFitter_Residuals, RecursiveMaTerm) {
    const std::vector<double> s = {2.0, 2.0, 2.0};
    const Vector ar = Vector::Constant(1, 0.5);

    const auto e0 = ArmaFitter::residuals(s, 0.0, ar, 0.0);
    ASSERT_EQ(e0.size(), 2u);
    EXPECT_DOUBLE_EQ(e0[0], 1.0);
    EXPECT_DOUBLE_EQ(e0[1], 1.0);

    const auto e1 = ArmaFitter::residuals(s, 0.0, ar, 0.5);
    EXPECT_DOUBLE_EQ(e1[0], 1.0);
    EXPECT_DOUBLE_EQ(e1[1], 0.5);
}

TEST(ArmaFitter_Residuals, SeriesNoLongerThanOrder_Empty) {
    const std::vector<double> s = {1.0, 2.0};
    EXPECT_TRUE(ArmaFitter::residuals(s, 0.0, Vector::Zero(2), 0.0).empty());
}

TEST(ArmaFit_Forecast, ArOneStepAhead) {
    ArmaFit fit;
    fit.mean = 10.0;
    fit.ar   = Vector::Constant(1, 0.5);
    fit.ma   = 0.0;
    const std::vector<double> s = {10.0, 12.0};
    EXPECT_DOUBLE_EQ(fit.forecast_next(s), 11.0);
}

TEST(ArmaFit_Forecast, EmptySeries_ReturnsMean) {
    ArmaFit fit;
    fit.mean = 33.0;
    fit.ar   = Vector::Constant(2, 0.4);
    EXPECT_DOUBLE_EQ(fit.forecast_next({}), 33.0);
}

// ─── fit: tiers and fallback ──────────────────────────────────────────────────

TEST(ArmaFitter_Fit, EmptyOrNonFinite_Nullopt) {
    EXPECT_FALSE(ArmaFitter::fit({}, ComputeTier::Standard).has_value());
    const std::vector<double> bad = {1.0, std::numeric_limits<double>::quiet_NaN(), 3.0};
    EXPECT_FALSE(ArmaFitter::fit(bad, ComputeTier::Minimal).has_value());
}

TEST(ArmaFitter_Fit, EachTierFitsItsOrder) {
    const auto s = simulate_ar2(300, 0.5, 0.2);

    const auto minimal = ArmaFitter::fit(s, ComputeTier::Minimal);
    ASSERT_TRUE(minimal.has_value());
    EXPECT_EQ(minimal->tier, ComputeTier::Minimal);
    EXPECT_EQ(minimal->ar.size(), 1);
    EXPECT_DOUBLE_EQ(minimal->ma, constants::DEFAULT_MA_COEFFICIENT);

    const auto standard = ArmaFitter::fit(s, ComputeTier::Standard);
    ASSERT_TRUE(standard.has_value());
    EXPECT_EQ(standard->tier, ComputeTier::Standard);
    EXPECT_EQ(standard->ar.size(), 2);

    const auto advanced = ArmaFitter::fit(s, ComputeTier::Advanced);
    ASSERT_TRUE(advanced.has_value());
    EXPECT_EQ(advanced->tier, ComputeTier::Advanced);
    EXPECT_EQ(advanced->ar.size(), 3);

    const auto expert = ArmaFitter::fit(s, ComputeTier::Expert);
    ASSERT_TRUE(expert.has_value());
    EXPECT_EQ(expert->tier, ComputeTier::Expert);
    EXPECT_EQ(expert->ar.size(), 4);
    EXPECT_LE(std::abs(expert->ma), constants::MAX_COEFFICIENT_MAGNITUDE);
}

TEST(ArmaFitter_Fit, DiagnosticsInRange) {
    const auto s = simulate_ar2(150, 0.6, -0.2, 45.0, 6.0, 7);
    for (auto tier : {ComputeTier::Minimal, ComputeTier::Standard,
                      ComputeTier::Advanced, ComputeTier::Expert}) {
        const auto fit = ArmaFitter::fit(s, tier);
        ASSERT_TRUE(fit.has_value());
        EXPECT_GE(fit->quality, 0.0);
        EXPECT_LE(fit->quality, 1.0);
        EXPECT_GE(fit->rmse, 0.0);
        EXPECT_TRUE(std::isfinite(fit->rss));
        EXPECT_TRUE(std::isfinite(fit->forecast_next(s)));
    }
}

TEST(ArmaFitter_Fit, ExpertDoesNotWorsenYuleWalkerStart) {
    // LM accepts only RSS-reducing steps from the Yule-Walker AR(4) start.
    const auto s = simulate_ar2(400, 0.4, 0.3, 50.0, 5.0, 99);
    FitOptions frozen;
    frozen.lm_max_iterations = 0;

    const auto start   = ArmaFitter::fit(s, ComputeTier::Expert, frozen);
    const auto refined = ArmaFitter::fit(s, ComputeTier::Expert);
    ASSERT_TRUE(start.has_value());
    ASSERT_TRUE(refined.has_value());
    EXPECT_EQ(start->iterations, 0);
    EXPECT_LE(refined->rss, start->rss * (1.0 + 1e-9));
}

TEST(ArmaFitter_Fit, ShortSeries_FallsBackToMinimal) {
    const std::vector<double> s = {50.0, 55.0, 48.0, 61.0};
    const auto fit = ArmaFitter::fit(s, ComputeTier::Expert);
    ASSERT_TRUE(fit.has_value());
    EXPECT_EQ(fit->tier, ComputeTier::Minimal);
}

TEST(ArmaFitter_Fit, MediumSeries_FallsBackOneTierAtATime) {
    // 7 points: enough for AR(3) (needs 7), not for AR(4) (needs 9).
    const std::vector<double> s = {50.0, 55.0, 48.0, 61.0, 52.0, 58.0, 47.0};
    const auto fit = ArmaFitter::fit(s, ComputeTier::Expert);
    ASSERT_TRUE(fit.has_value());
    EXPECT_EQ(fit->tier, ComputeTier::Advanced);
}

TEST(ArmaFitter_Fit, SingularSystems_FallBackToMinimal) {
    FitOptions options;
    options.singularity_threshold = 1.1;
    const auto s = simulate_ar2(200, 0.5, 0.2);
    const auto fit = ArmaFitter::fit(s, ComputeTier::Expert, options);
    ASSERT_TRUE(fit.has_value());
    EXPECT_EQ(fit->tier, ComputeTier::Minimal);
}

TEST(ArmaFitter_Fit, UnknownTier_ActsAsStandard) {
    const auto s = simulate_ar2(100, 0.5, 0.2);
    const auto fit = ArmaFitter::fit(s, static_cast<ComputeTier>(17));
    ASSERT_TRUE(fit.has_value());
    EXPECT_EQ(fit->tier, ComputeTier::Standard);
}

TEST(ArmaFitter_Fit, StopRequested_ExpertKeepsStartingPoint) {
    const auto s = simulate_ar2(200, 0.5, 0.2);
    std::stop_source source;
    source.request_stop();
    const auto fit = ArmaFitter::fit(s, ComputeTier::Expert, FitOptions{}, source.get_token());
    ASSERT_TRUE(fit.has_value());
    EXPECT_EQ(fit->tier, ComputeTier::Expert);
    EXPECT_EQ(fit->iterations, 0);
}

TEST(ArmaFitter_Fit, ConstantSeries_PerfectQuality) {
    const std::vector<double> s(40, 30.0);
    const auto fit = ArmaFitter::fit(s, ComputeTier::Expert);
    ASSERT_TRUE(fit.has_value());
    EXPECT_DOUBLE_EQ(fit->quality, 1.0);
    EXPECT_NEAR(fit->forecast_next(s), 30.0, 1e-9);
}
