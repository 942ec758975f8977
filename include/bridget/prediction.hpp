#pragma once

/// @file include/bridget/prediction.hpp
/// @brief Adaptive Prediction Engine: tiered ARMA short-horizon forecasts.
///
/// # Module: Prediction Engine
///
/// ## Responsibility
/// Given an entity's history, fit an ARMA model whose complexity follows
/// the caller's `ComputeTier` and forecast whether the entity opens within
/// the horizon, for how long, and how much to trust that.
///
/// ## Pipeline
///   history → inter-opening intervals xᵢ and durations dᵢ
///           → ArmaFitter (tier, with numerical fallback)
///           → x̂ (next interval), σ (interval RMSE)
///           → wait = time until the predicted opening
///           → P = logistic((horizon − wait) / max(σ, 5 min))
///           → + cascade boost, capped
///
/// ## Confidence
///     q = mean fit quality (1 − RMSE / range) of the fitted series
///     confidence = (bucket.confidence + q) / 2    matching analytics bucket
///                = penalty · q                    otherwise
///
/// ## Guarantees
/// - Never throws; fewer than `min_events` usable events → `nullopt`
/// - probability, confidence ∈ [0, 1]; expected duration ≥ 0
/// - A cascade-boosted probability never exceeds the configured cap
///
/// ## NOT Responsible For
/// - Producing analytics or cascade records (see analytics.hpp, cascade.hpp)

#include "bridget/types.hpp"
#include "bridget/constants.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <span>
#include <stop_token>

namespace bridget::prediction {

// ─── PredictionConfig ─────────────────────────────────────────────────────────

struct PredictionConfig {
    /// Forecast horizon in minutes from `now`.
    double horizon_minutes = constants::FORECAST_HORIZON_MINUTES;

    /// Additive probability boost per unit of cascade strength.
    double cascade_boost_factor = constants::CASCADE_BOOST_FACTOR;

    /// Ceiling applied to boosted probabilities.
    double boosted_probability_cap = constants::BOOSTED_PROBABILITY_CAP;

    /// Confidence multiplier used when no analytics bucket matches `now`.
    double missing_prior_penalty = constants::MISSING_PRIOR_PENALTY;

    /// A trigger counts as recent if it opened within `window.max_minutes`.
    CascadeWindow cascade_window{constants::CASCADE_WINDOW_MIN_MINUTES,
                                 constants::CASCADE_WINDOW_MAX_MINUTES};

    /// Minimum usable events for the entity. Values below 3 act as 3.
    std::size_t min_events = constants::MIN_FORECAST_EVENTS;

    int    lm_max_iterations     = constants::LM_MAX_ITERATIONS;
    double lm_tolerance          = constants::LM_TOLERANCE;
    double singularity_threshold = constants::SINGULARITY_THRESHOLD;

    /// Offset of the local calendar the analytics buckets were built in.
    std::chrono::minutes utc_offset{0};

    /// Emit per-forecast diagnostics to stderr.
    bool verbose = false;
};

// ─── PredictionEngine ─────────────────────────────────────────────────────────

class PredictionEngine {
public:
    explicit PredictionEngine(PredictionConfig config = PredictionConfig{});

    /// Forecast `entity` for the window [now, now + horizon].
    ///
    /// Only events of `entity` that are well formed and opened at or before
    /// `now` are used. `analytics` and `cascades` may be empty.
    ///
    /// # Returns
    /// `nullopt` if fewer than `min_events` such events exist or `stop` was
    /// requested before fitting began.
    [[nodiscard]] std::optional<Forecast>
    forecast(EntityId entity,
             std::span<const Event> events,
             std::span<const AnalyticsRecord> analytics,
             std::span<const CascadeRecord> cascades,
             ComputeTier tier,
             Timestamp now,
             std::stop_token stop = {}) const noexcept;

    /// As above, over [now, now + horizon_minutes] instead of the configured
    /// horizon. A non-finite horizon falls back to the configured one; a
    /// negative horizon acts as 0.
    [[nodiscard]] std::optional<Forecast>
    forecast(EntityId entity,
             std::span<const Event> events,
             std::span<const AnalyticsRecord> analytics,
             std::span<const CascadeRecord> cascades,
             ComputeTier tier,
             Timestamp now,
             double horizon_minutes,
             std::stop_token stop = {}) const noexcept;

    /// Logistic transform 1 / (1 + e^(−x)), saturating for large |x|.
    [[nodiscard]] static double logistic(double x) noexcept;

    [[nodiscard]] const PredictionConfig& config() const noexcept { return config_; }

private:
    PredictionConfig config_;
};

}  // namespace bridget::prediction
