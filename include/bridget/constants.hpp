#pragma once

#include <cstddef>

/// @file include/bridget/constants.hpp
/// @brief Tunable defaults for the Bridget analytics core.
///
/// Every config struct takes its defaults from here so that tests and the
/// CLI agree on a single set of numbers.

namespace bridget::constants {

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

/// Reciprocal condition estimate (σ_min / σ_max) below which a linear system
/// is treated as singular and the fitter falls back to a simpler tier.
static constexpr double SINGULARITY_THRESHOLD = 1e-8;

// ─── Analytics ────────────────────────────────────────────────────────────────

/// Observations per bucket at which confidence saturates at 1.0.
static constexpr int MIN_SAMPLE_FOR_FULL_CONFIDENCE = 10;

/// Window (in records) of the centred moving average used for trend.
static constexpr std::size_t TREND_WINDOW = 24;

/// Probability uplift attributed to holiday periods.
static constexpr double HOLIDAY_ADJUSTMENT = 0.3;

/// Gap between consecutive openings (hours) at which it counts as a streak.
static constexpr double MIN_STREAK_HOURS = 12.0;

/// Default look-back windows of the trend and streak reports.
static constexpr int DAILY_TREND_DAYS       = 30;
static constexpr int WEEKLY_TREND_WEEKS     = 12;
static constexpr int TREND_PERIOD_DAYS      = 7;
static constexpr int STREAK_LOOKBACK_DAYS   = 30;
static constexpr int CHAMPION_LOOKBACK_DAYS = 7;

// ─── Cascade Detection ────────────────────────────────────────────────────────

/// Default cascade window bounds (minutes after the trigger opening).
static constexpr double CASCADE_WINDOW_MIN_MINUTES = 30.0;
static constexpr double CASCADE_WINDOW_MAX_MINUTES = 90.0;

/// Default proximity radius for the entity graph.
static constexpr double MAX_CASCADE_DISTANCE_KM = 5.0;

/// Delays strictly below this are tagged "immediate".
static constexpr double IMMEDIATE_CASCADE_MINUTES = 35.0;

/// Mean Earth radius (IUGG) for haversine distances.
static constexpr double EARTH_RADIUS_KM = 6371.0088;

/// Neutral prior for the historical factor and unknown durations.
static constexpr double NEUTRAL_PRIOR = 0.5;

/// Quantile levels giving the weak / moderate / strong / very-strong cuts.
static constexpr double QUANTILE_LOW  = 0.25;
static constexpr double QUANTILE_MID  = 0.50;
static constexpr double QUANTILE_HIGH = 0.75;

/// Lead time for real-time cascade alerts.
static constexpr double CASCADE_ALERT_LEAD_MINUTES = 15.0;

/// Relationships weaker than this (mean strength) never raise an alert.
static constexpr double CASCADE_ALERT_MIN_STRENGTH = 0.4;

/// Mean strength above which an entity is called a high-influence trigger
/// or a highly susceptible target.
static constexpr double HIGH_CASCADE_STRENGTH = 0.5;

// ─── Prediction ───────────────────────────────────────────────────────────────

/// Minimum number of historical events required to fit any model.
static constexpr std::size_t MIN_FORECAST_EVENTS = 3;

/// Default forecast horizon.
static constexpr double FORECAST_HORIZON_MINUTES = 60.0;

/// Additive boost per unit cascade strength.
static constexpr double CASCADE_BOOST_FACTOR = 0.15;

/// Ceiling applied to cascade-boosted probabilities.
static constexpr double BOOSTED_PROBABILITY_CAP = 0.95;

/// Confidence multiplier when no analytics bucket matches the forecast time.
static constexpr double MISSING_PRIOR_PENALTY = 0.7;

/// MA(1) coefficient used by the minimal tier, which does not fit it.
static constexpr double DEFAULT_MA_COEFFICIENT = 0.2;

/// Largest admissible |φ| or |θ| for a stationary, invertible model.
static constexpr double MAX_COEFFICIENT_MAGNITUDE = 0.99;

/// Levenberg-Marquardt iteration cap and relative RSS tolerance.
static constexpr int    LM_MAX_ITERATIONS  = 20;
static constexpr double LM_TOLERANCE       = 1e-6;
static constexpr double LM_INITIAL_DAMPING = 1e-3;

/// Floor for the logistic scale (minutes) so that perfectly regular series
/// do not collapse to a step function.
static constexpr double MIN_PRESSURE_SCALE_MINUTES = 5.0;

/// Interval between cooperative cancellation checks in long loops.
static constexpr std::size_t CANCEL_CHECK_INTERVAL = 256;

}  // namespace bridget::constants
