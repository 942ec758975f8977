#pragma once

/// @file include/bridget/types.hpp
/// @brief Shared value types for the Bridget analytics core.
///
/// Every module includes this file. It defines the raw event model supplied
/// by the host application, the derived result records produced by the
/// aggregator, cascade engine and prediction engine, and the Eigen aliases
/// used by the numerical code.
///
/// All types are plain values with no back-references: results are computed
/// fresh, owned by the caller, and safe to copy across threads.

#include <Eigen/Dense>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

namespace bridget {

// ─── Scalars ──────────────────────────────────────────────────────────────────

/// UTC instant with one-second resolution.
using Timestamp = std::chrono::sys_seconds;

/// Stable identifier of a monitored entity (a drawbridge).
using EntityId = std::int64_t;

/// Signed number of minutes from `from` to `to`.
[[nodiscard]] inline double minutes_between(Timestamp from, Timestamp to) noexcept {
    return static_cast<double>((to - from).count()) / 60.0;
}

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Dynamically sized column vector used for model coefficients and series.
using Vector = Eigen::VectorXd;

/// Dynamically sized dense matrix (Toeplitz systems, Jacobians, distances).
using Matrix = Eigen::MatrixXd;

// ─── Raw Input ────────────────────────────────────────────────────────────────

/// One opening of an entity, as delivered by the event source.
///
/// `close_time` is absent while the entity is still open. `minutes_open` is
/// the duration reported by the source; when absent it is derived from the
/// close time. The core never mutates events.
struct Event {
    EntityId                 entity_id = 0;
    std::string              entity_label;
    Timestamp                open_time{};
    std::optional<Timestamp> close_time;
    std::optional<double>    minutes_open;
    double                   latitude  = 0.0;
    double                   longitude = 0.0;

    /// True while no close time has been recorded.
    [[nodiscard]] bool is_open() const noexcept { return !close_time.has_value(); }

    /// True for records that must be filtered out of every computation:
    /// a negative or non-finite reported duration, or a close before the open.
    [[nodiscard]] bool is_malformed() const noexcept {
        if (minutes_open && (!std::isfinite(*minutes_open) || *minutes_open < 0.0)) {
            return true;
        }
        return close_time && *close_time < open_time;
    }

    /// Duration in minutes, defined only once the event has closed.
    [[nodiscard]] std::optional<double> known_duration() const noexcept {
        if (!close_time || is_malformed()) return std::nullopt;
        if (minutes_open) return *minutes_open;
        return minutes_between(open_time, *close_time);
    }
};

/// Static coordinates of an entity, used only to build the proximity graph.
struct EntityLocation {
    EntityId entity_id = 0;
    double   latitude  = 0.0;
    double   longitude = 0.0;
};

// ─── Compute Tier ─────────────────────────────────────────────────────────────

/// Caller-supplied processing budget controlling model complexity.
///
/// Ordered: a higher tier never fits a simpler model than a lower one.
/// Values outside the enumerated range behave as `Standard`.
enum class ComputeTier : int {
    Minimal  = 0,
    Standard = 1,
    Advanced = 2,
    Expert   = 3,
};

/// Map any tier value onto one of the four recognised tiers.
[[nodiscard]] constexpr ComputeTier normalize_tier(ComputeTier tier) noexcept {
    switch (tier) {
        case ComputeTier::Minimal:
        case ComputeTier::Standard:
        case ComputeTier::Advanced:
        case ComputeTier::Expert:
            return tier;
    }
    return ComputeTier::Standard;
}

/// Lower-case tier name ("minimal", "standard", "advanced", "expert").
[[nodiscard]] const char* to_string(ComputeTier tier) noexcept;

/// Parse a tier name as produced by `to_string`. Case-sensitive.
[[nodiscard]] std::optional<ComputeTier> parse_tier(const std::string& name) noexcept;

// ─── Analytics ────────────────────────────────────────────────────────────────

/// Statistics for one (entity, year, month, weekday, hour) bucket.
///
/// Only buckets with at least one observed opening are materialised.
struct AnalyticsRecord {
    EntityId    entity_id = 0;
    std::string entity_label;
    int         year        = 0;
    int         month       = 0;  ///< 1 = January … 12 = December
    int         day_of_week = 0;  ///< 1 = Sunday … 7 = Saturday
    int         hour        = 0;  ///< 0 … 23

    int    opening_count               = 0;
    double total_minutes_open          = 0.0;
    double average_minutes_per_opening = 0.0;
    double longest_minutes             = 0.0;
    double shortest_minutes            = 0.0;

    double probability_of_opening = 0.0;  ///< ∈ [0, 1]
    double expected_duration      = 0.0;  ///< ≥ 0 minutes
    double confidence             = 0.0;  ///< ∈ [0, 1]

    bool is_weekend   = false;  ///< Sunday or Saturday
    bool is_rush_hour = false;  ///< Weekday 07–09 or 16–18
    bool is_summer    = false;  ///< May – September

    bool operator==(const AnalyticsRecord&) const = default;
};

// ─── Cascades ─────────────────────────────────────────────────────────────────

/// Relative strength class of a cascade, cut at run-local quantiles.
enum class CascadeStrengthClass { Weak, Moderate, Strong };

/// Timing class of a cascade, independent of its strength class.
enum class CascadeTimingClass { Immediate, Delayed };

[[nodiscard]] const char* to_string(CascadeStrengthClass c) noexcept;
[[nodiscard]] const char* to_string(CascadeTimingClass c) noexcept;

/// Window of admissible trigger→target delays, inclusive at both ends.
struct CascadeWindow {
    double min_minutes = 30.0;
    double max_minutes = 90.0;

    [[nodiscard]] bool contains(double delay) const noexcept {
        return delay >= min_minutes && delay <= max_minutes;
    }
};

/// One directed trigger→target relationship instance.
///
/// Invariants: trigger_entity_id ≠ target_entity_id, trigger_time <
/// target_time, and delay_minutes lies inside the configured window.
struct CascadeRecord {
    EntityId              trigger_entity_id = 0;
    std::string           trigger_label;
    Timestamp             trigger_time{};
    std::optional<double> trigger_duration;

    EntityId              target_entity_id = 0;
    std::string           target_label;
    Timestamp             target_time{};
    std::optional<double> target_duration;

    double delay_minutes = 0.0;
    double distance_km   = 0.0;

    double temporal_factor      = 0.0;
    double spatial_factor       = 0.0;
    double duration_correlation = 0.0;
    double historical_factor    = 0.0;
    double strength             = 0.0;  ///< ∈ [0, 1]

    CascadeStrengthClass strength_class = CascadeStrengthClass::Weak;
    CascadeTimingClass   timing_class   = CascadeTimingClass::Delayed;

    /// Present only when analytics records were supplied to the engine.
    std::optional<double> confidence;

    bool operator==(const CascadeRecord&) const = default;
};

// ─── Forecast ─────────────────────────────────────────────────────────────────

/// Short-horizon opening forecast for a single entity.
struct Forecast {
    EntityId    entity_id = 0;
    std::string entity_label;

    double probability               = 0.0;  ///< ∈ [0, 1]
    double expected_duration_minutes = 0.0;  ///< ≥ 0
    double confidence                = 0.0;  ///< ∈ [0, 1]

    ComputeTier model_tier     = ComputeTier::Minimal;  ///< Tier actually fitted
    ComputeTier requested_tier = ComputeTier::Minimal;
    double      horizon_minutes = 60.0;
    double      rmse            = 0.0;  ///< In-sample interval RMSE (minutes)

    /// Entity whose recent opening boosted this forecast, if any.
    std::optional<EntityId> cascade_trigger;

    std::string rationale;

    /// "Very Low", "Low", "Moderate", "High" or "Very High".
    [[nodiscard]] std::string probability_text() const;
    /// "Low Confidence", "Medium Confidence" or "High Confidence".
    [[nodiscard]] std::string confidence_text() const;
    /// "< 1 min", "N min" or "Hh Mm"; "unknown" for an infinite duration.
    [[nodiscard]] std::string duration_text() const;
};

}  // namespace bridget
