#pragma once

/// @file include/bridget/cascade.hpp
/// @brief Spatial-Temporal Cascade Engine.
///
/// # Module: Cascade Engine
///
/// ## Responsibility
/// Infer directed trigger→target relationships between entities whose
/// openings cluster in time and space:
///
///   EntityLocation[] → ProximityGraph (haversine, Eigen distance matrix)
///   Event[] → chronological scan → candidate pairs → four-factor score
///           → quantile classification → CascadeRecord[]
///
/// ## Scoring
/// Every candidate (E, F) with delay d = t_F − t_E inside [lo, hi] and
/// distance r ≤ R is scored by
///
///     temporal   = 1 − |d − (lo + hi)/2| / ((hi − lo)/2)
///     spatial    = 1 − r / R
///     duration   = 1 − |δ_E − δ_F| / max(δ_E, δ_F, 1)      (0.5 if unknown)
///     historical = qualifying / total  over earlier openings of E's entity
///                  that could have triggered F's entity     (0.5 if none)
///
///     strength = Σ wᵢ·factorᵢ / Σ wᵢ,   every factor clamped to [0, 1]
///
/// ## Guarantees
/// - Never throws; fewer than two events or no locations yields an empty list
/// - Every record has trigger ≠ target, trigger_time < target_time and a
///   delay inside the configured window
/// - Pure: the pair-frequency table is rebuilt on each call
///
/// ## NOT Responsible For
/// - Aggregated statistics (see analytics.hpp)
/// - Forecasting (see prediction.hpp)

#include "bridget/types.hpp"
#include "bridget/constants.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

namespace bridget::cascade {

// ─── ProximityGraph ───────────────────────────────────────────────────────────

/// Undirected graph of entities within `max_distance_km` of each other.
///
/// Nodes are the distinct entities of the location list (first occurrence
/// wins; non-finite coordinates are dropped), ordered by id. All pairwise
/// great-circle distances are kept in a symmetric Eigen matrix.
class ProximityGraph {
public:
    ProximityGraph(std::span<const EntityLocation> locations,
                   double max_distance_km = constants::MAX_CASCADE_DISTANCE_KM);

    /// Great-circle distance in km between two (lat, lon) points in degrees.
    [[nodiscard]] static double haversine_km(double lat1, double lon1,
                                             double lat2, double lon2) noexcept;

    [[nodiscard]] bool contains(EntityId id) const noexcept;

    /// Distance between two known entities, or nullopt if either is unknown.
    [[nodiscard]] std::optional<double> distance_km(EntityId a, EntityId b) const noexcept;

    /// True iff a ≠ b, both are known, and their distance ≤ max_distance_km.
    [[nodiscard]] bool adjacent(EntityId a, EntityId b) const noexcept;

    /// Entities adjacent to `id`, ascending. Empty for unknown ids.
    [[nodiscard]] std::vector<EntityId> neighbors(EntityId id) const;

    [[nodiscard]] std::size_t size() const noexcept { return ids_.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept;
    [[nodiscard]] bool        empty() const noexcept { return ids_.empty(); }

    [[nodiscard]] const std::vector<EntityId>& ids() const noexcept { return ids_; }
    [[nodiscard]] const Matrix& distances() const noexcept { return distances_; }
    [[nodiscard]] double max_distance_km() const noexcept { return max_distance_km_; }

private:
    std::vector<EntityId>                      ids_;
    std::unordered_map<EntityId, Eigen::Index> index_;
    Matrix                                     distances_;
    double                                     max_distance_km_;
};

// ─── CascadeConfig ────────────────────────────────────────────────────────────

/// Relative weights of the four scoring factors. Need not sum to one.
struct FactorWeights {
    double temporal   = 0.25;
    double spatial    = 0.25;
    double duration   = 0.25;
    double historical = 0.25;
};

struct CascadeConfig {
    CascadeWindow window{constants::CASCADE_WINDOW_MIN_MINUTES,
                         constants::CASCADE_WINDOW_MAX_MINUTES};

    double max_distance_km = constants::MAX_CASCADE_DISTANCE_KM;

    FactorWeights weights{};

    /// Delays strictly below this are classed `Immediate`.
    double immediate_threshold_minutes = constants::IMMEDIATE_CASCADE_MINUTES;

    /// Offset of the local calendar the analytics buckets were built in.
    std::chrono::minutes utc_offset{0};

    /// Emit scan statistics to stderr.
    bool verbose = false;
};

// ─── CascadeEngine ────────────────────────────────────────────────────────────

class CascadeEngine {
public:
    explicit CascadeEngine(CascadeConfig config = CascadeConfig{});

    /// Detect cascade records among `events`.
    ///
    /// # Returns
    /// Records ordered by (trigger_time, trigger_entity_id, target_time,
    /// target_entity_id), with `confidence` unset. Empty if fewer than two
    /// events, no locations, no adjacent pair, or if `stop` is requested.
    [[nodiscard]] std::vector<CascadeRecord>
    detect(std::span<const Event> events,
           std::span<const EntityLocation> locations,
           std::stop_token stop = {}) const noexcept;

    /// As above, additionally setting `confidence` from the analytics buckets
    /// of the trigger and target openings (geometric mean of the two bucket
    /// confidences; 0 when either bucket is absent).
    [[nodiscard]] std::vector<CascadeRecord>
    detect(std::span<const Event> events,
           std::span<const EntityLocation> locations,
           std::span<const AnalyticsRecord> analytics,
           std::stop_token stop = {}) const noexcept;

    [[nodiscard]] const CascadeConfig& config() const noexcept { return config_; }

    /// Linear peak-at-midpoint score of `delay` within `window`.
    [[nodiscard]] static double temporal_factor(double delay, const CascadeWindow& window) noexcept;

    /// 1 − distance / max_distance, clamped to [0, 1].
    [[nodiscard]] static double spatial_factor(double distance_km, double max_distance_km) noexcept;

    /// Similarity of two opening durations; 0.5 when either is unknown.
    [[nodiscard]] static double duration_correlation(std::optional<double> a,
                                                     std::optional<double> b) noexcept;

private:
    CascadeConfig config_;
};

// ─── Profiles, insights and alerts ────────────────────────────────────────────

/// Cascade behaviour of one entity summarised over a set of records.
struct CascadeProfile {
    EntityId entity_id = 0;

    std::size_t triggered_count = 0;  ///< Records with this entity as trigger
    std::size_t received_count  = 0;  ///< Records with this entity as target

    double influence           = 0.0;  ///< Mean strength as trigger
    double susceptibility      = 0.0;  ///< Mean strength as target
    double cascade_probability = 0.0;  ///< triggered / openings, ∈ [0, 1]
    double immediate_share     = 0.0;  ///< Share of triggered that are Immediate

    std::optional<EntityId> primary_target;
    std::string             primary_target_label;
    std::size_t             primary_target_count = 0;
    double                  mean_delay_to_primary_target = 0.0;

    std::optional<EntityId> primary_trigger;
    std::string             primary_trigger_label;
    std::size_t             primary_trigger_count = 0;
};

/// An expected cascade opening in the near future.
struct CascadeAlert {
    EntityId           trigger_entity_id = 0;
    std::string        trigger_label;
    EntityId           target_entity_id = 0;
    std::string        target_label;
    Timestamp          expected_time{};
    double             probability   = 0.0;  ///< Mean strength of the relationship
    double             minutes_until = 0.0;
    CascadeTimingClass timing_class  = CascadeTimingClass::Delayed;

    /// "Now", "1 minute" or "N minutes".
    [[nodiscard]] std::string time_until_text() const;
    /// "Low", "Moderate", "High" or "Very High".
    [[nodiscard]] std::string probability_text() const;
};

class CascadeAnalysis {
public:
    CascadeAnalysis() = delete;

    /// Summarise `entity`'s role in `cascades`. The opening count used for
    /// `cascade_probability` is the sum of the entity's analytics buckets.
    [[nodiscard]] static CascadeProfile
    summarize(EntityId entity,
              std::span<const CascadeRecord> cascades,
              std::span<const AnalyticsRecord> analytics) noexcept;

    /// Human-readable observations about `entity`'s cascade behaviour.
    [[nodiscard]] static std::vector<std::string>
    insights(EntityId entity, std::span<const CascadeRecord> cascades);

    /// Alerts for target openings expected within `lead_minutes` of `now`,
    /// derived from closed events that opened within the last
    /// `window.max_minutes`. Sorted by expected time.
    [[nodiscard]] static std::vector<CascadeAlert>
    alerts(std::span<const Event> recent_events,
           std::span<const CascadeRecord> cascades,
           Timestamp now,
           const CascadeWindow& window = CascadeWindow{},
           double lead_minutes = constants::CASCADE_ALERT_LEAD_MINUTES);
};

}  // namespace bridget::cascade
