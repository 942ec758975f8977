#pragma once

/// @file include/bridget/engine.hpp
/// @brief Pipeline engine: aggregator → cascade engine → prediction engine.
///
/// # Module: Integration Engine
///
/// ## Responsibility
/// Run the three analytics components over one immutable snapshot of the
/// event log, the way a host application would wrap the core:
///
///   Snapshot → most-recent-N bound → AnalyticsAggregator
///            → CascadeEngine (with analytics confidence)
///            → PredictionEngine (one forecast per entity) → PipelineResult
///
/// ## Usage
/// ```cpp
/// Engine engine;
/// auto events = DataLoader::load_events_csv("openings.csv");
/// if (events) {
///     Snapshot snap{.events = *events,
///                   .locations = DataLoader::locations_from_events(*events),
///                   .tier = ComputeTier::Advanced,
///                   .now = std::chrono::time_point_cast<std::chrono::seconds>(
///                              std::chrono::system_clock::now())};
///     auto result = engine.run_async(std::move(snap)).get();
/// }
/// ```
///
/// ## Guarantees
/// - `run` is const, noexcept and deterministic for a given snapshot
/// - A snapshot without `now` is forecast at its latest opening
/// - `run_async` starts at most one computation per snapshot fingerprint;
///   concurrent callers with identical snapshots share one future. A cached
///   entry whose `SnapshotShape` differs from the request is replaced.
/// - A cached run that finished cancelled is evicted on the next lookup,
///   so a later identical request recomputes
/// - The engine must outlive the futures it hands out; its destructor waits
///   for any run still in flight

#include "bridget/analytics.hpp"
#include "bridget/cascade.hpp"
#include "bridget/prediction.hpp"
#include "bridget/types.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <unordered_map>
#include <vector>

namespace bridget::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

struct EngineConfig {
    analytics::AggregatorConfig  analytics{};
    cascade::CascadeConfig       cascade{};
    prediction::PredictionConfig prediction{};

    /// Keep only the N most recent events (by open time). 0 = unbounded.
    std::size_t max_events = 0;

    /// Completed or in-flight results kept by `run_async`.
    std::size_t cache_capacity = 16;

    /// Emit per-stage timings to stderr.
    bool verbose = false;
};

// ─── Snapshot / PipelineResult ────────────────────────────────────────────────

/// Immutable copy of the host's inputs for one pipeline run.
struct Snapshot {
    std::vector<Event>          events;
    std::vector<EntityLocation> locations;
    ComputeTier                 tier = ComputeTier::Standard;

    /// Forecast instant. Unset = latest open time among the events used.
    std::optional<Timestamp>    now;

    /// Entities to forecast. Empty = every entity present in `events`.
    std::vector<EntityId> forecast_entities;
};

struct PipelineResult {
    std::vector<AnalyticsRecord> analytics;
    std::vector<CascadeRecord>   cascades;
    std::vector<Forecast>        forecasts;

    std::size_t events_used = 0;      ///< After the most-recent-N bound
    Timestamp   now{};                ///< Forecast instant actually used
    bool        cancelled   = false;  ///< Stop was requested mid-run
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig{});
    ~Engine();

    Engine(const Engine&)            = delete;
    Engine& operator=(const Engine&) = delete;

    /// Run the full pipeline synchronously.
    [[nodiscard]] PipelineResult
    run(const Snapshot& snapshot, std::stop_token stop = {}) const noexcept;

    /// Run on a worker thread, sharing the future with any identical
    /// request already in flight or cached.
    [[nodiscard]] std::shared_future<PipelineResult>
    run_async(Snapshot snapshot, std::stop_token stop = {});

    /// FNV-1a hash of every field of `snapshot`.
    [[nodiscard]] static std::uint64_t fingerprint(const Snapshot& snapshot) noexcept;

    /// The `max_events` events with the latest open times, in input order.
    /// Returns all events when `max_events` is 0 or not exceeded.
    [[nodiscard]] static std::vector<Event>
    most_recent(std::span<const Event> events, std::size_t max_events);

    /// Latest open time in `events`, `nullopt` if empty.
    [[nodiscard]] static std::optional<Timestamp>
    latest_open_time(std::span<const Event> events) noexcept;

    /// Cheap summary stored beside each cached result and compared on every
    /// hit, so that two different snapshots whose fingerprints collide get
    /// separate computations instead of sharing one.
    struct SnapshotShape {
        std::size_t              events            = 0;
        std::size_t              locations         = 0;
        std::size_t              forecast_entities = 0;
        ComputeTier              tier              = ComputeTier::Standard;
        std::optional<Timestamp> now;
        std::optional<Timestamp> first_open;
        std::optional<Timestamp> last_open;
        EntityId                 first_entity = 0;
        EntityId                 last_entity  = 0;

        bool operator==(const SnapshotShape&) const = default;

        [[nodiscard]] static SnapshotShape of(const Snapshot& snapshot) noexcept;
    };

    [[nodiscard]] std::size_t cache_size() const;
    void clear_cache();

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    using SharedResult = std::shared_future<PipelineResult>;

    struct CacheEntry {
        SharedResult  result;
        SnapshotShape shape;
    };

    EngineConfig                     config_;
    analytics::AnalyticsAggregator   aggregator_;
    cascade::CascadeEngine           cascade_engine_;
    prediction::PredictionEngine     predictor_;

    mutable std::mutex                              mutex_;
    std::unordered_map<std::uint64_t, CacheEntry> cache_;
    std::deque<std::uint64_t>                     insertion_order_;
};

}  // namespace bridget::core
