/**
 * @file  bench/bench_pipeline.cpp
 * @brief Google Benchmark suite for the Bridget analytics pipeline.
 *
 * Benchmarks
 * ----------
 *   BM_Aggregate          : AnalyticsAggregator over N events
 *   BM_CascadeDetect      : CascadeEngine over N events and 8 entities
 *   BM_Forecast/<tier>    : PredictionEngine for one entity, per tier
 *   BM_EngineRun          : full synchronous pipeline
 *   BM_Fingerprint        : snapshot hashing used by the result cache
 *
 * Build (CMake):
 *   cmake -DBRIDGET_BENCH=ON ..
 *   cmake --build build --target bench_pipeline
 *   ./build/bench_pipeline --benchmark_format=json
 *
 * Throughput units: items/second (events processed).
 */

#include "benchmark/benchmark.h"

#include "bridget/analytics.hpp"
#include "bridget/cascade.hpp"
#include "bridget/engine.hpp"
#include "bridget/prediction.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

using namespace std::chrono;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static const bridget::Timestamp BASE = sys_days{2025y / January / 6};

/// Eight entities spaced ~1.1 km apart along a meridian.
static std::vector<bridget::EntityLocation> make_locations() {
    std::vector<bridget::EntityLocation> locs;
    for (bridget::EntityId id = 1; id <= 8; ++id) {
        locs.push_back({id, 47.60 + 0.01 * static_cast<double>(id), -122.33});
    }
    return locs;
}

/// N openings spread over eight entities at an average of one every
/// 20 minutes, with fixed seed so every run measures identical work.
static std::vector<bridget::Event> make_events(std::size_t n) {
    std::mt19937_64 rng(42);
    std::uniform_int_distribution<int> entity(1, 8);
    std::uniform_int_distribution<int> gap(1, 40);
    std::uniform_int_distribution<int> duration(3, 25);

    std::vector<bridget::Event> events;
    events.reserve(n);
    bridget::Timestamp t = BASE;
    for (std::size_t i = 0; i < n; ++i) {
        t += minutes{gap(rng)};
        bridget::Event e;
        e.entity_id    = entity(rng);
        e.entity_label = "bridge";
        e.open_time    = t;
        const int d    = duration(rng);
        e.close_time   = t + minutes{d};
        e.minutes_open = static_cast<double>(d);
        e.latitude     = 47.60 + 0.01 * static_cast<double>(e.entity_id);
        e.longitude    = -122.33;
        events.push_back(std::move(e));
    }
    return events;
}

static void set_throughput(benchmark::State& state, std::size_t n) {
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

// ── Analytics ──────────────────────────────────────────────────────────────────

static void BM_Aggregate(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto events = make_events(n);
    const bridget::analytics::AnalyticsAggregator aggregator;
    for (auto _ : state) {
        auto records = aggregator.aggregate(events);
        benchmark::DoNotOptimize(records.data());
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Aggregate)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

// ── Cascades ───────────────────────────────────────────────────────────────────

static void BM_CascadeDetect(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto events = make_events(n);
    const auto locs   = make_locations();
    const bridget::cascade::CascadeEngine engine;
    for (auto _ : state) {
        auto cascades = engine.detect(events, locs);
        benchmark::DoNotOptimize(cascades.data());
    }
    set_throughput(state, n);
    state.counters["cascades"] = static_cast<double>(engine.detect(events, locs).size());
}
BENCHMARK(BM_CascadeDetect)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

// ── Prediction ─────────────────────────────────────────────────────────────────

static void BM_Forecast(benchmark::State& state) {
    const auto tier   = static_cast<bridget::ComputeTier>(state.range(0));
    const auto events = make_events(4096);
    const auto now    = events.back().open_time + minutes{10};
    const bridget::prediction::PredictionEngine engine;
    for (auto _ : state) {
        auto f = engine.forecast(1, events, {}, {}, tier, now);
        benchmark::DoNotOptimize(f);
    }
    state.SetLabel(bridget::to_string(tier));
}
BENCHMARK(BM_Forecast)->DenseRange(0, 3)->Unit(benchmark::kMicrosecond);

// ── Full pipeline ──────────────────────────────────────────────────────────────

static void BM_EngineRun(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    bridget::core::Snapshot snap;
    snap.events    = make_events(n);
    snap.locations = make_locations();
    snap.tier      = bridget::ComputeTier::Advanced;
    snap.now       = snap.events.back().open_time + minutes{10};

    const bridget::core::Engine engine;
    for (auto _ : state) {
        auto result = engine.run(snap);
        benchmark::DoNotOptimize(result.forecasts.data());
    }
    set_throughput(state, n);
}
BENCHMARK(BM_EngineRun)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMillisecond);

static void BM_Fingerprint(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    bridget::core::Snapshot snap;
    snap.events    = make_events(n);
    snap.locations = make_locations();
    for (auto _ : state) {
        benchmark::DoNotOptimize(bridget::core::Engine::fingerprint(snap));
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Fingerprint)->RangeMultiplier(8)->Range(512, 262144)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
