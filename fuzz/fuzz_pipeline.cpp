/**
 * @file  fuzz_pipeline.cpp
 * @brief libFuzzer target for the full Engine pipeline (end-to-end)
 *
 * Build:
 *   cmake -DBRIDGET_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_pipeline
 *
 * Run for 60 seconds:
 *   ./fuzz_pipeline -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Analytics: probability and confidence ∈ [0, 1], duration ≥ 0.
 *   3. Cascades: trigger ≠ target, delay inside the window, strength ∈ [0, 1].
 *   4. Forecasts: probability and confidence ∈ [0, 1], finite duration ≥ 0,
 *      fitted tier never above the requested tier.
 *
 * Fuzzer strategy:
 *   Byte 0 selects the compute tier (any value, so out-of-range tiers are
 *   exercised too). Every following 6-byte record decodes to one event:
 *     [0]    entity id (mod 6)
 *     [1..2] open offset in minutes from a fixed base (little-endian)
 *     [3]    signed reported duration in minutes (negative → malformed)
 *     [4]    flags: bit 0 closed, bit 1 report duration, bit 2 close before open
 *     [5]    latitude jitter
 */

#include <cassert>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <vector>

#include "bridget/data_loader.hpp"
#include "bridget/engine.hpp"

using namespace bridget;
using namespace bridget::core;
using namespace std::chrono;

namespace {

constexpr std::size_t RECORD_SIZE = 6;

const Timestamp BASE = sys_days{2025y / May / 5};

Event decode(const uint8_t* r) {
    Event e;
    e.entity_id    = static_cast<EntityId>(r[0] % 6);
    e.entity_label = "fuzz";
    e.open_time    = BASE + minutes{static_cast<int>(r[1]) | (static_cast<int>(r[2]) << 8)};

    const int duration = static_cast<int8_t>(r[3]);
    if (r[4] & 0x1) {
        const int signed_close = (r[4] & 0x4) ? -std::abs(duration) : std::abs(duration);
        e.close_time = e.open_time + minutes{signed_close};
    }
    if (r[4] & 0x2) e.minutes_open = static_cast<double>(duration);

    e.latitude  = 47.60 + 0.0005 * static_cast<double>(r[5]);
    e.longitude = -122.33;
    return e;
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0) return 0;

    Snapshot snap;
    snap.tier = static_cast<ComputeTier>(data[0]);
    for (std::size_t off = 1; off + RECORD_SIZE <= size; off += RECORD_SIZE) {
        snap.events.push_back(decode(data + off));
    }
    snap.locations = DataLoader::locations_from_events(snap.events);
    snap.now       = BASE + minutes{65536};

    const Engine engine;
    const auto result = engine.run(snap);
    assert(!result.cancelled);
    assert(result.events_used == snap.events.size());

    // Invariant 2
    for (const auto& a : result.analytics) {
        assert(a.probability_of_opening >= 0.0 && a.probability_of_opening <= 1.0);
        assert(a.confidence >= 0.0 && a.confidence <= 1.0);
        assert(a.expected_duration >= 0.0);
    }

    // Invariant 3
    const auto& window = engine.config().cascade.window;
    for (const auto& c : result.cascades) {
        assert(c.trigger_entity_id != c.target_entity_id);
        assert(window.contains(c.delay_minutes));
        assert(c.strength >= 0.0 && c.strength <= 1.0);
    }

    // Invariant 4
    const auto requested = normalize_tier(snap.tier);
    for (const auto& f : result.forecasts) {
        assert(f.probability >= 0.0 && f.probability <= 1.0);
        assert(f.confidence >= 0.0 && f.confidence <= 1.0);
        assert(std::isfinite(f.expected_duration_minutes));
        assert(f.expected_duration_minutes >= 0.0);
        assert(f.requested_tier == requested);
        assert(static_cast<int>(f.model_tier) <= static_cast<int>(requested));
    }

    return 0;
}
