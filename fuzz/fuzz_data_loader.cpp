/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the CSV event and location parsers
 *
 * Build:
 *   cmake -DBRIDGET_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parsed event has valid coordinates and a finite or absent
 *      reported duration.
 *   3. Every parsed location has valid coordinates.
 *   4. locations_from_events yields one location per distinct entity,
 *      ordered by id.
 *
 * Fuzzer strategy:
 *   Input is passed directly as std::string_view to both parsers. They must
 *   handle binary garbage, unbalanced quotes, CR/LF mixes, empty fields,
 *   "NaN"/"inf" tokens, and timestamps of every shape.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string_view>

#include "bridget/data_loader.hpp"

using namespace bridget;
using namespace bridget::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto events = DataLoader::parse_events_csv(input);
    std::set<EntityId> ids;
    for (const auto& e : events) {
        // Invariant 2
        assert(DataLoader::valid_coordinates(e.latitude, e.longitude));
        if (e.minutes_open) assert(std::isfinite(*e.minutes_open));
        ids.insert(e.entity_id);
    }

    // Invariant 3
    for (const auto& l : DataLoader::parse_locations_csv(input)) {
        assert(DataLoader::valid_coordinates(l.latitude, l.longitude));
    }

    // Invariant 4
    const auto locs = DataLoader::locations_from_events(events);
    assert(locs.size() == ids.size());
    for (std::size_t i = 1; i < locs.size(); ++i) {
        assert(locs[i - 1].entity_id < locs[i].entity_id);
    }

    return 0;
}
