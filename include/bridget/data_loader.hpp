#pragma once

/// @file include/bridget/data_loader.hpp
/// @brief CSV loader for opening events and entity locations.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse host-exported CSV snapshots into `Event` and `EntityLocation`
/// vectors for the CLI harness, tests and benchmarks. The analytics core
/// itself never touches files.
///
/// ## Expected CSV Formats
/// ```
/// entity_id,entity_label,open_time,close_time,minutes_open,latitude,longitude
/// 1,Ballard,2025-06-02T07:15:00Z,2025-06-02T07:27:00Z,12,47.6590,-122.3764
/// 2,Fremont,2025-06-02T07:55:00Z,,,47.6476,-122.3497
/// ```
/// ```
/// entity_id,latitude,longitude
/// 1,47.6590,-122.3764
/// ```
/// Times are ISO-8601 UTC or epoch seconds. An empty `close_time` marks a
/// still-open event; an empty `minutes_open` is derived from the close time.
/// Labels may be double-quoted. The first non-comment line is the header.
///
/// ## Guarantees
/// - Never throws; `load_*` return `nullopt` only if the file cannot be read
/// - Skips individual bad rows rather than failing the entire load
/// - Keeps rows with inconsistent durations; the core filters those itself

#include "bridget/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bridget::core {

class DataLoader {
public:
    /// Load events from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Parsed events otherwise, skipping malformed rows
    [[nodiscard]] static std::optional<std::vector<Event>>
    load_events_csv(const std::string& filepath) noexcept;

    /// Parse events from CSV text (same format as `load_events_csv`).
    [[nodiscard]] static std::vector<Event>
    parse_events_csv(std::string_view csv_content) noexcept;

    /// Load entity locations from a CSV file on disk.
    [[nodiscard]] static std::optional<std::vector<EntityLocation>>
    load_locations_csv(const std::string& filepath) noexcept;

    /// Parse entity locations from CSV text.
    [[nodiscard]] static std::vector<EntityLocation>
    parse_locations_csv(std::string_view csv_content) noexcept;

    /// First coordinate seen for each entity, ordered by entity id.
    [[nodiscard]] static std::vector<EntityLocation>
    locations_from_events(const std::vector<Event>& events) noexcept;

    /// Latitude in [−90, 90] and longitude in [−180, 180], both finite.
    [[nodiscard]] static bool valid_coordinates(double latitude, double longitude) noexcept;

private:
    [[nodiscard]] static std::optional<Event> parse_event_row(std::string_view line) noexcept;
    [[nodiscard]] static std::optional<EntityLocation>
    parse_location_row(std::string_view line) noexcept;
};

}  // namespace bridget::core
