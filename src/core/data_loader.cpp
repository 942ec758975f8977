/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for opening events and entity locations.

#include "bridget/data_loader.hpp"
#include "bridget/calendar.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#include <map>
#include <sstream>
#include <type_traits>

namespace bridget::core {

namespace {

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/// Split a CSV line on commas. A field wrapped in double quotes may contain
/// commas; a doubled quote inside it is an escaped quote.
[[nodiscard]] std::vector<std::string> split_fields(std::string_view line) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                current += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                current += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(std::move(current));

    for (auto& f : fields) f = std::string(trim(f));
    return fields;
}

template <typename Number>
[[nodiscard]] std::optional<Number> parse_number(std::string_view text) noexcept {
    text = trim(text);
    if (text.empty()) return std::nullopt;
    if (text.front() == '+') text.remove_prefix(1);

    Number value{};
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    if constexpr (std::is_floating_point_v<Number>) {
        if (!std::isfinite(value)) return std::nullopt;
    }
    return value;
}

/// Call `on_row` for every data line after the header.
template <typename OnRow>
void for_each_data_line(std::string_view csv_content, OnRow on_row) {
    bool header_skipped = false;
    std::size_t pos = 0;

    while (pos <= csv_content.size()) {
        auto end = csv_content.find('\n', pos);
        if (end == std::string_view::npos) end = csv_content.size();
        std::string_view line = csv_content.substr(pos, end - pos);
        pos = end + 1;

        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        const auto content = trim(line);
        if (content.empty() || content.front() == '#') continue;

        // First non-empty, non-comment line is the header.
        if (!header_skipped) {
            header_skipped = true;
            continue;
        }
        on_row(content);
    }
}

[[nodiscard]] std::optional<std::string> read_file(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) return std::nullopt;

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) return std::nullopt;
    return contents.str();
}

}  // namespace

// ─── Validation ───────────────────────────────────────────────────────────────

bool DataLoader::valid_coordinates(double latitude, double longitude) noexcept {
    return std::isfinite(latitude) && std::isfinite(longitude) &&
           latitude >= -90.0 && latitude <= 90.0 &&
           longitude >= -180.0 && longitude <= 180.0;
}

// ─── Events ───────────────────────────────────────────────────────────────────

std::optional<Event> DataLoader::parse_event_row(std::string_view line) noexcept {
    const auto f = split_fields(line);
    if (f.size() != 7) return std::nullopt;

    const auto id   = parse_number<EntityId>(f[0]);
    const auto open = parse_timestamp(f[2]);
    const auto lat  = parse_number<double>(f[5]);
    const auto lon  = parse_number<double>(f[6]);
    if (!id || !open || !lat || !lon) return std::nullopt;
    if (!valid_coordinates(*lat, *lon)) return std::nullopt;

    Event e;
    e.entity_id    = *id;
    e.entity_label = f[1];
    e.open_time    = *open;
    e.latitude     = *lat;
    e.longitude    = *lon;

    if (!f[3].empty()) {
        const auto close = parse_timestamp(f[3]);
        if (!close) return std::nullopt;
        e.close_time = *close;
    }
    if (!f[4].empty()) {
        const auto minutes = parse_number<double>(f[4]);
        if (!minutes) return std::nullopt;
        e.minutes_open = *minutes;
    }
    return e;
}

std::vector<Event> DataLoader::parse_events_csv(std::string_view csv_content) noexcept {
    std::vector<Event> events;
    for_each_data_line(csv_content, [&](std::string_view line) {
        if (auto e = parse_event_row(line)) events.push_back(std::move(*e));
    });
    return events;
}

std::optional<std::vector<Event>>
DataLoader::load_events_csv(const std::string& filepath) noexcept {
    const auto contents = read_file(filepath);
    if (!contents) return std::nullopt;
    return parse_events_csv(*contents);
}

// ─── Locations ────────────────────────────────────────────────────────────────

std::optional<EntityLocation> DataLoader::parse_location_row(std::string_view line) noexcept {
    const auto f = split_fields(line);
    if (f.size() != 3) return std::nullopt;

    const auto id  = parse_number<EntityId>(f[0]);
    const auto lat = parse_number<double>(f[1]);
    const auto lon = parse_number<double>(f[2]);
    if (!id || !lat || !lon || !valid_coordinates(*lat, *lon)) return std::nullopt;

    return EntityLocation{.entity_id = *id, .latitude = *lat, .longitude = *lon};
}

std::vector<EntityLocation>
DataLoader::parse_locations_csv(std::string_view csv_content) noexcept {
    std::vector<EntityLocation> locations;
    for_each_data_line(csv_content, [&](std::string_view line) {
        if (auto loc = parse_location_row(line)) locations.push_back(*loc);
    });
    return locations;
}

std::optional<std::vector<EntityLocation>>
DataLoader::load_locations_csv(const std::string& filepath) noexcept {
    const auto contents = read_file(filepath);
    if (!contents) return std::nullopt;
    return parse_locations_csv(*contents);
}

std::vector<EntityLocation>
DataLoader::locations_from_events(const std::vector<Event>& events) noexcept {
    std::map<EntityId, EntityLocation> first_seen;
    for (const auto& e : events) {
        if (!valid_coordinates(e.latitude, e.longitude)) continue;
        first_seen.try_emplace(e.entity_id, EntityLocation{
            .entity_id = e.entity_id,
            .latitude  = e.latitude,
            .longitude = e.longitude,
        });
    }

    std::vector<EntityLocation> out;
    out.reserve(first_seen.size());
    for (const auto& [_, loc] : first_seen) out.push_back(loc);
    return out;
}

}  // namespace bridget::core
