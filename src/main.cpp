/// @file src/main.cpp
/// @brief Bridget CLI harness.
///
/// Usage:
///   bridget <events.csv> [options]    Run the analytics pipeline on a snapshot
///   bridget --help                    Print usage
///
/// The analytics core has no I/O of its own; this harness stands in for a
/// host application by loading CSV snapshots and printing the results.

#include "bridget/analytics.hpp"
#include "bridget/calendar.hpp"
#include "bridget/cascade.hpp"
#include "bridget/data_loader.hpp"
#include "bridget/engine.hpp"

#include <fmt/core.h>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  bridget <events.csv> [options]\n"
        "  bridget --help\n"
        "\n"
        "Options:\n"
        "  --analytics            Print per-bucket analytics records\n"
        "  --cascades             Print detected cascade records\n"
        "  --forecast <id>        Forecast only this entity (repeatable)\n"
        "  --insights <id>        Print seasonal and cascade insights for an entity\n"
        "  --alerts               Print cascade alerts expected soon after --now\n"
        "  --severity             Print impact levels of closed events\n"
        "  --trends               Print daily/weekly trends and opening streaks\n"
        "  --tier <name>          minimal | standard | advanced | expert (default standard)\n"
        "  --now <time>           Forecast time, ISO-8601 UTC or epoch seconds\n"
        "                         (default: latest opening in the file)\n"
        "  --locations <csv>      Entity locations (default: taken from events)\n"
        "  --max-events <n>       Keep only the n most recent events\n"
        "  --utc-offset <min>     Local calendar offset for bucketing (e.g. -420)\n"
        "  --verbose              Diagnostics on stderr\n"
        "\n"
        "Events CSV (header required):\n"
        "  entity_id,entity_label,open_time,close_time,minutes_open,latitude,longitude\n"
        "Locations CSV (header required):\n"
        "  entity_id,latitude,longitude\n"
    );
}

struct CliOptions {
    std::string                events_path;
    std::optional<std::string> locations_path;
    std::vector<bridget::EntityId> forecast_ids;
    std::vector<bridget::EntityId> insight_ids;
    bridget::ComputeTier       tier = bridget::ComputeTier::Standard;
    std::optional<bridget::Timestamp> now;
    std::size_t                max_events = 0;
    int                        utc_offset_minutes = 0;
    bool show_analytics = false;
    bool show_cascades  = false;
    bool show_alerts    = false;
    bool show_severity  = false;
    bool show_trends    = false;
    bool verbose        = false;
};

template <typename Int>
[[nodiscard]] std::optional<Int> parse_integer(std::string_view text) noexcept {
    Int value{};
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (text.empty() || ec != std::errc{} || ptr != last) return std::nullopt;
    return value;
}

/// Parse argv into options. Prints the reason and returns nullopt on error.
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);

        const auto value = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} requires a value\n", arg);
                return std::nullopt;
            }
            return std::string_view(argv[++i]);
        };

        if (arg == "--analytics") {
            opts.show_analytics = true;
        } else if (arg == "--cascades") {
            opts.show_cascades = true;
        } else if (arg == "--alerts") {
            opts.show_alerts = true;
        } else if (arg == "--severity") {
            opts.show_severity = true;
        } else if (arg == "--trends") {
            opts.show_trends = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--forecast" || arg == "--insights") {
            const auto v = value();
            if (!v) return std::nullopt;
            const auto id = parse_integer<bridget::EntityId>(*v);
            if (!id) {
                fmt::print(stderr, "Error: invalid entity id '{}'\n", *v);
                return std::nullopt;
            }
            (arg == "--forecast" ? opts.forecast_ids : opts.insight_ids).push_back(*id);
        } else if (arg == "--tier") {
            const auto v = value();
            if (!v) return std::nullopt;
            const auto tier = bridget::parse_tier(std::string(*v));
            if (!tier) {
                fmt::print(stderr, "Error: unknown tier '{}'\n", *v);
                return std::nullopt;
            }
            opts.tier = *tier;
        } else if (arg == "--now") {
            const auto v = value();
            if (!v) return std::nullopt;
            opts.now = bridget::parse_timestamp(*v);
            if (!opts.now) {
                fmt::print(stderr, "Error: invalid time '{}'\n", *v);
                return std::nullopt;
            }
        } else if (arg == "--locations") {
            const auto v = value();
            if (!v) return std::nullopt;
            opts.locations_path = std::string(*v);
        } else if (arg == "--max-events") {
            const auto v = value();
            if (!v) return std::nullopt;
            const auto n = parse_integer<std::size_t>(*v);
            if (!n) {
                fmt::print(stderr, "Error: invalid event count '{}'\n", *v);
                return std::nullopt;
            }
            opts.max_events = *n;
        } else if (arg == "--utc-offset") {
            const auto v = value();
            if (!v) return std::nullopt;
            const auto m = parse_integer<int>(*v);
            if (!m || *m < -24 * 60 || *m > 24 * 60) {
                fmt::print(stderr, "Error: invalid UTC offset '{}'\n", *v);
                return std::nullopt;
            }
            opts.utc_offset_minutes = *m;
        } else if (!arg.empty() && arg.front() == '-') {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            return std::nullopt;
        } else if (opts.events_path.empty()) {
            opts.events_path = std::string(arg);
        } else {
            fmt::print(stderr, "Error: unexpected argument '{}'\n", arg);
            return std::nullopt;
        }
    }

    if (opts.events_path.empty()) {
        fmt::print(stderr, "Error: an events CSV file is required\n");
        return std::nullopt;
    }
    return opts;
}

void print_analytics(const std::vector<bridget::AnalyticsRecord>& records) {
    fmt::print("\n== Analytics ({} buckets) ==\n", records.size());
    for (const auto& r : records) {
        fmt::print("{:>6} {:<20} {:04}-{:02} {:<9} {:02}:00  n={:<4} avg={:6.1f} min  "
                   "p={:.3f}  conf={:.2f}{}{}{}\n",
                   r.entity_id, r.entity_label, r.year, r.month,
                   bridget::weekday_name(r.day_of_week), r.hour,
                   r.opening_count, r.average_minutes_per_opening,
                   r.probability_of_opening, r.confidence,
                   r.is_weekend ? " weekend" : "", r.is_rush_hour ? " rush" : "",
                   r.is_summer ? " summer" : "");
    }
}

void print_cascades(const std::vector<bridget::CascadeRecord>& cascades) {
    fmt::print("\n== Cascades ({}) ==\n", cascades.size());
    for (const auto& c : cascades) {
        fmt::print("{} {} -> {} +{:.0f} min  {:.2f} km  strength={:.3f} ({}, {})",
                   bridget::format_timestamp(c.trigger_time), c.trigger_label, c.target_label,
                   c.delay_minutes, c.distance_km, c.strength,
                   bridget::to_string(c.strength_class), bridget::to_string(c.timing_class));
        if (c.confidence) fmt::print("  conf={:.2f}", *c.confidence);
        fmt::print("\n");
    }
}

void print_forecasts(const std::vector<bridget::Forecast>& forecasts) {
    fmt::print("\n== Forecasts ({}) ==\n", forecasts.size());
    for (const auto& f : forecasts) {
        fmt::print("{:>6} {:<20} P={:.3f} ({})  duration {}  {} ({:.2f})  [{}]\n",
                   f.entity_id, f.entity_label, f.probability, f.probability_text(),
                   f.duration_text(), f.confidence_text(), f.confidence,
                   bridget::to_string(f.model_tier));
        fmt::print("       {}\n", f.rationale);
    }
}

void print_insights(bridget::EntityId id, const bridget::core::PipelineResult& result) {
    using bridget::analytics::SeasonalDecomposition;
    using bridget::cascade::CascadeAnalysis;

    const auto profile = CascadeAnalysis::summarize(id, result.cascades, result.analytics);
    fmt::print("\n== Insights for entity {} ==\n", id);
    fmt::print("influence={:.3f} susceptibility={:.3f} cascade probability={:.3f}\n",
               profile.influence, profile.susceptibility, profile.cascade_probability);

    for (const auto& line : SeasonalDecomposition::insights(id, result.analytics)) {
        fmt::print("  - {}\n", line);
    }
    for (const auto& line : CascadeAnalysis::insights(id, result.cascades)) {
        fmt::print("  - {}\n", line);
    }
}

void print_severity(const std::vector<bridget::Event>& events, std::chrono::minutes utc_offset) {
    const auto graded = bridget::analytics::classify_severity(events, utc_offset);
    std::size_t counts[4] = {0, 0, 0, 0};
    for (const auto& s : graded) ++counts[static_cast<std::size_t>(s.level)];

    fmt::print("\n== Severity ({} closed events) ==\n", graded.size());
    for (std::size_t i = 0; i < 4; ++i) {
        fmt::print("  {:<9} {}\n",
                   bridget::analytics::to_string(static_cast<bridget::analytics::ImpactLevel>(i)),
                   counts[i]);
    }
}

void print_trends(const std::vector<bridget::Event>& events, bridget::Timestamp now,
                  std::chrono::minutes utc_offset) {
    using bridget::analytics::StreakAnalytics;
    using bridget::analytics::TrendCalculator;

    fmt::print("\n== Daily openings (last 7 days) ==\n");
    for (const auto& p : TrendCalculator::daily(events, now, 7, utc_offset)) {
        fmt::print("  {}  {:>4}  avg {:.1f} min\n", bridget::format_timestamp(p.date).substr(0, 10),
                   p.count, p.average_duration);
    }

    fmt::print("\n== Weekly openings ==\n");
    for (const auto& p : TrendCalculator::weekly(events, now, 4, utc_offset)) {
        fmt::print("  week of {}  {:>4}  avg {:.1f} min  {} entities\n",
                   bridget::format_timestamp(p.week_start).substr(0, 10), p.count,
                   p.average_duration, p.entity_count);
    }

    const auto openings = TrendCalculator::opening_count_trend(events, now);
    const auto entities = TrendCalculator::entity_count_trend(events, now);
    fmt::print("\nOpenings this week: {} ({:+d}, {:+.1f}%, {})\n", openings.current_value,
               openings.change, openings.change_percent, to_string(openings.direction));
    fmt::print("Active entities this week: {} ({:+d}, {})\n", entities.current_value,
               entities.change, to_string(entities.direction));

    if (const auto champion = StreakAnalytics::weekly_champion(events, now)) {
        fmt::print("Streak champion: {} quiet for {} ({}, confidence {:.2f})\n",
                   champion->entity_label.empty() ? fmt::format("#{}", champion->entity_id)
                                                  : champion->entity_label,
                   StreakAnalytics::format_hours(champion->streak_hours),
                   to_string(champion->standing), champion->confidence);
    } else {
        fmt::print("Streak champion: none this week\n");
    }
}

/// Load inputs, run the pipeline and print the requested sections.
/// Returns 0 on success, 1 on error.
int run(const CliOptions& opts) {
    using namespace bridget;

    auto events = core::DataLoader::load_events_csv(opts.events_path);
    if (!events) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", opts.events_path);
        return 1;
    }
    if (events->empty()) {
        fmt::print(stderr, "Error: no valid events loaded from '{}'\n", opts.events_path);
        return 1;
    }
    fmt::print("Loaded {} events from '{}'\n", events->size(), opts.events_path);

    std::vector<EntityLocation> locations;
    if (opts.locations_path) {
        auto loaded = core::DataLoader::load_locations_csv(*opts.locations_path);
        if (!loaded) {
            fmt::print(stderr, "Error: cannot open file '{}'\n", *opts.locations_path);
            return 1;
        }
        locations = std::move(*loaded);
    } else {
        locations = core::DataLoader::locations_from_events(*events);
    }

    const std::chrono::minutes offset{opts.utc_offset_minutes};

    core::EngineConfig config;
    config.max_events            = opts.max_events;
    config.verbose               = opts.verbose;
    config.analytics.utc_offset  = offset;
    config.analytics.verbose     = opts.verbose;
    config.cascade.utc_offset    = offset;
    config.cascade.verbose       = opts.verbose;
    config.prediction.utc_offset = offset;
    config.prediction.verbose    = opts.verbose;

    core::Snapshot snapshot{
        .events            = *events,
        .locations         = std::move(locations),
        .tier              = opts.tier,
        .now               = opts.now,
        .forecast_entities = opts.forecast_ids,
    };

    core::Engine engine(config);
    const auto result = engine.run_async(snapshot).get();

    fmt::print("Snapshot at {} ({} events used, tier {})\n",
               format_timestamp(result.now), result.events_used, to_string(opts.tier));

    if (opts.show_analytics) print_analytics(result.analytics);
    if (opts.show_cascades)  print_cascades(result.cascades);
    print_forecasts(result.forecasts);

    for (EntityId id : opts.insight_ids) print_insights(id, result);

    if (opts.show_alerts) {
        const auto alerts = cascade::CascadeAnalysis::alerts(
            snapshot.events, result.cascades, result.now, config.cascade.window);
        fmt::print("\n== Cascade alerts ({}) ==\n", alerts.size());
        for (const auto& a : alerts) {
            fmt::print("{} -> {} in {} ({} likelihood, {})\n",
                       a.trigger_label, a.target_label, a.time_until_text(),
                       a.probability_text(), to_string(a.timing_class));
        }
    }

    if (opts.show_severity) print_severity(snapshot.events, offset);
    if (opts.show_trends)   print_trends(snapshot.events, result.now, offset);
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);
    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }
    return run(*opts);
}
