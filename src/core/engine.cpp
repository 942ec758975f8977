/// @file src/core/engine.cpp
/// @brief Pipeline engine and fingerprint-keyed result cache.

#include "bridget/engine.hpp"
#include "bridget/calendar.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <bit>
#include <chrono>
#include <numeric>
#include <set>
#include <string_view>

namespace bridget::core {

namespace {

/// 64-bit FNV-1a accumulator.
class Fnv1a {
public:
    void bytes(const void* data, std::size_t n) noexcept {
        const auto* p = static_cast<const unsigned char*>(data);
        for (std::size_t i = 0; i < n; ++i) {
            hash_ ^= p[i];
            hash_ *= PRIME;
        }
    }

    void u64(std::uint64_t v) noexcept { bytes(&v, sizeof v); }
    void i64(std::int64_t v) noexcept { u64(static_cast<std::uint64_t>(v)); }
    void f64(double v) noexcept { u64(std::bit_cast<std::uint64_t>(v)); }

    void str(std::string_view s) noexcept {
        u64(s.size());
        bytes(s.data(), s.size());
    }

    [[nodiscard]] std::uint64_t value() const noexcept { return hash_; }

private:
    static constexpr std::uint64_t OFFSET = 14695981039346656037ULL;
    static constexpr std::uint64_t PRIME  = 1099511628211ULL;

    std::uint64_t hash_ = OFFSET;
};

[[nodiscard]] double elapsed_ms(std::chrono::steady_clock::time_point since) noexcept {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - since).count();
}

[[nodiscard]] PipelineResult cancelled_result(std::size_t events_used, Timestamp now) noexcept {
    PipelineResult r;
    r.events_used = events_used;
    r.now         = now;
    r.cancelled   = true;
    return r;
}

}  // namespace

// ─── Engine constructor / destructor ──────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
    , aggregator_(config_.analytics)
    , cascade_engine_(config_.cascade)
    , predictor_(config_.prediction)
{}

Engine::~Engine() {
    std::vector<SharedResult> pending;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [_, entry] : cache_) pending.push_back(entry.result);
    }
    for (const auto& f : pending) {
        if (f.valid()) f.wait();
    }
}

// ─── Engine::most_recent ──────────────────────────────────────────────────────

std::vector<Event>
Engine::most_recent(std::span<const Event> events, std::size_t max_events) {
    if (max_events == 0 || events.size() <= max_events) {
        return {events.begin(), events.end()};
    }

    std::vector<std::size_t> idx(events.size());
    std::iota(idx.begin(), idx.end(), std::size_t{0});

    // Latest first; ties keep the later input position.
    std::stable_sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) {
        if (events[a].open_time != events[b].open_time) {
            return events[a].open_time > events[b].open_time;
        }
        return a > b;
    });
    idx.resize(max_events);
    std::sort(idx.begin(), idx.end());

    std::vector<Event> out;
    out.reserve(max_events);
    for (std::size_t i : idx) out.push_back(events[i]);
    return out;
}

std::optional<Timestamp> Engine::latest_open_time(std::span<const Event> events) noexcept {
    if (events.empty()) return std::nullopt;
    const auto it = std::max_element(events.begin(), events.end(),
                                     [](const Event& a, const Event& b) {
                                         return a.open_time < b.open_time;
                                     });
    return it->open_time;
}

// ─── Engine::fingerprint ──────────────────────────────────────────────────────

std::uint64_t Engine::fingerprint(const Snapshot& snapshot) noexcept {
    Fnv1a h;

    h.u64(snapshot.events.size());
    for (const auto& e : snapshot.events) {
        h.i64(e.entity_id);
        h.str(e.entity_label);
        h.i64(e.open_time.time_since_epoch().count());
        h.u64(e.close_time.has_value());
        if (e.close_time) h.i64(e.close_time->time_since_epoch().count());
        h.u64(e.minutes_open.has_value());
        if (e.minutes_open) h.f64(*e.minutes_open);
        h.f64(e.latitude);
        h.f64(e.longitude);
    }

    h.u64(snapshot.locations.size());
    for (const auto& l : snapshot.locations) {
        h.i64(l.entity_id);
        h.f64(l.latitude);
        h.f64(l.longitude);
    }

    h.i64(static_cast<std::int64_t>(snapshot.tier));
    h.u64(snapshot.now.has_value());
    if (snapshot.now) h.i64(snapshot.now->time_since_epoch().count());

    h.u64(snapshot.forecast_entities.size());
    for (EntityId id : snapshot.forecast_entities) h.i64(id);

    return h.value();
}

Engine::SnapshotShape Engine::SnapshotShape::of(const Snapshot& snapshot) noexcept {
    SnapshotShape shape;
    shape.events            = snapshot.events.size();
    shape.locations         = snapshot.locations.size();
    shape.forecast_entities = snapshot.forecast_entities.size();
    shape.tier              = snapshot.tier;
    shape.now               = snapshot.now;
    if (!snapshot.events.empty()) {
        shape.first_open   = snapshot.events.front().open_time;
        shape.last_open    = snapshot.events.back().open_time;
        shape.first_entity = snapshot.events.front().entity_id;
        shape.last_entity  = snapshot.events.back().entity_id;
    }
    return shape;
}

// ─── Engine::run ──────────────────────────────────────────────────────────────

PipelineResult Engine::run(const Snapshot& snapshot, std::stop_token stop) const noexcept {
    const auto started = std::chrono::steady_clock::now();

    PipelineResult result;
    const auto events  = most_recent(snapshot.events, config_.max_events);
    result.events_used = events.size();

    const Timestamp now = snapshot.now ? *snapshot.now
                                       : latest_open_time(events).value_or(Timestamp{});
    result.now = now;
    if (!snapshot.now && config_.verbose) {
        fmt::print(stderr, "[engine] no forecast time given; using latest opening {}\n",
                   format_timestamp(now));
    }

    // ── Stage 1: analytics ────────────────────────────────────────────────────
    result.analytics = aggregator_.aggregate(events, stop);
    if (stop.stop_requested()) return cancelled_result(events.size(), now);
    const double t_analytics = elapsed_ms(started);

    // ── Stage 2: cascades ─────────────────────────────────────────────────────
    result.cascades = cascade_engine_.detect(events, snapshot.locations, result.analytics, stop);
    if (stop.stop_requested()) return cancelled_result(events.size(), now);
    const double t_cascades = elapsed_ms(started);

    // ── Stage 3: forecasts ────────────────────────────────────────────────────
    std::set<EntityId> entities(snapshot.forecast_entities.begin(),
                                snapshot.forecast_entities.end());
    if (entities.empty()) {
        for (const auto& e : events) entities.insert(e.entity_id);
    }

    for (EntityId id : entities) {
        if (stop.stop_requested()) return cancelled_result(events.size(), now);
        auto f = predictor_.forecast(id, events, result.analytics, result.cascades,
                                     snapshot.tier, now, stop);
        if (f) result.forecasts.push_back(std::move(*f));
    }
    if (stop.stop_requested()) return cancelled_result(events.size(), now);

    if (config_.verbose) {
        const double total = elapsed_ms(started);
        fmt::print(stderr,
                   "[engine] {} events: {} buckets ({:.2f} ms), {} cascades ({:.2f} ms), "
                   "{} forecasts ({:.2f} ms)\n",
                   result.events_used, result.analytics.size(), t_analytics,
                   result.cascades.size(), t_cascades - t_analytics,
                   result.forecasts.size(), total - t_cascades);
    }

    return result;
}

// ─── Engine::run_async ────────────────────────────────────────────────────────

std::shared_future<PipelineResult>
Engine::run_async(Snapshot snapshot, std::stop_token stop) {
    const std::uint64_t key = fingerprint(snapshot);

    // Futures dropped from the cache are released after the lock, since
    // destroying the last reference to an async result joins its thread.
    std::vector<SharedResult> retired;
    std::lock_guard lock(mutex_);

    const auto shape = SnapshotShape::of(snapshot);

    if (const auto it = cache_.find(key); it != cache_.end()) {
        const auto& cached = it->second.result;
        const bool failed = cached.wait_for(std::chrono::seconds{0}) == std::future_status::ready &&
                            cached.get().cancelled;
        const bool collided = !(it->second.shape == shape);
        if (!failed && !collided) {
            if (config_.verbose) fmt::print(stderr, "[engine] cache hit {:016x}\n", key);
            return cached;
        }
        if (collided && config_.verbose) {
            fmt::print(stderr, "[engine] fingerprint collision {:016x}; recomputing\n", key);
        }
        retired.push_back(cached);
        cache_.erase(it);
        std::erase(insertion_order_, key);
    }

    const std::size_t capacity = std::max<std::size_t>(1, config_.cache_capacity);
    while (cache_.size() >= capacity && !insertion_order_.empty()) {
        const auto oldest = insertion_order_.front();
        insertion_order_.pop_front();
        if (const auto it = cache_.find(oldest); it != cache_.end()) {
            retired.push_back(std::move(it->second.result));
            cache_.erase(it);
        }
    }

    auto future = std::async(std::launch::async,
                             [this, snap = std::move(snapshot), stop]() {
                                 return run(snap, stop);
                             }).share();

    cache_.emplace(key, CacheEntry{future, shape});
    insertion_order_.push_back(key);
    if (config_.verbose) fmt::print(stderr, "[engine] scheduled {:016x}\n", key);
    return future;
}

// ─── Cache maintenance ────────────────────────────────────────────────────────

std::size_t Engine::cache_size() const {
    std::lock_guard lock(mutex_);
    return cache_.size();
}

void Engine::clear_cache() {
    std::unordered_map<std::uint64_t, CacheEntry> retired;
    std::lock_guard lock(mutex_);
    retired.swap(cache_);
    insertion_order_.clear();
}

}  // namespace bridget::core
