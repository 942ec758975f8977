/**
 * @file  prop_forecast_bounds.cpp
 * @brief Property: every forecast is bounded whatever the history looks like
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_forecast_bounds
 *
 * Basis:
 *   P = σ((h − wait) / max(RMSE, 5))          ∈ [0, 1]
 *   P_boosted = min(P + k·S̄, cap)             ≤ cap
 *   model tier ≤ requested tier               (fallback only goes down)
 *
 * The tiered fitter may fall back from LM to Yule-Walker to the fixed
 * minimal model; none of those paths may leak a NaN or an out-of-range
 * probability to the host.
 */

#include <rapidcheck.h>

#include <chrono>
#include <cmath>
#include <vector>

#include "bridget/prediction.hpp"

using namespace bridget;
using namespace bridget::prediction;
using namespace std::chrono;

namespace {

const Timestamp BASE = sys_days{2025y / March / 3};

struct History {
    std::vector<Event> events;
    Timestamp          last_open{};
};

/// Openings of entity 1 separated by random gaps of 1 minute to 12 hours.
History gen_history() {
    const int n = *rc::gen::inRange(3, 60);
    History h;
    Timestamp t = BASE;
    for (int i = 0; i < n; ++i) {
        t += minutes{*rc::gen::inRange(1, 12 * 60)};
        Event e;
        e.entity_id    = 1;
        e.entity_label = "Ballard";
        e.open_time    = t;
        const int duration = *rc::gen::inRange(0, 40);
        e.close_time   = t + minutes{duration};
        if (*rc::gen::arbitrary<bool>()) e.minutes_open = static_cast<double>(duration);
        h.events.push_back(std::move(e));
    }
    h.last_open = t;
    return h;
}

ComputeTier gen_tier() {
    return static_cast<ComputeTier>(*rc::gen::inRange(0, 4));
}

bool in_unit(double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; }

}  // namespace

int main() {
    // ── Property 1: probability, confidence and duration bounded ────────────
    rc::check(
        "forecast_bounds: outputs bounded for any history and tier",
        [] {
            const auto h    = gen_history();
            const auto tier = gen_tier();
            const auto now  = h.last_open + minutes{*rc::gen::inRange(0, 3 * 24 * 60)};

            const auto f = PredictionEngine{}.forecast(1, h.events, {}, {}, tier, now);
            RC_ASSERT(f.has_value());
            RC_ASSERT(in_unit(f->probability));
            RC_ASSERT(in_unit(f->confidence));
            RC_ASSERT(std::isfinite(f->expected_duration_minutes));
            RC_ASSERT(f->expected_duration_minutes >= 0.0);
            RC_ASSERT(std::isfinite(f->rmse));
            RC_ASSERT(f->requested_tier == tier);
            RC_ASSERT(static_cast<int>(f->model_tier) <= static_cast<int>(tier));
            RC_ASSERT(!f->cascade_trigger.has_value());
        }
    );

    // ── Property 2: a boosted probability never exceeds the cap ─────────────
    rc::check(
        "forecast_bounds: cascade boost capped",
        [] {
            auto h = gen_history();
            const auto now = h.last_open + minutes{*rc::gen::inRange(0, 240)};

            Event trigger;
            trigger.entity_id    = 2;
            trigger.entity_label = "Fremont";
            trigger.open_time    = now - minutes{*rc::gen::inRange(0, 90)};
            h.events.push_back(trigger);

            CascadeRecord c;
            c.trigger_entity_id = 2;
            c.trigger_label     = "Fremont";
            c.trigger_time      = BASE;
            c.target_entity_id  = 1;
            c.target_time       = BASE + 45min;
            c.delay_minutes     = 45.0;
            c.strength          = *rc::gen::inRange(0, 101) / 100.0;
            const std::vector<CascadeRecord> cascades = {c};

            const PredictionEngine engine;
            const auto f = engine.forecast(1, h.events, {}, cascades, gen_tier(), now);
            RC_ASSERT(f.has_value());
            RC_ASSERT(f->cascade_trigger.has_value());
            RC_ASSERT(*f->cascade_trigger == 2);
            RC_ASSERT(in_unit(f->probability));
            RC_ASSERT(f->probability <= engine.config().boosted_probability_cap);
        }
    );

    // ── Property 3: logistic is bounded and monotone ────────────────────────
    rc::check(
        "forecast_bounds: logistic in [0, 1] and non-decreasing",
        [](double a, double b) {
            RC_PRE(!std::isnan(a) && !std::isnan(b));
            if (a > b) std::swap(a, b);
            const double la = PredictionEngine::logistic(a);
            const double lb = PredictionEngine::logistic(b);
            RC_ASSERT(la >= 0.0 && la <= 1.0);
            RC_ASSERT(lb >= 0.0 && lb <= 1.0);
            RC_ASSERT(la <= lb);
        }
    );

    return 0;
}
