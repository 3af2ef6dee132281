// SPDX-License-Identifier: Apache-2.0
#include "charger_sim.hpp"
#include "control_loop.hpp"
#include "session_tracker.hpp"
#include "telemetry_source.hpp"

#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <memory>
#include <vector>

using namespace solarcharge;

namespace {

class ScriptedStore : public TelemetryStore {
public:
    std::optional<double> production_kw{3.0};
    std::optional<double> net_kw{-2.0};
    double slope_kw_per_s{0.0};

    std::optional<double> mean_over(const std::string& metric, const TimeWindow&) override {
        return metric == "pv_p" ? production_kw : net_kw;
    }

    std::vector<DerivativePoint> derivative_series(const std::string&, const TimeWindow& window,
                                                   std::chrono::seconds) override {
        return {DerivativePoint{window.start, slope_kw_per_s}};
    }
};

class RecordingSink : public MetricsSink {
public:
    std::vector<std::pair<std::string, MetricFields>> points;

    void write(const std::string& measurement, const MetricFields& fields) override {
        points.emplace_back(measurement, fields);
    }

    std::int64_t last_int(const std::string& key) const {
        return std::get<std::int64_t>(points.back().second.at(key));
    }
};

struct Harness {
    std::shared_ptr<SimulatedCharger> sim;
    std::shared_ptr<ScriptedStore> store;
    std::shared_ptr<RecordingSink> sink;
    std::shared_ptr<SessionStateTracker> sessions;
    std::unique_ptr<ControlLoop> loop;
    std::vector<std::chrono::milliseconds> loop_sleeps;

    explicit Harness(Sleeper loop_sleeper = nullptr) {
        SimulationConfig sim_cfg;
        sim_cfg.charger_id = 1;
        sim_cfg.amperage_limits = {8, 16, 24, 32, 40};
        sim_cfg.initial_amperage = 16;
        sim_cfg.settle_polls = 1;
        sim = std::make_shared<SimulatedCharger>(sim_cfg);
        sim->set_amperage_retry(RetryPolicy{5, std::chrono::milliseconds(1000)}, [](std::chrono::milliseconds) {});

        store = std::make_shared<ScriptedStore>();
        sink = std::make_shared<RecordingSink>();
        sessions = std::make_shared<SessionStateTracker>(sim);
        if (!loop_sleeper) {
            loop_sleeper = [this](std::chrono::milliseconds d) { loop_sleeps.push_back(d); };
        }
        loop = std::make_unique<ControlLoop>(ControlLoopConfig{}, 1, sim,
                                             std::make_shared<TelemetrySource>(store, TelemetryFields{}), sessions,
                                             sink, loop_sleeper);
    }
};

const auto T0 = WallClock::time_point(std::chrono::seconds(1700000000));

void test_follow_excess_across_control_intervals() {
    Harness h;
    h.loop->initialize();

    // 2 kW export, no session yet: 16A is the first step covering 2000W / 240V.
    assert(h.loop->tick(T0) == TickOutcome::Actuated);
    assert(h.sessions->active());
    assert(h.loop->last_set_amperage() == 16);
    assert(h.loop->last_decision()->target_amps == 16);
    auto counters = h.sim->counters();
    assert(counters.amperage_requests == 0);
    assert(counters.session_starts == 1);
    assert(h.sink->points.size() == 1);
    assert(h.sink->points.back().first == "solar_charge_control");
    assert(h.sink->last_int("target_amperage") == 16);
    assert(h.sink->last_int("current_amperage") == 16);
    assert(std::get<double>(h.sink->points.back().second.at("excess_solar_watts")) == 2000.0);

    // The running session now adds 3840W back into the excess, but actuation is not due yet.
    assert(h.loop->tick(T0 + std::chrono::seconds(60)) == TickOutcome::Evaluated);
    assert(h.sink->last_int("target_amperage") == 32);
    assert(std::fabs(std::get<double>(h.sink->points.back().second.at("charging_power_watts")) - 3840.0) < 1e-6);
    assert(h.sim->counters().amperage_requests == 0);
    assert(h.loop->last_set_amperage() == 16);

    // One control interval later: stop, change the limit, restart.
    assert(h.loop->tick(T0 + std::chrono::seconds(300)) == TickOutcome::Actuated);
    counters = h.sim->counters();
    assert(counters.amperage_requests == 1);
    assert(counters.session_stops == 1);
    assert(counters.session_starts == 2);
    assert(h.loop->last_set_amperage() == 32);
    assert(h.loop->last_decision()->confirmed_amps == 32);
    assert(*h.loop->last_actuation() == T0 + std::chrono::seconds(300));
    assert(h.sink->last_int("current_amperage") == 32);
    assert(h.sink->points.size() == 3);
}

void test_slope_shifts_prediction() {
    Harness h;
    // 1000W export alone is below the 1800W start threshold; a rising slope of 4 W/s adds 1200W.
    h.store->net_kw = -1.0;
    h.store->slope_kw_per_s = 0.004;
    assert(h.loop->tick(T0) == TickOutcome::Actuated);
    assert(h.loop->last_decision()->target_amps == 16);

    Harness falling;
    falling.store->net_kw = -2.0;
    falling.store->slope_kw_per_s = -0.001;
    assert(falling.loop->tick(T0) == TickOutcome::Actuated);
    assert(falling.loop->last_decision()->target_amps == 0);
    assert(!falling.sessions->active());
}

void test_low_production_then_stop() {
    Harness h;
    h.store->production_kw = 0.3;
    h.store->net_kw = 1.0;
    assert(h.loop->tick(T0) == TickOutcome::Actuated);
    assert(h.loop->last_set_amperage() == 40);
    assert(h.sessions->active());
    assert(h.sim->get_status(1).amperage_limit == 40);

    // The loop's own 40A is not a manual override; heavy import stops charging.
    h.store->production_kw = 3.0;
    h.store->net_kw = 12.0;
    assert(h.loop->tick(T0 + std::chrono::seconds(300)) == TickOutcome::Actuated);
    assert(!h.sessions->active());
    assert(h.loop->last_set_amperage() == 0);
    assert(h.sim->counters().session_stops == 1);
    assert(h.sink->last_int("target_amperage") == 0);
}

void test_telemetry_unavailable_skips_everything() {
    Harness h;
    h.store->net_kw.reset();
    assert(h.loop->tick(T0) == TickOutcome::TelemetryUnavailable);
    const auto counters = h.sim->counters();
    assert(counters.status_reads == 0);
    assert(counters.amperage_requests == 0);
    assert(counters.session_starts == 0);
    assert(h.sink->points.empty());
    assert(!h.loop->last_actuation());
}

void test_manual_override_respected() {
    Harness h;
    h.sim->begin_external_session(40);
    assert(h.sessions->adopt_existing());
    h.sim->reset_counters();

    assert(h.loop->tick(T0) == TickOutcome::ManualOverride);
    const auto counters = h.sim->counters();
    assert(counters.amperage_requests == 0);
    assert(counters.session_stops == 0);
    assert(counters.session_starts == 0);
    assert(h.sessions->active());
    assert(!h.loop->last_actuation());
    assert(h.sink->points.size() == 1);
    assert(h.sink->last_int("current_amperage") == 40);
}

void test_actuation_failure_waits_for_next_interval() {
    Harness h;
    h.store->production_kw = 0.3;
    SimulatedCharger::FaultOverride fault;
    fault.never_settle = true;
    h.sim->set_fault_override(fault);

    assert(h.loop->tick(T0) == TickOutcome::ActuationFailed);
    assert(!h.loop->last_set_amperage());
    assert(*h.loop->last_actuation() == T0);
    assert(h.sink->points.size() == 1);

    h.sim->clear_fault_override();
    assert(h.loop->tick(T0 + std::chrono::seconds(60)) == TickOutcome::Evaluated);
    assert(h.loop->tick(T0 + std::chrono::seconds(300)) == TickOutcome::Actuated);
    assert(h.loop->last_set_amperage() == 40);
}

void test_run_backs_off_after_failed_tick() {
    std::atomic<bool> keep_running{true};
    std::vector<std::chrono::milliseconds> sleeps;
    Harness h([&](std::chrono::milliseconds d) {
        sleeps.push_back(d);
        keep_running = false;
    });
    SimulatedCharger::FaultOverride fault;
    fault.comm_fault = true;
    h.sim->set_fault_override(fault);

    h.loop->run(keep_running);
    assert(sleeps.size() == 1);
    assert(sleeps.front() == std::chrono::milliseconds(300000));
    assert(h.sink->points.empty());
}

void test_run_sleeps_remaining_tick() {
    std::atomic<bool> keep_running{true};
    std::vector<std::chrono::milliseconds> sleeps;
    Harness h([&](std::chrono::milliseconds d) {
        sleeps.push_back(d);
        keep_running = false;
    });

    h.loop->run(keep_running);
    assert(sleeps.size() == 1);
    assert(sleeps.front() > std::chrono::milliseconds(0));
    assert(sleeps.front() <= std::chrono::milliseconds(60000));
    assert(h.sink->points.size() == 1);
}

void test_initialize_rejects_unknown_charger() {
    Harness h;
    ControlLoop other(ControlLoopConfig{}, 2, h.sim, std::make_shared<TelemetrySource>(h.store, TelemetryFields{}),
                      h.sessions, h.sink);
    bool threw = false;
    try {
        other.initialize();
    } catch (const ActuatorCommunicationError&) {
        threw = true;
    }
    assert(threw);
}

} // namespace

int main() {
    test_follow_excess_across_control_intervals();
    test_slope_shifts_prediction();
    test_low_production_then_stop();
    test_telemetry_unavailable_skips_everything();
    test_manual_override_respected();
    test_actuation_failure_waits_for_next_interval();
    test_run_backs_off_after_failed_tick();
    test_run_sleeps_remaining_tick();
    test_initialize_rejects_unknown_charger();
    std::cout << "control_loop_tests passed\n";
    return 0;
}
