// SPDX-License-Identifier: Apache-2.0
#include "charger_sim.hpp"
#include "control_loop.hpp"
#include "controller_config.hpp"
#include "influx_client.hpp"
#include "session_tracker.hpp"
#include "telemetry_source.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include <everest/logging.hpp>

namespace {
std::atomic<bool> keep_running{true};

void handle_signal(int) {
    keep_running = false;
}

struct CliOptions {
    std::string config_path{"configs/controller.json"};
    int control_interval_min{0};
    int slope_window_min{0};
};

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--control-interval" && i + 1 < argc) {
            opts.control_interval_min = std::stoi(argv[++i]);
        } else if (arg == "--slope-window" && i + 1 < argc) {
            opts.slope_window_min = std::stoi(argv[++i]);
        }
    }
    return opts;
}

// Sleeps in short slices so a signal ends the loop without waiting out a whole control interval.
solarcharge::Sleeper interruptible_sleeper() {
    return [](std::chrono::milliseconds duration) {
        const auto slice = std::chrono::milliseconds(1000);
        while (keep_running && duration.count() > 0) {
            const auto step = std::min(duration, slice);
            std::this_thread::sleep_for(step);
            duration -= step;
        }
    };
}
} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    solarcharge::ControllerConfig cfg;
    try {
        opts = parse_args(argc, argv);
        cfg = solarcharge::load_controller_config(opts.config_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        return 1;
    }
    if (opts.control_interval_min > 0) {
        cfg.control.interval_minutes = opts.control_interval_min;
    }
    if (opts.slope_window_min > 0) {
        cfg.control.slope_window_minutes = opts.slope_window_min;
    }

    Everest::Logging::init(cfg.logging_config.string(), "solar-charge");

    const auto sleeper = interruptible_sleeper();
    auto charger = std::make_shared<solarcharge::SimulatedCharger>(cfg.simulation);
    charger->set_amperage_retry(
        solarcharge::RetryPolicy{cfg.control.amperage_retries,
                                 std::chrono::milliseconds(cfg.control.amperage_retry_delay_ms)},
        sleeper);

    auto influx = std::make_shared<solarcharge::InfluxHttpClient>(cfg.influx);
    auto store = std::make_shared<solarcharge::InfluxTelemetryStore>(influx);
    auto metrics = std::make_shared<solarcharge::InfluxMetricsSink>(influx);
    auto telemetry = std::make_shared<solarcharge::TelemetrySource>(
        store, solarcharge::TelemetryFields{cfg.influx.production_field, cfg.influx.net_field},
        cfg.influx.power_scale_w);

    std::shared_ptr<solarcharge::ControlLoop> loop;
    try {
        EVLOG_info << "Connecting to charger backend '" << cfg.account.backend << "'"
                   << (cfg.account.username.empty() ? "" : " as " + cfg.account.username);
        const auto chargers = charger->get_home_chargers();
        if (chargers.empty()) {
            EVLOG_error << "No home chargers found.";
            return 1;
        }
        solarcharge::ChargerId charger_id = chargers.front();
        if (cfg.account.charger_id) {
            if (std::find(chargers.begin(), chargers.end(), *cfg.account.charger_id) == chargers.end()) {
                EVLOG_error << "Configured charger " << *cfg.account.charger_id << " not found on this account.";
                return 1;
            }
            charger_id = *cfg.account.charger_id;
        }
        EVLOG_info << "Found charger " << charger_id;

        auto sessions = std::make_shared<solarcharge::SessionStateTracker>(charger);
        sessions->adopt_existing();

        solarcharge::ControlLoopConfig loop_cfg;
        loop_cfg.tick_interval = std::chrono::seconds(cfg.control.tick_seconds);
        loop_cfg.control_interval = std::chrono::minutes(cfg.control.interval_minutes);
        loop_cfg.slope_window = std::chrono::minutes(cfg.control.slope_window_minutes);
        loop_cfg.voltage_v = cfg.control.voltage_v;
        loop_cfg.low_production_w = cfg.control.low_production_w;
        loop_cfg.metrics_measurement = cfg.influx.metrics_measurement;

        loop = std::make_shared<solarcharge::ControlLoop>(loop_cfg, charger_id, charger, telemetry, sessions, metrics,
                                                          sleeper);
        loop->initialize();
    } catch (const std::exception& e) {
        EVLOG_error << "Startup failed: " << e.what();
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    loop->run(keep_running);
    return 0;
}
