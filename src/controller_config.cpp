// SPDX-License-Identifier: Apache-2.0
#include "controller_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace solarcharge {

namespace {
fs::path make_absolute(const fs::path& base, const fs::path& relative_or_absolute) {
    if (relative_or_absolute.is_absolute()) {
        return relative_or_absolute;
    }
    return fs::weakly_canonical(base / relative_or_absolute);
}

std::string env_or(const char* name, const std::string& fallback) {
    const char* env = std::getenv(name);
    if (env && *env) {
        return env;
    }
    return fallback;
}

AccountConfig parse_account(const nlohmann::json& cp) {
    AccountConfig account;
    account.username = cp.value("username", "");
    account.password = env_or("SOLAR_CHARGE_PASSWORD", cp.value("password", ""));
    if (cp.contains("chargerId") && cp["chargerId"].is_number_integer()) {
        account.charger_id = cp["chargerId"].get<std::int64_t>();
    }
    account.backend = cp.value("backend", account.backend);
    std::transform(account.backend.begin(), account.backend.end(), account.backend.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return account;
}

InfluxConfig parse_influx(const nlohmann::json& influx_json) {
    InfluxConfig influx;
    influx.host = influx_json.value("host", influx.host);
    influx.port = influx_json.value("port", influx.port);
    influx.use_https = influx_json.value("useHttps", influx.use_https);
    influx.username = influx_json.value("username", "");
    influx.password = env_or("SOLAR_CHARGE_INFLUX_PASSWORD", influx_json.value("password", ""));
    influx.database = influx_json.value("database", influx.database);
    influx.measurement = influx_json.value("measurement", influx.measurement);
    influx.production_field = influx_json.value("productionField", influx.production_field);
    influx.net_field = influx_json.value("netField", influx.net_field);
    influx.metrics_measurement = influx_json.value("metricsMeasurement", influx.metrics_measurement);
    influx.power_scale_w = influx_json.value("powerScaleW", influx.power_scale_w);
    influx.connect_timeout_s = influx_json.value("connectTimeoutSeconds", influx.connect_timeout_s);
    influx.transfer_timeout_s = influx_json.value("transferTimeoutSeconds", influx.transfer_timeout_s);
    if (influx.port <= 0 || influx.port > 65535) {
        influx.port = 8086;
    }
    if (influx.power_scale_w <= 0.0) {
        influx.power_scale_w = 1000.0;
    }
    if (influx.connect_timeout_s <= 0) {
        influx.connect_timeout_s = 5;
    }
    if (influx.transfer_timeout_s <= 0) {
        influx.transfer_timeout_s = 15;
    }
    return influx;
}

ControlConfig parse_control(const nlohmann::json& control_json) {
    ControlConfig control;
    control.interval_minutes = control_json.value("intervalMinutes", control.interval_minutes);
    control.slope_window_minutes = control_json.value("slopeWindowMinutes", control.slope_window_minutes);
    control.tick_seconds = control_json.value("tickSeconds", control.tick_seconds);
    control.voltage_v = control_json.value("voltageV", control.voltage_v);
    control.low_production_w = control_json.value("lowProductionW", control.low_production_w);
    control.amperage_retries = control_json.value("amperageRetries", control.amperage_retries);
    control.amperage_retry_delay_ms = control_json.value("amperageRetryDelayMs", control.amperage_retry_delay_ms);
    if (control.interval_minutes <= 0) {
        control.interval_minutes = 5;
    }
    if (control.slope_window_minutes <= 0) {
        control.slope_window_minutes = 30;
    }
    if (control.tick_seconds <= 0) {
        control.tick_seconds = 60;
    }
    if (control.voltage_v <= 0.0) {
        control.voltage_v = 240.0;
    }
    if (control.low_production_w < 0.0) {
        control.low_production_w = 500.0;
    }
    if (control.amperage_retries <= 0) {
        control.amperage_retries = 5;
    }
    if (control.amperage_retry_delay_ms < 0) {
        control.amperage_retry_delay_ms = 1000;
    }
    return control;
}

SimulationConfig parse_simulation(const nlohmann::json& sim_json, double voltage_v) {
    SimulationConfig sim;
    sim.voltage_v = voltage_v;
    sim.charger_id = sim_json.value("chargerId", sim.charger_id);
    if (sim_json.contains("amperageLimits")) {
        if (!sim_json["amperageLimits"].is_array()) {
            throw std::runtime_error("simulation.amperageLimits must be an array of integers");
        }
        sim.amperage_limits = sim_json["amperageLimits"].get<std::vector<int>>();
    }
    sim.amperage_limits.erase(std::remove_if(sim.amperage_limits.begin(), sim.amperage_limits.end(),
                                             [](int amps) { return amps <= 0; }),
                              sim.amperage_limits.end());
    std::sort(sim.amperage_limits.begin(), sim.amperage_limits.end());
    sim.amperage_limits.erase(std::unique(sim.amperage_limits.begin(), sim.amperage_limits.end()),
                              sim.amperage_limits.end());
    if (sim.amperage_limits.empty()) {
        throw std::runtime_error("simulation.amperageLimits is empty; the charger needs at least one amperage step");
    }
    sim.initial_amperage = sim_json.value("initialAmperage", sim.initial_amperage);
    if (std::find(sim.amperage_limits.begin(), sim.amperage_limits.end(), sim.initial_amperage) ==
        sim.amperage_limits.end()) {
        sim.initial_amperage = sim.amperage_limits.front();
    }
    sim.plugged_in = sim_json.value("pluggedIn", sim.plugged_in);
    sim.settle_polls = sim_json.value("settlePolls", sim.settle_polls);
    sim.vehicle_power_factor = sim_json.value("vehiclePowerFactor", sim.vehicle_power_factor);
    if (sim.settle_polls < 0) {
        sim.settle_polls = 0;
    }
    if (sim.vehicle_power_factor < 0.0 || sim.vehicle_power_factor > 1.0) {
        sim.vehicle_power_factor = 1.0;
    }
    return sim;
}
} // namespace

ControllerConfig load_controller_config(const fs::path& config_path) {
    if (!fs::exists(config_path)) {
        throw std::runtime_error("Config file not found: " + config_path.string());
    }

    std::ifstream file(config_path);
    const auto json = nlohmann::json::parse(file);
    const auto base_dir = config_path.parent_path().empty() ? fs::current_path() : config_path.parent_path();

    ControllerConfig cfg{};
    cfg.account = parse_account(json.value("chargePoint", nlohmann::json::object()));
    cfg.influx = parse_influx(json.value("influxdb", nlohmann::json::object()));
    cfg.control = parse_control(json.value("control", nlohmann::json::object()));
    cfg.simulation = parse_simulation(json.value("simulation", nlohmann::json::object()), cfg.control.voltage_v);
    cfg.logging_config = make_absolute(base_dir, json.value("loggingConfig", "logging.ini"));

    if (cfg.account.backend != "simulated") {
        throw std::runtime_error("Unsupported charger backend '" + cfg.account.backend +
                                 "'; only 'simulated' is available");
    }
    if (cfg.account.charger_id) {
        cfg.simulation.charger_id = *cfg.account.charger_id;
    }

    return cfg;
}

} // namespace solarcharge
