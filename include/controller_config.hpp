// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace solarcharge {

namespace fs = std::filesystem;

struct AccountConfig {
    std::string username;
    std::string password;
    std::optional<std::int64_t> charger_id; // first discovered charger when unset
    std::string backend{"simulated"};
};

struct InfluxConfig {
    std::string host{"localhost"};
    int port{8086};
    bool use_https{false};
    std::string username;
    std::string password;
    std::string database{"pvs6"};
    std::string measurement{"sunpower_power"};
    std::string production_field{"pv_p"};
    std::string net_field{"net_p"};
    std::string metrics_measurement{"solar_charge_control"};
    double power_scale_w{1000.0}; // store reports kW
    int connect_timeout_s{5};
    int transfer_timeout_s{15};
};

struct ControlConfig {
    int interval_minutes{5};
    int slope_window_minutes{30};
    int tick_seconds{60};
    double voltage_v{240.0};
    double low_production_w{500.0};
    int amperage_retries{5};
    int amperage_retry_delay_ms{1000};
};

struct SimulationConfig {
    std::int64_t charger_id{1};
    std::vector<int> amperage_limits{8, 16, 24, 32, 40};
    int initial_amperage{16};
    bool plugged_in{true};
    int settle_polls{1};              // status reads before a requested limit becomes visible
    double vehicle_power_factor{1.0}; // fraction of the limit the vehicle actually draws
    double voltage_v{240.0};
};

struct ControllerConfig {
    AccountConfig account;
    InfluxConfig influx;
    ControlConfig control;
    SimulationConfig simulation;
    fs::path logging_config;
};

/// \brief Load controller.json, apply defaults and environment overrides, resolve paths against the file's directory.
ControllerConfig load_controller_config(const fs::path& config_path);

} // namespace solarcharge
