// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace solarcharge {

using WallClock = std::chrono::system_clock;

struct TimeWindow {
    WallClock::time_point start;
    WallClock::time_point end;
};

struct DerivativePoint {
    WallClock::time_point bucket;
    std::optional<double> value; // empty for buckets without samples
};

/// \brief Store query failed (transport, HTTP or query error).
class TelemetryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// \brief Time-series store holding the site power readings, in store units (e.g. kW).
class TelemetryStore {
public:
    virtual ~TelemetryStore() = default;

    /// \brief Mean of a metric over the window; empty when the window holds no points.
    virtual std::optional<double> mean_over(const std::string& metric, const TimeWindow& window) = 0;

    /// \brief Per-second derivative of the bucketed mean of a metric over the window.
    virtual std::vector<DerivativePoint> derivative_series(const std::string& metric, const TimeWindow& window,
                                                           std::chrono::seconds bucket) = 0;
};

struct SolarSample {
    double production_w{0.0};
    double consumption_w{0.0}; // net grid draw, negative when exporting
    double slope_w_per_s{0.0};
    TimeWindow control_window;
    TimeWindow slope_window;
};

struct TelemetryFields {
    std::string production{"pv_p"};
    std::string net{"net_p"};
};

/// \brief Turns raw store queries into a SolarSample, or nothing when any query comes back empty.
class TelemetrySource {
public:
    TelemetrySource(std::shared_ptr<TelemetryStore> store, TelemetryFields fields, double power_scale_w = 1000.0);

    std::optional<SolarSample> estimate(WallClock::time_point now, std::chrono::seconds control_window,
                                        std::chrono::seconds slope_window);

private:
    std::shared_ptr<TelemetryStore> store_;
    TelemetryFields fields_;
    double power_scale_w_{1000.0};
};

} // namespace solarcharge
