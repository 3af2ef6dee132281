// SPDX-License-Identifier: Apache-2.0
#include "telemetry_source.hpp"

#include <utility>

#include <everest/logging.hpp>

namespace solarcharge {

namespace {
constexpr std::chrono::seconds SLOPE_BUCKET(60);
} // namespace

TelemetrySource::TelemetrySource(std::shared_ptr<TelemetryStore> store, TelemetryFields fields, double power_scale_w) :
    store_(std::move(store)), fields_(std::move(fields)), power_scale_w_(power_scale_w > 0.0 ? power_scale_w : 1000.0) {
}

std::optional<SolarSample> TelemetrySource::estimate(WallClock::time_point now, std::chrono::seconds control_window,
                                                     std::chrono::seconds slope_window) {
    SolarSample sample;
    sample.control_window = TimeWindow{now - control_window, now};
    sample.slope_window = TimeWindow{now - slope_window, now};

    std::optional<double> production;
    std::optional<double> net;
    std::vector<DerivativePoint> slope_points;
    try {
        production = store_->mean_over(fields_.production, sample.control_window);
        net = store_->mean_over(fields_.net, sample.control_window);
        slope_points = store_->derivative_series(fields_.production, sample.slope_window, SLOPE_BUCKET);
    } catch (const std::exception& e) {
        EVLOG_error << "Failed to query telemetry store: " << e.what();
        return std::nullopt;
    }

    double slope_sum = 0.0;
    int slope_count = 0;
    for (const auto& point : slope_points) {
        if (!point.value.has_value()) continue;
        slope_sum += *point.value;
        slope_count++;
    }

    if (!production || !net || slope_count == 0) {
        EVLOG_warning << "Telemetry query returned no data (production=" << production.has_value()
                      << ", net=" << net.has_value() << ", slope buckets=" << slope_count << ")";
        return std::nullopt;
    }

    // Derivatives are per second in store units, so scaling by power_scale_w gives W/s directly.
    sample.production_w = *production * power_scale_w_;
    sample.consumption_w = *net * power_scale_w_;
    sample.slope_w_per_s = (slope_sum / slope_count) * power_scale_w_;
    return sample;
}

} // namespace solarcharge
