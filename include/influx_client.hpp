// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "controller_config.hpp"
#include "metrics_sink.hpp"
#include "telemetry_source.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace solarcharge {

/// \brief Minimal InfluxDB 1.x HTTP client (query + line-protocol write) over libcurl.
class InfluxHttpClient {
public:
    explicit InfluxHttpClient(InfluxConfig cfg);

    /// \brief Run an InfluxQL query with epoch=s and return the raw JSON body. Throws TelemetryError.
    std::string query(const std::string& influxql) const;

    /// \brief POST line protocol to /write. Throws TelemetryError.
    void write(const std::string& lines) const;

    const InfluxConfig& config() const { return cfg_; }

private:
    InfluxConfig cfg_;
    std::string base_url_;

    std::string perform(const std::string& url, const std::string* body) const;
};

/// \brief TelemetryStore backed by the site's InfluxDB measurement.
class InfluxTelemetryStore : public TelemetryStore {
public:
    explicit InfluxTelemetryStore(std::shared_ptr<InfluxHttpClient> client);

    std::optional<double> mean_over(const std::string& metric, const TimeWindow& window) override;
    std::vector<DerivativePoint> derivative_series(const std::string& metric, const TimeWindow& window,
                                                   std::chrono::seconds bucket) override;

private:
    std::shared_ptr<InfluxHttpClient> client_;
};

/// \brief MetricsSink writing one point per call; failures are logged and dropped.
class InfluxMetricsSink : public MetricsSink {
public:
    explicit InfluxMetricsSink(std::shared_ptr<InfluxHttpClient> client);

    void write(const std::string& measurement, const MetricFields& fields) override;

private:
    std::shared_ptr<InfluxHttpClient> client_;
};

// InfluxQL / line-protocol helpers
std::string build_mean_query(const std::string& measurement, const std::string& field, const TimeWindow& window);
std::string build_derivative_query(const std::string& measurement, const std::string& field,
                                   const TimeWindow& window, std::chrono::seconds bucket);
std::optional<double> parse_mean_response(const std::string& body);
std::vector<DerivativePoint> parse_derivative_response(const std::string& body);
std::string to_line_protocol(const std::string& measurement, const MetricFields& fields);

} // namespace solarcharge
