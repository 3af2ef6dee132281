// SPDX-License-Identifier: Apache-2.0
#include "influx_client.hpp"

#include <cassert>
#include <iostream>

using namespace solarcharge;

namespace {

bool parse_throws(const std::string& body) {
    try {
        parse_mean_response(body);
    } catch (const TelemetryError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    const TimeWindow window{WallClock::time_point(std::chrono::seconds(1700000000)),
                            WallClock::time_point(std::chrono::seconds(1700000300))};

    assert(build_mean_query("sunpower_power", "pv_p", window) ==
           "SELECT MEAN(\"pv_p\") FROM \"sunpower_power\" WHERE time >= 1700000000s and time <= 1700000300s");
    assert(build_derivative_query("sunpower_power", "pv_p", window, std::chrono::seconds(60)) ==
           "SELECT DERIVATIVE(MEAN(\"pv_p\"), 1s) FROM \"sunpower_power\" WHERE time >= 1700000000s and "
           "time <= 1700000300s GROUP BY time(60s) fill(null)");

    // Mean responses
    const auto mean = parse_mean_response(
        R"({"results":[{"statement_id":0,"series":[{"name":"sunpower_power","columns":["time","mean"],"values":[[1700000000,2.5]]}]}]})");
    assert(mean && *mean == 2.5);
    assert(!parse_mean_response(R"({"results":[{"statement_id":0}]})"));
    assert(!parse_mean_response(
        R"({"results":[{"statement_id":0,"series":[{"columns":["time","mean"],"values":[[1700000000,null]]}]}]})"));
    assert(parse_throws(R"({"error":"authorization failed"})"));
    assert(parse_throws(R"({"results":[{"statement_id":0,"error":"database not found: pvs6"}]})"));
    assert(parse_throws("<html>bad gateway</html>"));

    // Derivative responses keep empty buckets so callers can tell them apart.
    const auto points = parse_derivative_response(
        R"({"results":[{"statement_id":0,"series":[{"name":"sunpower_power","columns":["time","derivative"],"values":[[1700000060,0.002],[1700000120,null],[1700000180,-0.001]]}]}]})");
    assert(points.size() == 3);
    assert(points[0].bucket == WallClock::time_point(std::chrono::seconds(1700000060)));
    assert(points[0].value && *points[0].value == 0.002);
    assert(!points[1].value);
    assert(points[2].value && *points[2].value == -0.001);
    assert(parse_derivative_response(R"({"results":[{"statement_id":0}]})").empty());

    // Line protocol: fields in key order, integers tagged.
    MetricFields fields;
    fields["target_amperage"] = std::int64_t{24};
    fields["current_amperage"] = std::int64_t{16};
    fields["excess_solar_watts"] = -250.5;
    fields["charging_power_watts"] = 1500.0;
    fields["solar_slope_w_per_s"] = 0.25;
    assert(to_line_protocol("solar_charge_control", fields) ==
           "solar_charge_control charging_power_watts=1500,current_amperage=16i,excess_solar_watts=-250.5,"
           "solar_slope_w_per_s=0.25,target_amperage=24i");

    MetricFields one;
    one["power w"] = 1.0;
    assert(to_line_protocol("solar charge", one) == "solar\\ charge power\\ w=1");

    std::cout << "influx_protocol_tests passed\n";
    return 0;
}
