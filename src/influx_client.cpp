// SPDX-License-Identifier: Apache-2.0
#include "influx_client.hpp"

#include <cstdint>
#include <iomanip>
#include <limits>
#include <memory>
#include <mutex>
#include <sstream>
#include <utility>

#include <curl/curl.h>
#include <everest/logging.hpp>
#include <nlohmann/json.hpp>

namespace solarcharge {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

CurlHandle make_handle() {
    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw TelemetryError("curl_easy_init failed");
    }
    return curl;
}

std::size_t append_body(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string url_escape(CURL* curl, const std::string& value) {
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        throw TelemetryError("Failed to URL-encode query parameter");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

std::int64_t to_epoch_s(WallClock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::string time_clause(const TimeWindow& window) {
    std::ostringstream out;
    out << "time >= " << to_epoch_s(window.start) << "s and time <= " << to_epoch_s(window.end) << "s";
    return out.str();
}

// Rows of the first series of the first statement; empty when the statement returned no series.
nlohmann::json first_series(const std::string& body) {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        throw TelemetryError("InfluxDB returned malformed JSON");
    }
    if (json.contains("error")) {
        throw TelemetryError("InfluxDB error: " + json["error"].get<std::string>());
    }
    const auto results = json.value("results", nlohmann::json::array());
    if (results.empty()) {
        return nlohmann::json::object();
    }
    const auto& result = results.front();
    if (result.contains("error")) {
        throw TelemetryError("InfluxDB query error: " + result["error"].get<std::string>());
    }
    const auto series = result.value("series", nlohmann::json::array());
    if (series.empty()) {
        return nlohmann::json::object();
    }
    return series.front();
}

std::size_t value_column(const nlohmann::json& series, const char* name) {
    const auto columns = series.value("columns", nlohmann::json::array());
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].is_string() && columns[i].get<std::string>() == name) {
            return i;
        }
    }
    return 1;
}

std::string escape_key(const std::string& key) {
    std::string out;
    out.reserve(key.size());
    for (char c : key) {
        if (c == ',' || c == '=' || c == ' ') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

} // namespace

std::string build_mean_query(const std::string& measurement, const std::string& field, const TimeWindow& window) {
    return "SELECT MEAN(\"" + field + "\") FROM \"" + measurement + "\" WHERE " + time_clause(window);
}

std::string build_derivative_query(const std::string& measurement, const std::string& field,
                                   const TimeWindow& window, std::chrono::seconds bucket) {
    std::ostringstream out;
    out << "SELECT DERIVATIVE(MEAN(\"" << field << "\"), 1s) FROM \"" << measurement << "\" WHERE "
        << time_clause(window) << " GROUP BY time(" << bucket.count() << "s) fill(null)";
    return out.str();
}

std::optional<double> parse_mean_response(const std::string& body) {
    const auto series = first_series(body);
    const auto values = series.value("values", nlohmann::json::array());
    if (values.empty()) {
        return std::nullopt;
    }
    const auto column = value_column(series, "mean");
    const auto& row = values.front();
    if (!row.is_array() || row.size() <= column || !row[column].is_number()) {
        return std::nullopt;
    }
    return row[column].get<double>();
}

std::vector<DerivativePoint> parse_derivative_response(const std::string& body) {
    std::vector<DerivativePoint> points;
    const auto series = first_series(body);
    const auto values = series.value("values", nlohmann::json::array());
    const auto column = value_column(series, "derivative");
    for (const auto& row : values) {
        if (!row.is_array() || row.empty() || !row[0].is_number_integer()) continue;
        DerivativePoint point;
        point.bucket = WallClock::time_point(std::chrono::seconds(row[0].get<std::int64_t>()));
        if (row.size() > column && row[column].is_number()) {
            point.value = row[column].get<double>();
        }
        points.push_back(point);
    }
    return points;
}

std::string to_line_protocol(const std::string& measurement, const MetricFields& fields) {
    std::ostringstream out;
    out << escape_key(measurement) << ' ';
    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) out << ',';
        first = false;
        out << escape_key(key) << '=';
        if (const auto* integer = std::get_if<std::int64_t>(&value)) {
            out << *integer << 'i';
        } else {
            out << std::setprecision(std::numeric_limits<double>::max_digits10) << std::get<double>(value);
        }
    }
    return out.str();
}

InfluxHttpClient::InfluxHttpClient(InfluxConfig cfg) : cfg_(std::move(cfg)) {
    static std::once_flag curl_once;
    std::call_once(curl_once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    base_url_ = std::string(cfg_.use_https ? "https://" : "http://") + cfg_.host + ":" + std::to_string(cfg_.port);
}

std::string InfluxHttpClient::perform(const std::string& url, const std::string* body) const {
    const auto curl = make_handle();
    std::string response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg_.connect_timeout_s));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(cfg_.transfer_timeout_s));
    if (!cfg_.username.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_USERNAME, cfg_.username.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, cfg_.password.c_str());
    }
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, &curl_slist_free_all);
    if (body) {
        headers.reset(curl_slist_append(nullptr, "Content-Type: text/plain; charset=utf-8"));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    const CURLcode res = curl_easy_perform(curl.get());
    long http_status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
    if (res != CURLE_OK) {
        throw TelemetryError(std::string("InfluxDB request failed: ") + curl_easy_strerror(res) + " (HTTP " +
                             std::to_string(http_status) + ")");
    }
    return response;
}

std::string InfluxHttpClient::query(const std::string& influxql) const {
    const auto curl = make_handle();
    const auto url = base_url_ + "/query?db=" + url_escape(curl.get(), cfg_.database) +
                     "&epoch=s&q=" + url_escape(curl.get(), influxql);
    EVLOG_debug << "InfluxDB query: " << influxql;
    return perform(url, nullptr);
}

void InfluxHttpClient::write(const std::string& lines) const {
    const auto curl = make_handle();
    const auto url = base_url_ + "/write?db=" + url_escape(curl.get(), cfg_.database) + "&precision=s";
    perform(url, &lines);
}

InfluxTelemetryStore::InfluxTelemetryStore(std::shared_ptr<InfluxHttpClient> client) : client_(std::move(client)) {
}

std::optional<double> InfluxTelemetryStore::mean_over(const std::string& metric, const TimeWindow& window) {
    const auto& cfg = client_->config();
    return parse_mean_response(client_->query(build_mean_query(cfg.measurement, metric, window)));
}

std::vector<DerivativePoint> InfluxTelemetryStore::derivative_series(const std::string& metric,
                                                                     const TimeWindow& window,
                                                                     std::chrono::seconds bucket) {
    const auto& cfg = client_->config();
    return parse_derivative_response(client_->query(build_derivative_query(cfg.measurement, metric, window, bucket)));
}

InfluxMetricsSink::InfluxMetricsSink(std::shared_ptr<InfluxHttpClient> client) : client_(std::move(client)) {
}

void InfluxMetricsSink::write(const std::string& measurement, const MetricFields& fields) {
    if (fields.empty()) {
        return;
    }
    try {
        client_->write(to_line_protocol(measurement, fields));
    } catch (const std::exception& e) {
        EVLOG_warning << "Failed to write control metrics to InfluxDB: " << e.what();
    }
}

} // namespace solarcharge
