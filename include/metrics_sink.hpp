// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace solarcharge {

using MetricValue = std::variant<double, std::int64_t>;
using MetricFields = std::map<std::string, MetricValue>;

/// \brief Best-effort metrics output. Implementations log failures and never throw.
class MetricsSink {
public:
    virtual ~MetricsSink() = default;
    virtual void write(const std::string& measurement, const MetricFields& fields) = 0;
};

} // namespace solarcharge
