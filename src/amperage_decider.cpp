// SPDX-License-Identifier: Apache-2.0
#include "amperage_decider.hpp"

#include <algorithm>
#include <stdexcept>

namespace solarcharge {

namespace {
constexpr double LOWEST_STEP_SLACK_A = 0.5;

void require_ladder(const std::vector<int>& allowed_amps) {
    if (allowed_amps.empty()) {
        throw std::invalid_argument("Amperage ladder is empty");
    }
}
} // namespace

int decide_amperage(double predicted_excess_w, const std::vector<int>& allowed_amps, double voltage_v) {
    require_ladder(allowed_amps);
    if (predicted_excess_w <= 0.0) {
        return 0;
    }
    const int lowest = *std::min_element(allowed_amps.begin(), allowed_amps.end());
    const double ideal = std::max(predicted_excess_w / voltage_v, lowest - LOWEST_STEP_SLACK_A);

    bool found = false;
    int best = 0;
    for (int amps : allowed_amps) {
        if (amps >= ideal && (!found || amps < best)) {
            best = amps;
            found = true;
        }
    }
    if (!found) {
        return *std::max_element(allowed_amps.begin(), allowed_amps.end());
    }
    return best;
}

double minimum_excess_w(const std::vector<int>& allowed_amps, double voltage_v) {
    require_ladder(allowed_amps);
    const int lowest = *std::min_element(allowed_amps.begin(), allowed_amps.end());
    return (lowest - LOWEST_STEP_SLACK_A) * voltage_v;
}

} // namespace solarcharge
