// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vector>

namespace solarcharge {

constexpr double DEFAULT_CHARGER_VOLTAGE_V = 240.0;

/// \brief Pick the amperage step for the predicted solar excess.
///
/// Returns 0 when there is no excess. Otherwise rounds excess / voltage up to the next step of the
/// ladder, never below the lowest step minus 0.5 A so excess just under the first step still selects it.
/// Excess beyond the top step returns the top step.
/// \param allowed_amps ascending amperage ladder; throws std::invalid_argument when empty.
int decide_amperage(double predicted_excess_w, const std::vector<int>& allowed_amps,
                    double voltage_v = DEFAULT_CHARGER_VOLTAGE_V);

/// \brief Excess needed before charging can start at the lowest step.
double minimum_excess_w(const std::vector<int>& allowed_amps, double voltage_v = DEFAULT_CHARGER_VOLTAGE_V);

} // namespace solarcharge
