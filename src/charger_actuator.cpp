// SPDX-License-Identifier: Apache-2.0
#include "charger_actuator.hpp"

#include <utility>

#include <everest/logging.hpp>

namespace solarcharge {

const char* to_string(ChargingStatus status) {
    switch (status) {
    case ChargingStatus::Idle:
        return "IDLE";
    case ChargingStatus::Charging:
        return "CHARGING";
    case ChargingStatus::Other:
        break;
    }
    return "OTHER";
}

void ChargerActuator::set_amperage_retry(RetryPolicy policy, Sleeper sleeper) {
    amperage_retry_ = policy;
    retry_sleeper_ = std::move(sleeper);
}

void ChargerActuator::set_amperage(ChargerId charger_id, int amps) {
    EVLOG_debug << "Setting amperage limit for " << charger_id << " to " << amps;
    request_amperage_limit(charger_id, amps);

    // The device applies the new limit eventually; wait until status reflects it.
    int last_seen = -1;
    const bool persisted = retry_with_delay(amperage_retry_, retry_sleeper_, [&]() {
        last_seen = get_status(charger_id).amperage_limit;
        return last_seen == amps;
    });
    if (!persisted) {
        throw ActuatorCommunicationError("New amperage limit " + std::to_string(amps) +
                                         "A did not persist to charger " + std::to_string(charger_id) +
                                         " after retries (reported " + std::to_string(last_seen) + "A)");
    }
}

} // namespace solarcharge
