// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "retry.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace solarcharge {

using ChargerId = std::int64_t;
using SessionId = std::int64_t;

enum class ChargingStatus { Idle, Charging, Other };

const char* to_string(ChargingStatus status);

/// \brief Remote call to the charger failed or the device never confirmed a command.
class ActuatorCommunicationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// \brief A session handle no longer refers to a live remote session.
class SessionInvalid : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ChargerStatus {
    ChargerId charger_id{0};
    int amperage_limit{0};
    std::vector<int> possible_amperage_limits; // ascending, unique
    bool plugged_in{false};
    ChargingStatus charging_status{ChargingStatus::Idle};

    int min_amperage() const { return possible_amperage_limits.empty() ? 0 : possible_amperage_limits.front(); }
    int max_amperage() const { return possible_amperage_limits.empty() ? 0 : possible_amperage_limits.back(); }
};

/// \brief Charging activity the vendor account reports for the logged-in user.
struct UserChargingStatus {
    SessionId session_id{0};
    ChargerId charger_id{0};
};

/// \brief Handle to one remote charging session.
class SessionHandle {
public:
    virtual ~SessionHandle() = default;

    virtual SessionId session_id() const = 0;
    virtual ChargerId charger_id() const = 0;
    virtual std::chrono::system_clock::time_point started_at() const = 0;

    /// \brief Power reported by the last successful refresh, in kW.
    virtual double power_kw() const = 0;

    /// \brief Pull the latest session state. Throws SessionInvalid when the remote session is gone.
    virtual void refresh() = 0;

    /// \brief Stop charging. Throws ActuatorCommunicationError on failure.
    virtual void stop() = 0;
};

/// \brief Remote charger interface consumed by the control loop.
class ChargerActuator {
public:
    virtual ~ChargerActuator() = default;

    virtual std::vector<ChargerId> get_home_chargers() = 0;

    /// \brief Fresh status read. Throws ActuatorCommunicationError.
    virtual ChargerStatus get_status(ChargerId charger_id) = 0;

    virtual std::optional<UserChargingStatus> get_user_charging_status() = 0;

    virtual std::unique_ptr<SessionHandle> start_session(ChargerId charger_id) = 0;

    /// \brief Attach to a session that already exists remotely (e.g. started before this process).
    virtual std::unique_ptr<SessionHandle> attach_session(SessionId session_id) = 0;

    /// \brief Send a new amperage limit without waiting for the device to apply it.
    virtual void request_amperage_limit(ChargerId charger_id, int amps) = 0;

    /// \brief Send a new amperage limit and poll status until the device reflects it.
    /// The default implementation retries according to the amperage retry policy and throws
    /// ActuatorCommunicationError when the limit does not persist.
    virtual void set_amperage(ChargerId charger_id, int amps);

    void set_amperage_retry(RetryPolicy policy, Sleeper sleeper);

protected:
    RetryPolicy amperage_retry_{};
    Sleeper retry_sleeper_{thread_sleeper()};
};

} // namespace solarcharge
