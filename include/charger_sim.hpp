// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "charger_actuator.hpp"
#include "controller_config.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>

namespace solarcharge {

/// \brief In-process home charger so the control loop can run without the vendor cloud.
///
/// Models the awkward parts of the real device: a requested amperage limit only shows up in status after
/// a number of status reads, sessions can disappear remotely, and any call can fail.
class SimulatedCharger : public ChargerActuator {
public:
    struct FaultOverride {
        bool comm_fault{false};   // every remote call throws ActuatorCommunicationError
        bool never_settle{false}; // requested limits are accepted but never applied
        bool reject_start{false};
    };

    struct CallCounters {
        int status_reads{0};
        int amperage_requests{0};
        int session_starts{0};
        int session_stops{0};
    };

    explicit SimulatedCharger(const SimulationConfig& cfg);
    ~SimulatedCharger() override = default;

    std::vector<ChargerId> get_home_chargers() override;
    ChargerStatus get_status(ChargerId charger_id) override;
    std::optional<UserChargingStatus> get_user_charging_status() override;
    std::unique_ptr<SessionHandle> start_session(ChargerId charger_id) override;
    std::unique_ptr<SessionHandle> attach_session(SessionId session_id) override;
    void request_amperage_limit(ChargerId charger_id, int amps) override;

    // Session calls made by SimulatedSession handles
    double session_power_kw(SessionId session_id);
    void stop_session(SessionId session_id);

    // Simulation controls for tests/harnesses
    void set_fault_override(const FaultOverride& fault);
    void clear_fault_override();
    void set_plugged_in(bool plugged);
    /// \brief Operator changes the limit and starts charging from the app, outside the controller.
    SessionId begin_external_session(int amps);
    /// \brief Remote session ends without the controller stopping it (vehicle full, cable pulled).
    void end_session_remotely();
    CallCounters counters() const;
    void reset_counters();

private:
    struct RemoteSession {
        SessionId id{0};
        std::chrono::system_clock::time_point started_at;
    };

    mutable std::mutex mutex_;
    SimulationConfig cfg_;
    int amperage_limit_{0};
    std::optional<int> pending_limit_;
    int pending_polls_{0};
    bool plugged_in_{true};
    std::optional<RemoteSession> session_;
    SessionId next_session_id_{1000};
    FaultOverride fault_;
    CallCounters counters_;

    void check_link() const;
    void check_charger(ChargerId charger_id) const;
    SessionId open_session_locked();
};

} // namespace solarcharge
