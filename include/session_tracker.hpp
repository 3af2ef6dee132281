// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "charger_actuator.hpp"

#include <chrono>
#include <memory>
#include <optional>

namespace solarcharge {

enum class SessionState { None, Active };

struct ChargingSession {
    SessionId session_id{0};
    ChargerId charger_id{0};
    std::chrono::system_clock::time_point started_at{};
    double power_kw{0.0};
    SessionState state{SessionState::None};
};

/// \brief Owns the single charging session the loop may have open on the charger.
///
/// A failed refresh drops the session instead of raising; the next tick starts from NONE.
class SessionStateTracker {
public:
    explicit SessionStateTracker(std::shared_ptr<ChargerActuator> actuator);

    /// \brief Attach to a session the account already reports as charging. Returns true if one was adopted.
    bool adopt_existing();

    /// \brief Start a new session. No-op when one is already active.
    const ChargingSession& start(ChargerId charger_id);

    /// \brief Stop the active session, if any. A failed remote stop propagates and keeps the session.
    void stop();

    /// \brief Refresh the active session. Returns false (and clears state) when it is no longer valid.
    bool refresh();

    /// \brief Charging power in W; refreshes the session when one is active.
    double current_power_w();

    bool active() const { return handle_ != nullptr; }
    SessionState state() const { return active() ? SessionState::Active : SessionState::None; }
    const ChargingSession& session() const { return session_; }

private:
    std::shared_ptr<ChargerActuator> actuator_;
    std::unique_ptr<SessionHandle> handle_;
    ChargingSession session_;

    void take(std::unique_ptr<SessionHandle> handle);
    void clear();
};

} // namespace solarcharge
