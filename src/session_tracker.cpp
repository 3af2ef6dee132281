// SPDX-License-Identifier: Apache-2.0
#include "session_tracker.hpp"

#include <stdexcept>
#include <utility>

#include <everest/logging.hpp>

namespace solarcharge {

SessionStateTracker::SessionStateTracker(std::shared_ptr<ChargerActuator> actuator) : actuator_(std::move(actuator)) {
    if (!actuator_) {
        throw std::invalid_argument("SessionStateTracker requires an actuator");
    }
}

bool SessionStateTracker::adopt_existing() {
    try {
        const auto status = actuator_->get_user_charging_status();
        if (!status) {
            EVLOG_info << "No active charging session found.";
            return false;
        }
        take(actuator_->attach_session(status->session_id));
        EVLOG_info << "Adopted existing charging session " << session_.session_id << " on charger "
                   << session_.charger_id;
        return true;
    } catch (const std::exception& e) {
        EVLOG_warning << "Failed to check for existing charging session: " << e.what();
        clear();
        return false;
    }
}

const ChargingSession& SessionStateTracker::start(ChargerId charger_id) {
    if (active()) {
        EVLOG_debug << "Session " << session_.session_id << " already active; not starting another";
        return session_;
    }
    take(actuator_->start_session(charger_id));
    EVLOG_info << "Started charging session " << session_.session_id;
    return session_;
}

void SessionStateTracker::stop() {
    if (!active()) {
        return;
    }
    const auto id = session_.session_id;
    handle_->stop();
    clear();
    EVLOG_info << "Stopped charging session " << id;
}

bool SessionStateTracker::refresh() {
    if (!active()) {
        return false;
    }
    try {
        handle_->refresh();
        session_.power_kw = handle_->power_kw();
        return true;
    } catch (const std::exception& e) {
        EVLOG_warning << "Failed to refresh charging session " << session_.session_id << ": " << e.what()
                      << ". Dropping session.";
        clear();
        return false;
    }
}

double SessionStateTracker::current_power_w() {
    if (!refresh()) {
        return 0.0;
    }
    const double watts = session_.power_kw * 1000.0;
    EVLOG_debug << "Current charging power from session " << session_.session_id << ": " << watts << "W";
    return watts;
}

void SessionStateTracker::take(std::unique_ptr<SessionHandle> handle) {
    if (!handle) {
        throw ActuatorCommunicationError("Charger returned no session handle");
    }
    handle_ = std::move(handle);
    session_.session_id = handle_->session_id();
    session_.charger_id = handle_->charger_id();
    session_.started_at = handle_->started_at();
    session_.power_kw = handle_->power_kw();
    session_.state = SessionState::Active;
}

void SessionStateTracker::clear() {
    handle_.reset();
    session_ = ChargingSession{};
}

} // namespace solarcharge
