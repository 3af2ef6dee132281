// SPDX-License-Identifier: Apache-2.0
#include "charger_sim.hpp"

#include <algorithm>
#include <utility>

#include <everest/logging.hpp>

namespace solarcharge {

namespace {

class SimulatedSession : public SessionHandle {
public:
    SimulatedSession(SimulatedCharger& charger, SessionId id, ChargerId charger_id,
                     std::chrono::system_clock::time_point started_at, double power_kw) :
        charger_(charger), id_(id), charger_id_(charger_id), started_at_(started_at), power_kw_(power_kw) {
    }

    SessionId session_id() const override {
        return id_;
    }
    ChargerId charger_id() const override {
        return charger_id_;
    }
    std::chrono::system_clock::time_point started_at() const override {
        return started_at_;
    }
    double power_kw() const override {
        return power_kw_;
    }

    void refresh() override {
        power_kw_ = charger_.session_power_kw(id_);
    }

    void stop() override {
        charger_.stop_session(id_);
        power_kw_ = 0.0;
    }

private:
    SimulatedCharger& charger_;
    SessionId id_;
    ChargerId charger_id_;
    std::chrono::system_clock::time_point started_at_;
    double power_kw_{0.0};
};

} // namespace

SimulatedCharger::SimulatedCharger(const SimulationConfig& cfg) : cfg_(cfg) {
    std::sort(cfg_.amperage_limits.begin(), cfg_.amperage_limits.end());
    cfg_.amperage_limits.erase(std::unique(cfg_.amperage_limits.begin(), cfg_.amperage_limits.end()),
                               cfg_.amperage_limits.end());
    amperage_limit_ = cfg_.initial_amperage;
    plugged_in_ = cfg_.plugged_in;
}

void SimulatedCharger::check_link() const {
    if (fault_.comm_fault) {
        throw ActuatorCommunicationError("Simulated charger unreachable");
    }
}

void SimulatedCharger::check_charger(ChargerId charger_id) const {
    if (charger_id != cfg_.charger_id) {
        throw ActuatorCommunicationError("Unknown charger id " + std::to_string(charger_id));
    }
}

std::vector<ChargerId> SimulatedCharger::get_home_chargers() {
    std::lock_guard<std::mutex> lock(mutex_);
    check_link();
    return {cfg_.charger_id};
}

ChargerStatus SimulatedCharger::get_status(ChargerId charger_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_link();
    check_charger(charger_id);
    counters_.status_reads++;

    if (pending_limit_ && !fault_.never_settle) {
        if (pending_polls_ <= 0) {
            amperage_limit_ = *pending_limit_;
            pending_limit_.reset();
        } else {
            pending_polls_--;
        }
    }

    ChargerStatus status;
    status.charger_id = cfg_.charger_id;
    status.amperage_limit = amperage_limit_;
    status.possible_amperage_limits = cfg_.amperage_limits;
    status.plugged_in = plugged_in_;
    status.charging_status = session_ ? ChargingStatus::Charging : ChargingStatus::Idle;
    return status;
}

std::optional<UserChargingStatus> SimulatedCharger::get_user_charging_status() {
    std::lock_guard<std::mutex> lock(mutex_);
    check_link();
    if (!session_) {
        return std::nullopt;
    }
    return UserChargingStatus{session_->id, cfg_.charger_id};
}

SessionId SimulatedCharger::open_session_locked() {
    session_ = RemoteSession{next_session_id_++, std::chrono::system_clock::now()};
    return session_->id;
}

std::unique_ptr<SessionHandle> SimulatedCharger::start_session(ChargerId charger_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_link();
    check_charger(charger_id);
    if (fault_.reject_start) {
        throw ActuatorCommunicationError("Charger rejected session start");
    }
    if (!plugged_in_) {
        throw ActuatorCommunicationError("Cannot start session: no vehicle plugged in");
    }
    counters_.session_starts++;
    if (!session_) {
        open_session_locked();
    }
    const double power_kw = amperage_limit_ * cfg_.voltage_v * cfg_.vehicle_power_factor / 1000.0;
    return std::make_unique<SimulatedSession>(*this, session_->id, cfg_.charger_id, session_->started_at, power_kw);
}

std::unique_ptr<SessionHandle> SimulatedCharger::attach_session(SessionId session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_link();
    if (!session_ || session_->id != session_id) {
        throw SessionInvalid("Session " + std::to_string(session_id) + " does not exist");
    }
    const double power_kw = amperage_limit_ * cfg_.voltage_v * cfg_.vehicle_power_factor / 1000.0;
    return std::make_unique<SimulatedSession>(*this, session_id, cfg_.charger_id, session_->started_at, power_kw);
}

void SimulatedCharger::request_amperage_limit(ChargerId charger_id, int amps) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_link();
    check_charger(charger_id);
    counters_.amperage_requests++;
    if (std::find(cfg_.amperage_limits.begin(), cfg_.amperage_limits.end(), amps) == cfg_.amperage_limits.end()) {
        throw ActuatorCommunicationError("Amperage " + std::to_string(amps) + "A is not supported by the charger");
    }
    pending_limit_ = amps;
    pending_polls_ = cfg_.settle_polls;
}

double SimulatedCharger::session_power_kw(SessionId session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_link();
    if (!session_ || session_->id != session_id) {
        throw SessionInvalid("Session " + std::to_string(session_id) + " is no longer active");
    }
    return amperage_limit_ * cfg_.voltage_v * cfg_.vehicle_power_factor / 1000.0;
}

void SimulatedCharger::stop_session(SessionId session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_link();
    counters_.session_stops++;
    if (session_ && session_->id == session_id) {
        session_.reset();
        return;
    }
    EVLOG_debug << "Stop for session " << session_id << " ignored; session already ended";
}

void SimulatedCharger::set_fault_override(const FaultOverride& fault) {
    std::lock_guard<std::mutex> lock(mutex_);
    fault_ = fault;
}

void SimulatedCharger::clear_fault_override() {
    std::lock_guard<std::mutex> lock(mutex_);
    fault_ = FaultOverride{};
}

void SimulatedCharger::set_plugged_in(bool plugged) {
    std::lock_guard<std::mutex> lock(mutex_);
    plugged_in_ = plugged;
    if (!plugged) {
        session_.reset();
    }
}

SessionId SimulatedCharger::begin_external_session(int amps) {
    std::lock_guard<std::mutex> lock(mutex_);
    amperage_limit_ = amps;
    pending_limit_.reset();
    plugged_in_ = true;
    if (session_) {
        return session_->id;
    }
    return open_session_locked();
}

void SimulatedCharger::end_session_remotely() {
    std::lock_guard<std::mutex> lock(mutex_);
    session_.reset();
}

SimulatedCharger::CallCounters SimulatedCharger::counters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

void SimulatedCharger::reset_counters() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_ = CallCounters{};
}

} // namespace solarcharge
