// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "charger_actuator.hpp"
#include "metrics_sink.hpp"
#include "retry.hpp"
#include "session_tracker.hpp"
#include "telemetry_source.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace solarcharge {

struct ControlLoopConfig {
    std::chrono::seconds tick_interval{60};
    std::chrono::seconds control_interval{300}; // also the averaging window and the failure backoff
    std::chrono::seconds slope_window{1800};
    double voltage_v{240.0};
    double low_production_w{500.0};
    std::string metrics_measurement{"solar_charge_control"};
};

struct ControlDecision {
    int target_amps{0};
    int confirmed_amps{0};
    WallClock::time_point timestamp{};
};

enum class TickOutcome {
    TelemetryUnavailable, // nothing read past telemetry, nothing actuated
    Evaluated,            // decision computed, actuation not due
    Actuated,
    ManualOverride,       // actuation due but skipped to respect an operator change
    ActuationFailed
};

const char* to_string(TickOutcome outcome);

/// \brief Solar-following charge controller.
///
/// Every tick reads telemetry and charger status, computes a target amperage and writes one metrics sample.
/// Actuation only happens once per control interval so noisy readings do not re-command the charger.
class ControlLoop {
public:
    ControlLoop(ControlLoopConfig cfg, ChargerId charger_id, std::shared_ptr<ChargerActuator> actuator,
                std::shared_ptr<TelemetrySource> telemetry, std::shared_ptr<SessionStateTracker> sessions,
                std::shared_ptr<MetricsSink> metrics, Sleeper sleeper = thread_sleeper());

    /// \brief Validate the charger's amperage ladder and log the start threshold. Throws on an empty ladder.
    void initialize();

    /// \brief One control tick at wall-clock time now. Actuator communication failures are handled here;
    /// any other exception propagates to the caller.
    TickOutcome tick(WallClock::time_point now);

    /// \brief Tick until keep_running clears. A failed tick is logged and followed by a control_interval backoff.
    void run(const std::atomic<bool>& keep_running);

    /// \brief Drive the charger and session toward target_amps. Returns the confirmed amperage (0 when stopping).
    /// Throws ActuatorCommunicationError when a remote call fails.
    int apply_charging_decision(const ChargerStatus& status, int target_amps, int min_amperage);

    /// \brief Target amperage for a sample and its predicted excess.
    int compute_target(const SolarSample& sample, double predicted_excess_w,
                       const std::vector<int>& allowed_amps) const;

    std::optional<int> last_set_amperage() const { return last_set_amperage_; }
    std::optional<WallClock::time_point> last_actuation() const { return last_actuation_; }
    std::optional<ControlDecision> last_decision() const { return last_decision_; }

private:
    ControlLoopConfig cfg_;
    ChargerId charger_id_;
    std::shared_ptr<ChargerActuator> actuator_;
    std::shared_ptr<TelemetrySource> telemetry_;
    std::shared_ptr<SessionStateTracker> sessions_;
    std::shared_ptr<MetricsSink> metrics_;
    Sleeper sleeper_;

    std::optional<WallClock::time_point> last_actuation_;
    std::optional<int> last_set_amperage_;
    std::optional<ControlDecision> last_decision_;

    bool actuation_due(WallClock::time_point now) const;
    bool manual_override_detected(const ChargerStatus& status) const;
    void emit_metrics(const SolarSample& sample, double predicted_excess_w, double charging_w, int target_amps,
                      int current_amps);
};

} // namespace solarcharge
