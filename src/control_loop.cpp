// SPDX-License-Identifier: Apache-2.0
#include "control_loop.hpp"

#include "amperage_decider.hpp"

#include <algorithm>
#include <iomanip>
#include <stdexcept>
#include <utility>

#include <everest/logging.hpp>

namespace solarcharge {

const char* to_string(TickOutcome outcome) {
    switch (outcome) {
    case TickOutcome::TelemetryUnavailable:
        return "TelemetryUnavailable";
    case TickOutcome::Evaluated:
        return "Evaluated";
    case TickOutcome::Actuated:
        return "Actuated";
    case TickOutcome::ManualOverride:
        return "ManualOverride";
    case TickOutcome::ActuationFailed:
        return "ActuationFailed";
    }
    return "Unknown";
}

ControlLoop::ControlLoop(ControlLoopConfig cfg, ChargerId charger_id, std::shared_ptr<ChargerActuator> actuator,
                         std::shared_ptr<TelemetrySource> telemetry, std::shared_ptr<SessionStateTracker> sessions,
                         std::shared_ptr<MetricsSink> metrics, Sleeper sleeper) :
    cfg_(std::move(cfg)),
    charger_id_(charger_id),
    actuator_(std::move(actuator)),
    telemetry_(std::move(telemetry)),
    sessions_(std::move(sessions)),
    metrics_(std::move(metrics)),
    sleeper_(std::move(sleeper)) {
    if (!actuator_ || !telemetry_ || !sessions_ || !metrics_) {
        throw std::invalid_argument("ControlLoop requires actuator, telemetry, session tracker and metrics sink");
    }
    if (!sleeper_) {
        sleeper_ = thread_sleeper();
    }
}

void ControlLoop::initialize() {
    const auto status = actuator_->get_status(charger_id_);
    if (status.possible_amperage_limits.empty()) {
        throw std::runtime_error("Charger " + std::to_string(charger_id_) + " reports no amperage limits");
    }
    const int min_amperage = status.min_amperage();
    EVLOG_info << "Using " << cfg_.control_interval.count() / 60 << "-min control interval and "
               << cfg_.slope_window.count() / 60 << "-min slope window";
    EVLOG_info << "Minimum amperage is " << min_amperage << "A, requiring at least "
               << minimum_excess_w(status.possible_amperage_limits, cfg_.voltage_v)
               << "W of solar excess to start charging.";
}

int ControlLoop::compute_target(const SolarSample& sample, double predicted_excess_w,
                                const std::vector<int>& allowed_amps) const {
    if (allowed_amps.empty()) {
        throw std::invalid_argument("Amperage ladder is empty");
    }
    const int max_amps = *std::max_element(allowed_amps.begin(), allowed_amps.end());
    if (sample.production_w < cfg_.low_production_w) {
        // Trace production: the solar signal is noise, charge at full rate.
        EVLOG_info << "Low production (" << sample.production_w << "W). Setting to max amperage " << max_amps
                   << "A.";
        return max_amps;
    }
    const double threshold = minimum_excess_w(allowed_amps, cfg_.voltage_v);
    if (predicted_excess_w >= threshold) {
        const int target = decide_amperage(predicted_excess_w, allowed_amps, cfg_.voltage_v);
        EVLOG_info << "Predicted excess solar (" << predicted_excess_w << "W). Setting amperage to " << target
                   << "A.";
        return target;
    }
    EVLOG_info << "Insufficient predicted excess solar (" << predicted_excess_w << "W) < minimum (" << threshold
               << "W). Stopping charging.";
    return 0;
}

bool ControlLoop::actuation_due(WallClock::time_point now) const {
    if (!last_actuation_) {
        return true;
    }
    return now - *last_actuation_ >= cfg_.control_interval;
}

bool ControlLoop::manual_override_detected(const ChargerStatus& status) const {
    // Best-effort: charging at the top step without us having commanded it usually means an operator did.
    const int max_amps = status.max_amperage();
    return status.charging_status == ChargingStatus::Charging && status.amperage_limit == max_amps &&
           last_set_amperage_ != max_amps;
}

TickOutcome ControlLoop::tick(WallClock::time_point now) {
    const auto sample = telemetry_->estimate(now, cfg_.control_interval, cfg_.slope_window);
    if (!sample) {
        EVLOG_warning << "No solar data. Skipping tick.";
        return TickOutcome::TelemetryUnavailable;
    }

    const auto status = actuator_->get_status(charger_id_);
    const double charging_w = sessions_->current_power_w();
    const double average_excess = -(sample->consumption_w - charging_w);
    const double control_s = static_cast<double>(cfg_.control_interval.count());
    const double predicted_excess = average_excess + sample->slope_w_per_s * control_s;

    EVLOG_info << std::fixed << std::setprecision(1) << cfg_.control_interval.count() / 60
               << "-min averages - Production: " << sample->production_w
               << "W, Grid Consumption: " << sample->consumption_w << "W, Current Charging Load: " << charging_w
               << "W, Average Excess: " << average_excess << "W, Solar Slope: " << std::setprecision(3)
               << sample->slope_w_per_s << "W/s, Predicted Excess: " << std::setprecision(1) << predicted_excess
               << "W";

    const int target = compute_target(*sample, predicted_excess, status.possible_amperage_limits);

    auto outcome = TickOutcome::Evaluated;
    if (actuation_due(now)) {
        if (manual_override_detected(status)) {
            EVLOG_info << "Charger is charging at " << status.amperage_limit
                       << "A which was not set by this controller; assuming manual override. Skipping adjustment.";
            outcome = TickOutcome::ManualOverride;
        } else {
            try {
                const int confirmed = apply_charging_decision(status, target, status.min_amperage());
                last_set_amperage_ = confirmed;
                last_actuation_ = now;
                last_decision_ = ControlDecision{target, confirmed, now};
                outcome = TickOutcome::Actuated;
            } catch (const ActuatorCommunicationError& e) {
                EVLOG_error << "Failed to apply charging decision: " << e.what();
                last_actuation_ = now;
                outcome = TickOutcome::ActuationFailed;
            }
        }
    }

    const auto after = actuator_->get_status(charger_id_);
    emit_metrics(*sample, predicted_excess, charging_w, target, after.amperage_limit);
    return outcome;
}

int ControlLoop::apply_charging_decision(const ChargerStatus& status, int target_amps, int min_amperage) {
    const int current_amperage = status.amperage_limit;

    if (target_amps == 0) {
        if (sessions_->active()) {
            sessions_->stop();
            EVLOG_info << "Stopped charging.";
        } else {
            EVLOG_info << "Already not charging.";
            if (current_amperage != min_amperage) {
                actuator_->set_amperage(charger_id_, min_amperage);
                EVLOG_info << "Amperage lowered to minimum " << min_amperage << "A.";
            }
        }
        return 0;
    }

    int confirmed = current_amperage;
    if (current_amperage != target_amps) {
        EVLOG_info << "Changing amperage from " << current_amperage << "A to " << target_amps << "A...";
        // The limit must not change underneath a live session.
        sessions_->stop();
        actuator_->set_amperage(charger_id_, target_amps);

        confirmed = actuator_->get_status(charger_id_).amperage_limit;
        if (confirmed == target_amps) {
            EVLOG_info << "Confirmed amperage: " << confirmed << "A.";
        } else {
            EVLOG_warning << "Amperage mismatch! Set " << target_amps << "A but charger reports " << confirmed
                          << "A.";
        }
    } else {
        EVLOG_info << "Amperage already set correctly (" << current_amperage << "A). No change needed.";
    }

    if (!sessions_->active() && status.plugged_in) {
        sessions_->start(charger_id_);
    }
    return confirmed;
}

void ControlLoop::emit_metrics(const SolarSample& sample, double predicted_excess_w, double charging_w,
                               int target_amps, int current_amps) {
    MetricFields fields;
    fields["solar_slope_w_per_s"] = sample.slope_w_per_s;
    fields["excess_solar_watts"] = predicted_excess_w;
    fields["charging_power_watts"] = charging_w;
    fields["target_amperage"] = static_cast<std::int64_t>(target_amps);
    fields["current_amperage"] = static_cast<std::int64_t>(current_amps);
    metrics_->write(cfg_.metrics_measurement, fields);
}

void ControlLoop::run(const std::atomic<bool>& keep_running) {
    const RetryPolicy failure_backoff{1, std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.control_interval)};
    while (keep_running) {
        const auto started = std::chrono::steady_clock::now();
        const bool ok = retry_with_delay(failure_backoff, sleeper_, [&]() {
            try {
                const auto outcome = tick(WallClock::now());
                EVLOG_debug << "Tick outcome: " << to_string(outcome);
                return true;
            } catch (const std::exception& e) {
                EVLOG_error << "Error in control loop: " << e.what();
                return false;
            }
        });
        if (!ok || !keep_running) {
            continue;
        }
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.tick_interval) - elapsed;
        if (remaining.count() > 0) {
            sleeper_(remaining);
        }
    }
    EVLOG_info << "Control loop stopped";
}

} // namespace solarcharge
