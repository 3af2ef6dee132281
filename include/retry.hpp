// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <functional>
#include <thread>

namespace solarcharge {

/// \brief Blocking wait used by retry loops and the control loop. Injected so tests can run without real delays.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline Sleeper thread_sleeper() {
    return [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
}

struct RetryPolicy {
    int max_attempts{5};
    std::chrono::milliseconds delay{1000};
};

/// \brief Run attempt() until it returns true or max_attempts is reached.
/// Every failed attempt, including the last one, is followed by a wait of policy.delay.
/// \returns true on success, false once the attempts are exhausted.
template <typename Attempt>
bool retry_with_delay(const RetryPolicy& policy, const Sleeper& sleep, Attempt&& attempt) {
    const int attempts = policy.max_attempts > 0 ? policy.max_attempts : 1;
    for (int i = 0; i < attempts; ++i) {
        if (attempt()) {
            return true;
        }
        if (sleep && policy.delay.count() > 0) {
            sleep(policy.delay);
        }
    }
    return false;
}

} // namespace solarcharge
