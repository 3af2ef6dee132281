// SPDX-License-Identifier: Apache-2.0
#include "retry.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <vector>

using namespace solarcharge;

int main() {
    std::vector<std::chrono::milliseconds> sleeps;
    const Sleeper record = [&](std::chrono::milliseconds d) { sleeps.push_back(d); };

    // Success on the first attempt never sleeps.
    int calls = 0;
    bool ok = retry_with_delay(RetryPolicy{5, std::chrono::milliseconds(1000)}, record, [&]() {
        calls++;
        return true;
    });
    assert(ok);
    assert(calls == 1);
    assert(sleeps.empty());

    // Success on the third attempt sleeps after each of the two failures.
    calls = 0;
    ok = retry_with_delay(RetryPolicy{5, std::chrono::milliseconds(250)}, record, [&]() { return ++calls == 3; });
    assert(ok);
    assert(calls == 3);
    assert(sleeps.size() == 2);
    assert(sleeps[0] == std::chrono::milliseconds(250));

    // Exhausted attempts: every failure, including the last, is followed by the delay.
    sleeps.clear();
    calls = 0;
    ok = retry_with_delay(RetryPolicy{4, std::chrono::milliseconds(10)}, record, [&]() {
        calls++;
        return false;
    });
    assert(!ok);
    assert(calls == 4);
    assert(sleeps.size() == 4);

    // A single-attempt policy acts as a backoff after failure.
    sleeps.clear();
    ok = retry_with_delay(RetryPolicy{1, std::chrono::minutes(5)}, record, []() { return false; });
    assert(!ok);
    assert(sleeps.size() == 1);
    assert(sleeps.front() == std::chrono::milliseconds(300000));

    // Non-positive attempt counts still run once.
    calls = 0;
    ok = retry_with_delay(RetryPolicy{0, std::chrono::milliseconds(0)}, record, [&]() {
        calls++;
        return false;
    });
    assert(!ok);
    assert(calls == 1);

    std::cout << "retry_tests passed\n";
    return 0;
}
