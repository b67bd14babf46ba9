/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file clock.cpp
 * @brief Wall clock access and bounded clock waits.
 */

#include "tagid/infra/clock.hpp"

#include "tagid/core/error.hpp"
#include "tagid/infra/logger.hpp"

#include <thread>

namespace tagid::infra {

int64_t system_millis()
{
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

ClockFn system_clock()
{
    return &system_millis;
}

int64_t wait_for_clock(const ClockFn& clock, int64_t target_ms, std::chrono::milliseconds max_wait)
{
    const auto bound = std::clamp(max_wait, std::chrono::milliseconds(0), kMaxClockWait);
    const auto deadline = std::chrono::steady_clock::now() + bound;
    int64_t now = clock();
    while (now < target_ms) {
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::microseconds(100));
        now = clock();
    }
    return now;
}

int64_t settle_clock(const ClockFn& clock, int64_t observed_ms, int64_t last_ms,
                     const ClockPolicy& policy, const std::string& generator)
{
    if (observed_ms >= last_ms) {
        return observed_ms;
    }

    Logger::log(LogLevel::WARN, generator + ": clock moved backward by " +
                                    std::to_string(last_ms - observed_ms) + " ms");

    if (policy.mode == ClockPolicy::Mode::Fail) {
        throw ClockRegression(generator, last_ms, observed_ms);
    }

    int64_t now = wait_for_clock(clock, last_ms, policy.max_wait);
    if (now < last_ms) {
        throw ClockRegression(generator, last_ms, now);
    }
    return now;
}

int64_t wait_next_millis(const ClockFn& clock, int64_t last_ms, const ClockPolicy& policy,
                         const std::string& generator)
{
    Logger::log(LogLevel::TRACE, generator + ": sequence exhausted at " + std::to_string(last_ms) +
                                     ", waiting for next millisecond");

    // A short floor keeps Fail-mode generators from giving up within the same millisecond.
    auto bound = policy.max_wait;
    if (bound < std::chrono::milliseconds(2)) {
        bound = std::chrono::milliseconds(2);
    }

    int64_t now = wait_for_clock(clock, last_ms + 1, bound);
    if (now <= last_ms) {
        throw GenerationFailure(generator + ": sequence exhausted and clock did not advance past " +
                                std::to_string(last_ms));
    }
    return now;
}

} // namespace tagid::infra
