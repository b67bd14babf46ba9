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
 * @file clock.hpp
 * @brief Injectable wall clock and the clock-regression policy of time-ordered generators.
 *
 * @details
 * Snowflake and ULID generators embed the current time in every value. They read it
 * through a `ClockFn` so tests can substitute a scripted clock, and they resolve two
 * anomalies through the helpers below:
 *
 * - **Regression**: the clock reads earlier than the last issued timestamp.
 *   Governed by `ClockPolicy`: either fail at once, or wait (bounded) for the
 *   clock to catch up.
 * - **Exhaustion**: every value of the current millisecond has been issued.
 *   The generator waits (same bound) for the next millisecond.
 *
 * No wait is ever unbounded.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace tagid::infra {

/// @brief Ceiling applied to every clock wait; also the largest configurable `max_wait`.
inline constexpr std::chrono::milliseconds kMaxClockWait{60000};

/// @brief Source of the current time in milliseconds since the UNIX epoch.
using ClockFn = std::function<int64_t()>;

/// @brief Reads `std::chrono::system_clock` in UNIX milliseconds.
int64_t system_millis();

/// @brief A `ClockFn` bound to `system_millis`.
ClockFn system_clock();

/**
 * @struct ClockPolicy
 * @brief Behavior of a time-ordered generator when the clock moves backward.
 */
struct ClockPolicy {
    enum class Mode {
        Wait, ///< Block until the clock catches up, at most `max_wait`, then fail.
        Fail  ///< Throw `ClockRegression` immediately.
    };

    Mode mode = Mode::Wait;

    /// @brief Upper bound on any wait (regression or sequence exhaustion), capped at `kMaxClockWait`.
    std::chrono::milliseconds max_wait{50};

    static ClockPolicy wait(std::chrono::milliseconds max_wait = std::chrono::milliseconds(50))
    {
        return ClockPolicy{Mode::Wait, std::min(max_wait, kMaxClockWait)};
    }

    static ClockPolicy fail() { return ClockPolicy{Mode::Fail, std::chrono::milliseconds(0)}; }
};

/**
 * @brief Polls @p clock until it reads at least @p target_ms or @p max_wait elapses.
 *
 * The deadline is measured on `std::chrono::steady_clock`, independent of @p clock.
 * @p max_wait is clamped to [0, `kMaxClockWait`].
 *
 * @return The last reading, which is below @p target_ms if the wait timed out.
 */
int64_t wait_for_clock(const ClockFn& clock, int64_t target_ms, std::chrono::milliseconds max_wait);

/**
 * @brief Applies @p policy to a reading that may lie behind the last issued timestamp.
 *
 * @param clock The generator's clock, re-read while waiting.
 * @param observed_ms The reading just taken.
 * @param last_ms The timestamp of the last issued value.
 * @param policy The regression policy.
 * @param generator Name used in log lines and the exception message.
 * @return A reading that is `>= last_ms`.
 * @throws tagid::ClockRegression If the policy is `Fail`, or the wait timed out.
 */
int64_t settle_clock(const ClockFn& clock, int64_t observed_ms, int64_t last_ms,
                     const ClockPolicy& policy, const std::string& generator);

/**
 * @brief Waits for the first reading strictly after @p last_ms.
 *
 * Used when a millisecond's worth of sequence numbers is exhausted.
 *
 * @throws tagid::GenerationFailure If the clock does not advance within `policy.max_wait`.
 */
int64_t wait_next_millis(const ClockFn& clock, int64_t last_ms, const ClockPolicy& policy,
                         const std::string& generator);

} // namespace tagid::infra
