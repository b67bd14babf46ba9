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
 * @file error.hpp
 * @brief Exception hierarchy reported by identifier generation and conversion.
 *
 * @details
 * Every failure surfaced by the library derives from `tagid::Error`, itself a
 * `std::runtime_error`, so callers that only care about "something went wrong"
 * can catch `std::exception` the same way the CLI entry point does.
 *
 * - `GenerationFailure`: a generator could not produce a raw value.
 * - `ClockRegression`: a time-ordered generator observed the clock moving backward.
 * - `FormatError`: a raw value could not be parsed from its external representation.
 * - `ConfigError`: a configuration value is missing a valid form or is out of range.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tagid {

/**
 * @class Error
 * @brief Root of all tagid exceptions.
 */
class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @class GenerationFailure
 * @brief The plugged-in generator could not produce a value.
 *
 * Raised from `Id::next()` and from every built-in generator. The core never
 * retries; retry policy, if any, belongs to the generator itself.
 */
class GenerationFailure : public Error {
  public:
    using Error::Error;
};

/**
 * @class ClockRegression
 * @brief The wall clock moved backward relative to the last issued timestamp.
 *
 * Carries both readings so callers can log or alert on the size of the jump.
 */
class ClockRegression : public GenerationFailure {
  public:
    /**
     * @param generator Name of the generator that observed the regression.
     * @param last_ms The timestamp (unix ms) embedded in the last issued value.
     * @param observed_ms The earlier timestamp just read from the clock.
     */
    ClockRegression(const std::string& generator, int64_t last_ms, int64_t observed_ms);

    int64_t last_ms() const noexcept { return last_ms_; }
    int64_t observed_ms() const noexcept { return observed_ms_; }

  private:
    int64_t last_ms_;
    int64_t observed_ms_;
};

/**
 * @class FormatError
 * @brief External text, JSON, or timestamp could not be parsed into the raw type.
 */
class FormatError : public Error {
  public:
    using Error::Error;
};

/**
 * @class ConfigError
 * @brief Invalid configuration (environment value, machine node range, ...).
 */
class ConfigError : public Error {
  public:
    using Error::Error;
};

} // namespace tagid
