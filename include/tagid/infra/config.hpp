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
 * @file config.hpp
 * @brief Process configuration read from `TAGID_*` environment variables.
 *
 * @details
 * | Variable | Values | Default |
 * |---|---|---|
 * | `TAGID_LOG_LEVEL` | trace, debug, info, warn, error, fatal | warn |
 * | `TAGID_MACHINE_ID` | 0..31 | 1 |
 * | `TAGID_NODE_ID` | 0..31 | 1 |
 * | `TAGID_SNOWFLAKE_STRATEGY` | real_time, generate, lazy | real_time |
 * | `TAGID_CLOCK_POLICY` | wait, fail | wait |
 * | `TAGID_CLOCK_MAX_WAIT_MS` | 0..60000 | 50 |
 *
 * Unset or empty variables take the default. Anything else that does not parse
 * raises `tagid::ConfigError`; the loader never silently falls back.
 */

#pragma once

#include "tagid/infra/clock.hpp"
#include "tagid/infra/logger.hpp"

#include <functional>
#include <optional>
#include <string>

namespace tagid::infra {

/**
 * @struct Config
 * @brief Resolved settings for the logger and the process-wide Snowflake generator.
 */
struct Config {
    /// @brief Reads one variable; `std::nullopt` when unset.
    using Lookup = std::function<std::optional<std::string>(const std::string&)>;

    LogLevel log_level = LogLevel::WARN;
    int machine_id = 1;
    int node_id = 1;

    /// @brief Lower-case strategy name, one of `real_time`, `generate`, `lazy`.
    std::string snowflake_strategy = "real_time";

    ClockPolicy clock_policy;

    /// @brief Loads from the process environment.
    static Config from_env();

    /**
     * @brief Loads from an arbitrary variable source.
     * @throws tagid::ConfigError On the first invalid value.
     */
    static Config from_lookup(const Lookup& lookup);

    /// @brief Pushes `log_level` into the Logger.
    void apply() const;
};

} // namespace tagid::infra
