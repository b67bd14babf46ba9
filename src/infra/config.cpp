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
 * @file config.cpp
 * @brief Environment variable parsing for tagid.
 */

#include "tagid/infra/config.hpp"

#include "tagid/core/error.hpp"
#include "tagid/infra/string.hpp"

#include <cstdlib>
#include <string>

namespace tagid::infra {

namespace {

int parse_node_component(const std::string& name, const std::string& value)
{
    auto parsed = String::parse_int64(value);
    if (!parsed || *parsed < 0 || *parsed > 31) {
        throw ConfigError("Config: " + name + " must be an integer in [0, 31], got '" + value + "'");
    }
    return static_cast<int>(*parsed);
}

} // namespace

Config Config::from_env()
{
    return from_lookup([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

Config Config::from_lookup(const Lookup& lookup)
{
    Config config;

    auto read = [&lookup](const char* name) -> std::optional<std::string> {
        auto raw = lookup(name);
        if (!raw) {
            return std::nullopt;
        }
        std::string value = String::trim(*raw);
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    };

    if (auto v = read("TAGID_LOG_LEVEL")) {
        config.log_level = Logger::parse_level(*v);
    }
    if (auto v = read("TAGID_MACHINE_ID")) {
        config.machine_id = parse_node_component("TAGID_MACHINE_ID", *v);
    }
    if (auto v = read("TAGID_NODE_ID")) {
        config.node_id = parse_node_component("TAGID_NODE_ID", *v);
    }
    if (auto v = read("TAGID_SNOWFLAKE_STRATEGY")) {
        std::string key = String::to_lower(*v);
        if (key != "real_time" && key != "generate" && key != "lazy") {
            throw ConfigError("Config: TAGID_SNOWFLAKE_STRATEGY must be real_time, generate or lazy, got '" +
                              *v + "'");
        }
        config.snowflake_strategy = key;
    }
    if (auto v = read("TAGID_CLOCK_POLICY")) {
        std::string key = String::to_lower(*v);
        if (key == "wait") {
            config.clock_policy.mode = ClockPolicy::Mode::Wait;
        } else if (key == "fail") {
            config.clock_policy.mode = ClockPolicy::Mode::Fail;
        } else {
            throw ConfigError("Config: TAGID_CLOCK_POLICY must be wait or fail, got '" + *v + "'");
        }
    }
    if (auto v = read("TAGID_CLOCK_MAX_WAIT_MS")) {
        auto parsed = String::parse_int64(*v);
        if (!parsed || *parsed < 0 || *parsed > kMaxClockWait.count()) {
            throw ConfigError("Config: TAGID_CLOCK_MAX_WAIT_MS must be an integer in [0, " +
                              std::to_string(kMaxClockWait.count()) + "], got '" + *v + "'");
        }
        config.clock_policy.max_wait = std::chrono::milliseconds(*parsed);
    }

    return config;
}

void Config::apply() const
{
    Logger::set_level(log_level);
    Logger::log(LogLevel::DEBUG, std::string("Config: log level set to ") + Logger::level_name(log_level));
}

} // namespace tagid::infra
