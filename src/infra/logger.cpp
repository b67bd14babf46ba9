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
 * @file logger.cpp
 * @brief Implementation of the thread-safe diagnostic logging utility.
 *
 * @details
 * Formats `[YYYY-MM-DDTHH:MM:SS.mmmZ] [LEVL] message` and applies the
 * process-wide severity threshold. ANSI colors are only emitted when the target
 * stream is a terminal, so piped `tagid-mint` output stays plain.
 */

#include "tagid/infra/logger.hpp"

#include "tagid/core/error.hpp"
#include "tagid/infra/string.hpp"
#include "tagid/infra/timestamp.hpp"

#include <iostream>

#include <unistd.h>

namespace tagid::infra {

std::mutex Logger::mutex_;
std::atomic<LogLevel> Logger::threshold_{LogLevel::WARN};
std::atomic<LogRoute> Logger::route_{LogRoute::Split};

void Logger::set_level(LogLevel level) noexcept
{
    threshold_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() noexcept
{
    return threshold_.load(std::memory_order_relaxed);
}

void Logger::set_route(LogRoute route) noexcept
{
    route_.store(route, std::memory_order_relaxed);
}

LogRoute Logger::route() noexcept
{
    return route_.load(std::memory_order_relaxed);
}

bool Logger::enabled(LogLevel level) noexcept
{
    return level >= threshold_.load(std::memory_order_relaxed);
}

LogLevel Logger::parse_level(std::string_view name)
{
    std::string key = String::to_lower(String::trim(std::string(name)));
    if (key == "trace")
        return LogLevel::TRACE;
    if (key == "debug")
        return LogLevel::DEBUG;
    if (key == "info")
        return LogLevel::INFO;
    if (key == "warn" || key == "warning")
        return LogLevel::WARN;
    if (key == "error")
        return LogLevel::ERROR;
    if (key == "fatal")
        return LogLevel::FATAL;
    throw ConfigError("Config: unknown log level '" + std::string(name) + "'");
}

const char* Logger::level_name(LogLevel level) noexcept
{
    switch (level) {
    case LogLevel::TRACE:
        return "trace";
    case LogLevel::DEBUG:
        return "debug";
    case LogLevel::INFO:
        return "info";
    case LogLevel::WARN:
        return "warn";
    case LogLevel::ERROR:
        return "error";
    case LogLevel::FATAL:
        return "fatal";
    }
    return "unknown";
}

namespace {

struct LevelStyle {
    const char* tag;
    const char* color;
};

LevelStyle style_of(LogLevel level) noexcept
{
    switch (level) {
    case LogLevel::TRACE:
        return {"[TRCE]", "\033[90m"};
    case LogLevel::DEBUG:
        return {"[DBUG]", "\033[36m"};
    case LogLevel::INFO:
        return {"[INFO]", "\033[32m"};
    case LogLevel::WARN:
        return {"[WARN]", "\033[33m"};
    case LogLevel::ERROR:
        return {"[FAIL]", "\033[31m"};
    case LogLevel::FATAL:
        return {"[CRIT]", "\033[1;31m"};
    }
    return {"[????]", ""};
}

} // namespace

/**
 * @brief Dispatches a formatted log entry to the appropriate system stream.
 *
 * Operational Logic:
 * 1. **Filtering**: Drops the entry early when below the threshold.
 * 2. **Synchronization**: Holds the mutex for the whole line so threads never interleave.
 * 3. **Stream Segregation**: `WARN` and above go to `stderr`; the rest go to `stdout`
 *    unless the route is `LogRoute::StderrOnly`.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    if (!enabled(level))
        return;

    const bool to_stderr =
        level >= LogLevel::WARN || route_.load(std::memory_order_relaxed) == LogRoute::StderrOnly;
    const bool colored = ::isatty(to_stderr ? STDERR_FILENO : STDOUT_FILENO) != 0;
    const LevelStyle style = style_of(level);
    const std::string stamp = Timestamp::now().to_iso();

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& stream = to_stderr ? std::cerr : std::cout;

    stream << "[" << stamp << "] ";
    if (colored) {
        stream << style.color << style.tag << " " << message << "\033[0m";
    } else {
        stream << style.tag << " " << message;
    }
    stream << std::endl;
}

} // namespace tagid::infra
