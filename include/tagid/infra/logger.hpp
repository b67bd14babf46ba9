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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for tagid.
 *
 * @details
 * This header declares the `Logger` class, the single reporting channel used by
 * the generators (clock anomalies, singleton initialization), the configuration
 * loader, and the `tagid-mint` tool. Output to the standard streams is
 * serialized so that lines emitted by many minting threads never interleave.
 *
 * Unlike a service, a value-type library must stay quiet by default: entries
 * below the process-wide threshold (default `WARN`) are discarded before any
 * formatting work or locking takes place.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>

namespace tagid::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-value details (sequence numbers, waits).
    DEBUG, ///< Generator state transitions.
    INFO,  ///< Singleton initialization, tool progress.
    WARN,  ///< Clock anomalies and other recoverable surprises.
    ERROR, ///< A generation or conversion failed and is being reported upward.
    FATAL  ///< The tool cannot continue.
};

/**
 * @enum LogRoute
 * @brief Selects which standard stream receives the low-severity levels.
 */
enum class LogRoute {
    Split,     ///< `TRACE` through `INFO` on stdout, `WARN` and above on stderr.
    StderrOnly ///< Every level on stderr, leaving stdout to program output.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 */
class Logger {
  public:
    /**
     * @brief Dispatches a log message to the console if it passes the threshold.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * **Stream Routing Logic:**
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout` under `LogRoute::Split`,
     *   to `std::cerr` under `LogRoute::StderrOnly`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * tagid::infra::Logger::log(LogLevel::WARN, "Snowflake: clock moved backward by 3 ms");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum severity that reaches the console.
    static void set_level(LogLevel level) noexcept;

    /// @brief Returns the current threshold.
    static LogLevel level() noexcept;

    /// @brief Chooses where levels below `WARN` are written (default `Split`).
    static void set_route(LogRoute route) noexcept;

    static LogRoute route() noexcept;

    /// @brief True when a message at @p level would be written.
    static bool enabled(LogLevel level) noexcept;

    /**
     * @brief Parses a case-insensitive level name (`trace` .. `fatal`, also `warning`).
     *
     * @throws tagid::ConfigError If the name is not recognized.
     */
    static LogLevel parse_level(std::string_view name);

    /// @brief Lower-case name of a level, the inverse of `parse_level`.
    static const char* level_name(LogLevel level) noexcept;

  private:
    /// @brief Serializes whole lines on `std::cout`/`std::cerr`.
    static std::mutex mutex_;

    /// @brief Current threshold, readable without taking the mutex.
    static std::atomic<LogLevel> threshold_;

    static std::atomic<LogRoute> route_;
};

} // namespace tagid::infra
