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
 * @brief Thread-safe diagnostic logging facility for HostUID.
 *
 * @details
 * This header declares the `Logger` class, the centralized reporting interface
 * for the identifier generator and its command line front-end. Output to the
 * standard streams is serialized across threads, and a process-wide severity
 * threshold filters out messages below the configured level.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace hostuid::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 *
 * Used to categorize the criticality of log entries and determine the
 * appropriate output stream (Standard Output vs. Standard Error).
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Diagnostic information (e.g., host discriminant initialization).
    INFO,  ///< Nominal operational events.
    WARN,  ///< Non-blocking anomalies (e.g., system clock regression).
    ERROR, ///< Recoverable runtime errors.
    FATAL  ///< Failures that terminate the command.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * An internal mutex serializes access to the console so that entries written by
 * concurrent generator threads remain distinct. Messages below the current
 * threshold (see `set_level`) are discarded before the lock is taken.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * hostuid::infra::Logger::log(LogLevel::WARN, "Generator: clock moved backwards");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that will be written.
     * @param level Messages strictly below this level are dropped.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /**
     * @brief Parses a level name (`trace`, `debug`, `info`, `warn`, `error`, `fatal`).
     *
     * Matching is case-insensitive.
     *
     * @throws std::invalid_argument If the name does not denote a level.
     */
    static LogLevel parse_level(const std::string& name);

  private:
    /// @brief Guards access to `std::cout` and `std::cerr`.
    static std::mutex mutex_;

    /// @brief Current threshold, read without the lock on the fast path.
    static std::atomic<LogLevel> threshold_;
};

} // namespace hostuid::infra
