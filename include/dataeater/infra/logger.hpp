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
 * @brief Thread-safe diagnostic logging facility for DataEater.
 *
 * @details
 * Declares the `Logger` class, the single reporting interface used by the
 * identifier factory, the host identity probe and the command line tool.
 * Output to `stdout`/`stderr` is serialized across threads and filtered by a
 * process-wide minimum severity.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace dataeater::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages, lowest first.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details (e.g., rejected host id candidates).
    DEBUG, ///< Diagnostic information intended for development and troubleshooting.
    INFO,  ///< Nominal operational events (e.g., node id derivation).
    WARN,  ///< Non-blocking anomalies or potential misconfigurations.
    ERROR, ///< Recoverable runtime errors that do not halt the system.
    FATAL  ///< Critical failures requiring process termination.
};

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging capabilities.
 *
 * @details
 * Messages below the configured threshold are discarded before the lock is
 * taken. Everything else is written atomically, one line per call.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * dataeater::infra::Logger::log(LogLevel::INFO, "Factory: node id 0x2a");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that reaches the console.
     *
     * Defaults to `LogLevel::INFO`.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /// @brief Returns true if a message of @p level would be written.
    static bool enabled(LogLevel level);

    /**
     * @brief Maps a level name to a `LogLevel`.
     *
     * Accepts `trace`, `debug`, `info`, `warn`, `error` and `fatal` in any
     * letter case, with surrounding whitespace ignored.
     *
     * @return The level, or `std::nullopt` if the name is unknown.
     */
    static std::optional<LogLevel> parse_level(const std::string& name);

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved lines.
    static std::mutex mutex_;

    /// @brief Minimum severity, readable without taking `mutex_`.
    static std::atomic<LogLevel> threshold_;
};

} // namespace dataeater::infra
