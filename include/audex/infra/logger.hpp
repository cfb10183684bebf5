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
 * @brief Process-wide diagnostic logging for the Audex change-capture layer.
 *
 * @details
 * This is the operator-facing diagnostics channel (startup, scan summaries,
 * storage faults). It is unrelated to the audit log entries produced by the
 * capture pipeline, which are domain records persisted by the storage layer.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace audex::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-entity decisions inside a flush cycle.
    DEBUG, ///< Scan summaries and commit cycle boundaries.
    INFO,  ///< Nominal lifecycle events.
    WARN,  ///< Suspicious but tolerated conditions.
    ERROR, ///< Failed operations that were reported to the caller.
    FATAL  ///< Unrecoverable failures.
};

/**
 * @class Logger
 * @brief A static, thread-safe console logger with a global severity threshold.
 *
 * @details
 * Messages below the configured threshold are discarded before the lock is taken.
 * `WARN` and above go to `std::cerr`, everything else to `std::cout`.
 *
 * @code
 * audex::infra::Logger::set_level(audex::infra::LogLevel::DEBUG);
 * audex::infra::Logger::log(audex::infra::LogLevel::DEBUG, "Audit: scan complete.");
 * @endcode
 */
class Logger {
  public:
    /**
     * @brief Writes a timestamped, severity-tagged message.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that will be emitted.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /**
     * @brief Parses a case-insensitive level name (`trace` ... `fatal`).
     *
     * @throws std::invalid_argument If the name is not a known level.
     */
    static LogLevel parse_level(const std::string& name);

  private:
    /// @brief Serializes writes to the standard streams.
    static std::mutex mutex_;

    /// @brief Current threshold. Defaults to `INFO`.
    static std::atomic<LogLevel> threshold_;
};

} // namespace audex::infra
