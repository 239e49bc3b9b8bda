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
 * @brief Thread-safe, level-filtered diagnostic logging for chronoid.
 *
 * @details
 * Generators are single-owner objects, but several of them may live in different
 * threads of a host process. The logger is therefore the one piece of shared state
 * in the library and serializes every write behind a single mutex.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace chronoid::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-identifier events (e.g., counter cycle reseeds).
    DEBUG, ///< Generator construction and configuration details.
    INFO,  ///< Nominal operational events.
    WARN,  ///< Non-blocking anomalies.
    ERROR, ///< Failures surfaced to the caller as exceptions.
    FATAL  ///< Failures the host process cannot continue from.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Messages below the current threshold are discarded before the lock is taken.
 * The threshold defaults to `LogLevel::INFO`.
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
     * chronoid::infra::Logger::log(LogLevel::DEBUG, "RawGenerator: Seeded.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that will be emitted.
     */
    static void set_level(LogLevel level);

    /**
     * @brief Returns the current minimum severity.
     */
    static LogLevel level();

    /**
     * @brief Returns true if a message of the given severity would be emitted.
     *
     * Lets callers skip building expensive messages on hot paths.
     */
    static bool enabled(LogLevel level);

    /**
     * @brief Parses a level name (`trace`, `debug`, `info`, `warn`, `error`, `fatal`).
     *
     * Matching is case-insensitive. `warning` is accepted as an alias of `warn`.
     *
     * @return The level, or `std::nullopt` for an unknown name.
     */
    static std::optional<LogLevel> parse_level(const std::string& name);

  private:
    /// Guards access to `std::cout` and `std::cerr`.
    static std::mutex mutex_;

    /// Current threshold, stored as the underlying enum value.
    static std::atomic<int> threshold_;
};

} // namespace chronoid::infra
