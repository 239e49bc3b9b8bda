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
 * Formats each entry with a local timestamp and an ANSI color-coded severity tag,
 * after filtering it against the process-wide threshold.
 */

#include "chronoid/infra/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace chronoid::infra {

std::mutex Logger::mutex_;
std::atomic<int> Logger::threshold_{static_cast<int>(LogLevel::INFO)};

void Logger::set_level(LogLevel level)
{
    threshold_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::level()
{
    return static_cast<LogLevel>(threshold_.load(std::memory_order_relaxed));
}

bool Logger::enabled(LogLevel level)
{
    return static_cast<int>(level) >= threshold_.load(std::memory_order_relaxed);
}

std::optional<LogLevel> Logger::parse_level(const std::string& name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace")
        return LogLevel::TRACE;
    if (lower == "debug")
        return LogLevel::DEBUG;
    if (lower == "info")
        return LogLevel::INFO;
    if (lower == "warn" || lower == "warning")
        return LogLevel::WARN;
    if (lower == "error")
        return LogLevel::ERROR;
    if (lower == "fatal")
        return LogLevel::FATAL;
    return std::nullopt;
}

/**
 * @brief Dispatches a formatted log entry to the appropriate system stream.
 *
 * Operational Logic:
 * 1. **Filtering**: Drops entries below the threshold without locking.
 * 2. **Synchronization**: Acquires a `lock_guard` to prevent interleaved output.
 * 3. **Stream Segregation**: Routes messages to `stdout` or `stderr` based on severity.
 * 4. **Stylization**: Injects ANSI escape sequences for visual categorization.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    if (!enabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    auto& stream = (level >= LogLevel::WARN) ? std::cerr : std::cout;

    // Mutex protects std::localtime's internal static buffer.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    switch (level) {
    case LogLevel::TRACE:
        stream << "\033[90m[TRCE] ";
        break;
    case LogLevel::DEBUG:
        stream << "\033[36m[DBUG] ";
        break;
    case LogLevel::INFO:
        stream << "\033[32m[INFO] ";
        break;
    case LogLevel::WARN:
        stream << "\033[33m[WARN] ";
        break;
    case LogLevel::ERROR:
        stream << "\033[31m[FAIL] ";
        break;
    case LogLevel::FATAL:
        stream << "\033[1;31m[CRIT] ";
        break;
    }

    stream << message << "\033[0m" << std::endl;
}

} // namespace chronoid::infra
