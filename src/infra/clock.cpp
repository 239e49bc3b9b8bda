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
 * @file clock.cpp
 * @brief Implementation of the UUID tick clock.
 */

#include "chronoid/infra/clock.hpp"

#include "chronoid/infra/error.hpp"
#include "chronoid/infra/logger.hpp"

#include <chrono>
#include <limits>
#include <string>

namespace chronoid::infra {

std::uint64_t Clock::now_ticks()
{
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    auto seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
    auto sub_second =
        std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds).count();
    return ticks_from_unix_time(static_cast<std::int64_t>(seconds.count()),
                                static_cast<std::uint32_t>(sub_second));
}

std::uint64_t Clock::ticks_from_unix_time(std::int64_t seconds, std::uint32_t nanos)
{
    if (seconds < 0) {
        std::string reason =
            "Clock: System time is before the Unix epoch (" + std::to_string(seconds) + " s)";
        Logger::log(LogLevel::ERROR, reason);
        throw ClockFault(reason);
    }
    if (nanos >= kNanosPerSecond) {
        std::string reason = "Clock: Sub-second part out of range (" + std::to_string(nanos) + " ns)";
        Logger::log(LogLevel::ERROR, reason);
        throw ClockFault(reason);
    }

    // seconds * 1e9 + nanos + shift must fit in 64 bits.
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    auto whole = static_cast<std::uint64_t>(seconds);
    if (whole > (kMax - kEpochShiftNanos - nanos) / kNanosPerSecond) {
        std::string reason = "Clock: Time is completely off, epoch shift overflows (" +
                             std::to_string(seconds) + " s)";
        Logger::log(LogLevel::ERROR, reason);
        throw ClockFault(reason);
    }

    return (whole * kNanosPerSecond + nanos + kEpochShiftNanos) / kNanosPerTick;
}

std::uint64_t Clock::ticks_from_unix_nanos(std::int64_t unix_nanos)
{
    if (unix_nanos < 0) {
        std::string reason = "Clock: System time is before the Unix epoch (" +
                             std::to_string(unix_nanos) + " ns)";
        Logger::log(LogLevel::ERROR, reason);
        throw ClockFault(reason);
    }

    const auto per_second = static_cast<std::int64_t>(kNanosPerSecond);
    return ticks_from_unix_time(unix_nanos / per_second,
                                static_cast<std::uint32_t>(unix_nanos % per_second));
}

} // namespace chronoid::infra
