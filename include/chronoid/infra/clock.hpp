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
 * @file clock.hpp
 * @brief Conversion of system time into UUID timestamp ticks.
 *
 * @details
 * A tick is one 100-nanosecond interval. UUID timestamps count ticks from the
 * Gregorian epoch (1582-10-15T00:00:00Z) rather than from the Unix epoch, so the
 * Unix-relative nanosecond count is shifted before it is scaled down.
 */

#pragma once

#include <cstdint>

namespace chronoid::infra {

/**
 * @class Clock
 * @brief Static helpers producing 60-bit UUID timestamps.
 */
class Clock {
  public:
    /// Nanosecond shift added to Unix time before scaling to ticks.
    static constexpr std::uint64_t kEpochShiftNanos = 1221929280000000ULL;

    /// Nanoseconds per UUID tick.
    static constexpr std::uint64_t kNanosPerTick = 100;

    /// Nanoseconds per second.
    static constexpr std::uint64_t kNanosPerSecond = 1000000000ULL;

    /**
     * @brief Samples the system clock and returns the current UUID tick count.
     *
     * The reading is split into whole seconds and a sub-second remainder, so no
     * intermediate nanosecond count can overflow.
     *
     * @throws ClockFault if the clock reads before the Unix epoch, or if the
     * shifted nanosecond count does not fit in 64 bits.
     */
    static std::uint64_t now_ticks();

    /**
     * @brief Converts a Unix time into UUID ticks.
     *
     * Computes `(seconds * 1e9 + nanos + kEpochShiftNanos) / kNanosPerTick`, truncating.
     *
     * @param seconds Whole seconds since 1970-01-01T00:00:00Z.
     * @param nanos Sub-second part, below one second.
     * @throws ClockFault if `seconds` is negative, `nanos` is a second or more, or
     * the shifted nanosecond count overflows 64 bits.
     */
    static std::uint64_t ticks_from_unix_time(std::int64_t seconds, std::uint32_t nanos);

    /**
     * @brief Converts nanoseconds since the Unix epoch into UUID ticks.
     *
     * @throws ClockFault if `unix_nanos` is negative.
     */
    static std::uint64_t ticks_from_unix_nanos(std::int64_t unix_nanos);
};

} // namespace chronoid::infra
