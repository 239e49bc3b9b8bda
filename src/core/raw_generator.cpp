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
 * @file raw_generator.cpp
 * @brief Implementation of UUIDv6 field packing and counter management.
 */

#include "chronoid/core/raw_generator.hpp"

#include "chronoid/infra/clock.hpp"
#include "chronoid/infra/entropy.hpp"
#include "chronoid/infra/logger.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace chronoid::core {

RawGenerator::RawGenerator(const NodeId& node)
    : ts_(infra::Clock::now_ticks()), counter_(infra::Entropy::next_u16()),
      initial_counter_(counter_), node_(node)
{
    if (infra::Logger::enabled(infra::LogLevel::DEBUG)) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "RawGenerator: Seeded node " + node_.to_string() + " at tick " +
                               std::to_string(ts_) + ", counter " + std::to_string(counter_));
    }
}

RawGenerator::RawGenerator(const NodeId& node, std::uint64_t timestamp, std::uint16_t counter)
    : ts_(timestamp), counter_(counter), initial_counter_(counter), node_(node)
{
}

/**
 * @brief Packs the current state into a UUIDv6 and advances the counter.
 *
 * Packing Steps:
 * 1. **Timestamp**: `ts << 4` is written big-endian over bytes 0..7, leaving the
 * low nibble of byte 7 zero.
 * 2. **Version**: Bytes 6..7 are read back, shifted right by one nibble and
 * prefixed with the version, so the low 12 timestamp bits follow the `6`.
 * 3. **Counter**: Written big-endian over bytes 8..9, then incremented with
 * 16-bit wraparound. Returning to the seed value forces a reseed.
 * 4. **Node**: Copied over bytes 10..15.
 *
 * State is committed only after a reseed succeeds. If the reseed throws, the
 * generator is unchanged and the identifier packed by this call is never returned,
 * so a retry emits that same identifier once rather than repeating a cycle.
 */
RawGenerator::Bytes RawGenerator::create()
{
    Bytes buf{};

    const std::uint64_t shifted = ts_ << 4;
    for (std::size_t i = 0; i < 8; ++i) {
        buf[i] = static_cast<std::uint8_t>(shifted >> (56 - 8 * i));
    }

    const auto time_hi = static_cast<std::uint16_t>((buf[6] << 8) | buf[7]);
    const auto versioned = static_cast<std::uint16_t>((kVersion << 12) | (time_hi >> 4));
    buf[6] = static_cast<std::uint8_t>(versioned >> 8);
    buf[7] = static_cast<std::uint8_t>(versioned & 0xff);

    buf[8] = static_cast<std::uint8_t>(counter_ >> 8);
    buf[9] = static_cast<std::uint8_t>(counter_ & 0xff);

    const auto next = static_cast<std::uint16_t>(counter_ + 1);
    if (next == initial_counter_) {
        reseed();
    } else {
        counter_ = next;
    }

    std::copy(node_.bytes().begin(), node_.bytes().end(), buf.begin() + 10);
    return buf;
}

Sequence<RawGenerator> RawGenerator::into_sequence() &&
{
    return Sequence<RawGenerator>(std::move(*this));
}

void RawGenerator::reseed()
{
    if (infra::Logger::enabled(infra::LogLevel::TRACE)) {
        infra::Logger::log(infra::LogLevel::TRACE,
                           "RawGenerator: Counter cycle complete at tick " + std::to_string(ts_) +
                               ", reseeding");
    }

    RawGenerator fresh(node_);
    *this = fresh;
}

} // namespace chronoid::core
