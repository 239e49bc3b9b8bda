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
 * @file raw_generator.hpp
 * @brief Binary UUIDv6 generator.
 *
 * @details
 * This file declares `RawGenerator`, which owns a timestamp, a 16-bit counter and
 * a node identifier, and packs them into 16-byte UUIDv6 values:
 *
 * | Bytes  | Field                                                     |
 * |--------|-----------------------------------------------------------|
 * | 0..5   | high 48 bits of the 60-bit timestamp                      |
 * | 6..7   | version nibble `0x6`, then the low 12 timestamp bits      |
 * | 8..9   | counter, big-endian                                       |
 * | 10..15 | node identifier                                           |
 */

#pragma once

#include "chronoid/core/node_id.hpp"
#include "chronoid/core/sequence.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace chronoid::core {

/**
 * @class RawGenerator
 * @brief Produces time-ordered 16-byte identifiers for one node.
 *
 * @details
 * The timestamp is sampled once per seed, not once per identifier. Uniqueness
 * within a seed comes from the counter, which starts at a random value and is
 * incremented on every `create()`. When the counter comes back around to its
 * starting value (after exactly 65536 identifiers) the whole generator is replaced
 * by a freshly constructed one, which samples a new timestamp and a new seed.
 *
 * Not thread-safe. Each producer should own its own generator.
 */
class RawGenerator {
  public:
    static constexpr std::size_t kSize = 16;
    using Bytes = std::array<std::uint8_t, kSize>;

    /// Version nibble placed in the top of byte 6.
    static constexpr std::uint16_t kVersion = 0x6;

    /**
     * @brief Seeds a generator from the system clock and the secure random source.
     *
     * @throws chronoid::infra::ClockFault if the clock is before the Unix epoch.
     * @throws chronoid::infra::EntropyUnavailable if the counter cannot be seeded.
     */
    explicit RawGenerator(const NodeId& node);

    /**
     * @brief Restores a generator from explicit state.
     *
     * `counter` is also taken as the seed that marks a full cycle. Neither the clock
     * nor the entropy source is consulted until the first reseed.
     */
    RawGenerator(const NodeId& node, std::uint64_t timestamp, std::uint16_t counter);

    /**
     * @brief Returns the next identifier and advances the counter.
     *
     * May reseed the generator in place after the value has been packed.
     *
     * @throws chronoid::infra::ClockFault, chronoid::infra::EntropyUnavailable
     * only when a reseed is triggered. The generator is then left unchanged, and the
     * next successful call returns the identifier this call would have returned.
     */
    Bytes create();

    /**
     * @brief Consumes the generator into an infinite sequence of identifiers.
     */
    Sequence<RawGenerator> into_sequence() &&;

    const NodeId& node() const { return node_; }

    /// UUID ticks sampled at the last seed.
    std::uint64_t timestamp() const { return ts_; }

    /// Counter value the next `create()` will emit.
    std::uint16_t counter() const { return counter_; }

    /// Counter value at the last seed.
    std::uint16_t initial_counter() const { return initial_counter_; }

  private:
    void reseed();

    std::uint64_t ts_;
    std::uint16_t counter_;
    std::uint16_t initial_counter_;
    NodeId node_;
};

} // namespace chronoid::core
