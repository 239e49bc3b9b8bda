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
 * @file entropy.hpp
 * @brief Access to the operating system's cryptographically secure random source.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace chronoid::infra {

/**
 * @class Entropy
 * @brief A static wrapper around the kernel CSPRNG (`getrandom(2)`).
 *
 * @details
 * Unlike a seeded userspace engine, every call reads fresh bytes from the kernel,
 * so node identifiers and counter seeds of independent generators are unrelated.
 */
class Entropy {
  public:
    /**
     * @brief Fills `size` bytes at `buffer` with secure random data.
     *
     * Short reads and `EINTR` are retried until the buffer is full.
     *
     * @throws EntropyUnavailable if the kernel reports any other failure.
     */
    static void fill(std::uint8_t* buffer, std::size_t size);

    /**
     * @brief Draws two secure random bytes and reads them as a big-endian integer.
     *
     * @throws EntropyUnavailable on failure.
     */
    static std::uint16_t next_u16();
};

} // namespace chronoid::infra
