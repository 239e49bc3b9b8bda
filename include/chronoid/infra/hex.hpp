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
 * @file hex.hpp
 * @brief Lowercase hexadecimal encoding primitives.
 *
 * @details
 * This header defines the `Hex` utility class used by the string generator to
 * expand identifier bytes, and by configuration parsing to read node identifiers
 * written by humans.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace chronoid::infra {

/**
 * @class Hex
 * @brief A static container for hex conversion algorithms.
 */
class Hex {
  public:
    /// Nibble-to-digit alphabet.
    static constexpr char kDigits[] = "0123456789abcdef";

    /**
     * @brief Expands `size` bytes into `2 * size` lowercase hex characters.
     *
     * The output buffer is written in place and is not terminated. The high nibble
     * of each byte is emitted first.
     *
     * @param out Destination; must have room for `2 * size` characters.
     * @param in Source bytes.
     * @param size Number of source bytes.
     *
     * @code
     * // Example Usage:
     * const std::uint8_t bytes[] = {0xde, 0xad};
     * char buf[4];
     * chronoid::infra::Hex::encode(buf, bytes, 2); // "dead"
     * @endcode
     */
    static void encode(char* out, const std::uint8_t* in, std::size_t size);

    /**
     * @brief Encodes a byte range into a new lowercase hex string.
     */
    static std::string to_string(const std::uint8_t* in, std::size_t size);

    /**
     * @brief Decodes hex text into bytes.
     *
     * Leading and trailing whitespace is ignored. Digits may be upper or lower case.
     * A single `:` or `-` may stand between two complete bytes, so `01:02:03`,
     * `01-02-03` and `010203` all decode to the same bytes. A separator at either
     * end, a doubled separator, or one splitting a pair fails the decode.
     *
     * @param text The source text.
     * @param out Receives the decoded bytes on success; untouched on failure.
     * @return true if the text held an even number of hex digits and nothing else.
     */
    static bool decode(const std::string& text, std::vector<std::uint8_t>& out);
};

} // namespace chronoid::infra
