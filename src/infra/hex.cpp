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
 * @file hex.cpp
 * @brief Implementation of the hex conversion primitives.
 */

#include "chronoid/infra/hex.hpp"

#include <cctype>
#include <utility>

namespace chronoid::infra {

namespace {

int nibble_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

void Hex::encode(char* out, const std::uint8_t* in, std::size_t size)
{
    for (std::size_t i = 0; i < size; ++i) {
        out[2 * i] = kDigits[in[i] >> 4];
        out[2 * i + 1] = kDigits[in[i] & 0x0f];
    }
}

std::string Hex::to_string(const std::uint8_t* in, std::size_t size)
{
    std::string out(2 * size, '0');
    encode(out.data(), in, size);
    return out;
}

/**
 * @brief Decodes hex text into bytes.
 *
 * Implementation Strategy:
 * 1. **Trim**: Skips leading and trailing whitespace. The `static_cast<unsigned char>`
 * keeps `std::isspace` defined for negative `char` values.
 * 2. **Pairing**: Accumulates nibbles, flushing a byte every second digit.
 * A separator is only legal between two complete bytes: at least one byte
 * decoded, no half byte pending, no separator directly before it, and more
 * digits after it.
 * 3. **Commit**: Writes to `out` only once the whole input validated.
 */
bool Hex::decode(const std::string& text, std::vector<std::uint8_t>& out)
{
    auto start = text.begin();
    auto end = text.end();
    while (start != end && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }

    std::vector<std::uint8_t> bytes;
    int high = -1;
    bool after_separator = false;
    for (auto it = start; it != end; ++it) {
        if (*it == ':' || *it == '-') {
            if (high != -1 || bytes.empty() || after_separator) {
                return false;
            }
            after_separator = true;
            continue;
        }
        after_separator = false;

        int value = nibble_value(*it);
        if (value < 0) {
            return false;
        }

        if (high == -1) {
            high = value;
        } else {
            bytes.push_back(static_cast<std::uint8_t>((high << 4) | value));
            high = -1;
        }
    }

    if (high != -1 || after_separator) {
        return false;
    }

    out = std::move(bytes);
    return true;
}

} // namespace chronoid::infra
