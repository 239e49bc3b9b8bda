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
 * @file string_generator.cpp
 * @brief Implementation of canonical UUID text rendering.
 *
 * @details
 * Rendering writes into a fixed 36-byte buffer at precomputed offsets.
 */

#include "chronoid/core/string_generator.hpp"

#include "chronoid/infra/hex.hpp"

#include <utility>

namespace chronoid::core {

namespace {

/// Hex-expanded byte groups: {first byte, byte count, output offset}.
struct Group {
    std::size_t first;
    std::size_t count;
    std::size_t offset;
};

constexpr Group kGroups[] = {
    {0, 4, 0},   // time_high
    {4, 2, 9},   // time_mid
    {6, 2, 14},  // version + time_low
    {8, 2, 19},  // counter
    {10, 6, 24}, // node
};

constexpr std::size_t kHyphens[] = {8, 13, 18, 23};

} // namespace

StringGenerator::StringGenerator(const NodeId& node) : raw_(node) {}

StringGenerator::StringGenerator(RawGenerator raw) : raw_(std::move(raw)) {}

std::string StringGenerator::create()
{
    return format(raw_.create());
}

Sequence<StringGenerator> StringGenerator::into_sequence() &&
{
    return Sequence<StringGenerator>(std::move(*this));
}

std::string StringGenerator::format(const RawGenerator::Bytes& bytes)
{
    std::string out(kLength, '0');
    for (const auto& group : kGroups) {
        infra::Hex::encode(&out[group.offset], bytes.data() + group.first, group.count);
    }
    for (std::size_t pos : kHyphens) {
        out[pos] = '-';
    }
    return out;
}

} // namespace chronoid::core
