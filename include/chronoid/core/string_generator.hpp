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
 * @file string_generator.hpp
 * @brief Canonical-text UUIDv6 generator.
 */

#pragma once

#include "chronoid/core/node_id.hpp"
#include "chronoid/core/raw_generator.hpp"
#include "chronoid/core/sequence.hpp"

#include <cstddef>
#include <string>

namespace chronoid::core {

/**
 * @class StringGenerator
 * @brief Renders each identifier of an owned `RawGenerator` as text.
 *
 * @details
 * The output adheres to the canonical textual representation
 * `xxxxxxxx-xxxx-6xxx-xxxx-xxxxxxxxxxxx`, lowercase, 36 characters. The last
 * 12 digits are always the node identifier.
 */
class StringGenerator {
  public:
    /// Length of a rendered identifier.
    static constexpr std::size_t kLength = 36;

    /**
     * @brief Wraps a freshly seeded raw generator for `node`.
     *
     * @throws chronoid::infra::ClockFault, chronoid::infra::EntropyUnavailable
     */
    explicit StringGenerator(const NodeId& node);

    /**
     * @brief Takes ownership of an existing raw generator.
     */
    explicit StringGenerator(RawGenerator raw);

    /**
     * @brief Returns the next identifier as a 36-character string.
     *
     * @return std::string e.g. "1f0b5a2c-9e4d-6a71-8c3e-010203040506".
     */
    std::string create();

    /**
     * @brief Consumes the generator into an infinite sequence of strings.
     */
    Sequence<StringGenerator> into_sequence() &&;

    /**
     * @brief Formats 16 identifier bytes as canonical UUID text.
     *
     * Byte ranges `[0,4) [4,6) [6,8) [8,10) [10,16)` become the five hyphen-separated
     * groups, two lowercase hex digits per byte. Total over every input.
     */
    static std::string format(const RawGenerator::Bytes& bytes);

    const RawGenerator& raw() const { return raw_; }

  private:
    RawGenerator raw_;
};

} // namespace chronoid::core
