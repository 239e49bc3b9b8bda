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
 * @file node_id.hpp
 * @brief The 48-bit spatially unique node identifier.
 *
 * @details
 * A node identifier distinguishes the entity generating identifiers and occupies the
 * low 6 bytes of every UUIDv6 it produces. It is a plain value: generators copy it
 * and never share it.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace chronoid::core {

class RawGenerator;
class StringGenerator;

/**
 * @class NodeId
 * @brief An immutable 6-byte node identifier.
 *
 * @details
 * Equality and ordering compare the bytes lexicographically. The default
 * constructor yields the all-zero node.
 */
class NodeId {
  public:
    static constexpr std::size_t kSize = 6;
    using Bytes = std::array<std::uint8_t, kSize>;

    NodeId() : bytes_{} {}

    /**
     * @brief Creates a node identifier from the kernel's secure random source.
     *
     * @throws chronoid::infra::EntropyUnavailable if no entropy can be read.
     */
    static NodeId random();

    /**
     * @brief Creates a node identifier from caller-supplied bytes, copied verbatim.
     */
    static NodeId from_bytes(const Bytes& bytes);

    /**
     * @brief Parses 12 hex digits, optionally separated by `:` or `-`.
     *
     * @code
     * auto node = NodeId::parse("01:02:03:04:05:06");
     * @endcode
     *
     * @return The node, or `std::nullopt` if the text is not exactly 6 hex bytes.
     */
    static std::optional<NodeId> parse(const std::string& text);

    const Bytes& bytes() const { return bytes_; }

    /// 12 lowercase hex digits, no separators.
    std::string to_string() const;

    /**
     * @brief Builds a raw generator for this node.
     *
     * @throws chronoid::infra::ClockFault, chronoid::infra::EntropyUnavailable
     */
    RawGenerator raw_generator() const;

    /**
     * @brief Builds a string generator for this node.
     *
     * @throws chronoid::infra::ClockFault, chronoid::infra::EntropyUnavailable
     */
    StringGenerator string_generator() const;

    friend bool operator==(const NodeId& lhs, const NodeId& rhs) { return lhs.bytes_ == rhs.bytes_; }
    friend bool operator!=(const NodeId& lhs, const NodeId& rhs) { return lhs.bytes_ != rhs.bytes_; }
    friend bool operator<(const NodeId& lhs, const NodeId& rhs) { return lhs.bytes_ < rhs.bytes_; }

  private:
    explicit NodeId(const Bytes& bytes) : bytes_(bytes) {}

    Bytes bytes_;
};

} // namespace chronoid::core
