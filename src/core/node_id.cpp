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
 * @file node_id.cpp
 * @brief Implementation of node identifier construction and formatting.
 */

#include "chronoid/core/node_id.hpp"

#include "chronoid/core/raw_generator.hpp"
#include "chronoid/core/string_generator.hpp"
#include "chronoid/infra/entropy.hpp"
#include "chronoid/infra/hex.hpp"

#include <algorithm>
#include <vector>

namespace chronoid::core {

NodeId NodeId::random()
{
    Bytes bytes{};
    infra::Entropy::fill(bytes.data(), bytes.size());
    return NodeId(bytes);
}

NodeId NodeId::from_bytes(const Bytes& bytes)
{
    return NodeId(bytes);
}

std::optional<NodeId> NodeId::parse(const std::string& text)
{
    std::vector<std::uint8_t> decoded;
    if (!infra::Hex::decode(text, decoded) || decoded.size() != kSize) {
        return std::nullopt;
    }

    Bytes bytes{};
    std::copy(decoded.begin(), decoded.end(), bytes.begin());
    return NodeId(bytes);
}

std::string NodeId::to_string() const
{
    return infra::Hex::to_string(bytes_.data(), bytes_.size());
}

RawGenerator NodeId::raw_generator() const
{
    return RawGenerator(*this);
}

StringGenerator NodeId::string_generator() const
{
    return StringGenerator(*this);
}

} // namespace chronoid::core
