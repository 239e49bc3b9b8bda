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
 * @file node_id_test.cpp
 * @brief Unit tests for node identifier construction, parsing and comparison.
 */

#include "chronoid/core/node_id.hpp"
#include "framework.hpp"

#include <string>

using chronoid::core::NodeId;

/**
 * @brief Caller bytes are stored verbatim.
 */
void test_node_from_bytes()
{
    NodeId::Bytes bytes = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06};
    NodeId node = NodeId::from_bytes(bytes);

    ASSERT_TRUE(node.bytes() == bytes);
    ASSERT_EQ(node.to_string(), std::string("010203040506"));
}

/**
 * @brief Textual node identifiers accept the common separators.
 */
void test_node_parse()
{
    NodeId expected = NodeId::from_bytes({0xde, 0xad, 0xbe, 0xef, 0x00, 0x01});

    for (const char* text : {"deadbeef0001", "DE:AD:BE:EF:00:01", "de-ad-be-ef-00-01"}) {
        auto node = NodeId::parse(text);
        ASSERT_TRUE(node.has_value());
        ASSERT_TRUE(*node == expected);
    }

    ASSERT_FALSE(NodeId::parse("deadbeef00").has_value());
    ASSERT_FALSE(NodeId::parse("deadbeef000102").has_value());
    ASSERT_FALSE(NodeId::parse("not-a-node").has_value());
    ASSERT_FALSE(NodeId::parse("").has_value());
    ASSERT_FALSE(NodeId::parse("-deadbeef0001-").has_value());
    ASSERT_FALSE(NodeId::parse("::de:ad:be:ef:00:01").has_value());
    ASSERT_FALSE(NodeId::parse("de:ad::be:ef:00:01").has_value());
}

/**
 * @brief Equality and ordering are byte-wise.
 */
void test_node_comparison()
{
    NodeId low = NodeId::from_bytes({0x00, 0x00, 0x00, 0x00, 0x00, 0x01});
    NodeId high = NodeId::from_bytes({0x01, 0x00, 0x00, 0x00, 0x00, 0x00});
    NodeId low_copy = low;

    ASSERT_TRUE(low == low_copy);
    ASSERT_TRUE(low != high);
    ASSERT_TRUE(low < high);
    ASSERT_FALSE(high < low);
    ASSERT_TRUE(NodeId() == NodeId::from_bytes({0, 0, 0, 0, 0, 0}));
}

/**
 * @brief Random nodes are drawn independently.
 */
void test_node_random()
{
    NodeId a = NodeId::random();
    NodeId b = NodeId::random();

    ASSERT_NE(a.to_string(), b.to_string());
    ASSERT_EQ(a.to_string().size(), static_cast<std::size_t>(12));
}
