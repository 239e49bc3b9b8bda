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
 * @file config.cpp
 * @brief Implementation of the JSON configuration loader.
 *
 * @details
 * Parsing follows an Ingest / Extract / Validate pipeline:
 * 1. **Ingest**: The document is parsed with cJSON into an owned tree.
 * 2. **Extract**: Known keys are looked up on the root object.
 * 3. **Validate**: Each value is converted to its typed form, or rejected with a
 * `ConfigError` naming the offending key.
 */

#include "chronoid/config/config.hpp"

#include "chronoid/infra/error.hpp"

#include <cJSON.h>
#include <fstream>
#include <memory>
#include <sstream>

namespace chronoid::config {

namespace {

/// Owns a parsed cJSON tree and releases it on every exit path.
using JsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

/**
 * @brief Returns the string value of `key`, `nullptr` if absent.
 *
 * @throws ConfigError if the key is present but not a string.
 */
const char* string_item(const cJSON* root, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, key);
    if (!item || cJSON_IsNull(item)) {
        return nullptr;
    }
    if (!cJSON_IsString(item) || !item->valuestring) {
        throw infra::ConfigError("Config: '" + std::string(key) + "' must be a string");
    }
    return item->valuestring;
}

} // namespace

Config Config::parse(const std::string& json)
{
    // 1. INGEST PHASE
    JsonPtr root(cJSON_Parse(json.c_str()), &cJSON_Delete);
    if (!root) {
        throw infra::ConfigError("Config: Invalid JSON syntax");
    }
    if (!cJSON_IsObject(root.get())) {
        throw infra::ConfigError("Config: Root must be a JSON object");
    }

    Config config;

    // 2. EXTRACT & VALIDATE: node
    if (const char* node = string_item(root.get(), "node")) {
        auto parsed = core::NodeId::parse(node);
        if (!parsed) {
            throw infra::ConfigError("Config: 'node' must be 6 hex bytes, got '" +
                                     std::string(node) + "'");
        }
        config.node_ = *parsed;
    }

    // 3. EXTRACT & VALIDATE: log_level
    if (const char* level = string_item(root.get(), "log_level")) {
        auto parsed = infra::Logger::parse_level(level);
        if (!parsed) {
            throw infra::ConfigError("Config: Unknown 'log_level' '" + std::string(level) + "'");
        }
        config.log_level_ = *parsed;
    }

    return config;
}

Config Config::load(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        throw infra::ConfigError("Config: Cannot open '" + path + "'");
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str());
}

core::NodeId Config::node_id() const
{
    if (node_) {
        return *node_;
    }
    return core::NodeId::random();
}

void Config::apply() const
{
    infra::Logger::set_level(log_level_);
    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Config: Node " + (node_ ? node_->to_string() : std::string("<random>")) +
                           " applied");
}

} // namespace chronoid::config
