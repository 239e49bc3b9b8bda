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
 * @file config.hpp
 * @brief JSON configuration for hosts embedding chronoid.
 *
 * @details
 * A host process usually pins its node identifier (so that restarts keep emitting
 * the same low 48 bits) and chooses how chatty the library is. Both settings live
 * in a small JSON document:
 *
 * @code
 * { "node": "01:02:03:04:05:06", "log_level": "debug" }
 * @endcode
 *
 * Every key is optional.
 */

#pragma once

#include "chronoid/core/node_id.hpp"
#include "chronoid/infra/logger.hpp"

#include <optional>
#include <string>

namespace chronoid::config {

/**
 * @class Config
 * @brief Parsed generator configuration.
 */
class Config {
  public:
    /// Defaults: random node, `INFO` threshold.
    Config() = default;

    /**
     * @brief Parses a configuration document.
     *
     * **Recognized keys:**
     * - `node`: string of 12 hex digits, `:` or `-` separators allowed.
     * - `log_level`: one of `trace`, `debug`, `info`, `warn`, `error`, `fatal`.
     *
     * Unknown keys are ignored.
     *
     * @throws chronoid::infra::ConfigError on malformed JSON, a non-object root,
     * a non-string value for a known key, a bad node or an unknown level.
     */
    static Config parse(const std::string& json);

    /**
     * @brief Reads and parses the configuration file at `path`.
     *
     * @throws chronoid::infra::ConfigError if the file cannot be opened, or as `parse`.
     */
    static Config load(const std::string& path);

    const std::optional<core::NodeId>& node() const { return node_; }

    infra::LogLevel log_level() const { return log_level_; }

    /**
     * @brief Returns the configured node, or draws a random one if none was set.
     *
     * @throws chronoid::infra::EntropyUnavailable when a random node is needed and
     * the entropy source fails.
     */
    core::NodeId node_id() const;

    /**
     * @brief Applies process-wide settings (the logger threshold).
     */
    void apply() const;

  private:
    std::optional<core::NodeId> node_;
    infra::LogLevel log_level_ = infra::LogLevel::INFO;
};

} // namespace chronoid::config
