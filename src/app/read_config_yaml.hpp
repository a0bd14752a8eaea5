/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <string_view>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "app/configuration.hpp"

namespace YAML {
  class Node;
}

namespace strata::app {

  enum class ConfigYamlError : uint8_t {
    UNREADABLE = 1,
    INVALID,
    INVALID_STORAGE,
    UNKNOWN_BACKEND,
    INVALID_LOGGING,
  };
  Q_ENUM_ERROR_CODE(ConfigYamlError) {
    using E = decltype(e);
    switch (e) {
      case E::UNREADABLE:
        return "Config file can't be read or parsed";
      case E::INVALID:
        return "Invalid config, mapping expected at top level";
      case E::INVALID_STORAGE:
        return "Invalid 'storage' section";
      case E::UNKNOWN_BACKEND:
        return "Unknown storage backend, expected 'memory' or 'rocksdb'";
      case E::INVALID_LOGGING:
        return "Invalid 'logging' section, list of levels expected";
    }
    return "Unknown ConfigYamlError";
  }

  /**
   * Builds configuration from a parsed YAML document. Absent sections and
   * fields keep their defaults.
   */
  outcome::result<Configuration> parseConfigYaml(const YAML::Node &yaml);

  /// Parses configuration from YAML text
  outcome::result<Configuration> readConfigYaml(std::string_view text);

  /// Reads configuration from YAML file
  outcome::result<Configuration> readConfigYamlFile(
      const std::filesystem::path &path);

}  // namespace strata::app
