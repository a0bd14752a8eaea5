/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/read_config_yaml.hpp"

#include <yaml-cpp/yaml.h>

namespace strata::app {

  namespace {
    outcome::result<Configuration::StorageConfig> parseStorage(
        const YAML::Node &yaml) {
      Configuration::StorageConfig config;
      if (not yaml.IsDefined() or yaml.IsNull()) {
        return config;
      }
      if (not yaml.IsMap()) {
        return ConfigYamlError::INVALID_STORAGE;
      }

      if (auto backend = yaml["backend"]; backend.IsDefined()) {
        if (not backend.IsScalar()) {
          return ConfigYamlError::INVALID_STORAGE;
        }
        auto name = backend.as<std::string>();
        if (name == "memory") {
          config.backend = Configuration::StorageBackend::MEMORY;
        } else if (name == "rocksdb") {
          config.backend = Configuration::StorageBackend::ROCKSDB;
        } else {
          return ConfigYamlError::UNKNOWN_BACKEND;
        }
      }

      try {
        if (auto directory = yaml["directory"]; directory.IsDefined()) {
          if (not directory.IsScalar()) {
            return ConfigYamlError::INVALID_STORAGE;
          }
          config.directory = directory.as<std::string>();
        }
        if (auto cache_size = yaml["cache_size"]; cache_size.IsDefined()) {
          config.cache_size = cache_size.as<size_t>();
        }
        if (auto quota = yaml["quota"]; quota.IsDefined()) {
          config.quota = quota.as<uint64_t>();
        }
      } catch (const YAML::BadConversion &) {
        return ConfigYamlError::INVALID_STORAGE;
      }
      return config;
    }

    outcome::result<std::vector<std::string>> parseLogging(
        const YAML::Node &yaml) {
      std::vector<std::string> levels;
      if (not yaml.IsDefined() or yaml.IsNull()) {
        return levels;
      }
      if (yaml.IsScalar()) {
        levels.emplace_back(yaml.as<std::string>());
        return levels;
      }
      if (not yaml.IsSequence()) {
        return ConfigYamlError::INVALID_LOGGING;
      }
      for (auto &&item : yaml) {
        if (not item.IsScalar()) {
          return ConfigYamlError::INVALID_LOGGING;
        }
        levels.emplace_back(item.as<std::string>());
      }
      return levels;
    }
  }  // namespace

  outcome::result<Configuration> parseConfigYaml(const YAML::Node &yaml) {
    if (yaml.IsNull()) {
      return Configuration{};
    }
    if (not yaml.IsMap()) {
      return ConfigYamlError::INVALID;
    }
    OUTCOME_TRY(storage, parseStorage(yaml["storage"]));
    OUTCOME_TRY(logging, parseLogging(yaml["logging"]));
    return Configuration{std::move(storage), std::move(logging)};
  }

  outcome::result<Configuration> readConfigYaml(std::string_view text) {
    YAML::Node yaml;
    try {
      yaml = YAML::Load(std::string{text});
    } catch (const YAML::Exception &) {
      return ConfigYamlError::UNREADABLE;
    }
    return parseConfigYaml(yaml);
  }

  outcome::result<Configuration> readConfigYamlFile(
      const std::filesystem::path &path) {
    YAML::Node yaml;
    try {
      yaml = YAML::LoadFile(path.native());
    } catch (const YAML::Exception &) {
      return ConfigYamlError::UNREADABLE;
    }
    return parseConfigYaml(yaml);
  }

}  // namespace strata::app
