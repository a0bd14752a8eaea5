/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(strata::log, Error, e) {
  using E = strata::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
    case E::WRONG_GROUP:
      return "Unknown group";
    case E::WRONG_LOGGER:
      return "Unknown logger";
    case E::WRONG_CONFIG:
      return "Invalid logging configuration";
  }
  return "Unknown log::Error";
}

namespace strata::log {

  namespace {
    // Console sink feeding the root "strata" group and the collection groups
    constexpr std::string_view kDefaultConfig = R"(
sinks:
  - name: console
    type: console
    capacity: 4
    latency: 0
groups:
  - name: strata
    sink: console
    level: info
    is_fallback: true
    children:
      - name: collections
      - name: storage
      - name: config
)";
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    if (str == "trace") {
      return Level::TRACE;
    }
    if (str == "debug") {
      return Level::DEBUG;
    }
    if (str == "verbose") {
      return Level::VERBOSE;
    }
    if (str == "info" or str == "inf") {
      return Level::INFO;
    }
    if (str == "warning" or str == "warn") {
      return Level::WARN;
    }
    if (str == "error" or str == "err") {
      return Level::ERROR;
    }
    if (str == "critical" or str == "crit") {
      return Level::CRITICAL;
    }
    if (str == "off" or str == "no") {
      return Level::OFF;
    }
    return Error::WRONG_LEVEL;
  }

  outcome::result<std::shared_ptr<soralog::LoggingSystem>> createSoralog(
      std::string_view yaml_config) {
    auto yaml = YAML::Load(
        std::string(yaml_config.empty() ? kDefaultConfig : yaml_config));
    if (not yaml.IsDefined()) {
      return Error::WRONG_CONFIG;
    }
    auto configurator = std::make_shared<soralog::ConfiguratorFromYAML>(yaml);
    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(configurator));
    auto config_result = logging_system->configure();
    if (config_result.has_error) {
      return Error::WRONG_CONFIG;
    }
    return logging_system;
  }

  LoggingSystem::LoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system)
      : logging_system_(std::move(logging_system)) {}

  outcome::result<void> LoggingSystem::tuneLoggingSystem(
      const std::vector<std::string> &cfg) {
    for (auto &chunk : cfg) {
      if (auto res = str2lvl(chunk); res.has_value()) {
        logging_system_->setLevelOfGroup(defaultGroupName, res.value());
        continue;
      }

      auto eq = chunk.find('=');
      if (eq == std::string::npos) {
        return Error::WRONG_LEVEL;
      }
      auto group_name = chunk.substr(0, eq);
      if (not logging_system_->getGroup(group_name)) {
        return Error::WRONG_GROUP;
      }
      OUTCOME_TRY(level, str2lvl(std::string_view(chunk).substr(eq + 1)));
      logging_system_->setLevelOfGroup(group_name, level);
    }
    return outcome::success();
  }

}  // namespace strata::log
