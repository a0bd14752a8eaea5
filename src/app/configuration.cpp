/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace strata::app {

  Configuration::Configuration()
      : storage_{
            .backend = StorageBackend::MEMORY,
            .directory = "db",
            .cache_size = 8 << 20,
            .quota = 0,
        } {}

  Configuration::Configuration(StorageConfig storage,
                               std::vector<std::string> logging)
      : storage_(std::move(storage)), logging_(std::move(logging)) {}

  const Configuration::StorageConfig &Configuration::storage() const {
    return storage_;
  }

  const std::vector<std::string> &Configuration::logging() const {
    return logging_;
  }

}  // namespace strata::app
