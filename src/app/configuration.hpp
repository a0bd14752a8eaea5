/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace strata::app {

  class Configuration {
   public:
    enum class StorageBackend : uint8_t {
      MEMORY,
      ROCKSDB,
    };

    struct StorageConfig {
      StorageBackend backend = StorageBackend::MEMORY;
      std::filesystem::path directory = "db";
      size_t cache_size = 8 << 20;  // 8MiB
      /// storage operations allowed per call, zero means unlimited
      uint64_t quota = 0;
    };

    Configuration();
    Configuration(StorageConfig storage, std::vector<std::string> logging);
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const StorageConfig &storage() const;

    /// Level overrides, see log::LoggingSystem::tuneLoggingSystem
    [[nodiscard]] virtual const std::vector<std::string> &logging() const;

   private:
    StorageConfig storage_;
    std::vector<std::string> logging_;
  };

}  // namespace strata::app
