/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/storage_factory.hpp"

#include "app/configuration.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/rocksdb/rocksdb_storage.hpp"

namespace strata::storage {

  qtils::SharedRef<MeteredStorage> createStorage(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<app::Configuration> app_config) {
    auto logger = logsys->getLogger("Storage", "storage");
    const auto &config = app_config->storage();

    std::shared_ptr<BufferStorage> backend;
    switch (config.backend) {
      case app::Configuration::StorageBackend::MEMORY:
        SL_INFO(logger, "Using in-memory storage");
        backend = std::make_shared<InMemoryStorage>();
        break;
      case app::Configuration::StorageBackend::ROCKSDB:
        SL_INFO(logger,
                "Using RocksDB storage in {}",
                config.directory.native());
        backend = std::make_shared<RocksDbStorage>(logsys, app_config);
        break;
    }
    if (config.quota != 0) {
      SL_INFO(logger, "Storage quota is {} operations per call", config.quota);
    }
    return std::make_shared<MeteredStorage>(
        logsys, qtils::SharedRef<BufferStorage>(backend), config.quota);
  }

}  // namespace strata::storage
