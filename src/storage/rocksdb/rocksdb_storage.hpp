/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <memory>

#include <qtils/shared_ref.hpp>
#include <rocksdb/db.h>
#include <rocksdb/table.h>

#include "log/logger.hpp"
#include "storage/buffer_map_types.hpp"
#include "utils/ctor_limiters.hpp"

namespace strata::app {
  class Configuration;
}

namespace strata::storage {

  /**
   * Point storage persisted in a RocksDB database. All keys live in the
   * default column family.
   */
  class RocksDbStorage : public BufferStorage,
                         NonCopyable,
                         NonMovable {
   public:
    /**
     * Opens the database in the configured directory, creating it when
     * missing. Failure to open is fatal and raised.
     */
    RocksDbStorage(qtils::SharedRef<log::LoggingSystem> logsys,
                   qtils::SharedRef<app::Configuration> app_config);

    ~RocksDbStorage() override;

    static constexpr uint32_t kDefaultBlockSizeKiB = 32;

    std::unique_ptr<BufferBatch> batch() override;

    std::optional<size_t> byteSizeHint() const override;

    outcome::result<bool> contains(const ByteView &key) const override;

    outcome::result<ByteVecOrView> get(const ByteView &key) const override;

    outcome::result<std::optional<ByteVecOrView>> tryGet(
        const ByteView &key) const override;

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override;

    outcome::result<void> remove(const ByteView &key) override;

    /**
     * Prepare table options
     * @param lru_cache_size - LRU block cache in bytes
     * @param block_size_kib - internal rocksdb block size in KiB
     */
    static rocksdb::BlockBasedTableOptions tableOptionsConfiguration(
        size_t lru_cache_size,
        uint32_t block_size_kib = kDefaultBlockSizeKiB);

    friend class RocksDbBatch;

   private:
    static outcome::result<void> createDirectory(
        const std::filesystem::path &absolute_path, log::Logger &log);

    std::unique_ptr<rocksdb::DB> db_;
    rocksdb::ReadOptions ro_;
    rocksdb::WriteOptions wo_;
    log::Logger logger_;
  };

}  // namespace strata::storage
