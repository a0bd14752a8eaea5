/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_storage.hpp"

#include <qtils/error_throw.hpp>
#include <rocksdb/filter_policy.h>
#include <soralog/macro.hpp>

#include "app/configuration.hpp"
#include "storage/rocksdb/rocksdb_batch.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/storage_error.hpp"
#include "utils/fd_limit.hpp"

namespace strata::storage {
  namespace fs = std::filesystem;

  RocksDbStorage::RocksDbStorage(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<app::Configuration> app_config)
      : logger_(logsys->getLogger("RocksDB", "storage")) {
    ro_.fill_cache = true;

    const auto &config = app_config->storage();
    const auto &path = config.directory;

    auto options = rocksdb::Options{};
    options.create_if_missing = true;
    options.optimize_filters_for_hits = true;
    options.OptimizeLevelStyleCompaction(config.cache_size);
    options.table_factory.reset(rocksdb::NewBlockBasedTableFactory(
        tableOptionsConfiguration(config.cache_size)));

    // Use a half of the soft limit of open files
    if (auto soft_limit = getFdLimit(logger_)) {
      // NOLINTNEXTLINE(cppcoreguidelines-narrowing-conversions)
      options.max_open_files = soft_limit.value() / 2;
    }

    if (auto res = createDirectory(path, logger_); res.has_error()) {
      SL_CRITICAL(logger_,
                  "Can't create DB directory ({}): {}",
                  path.native(),
                  res.error());
      qtils::raise(res.error());
    }

    rocksdb::DB *db = nullptr;
    auto status = rocksdb::DB::Open(options, path.native(), &db);
    if (not status.ok()) {
      SL_CRITICAL(logger_,
                  "Can't open database in {}: {}",
                  path.native(),
                  status.ToString());
      qtils::raise(status_as_error(status, logger_));
    }
    db_.reset(db);

    std::string size_str;
    if (db_->GetProperty("rocksdb.estimate-live-data-size", &size_str)) {
      SL_VERBOSE(logger_,
                 "Database opened in {}, live data size {} bytes",
                 path.native(),
                 size_str);
    } else {
      SL_VERBOSE(logger_, "Database opened in {}", path.native());
    }
  }

  RocksDbStorage::~RocksDbStorage() {
    auto status = db_->Flush(rocksdb::FlushOptions());
    if (not status.ok()) {
      SL_ERROR(logger_, "Can't flush database: {}", status.ToString());
    }
    status = db_->Close();
    if (not status.ok()) {
      SL_ERROR(logger_, "Can't close database: {}", status.ToString());
    }
    db_.reset();
    SL_VERBOSE(logger_, "Database closed");
  }

  outcome::result<void> RocksDbStorage::createDirectory(
      const std::filesystem::path &absolute_path, log::Logger &log) {
    std::error_code ec;
    fs::create_directories(absolute_path, ec);
    if (ec) {
      SL_ERROR(log,
               "Can't create directory {} for database: {}",
               absolute_path.native(),
               ec.message());
      return StorageError::DB_PATH_NOT_CREATED;
    }
    if (not fs::is_directory(absolute_path)) {
      SL_ERROR(log,
               "Can't open {} for database: is not a directory",
               absolute_path.native());
      return StorageError::IO_ERROR;
    }
    return outcome::success();
  }

  rocksdb::BlockBasedTableOptions RocksDbStorage::tableOptionsConfiguration(
      size_t lru_cache_size, uint32_t block_size_kib) {
    rocksdb::BlockBasedTableOptions table_options;
    table_options.format_version = 5;
    table_options.block_cache = rocksdb::NewLRUCache(lru_cache_size);
    table_options.block_size = static_cast<size_t>(block_size_kib) * 1024;
    table_options.cache_index_and_filter_blocks = true;
    table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(10, false));
    return table_options;
  }

  std::unique_ptr<BufferBatch> RocksDbStorage::batch() {
    return std::make_unique<RocksDbBatch>(*this, logger_);
  }

  std::optional<size_t> RocksDbStorage::byteSizeHint() const {
    uint64_t usage = 0;
    if (not db_->GetIntProperty("rocksdb.cur-size-all-mem-tables", &usage)) {
      SL_ERROR(logger_, "Unable to retrieve memory usage value");
      return std::nullopt;
    }
    return usage;
  }

  outcome::result<bool> RocksDbStorage::contains(const ByteView &key) const {
    std::string value;
    auto status = db_->Get(ro_, make_slice(key), &value);
    if (status.ok()) {
      return true;
    }

    if (status.IsNotFound()) {
      return false;
    }

    return status_as_error(status, logger_);
  }

  outcome::result<ByteVecOrView> RocksDbStorage::get(
      const ByteView &key) const {
    std::string value;
    auto status = db_->Get(ro_, make_slice(key), &value);
    if (status.ok()) {
      return make_buffer(value);
    }
    return status_as_error(status, logger_);
  }

  outcome::result<std::optional<ByteVecOrView>> RocksDbStorage::tryGet(
      const ByteView &key) const {
    std::string value;
    auto status = db_->Get(ro_, make_slice(key), &value);
    if (status.ok()) {
      return std::make_optional(ByteVecOrView(make_buffer(value)));
    }

    if (status.IsNotFound()) {
      return std::nullopt;
    }

    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbStorage::put(const ByteView &key,
                                            ByteVecOrView &&value) {
    auto status =
        db_->Put(wo_, make_slice(key), make_slice(std::move(value)));
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbStorage::remove(const ByteView &key) {
    auto status = db_->Delete(wo_, make_slice(key));
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

}  // namespace strata::storage
