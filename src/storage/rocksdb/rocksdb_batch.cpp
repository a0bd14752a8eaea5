/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_batch.hpp"

#include "storage/rocksdb/rocksdb_util.hpp"

namespace strata::storage {

  RocksDbBatch::RocksDbBatch(RocksDbStorage &db, log::Logger &logger)
      : db_(db), logger_(logger) {}

  outcome::result<void> RocksDbBatch::put(const ByteView &key,
                                          ByteVecOrView &&value) {
    auto status = batch_.Put(make_slice(key), make_slice(std::move(value)));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbBatch::remove(const ByteView &key) {
    auto status = batch_.Delete(make_slice(key));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbBatch::commit() {
    auto status = db_.db_->Write(db_.wo_, &batch_);
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    batch_.Clear();
    return outcome::success();
  }

  void RocksDbBatch::clear() {
    batch_.Clear();
  }

}  // namespace strata::storage
