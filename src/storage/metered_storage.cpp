/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/metered_storage.hpp"

#include "storage/storage_error.hpp"

namespace strata::storage {

  class MeteredBatch : public BufferBatch {
   public:
    MeteredBatch(const MeteredStorage &storage,
                 std::unique_ptr<BufferBatch> origin)
        : storage_{storage}, origin_{std::move(origin)} {}

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override {
      OUTCOME_TRY(storage_.charge(&StorageCounters::writes));
      return origin_->put(key, std::move(value));
    }

    outcome::result<void> remove(const ByteView &key) override {
      OUTCOME_TRY(storage_.charge(&StorageCounters::removes));
      return origin_->remove(key);
    }

    outcome::result<void> commit() override {
      return origin_->commit();
    }

    void clear() override {
      origin_->clear();
    }

   private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    const MeteredStorage &storage_;
    std::unique_ptr<BufferBatch> origin_;
  };

  MeteredStorage::MeteredStorage(qtils::SharedRef<log::LoggingSystem> logsys,
                                 qtils::SharedRef<BufferStorage> origin,
                                 uint64_t quota)
      : logger_{logsys->getLogger("MeteredStorage", "storage")},
        origin_{std::move(origin)},
        quota_{quota} {}

  outcome::result<ByteVecOrView> MeteredStorage::get(
      const ByteView &key) const {
    OUTCOME_TRY(charge(&StorageCounters::reads));
    return origin_->get(key);
  }

  outcome::result<std::optional<ByteVecOrView>> MeteredStorage::tryGet(
      const ByteView &key) const {
    OUTCOME_TRY(charge(&StorageCounters::reads));
    return origin_->tryGet(key);
  }

  outcome::result<void> MeteredStorage::put(const ByteView &key,
                                            ByteVecOrView &&value) {
    OUTCOME_TRY(charge(&StorageCounters::writes));
    return origin_->put(key, std::move(value));
  }

  outcome::result<bool> MeteredStorage::contains(const ByteView &key) const {
    OUTCOME_TRY(charge(&StorageCounters::has));
    return origin_->contains(key);
  }

  outcome::result<void> MeteredStorage::remove(const ByteView &key) {
    OUTCOME_TRY(charge(&StorageCounters::removes));
    return origin_->remove(key);
  }

  std::unique_ptr<BufferBatch> MeteredStorage::batch() {
    return std::make_unique<MeteredBatch>(*this, origin_->batch());
  }

  std::optional<size_t> MeteredStorage::byteSizeHint() const {
    return origin_->byteSizeHint();
  }

  void MeteredStorage::beginCall() {
    SL_TRACE(logger_,
             "Previous call: {} reads, {} writes, {} removes, {} has",
             counters_.reads,
             counters_.writes,
             counters_.removes,
             counters_.has);
    counters_ = {};
  }

  outcome::result<void> MeteredStorage::charge(
      uint64_t StorageCounters::*counter) const {
    if (quota_ != 0 and counters_.total() >= quota_) {
      SL_ERROR(logger_,
               "Quota of {} storage operations per call is exhausted",
               quota_);
      return StorageError::RESOURCE_EXHAUSTED;
    }
    ++(counters_.*counter);
    return outcome::success();
  }

}  // namespace strata::storage
