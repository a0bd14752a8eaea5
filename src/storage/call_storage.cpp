/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/call_storage.hpp"

#include "storage/storage_error.hpp"

namespace strata::storage {

  namespace {
    ByteVec toVec(const ByteView &view) {
      return ByteVec(view.begin(), view.end());
    }
  }  // namespace

  /// Batch over the overlay, lands into pending modifications on commit
  class CallBatch : public BufferBatch {
   public:
    explicit CallBatch(CallStorage &storage) : storage_{storage} {}

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override {
      entries_[toVec(key)] = std::move(value).intoByteVec();
      return outcome::success();
    }

    outcome::result<void> remove(const ByteView &key) override {
      entries_[toVec(key)] = std::nullopt;
      return outcome::success();
    }

    outcome::result<void> commit() override {
      for (auto &[key, value] : entries_) {
        storage_.pending_[key] = std::move(value);
      }
      entries_.clear();
      return outcome::success();
    }

    void clear() override {
      entries_.clear();
    }

   private:
    std::map<ByteVec, std::optional<ByteVec>> entries_;
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    CallStorage &storage_;
  };

  CallStorage::CallStorage(qtils::SharedRef<log::LoggingSystem> logsys,
                           qtils::SharedRef<BufferStorage> base)
      : base_{std::move(base)},
        logger_{logsys->getLogger("CallStorage", "storage")} {}

  CallStorage::~CallStorage() {
    if (not pending_.empty()) {
      SL_DEBUG(logger_,
               "{} uncommitted modifications are discarded",
               pending_.size());
    }
  }

  outcome::result<ByteVecOrView> CallStorage::get(const ByteView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    if (not value.has_value()) {
      return StorageError::NOT_FOUND;
    }
    return std::move(value.value());
  }

  outcome::result<std::optional<ByteVecOrView>> CallStorage::tryGet(
      const ByteView &key) const {
    if (auto it = pending_.find(toVec(key)); it != pending_.end()) {
      if (not it->second.has_value()) {
        return std::nullopt;
      }
      return ByteView{it->second.value()};
    }
    return base_->tryGet(key);
  }

  outcome::result<void> CallStorage::put(const ByteView &key,
                                         ByteVecOrView &&value) {
    pending_[toVec(key)] = std::move(value).intoByteVec();
    return outcome::success();
  }

  outcome::result<bool> CallStorage::contains(const ByteView &key) const {
    if (auto it = pending_.find(toVec(key)); it != pending_.end()) {
      return it->second.has_value();
    }
    return base_->contains(key);
  }

  outcome::result<void> CallStorage::remove(const ByteView &key) {
    pending_[toVec(key)] = std::nullopt;
    return outcome::success();
  }

  std::unique_ptr<BufferBatch> CallStorage::batch() {
    return std::make_unique<CallBatch>(*this);
  }

  outcome::result<void> CallStorage::commit() {
    if (pending_.empty()) {
      return outcome::success();
    }
    auto batch = base_->batch();
    for (auto &[key, value] : pending_) {
      if (value.has_value()) {
        OUTCOME_TRY(batch->put(key, ByteView{value.value()}));
      } else {
        OUTCOME_TRY(batch->remove(key));
      }
    }
    OUTCOME_TRY(batch->commit());
    SL_TRACE(logger_, "{} modifications committed", pending_.size());
    pending_.clear();
    return outcome::success();
  }

  void CallStorage::discard() {
    SL_TRACE(logger_, "{} modifications discarded", pending_.size());
    pending_.clear();
  }

}  // namespace strata::storage
