/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include <boost/assert.hpp>

#include "storage/in_memory/in_memory_batch.hpp"
#include "storage/storage_error.hpp"

namespace strata::storage {

  outcome::result<ByteVecOrView> InMemoryStorage::get(
      const ByteView &key) const {
    if (auto it = storage_.find(key.toHex()); it != storage_.end()) {
      return ByteView{it->second};
    }
    return StorageError::NOT_FOUND;
  }

  outcome::result<std::optional<ByteVecOrView>> InMemoryStorage::tryGet(
      const ByteView &key) const {
    if (auto it = storage_.find(key.toHex()); it != storage_.end()) {
      return ByteView{it->second};
    }
    return std::nullopt;
  }

  outcome::result<void> InMemoryStorage::put(const ByteView &key,
                                             ByteVecOrView &&value) {
    putHex(key.toHex(), std::move(value).intoByteVec());
    return outcome::success();
  }

  outcome::result<bool> InMemoryStorage::contains(const ByteView &key) const {
    return storage_.contains(key.toHex());
  }

  outcome::result<void> InMemoryStorage::remove(const ByteView &key) {
    removeHex(key.toHex());
    return outcome::success();
  }

  std::unique_ptr<BufferBatch> InMemoryStorage::batch() {
    return std::make_unique<InMemoryBatch>(*this);
  }

  std::optional<size_t> InMemoryStorage::byteSizeHint() const {
    return size_;
  }

  void InMemoryStorage::putHex(const std::string &hex_key, ByteVec value) {
    auto it = storage_.find(hex_key);
    if (it != storage_.end()) {
      BOOST_ASSERT(size_ >= it->second.size());
      size_ -= it->second.size();
    }
    size_ += value.size();
    storage_[hex_key] = std::move(value);
  }

  void InMemoryStorage::removeHex(const std::string &hex_key) {
    auto it = storage_.find(hex_key);
    if (it != storage_.end()) {
      size_ -= it->second.size();
      storage_.erase(it);
    }
  }

}  // namespace strata::storage
