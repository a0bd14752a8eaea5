/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <string>

#include <qtils/byte_vec.hpp>
#include <qtils/outcome.hpp>

#include "storage/buffer_map_types.hpp"

namespace strata::storage {

  /**
   * Storage kept in process memory. Used by tests and for ephemeral runs,
   * where nothing has to survive the process.
   */
  class InMemoryStorage : public BufferStorage {
   public:
    ~InMemoryStorage() override = default;

    [[nodiscard]] outcome::result<ByteVecOrView> get(
        const ByteView &key) const override;

    [[nodiscard]] outcome::result<std::optional<ByteVecOrView>> tryGet(
        const ByteView &key) const override;

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override;

    [[nodiscard]] outcome::result<bool> contains(
        const ByteView &key) const override;

    outcome::result<void> remove(const ByteView &key) override;

    std::unique_ptr<BufferBatch> batch() override;

    [[nodiscard]] std::optional<size_t> byteSizeHint() const override;

    /// Number of stored keys
    [[nodiscard]] size_t size() const {
      return storage_.size();
    }

   private:
    friend class InMemoryBatch;

    void putHex(const std::string &hex_key, ByteVec value);
    void removeHex(const std::string &hex_key);

    std::map<std::string, ByteVec> storage_;
    size_t size_ = 0;
  };

}  // namespace strata::storage
