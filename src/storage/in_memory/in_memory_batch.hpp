/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>

#include <qtils/byte_vec.hpp>

#include "storage/in_memory/in_memory_storage.hpp"

namespace strata::storage {

  class InMemoryBatch : public BufferBatch {
   public:
    explicit InMemoryBatch(InMemoryStorage &db) : db_{db} {}

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override {
      entries_[key.toHex()] = std::move(value).intoByteVec();
      return outcome::success();
    }

    outcome::result<void> remove(const ByteView &key) override {
      entries_[key.toHex()] = std::nullopt;
      return outcome::success();
    }

    outcome::result<void> commit() override {
      for (auto &[hex_key, value] : entries_) {
        if (value.has_value()) {
          db_.putHex(hex_key, std::move(value.value()));
        } else {
          db_.removeHex(hex_key);
        }
      }
      entries_.clear();
      return outcome::success();
    }

    void clear() override {
      entries_.clear();
    }

   private:
    // nullopt marks removal
    std::map<std::string, std::optional<ByteVec>> entries_;
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    InMemoryStorage &db_;
  };

}  // namespace strata::storage
