/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <utility>

#include <qtils/shared_ref.hpp>

#include "collections/cache_entry.hpp"
#include "collections/element_codec.hpp"
#include "collections/env.hpp"
#include "utils/ctor_limiters.hpp"

namespace strata::collections {

  /**
   * Cache of elements addressed by u32 index, stored under
   * prefix ++ u32_le(index). Knows nothing of length; bounds are checked by
   * the owner.
   */
  template <typename T>
  class IndexMap : NonCopyable {
   public:
    IndexMap(qtils::SharedRef<Env> env, ByteVec prefix)
        : env_{std::move(env)}, prefix_{std::move(prefix)} {}

    IndexMap(IndexMap &&other) noexcept
        : env_{other.env_},
          prefix_{std::move(other.prefix_)},
          cache_{std::exchange(other.cache_, {})} {}

    IndexMap &operator=(IndexMap &&) = delete;

    ~IndexMap() = default;

    const T *get(uint32_t index) const {
      auto &value = load(index).value();
      return value.has_value() ? &value.value() : nullptr;
    }

    T *getMut(uint32_t index) {
      auto &entry = load(index);
      if (not entry.value().has_value()) {
        return nullptr;
      }
      return &entry.valueMut().value();
    }

    /// Overwrites the element without loading the previous one
    void set(uint32_t index, std::optional<T> value) {
      auto it = cache_.find(index);
      if (it == cache_.end()) {
        cache_.emplace(index, CacheEntry<T>::newModified(std::move(value)));
      } else {
        it->second.valueMut() = std::move(value);
      }
    }

    /// @return previous element
    std::optional<T> insert(uint32_t index, T value) {
      return load(index).replace(std::move(value));
    }

    /// @return removed element
    std::optional<T> remove(uint32_t index) {
      return load(index).replace(std::nullopt);
    }

    void swap(uint32_t a, uint32_t b) {
      if (a == b) {
        return;
      }
      auto &first = load(a);
      auto &second = load(b);
      auto tmp = first.replace(std::nullopt);
      first.replace(second.replace(std::move(tmp)));
    }

    void flush() {
      for (auto &[index, entry] : cache_) {
        if (not entry.isModified()) {
          continue;
        }
        auto storage_key = indexKey(index);
        if (entry.value().has_value()) {
          env_->write(storage_key,
                      detail::encodeElement(entry.value().value()));
        } else {
          env_->remove(storage_key);
        }
        entry.markCached();
      }
    }

   private:
    ByteVec indexKey(uint32_t index) const {
      ByteVec key;
      key.reserve(prefix_.size() + sizeof(index));
      key.insert(key.end(), prefix_.begin(), prefix_.end());
      for (size_t i = 0; i < sizeof(index); ++i) {
        key.push_back(static_cast<uint8_t>(index >> (8 * i)));
      }
      return key;
    }

    CacheEntry<T> &load(uint32_t index) const {
      auto it = cache_.find(index);
      if (it == cache_.end()) {
        std::optional<T> value;
        if (auto bytes = env_->read(indexKey(index))) {
          value = detail::decodeElement<T>(bytes.value());
        }
        it = cache_.emplace(index, CacheEntry<T>::newCached(std::move(value)))
                 .first;
      }
      return it->second;
    }

    qtils::SharedRef<Env> env_;
    ByteVec prefix_;
    mutable std::map<uint32_t, CacheEntry<T>> cache_;
  };

}  // namespace strata::collections
