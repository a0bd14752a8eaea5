/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>
#include <utility>

#include <qtils/shared_ref.hpp>

#include "collections/cache_entry.hpp"
#include "collections/element_codec.hpp"
#include "collections/env.hpp"
#include "collections/flush_on_drop.hpp"
#include "collections/key.hpp"
#include "collections/map_entry.hpp"
#include "utils/ctor_limiters.hpp"

namespace strata::collections {

  /**
   * Map from K to V stored as one storage entry per key. There is no
   * iteration, see IterableMap and TreeMap for that.
   *
   * Values are loaded on first access and cached until the map is destroyed.
   * Modifications are kept in cache and written on flush(), which is also
   * done by destructor.
   */
  template <typename K, typename V, typename H = Identity>
    requires KeyStrategy<H, K>
  class LookupMap : NonCopyable {
   public:
    using Key = K;
    using Value = V;

    LookupMap(qtils::SharedRef<Env> env, ByteVec prefix)
        : env_{std::move(env)}, prefix_{std::move(prefix)} {}

    LookupMap(LookupMap &&other) noexcept
        : env_{other.env_},
          prefix_{std::move(other.prefix_)},
          cache_{std::exchange(other.cache_, {})},
          guard_{other.guard_} {}

    LookupMap &operator=(LookupMap &&) = delete;

    ~LookupMap() {
      detail::flushOnDrop(
          guard_, env_->logger(), "LookupMap", [this] { flush(); });
    }

    const ByteVec &prefix() const {
      return prefix_;
    }

    /// @return value bound to the key, nullptr if there is none
    const V *get(const K &key) const {
      auto &value = load(H::toKey(prefix_, key)).value();
      return value.has_value() ? &value.value() : nullptr;
    }

    /// @return mutable value bound to the key, nullptr if there is none
    V *getMut(const K &key) {
      auto &entry = load(H::toKey(prefix_, key));
      if (not entry.value().has_value()) {
        return nullptr;
      }
      return &entry.valueMut().value();
    }

    /**
     * Answered from cache if the key was touched before, otherwise checks
     * storage without loading the value.
     */
    bool contains(const K &key) const {
      auto storage_key = H::toKey(prefix_, key);
      if (auto it = cache_.find(storage_key); it != cache_.end()) {
        return it->second.value().has_value();
      }
      return env_->has(storage_key);
    }

    /**
     * Binds value to the key, std::nullopt unbinds.
     * @return previous value
     */
    std::optional<V> set(const K &key, std::optional<V> value) {
      return load(H::toKey(prefix_, key)).replace(std::move(value));
    }

    std::optional<V> insert(const K &key, V value) {
      return set(key, std::move(value));
    }

    std::optional<V> remove(const K &key) {
      return set(key, std::nullopt);
    }

    MapEntry<LookupMap> entry(K key) {
      return MapEntry<LookupMap>{*this, std::move(key)};
    }

    /// Binds value to the key without loading the previous one
    void overwrite(const K &key, std::optional<V> value) {
      auto storage_key = H::toKey(prefix_, key);
      auto it = cache_.find(storage_key);
      if (it == cache_.end()) {
        cache_.emplace(std::move(storage_key),
                       CacheEntry<V>::newModified(std::move(value)));
      } else {
        it->second.valueMut() = std::move(value);
      }
    }

    /// Writes all modified entries to storage
    void flush() {
      for (auto &[storage_key, entry] : cache_) {
        if (not entry.isModified()) {
          continue;
        }
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
    CacheEntry<V> &load(ByteVec storage_key) const {
      auto it = cache_.find(storage_key);
      if (it == cache_.end()) {
        std::optional<V> value;
        if (auto bytes = env_->read(storage_key)) {
          value = detail::decodeElement<V>(bytes.value());
        }
        it = cache_
                 .emplace(std::move(storage_key),
                          CacheEntry<V>::newCached(std::move(value)))
                 .first;
      }
      return it->second;
    }

    qtils::SharedRef<Env> env_;
    ByteVec prefix_;
    mutable std::map<ByteVec, CacheEntry<V>> cache_;
    detail::UnwindGuard guard_;
  };

}  // namespace strata::collections
