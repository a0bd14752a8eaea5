/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <utility>

#include <qtils/shared_ref.hpp>

#include "collections/cache_entry.hpp"
#include "collections/env.hpp"
#include "collections/flush_on_drop.hpp"
#include "collections/key.hpp"
#include "utils/ctor_limiters.hpp"

namespace strata::collections {

  /**
   * Set of values without iteration. Presence of a value is an empty
   * storage entry under the derived key.
   */
  template <typename T, typename H = Identity>
    requires KeyStrategy<H, T>
  class LookupSet : NonCopyable {
    struct Present {};

   public:
    LookupSet(qtils::SharedRef<Env> env, ByteVec prefix)
        : env_{std::move(env)}, prefix_{std::move(prefix)} {}

    LookupSet(LookupSet &&other) noexcept
        : env_{other.env_},
          prefix_{std::move(other.prefix_)},
          cache_{std::exchange(other.cache_, {})},
          guard_{other.guard_} {}

    LookupSet &operator=(LookupSet &&) = delete;

    ~LookupSet() {
      detail::flushOnDrop(
          guard_, env_->logger(), "LookupSet", [this] { flush(); });
    }

    const ByteVec &prefix() const {
      return prefix_;
    }

    /// Presence is checked without reading the stored entry
    bool contains(const T &value) const {
      return entry(value).value().has_value();
    }

    /// @return true if the value was not in the set
    bool insert(const T &value) {
      return not entry(value).replace(Present{}).has_value();
    }

    /// @return true if the value was in the set
    bool remove(const T &value) {
      return entry(value).replace(std::nullopt).has_value();
    }

    void flush() {
      for (auto &[storage_key, entry] : cache_) {
        if (not entry.isModified()) {
          continue;
        }
        if (entry.value().has_value()) {
          env_->write(storage_key, ByteVec{});
        } else {
          env_->remove(storage_key);
        }
        entry.markCached();
      }
    }

   private:
    CacheEntry<Present> &entry(const T &value) const {
      auto storage_key = H::toKey(prefix_, value);
      auto it = cache_.find(storage_key);
      if (it == cache_.end()) {
        bool present = env_->has(storage_key);
        it = cache_
                 .emplace(std::move(storage_key),
                          CacheEntry<Present>::newCached(
                              present ? std::optional<Present>{Present{}}
                                      : std::nullopt))
                 .first;
      }
      return it->second;
    }

    qtils::SharedRef<Env> env_;
    ByteVec prefix_;
    mutable std::map<ByteVec, CacheEntry<Present>> cache_;
    detail::UnwindGuard guard_;
  };

}  // namespace strata::collections
