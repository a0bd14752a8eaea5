/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <utility>

#include <qtils/error_throw.hpp>
#include <qtils/shared_ref.hpp>

#include "collections/cache_entry.hpp"
#include "collections/collection_error.hpp"
#include "collections/element_codec.hpp"
#include "collections/env.hpp"
#include "collections/flush_on_drop.hpp"
#include "utils/ctor_limiters.hpp"

namespace strata::collections {

  /**
   * Single value stored under a fixed key, read on first access.
   *
   * Once loaded or set, the in-memory copy is the only authority until the
   * next flush. The value is written on flush (and on destruction) only if it
   * was modified.
   */
  template <typename T>
  class Lazy : NonCopyable {
   public:
    /// Attaches to the key, storage is not touched
    Lazy(qtils::SharedRef<Env> env, ByteVec key)
        : env_{std::move(env)}, key_{std::move(key)} {}

    /// Initializes the key with value, which will be written on flush
    Lazy(qtils::SharedRef<Env> env, ByteVec key, T value)
        : env_{std::move(env)},
          key_{std::move(key)},
          cache_{CacheEntry<T>::newModified(std::move(value))} {}

    Lazy(Lazy &&other) noexcept
        : env_{other.env_},
          key_{std::move(other.key_)},
          cache_{std::exchange(other.cache_, std::nullopt)},
          guard_{other.guard_} {}

    Lazy &operator=(Lazy &&) = delete;

    ~Lazy() {
      detail::flushOnDrop(guard_, env_->logger(), "Lazy", [this] { flush(); });
    }

    const ByteVec &key() const {
      return key_;
    }

    /**
     * Loads the value on first call.
     * Raises VALUE_NOT_FOUND if nothing is stored under the key.
     */
    const T &get() const {
      return load().value().value();
    }

    T &getMut() {
      return load().valueMut().value();
    }

    /// Replaces the value without loading the previous one
    void set(T value) {
      if (cache_.has_value()) {
        cache_->valueMut() = std::move(value);
      } else {
        cache_.emplace(CacheEntry<T>::newModified(std::move(value)));
      }
    }

    /// @return previous value
    T replace(T value) {
      return load().replace(std::move(value)).value();
    }

    void flush() {
      if (not cache_.has_value() or not cache_->isModified()) {
        return;
      }
      env_->write(key_, detail::encodeElement(cache_->value().value()));
      cache_->markCached();
    }

   private:
    CacheEntry<T> &load() const {
      if (not cache_.has_value()) {
        auto bytes = env_->read(key_);
        if (not bytes.has_value()) {
          SL_ERROR(env_->logger(),
                   "Lazy value is absent under key {}",
                   key_.toHex());
          qtils::raise(CollectionError::VALUE_NOT_FOUND);
        }
        cache_.emplace(
            CacheEntry<T>::newCached(detail::decodeElement<T>(bytes.value())));
      }
      return cache_.value();
    }

    qtils::SharedRef<Env> env_;
    ByteVec key_;
    mutable std::optional<CacheEntry<T>> cache_;
    detail::UnwindGuard guard_;
  };

}  // namespace strata::collections
