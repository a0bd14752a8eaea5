/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <utility>

#include <qtils/shared_ref.hpp>

#include "collections/cache_entry.hpp"
#include "collections/element_codec.hpp"
#include "collections/env.hpp"
#include "collections/flush_on_drop.hpp"
#include "utils/ctor_limiters.hpp"

namespace strata::collections {

  /**
   * Optional single value stored under a fixed key, read on first access.
   * Absence means the key is not present in storage; flushing an absent
   * value removes the key.
   */
  template <typename T>
  class LazyOption : NonCopyable {
   public:
    /// Attaches to the key, storage is not touched
    LazyOption(qtils::SharedRef<Env> env, ByteVec key)
        : env_{std::move(env)}, key_{std::move(key)} {}

    /**
     * Creates with initial value. A present value will be written on flush,
     * an absent one is assumed to be absent in storage too.
     */
    LazyOption(qtils::SharedRef<Env> env,
               ByteVec key,
               std::optional<T> value)
        : env_{std::move(env)},
          key_{std::move(key)},
          cache_{value.has_value()
                     ? CacheEntry<T>::newModified(std::move(value))
                     : CacheEntry<T>::newCached(std::nullopt)} {}

    LazyOption(LazyOption &&other) noexcept
        : env_{other.env_},
          key_{std::move(other.key_)},
          cache_{std::exchange(other.cache_, std::nullopt)},
          guard_{other.guard_} {}

    LazyOption &operator=(LazyOption &&) = delete;

    ~LazyOption() {
      detail::flushOnDrop(
          guard_, env_->logger(), "LazyOption", [this] { flush(); });
    }

    const ByteVec &key() const {
      return key_;
    }

    const std::optional<T> &get() const {
      return load().value();
    }

    /// Marks the value modified, even if it is left untouched
    std::optional<T> &getMut() {
      return load().valueMut();
    }

    bool isSome() const {
      return get().has_value();
    }

    bool isNone() const {
      return not isSome();
    }

    /// Replaces the value without loading the previous one
    void set(std::optional<T> value) {
      if (cache_.has_value()) {
        cache_->valueMut() = std::move(value);
      } else {
        cache_.emplace(CacheEntry<T>::newModified(std::move(value)));
      }
    }

    /// @return previous value, leaving absent one
    std::optional<T> take() {
      return load().replace(std::nullopt);
    }

    /// @return previous value
    std::optional<T> replace(T value) {
      return load().replace(std::move(value));
    }

    void flush() {
      if (not cache_.has_value() or not cache_->isModified()) {
        return;
      }
      if (cache_->value().has_value()) {
        env_->write(key_, detail::encodeElement(cache_->value().value()));
      } else {
        env_->remove(key_);
      }
      cache_->markCached();
    }

   private:
    CacheEntry<T> &load() const {
      if (not cache_.has_value()) {
        std::optional<T> value;
        if (auto bytes = env_->read(key_)) {
          value = detail::decodeElement<T>(bytes.value());
        }
        cache_.emplace(CacheEntry<T>::newCached(std::move(value)));
      }
      return cache_.value();
    }

    qtils::SharedRef<Env> env_;
    ByteVec key_;
    mutable std::optional<CacheEntry<T>> cache_;
    detail::UnwindGuard guard_;
  };

}  // namespace strata::collections
