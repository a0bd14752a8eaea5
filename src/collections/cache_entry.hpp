/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <utility>

namespace strata::collections {

  /**
   * Cached copy of a single storage value.
   * Absent value (std::nullopt) means the key has no value in storage, or
   * has to be removed from storage when the entry is modified.
   */
  template <typename T>
  class CacheEntry {
   public:
    enum class State : uint8_t {
      CACHED,
      MODIFIED,
    };

    static CacheEntry newCached(std::optional<T> value) {
      return CacheEntry{std::move(value), State::CACHED};
    }

    static CacheEntry newModified(std::optional<T> value) {
      return CacheEntry{std::move(value), State::MODIFIED};
    }

    const std::optional<T> &value() const {
      return value_;
    }

    /// Gives mutable access, so the entry is unconditionally modified
    std::optional<T> &valueMut() {
      state_ = State::MODIFIED;
      return value_;
    }

    /**
     * Replaces the value and returns the previous one.
     * Replacing absent value with absent one doesn't modify the entry.
     */
    std::optional<T> replace(std::optional<T> value) {
      if (value.has_value() or value_.has_value()) {
        state_ = State::MODIFIED;
      }
      return std::exchange(value_, std::move(value));
    }

    bool isModified() const {
      return state_ == State::MODIFIED;
    }

    /// Called once the value has been written to storage
    void markCached() {
      state_ = State::CACHED;
    }

   private:
    CacheEntry(std::optional<T> value, State state)
        : value_{std::move(value)}, state_{state} {}

    std::optional<T> value_;
    State state_;
  };

}  // namespace strata::collections
