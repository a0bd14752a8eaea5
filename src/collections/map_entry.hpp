/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <utility>

#include <qtils/error_throw.hpp>

#include "collections/collection_error.hpp"

namespace strata::collections {

  /**
   * View of a single key of a map, whether it is bound or not. Lets the
   * caller bind a default value or update the present one without looking
   * the key up again at the call site.
   *
   * Map must provide Key and Value types, getMut(), insert() and remove().
   * Entry borrows the map, so it must not outlive it.
   */
  template <typename Map>
  class MapEntry {
   public:
    using Key = typename Map::Key;
    using Value = typename Map::Value;

    MapEntry(Map &map, Key key) : map_{map}, key_{std::move(key)} {}

    const Key &key() const {
      return key_;
    }

    bool isOccupied() const {
      return map_.contains(key_);
    }

    /// @return present value, nullptr for vacant entry
    Value *get() {
      return map_.getMut(key_);
    }

    /// Binds `value` if the entry is vacant
    Value &orInsert(Value value) {
      return orInsertWith([&] { return std::move(value); });
    }

    /// Binds result of `make()` if the entry is vacant, `make` is not called
    /// otherwise
    template <typename F>
    Value &orInsertWith(F &&make) {
      if (auto *value = map_.getMut(key_)) {
        return *value;
      }
      map_.insert(key_, std::forward<F>(make)());
      auto *value = map_.getMut(key_);
      if (value == nullptr) {
        qtils::raise(CollectionError::INCONSISTENT_STATE);
      }
      return *value;
    }

    Value &orDefault() {
      return orInsertWith([] { return Value{}; });
    }

    /// Applies `modify` to the present value, vacant entry is left as is
    template <typename F>
    MapEntry &andModify(F &&modify) {
      if (auto *value = map_.getMut(key_)) {
        std::forward<F>(modify)(*value);
      }
      return *this;
    }

    /// @return previous value
    std::optional<Value> insert(Value value) {
      return map_.insert(key_, std::move(value));
    }

    /// @return removed value
    std::optional<Value> remove() {
      return map_.remove(key_);
    }

   private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    Map &map_;
    Key key_;
  };

}  // namespace strata::collections
