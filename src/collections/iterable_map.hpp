/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <ranges>
#include <utility>
#include <vector>

#include <qtils/error_throw.hpp>
#include <qtils/shared_ref.hpp>

#include "collections/collection_error.hpp"
#include "collections/env.hpp"
#include "collections/free_list.hpp"
#include "collections/key.hpp"
#include "collections/lookup_map.hpp"
#include "collections/map_entry.hpp"
#include "utils/ctor_limiters.hpp"

namespace strata::collections {

  /**
   * Map with iteration over its entries.
   *
   * Entries (key and value together) live in a FreeList under
   * prefix ++ 'e', and LookupMap under prefix ++ 'i' maps key to index of its
   * entry. Both halves always hold exactly the same keys.
   *
   * Iteration follows slot order, which is insertion order only as long as
   * nothing was removed.
   */
  template <typename K, typename V, typename H = Sha256>
  class IterableMap : NonCopyable {
   public:
    using Key = K;
    using Value = V;
    using Entry = std::pair<K, V>;
    using KeyValueMut = std::pair<const K &, V &>;
    using Iterator = typename FreeList<Entry>::Iterator;
    using ReverseIterator = typename FreeList<Entry>::ReverseIterator;

    IterableMap(qtils::SharedRef<Env> env, const ByteVec &prefix)
        : index_{env, detail::nestedPrefix(prefix, 'i')},
          entries_{env, detail::nestedPrefix(prefix, 'e')} {}

    IterableMap(IterableMap &&) noexcept = default;
    IterableMap &operator=(IterableMap &&) = delete;

    uint32_t len() const {
      return entries_.len();
    }

    bool isEmpty() const {
      return len() == 0;
    }

    bool contains(const K &key) const {
      return index_.contains(key);
    }

    const V *get(const K &key) const {
      const auto *index = index_.get(key);
      if (index == nullptr) {
        return nullptr;
      }
      return &entryOrRaise(*index).second;
    }

    V *getMut(const K &key) {
      const auto *index = index_.get(key);
      if (index == nullptr) {
        return nullptr;
      }
      auto *entry = entries_.getMut(*index);
      if (entry == nullptr) {
        qtils::raise(CollectionError::INCONSISTENT_STATE);
      }
      return &entry->second;
    }

    /**
     * Value of existing key is replaced in place, so its index is kept.
     * @return previous value
     */
    std::optional<V> insert(const K &key, V value) {
      if (const auto *index = index_.get(key)) {
        auto *entry = entries_.getMut(*index);
        if (entry == nullptr) {
          qtils::raise(CollectionError::INCONSISTENT_STATE);
        }
        return std::exchange(entry->second, std::move(value));
      }
      auto index = entries_.allocate(Entry{key, std::move(value)});
      index_.overwrite(key, index);
      return std::nullopt;
    }

    /// @return removed value
    std::optional<V> remove(const K &key) {
      auto index = index_.remove(key);
      if (not index.has_value()) {
        return std::nullopt;
      }
      auto entry = entries_.free(index.value());
      if (not entry.has_value()) {
        qtils::raise(CollectionError::INCONSISTENT_STATE);
      }
      return std::move(entry->second);
    }

    /// std::nullopt removes the key
    std::optional<V> set(const K &key, std::optional<V> value) {
      if (value.has_value()) {
        return insert(key, std::move(value.value()));
      }
      return remove(key);
    }

    MapEntry<IterableMap> entry(K key) {
      return MapEntry<IterableMap>{*this, std::move(key)};
    }

    /// Stable index of entry, valid until the key is removed
    std::optional<FreeListIndex> indexOf(const K &key) const {
      const auto *index = index_.get(key);
      if (index == nullptr) {
        return std::nullopt;
      }
      return *index;
    }

    const Entry *entryAt(FreeListIndex index) const {
      return entries_.get(index);
    }

    void clear() {
      for (const auto &entry : entries_) {
        index_.overwrite(entry.first, std::nullopt);
      }
      entries_.clear();
    }

    /**
     * Removes all entries.
     * @return removed entries in iteration order
     */
    std::vector<Entry> drain() {
      std::vector<Entry> drained;
      drained.reserve(len());
      for (auto &entry : entries_.iterMut()) {
        index_.overwrite(entry.first, std::nullopt);
        drained.emplace_back(std::move(entry));
      }
      entries_.clear();
      return drained;
    }

    /**
     * Keeps only entries for which `keep(key, value)` is true. Every value
     * is passed mutable, so every kept entry is written back on flush.
     */
    template <typename F>
    void retain(F &&keep) {
      std::vector<K> removed;
      for (auto &&[key, value] : iterMut()) {
        if (not keep(key, value)) {
          removed.push_back(key);
        }
      }
      for (const auto &key : removed) {
        remove(key);
      }
    }

    void flush() {
      index_.flush();
      entries_.flush();
    }

    Iterator begin() const {
      return entries_.begin();
    }
    Iterator end() const {
      return entries_.end();
    }
    ReverseIterator rbegin() const {
      return entries_.rbegin();
    }
    ReverseIterator rend() const {
      return entries_.rend();
    }

    std::ranges::subrange<Iterator> iter() const {
      return {begin(), end()};
    }

    auto keys() const {
      return iter() | std::views::keys;
    }

    auto values() const {
      return iter() | std::views::values;
    }

    /// Pairs of key and mutable value, visited values are written on flush
    auto iterMut() {
      return entries_.iterMut() | std::views::transform([](Entry &entry) {
               return KeyValueMut{entry.first, entry.second};
             });
    }

    auto valuesMut() {
      return entries_.iterMut() | std::views::values;
    }

   private:
    const Entry &entryOrRaise(FreeListIndex index) const {
      const auto *entry = entries_.get(index);
      if (entry == nullptr) {
        qtils::raise(CollectionError::INCONSISTENT_STATE);
      }
      return *entry;
    }

    LookupMap<K, FreeListIndex, H> index_;
    FreeList<Entry> entries_;
  };

}  // namespace strata::collections
