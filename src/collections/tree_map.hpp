/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <iterator>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>

#include <qtils/error_throw.hpp>
#include <qtils/shared_ref.hpp>

#include "collections/collection_error.hpp"
#include "collections/env.hpp"
#include "collections/key.hpp"
#include "collections/lookup_map.hpp"
#include "collections/map_entry.hpp"
#include "collections/tree_map/avl_tree.hpp"
#include "utils/ctor_limiters.hpp"

namespace strata::collections {

  /**
   * Ordered map. Values are kept in LookupMap under prefix ++ 'v', and keys
   * are additionally kept in AvlTree under prefix ++ 't', which answers
   * ordered queries. Both hold exactly the same keys.
   */
  template <typename K,
            typename V,
            typename H = Sha256,
            typename Compare = std::less<>>
  class TreeMap : NonCopyable {
   public:
    using Key = K;
    using Value = V;
    using KeyValue = std::pair<const K &, const V &>;
    using KeyValueMut = std::pair<const K &, V &>;

    /**
     * Lazy ordered walk over the map. Each step is a neighbour query of the
     * tree, so the map may be read between steps. Mutable walk marks each
     * visited value as modified.
     */
    template <bool kMutable>
    class BasicRange
        : public std::ranges::view_interface<BasicRange<kMutable>> {
      using Map = std::conditional_t<kMutable, TreeMap, const TreeMap>;

     public:
      using Item = std::conditional_t<kMutable, KeyValueMut, KeyValue>;

      class Iterator {
       public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Item;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = Item;

        Iterator() = default;
        Iterator(const BasicRange *range, const K *key)
            : range_{range}, key_{key} {}

        Item operator*() const {
          if constexpr (kMutable) {
            return range_->map_->keyValueMut(key_);
          } else {
            return range_->map_->keyValue(key_);
          }
        }

        Iterator &operator++() {
          key_ = range_->next(*key_);
          return *this;
        }
        Iterator operator++(int) {
          auto prev = *this;
          ++*this;
          return prev;
        }

        bool operator==(const Iterator &other) const {
          return key_ == other.key_;
        }

       private:
        const BasicRange *range_ = nullptr;
        const K *key_ = nullptr;
      };

      BasicRange() = default;

      Iterator begin() const {
        return Iterator{this, bounded(first())};
      }
      Iterator end() const {
        return Iterator{this, nullptr};
      }

     private:
      friend class TreeMap;

      BasicRange(Map *map,
                 std::optional<K> lo,
                 std::optional<K> hi,
                 bool reversed)
          : map_{map},
            lo_{std::move(lo)},
            hi_{std::move(hi)},
            reversed_{reversed} {}

      const K *first() const {
        const auto &tree = map_->tree_;
        if (reversed_) {
          return hi_.has_value() ? tree.lower(*hi_) : tree.max();
        }
        return lo_.has_value() ? tree.ceiling(*lo_) : tree.min();
      }

      const K *next(const K &key) const {
        const auto &tree = map_->tree_;
        return bounded(reversed_ ? tree.lower(key) : tree.higher(key));
      }

      /// Cuts keys outside of [lo, hi) in order of the tree
      const K *bounded(const K *key) const {
        if (key == nullptr) {
          return nullptr;
        }
        const auto &less = map_->tree_.comparator();
        if (hi_.has_value() and not less(*key, *hi_)) {
          return nullptr;
        }
        if (lo_.has_value() and less(*key, *lo_)) {
          return nullptr;
        }
        return key;
      }

      Map *map_ = nullptr;
      std::optional<K> lo_;
      std::optional<K> hi_;
      bool reversed_ = false;
    };

    using Range = BasicRange<false>;
    using RangeMut = BasicRange<true>;

    TreeMap(qtils::SharedRef<Env> env,
            const ByteVec &prefix,
            Compare less = Compare{})
        : values_{env, detail::nestedPrefix(prefix, 'v')},
          tree_{env, detail::nestedPrefix(prefix, 't'), std::move(less)} {}

    TreeMap(TreeMap &&) noexcept = default;
    TreeMap &operator=(TreeMap &&) = delete;

    uint32_t len() const {
      return tree_.len();
    }

    bool isEmpty() const {
      return len() == 0;
    }

    bool contains(const K &key) const {
      return values_.contains(key);
    }

    const V *get(const K &key) const {
      return values_.get(key);
    }

    V *getMut(const K &key) {
      return values_.getMut(key);
    }

    /**
     * Existing key keeps its place in the tree, only value is replaced.
     * @return previous value
     */
    std::optional<V> insert(const K &key, V value) {
      auto prev = values_.insert(key, std::move(value));
      if (not prev.has_value() and not tree_.insert(key)) {
        qtils::raise(CollectionError::INCONSISTENT_STATE);
      }
      return prev;
    }

    /// @return removed value
    std::optional<V> remove(const K &key) {
      auto prev = values_.remove(key);
      if (prev.has_value() and not tree_.remove(key)) {
        qtils::raise(CollectionError::INCONSISTENT_STATE);
      }
      return prev;
    }

    /// std::nullopt removes the key
    std::optional<V> set(const K &key, std::optional<V> value) {
      if (value.has_value()) {
        return insert(key, std::move(value.value()));
      }
      return remove(key);
    }

    MapEntry<TreeMap> entry(K key) {
      return MapEntry<TreeMap>{*this, std::move(key)};
    }

    std::optional<KeyValue> min() const {
      return optionalKeyValue(tree_.min());
    }

    std::optional<KeyValue> max() const {
      return optionalKeyValue(tree_.max());
    }

    /// Entry with greatest key less than or equal to the given one
    std::optional<KeyValue> floor(const K &key) const {
      return optionalKeyValue(tree_.floor(key));
    }

    /// Entry with least key greater than or equal to the given one
    std::optional<KeyValue> ceiling(const K &key) const {
      return optionalKeyValue(tree_.ceiling(key));
    }

    /// Entry with greatest key strictly less than the given one
    std::optional<KeyValue> lower(const K &key) const {
      return optionalKeyValue(tree_.lower(key));
    }

    /// Entry with least key strictly greater than the given one
    std::optional<KeyValue> higher(const K &key) const {
      return optionalKeyValue(tree_.higher(key));
    }

    /// All entries in ascending order of keys
    Range iter() const {
      return Range{this, std::nullopt, std::nullopt, false};
    }

    /// All entries in descending order of keys
    Range iterRev() const {
      return Range{this, std::nullopt, std::nullopt, true};
    }

    /// Entries with keys in [lo, hi), ascending
    Range range(K lo, K hi) const {
      return Range{this, std::move(lo), std::move(hi), false};
    }

    /// Entries with keys in [lo, hi), descending
    Range rangeRev(K lo, K hi) const {
      return Range{this, std::move(lo), std::move(hi), true};
    }

    auto keys() const {
      return iter() | std::views::keys;
    }

    auto values() const {
      return iter() | std::views::values;
    }

    /// All entries in ascending order with mutable values
    RangeMut iterMut() {
      return RangeMut{this, std::nullopt, std::nullopt, false};
    }

    /// Entries with keys in [lo, hi), ascending, with mutable values
    RangeMut rangeMut(K lo, K hi) {
      return RangeMut{this, std::move(lo), std::move(hi), false};
    }

    void clear() {
      std::vector<K> keys;
      keys.reserve(len());
      for (const auto *key = tree_.min(); key != nullptr;
           key = tree_.higher(*key)) {
        keys.push_back(*key);
      }
      for (const auto &key : keys) {
        values_.overwrite(key, std::nullopt);
      }
      tree_.clear();
    }

    void flush() {
      values_.flush();
      tree_.flush();
    }

    /// Invariants of underlying tree, see AvlTree::checkInvariants
    outcome::result<void> checkInvariants() const {
      return tree_.checkInvariants();
    }

   private:
    KeyValue keyValue(const K *key) const {
      const auto *value = values_.get(*key);
      if (value == nullptr) {
        qtils::raise(CollectionError::INCONSISTENT_STATE);
      }
      return KeyValue{*key, *value};
    }

    KeyValueMut keyValueMut(const K *key) {
      auto *value = values_.getMut(*key);
      if (value == nullptr) {
        qtils::raise(CollectionError::INCONSISTENT_STATE);
      }
      return KeyValueMut{*key, *value};
    }

    std::optional<KeyValue> optionalKeyValue(const K *key) const {
      if (key == nullptr) {
        return std::nullopt;
      }
      return keyValue(key);
    }

    LookupMap<K, V, H> values_;
    AvlTree<K, Compare> tree_;
  };

}  // namespace strata::collections
