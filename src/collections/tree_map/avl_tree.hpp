/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <optional>

#include <qtils/error_throw.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "collections/collection_error.hpp"
#include "collections/env.hpp"
#include "collections/free_list.hpp"
#include "collections/key.hpp"
#include "collections/lazy_option.hpp"
#include "utils/ctor_limiters.hpp"

namespace strata::collections {

  /// Persisted node of AvlTree, children are indices of other nodes
  template <typename K>
  struct AvlNode {
    K key;
    std::optional<FreeListIndex> left;
    std::optional<FreeListIndex> right;
    uint32_t height = 1;
  };

  /**
   * AVL tree of keys. Nodes are kept in a FreeList under prefix ++ 'n', the
   * root index is kept under prefix ++ 'r'. Each node access is a cached
   * storage access, so insert, remove and neighbour queries cost O(log n)
   * round trips.
   *
   * Compare must define the same strict weak order for the whole lifetime of
   * stored data.
   */
  template <typename K, typename Compare = std::less<>>
  class AvlTree : NonCopyable {
    using Node = AvlNode<K>;
    using Link = std::optional<FreeListIndex>;

   public:
    AvlTree(qtils::SharedRef<Env> env,
            const ByteVec &prefix,
            Compare less = Compare{})
        : root_{env, detail::nestedPrefix(prefix, 'r')},
          nodes_{env, detail::nestedPrefix(prefix, 'n')},
          less_{std::move(less)} {}

    AvlTree(AvlTree &&) noexcept = default;
    AvlTree &operator=(AvlTree &&) = delete;

    uint32_t len() const {
      return nodes_.len();
    }

    /// Order of keys in the tree
    const Compare &comparator() const {
      return less_;
    }

    bool isEmpty() const {
      return len() == 0;
    }

    bool contains(const K &key) const {
      auto at = root();
      while (at.has_value()) {
        const auto &n = node(*at);
        if (less_(key, n.key)) {
          at = n.left;
        } else if (less_(n.key, key)) {
          at = n.right;
        } else {
          return true;
        }
      }
      return false;
    }

    /// @return true if the key was not in the tree
    bool insert(const K &key) {
      bool inserted = false;
      setRoot(insertAt(root(), key, inserted));
      return inserted;
    }

    /// @return true if the key was in the tree
    bool remove(const K &key) {
      bool removed = false;
      setRoot(removeAt(root(), key, removed));
      return removed;
    }

    /// Smallest key
    const K *min() const {
      auto at = root();
      if (not at.has_value()) {
        return nullptr;
      }
      while (node(*at).left.has_value()) {
        at = node(*at).left;
      }
      return &node(*at).key;
    }

    /// Largest key
    const K *max() const {
      auto at = root();
      if (not at.has_value()) {
        return nullptr;
      }
      while (node(*at).right.has_value()) {
        at = node(*at).right;
      }
      return &node(*at).key;
    }

    /// Greatest key less than or equal to the given one
    const K *floor(const K &key) const {
      Link best;
      auto at = root();
      while (at.has_value()) {
        const auto &n = node(*at);
        if (less_(key, n.key)) {
          at = n.left;
        } else {
          best = at;
          if (not less_(n.key, key)) {
            break;
          }
          at = n.right;
        }
      }
      return keyOf(best);
    }

    /// Least key greater than or equal to the given one
    const K *ceiling(const K &key) const {
      Link best;
      auto at = root();
      while (at.has_value()) {
        const auto &n = node(*at);
        if (less_(n.key, key)) {
          at = n.right;
        } else {
          best = at;
          if (not less_(key, n.key)) {
            break;
          }
          at = n.left;
        }
      }
      return keyOf(best);
    }

    /// Greatest key strictly less than the given one
    const K *lower(const K &key) const {
      Link best;
      auto at = root();
      while (at.has_value()) {
        const auto &n = node(*at);
        if (less_(n.key, key)) {
          best = at;
          at = n.right;
        } else {
          at = n.left;
        }
      }
      return keyOf(best);
    }

    /// Least key strictly greater than the given one
    const K *higher(const K &key) const {
      Link best;
      auto at = root();
      while (at.has_value()) {
        const auto &n = node(*at);
        if (less_(key, n.key)) {
          best = at;
          at = n.left;
        } else {
          at = n.right;
        }
      }
      return keyOf(best);
    }

    /// Removes all nodes without loading them
    void clear() {
      nodes_.clear();
      root_.set(std::nullopt);
    }

    void flush() {
      nodes_.flush();
      root_.flush();
    }

    /**
     * Walks the whole tree and checks that keys go in strictly increasing
     * order, stored heights are exact, subtrees are balanced and the number
     * of reachable nodes equals len().
     */
    outcome::result<void> checkInvariants() const {
      uint32_t count = 0;
      auto res = checkSubtree(root(), nullptr, nullptr, count);
      if (res.has_error()) {
        return res.error();
      }
      if (count != len()) {
        return CollectionError::TREE_SIZE_MISMATCH;
      }
      return outcome::success();
    }

   private:
    Link root() const {
      return root_.get();
    }

    void setRoot(Link at) {
      if (root_.get() != at) {
        root_.set(at);
      }
    }

    const Node &node(FreeListIndex at) const {
      const auto *n = nodes_.get(at);
      if (n == nullptr) {
        qtils::raise(CollectionError::INCONSISTENT_STATE);
      }
      return *n;
    }

    Node &nodeMut(FreeListIndex at) {
      auto *n = nodes_.getMut(at);
      if (n == nullptr) {
        qtils::raise(CollectionError::INCONSISTENT_STATE);
      }
      return *n;
    }

    const K *keyOf(Link at) const {
      return at.has_value() ? &node(*at).key : nullptr;
    }

    uint32_t height(Link at) const {
      return at.has_value() ? node(*at).height : 0;
    }

    int64_t balance(FreeListIndex at) const {
      const auto &n = node(at);
      return static_cast<int64_t>(height(n.left))
           - static_cast<int64_t>(height(n.right));
    }

    // setters touch storage only when something really changes

    void setLeft(FreeListIndex at, Link child) {
      if (node(at).left != child) {
        nodeMut(at).left = child;
      }
    }

    void setRight(FreeListIndex at, Link child) {
      if (node(at).right != child) {
        nodeMut(at).right = child;
      }
    }

    void updateHeight(FreeListIndex at) {
      const auto &n = node(at);
      auto h = 1 + std::max(height(n.left), height(n.right));
      if (n.height != h) {
        nodeMut(at).height = h;
      }
    }

    FreeListIndex rotateRight(FreeListIndex at) {
      auto pivot = node(at).left.value();
      setLeft(at, node(pivot).right);
      setRight(pivot, at);
      updateHeight(at);
      updateHeight(pivot);
      return pivot;
    }

    FreeListIndex rotateLeft(FreeListIndex at) {
      auto pivot = node(at).right.value();
      setRight(at, node(pivot).left);
      setLeft(pivot, at);
      updateHeight(at);
      updateHeight(pivot);
      return pivot;
    }

    /// @return new root of the subtree
    FreeListIndex rebalance(FreeListIndex at) {
      updateHeight(at);
      auto factor = balance(at);
      if (factor > 1) {
        auto left = node(at).left.value();
        if (balance(left) < 0) {
          setLeft(at, rotateLeft(left));
        }
        return rotateRight(at);
      }
      if (factor < -1) {
        auto right = node(at).right.value();
        if (balance(right) > 0) {
          setRight(at, rotateRight(right));
        }
        return rotateLeft(at);
      }
      return at;
    }

    FreeListIndex insertAt(Link at, const K &key, bool &inserted) {
      if (not at.has_value()) {
        inserted = true;
        return nodes_.allocate(Node{key, std::nullopt, std::nullopt, 1});
      }
      auto index = *at;
      const auto &n = node(index);
      if (less_(key, n.key)) {
        auto left = n.left;
        setLeft(index, insertAt(left, key, inserted));
      } else if (less_(n.key, key)) {
        auto right = n.right;
        setRight(index, insertAt(right, key, inserted));
      } else {
        return index;
      }
      return rebalance(index);
    }

    Link removeAt(Link at, const K &key, bool &removed) {
      if (not at.has_value()) {
        return std::nullopt;
      }
      auto index = *at;
      const auto &n = node(index);
      auto left = n.left;
      auto right = n.right;
      if (less_(key, n.key)) {
        setLeft(index, removeAt(left, key, removed));
        return rebalance(index);
      }
      if (less_(n.key, key)) {
        setRight(index, removeAt(right, key, removed));
        return rebalance(index);
      }

      removed = true;
      if (not left.has_value() or not right.has_value()) {
        nodes_.free(index);
        return left.has_value() ? left : right;
      }
      // node with two children is replaced by the smallest node of right
      // subtree
      FreeListIndex successor{};
      auto rest = removeMin(right.value(), successor);
      setLeft(successor, left);
      setRight(successor, rest);
      nodes_.free(index);
      return rebalance(successor);
    }

    /// Detaches the smallest node of subtree, its index goes to `min`
    Link removeMin(FreeListIndex at, FreeListIndex &min) {
      auto left = node(at).left;
      if (not left.has_value()) {
        min = at;
        return node(at).right;
      }
      setLeft(at, removeMin(left.value(), min));
      return rebalance(at);
    }

    /// @return height of subtree
    outcome::result<uint32_t> checkSubtree(Link at,
                                           const K *lo,
                                           const K *hi,
                                           uint32_t &count) const {
      if (not at.has_value()) {
        return uint32_t{0};
      }
      const auto *n = nodes_.get(*at);
      if (n == nullptr) {
        return CollectionError::INCONSISTENT_STATE;
      }
      if ((lo != nullptr and not less_(*lo, n->key))
          or (hi != nullptr and not less_(n->key, *hi))) {
        return CollectionError::TREE_UNORDERED;
      }
      ++count;
      OUTCOME_TRY(left_height, checkSubtree(n->left, lo, &n->key, count));
      OUTCOME_TRY(right_height, checkSubtree(n->right, &n->key, hi, count));
      if (n->height != 1 + std::max(left_height, right_height)) {
        return CollectionError::TREE_HEIGHT_MISMATCH;
      }
      if (left_height > right_height + 1 or right_height > left_height + 1) {
        return CollectionError::TREE_UNBALANCED;
      }
      return n->height;
    }

    LazyOption<FreeListIndex> root_;
    FreeList<Node> nodes_;
    Compare less_;
  };

}  // namespace strata::collections
