/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <qtils/error_throw.hpp>
#include <qtils/shared_ref.hpp>

#include "collections/collection_error.hpp"
#include "collections/env.hpp"
#include "collections/free_list.hpp"
#include "collections/key.hpp"
#include "collections/lookup_map.hpp"
#include "utils/ctor_limiters.hpp"

namespace strata::collections {

  /**
   * Set with iteration. Layout is the same as of IterableMap: elements in a
   * FreeList under prefix ++ 'e', their indices in LookupMap under
   * prefix ++ 'i'.
   */
  template <typename T, typename H = Sha256>
  class IterableSet : NonCopyable {
   public:
    using Iterator = typename FreeList<T>::Iterator;
    using ReverseIterator = typename FreeList<T>::ReverseIterator;

    IterableSet(qtils::SharedRef<Env> env, const ByteVec &prefix)
        : index_{env, detail::nestedPrefix(prefix, 'i')},
          elements_{env, detail::nestedPrefix(prefix, 'e')} {}

    IterableSet(IterableSet &&) noexcept = default;
    IterableSet &operator=(IterableSet &&) = delete;

    uint32_t len() const {
      return elements_.len();
    }

    bool isEmpty() const {
      return len() == 0;
    }

    bool contains(const T &value) const {
      return index_.contains(value);
    }

    /// @return true if the value was not in the set
    bool insert(const T &value) {
      if (index_.get(value) != nullptr) {
        return false;
      }
      index_.overwrite(value, elements_.allocate(value));
      return true;
    }

    /// @return true if the value was in the set
    bool remove(const T &value) {
      auto index = index_.remove(value);
      if (not index.has_value()) {
        return false;
      }
      if (not elements_.free(index.value()).has_value()) {
        qtils::raise(CollectionError::INCONSISTENT_STATE);
      }
      return true;
    }

    std::optional<FreeListIndex> indexOf(const T &value) const {
      const auto *index = index_.get(value);
      if (index == nullptr) {
        return std::nullopt;
      }
      return *index;
    }

    void clear() {
      for (const auto &value : elements_) {
        index_.overwrite(value, std::nullopt);
      }
      elements_.clear();
    }

    void flush() {
      index_.flush();
      elements_.flush();
    }

    Iterator begin() const {
      return elements_.begin();
    }
    Iterator end() const {
      return elements_.end();
    }
    ReverseIterator rbegin() const {
      return elements_.rbegin();
    }
    ReverseIterator rend() const {
      return elements_.rend();
    }

   private:
    LookupMap<T, FreeListIndex, H> index_;
    FreeList<T> elements_;
  };

}  // namespace strata::collections
