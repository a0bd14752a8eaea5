/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <limits>
#include <optional>
#include <vector>

#include <qtils/error_throw.hpp>
#include <qtils/shared_ref.hpp>

#include "collections/collection_error.hpp"
#include "collections/env.hpp"
#include "collections/flush_on_drop.hpp"
#include "collections/index_map.hpp"
#include "collections/lazy_option.hpp"
#include "utils/ctor_limiters.hpp"

namespace strata::collections {

  /**
   * Growable array. Element i is stored under prefix ++ u32_le(i), the
   * length is stored under prefix itself.
   */
  template <typename T>
  class Vector : NonCopyable {
   public:
    class Iterator {
     public:
      using iterator_category = std::bidirectional_iterator_tag;
      using value_type = T;
      using difference_type = std::ptrdiff_t;
      using pointer = const T *;
      using reference = const T &;

      Iterator() = default;
      Iterator(const Vector *vec, uint32_t index) : vec_{vec}, index_{index} {}

      reference operator*() const {
        return vec_->at(index_);
      }
      pointer operator->() const {
        return &vec_->at(index_);
      }

      Iterator &operator++() {
        ++index_;
        return *this;
      }
      Iterator operator++(int) {
        auto prev = *this;
        ++index_;
        return prev;
      }
      Iterator &operator--() {
        --index_;
        return *this;
      }
      Iterator operator--(int) {
        auto prev = *this;
        --index_;
        return prev;
      }

      uint32_t index() const {
        return index_;
      }

      bool operator==(const Iterator &other) const {
        return vec_ == other.vec_ and index_ == other.index_;
      }

     private:
      const Vector *vec_ = nullptr;
      uint32_t index_ = 0;
    };

    using ReverseIterator = std::reverse_iterator<Iterator>;

    Vector(qtils::SharedRef<Env> env, ByteVec prefix)
        : len_{env, prefix}, values_{env, prefix}, env_{std::move(env)} {}

    Vector(Vector &&other) noexcept
        : len_{std::move(other.len_)},
          values_{std::move(other.values_)},
          env_{other.env_},
          guard_{other.guard_} {}

    Vector &operator=(Vector &&) = delete;

    ~Vector() {
      detail::flushOnDrop(
          guard_, env_->logger(), "Vector", [this] { flush(); });
    }

    uint32_t len() const {
      return len_.get().value_or(0);
    }

    bool isEmpty() const {
      return len() == 0;
    }

    void push(T value) {
      auto len = this->len();
      if (len == std::numeric_limits<uint32_t>::max()) {
        qtils::raise(CollectionError::INDEX_OUT_OF_BOUNDS);
      }
      // slot beyond the end is known to be empty, no need to load it
      values_.set(len, std::move(value));
      len_.set(len + 1);
    }

    std::optional<T> pop() {
      auto len = this->len();
      if (len == 0) {
        return std::nullopt;
      }
      auto value = values_.remove(len - 1);
      if (not value.has_value()) {
        qtils::raise(CollectionError::INCONSISTENT_STATE);
      }
      len_.set(len - 1);
      return value;
    }

    /// @return element, nullptr if index is out of bounds
    const T *get(uint32_t index) const {
      if (index >= len()) {
        return nullptr;
      }
      return &at(index);
    }

    T *getMut(uint32_t index) {
      if (index >= len()) {
        return nullptr;
      }
      auto *value = values_.getMut(index);
      if (value == nullptr) {
        qtils::raise(CollectionError::INCONSISTENT_STATE);
      }
      return value;
    }

    /// Overwrites the element without loading it
    void set(uint32_t index, T value) {
      checkBounds(index);
      values_.set(index, std::move(value));
    }

    /// @return previous element
    T replace(uint32_t index, T value) {
      checkBounds(index);
      auto prev = values_.insert(index, std::move(value));
      if (not prev.has_value()) {
        qtils::raise(CollectionError::INCONSISTENT_STATE);
      }
      return std::move(prev.value());
    }

    void swap(uint32_t a, uint32_t b) {
      checkBounds(a);
      checkBounds(b);
      values_.swap(a, b);
    }

    /**
     * Removes element and puts the last one in its place.
     * @return removed element
     */
    T swapRemove(uint32_t index) {
      checkBounds(index);
      auto last = len() - 1;
      if (index != last) {
        values_.swap(index, last);
      }
      return pop().value();
    }

    /**
     * Removes [start, min(end, len)) and shifts the tail down. Range starting
     * after its end is empty.
     * @return removed elements in order
     */
    std::vector<T> drain(uint32_t start, uint32_t end) {
      auto len = this->len();
      end = std::min(end, len);
      start = std::min(start, end);
      std::vector<T> drained;
      drained.reserve(end - start);
      for (auto i = start; i < end; ++i) {
        auto value = values_.remove(i);
        if (not value.has_value()) {
          qtils::raise(CollectionError::INCONSISTENT_STATE);
        }
        drained.emplace_back(std::move(value.value()));
      }
      auto delta = end - start;
      if (delta != 0) {
        for (auto i = end; i < len; ++i) {
          auto value = values_.remove(i);
          if (not value.has_value()) {
            qtils::raise(CollectionError::INCONSISTENT_STATE);
          }
          values_.set(i - delta, std::move(value));
        }
        len_.set(len - delta);
      }
      return drained;
    }

    /// Removes all elements, without loading them
    void clear() {
      auto len = this->len();
      for (uint32_t i = 0; i < len; ++i) {
        values_.set(i, std::nullopt);
      }
      len_.set(0);
    }

    void flush() {
      values_.flush();
      len_.flush();
    }

    Iterator begin() const {
      return Iterator{this, 0};
    }
    Iterator end() const {
      return Iterator{this, len()};
    }
    ReverseIterator rbegin() const {
      return ReverseIterator{end()};
    }
    ReverseIterator rend() const {
      return ReverseIterator{begin()};
    }

   private:
    void checkBounds(uint32_t index) const {
      if (index >= len()) {
        qtils::raise(CollectionError::INDEX_OUT_OF_BOUNDS);
      }
    }

    const T &at(uint32_t index) const {
      const auto *value = values_.get(index);
      if (value == nullptr) {
        qtils::raise(CollectionError::INCONSISTENT_STATE);
      }
      return *value;
    }

    LazyOption<uint32_t> len_;
    IndexMap<T> values_;
    qtils::SharedRef<Env> env_;
    detail::UnwindGuard guard_;
  };

}  // namespace strata::collections
