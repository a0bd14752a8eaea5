/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <iterator>
#include <optional>
#include <ranges>
#include <type_traits>
#include <variant>

#include <qtils/error_throw.hpp>
#include <qtils/shared_ref.hpp>

#include "collections/collection_error.hpp"
#include "collections/env.hpp"
#include "collections/flush_on_drop.hpp"
#include "collections/key.hpp"
#include "collections/lazy_option.hpp"
#include "collections/vector.hpp"
#include "utils/ctor_limiters.hpp"

namespace strata::collections {

  /// Stable index of an element in FreeList
  using FreeListIndex = uint32_t;

  /// Persisted metadata of FreeList
  struct FreeListMeta {
    std::optional<FreeListIndex> first_free;
    uint32_t occupied_count = 0;
  };

  template <typename T>
  struct OccupiedSlot {
    T value;
  };

  /// Link of the list of vacated slots
  struct VacantSlot {
    std::optional<FreeListIndex> next_free;
  };

  template <typename T>
  using FreeListSlot = std::variant<OccupiedSlot<T>, VacantSlot>;

  /**
   * Slot array giving out indices which stay valid until the element is
   * freed. Freed slots are chained into a list and reused by following
   * allocations, so both allocation and freeing are O(1).
   *
   * Slots are stored in a Vector under prefix ++ 'v', metadata under
   * prefix ++ 'm'.
   */
  template <typename T>
  class FreeList : NonCopyable {
    using Slot = FreeListSlot<T>;

   public:
    /**
     * Iterates over occupied slots in order of indices. Freeing of slots
     * other than the current one during iteration is allowed.
     * Mutable iterator marks each visited element as modified.
     */
    template <bool kMutable>
    class BasicIterator {
      using List = std::conditional_t<kMutable, FreeList, const FreeList>;

     public:
      using iterator_category = std::bidirectional_iterator_tag;
      using value_type = T;
      using difference_type = std::ptrdiff_t;
      using pointer = std::conditional_t<kMutable, T *, const T *>;
      using reference = std::conditional_t<kMutable, T &, const T &>;

      BasicIterator() = default;
      BasicIterator(List *list, FreeListIndex index)
          : list_{list}, index_{index} {}

      reference operator*() const {
        pointer value = nullptr;
        if constexpr (kMutable) {
          value = list_->getMut(index_);
        } else {
          value = list_->get(index_);
        }
        if (value == nullptr) {
          qtils::raise(CollectionError::INCONSISTENT_STATE);
        }
        return *value;
      }
      pointer operator->() const {
        return &**this;
      }

      BasicIterator &operator++() {
        index_ = list_->nextOccupied(index_ + 1);
        return *this;
      }
      BasicIterator operator++(int) {
        auto prev = *this;
        ++*this;
        return prev;
      }
      BasicIterator &operator--() {
        index_ = list_->prevOccupied(index_);
        return *this;
      }
      BasicIterator operator--(int) {
        auto prev = *this;
        --*this;
        return prev;
      }

      /// Index of current slot
      FreeListIndex index() const {
        return index_;
      }

      bool operator==(const BasicIterator &other) const {
        return list_ == other.list_ and index_ == other.index_;
      }

     private:
      List *list_ = nullptr;
      FreeListIndex index_ = 0;
    };

    using Iterator = BasicIterator<false>;
    using MutIterator = BasicIterator<true>;
    using ReverseIterator = std::reverse_iterator<Iterator>;

    FreeList(qtils::SharedRef<Env> env, ByteVec prefix)
        : meta_{env, detail::nestedPrefix(prefix, 'm')},
          slots_{env, detail::nestedPrefix(prefix, 'v')},
          env_{std::move(env)} {}

    FreeList(FreeList &&other) noexcept
        : meta_{std::move(other.meta_)},
          slots_{std::move(other.slots_)},
          env_{other.env_},
          guard_{other.guard_} {}

    FreeList &operator=(FreeList &&) = delete;

    ~FreeList() {
      detail::flushOnDrop(
          guard_, env_->logger(), "FreeList", [this] { flush(); });
    }

    /// Number of occupied slots
    uint32_t len() const {
      return meta().occupied_count;
    }

    bool isEmpty() const {
      return len() == 0;
    }

    /// Puts value into the head of free list, or appends a new slot
    FreeListIndex allocate(T value) {
      auto meta = this->meta();
      FreeListIndex index{};
      if (meta.first_free.has_value()) {
        index = meta.first_free.value();
        const auto *vacant = vacantAt(index);
        if (vacant == nullptr) {
          qtils::raise(CollectionError::INCONSISTENT_STATE);
        }
        meta.first_free = vacant->next_free;
        slots_.set(index, Slot{OccupiedSlot<T>{std::move(value)}});
      } else {
        index = slots_.len();
        slots_.push(Slot{OccupiedSlot<T>{std::move(value)}});
      }
      ++meta.occupied_count;
      meta_.set(meta);
      return index;
    }

    /// @return element, nullptr if slot is vacant or out of range
    const T *get(FreeListIndex index) const {
      const auto *slot = slots_.get(index);
      if (slot == nullptr) {
        return nullptr;
      }
      const auto *occupied = std::get_if<OccupiedSlot<T>>(slot);
      return occupied != nullptr ? &occupied->value : nullptr;
    }

    T *getMut(FreeListIndex index) {
      // vacant slot must not be marked modified
      if (get(index) == nullptr) {
        return nullptr;
      }
      return &std::get<OccupiedSlot<T>>(*slots_.getMut(index)).value;
    }

    /**
     * Vacates the slot, it becomes the head of free list.
     * @return freed element, std::nullopt for vacant or out of range slot
     */
    std::optional<T> free(FreeListIndex index) {
      if (get(index) == nullptr) {
        return std::nullopt;
      }
      auto meta = this->meta();
      auto prev = slots_.replace(index, Slot{VacantSlot{meta.first_free}});
      meta.first_free = index;
      --meta.occupied_count;
      meta_.set(meta);
      return std::move(std::get<OccupiedSlot<T>>(prev).value);
    }

    void clear() {
      slots_.clear();
      meta_.set(std::nullopt);
    }

    void flush() {
      slots_.flush();
      meta_.flush();
    }

    Iterator begin() const {
      return Iterator{this, nextOccupied(0)};
    }
    Iterator end() const {
      return Iterator{this, slots_.len()};
    }
    ReverseIterator rbegin() const {
      return ReverseIterator{end()};
    }
    ReverseIterator rend() const {
      return ReverseIterator{begin()};
    }

    /// Occupied elements, each visited one is written back on flush
    std::ranges::subrange<MutIterator> iterMut() {
      return {MutIterator{this, nextOccupied(0)},
              MutIterator{this, slots_.len()}};
    }

   private:
    FreeListMeta meta() const {
      return meta_.get().value_or(FreeListMeta{});
    }

    const VacantSlot *vacantAt(FreeListIndex index) const {
      const auto *slot = slots_.get(index);
      return slot != nullptr ? std::get_if<VacantSlot>(slot) : nullptr;
    }

    FreeListIndex nextOccupied(FreeListIndex from) const {
      auto len = slots_.len();
      for (auto i = from; i < len; ++i) {
        if (get(i) != nullptr) {
          return i;
        }
      }
      return len;
    }

    FreeListIndex prevOccupied(FreeListIndex before) const {
      for (auto i = before; i > 0; --i) {
        if (get(i - 1) != nullptr) {
          return i - 1;
        }
      }
      return begin().index();
    }

    LazyOption<FreeListMeta> meta_;
    Vector<Slot> slots_;
    qtils::SharedRef<Env> env_;
    detail::UnwindGuard guard_;
  };

}  // namespace strata::collections
