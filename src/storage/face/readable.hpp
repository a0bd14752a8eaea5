/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <qtils/outcome.hpp>

#include "storage/face/owned_or_view.hpp"
#include "storage/face/view.hpp"

namespace strata::storage::face {

  /**
   * @brief Point lookups of a key-value store
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct Readable {
    virtual ~Readable() = default;

    /**
     * @brief Checks whether a value is bound to the key, without fetching it
     * @param key key to look for
     * @return true if the key is present
     */
    [[nodiscard]] virtual outcome::result<bool> contains(
        const View<K> &key) const = 0;

    /**
     * @brief Fetches the value bound to the key
     * @return value, or StorageError::NOT_FOUND if the key is absent
     */
    [[nodiscard]] virtual outcome::result<OwnedOrView<V>> get(
        const View<K> &key) const = 0;

    /**
     * @brief Fetches the value bound to the key
     * @return value, or std::nullopt if the key is absent
     */
    [[nodiscard]] virtual outcome::result<std::optional<OwnedOrView<V>>> tryGet(
        const View<K> &key) const = 0;
  };

}  // namespace strata::storage::face
