/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "storage/face/owned_or_view.hpp"
#include "storage/face/view.hpp"

namespace strata::storage::face {

  /**
   * @brief Point modifications of a key-value store
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct Writeable {
    virtual ~Writeable() = default;

    /**
     * @brief Binds the value to the key, replacing the previous one
     */
    virtual outcome::result<void> put(const View<K> &key,
                                      OwnedOrView<V> &&value) = 0;

    /**
     * @brief Drops the binding of the key. Removing an absent key succeeds.
     */
    virtual outcome::result<void> remove(const View<K> &key) = 0;
  };

}  // namespace strata::storage::face
