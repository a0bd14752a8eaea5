/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "storage/face/batch_writeable.hpp"
#include "storage/face/readable.hpp"
#include "storage/face/writeable.hpp"

namespace strata::storage::face {

  /**
   * @brief Point key-value store: get, put, remove and has-key operations
   * plus batches. There is no iteration or range access,
   * ordered and iterable views are built on top of it by collections.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct GenericStorage : Readable<K, V>,
                          Writeable<K, V>,
                          BatchWriteable<K, V> {
    /**
     * @return approximate amount of stored bytes, if the backend knows it
     */
    [[nodiscard]] virtual std::optional<size_t> byteSizeHint() const {
      return std::nullopt;
    }
  };

}  // namespace strata::storage::face
