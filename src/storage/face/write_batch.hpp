/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/face/writeable.hpp"

namespace strata::storage::face {

  /**
   * @brief Accumulates modifications and applies them to the origin store
   * at once.
   *
   * Puts and removals are kept in the batch until commit(). When the same
   * key is touched twice, the last modification wins.
   */
  template <typename K, typename V>
  struct WriteBatch : public Writeable<K, V> {
    /// Applies all accumulated modifications to the origin store
    virtual outcome::result<void> commit() = 0;

    /// Drops all accumulated modifications
    virtual void clear() = 0;
  };

}  // namespace strata::storage::face
