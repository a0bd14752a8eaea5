/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <stdexcept>

#include "storage/face/write_batch.hpp"

namespace strata::storage::face {

  /**
   * @brief Store able to produce write batches bound to itself
   */
  template <typename K, typename V>
  struct BatchWriteable {
    virtual ~BatchWriteable() = default;

    /**
     * @brief Creates an empty batch, modifications go to this store on commit
     */
    virtual std::unique_ptr<WriteBatch<K, V>> batch() {
      throw std::logic_error{"BatchWriteable::batch not implemented"};
    }
  };

}  // namespace strata::storage::face
