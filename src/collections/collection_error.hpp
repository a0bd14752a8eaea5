/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace strata::collections {

  enum class CollectionError : uint8_t {
    /// Storage content contradicts invariants of the collection
    INCONSISTENT_STATE = 1,
    INDEX_OUT_OF_BOUNDS,
    KEY_SERIALIZATION,
    ELEMENT_SERIALIZATION,
    ELEMENT_DESERIALIZATION,
    /// Lazy value was read from a key with nothing stored
    VALUE_NOT_FOUND,

    // Reported by AvlTree::checkInvariants
    TREE_UNORDERED,
    TREE_HEIGHT_MISMATCH,
    TREE_UNBALANCED,
    TREE_SIZE_MISMATCH,
  };

}  // namespace strata::collections

OUTCOME_HPP_DECLARE_ERROR(strata::collections, CollectionError);
