/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "collections/collection_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(strata::collections, CollectionError, e) {
  using E = strata::collections::CollectionError;
  switch (e) {
    case E::INCONSISTENT_STATE:
      return "Collection is in an inconsistent state";
    case E::INDEX_OUT_OF_BOUNDS:
      return "Index out of bounds";
    case E::KEY_SERIALIZATION:
      return "Cannot serialize key";
    case E::ELEMENT_SERIALIZATION:
      return "Cannot serialize element";
    case E::ELEMENT_DESERIALIZATION:
      return "Cannot deserialize element";
    case E::VALUE_NOT_FOUND:
      return "No value stored under the key of lazy value";
    case E::TREE_UNORDERED:
      return "Keys of tree are not in strictly increasing order";
    case E::TREE_HEIGHT_MISMATCH:
      return "Stored height of tree node differs from the actual one";
    case E::TREE_UNBALANCED:
      return "Heights of subtrees differ by more than one";
    case E::TREE_SIZE_MISMATCH:
      return "Number of tree nodes differs from number of entries";
  }
  return "Unknown CollectionError";
}
