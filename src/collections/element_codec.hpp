/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <qtils/byte_view.hpp>

#include "collections/collection_error.hpp"
#include "scale/codec.hpp"
#include "utils/value_or_raise.hpp"

namespace strata::collections::detail {

  template <typename T>
  qtils::ByteVec encodeElement(const T &value) {
    return valueOrRaise(scaleEncode(value),
                        CollectionError::ELEMENT_SERIALIZATION);
  }

  /// Stored bytes are never treated as absence, undecodable ones are fatal
  template <typename T>
  T decodeElement(qtils::ByteView bytes) {
    return valueOrRaise(scaleDecode<T>(bytes),
                        CollectionError::ELEMENT_DESERIALIZATION);
  }

}  // namespace strata::collections::detail
