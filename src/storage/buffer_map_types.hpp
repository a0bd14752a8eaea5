/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <qtils/byte_vec_or_view.hpp>
#include <qtils/byte_view.hpp>

#include "storage/face/generic_storage.hpp"
#include "storage/face/write_batch.hpp"

namespace strata::storage::face {

  template <>
  struct OwnedOrViewTrait<qtils::ByteVec> {
    using type = qtils::ByteVecOrView;
  };

  template <>
  struct ViewTrait<qtils::ByteVec> {
    using type = qtils::ByteView;
  };

}  // namespace strata::storage::face

namespace strata::storage {

  using qtils::ByteVec;
  using qtils::ByteVecOrView;
  using qtils::ByteView;

  /// Batch of byte-keyed modifications
  using BufferBatch = face::WriteBatch<ByteVec, ByteVec>;

  /// Byte-keyed point store, the primitive all collections are built on
  using BufferStorage = face::GenericStorage<ByteVec, ByteVec>;

}  // namespace strata::storage
