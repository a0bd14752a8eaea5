/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_view.hpp>

#include "crypto/hash_types.hpp"
#include "keccak/keccak.h"

namespace strata::crypto {

  /// Legacy Keccak-256 (pre-FIPS padding), as used by Ethereum-style stores
  inline Hash256 keccak256(qtils::ByteView buf) {
    Hash256 out;
    sha3_HashBuffer(256,
                    SHA3_FLAGS::SHA3_FLAGS_KECCAK,
                    buf.data(),
                    buf.size(),
                    out.data(),
                    out.size());
    return out;
  }

}  // namespace strata::crypto
