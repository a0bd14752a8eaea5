/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <openssl/evp.h>

namespace strata::crypto {
  Hash256 sha256(std::string_view input) {
    return sha256(
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        {reinterpret_cast<const uint8_t *>(input.data()), input.size()});
  }

  Hash256 sha256(qtils::ByteView input) {
    Hash256 out;
    unsigned int out_size = 0;
    // one-shot digest, SHA256_* low level calls are deprecated in OpenSSL 3
    EVP_Digest(input.data(),
               input.size(),
               out.data(),
               &out_size,
               EVP_sha256(),
               nullptr);
    return out;
  }
}  // namespace strata::crypto
