/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <concepts>

#include <qtils/byte_vec.hpp>
#include <qtils/byte_view.hpp>

#include "collections/collection_error.hpp"
#include "crypto/keccak/keccak.hpp"
#include "crypto/sha/sha256.hpp"
#include "scale/codec.hpp"
#include "utils/value_or_raise.hpp"

/**
 * Strategies deriving storage key from prefix of collection and logical key.
 * Strategy is a template parameter of collection and must never change for
 * already stored data.
 */
namespace strata::collections {

  namespace detail {
    template <typename K>
    qtils::ByteVec encodeKey(const K &key) {
      return valueOrRaise(scaleEncode(key), CollectionError::KEY_SERIALIZATION);
    }

    inline qtils::ByteVec concat(qtils::ByteView prefix,
                                 qtils::ByteView suffix) {
      qtils::ByteVec out;
      out.reserve(prefix.size() + suffix.size());
      out.insert(out.end(), prefix.begin(), prefix.end());
      out.insert(out.end(), suffix.begin(), suffix.end());
      return out;
    }

    /// Prefix of a collection nested into composite one
    inline qtils::ByteVec nestedPrefix(qtils::ByteView prefix, char tag) {
      qtils::ByteVec out(prefix.begin(), prefix.end());
      out.push_back(static_cast<uint8_t>(tag));
      return out;
    }
  }  // namespace detail

  /// prefix ++ encode(key). Prefixes of collections must be incomparable.
  struct Identity {
    template <typename K>
    static qtils::ByteVec toKey(qtils::ByteView prefix, const K &key) {
      return detail::concat(prefix, detail::encodeKey(key));
    }
  };

  /// prefix ++ sha256(prefix ++ encode(key))
  struct Sha256 {
    template <typename K>
    static qtils::ByteVec toKey(qtils::ByteView prefix, const K &key) {
      auto preimage = detail::concat(prefix, detail::encodeKey(key));
      return detail::concat(prefix, crypto::sha256(qtils::ByteView{preimage}));
    }
  };

  /// prefix ++ keccak256(prefix ++ encode(key))
  struct Keccak256 {
    template <typename K>
    static qtils::ByteVec toKey(qtils::ByteView prefix, const K &key) {
      auto preimage = detail::concat(prefix, detail::encodeKey(key));
      return detail::concat(prefix, crypto::keccak256(preimage));
    }
  };

  template <typename H, typename K>
  concept KeyStrategy = requires(qtils::ByteView prefix, const K &key) {
    { H::toKey(prefix, key) } -> std::same_as<qtils::ByteVec>;
  };

}  // namespace strata::collections
