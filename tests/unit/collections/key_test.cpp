/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "collections/key.hpp"
#include "crypto/keccak/keccak.hpp"
#include "crypto/sha/sha256.hpp"
#include "testutil/literals.hpp"

using qtils::ByteVec;
using strata::collections::Identity;
using strata::collections::Keccak256;
using strata::collections::Sha256;
using strata::collections::detail::concat;
using strata::collections::detail::nestedPrefix;

/**
 * @given prefix and integer key
 * @when identity key is derived
 * @then it is the prefix followed by little-endian key
 */
TEST(KeyTest, IdentityLayout) {
  auto key = Identity::toKey("p"_vec, uint32_t{0x01020304});
  EXPECT_EQ(key, (ByteVec{'p', 0x04, 0x03, 0x02, 0x01}));
}

/**
 * @given prefix and key
 * @when hashed keys are derived
 * @then they are the prefix followed by digest of prefixed encoded key
 */
TEST(KeyTest, HashedLayout) {
  auto prefix = "p"_vec;
  auto preimage = concat(prefix, Identity::toKey(ByteVec{}, uint64_t{7}));

  auto sha = Sha256::toKey(prefix, uint64_t{7});
  auto sha_digest = strata::crypto::sha256(qtils::ByteView{preimage});
  EXPECT_EQ(sha, concat(prefix, sha_digest));

  auto keccak = Keccak256::toKey(prefix, uint64_t{7});
  EXPECT_EQ(keccak, concat(prefix, strata::crypto::keccak256(preimage)));

  EXPECT_NE(sha, keccak);
  EXPECT_EQ(sha.size(), keccak.size());
}

/**
 * @given the same key in two collections
 * @when hashed keys are derived
 * @then digests differ, as the prefix is hashed too
 */
TEST(KeyTest, PrefixIsHashed) {
  auto a = Sha256::toKey("a"_vec, std::string{"key"});
  auto b = Sha256::toKey("b"_vec, std::string{"key"});
  EXPECT_NE(ByteVec(a.begin() + 1, a.end()), ByteVec(b.begin() + 1, b.end()));
}

/**
 * @given collection prefix
 * @when nested prefixes are derived
 * @then they extend the prefix by a tag byte
 */
TEST(KeyTest, NestedPrefix) {
  EXPECT_EQ(nestedPrefix("map"_vec, 'i'), "mapi"_vec);
  EXPECT_NE(nestedPrefix("map"_vec, 'i'), nestedPrefix("map"_vec, 'e'));
}
