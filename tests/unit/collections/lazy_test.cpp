/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "collections/collection_error.hpp"
#include "collections/lazy.hpp"
#include "collections/lazy_option.hpp"
#include "mock/storage/buffer_storage_mock.hpp"
#include "scale/codec.hpp"
#include "storage/storage_error.hpp"
#include "testutil/collections/base_collection_test.hpp"

using strata::collections::CollectionError;
using strata::collections::Env;
using strata::collections::Lazy;
using strata::collections::LazyOption;
using strata::storage::BufferStorageMock;
using strata::storage::StorageError;
using testing::_;
using testing::Return;

struct LazyTest : public test::BaseCollection_Test {};

/**
 * @given lazy value created with initial value
 * @when it is destroyed and attached again to the same key
 * @then stored value is read back
 */
TEST_F(LazyTest, InitialValueIsWritten) {
  {
    Lazy<std::string> lazy{env, prefix("k"), "hello"};
    EXPECT_EQ(counters().writes, 0);
  }
  EXPECT_EQ(counters().writes, 1);

  Lazy<std::string> lazy{env, prefix("k")};
  EXPECT_EQ(lazy.get(), "hello");
}

/**
 * @given lazy value attached to a key with nothing stored
 * @when the value is read
 * @then VALUE_NOT_FOUND is raised
 */
TEST_F(LazyTest, AbsentValueIsError) {
  Lazy<uint64_t> lazy{env, prefix("k")};
  EXPECT_THROW_OUTCOME(lazy.get(), CollectionError::VALUE_NOT_FOUND);

  // set doesn't need the previous value
  lazy.set(5);
  EXPECT_EQ(lazy.get(), 5);
}

/**
 * @given stored lazy value
 * @when it is changed through getMut() and replace()
 * @then previous values are returned and final one is persisted
 */
TEST_F(LazyTest, Modification) {
  {
    Lazy<uint64_t> lazy{env, prefix("k"), 1};
  }
  {
    Lazy<uint64_t> lazy{env, prefix("k")};
    lazy.getMut() += 10;
    EXPECT_EQ(lazy.replace(100), 11);
    EXPECT_EQ(lazy.get(), 100);
  }
  Lazy<uint64_t> lazy{env, prefix("k")};
  EXPECT_EQ(lazy.get(), 100);
}

/**
 * @given lazy value which was only read
 * @when it is flushed
 * @then nothing is written
 */
TEST_F(LazyTest, UnmodifiedIsNotWritten) {
  {
    Lazy<uint64_t> lazy{env, prefix("k"), 1};
  }
  resetCounters();
  {
    Lazy<uint64_t> lazy{env, prefix("k")};
    EXPECT_EQ(lazy.get(), 1);
    lazy.flush();
  }
  EXPECT_EQ(counters().reads, 1);
  EXPECT_EQ(counters().writes, 0);
}

/**
 * @given lazy option attached to a key with stored value
 * @when the value is read many times
 * @then storage is read exactly once
 */
TEST(LazyMockTest, LoadedOnce) {
  auto logsys = testutil::prepareLoggers();
  auto storage = std::make_shared<BufferStorageMock>();
  auto env = std::make_shared<Env>(
      logsys, std::shared_ptr<strata::storage::BufferStorage>{storage});

  ASSERT_OUTCOME_SUCCESS(encoded, strata::scaleEncode(uint32_t{42}));
  EXPECT_CALL(*storage, tryGetMock(_))
      .WillOnce(Return(std::optional<qtils::ByteVec>{encoded}));
  EXPECT_CALL(*storage, put(_, _)).Times(0);
  EXPECT_CALL(*storage, remove(_)).Times(0);

  LazyOption<uint32_t> lazy{env, qtils::ByteVec{1, 2, 3}};
  for (auto i = 0; i < 5; ++i) {
    EXPECT_TRUE(lazy.isSome());
    EXPECT_EQ(lazy.get(), 42);
  }
}

/**
 * @given lazy option over storage failing to read
 * @when the value is read
 * @then storage error is raised
 */
TEST(LazyMockTest, StorageFailureIsRaised) {
  auto logsys = testutil::prepareLoggers();
  auto storage = std::make_shared<BufferStorageMock>();
  auto env = std::make_shared<Env>(
      logsys, std::shared_ptr<strata::storage::BufferStorage>{storage});

  EXPECT_CALL(*storage, tryGetMock(_))
      .WillOnce(Return(StorageError::IO_ERROR));

  LazyOption<uint32_t> lazy{env, qtils::ByteVec{1}};
  EXPECT_THROW_OUTCOME(lazy.get(), StorageError::IO_ERROR);
}

/**
 * @given stored lazy option
 * @when the value is taken
 * @then the key is removed from storage on flush
 */
TEST_F(LazyTest, TakeRemoves) {
  {
    LazyOption<std::string> lazy{env, prefix("o"), "value"};
  }
  EXPECT_EQ(memory->size(), 1);
  {
    LazyOption<std::string> lazy{env, prefix("o")};
    EXPECT_EQ(lazy.take(), "value");
    EXPECT_TRUE(lazy.isNone());
    EXPECT_EQ(lazy.take(), std::nullopt);
  }
  EXPECT_EQ(memory->size(), 0);
}

/**
 * @given lazy option created as absent
 * @when it is read and destroyed
 * @then storage is neither read nor written
 */
TEST_F(LazyTest, CreatedAbsentIsNotLoaded) {
  {
    LazyOption<std::string> lazy{env, prefix("o"), std::nullopt};
    EXPECT_TRUE(lazy.isNone());
  }
  EXPECT_EQ(counters().total(), 0);
}

/**
 * @given absent lazy option
 * @when replace() and set() are called
 * @then previous values are reported and the last value is persisted
 */
TEST_F(LazyTest, ReplaceAndSet) {
  {
    LazyOption<std::string> lazy{env, prefix("o")};
    EXPECT_EQ(lazy.replace("first"), std::nullopt);
    EXPECT_EQ(lazy.replace("second"), "first");
    lazy.set("third");
    EXPECT_EQ(lazy.get(), "third");
  }
  LazyOption<std::string> lazy{env, prefix("o")};
  EXPECT_EQ(lazy.get(), "third");

  lazy.set(std::nullopt);
  lazy.flush();
  EXPECT_EQ(memory->size(), 0);
}

/**
 * @given bytes under the key of lazy value which don't decode as its type
 * @when the value is accessed
 * @then ELEMENT_DESERIALIZATION is raised, never absence
 */
TEST_F(LazyTest, UndecodableValueIsFatal) {
  EXPECT_OUTCOME_SUCCESS(memory->put(prefix("k"), ByteVec{0x10, 'a'}));
  EXPECT_OUTCOME_SUCCESS(memory->put(prefix("o"), ByteVec{1, 2, 3}));

  Lazy<std::string> lazy{env, prefix("k")};
  EXPECT_THROW_OUTCOME(lazy.get(), CollectionError::ELEMENT_DESERIALIZATION);
  EXPECT_THROW_OUTCOME(lazy.getMut(),
                       CollectionError::ELEMENT_DESERIALIZATION);

  // three bytes are not a u32
  LazyOption<uint32_t> option{env, prefix("o")};
  EXPECT_THROW_OUTCOME(option.isSome(),
                       CollectionError::ELEMENT_DESERIALIZATION);
  EXPECT_THROW_OUTCOME(option.take(), CollectionError::ELEMENT_DESERIALIZATION);
}
