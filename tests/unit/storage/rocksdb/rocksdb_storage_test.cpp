/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "collections/env.hpp"
#include "collections/tree_map.hpp"
#include "collections/vector.hpp"
#include "storage/storage_error.hpp"
#include "storage/storage_factory.hpp"
#include "testutil/literals.hpp"
#include "testutil/storage/base_rocksdb_test.hpp"

using strata::collections::Env;
using strata::collections::TreeMap;
using strata::collections::Vector;
using strata::storage::StorageError;

struct RocksDbStorageTest : public test::BaseRocksDB_Test {
  RocksDbStorageTest()
      : BaseRocksDB_Test("/tmp/strata-test-rocksdb-storage") {}

  std::shared_ptr<Env> env() {
    return std::make_shared<Env>(logsys, db_);
  }
};

/**
 * @given opened database
 * @when a value is put, read and removed
 * @then reads reflect the last modification
 */
TEST_F(RocksDbStorageTest, PutGetRemove) {
  auto key = "key"_vec;
  EXPECT_OUTCOME_SUCCESS(db_->put(key, "value"_vec));

  ASSERT_OUTCOME_SUCCESS(value, db_->get(key));
  BufferView view = value;
  EXPECT_EQ(Buffer(view.begin(), view.end()), "value"_vec);
  ASSERT_OUTCOME_SUCCESS(present, db_->contains(key));
  EXPECT_TRUE(present);

  EXPECT_OUTCOME_SUCCESS(db_->remove(key));
  ASSERT_OUTCOME_SUCCESS(absent, db_->tryGet(key));
  EXPECT_FALSE(absent.has_value());

  auto res = db_->get(key);
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), make_error_code(StorageError::NOT_FOUND));
}

/**
 * @given opened database
 * @when batch is committed and the database is reopened
 * @then batch content survives
 */
TEST_F(RocksDbStorageTest, BatchSurvivesReopen) {
  {
    auto batch = db_->batch();
    EXPECT_OUTCOME_SUCCESS(batch->put("a"_vec, "1"_vec));
    EXPECT_OUTCOME_SUCCESS(batch->put("b"_vec, "2"_vec));
    EXPECT_OUTCOME_SUCCESS(batch->remove("a"_vec));
    EXPECT_OUTCOME_SUCCESS(batch->commit());
  }
  open();

  ASSERT_OUTCOME_SUCCESS(a, db_->contains("a"_vec));
  EXPECT_FALSE(a);
  ASSERT_OUTCOME_SUCCESS(b, db_->tryGet("b"_vec));
  ASSERT_TRUE(b.has_value());
  BufferView view = b.value();
  EXPECT_EQ(Buffer(view.begin(), view.end()), "2"_vec);
}

/**
 * @given collections flushed into the database
 * @when the database is closed and opened again
 * @then collections attached to the same prefixes see the same content
 */
TEST_F(RocksDbStorageTest, CollectionsSurviveReopen) {
  {
    auto env = this->env();
    Vector<std::string> log{env, "log"_vec};
    TreeMap<uint32_t, std::string> index{env, "idx"_vec};
    for (uint32_t i = 0; i < 50; ++i) {
      log.push("entry " + std::to_string(i));
      index.insert(100 - i, std::to_string(i));
    }
  }
  open();

  auto env = this->env();
  Vector<std::string> log{env, "log"_vec};
  TreeMap<uint32_t, std::string> index{env, "idx"_vec};
  EXPECT_EQ(log.len(), 50);
  EXPECT_EQ(*log.get(49), "entry 49");
  EXPECT_EQ(index.len(), 50);
  EXPECT_EQ(index.min()->first, 51);
  EXPECT_EQ(index.min()->second, "49");
  EXPECT_OUTCOME_SUCCESS(index.checkInvariants());
}

/**
 * @given configuration selecting RocksDB backend with quota
 * @when storage is created by the factory
 * @then it is metered with the configured quota and persists data
 */
TEST_F(RocksDbStorageTest, FactoryCreatesMeteredRocksDb) {
  close();
  storage_config.directory = getPathString() + "/factory";
  storage_config.quota = 100;
  {
    auto storage = strata::storage::createStorage(logsys, app_config);
    EXPECT_EQ(storage->quota(), 100);
    EXPECT_OUTCOME_SUCCESS(storage->put("k"_vec, "v"_vec));
    EXPECT_EQ(storage->counters().writes, 1);
  }
  auto storage = strata::storage::createStorage(logsys, app_config);
  ASSERT_OUTCOME_SUCCESS(present, storage->contains("k"_vec));
  EXPECT_TRUE(present);
}
