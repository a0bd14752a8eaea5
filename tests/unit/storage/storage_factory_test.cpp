/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "app/configuration.hpp"
#include "storage/storage_error.hpp"
#include "storage/storage_factory.hpp"
#include "testutil/prepare_loggers.hpp"

using strata::app::Configuration;
using strata::storage::StorageError;

/**
 * @given default configuration
 * @when storage is created
 * @then it is unlimited in-memory storage
 */
TEST(StorageFactoryTest, DefaultIsInMemory) {
  auto logsys = testutil::prepareLoggers();
  auto config = std::make_shared<Configuration>();

  auto storage = strata::storage::createStorage(logsys, config);
  EXPECT_EQ(storage->quota(), 0);
  for (uint8_t i = 0; i < 100; ++i) {
    EXPECT_OUTCOME_SUCCESS(storage->put(qtils::ByteVec{i}, qtils::ByteVec{i}));
  }
  EXPECT_EQ(storage->counters().writes, 100);
  EXPECT_EQ(storage->byteSizeHint(), 100);
}

/**
 * @given configuration with quota
 * @when more operations than allowed are made in one call
 * @then the excess operation is refused
 */
TEST(StorageFactoryTest, QuotaFromConfig) {
  auto logsys = testutil::prepareLoggers();
  auto config = std::make_shared<Configuration>(
      Configuration::StorageConfig{.quota = 1}, std::vector<std::string>{});

  auto storage = strata::storage::createStorage(logsys, config);
  EXPECT_OUTCOME_SUCCESS(storage->contains(qtils::ByteVec{1}));
  auto res = storage->contains(qtils::ByteVec{1});
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), make_error_code(StorageError::RESOURCE_EXHAUSTED));
}
