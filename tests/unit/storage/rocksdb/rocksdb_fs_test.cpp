/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <fstream>

#include <mock/app/configuration_mock.hpp>
#include <qtils/test/outcome.hpp>

#include "app/configuration.hpp"
#include "storage/rocksdb/rocksdb_storage.hpp"
#include "storage/storage_error.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/storage/base_fs_test.hpp"

using strata::app::ConfigurationMock;
using strata::log::LoggingSystem;
using strata::storage::RocksDbStorage;
using strata::storage::StorageError;
using StorageConfig = strata::app::Configuration::StorageConfig;
using namespace testing;

struct RocksDb_Open : public test::BaseFS_Test {
  RocksDb_Open() : test::BaseFS_Test("/tmp/strata-test-rocksdb-open") {}

  void SetUp() override {
    BaseFS_Test::SetUp();

    logsys = testutil::prepareLoggers();
    app_config = std::make_shared<ConfigurationMock>();

    storage_config = StorageConfig{
        .directory = getPathString() + "/db",
        .cache_size = 8 << 20,  // 8Mb
    };
    EXPECT_CALL(*app_config, storage())
        .WillRepeatedly(ReturnRef(storage_config));
  };

  void TearDown() override {
    app_config.reset();
    BaseFS_Test::TearDown();
  }

  std::shared_ptr<LoggingSystem> logsys;
  std::shared_ptr<ConfigurationMock> app_config;
  StorageConfig storage_config;
};

/**
 * @given directory path which can't be created
 * @when open database
 * @then database can not be opened
 */
TEST_F(RocksDb_Open, OpenNonExistingDB) {
  storage_config.directory = "/dev/zero/impossible/path";

  ASSERT_THROW_OUTCOME(RocksDbStorage(logsys, app_config),
                       StorageError::DB_PATH_NOT_CREATED);
}

/**
 * @given path of a regular file
 * @when open database
 * @then database can not be opened
 */
TEST_F(RocksDb_Open, OpenOverRegularFile) {
  auto file = getPathString() + "/file";
  std::ofstream{file} << "not a database";
  storage_config.directory = file;

  EXPECT_ANY_THROW(RocksDbStorage(logsys, app_config));
}

/**
 * @given writable directory
 * @when open database
 * @then database is opened
 */
TEST_F(RocksDb_Open, OpenExistingDB) {
  ASSERT_NO_THROW(RocksDbStorage(logsys, app_config));
  // and once again over the existing one
  ASSERT_NO_THROW(RocksDbStorage(logsys, app_config));
}
