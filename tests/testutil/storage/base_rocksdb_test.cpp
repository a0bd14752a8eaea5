/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testutil/storage/base_rocksdb_test.hpp"

#include "testutil/prepare_loggers.hpp"

namespace test {

  void BaseRocksDB_Test::open() {
    close();
    ASSERT_NO_THROW(rocks_ = std::make_shared<RocksDB>(logsys, app_config));
    db_ = rocks_;
  }

  void BaseRocksDB_Test::close() {
    db_.reset();
    rocks_.reset();
  }

  BaseRocksDB_Test::BaseRocksDB_Test(fs::path path)
      : BaseFS_Test(std::move(path)) {}

  void BaseRocksDB_Test::SetUp() {
    BaseFS_Test::SetUp();
    logsys = testutil::prepareLoggers();
    app_config = std::make_shared<strata::app::ConfigurationMock>();

    storage_config = StorageConfig{
        .backend = strata::app::Configuration::StorageBackend::ROCKSDB,
        .directory = getPathString() + "/db",
        .cache_size = 8 << 20,  // 8Mb
    };
    EXPECT_CALL(*app_config, storage())
        .WillRepeatedly(testing::ReturnRef(storage_config));

    open();
  }

  void BaseRocksDB_Test::TearDown() {
    close();
    app_config.reset();
    clear();
  }

}  // namespace test
