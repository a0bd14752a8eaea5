/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <string>

#include <gtest/gtest.h>

namespace test {

  namespace fs = std::filesystem;

  /**
   * Test fixture owning a scratch directory, which is recreated before and
   * removed after each test
   */
  struct BaseFS_Test : public ::testing::Test {
    explicit BaseFS_Test(fs::path path) : base_path(std::move(path)) {
      clear();
      mkdir();
    }

    ~BaseFS_Test() override {
      clear();
    }

    void clear() {
      std::error_code ec;
      fs::remove_all(base_path, ec);
    }

    void mkdir() {
      std::error_code ec;
      fs::create_directories(base_path, ec);
      ASSERT_FALSE(ec) << "Can't create " << base_path << ": " << ec.message();
    }

    std::string getPathString() const {
      return fs::canonical(base_path).string();
    }

    void SetUp() override {
      clear();
      mkdir();
    }

    void TearDown() override {
      clear();
    }

   protected:
    fs::path base_path;
  };

}  // namespace test
