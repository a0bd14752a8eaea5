/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <qtils/byte_vec.hpp>
#include <qtils/byte_view.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "storage/buffer_map_types.hpp"

namespace strata::collections {

  using qtils::ByteVec;
  using qtils::ByteView;

  /**
   * Point storage as seen by collections.
   *
   * Every failure of underlying storage (including exhausted quota) is
   * fatal for the current call: it is logged and raised as
   * std::system_error carrying the storage error code.
   */
  class Env {
   public:
    Env(qtils::SharedRef<log::LoggingSystem> logsys,
        qtils::SharedRef<storage::BufferStorage> storage);

    /// @return stored bytes, or std::nullopt if the key is absent
    std::optional<ByteVec> read(ByteView key) const;

    void write(ByteView key, ByteVec value);

    void remove(ByteView key);

    /// Checks presence of the key without fetching its value
    bool has(ByteView key) const;

    const log::Logger &logger() const {
      return logger_;
    }

   private:
    log::Logger logger_;
    qtils::SharedRef<storage::BufferStorage> storage_;
  };

}  // namespace strata::collections
