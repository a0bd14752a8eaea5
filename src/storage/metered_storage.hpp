/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "storage/buffer_map_types.hpp"

namespace strata::storage {

  /// Storage operations performed since the beginning of the current call
  struct StorageCounters {
    uint64_t reads = 0;
    uint64_t writes = 0;
    uint64_t removes = 0;
    uint64_t has = 0;

    uint64_t total() const {
      return reads + writes + removes + has;
    }

    bool operator==(const StorageCounters &) const = default;
  };

  /**
   * Decorator which meters every operation passed to the origin storage.
   * With non-zero quota, an operation beyond the quota of the current call
   * fails with StorageError::RESOURCE_EXHAUSTED and doesn't reach the
   * origin.
   */
  class MeteredStorage : public BufferStorage {
   public:
    MeteredStorage(qtils::SharedRef<log::LoggingSystem> logsys,
                   qtils::SharedRef<BufferStorage> origin,
                   uint64_t quota = 0);

    [[nodiscard]] outcome::result<ByteVecOrView> get(
        const ByteView &key) const override;

    [[nodiscard]] outcome::result<std::optional<ByteVecOrView>> tryGet(
        const ByteView &key) const override;

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override;

    [[nodiscard]] outcome::result<bool> contains(
        const ByteView &key) const override;

    outcome::result<void> remove(const ByteView &key) override;

    std::unique_ptr<BufferBatch> batch() override;

    [[nodiscard]] std::optional<size_t> byteSizeHint() const override;

    const StorageCounters &counters() const {
      return counters_;
    }

    uint64_t quota() const {
      return quota_;
    }

    /// Starts metering of a new call: counters are zeroed
    void beginCall();

   private:
    friend class MeteredBatch;

    outcome::result<void> charge(uint64_t StorageCounters::*counter) const;

    log::Logger logger_;
    qtils::SharedRef<BufferStorage> origin_;
    uint64_t quota_;
    mutable StorageCounters counters_;
  };

}  // namespace strata::storage
