/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "storage/buffer_map_types.hpp"
#include "utils/ctor_limiters.hpp"

namespace strata::storage {

  /**
   * Overlay which holds modifications of one call in memory.
   *
   * Reads see the pending modifications first and fall through to the base
   * storage otherwise. Nothing reaches the base until commit(), which
   * applies all modifications in a single batch. Destroying the overlay
   * without commit discards them, so a failed call leaves the base intact.
   */
  class CallStorage : public BufferStorage, NonCopyable, NonMovable {
   public:
    CallStorage(qtils::SharedRef<log::LoggingSystem> logsys,
                qtils::SharedRef<BufferStorage> base);

    ~CallStorage() override;

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

    /// Applies pending modifications to the base storage
    outcome::result<void> commit();

    /// Drops pending modifications
    void discard();

    size_t pendingCount() const {
      return pending_.size();
    }

   private:
    friend class CallBatch;

    // nullopt value marks removal
    std::map<ByteVec, std::optional<ByteVec>> pending_;
    qtils::SharedRef<BufferStorage> base_;
    log::Logger logger_;
  };

}  // namespace strata::storage
