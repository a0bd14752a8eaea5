/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <exception>
#include <string_view>
#include <system_error>

#include "log/logger.hpp"

namespace strata::collections::detail {

  /**
   * Remembers how many exceptions were in flight when a collection was
   * created. A bigger number at destruction means the collection is
   * destroyed by stack unwinding of a failed call.
   */
  class UnwindGuard {
   public:
    UnwindGuard() : uncaught_{std::uncaught_exceptions()} {}

    bool unwinding() const {
      return std::uncaught_exceptions() > uncaught_;
    }

   private:
    int uncaught_;
  };

  /**
   * Write-back of a collection being destroyed. Pending modifications of a
   * failed call are dropped. Destructor can't propagate, so failure of the
   * write-back is only logged.
   */
  template <typename Flush>
  void flushOnDrop(const UnwindGuard &guard,
                   const log::Logger &logger,
                   std::string_view what,
                   Flush &&flush) noexcept {
    if (guard.unwinding()) {
      SL_DEBUG(logger, "{} is dropped during unwinding, cache discarded", what);
      return;
    }
    try {
      flush();
    } catch (const std::system_error &e) {
      SL_ERROR(logger, "Flush of {} on drop failed: {}", what, e.what());
    }
  }

}  // namespace strata::collections::detail
