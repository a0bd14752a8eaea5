/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/error_throw.hpp>
#include <qtils/outcome.hpp>

namespace strata {

  /**
   * Get value or `qtils::raise` the error.
   * Same as `.value()`, but throws std::system_error with original code.
   */
  template <typename T>
  T valueOrRaise(outcome::result<T> r) {
    if (r.has_error()) {
      qtils::raise(r.error());
    }
    return std::move(r).value();
  }

  /**
   * Get value or `qtils::raise` the given error instead of the original one.
   */
  template <typename T, typename E>
  T valueOrRaise(outcome::result<T> r, E error) {
    if (r.has_error()) {
      qtils::raise(error);
    }
    return std::move(r).value();
  }

}  // namespace strata
