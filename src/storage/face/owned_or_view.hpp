/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace strata::storage::face {

  /**
   * Type of values handed to and returned by storage. Backends may return a
   * view into their own memory or an owned copy, whichever is cheaper.
   */
  template <typename T>
  struct OwnedOrViewTrait;

  template <typename T>
  using OwnedOrView = typename OwnedOrViewTrait<T>::type;

}  // namespace strata::storage::face
