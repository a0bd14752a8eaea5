/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <optional>

#include "log/logger.hpp"

namespace strata {

  /// Soft limit of open file descriptors of the process
  std::optional<size_t> getFdLimit(const log::Logger &logger);

}  // namespace strata
