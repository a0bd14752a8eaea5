/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "storage/metered_storage.hpp"

namespace strata::app {
  class Configuration;
}

namespace strata::storage {

  /**
   * Creates the backend selected by configuration. The backend is always
   * wrapped into MeteredStorage with the configured per-call quota, so no
   * storage access goes unmetered.
   */
  qtils::SharedRef<MeteredStorage> createStorage(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<app::Configuration> app_config);

}  // namespace strata::storage
