/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "collections/env.hpp"

#include <qtils/error_throw.hpp>

namespace strata::collections {

  Env::Env(qtils::SharedRef<log::LoggingSystem> logsys,
           qtils::SharedRef<storage::BufferStorage> storage)
      : logger_{logsys->getLogger("Collections", "collections")},
        storage_{std::move(storage)} {}

  std::optional<ByteVec> Env::read(ByteView key) const {
    auto res = storage_->tryGet(key);
    if (res.has_error()) {
      SL_ERROR(logger_, "Read of {} failed: {}", key.toHex(), res.error());
      qtils::raise(res.error());
    }
    auto &value = res.value();
    SL_TRACE(logger_,
             "read {} -> {}",
             key.toHex(),
             value.has_value() ? "found" : "absent");
    if (not value.has_value()) {
      return std::nullopt;
    }
    return std::move(value.value()).intoByteVec();
  }

  void Env::write(ByteView key, ByteVec value) {
    SL_TRACE(logger_, "write {} ({} bytes)", key.toHex(), value.size());
    auto res = storage_->put(key, std::move(value));
    if (res.has_error()) {
      SL_ERROR(logger_, "Write of {} failed: {}", key.toHex(), res.error());
      qtils::raise(res.error());
    }
  }

  void Env::remove(ByteView key) {
    SL_TRACE(logger_, "remove {}", key.toHex());
    auto res = storage_->remove(key);
    if (res.has_error()) {
      SL_ERROR(logger_, "Remove of {} failed: {}", key.toHex(), res.error());
      qtils::raise(res.error());
    }
  }

  bool Env::has(ByteView key) const {
    auto res = storage_->contains(key);
    if (res.has_error()) {
      SL_ERROR(logger_, "Check of {} failed: {}", key.toHex(), res.error());
      qtils::raise(res.error());
    }
    SL_TRACE(logger_, "has {} -> {}", key.toHex(), res.value());
    return res.value();
  }

}  // namespace strata::collections
