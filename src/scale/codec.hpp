/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <qtils/byte_view.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <scale/scale.hpp>

namespace strata {
  using scale::impl::memory::decode;
  using scale::impl::memory::encode;

  enum class ScaleDecodeError : uint8_t {
    TRAILING_BYTES = 1,
  };
  Q_ENUM_ERROR_CODE(ScaleDecodeError) {
    using E = decltype(e);
    switch (e) {
      case E::TRAILING_BYTES:
        return "Not all bytes were consumed by decoding";
    }
    return "Unknown ScaleDecodeError";
  }

  /**
   * SCALE-encodes the value. Codec exceptions are converted into error.
   */
  template <typename T>
  [[nodiscard]] outcome::result<qtils::ByteVec> scaleEncode(const T &value) {
    qtils::ByteVec out;
    scale::backend::ToBytes encoder(out);
    try {
      encode(value, encoder);
    } catch (std::system_error &e) {
      return outcome::failure(e.code());
    }
    return out;
  }

  /**
   * Decodes SCALE-encoded value. Input must hold exactly one value, bytes left
   * after it are an error.
   */
  template <typename T>
  [[nodiscard]] outcome::result<T> scaleDecode(qtils::ByteView bytes) {
    scale::backend::FromBytes decoder(bytes);
    T value;
    try {
      decode(value, decoder);
    } catch (std::system_error &e) {
      return outcome::failure(e.code());
    }
    if (decoder.has(1)) {
      return ScaleDecodeError::TRAILING_BYTES;
    }
    return value;
  }

}  // namespace strata
