/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <scale/scale.hpp>

#include "chain/chain_error.hpp"
#include "common/buffer_view.hpp"
#include "log/logger.hpp"

namespace parabridge::chain {

  /**
   * Decodes SCALE bytes received from a node. Any codec failure, including
   * trailing bytes, is reported as ChainError::DECODE_FAILED so callers can
   * tell a malformed payload from a transport failure.
   */
  template <typename T>
  outcome::result<T> decodeScale(common::BufferView bytes) {
    ::scale::ScaleDecoderStream s{bytes};
    T value{};
    try {
      s >> value;
    } catch (const std::system_error &e) {
      static const auto logger = log::createLogger("ScaleDecode", "chain");
      SL_DEBUG(logger, "Decoding failed: {}", e.code().message());
      return ChainError::DECODE_FAILED;
    }
    if (s.hasMore(1)) {
      return ChainError::DECODE_FAILED;
    }
    return value;
  }

}  // namespace parabridge::chain
