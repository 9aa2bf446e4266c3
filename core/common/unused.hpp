/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>
#include <scale/scale.hpp>

namespace parabridge {

  enum class UnusedError : uint8_t {
    AttemptToEncodeUnused = 1,
    AttemptToDecodeUnused,
  };
  Q_ENUM_ERROR_CODE(UnusedError) {
    using E = decltype(e);
    switch (e) {
      case E::AttemptToEncodeUnused:
        return "Attempt to encode a value that must be unused";
      case E::AttemptToDecodeUnused:
        return "Attempt to decode a value that must be unused";
    }
    return "Unknown UnusedError";
  }

  /// Zero-size placeholder occupying an index of a SCALE enum that is never
  /// produced by the chains we read
  template <size_t N>
  struct Unused {
    bool operator==(const Unused &) const = default;
  };

  template <size_t N>
  [[noreturn]] ::scale::ScaleEncoderStream &operator<<(
      ::scale::ScaleEncoderStream &, const Unused<N> &) {
    ::scale::raise(UnusedError::AttemptToEncodeUnused);
  }

  template <size_t N>
  [[noreturn]] ::scale::ScaleDecoderStream &operator>>(
      ::scale::ScaleDecoderStream &, Unused<N> &) {
    ::scale::raise(UnusedError::AttemptToDecodeUnused);
  }

}  // namespace parabridge
