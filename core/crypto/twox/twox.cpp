/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/twox/twox.hpp"

#include <xxhash.h>

namespace parabridge::crypto {

  namespace {
    // Substrate stores each XXH64 lane little-endian
    void put_lane(uint64_t lane, uint8_t *out) {
      for (size_t i = 0; i < sizeof(lane); ++i) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out[i] = static_cast<uint8_t>(lane >> (8 * i));
      }
    }
  }  // namespace

  common::Hash64 make_twox64(common::BufferView buf) {
    common::Hash64 hash{};
    put_lane(XXH64(buf.data(), buf.size(), 0), hash.data());
    return hash;
  }

  common::Hash128 make_twox128(common::BufferView buf) {
    common::Hash128 hash{};
    put_lane(XXH64(buf.data(), buf.size(), 0), hash.data());
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    put_lane(XXH64(buf.data(), buf.size(), 1), hash.data() + 8);
    return hash;
  }

}  // namespace parabridge::crypto
