/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/buffer_view.hpp"

namespace parabridge::crypto {
  class Hasher {
   protected:
    using Hash64 = common::Hash64;
    using Hash128 = common::Hash128;
    using Hash256 = common::Hash256;

   public:
    virtual ~Hasher() = default;

    /**
     * @brief twox_64 calculates 8-byte twox hash
     * @param data source data
     * @return 64-bit hash value
     */
    virtual Hash64 twox_64(common::BufferView data) const = 0;

    /**
     * @brief twox_128 calculates 16-byte twox hash
     * @param data source data
     * @return 128-bit hash value
     */
    virtual Hash128 twox_128(common::BufferView data) const = 0;

    /**
     * @brief keccak_256 function calculates 32-byte keccak hash
     * @param data source value
     * @return 256-bit hash value
     */
    virtual Hash256 keccak_256(common::BufferView data) const = 0;
  };
}  // namespace parabridge::crypto
