/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "common/blob.hpp"

namespace parabridge::primitives {
  using BlockNumber = uint32_t;
  using BlockHash = common::Hash256;

  /// Parachain (and channel origin) identifier as registered on relay chain
  using ParachainId = uint32_t;
}  // namespace parabridge::primitives
