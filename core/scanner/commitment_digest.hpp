/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "outcome/outcome.hpp"
#include "primitives/block_header.hpp"

namespace parabridge::scanner {

  /// First payload byte of the `Other` digest item carrying the commitment
  constexpr uint8_t kCommitmentDigestPrefix = 0x00;

  /**
   * Finds the outbound queue commitment in the header digest
   * @return merkle root of the block's messages, nullopt if the block
   * committed nothing
   */
  outcome::result<std::optional<common::Hash256>> extractCommitment(
      const primitives::Digest &digest);

}  // namespace parabridge::scanner
