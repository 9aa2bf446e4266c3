/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/block_header.hpp"
#include "primitives/parachain.hpp"

namespace parabridge::chain {

  /// Read-only view of the relay chain which finalizes the source parachain
  class RelayChain {
   public:
    virtual ~RelayChain() = default;

    virtual outcome::result<primitives::BlockHash> blockHash(
        primitives::BlockNumber number) const = 0;

    /// Number of the latest finalized relay chain block
    virtual outcome::result<primitives::BlockNumber> finalizedBlockNumber()
        const = 0;

    /**
     * Relay chain view of the current head of a parachain
     * @return nullopt if the parachain is not registered at the block
     */
    virtual outcome::result<std::optional<primitives::BlockHeader>>
    parachainHead(primitives::ParachainId para_id,
                  const primitives::BlockHash &at) const = 0;

    /// All parachain heads at the block, ordered by parachain id
    virtual outcome::result<std::vector<primitives::ParaHead>> parachainHeads(
        const primitives::BlockHash &at) const = 0;
  };

}  // namespace parabridge::chain
