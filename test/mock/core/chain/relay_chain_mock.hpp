/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "chain/relay_chain.hpp"

#include <gmock/gmock.h>

namespace parabridge::chain {

  class RelayChainMock : public RelayChain {
   public:
    MOCK_METHOD(outcome::result<primitives::BlockHash>,
                blockHash,
                (primitives::BlockNumber),
                (const, override));

    MOCK_METHOD(outcome::result<primitives::BlockNumber>,
                finalizedBlockNumber,
                (),
                (const, override));

    MOCK_METHOD(outcome::result<std::optional<primitives::BlockHeader>>,
                parachainHead,
                (primitives::ParachainId, const primitives::BlockHash &),
                (const, override));

    MOCK_METHOD(outcome::result<std::vector<primitives::ParaHead>>,
                parachainHeads,
                (const primitives::BlockHash &),
                (const, override));
  };

}  // namespace parabridge::chain
