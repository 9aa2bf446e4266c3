/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "chain/relay_chain.hpp"

#include "chain/impl/substrate_rpc.hpp"
#include "log/logger.hpp"

namespace parabridge::chain {

  class RelayChainImpl final : public RelayChain {
   public:
    explicit RelayChainImpl(std::shared_ptr<jrpc::JrpcClient> client);

    outcome::result<primitives::BlockHash> blockHash(
        primitives::BlockNumber number) const override;

    outcome::result<primitives::BlockNumber> finalizedBlockNumber()
        const override;

    outcome::result<std::optional<primitives::BlockHeader>> parachainHead(
        primitives::ParachainId para_id,
        const primitives::BlockHash &at) const override;

    outcome::result<std::vector<primitives::ParaHead>> parachainHeads(
        const primitives::BlockHash &at) const override;

   private:
    SubstrateRpc rpc_;
    log::Logger log_;
  };

}  // namespace parabridge::chain
