/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "chain/source_chain.hpp"

#include "chain/impl/substrate_rpc.hpp"
#include "log/logger.hpp"

namespace parabridge::chain {

  class SourceChainImpl final : public SourceChain {
   public:
    static constexpr std::string_view kProveMessageApi =
        "OutboundQueueApi_prove_message";

    explicit SourceChainImpl(std::shared_ptr<jrpc::JrpcClient> client);

    outcome::result<primitives::BlockHash> blockHash(
        primitives::BlockNumber number) const override;

    outcome::result<primitives::BlockHeader> header(
        const primitives::BlockHash &block_hash) const override;

    outcome::result<std::optional<common::Buffer>> storage(
        const common::Buffer &key,
        const primitives::BlockHash &at) const override;

    outcome::result<std::optional<primitives::MerkleProof>> proveMessage(
        uint64_t leaf_index, const primitives::BlockHash &at) const override;

   private:
    SubstrateRpc rpc_;
    log::Logger log_;
  };

}  // namespace parabridge::chain
