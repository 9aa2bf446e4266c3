/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/impl/source_chain_impl.hpp"

#include "chain/scale_decode.hpp"

namespace parabridge::chain {

  SourceChainImpl::SourceChainImpl(std::shared_ptr<jrpc::JrpcClient> client)
      : rpc_{std::move(client)},
        log_{log::createLogger("SourceChain", "chain")} {}

  outcome::result<primitives::BlockHash> SourceChainImpl::blockHash(
      primitives::BlockNumber number) const {
    return rpc_.getBlockHash(number);
  }

  outcome::result<primitives::BlockHeader> SourceChainImpl::header(
      const primitives::BlockHash &block_hash) const {
    return rpc_.getHeader(block_hash);
  }

  outcome::result<std::optional<common::Buffer>> SourceChainImpl::storage(
      const common::Buffer &key, const primitives::BlockHash &at) const {
    return rpc_.getStorage(key, at);
  }

  outcome::result<std::optional<primitives::MerkleProof>>
  SourceChainImpl::proveMessage(uint64_t leaf_index,
                                const primitives::BlockHash &at) const {
    OUTCOME_TRY(args, ::scale::encode(leaf_index));
    OUTCOME_TRY(output, rpc_.call(kProveMessageApi, args, at));
    SL_TRACE(log_,
             "Proof of leaf {} at {}: {} bytes",
             leaf_index,
             at,
             output.size());
    return decodeScale<std::optional<primitives::MerkleProof>>(output);
  }

}  // namespace parabridge::chain
