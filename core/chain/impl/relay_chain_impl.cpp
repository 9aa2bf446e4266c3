/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/impl/relay_chain_impl.hpp"

#include <algorithm>

#include "chain/chain_error.hpp"
#include "chain/scale_decode.hpp"
#include "chain/storage_keys.hpp"

namespace parabridge::chain {

  RelayChainImpl::RelayChainImpl(std::shared_ptr<jrpc::JrpcClient> client)
      : rpc_{std::move(client)},
        log_{log::createLogger("RelayChain", "chain")} {}

  outcome::result<primitives::BlockHash> RelayChainImpl::blockHash(
      primitives::BlockNumber number) const {
    return rpc_.getBlockHash(number);
  }

  outcome::result<primitives::BlockNumber>
  RelayChainImpl::finalizedBlockNumber() const {
    OUTCOME_TRY(finalized_hash, rpc_.getFinalizedHead());
    OUTCOME_TRY(header, rpc_.getHeader(finalized_hash));
    SL_DEBUG(log_, "Finalized relay chain block #{} ({})", header.number,
             finalized_hash);
    return header.number;
  }

  outcome::result<std::optional<primitives::BlockHeader>>
  RelayChainImpl::parachainHead(primitives::ParachainId para_id,
                                const primitives::BlockHash &at) const {
    OUTCOME_TRY(head_data, rpc_.getStorage(parasHeadsKey(para_id), at));
    if (not head_data.has_value()) {
      return std::nullopt;
    }
    OUTCOME_TRY(encoded_header,
                decodeScale<primitives::HeadData>(head_data.value()));
    OUTCOME_TRY(header, decodeScale<primitives::BlockHeader>(encoded_header));
    return std::move(header);
  }

  outcome::result<std::vector<primitives::ParaHead>>
  RelayChainImpl::parachainHeads(const primitives::BlockHash &at) const {
    OUTCOME_TRY(keys, rpc_.getKeys(parasHeadsPrefix(), at));
    OUTCOME_TRY(values, rpc_.queryStorageAt(keys, at));

    std::vector<primitives::ParaHead> heads;
    heads.reserve(keys.size());
    for (size_t i = 0; i < keys.size(); ++i) {
      auto para_id = paraIdFromHeadsKey(keys[i]);
      if (not para_id.has_value()) {
        SL_WARN(log_, "Unexpected key under Paras::Heads: {}", keys[i]);
        return ChainError::BAD_RESPONSE;
      }
      if (not values[i].has_value()) {
        // removed between the two queries
        continue;
      }
      OUTCOME_TRY(head_data,
                  decodeScale<primitives::HeadData>(values[i].value()));
      heads.emplace_back(
          primitives::ParaHead{para_id.value(), std::move(head_data)});
    }

    std::sort(heads.begin(), heads.end(), [](const auto &lhs, const auto &rhs) {
      return lhs.para_id < rhs.para_id;
    });
    SL_TRACE(log_, "{} parachain heads at {}", heads.size(), at);
    return heads;
  }

}  // namespace parabridge::chain
