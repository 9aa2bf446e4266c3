/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "chain/destination_chain.hpp"

#include <memory>

#include "chain/jrpc/jrpc_client.hpp"
#include "crypto/hasher.hpp"
#include "log/logger.hpp"

namespace parabridge::chain {

  /**
   * Reads channel nonces from the gateway contract with `eth_call` against
   * the pending block
   */
  class GatewayImpl final : public DestinationChain {
   public:
    static constexpr std::string_view kChannelNoncesOf =
        "channelNoncesOf(uint256)";

    GatewayImpl(std::shared_ptr<jrpc::JrpcClient> client,
                std::shared_ptr<crypto::Hasher> hasher,
                common::Address gateway);

    outcome::result<ChannelNonces> channelNonces(
        primitives::ChannelId channel_id) const override;

    /// 4-byte function selector followed by the ABI-encoded argument
    common::Buffer encodeCall(primitives::ChannelId channel_id) const;

    /// Decodes the (uint64, uint64) tuple returned by the gateway
    static outcome::result<ChannelNonces> decodeNonces(
        common::BufferView output);

   private:
    std::shared_ptr<jrpc::JrpcClient> client_;
    common::Address gateway_;
    common::Blob<4> selector_;
    log::Logger log_;
  };

}  // namespace parabridge::chain
