/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/impl/gateway_impl.hpp"

#include <algorithm>

#include <boost/assert.hpp>

#include "chain/chain_error.hpp"

namespace parabridge::chain {

  namespace {
    constexpr size_t kWordSize = 32;

    outcome::result<uint64_t> decodeUint64Word(common::BufferView word) {
      auto high = word.first(kWordSize - sizeof(uint64_t));
      if (std::any_of(high.begin(), high.end(), [](auto b) { return b != 0; })) {
        return ChainError::VALUE_OUT_OF_RANGE;
      }
      uint64_t value = 0;
      for (auto b : word.last(sizeof(uint64_t))) {
        value = (value << 8) | b;
      }
      return value;
    }
  }  // namespace

  GatewayImpl::GatewayImpl(std::shared_ptr<jrpc::JrpcClient> client,
                           std::shared_ptr<crypto::Hasher> hasher,
                           common::Address gateway)
      : client_{std::move(client)},
        gateway_{gateway},
        log_{log::createLogger("Gateway", "chain")} {
    BOOST_ASSERT(client_ != nullptr);
    BOOST_ASSERT(hasher != nullptr);
    auto signature_hash =
        hasher->keccak_256(common::Buffer::fromString(kChannelNoncesOf));
    std::copy_n(signature_hash.begin(), selector_.size(), selector_.begin());
  }

  common::Buffer GatewayImpl::encodeCall(
      primitives::ChannelId channel_id) const {
    common::Buffer data;
    data.put(selector_);
    data.resize(data.size() + kWordSize - sizeof(channel_id), 0);
    for (size_t i = sizeof(channel_id); i > 0; --i) {
      data.putUint8(static_cast<uint8_t>(channel_id >> (8 * (i - 1))));
    }
    return data;
  }

  outcome::result<ChannelNonces> GatewayImpl::decodeNonces(
      common::BufferView output) {
    if (output.size() != 2 * kWordSize) {
      return ChainError::DECODE_FAILED;
    }
    OUTCOME_TRY(inbound, decodeUint64Word(output.first(kWordSize)));
    OUTCOME_TRY(outbound, decodeUint64Word(output.last(kWordSize)));
    return ChannelNonces{inbound, outbound};
  }

  outcome::result<ChannelNonces> GatewayImpl::channelNonces(
      primitives::ChannelId channel_id) const {
    rapidjson::Document params{rapidjson::kArrayType};
    auto &allocator = params.GetAllocator();
    rapidjson::Value call{rapidjson::kObjectType};
    call.AddMember(
        "to", jrpc::makeString(gateway_.toHexWithPrefix(), allocator), allocator);
    call.AddMember("data",
                   jrpc::makeString(encodeCall(channel_id).toHexWithPrefix(),
                                    allocator),
                   allocator);
    params.PushBack(call, allocator);
    params.PushBack("pending", allocator);

    OUTCOME_TRY(result, client_->call("eth_call", params));
    OUTCOME_TRY(output, jrpc::getBytes(result));
    OUTCOME_TRY(nonces, decodeNonces(output));
    SL_TRACE(log_,
             "Gateway nonces of channel {}: inbound={} outbound={}",
             channel_id,
             nonces.inbound,
             nonces.outbound);
    return nonces;
  }

}  // namespace parabridge::chain
