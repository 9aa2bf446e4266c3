/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/storage_keys.hpp"

#include "crypto/twox/twox.hpp"

namespace parabridge::chain {

  namespace {
    constexpr std::string_view kOutboundQueue = "EthereumOutboundQueue";
    constexpr std::string_view kParachainSystem = "ParachainSystem";
    constexpr std::string_view kParas = "Paras";

    // twox64 of the key followed by the key itself
    constexpr size_t kTwox64ConcatSize = 8 + sizeof(uint32_t);
  }  // namespace

  common::Buffer plainStorageKey(std::string_view pallet,
                                 std::string_view item) {
    common::Buffer key;
    key.put(crypto::make_twox128(common::Buffer::fromString(pallet)));
    key.put(crypto::make_twox128(common::Buffer::fromString(item)));
    return key;
  }

  common::Buffer twox64ConcatStorageKey(std::string_view pallet,
                                        std::string_view item,
                                        uint32_t key) {
    common::Buffer encoded;
    encoded.putUint32LE(key);
    auto storage_key = plainStorageKey(pallet, item);
    storage_key.put(crypto::make_twox64(encoded));
    storage_key.put(encoded);
    return storage_key;
  }

  common::Buffer outboundQueueMessagesKey() {
    return plainStorageKey(kOutboundQueue, "Messages");
  }

  common::Buffer outboundQueueNonceKey(primitives::ChannelId channel_id) {
    return twox64ConcatStorageKey(kOutboundQueue, "Nonce", channel_id);
  }

  common::Buffer validationDataKey() {
    return plainStorageKey(kParachainSystem, "ValidationData");
  }

  common::Buffer parasHeadsPrefix() {
    return plainStorageKey(kParas, "Heads");
  }

  common::Buffer parasHeadsKey(primitives::ParachainId para_id) {
    return twox64ConcatStorageKey(kParas, "Heads", para_id);
  }

  std::optional<primitives::ParachainId> paraIdFromHeadsKey(
      common::BufferView key) {
    auto prefix = parasHeadsPrefix();
    if (key.size() != prefix.size() + kTwox64ConcatSize
        or not common::startsWith(key, prefix)) {
      return std::nullopt;
    }
    auto id = key.last(sizeof(uint32_t));
    primitives::ParachainId para_id = 0;
    for (size_t i = 0; i < id.size(); ++i) {
      para_id |= static_cast<primitives::ParachainId>(id[i]) << (8 * i);
    }
    return para_id;
  }

}  // namespace parabridge::chain
