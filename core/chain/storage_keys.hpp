/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string_view>

#include "common/buffer.hpp"
#include "primitives/common.hpp"
#include "primitives/outbound_queue.hpp"

namespace parabridge::chain {

  /// twox128(pallet) ++ twox128(item)
  common::Buffer plainStorageKey(std::string_view pallet,
                                 std::string_view item);

  /// Key of a map entry hashed with Twox64Concat over SCALE-encoded u32
  common::Buffer twox64ConcatStorageKey(std::string_view pallet,
                                        std::string_view item,
                                        uint32_t key);

  /// Messages committed in the current block, all channels together
  common::Buffer outboundQueueMessagesKey();

  /// Last nonce assigned on the channel by the outbound queue
  common::Buffer outboundQueueNonceKey(primitives::ChannelId channel_id);

  /// Validation data of the block being executed
  common::Buffer validationDataKey();

  /// Prefix of the relay chain head table
  common::Buffer parasHeadsPrefix();

  /// Relay chain record of the head of one parachain
  common::Buffer parasHeadsKey(primitives::ParachainId para_id);

  /**
   * Extracts the parachain id from a full Paras::Heads key
   * @return nullopt if the key is not from the head table
   */
  std::optional<primitives::ParachainId> paraIdFromHeadsKey(
      common::BufferView key);

}  // namespace parabridge::chain
