/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"
#include "primitives/outbound_queue.hpp"

namespace parabridge::chain {

  /// Gateway counters of a channel, from the destination chain perspective
  struct ChannelNonces {
    /// last nonce delivered to the destination chain
    primitives::Nonce inbound{};
    /// last nonce sent from the destination chain
    primitives::Nonce outbound{};

    bool operator==(const ChannelNonces &) const = default;
  };

  /// Read-only view of the gateway contract on the destination chain
  class DestinationChain {
   public:
    virtual ~DestinationChain() = default;

    virtual outcome::result<ChannelNonces> channelNonces(
        primitives::ChannelId channel_id) const = 0;
  };

}  // namespace parabridge::chain
