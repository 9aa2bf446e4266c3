/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/common.hpp"
#include "primitives/outbound_queue.hpp"

namespace parabridge::scanner {

  struct ScannerConfig {
    static constexpr uint32_t kDefaultFinalizationTimeout = 4;

    /// Source parachain
    primitives::ParachainId para_id{};
    /// Channel whose messages are collected
    primitives::ChannelId channel_id{};
    /// Relay blocks after the relay parent in which the source block must
    /// become included
    uint32_t finalization_timeout = kDefaultFinalizationTimeout;
    /// Maximum number of source blocks to walk back, 0 for no limit
    uint32_t max_lookback = 0;
  };

}  // namespace parabridge::scanner
