/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include "chain/destination_chain.hpp"
#include "chain/source_chain.hpp"
#include "log/logger.hpp"
#include "scanner/scanner_error.hpp"

namespace parabridge::scanner {

  /**
   * Compares the nonce delivered to the destination chain with the nonce
   * committed on the source chain. Nothing is cached, every call reads both
   * chains.
   */
  class NonceReconciler {
   public:
    NonceReconciler(std::shared_ptr<chain::SourceChain> source,
                    std::shared_ptr<chain::DestinationChain> destination);

    /**
     * @param source_at source block the committed nonce is read at
     * @return first undelivered nonce, nullopt if everything committed up
     * to `source_at` is delivered
     */
    ScanOutcome<std::optional<primitives::Nonce>> startingNonce(
        primitives::ChannelId channel_id,
        const primitives::BlockHash &source_at) const;

    /// Last nonce committed on the source chain, 0 if none was ever sent
    ScanOutcome<primitives::Nonce> sourceNonce(
        primitives::ChannelId channel_id,
        const primitives::BlockHash &source_at) const;

   private:
    std::shared_ptr<chain::SourceChain> source_;
    std::shared_ptr<chain::DestinationChain> destination_;
    log::Logger log_;
  };

}  // namespace parabridge::scanner
