/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "chain/source_chain.hpp"
#include "crypto/hasher.hpp"
#include "log/logger.hpp"
#include "scanner/scanner_error.hpp"
#include "scanner/types.hpp"

namespace parabridge::scanner {

  /// Fetches the inclusion proof of a committed message and checks it
  /// against the commitment observed in the block header
  class ProofAssembler {
   public:
    ProofAssembler(std::shared_ptr<chain::SourceChain> source,
                   std::shared_ptr<crypto::Hasher> hasher);

    /**
     * @param block_hash block which committed the message
     * @param message_index position of the message in the full message list
     * of the block, whatever its channel
     * @param commitment merkle root from the block digest
     */
    ScanOutcome<MessageProof> proveMessage(
        const primitives::BlockHash &block_hash,
        uint64_t message_index,
        primitives::OutboundQueueMessage message,
        const common::Hash256 &commitment) const;

   private:
    std::shared_ptr<chain::SourceChain> source_;
    std::shared_ptr<crypto::Hasher> hasher_;
    log::Logger log_;
  };

}  // namespace parabridge::scanner
