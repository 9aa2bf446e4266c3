/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <memory>
#include <vector>

#include "chain/source_chain.hpp"
#include "log/logger.hpp"
#include "scanner/proof_assembler.hpp"
#include "scanner/scanner_error.hpp"
#include "scanner/types.hpp"

namespace parabridge::scanner {

  /**
   * Walks the source chain back from a block and collects, per block, the
   * proved messages of a channel with nonces from the starting nonce on.
   *
   * The walk stops once a message older than the starting nonce is met or
   * the starting nonce itself is collected, and never descends to genesis.
   * Tasks come out in ascending block order, proofs in ascending nonce
   * order; proof inputs are left empty.
   */
  class CommitmentScanner {
   public:
    CommitmentScanner(std::shared_ptr<chain::SourceChain> source,
                      std::shared_ptr<ProofAssembler> proof_assembler,
                      uint32_t max_lookback);

    ScanOutcome<std::vector<Task>> scan(primitives::BlockNumber start_block,
                                        primitives::ChannelId channel_id,
                                        primitives::Nonce starting_nonce,
                                        const std::atomic_bool &cancel) const;

   private:
    struct BlockScan {
      std::vector<MessageProof> proofs;
      bool done = false;
    };

    ScanOutcome<BlockScan> scanBlock(const primitives::BlockHeader &header,
                                     const common::Hash256 &commitment,
                                     primitives::ChannelId channel_id,
                                     primitives::Nonce starting_nonce,
                                     const std::atomic_bool &cancel) const;

    std::shared_ptr<chain::SourceChain> source_;
    std::shared_ptr<ProofAssembler> proof_assembler_;
    uint32_t max_lookback_;
    log::Logger log_;
  };

}  // namespace parabridge::scanner
