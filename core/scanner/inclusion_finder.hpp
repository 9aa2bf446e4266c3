/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <memory>

#include "chain/relay_chain.hpp"
#include "chain/source_chain.hpp"
#include "log/logger.hpp"
#include "scanner/scanner_error.hpp"
#include "scanner/types.hpp"

namespace parabridge::scanner {

  /**
   * Finds the relay chain block in which a source block became the
   * parachain head, and captures the relay chain head table there
   */
  class InclusionFinder {
   public:
    InclusionFinder(std::shared_ptr<chain::SourceChain> source,
                    std::shared_ptr<chain::RelayChain> relay,
                    primitives::ParachainId para_id,
                    uint32_t finalization_timeout);

    /**
     * Probes relay blocks following the relay parent of the source block
     * @return first relay block whose head of the parachain is the block,
     * ScannerError::INCLUSION_NOT_FOUND when the window is exhausted
     */
    ScanOutcome<primitives::BlockNumber> findInclusionBlock(
        const primitives::BlockHeader &source_header,
        const std::atomic_bool &cancel) const;

    ScanOutcome<ProofInput> gatherProofInput(
        primitives::BlockNumber relay_block_number) const;

   private:
    std::shared_ptr<chain::SourceChain> source_;
    std::shared_ptr<chain::RelayChain> relay_;
    primitives::ParachainId para_id_;
    uint32_t finalization_timeout_;
    log::Logger log_;
  };

}  // namespace parabridge::scanner
