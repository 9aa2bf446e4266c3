/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "scanner/scanner.hpp"

#include <memory>

#include "chain/destination_chain.hpp"
#include "chain/relay_chain.hpp"
#include "chain/source_chain.hpp"
#include "crypto/hasher.hpp"
#include "log/logger.hpp"
#include "scanner/commitment_scanner.hpp"
#include "scanner/nonce_reconciler.hpp"
#include "scanner/scanner_config.hpp"
#include "scanner/task_builder.hpp"

namespace parabridge::scanner {

  class ScannerImpl final : public Scanner {
   public:
    ScannerImpl(const ScannerConfig &config,
                std::shared_ptr<chain::SourceChain> source,
                std::shared_ptr<chain::RelayChain> relay,
                std::shared_ptr<chain::DestinationChain> destination,
                std::shared_ptr<crypto::Hasher> hasher);

    ScanOutcome<std::vector<Task>> scan(
        primitives::BlockNumber relay_checkpoint,
        const std::atomic_bool &cancel) const override;

   private:
    ScanOutcome<std::vector<Task>> scanImpl(
        primitives::BlockNumber relay_checkpoint,
        const std::atomic_bool &cancel) const;

    ScannerConfig config_;
    std::shared_ptr<chain::SourceChain> source_;
    std::shared_ptr<chain::RelayChain> relay_;
    NonceReconciler nonce_reconciler_;
    CommitmentScanner commitment_scanner_;
    TaskBuilder task_builder_;
    log::Logger log_;
  };

}  // namespace parabridge::scanner
