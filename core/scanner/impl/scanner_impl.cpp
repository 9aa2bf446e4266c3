/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scanner/impl/scanner_impl.hpp"

#include <boost/assert.hpp>

namespace parabridge::scanner {

  ScannerImpl::ScannerImpl(
      const ScannerConfig &config,
      std::shared_ptr<chain::SourceChain> source,
      std::shared_ptr<chain::RelayChain> relay,
      std::shared_ptr<chain::DestinationChain> destination,
      std::shared_ptr<crypto::Hasher> hasher)
      : config_{config},
        source_{source},
        relay_{relay},
        nonce_reconciler_{source, std::move(destination)},
        commitment_scanner_{
            source,
            std::make_shared<ProofAssembler>(source, std::move(hasher)),
            config.max_lookback},
        task_builder_{std::make_shared<InclusionFinder>(
            source, relay, config.para_id, config.finalization_timeout)},
        log_{log::createLogger("Scanner", "scanner")} {
    BOOST_ASSERT(source_ != nullptr);
    BOOST_ASSERT(relay_ != nullptr);
  }

  ScanOutcome<std::vector<Task>> ScannerImpl::scan(
      primitives::BlockNumber relay_checkpoint,
      const std::atomic_bool &cancel) const {
    OUTCOME_TRY(tasks,
                withContext(scanImpl(relay_checkpoint, cancel),
                            "scan channel {} at relay block #{}",
                            config_.channel_id,
                            relay_checkpoint));
    // All or nothing: a cancel raised during the last query drops the result
    if (cancel) {
      return ScanError{ScannerError::CANCELLED,
                       fmt::format("scan channel {} at relay block #{}",
                                   config_.channel_id,
                                   relay_checkpoint)};
    }
    return tasks;
  }

  ScanOutcome<std::vector<Task>> ScannerImpl::scanImpl(
      primitives::BlockNumber relay_checkpoint,
      const std::atomic_bool &cancel) const {
    if (cancel) {
      return ScanError{ScannerError::CANCELLED};
    }

    // Source chain state finalized by the checkpoint is the one included in
    // its parent
    const auto relay_number = relay_checkpoint > 0 ? relay_checkpoint - 1 : 0;
    OUTCOME_TRY(relay_hash,
                withContext(relay_->blockHash(relay_number),
                            "fetch hash of relay block #{}",
                            relay_number));
    OUTCOME_TRY(para_head,
                withContext(relay_->parachainHead(config_.para_id, relay_hash),
                            "fetch head of parachain {} at relay block #{}",
                            config_.para_id,
                            relay_number));
    if (not para_head.has_value()) {
      return ScanError{ScannerError::PARACHAIN_NOT_REGISTERED,
                       fmt::format("parachain {} at relay block #{}",
                                   config_.para_id,
                                   relay_number)};
    }
    const auto para_number = para_head->number;
    OUTCOME_TRY(para_hash,
                withContext(source_->blockHash(para_number),
                            "fetch hash of source block #{}",
                            para_number));

    if (cancel) {
      return ScanError{ScannerError::CANCELLED};
    }
    OUTCOME_TRY(starting_nonce,
                nonce_reconciler_.startingNonce(config_.channel_id, para_hash));
    if (not starting_nonce.has_value()) {
      SL_INFO(log_,
              "Nothing to relay on channel {} at source block #{}",
              config_.channel_id,
              para_number);
      return std::vector<Task>{};
    }

    OUTCOME_TRY(tasks,
                commitment_scanner_.scan(para_number,
                                         config_.channel_id,
                                         starting_nonce.value(),
                                         cancel));
    SL_INFO(log_,
            "Found {} source blocks with messages of channel {} from nonce {}",
            tasks.size(),
            config_.channel_id,
            starting_nonce.value());

    return task_builder_.build(std::move(tasks), cancel);
  }

}  // namespace parabridge::scanner
