/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scanner/commitment_scanner.hpp"

#include <algorithm>

#include <boost/assert.hpp>

#include "chain/scale_decode.hpp"
#include "chain/storage_keys.hpp"
#include "scanner/commitment_digest.hpp"

namespace parabridge::scanner {

  CommitmentScanner::CommitmentScanner(
      std::shared_ptr<chain::SourceChain> source,
      std::shared_ptr<ProofAssembler> proof_assembler,
      uint32_t max_lookback)
      : source_{std::move(source)},
        proof_assembler_{std::move(proof_assembler)},
        max_lookback_{max_lookback},
        log_{log::createLogger("CommitmentScanner", "scanner")} {
    BOOST_ASSERT(source_ != nullptr);
    BOOST_ASSERT(proof_assembler_ != nullptr);
  }

  ScanOutcome<std::vector<Task>> CommitmentScanner::scan(
      primitives::BlockNumber start_block,
      primitives::ChannelId channel_id,
      primitives::Nonce starting_nonce,
      const std::atomic_bool &cancel) const {
    SL_DEBUG(log_,
             "Scanning source chain back from block #{} for channel {}, "
             "starting nonce {}",
             start_block,
             channel_id,
             starting_nonce);

    std::vector<Task> tasks;
    bool done = false;
    for (auto number = start_block; number > 0 and not done; --number) {
      if (cancel) {
        return ScanError{ScannerError::CANCELLED,
                         fmt::format("scan source block #{}", number)};
      }
      if (max_lookback_ != 0 and start_block - number >= max_lookback_) {
        return ScanError{
            ScannerError::LOOKBACK_EXCEEDED,
            fmt::format("nonce {} of channel {} not reached within {} blocks "
                        "back from #{}",
                        starting_nonce,
                        channel_id,
                        max_lookback_,
                        start_block)};
      }

      OUTCOME_TRY(hash,
                  withContext(source_->blockHash(number),
                              "fetch hash of source block #{}",
                              number));
      OUTCOME_TRY(header,
                  withContext(source_->header(hash),
                              "fetch header of source block #{} ({})",
                              number,
                              hash));
      header.hash_opt = hash;

      OUTCOME_TRY(commitment,
                  withContext(extractCommitment(header.digest),
                              "extract commitment of source block #{} ({})",
                              number,
                              hash));
      if (not commitment.has_value()) {
        SL_TRACE(log_, "Block #{} has no commitment", number);
        continue;
      }

      OUTCOME_TRY(block_scan,
                  withContext(scanBlock(header,
                                        commitment.value(),
                                        channel_id,
                                        starting_nonce,
                                        cancel),
                              "scan source block #{} ({})",
                              number,
                              hash));
      done = block_scan.done;

      SL_DEBUG(log_,
               "Block #{}: commitment {}, {} outstanding messages of "
               "channel {}",
               number,
               commitment.value(),
               block_scan.proofs.size(),
               channel_id);

      if (not block_scan.proofs.empty()) {
        tasks.emplace_back(Task{
            .header = std::move(header),
            .proofs = std::move(block_scan.proofs),
            .proof_input = std::nullopt,
        });
      }
    }

    if (done) {
      SL_DEBUG(log_, "Delivered boundary of channel {} reached", channel_id);
    } else {
      SL_DEBUG(log_, "Genesis reached scanning channel {}", channel_id);
    }

    std::reverse(tasks.begin(), tasks.end());
    return tasks;
  }

  ScanOutcome<CommitmentScanner::BlockScan> CommitmentScanner::scanBlock(
      const primitives::BlockHeader &header,
      const common::Hash256 &commitment,
      primitives::ChannelId channel_id,
      primitives::Nonce starting_nonce,
      const std::atomic_bool &cancel) const {
    const auto &hash = header.hash();
    OUTCOME_TRY(stored,
                withContext(source_->storage(chain::outboundQueueMessagesKey(),
                                             hash),
                            "fetch committed messages"));
    if (not stored.has_value()) {
      return ScanError{ScannerError::MESSAGES_NOT_FOUND};
    }
    OUTCOME_TRY(messages,
                withContext(chain::decodeScale<
                                std::vector<primitives::OutboundQueueMessage>>(
                                stored.value()),
                            "decode committed messages"));

    // Newest messages are at the end of the list
    BlockScan result;
    for (auto i = messages.size(); i > 0; --i) {
      auto index = i - 1;
      auto &message = messages[index];
      if (message.origin != channel_id) {
        continue;
      }
      if (message.nonce < starting_nonce) {
        result.done = true;
        break;
      }
      if (cancel) {
        return ScanError{ScannerError::CANCELLED,
                         fmt::format("prove nonce {}", message.nonce)};
      }

      auto nonce = message.nonce;
      OUTCOME_TRY(proof,
                  proof_assembler_->proveMessage(
                      hash, index, std::move(message), commitment));
      result.proofs.emplace_back(std::move(proof));
      if (nonce == starting_nonce) {
        result.done = true;
      }
    }

    std::reverse(result.proofs.begin(), result.proofs.end());
    return result;
  }

}  // namespace parabridge::scanner
