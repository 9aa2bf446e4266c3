/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scanner/proof_assembler.hpp"

#include <boost/assert.hpp>

#include "scanner/merkle_proof.hpp"

namespace parabridge::scanner {

  ProofAssembler::ProofAssembler(std::shared_ptr<chain::SourceChain> source,
                                 std::shared_ptr<crypto::Hasher> hasher)
      : source_{std::move(source)},
        hasher_{std::move(hasher)},
        log_{log::createLogger("ProofAssembler", "scanner")} {
    BOOST_ASSERT(source_ != nullptr);
    BOOST_ASSERT(hasher_ != nullptr);
  }

  ScanOutcome<MessageProof> ProofAssembler::proveMessage(
      const primitives::BlockHash &block_hash,
      uint64_t message_index,
      primitives::OutboundQueueMessage message,
      const common::Hash256 &commitment) const {
    OUTCOME_TRY(proof,
                withContext(source_->proveMessage(message_index, block_hash),
                            "fetch proof of message {} at {}",
                            message_index,
                            block_hash));
    if (not proof.has_value()) {
      return ScanError{ScannerError::PROOF_NOT_FOUND,
                       fmt::format("message {} (nonce {}) at {}",
                                   message_index,
                                   message.nonce,
                                   block_hash)};
    }

    OUTCOME_TRY(withContext(
        verifyMessageProof(
            *hasher_, proof.value(), message_index, message, commitment),
        "verify proof of nonce {} at {}: proof root {}, commitment {}",
        message.nonce,
        block_hash,
        proof->root,
        commitment));

    SL_TRACE(log_,
             "Proved message {} with nonce {} at {}",
             message_index,
             message.nonce,
             block_hash);
    return MessageProof{std::move(message), std::move(proof.value())};
  }

}  // namespace parabridge::scanner
