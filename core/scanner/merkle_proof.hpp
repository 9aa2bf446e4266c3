/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "crypto/hasher.hpp"
#include "outcome/outcome.hpp"
#include "primitives/outbound_queue.hpp"

namespace parabridge::scanner {

  /**
   * ABI encoding of the message as the gateway hashes it:
   * `abi.encode((uint256 origin, uint256 nonce, uint256 command, bytes params))`
   */
  common::Buffer encodeMessageLeaf(
      const primitives::OutboundQueueMessage &message);

  /// Keccak-256 of the ABI-encoded message
  common::Hash256 messageLeaf(const crypto::Hasher &hasher,
                              const primitives::OutboundQueueMessage &message);

  /**
   * Root of the binary keccak tree the outbound queue commits to. Each
   * level hashes the concatenation of the smaller and the larger node, so
   * the proof needs no left/right flags.
   */
  common::Hash256 computeMerkleRoot(const crypto::Hasher &hasher,
                                    const common::Hash256 &leaf,
                                    const std::vector<common::Hash256> &proof);

  /**
   * Checks that the proof belongs to `message`, found at `message_index` of
   * the block's message list, and leads to `commitment`
   * @return ScannerError::PROOF_INVALID if the proof is inconsistent in
   * itself or proves another leaf, ScannerError::PROOF_ROOT_MISMATCH if it
   * proves another root
   */
  outcome::result<void> verifyMessageProof(
      const crypto::Hasher &hasher,
      const primitives::MerkleProof &proof,
      uint64_t message_index,
      const primitives::OutboundQueueMessage &message,
      const common::Hash256 &commitment);

}  // namespace parabridge::scanner
