/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "primitives/block_header.hpp"
#include "primitives/outbound_queue.hpp"
#include "primitives/parachain.hpp"

namespace parabridge::scanner {

  /// Message together with the proof of its inclusion under a commitment
  struct MessageProof {
    primitives::OutboundQueueMessage message;
    primitives::MerkleProof proof;

    bool operator==(const MessageProof &) const = default;
  };

  /// Relay chain state the destination light client needs to accept the
  /// parachain block as finalized
  struct ProofInput {
    primitives::ParachainId para_id{};
    primitives::BlockNumber relay_block_number{};
    std::vector<primitives::ParaHead> para_heads;

    bool operator==(const ProofInput &) const = default;
  };

  /**
   * Unit of relay work: outstanding messages of one source block, in
   * ascending nonce order, and the evidence of that block's finality
   */
  struct Task {
    primitives::BlockHeader header;
    std::vector<MessageProof> proofs;
    std::optional<ProofInput> proof_input;

    bool operator==(const Task &) const = default;
  };

}  // namespace parabridge::scanner
