/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"
#include "primitives/block_header.hpp"
#include "primitives/outbound_queue.hpp"

namespace parabridge::chain {

  /**
   * Read-only view of the parachain that emits bridge messages. Retry and
   * call timeouts belong to implementations of this interface.
   */
  class SourceChain {
   public:
    virtual ~SourceChain() = default;

    /// Hash of the canonical block with the given number
    virtual outcome::result<primitives::BlockHash> blockHash(
        primitives::BlockNumber number) const = 0;

    /// Header of the block; hash_opt is filled with the given hash
    virtual outcome::result<primitives::BlockHeader> header(
        const primitives::BlockHash &block_hash) const = 0;

    /**
     * Raw storage value at the block
     * @return nullopt if nothing is stored under the key
     */
    virtual outcome::result<std::optional<common::Buffer>> storage(
        const common::Buffer &key, const primitives::BlockHash &at) const = 0;

    /**
     * Merkle proof of the message at position `leaf_index` of the block's
     * committed message list
     * @return nullopt if the runtime has no such leaf
     */
    virtual outcome::result<std::optional<primitives::MerkleProof>>
    proveMessage(uint64_t leaf_index, const primitives::BlockHash &at) const = 0;
  };

}  // namespace parabridge::chain
