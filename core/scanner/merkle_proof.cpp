/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scanner/merkle_proof.hpp"

#include "scanner/scanner_error.hpp"

namespace parabridge::scanner {

  namespace {
    constexpr size_t kWordSize = 32;

    void putWord(common::Buffer &out, uint64_t value) {
      out.resize(out.size() + kWordSize - sizeof(value), 0);
      for (size_t i = sizeof(value); i > 0; --i) {
        out.putUint8(static_cast<uint8_t>(value >> (8 * (i - 1))));
      }
    }
  }  // namespace

  common::Buffer encodeMessageLeaf(
      const primitives::OutboundQueueMessage &message) {
    // offset of the tuple, then its head and the tail of `params`
    constexpr uint64_t kTupleOffset = kWordSize;
    constexpr uint64_t kParamsOffset = 4 * kWordSize;

    common::Buffer out;
    putWord(out, kTupleOffset);
    putWord(out, message.origin);
    putWord(out, message.nonce);
    putWord(out, message.command);
    putWord(out, kParamsOffset);
    putWord(out, message.params.size());
    out.put(message.params);
    out.resize(out.size() + (kWordSize - message.params.size() % kWordSize)
                   % kWordSize,
               0);
    return out;
  }

  common::Hash256 messageLeaf(const crypto::Hasher &hasher,
                              const primitives::OutboundQueueMessage &message) {
    return hasher.keccak_256(encodeMessageLeaf(message));
  }

  common::Hash256 computeMerkleRoot(const crypto::Hasher &hasher,
                                    const common::Hash256 &leaf,
                                    const std::vector<common::Hash256> &proof) {
    auto node = leaf;
    common::Buffer pair;
    for (const auto &sibling : proof) {
      pair.clear();
      if (node <= sibling) {
        pair.put(node).put(sibling);
      } else {
        pair.put(sibling).put(node);
      }
      node = hasher.keccak_256(pair);
    }
    return node;
  }

  outcome::result<void> verifyMessageProof(
      const crypto::Hasher &hasher,
      const primitives::MerkleProof &proof,
      uint64_t message_index,
      const primitives::OutboundQueueMessage &message,
      const common::Hash256 &commitment) {
    if (proof.leaf_index != message_index
        or proof.leaf_index >= proof.number_of_leaves) {
      return ScannerError::PROOF_INVALID;
    }
    if (proof.leaf != messageLeaf(hasher, message)) {
      return ScannerError::PROOF_INVALID;
    }
    if (computeMerkleRoot(hasher, proof.leaf, proof.proof) != proof.root) {
      return ScannerError::PROOF_INVALID;
    }
    if (proof.root != commitment) {
      return ScannerError::PROOF_ROOT_MISMATCH;
    }
    return outcome::success();
  }

}  // namespace parabridge::scanner
