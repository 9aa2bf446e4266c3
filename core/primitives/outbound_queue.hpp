/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <vector>

#include <scale/scale.hpp>

#include "common/blob.hpp"
#include "common/buffer.hpp"

namespace parabridge::primitives {

  /// Message lane; equals the id of the parachain the messages originate on
  using ChannelId = uint32_t;

  /// Per-channel sequence number of a message
  using Nonce = uint64_t;

  /**
   * Message as it is committed by the outbound queue pallet at the end of
   * the block which emitted it
   */
  struct OutboundQueueMessage {
    ChannelId origin{};
    Nonce nonce{};
    uint8_t command{};
    common::Buffer params;

    bool operator==(const OutboundQueueMessage &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const OutboundQueueMessage &msg) {
    return s << msg.origin << msg.nonce << msg.command << msg.params;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, OutboundQueueMessage &msg) {
    return s >> msg.origin >> msg.nonce >> msg.command >> msg.params;
  }

  /**
   * Binary merkle proof of a leaf, as returned by the outbound queue
   * runtime api
   */
  struct MerkleProof {
    common::Hash256 root;
    std::vector<common::Hash256> proof;
    uint64_t number_of_leaves{};
    uint64_t leaf_index{};
    common::Hash256 leaf;

    bool operator==(const MerkleProof &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const MerkleProof &proof) {
    return s << proof.root << proof.proof << proof.number_of_leaves
             << proof.leaf_index << proof.leaf;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, MerkleProof &proof) {
    return s >> proof.root >> proof.proof >> proof.number_of_leaves
        >> proof.leaf_index >> proof.leaf;
  }

}  // namespace parabridge::primitives
