/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/variant.hpp>
#include <scale/scale.hpp>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "common/unused.hpp"

namespace parabridge::primitives {

  /// Consensus engine unique ID.
  using ConsensusEngineId = common::Blob<4>;

  /// Payload of the digest items that are addressed to a consensus engine
  struct ConsensusEngineDigest {
    ConsensusEngineId consensus_engine_id;
    common::Buffer data;

    bool operator==(const ConsensusEngineDigest &rhs) const = default;
  };

  /// Put by the runtime, addressed to a consensus engine
  struct Consensus : public ConsensusEngineDigest {};

  /// Put by the block author, excluded from the pre-seal hash
  struct Seal : public ConsensusEngineDigest {};

  /// Put by the block author before the runtime runs
  struct PreRuntime : public ConsensusEngineDigest {};

  /// Chain-specific opaque payload; bridge commitments travel here
  struct Other {
    common::Buffer data;

    bool operator==(const Other &rhs) const = default;
  };

  /// Signals that the runtime code or heap pages changed in this block
  struct RuntimeEnvironmentUpdated {
    bool operator==(const RuntimeEnvironmentUpdated &) const = default;
  };

  /**
   * Digest item in the SCALE enum order of sp_runtime::DigestItem:
   * Other = 0, Consensus = 4, Seal = 5, PreRuntime = 6,
   * RuntimeEnvironmentUpdated = 8
   */
  using DigestItem = boost::variant<Other,                      // 0
                                    Unused<1>,                  // 1
                                    Unused<2>,                  // 2
                                    Unused<3>,                  // 3
                                    Consensus,                  // 4
                                    Seal,                       // 5
                                    PreRuntime,                 // 6
                                    Unused<7>,                  // 7
                                    RuntimeEnvironmentUpdated>; // 8

  /**
   * Digest is an implementation- and usage-defined entity, for example,
   * information, needed to verify the block
   */
  using Digest = std::vector<DigestItem>;

  template <class Stream,
            typename T,
            typename = std::enable_if_t<
                Stream::is_encoder_stream
                and std::is_base_of_v<ConsensusEngineDigest, T>>>
  Stream &operator<<(Stream &s, const T &digest) {
    return s << digest.consensus_engine_id << digest.data;
  }

  template <class Stream,
            typename T,
            typename = std::enable_if_t<
                Stream::is_decoder_stream
                and std::is_base_of_v<ConsensusEngineDigest, T>>>
  Stream &operator>>(Stream &s, T &digest) {
    return s >> digest.consensus_engine_id >> digest.data;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const Other &other) {
    return s << other.data;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, Other &other) {
    return s >> other.data;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const RuntimeEnvironmentUpdated &) {
    return s;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, RuntimeEnvironmentUpdated &) {
    return s;
  }

}  // namespace parabridge::primitives
