/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <tuple>

#include <boost/assert.hpp>
#include <scale/scale.hpp>

#include "common/blob.hpp"
#include "primitives/common.hpp"
#include "primitives/digest.hpp"

namespace parabridge::primitives {
  /**
   * @struct BlockHeader represents header of a block
   */
  struct BlockHeader {
    BlockNumber number{};                ///< Block number (height)
    BlockHash parent_hash{};             ///< Parent block hash
    common::Hash256 state_root{};        ///< Merkle tree root of state
    common::Hash256 extrinsics_root{};   ///< Hash of included extrinsics
    Digest digest{};                     ///< Chain-specific auxiliary data
    std::optional<BlockHash> hash_opt{};  ///< Block hash if known

    bool operator==(const BlockHeader &rhs) const {
      return std::tie(parent_hash, number, state_root, extrinsics_root, digest)
          == std::tie(rhs.parent_hash,
                      rhs.number,
                      rhs.state_root,
                      rhs.extrinsics_root,
                      rhs.digest);
    }

    bool operator!=(const BlockHeader &rhs) const {
      return !operator==(rhs);
    }

    const BlockHash &hash() const {
      BOOST_ASSERT_MSG(hash_opt.has_value(),
                       "Hash must be known and saved before that");
      return hash_opt.value();
    }
  };

  /**
   * @brief outputs object of type BlockHeader to stream
   * @tparam Stream output stream type
   * @param s stream reference
   * @param bh value to output
   * @return reference to stream
   */
  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const BlockHeader &bh) {
    return s << bh.parent_hash << ::scale::CompactInteger(bh.number)
             << bh.state_root << bh.extrinsics_root << bh.digest;
  }

  /**
   * @brief decodes object of type BlockHeader from stream
   * @tparam Stream input stream type
   * @param s stream reference
   * @param bh value to decode into
   * @return reference to stream
   */
  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, BlockHeader &bh) {
    ::scale::CompactInteger number_compact;
    s >> bh.parent_hash >> number_compact >> bh.state_root
        >> bh.extrinsics_root >> bh.digest;
    bh.number = number_compact.convert_to<BlockNumber>();
    return s;
  }

}  // namespace parabridge::primitives
