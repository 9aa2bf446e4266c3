/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <scale/scale.hpp>

#include "common/buffer.hpp"
#include "primitives/common.hpp"

namespace parabridge::primitives {

  /// Opaque parachain head as stored by the relay chain (SCALE-encoded header)
  using HeadData = common::Buffer;

  /// Entry of the relay chain head table
  struct ParaHead {
    ParachainId para_id{};
    HeadData data;

    bool operator==(const ParaHead &) const = default;
  };

  /**
   * Validation context a parachain block was built in; stored by the
   * parachain system pallet during block execution
   */
  struct PersistedValidationData {
    HeadData parent_head;
    BlockNumber relay_parent_number{};
    common::Hash256 relay_parent_storage_root;
    uint32_t max_pov_size{};

    bool operator==(const PersistedValidationData &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const PersistedValidationData &data) {
    return s << data.parent_head << data.relay_parent_number
             << data.relay_parent_storage_root << data.max_pov_size;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, PersistedValidationData &data) {
    return s >> data.parent_head >> data.relay_parent_number
        >> data.relay_parent_storage_root >> data.max_pov_size;
  }

}  // namespace parabridge::primitives
