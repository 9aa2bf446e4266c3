/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include "chain/jrpc/jrpc_client.hpp"
#include "primitives/block_header.hpp"

namespace parabridge::chain {

  /**
   * Typed wrappers of the `chain_*` and `state_*` methods common to relay
   * chain and parachain nodes
   */
  class SubstrateRpc {
   public:
    explicit SubstrateRpc(std::shared_ptr<jrpc::JrpcClient> client);

    outcome::result<primitives::BlockHash> getBlockHash(
        primitives::BlockNumber number) const;

    outcome::result<primitives::BlockHash> getFinalizedHead() const;

    outcome::result<primitives::BlockHeader> getHeader(
        const primitives::BlockHash &block_hash) const;

    outcome::result<std::optional<common::Buffer>> getStorage(
        common::BufferView key, const primitives::BlockHash &at) const;

    /// All keys under the prefix, fetched page by page
    outcome::result<std::vector<common::Buffer>> getKeys(
        common::BufferView prefix, const primitives::BlockHash &at) const;

    /// Values of the keys in one query; absent values are nullopt
    outcome::result<std::vector<std::optional<common::Buffer>>>
    queryStorageAt(const std::vector<common::Buffer> &keys,
                   const primitives::BlockHash &at) const;

    /// Output of the runtime api function called at the block
    outcome::result<common::Buffer> call(std::string_view function,
                                         common::BufferView args,
                                         const primitives::BlockHash &at) const;

    static constexpr uint32_t kKeysPageSize = 1000;

   private:
    std::shared_ptr<jrpc::JrpcClient> client_;
  };

  /// Header in the JSON form of `chain_getHeader`; digest logs are SCALE hex
  outcome::result<primitives::BlockHeader> parseJsonHeader(
      const rapidjson::Value &json);

}  // namespace parabridge::chain
