/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/impl/substrate_rpc.hpp"

#include <algorithm>

#include <boost/assert.hpp>

#include "chain/chain_error.hpp"
#include "chain/scale_decode.hpp"

namespace parabridge::chain {

  namespace {
    outcome::result<primitives::BlockHash> parseHash(
        const rapidjson::Value &json) {
      OUTCOME_TRY(str, jrpc::getString(json));
      auto hash = primitives::BlockHash::fromHexWithPrefix(str);
      if (not hash) {
        return ChainError::DECODE_FAILED;
      }
      return hash.value();
    }

    outcome::result<primitives::BlockNumber> parseNumber(
        const rapidjson::Value &json) {
      OUTCOME_TRY(str, jrpc::getString(json));
      auto number = common::unhexNumber<primitives::BlockNumber>(str);
      if (number.has_error()) {
        if (number.error() == common::UnhexError::VALUE_OUT_OF_RANGE) {
          return ChainError::VALUE_OUT_OF_RANGE;
        }
        return ChainError::DECODE_FAILED;
      }
      return number.value();
    }
  }  // namespace

  outcome::result<primitives::BlockHeader> parseJsonHeader(
      const rapidjson::Value &json) {
    primitives::BlockHeader header;
    OUTCOME_TRY(parent_hash, jrpc::getMember(json, "parentHash"));
    OUTCOME_TRY(number, jrpc::getMember(json, "number"));
    OUTCOME_TRY(state_root, jrpc::getMember(json, "stateRoot"));
    OUTCOME_TRY(extrinsics_root, jrpc::getMember(json, "extrinsicsRoot"));
    OUTCOME_TRY(digest, jrpc::getMember(json, "digest"));
    OUTCOME_TRY(logs, jrpc::getMember(digest.get(), "logs"));

    OUTCOME_TRY(parent_hash_value, parseHash(parent_hash.get()));
    OUTCOME_TRY(number_value, parseNumber(number.get()));
    OUTCOME_TRY(state_root_value, parseHash(state_root.get()));
    OUTCOME_TRY(extrinsics_root_value, parseHash(extrinsics_root.get()));
    header.parent_hash = parent_hash_value;
    header.number = number_value;
    header.state_root = state_root_value;
    header.extrinsics_root = extrinsics_root_value;

    if (not logs.get().IsArray()) {
      return ChainError::BAD_RESPONSE;
    }
    for (const auto &log : logs.get().GetArray()) {
      OUTCOME_TRY(bytes, jrpc::getBytes(log));
      OUTCOME_TRY(item, decodeScale<primitives::DigestItem>(bytes));
      header.digest.emplace_back(std::move(item));
    }
    return header;
  }

  SubstrateRpc::SubstrateRpc(std::shared_ptr<jrpc::JrpcClient> client)
      : client_{std::move(client)} {
    BOOST_ASSERT(client_ != nullptr);
  }

  outcome::result<primitives::BlockHash> SubstrateRpc::getBlockHash(
      primitives::BlockNumber number) const {
    rapidjson::Document params{rapidjson::kArrayType};
    params.PushBack(number, params.GetAllocator());
    OUTCOME_TRY(result, client_->call("chain_getBlockHash", params));
    return parseHash(result);
  }

  outcome::result<primitives::BlockHash> SubstrateRpc::getFinalizedHead()
      const {
    rapidjson::Document params{rapidjson::kArrayType};
    OUTCOME_TRY(result, client_->call("chain_getFinalizedHead", params));
    return parseHash(result);
  }

  outcome::result<primitives::BlockHeader> SubstrateRpc::getHeader(
      const primitives::BlockHash &block_hash) const {
    rapidjson::Document params{rapidjson::kArrayType};
    auto &allocator = params.GetAllocator();
    params.PushBack(jrpc::makeString(block_hash.toHexWithPrefix(), allocator),
                    allocator);
    OUTCOME_TRY(result, client_->call("chain_getHeader", params));
    OUTCOME_TRY(header, parseJsonHeader(result));
    header.hash_opt = block_hash;
    return header;
  }

  outcome::result<std::optional<common::Buffer>> SubstrateRpc::getStorage(
      common::BufferView key, const primitives::BlockHash &at) const {
    rapidjson::Document params{rapidjson::kArrayType};
    auto &allocator = params.GetAllocator();
    params.PushBack(jrpc::makeString(common::hex_lower_0x(key), allocator),
                    allocator);
    params.PushBack(jrpc::makeString(at.toHexWithPrefix(), allocator),
                    allocator);
    OUTCOME_TRY(result, client_->call("state_getStorage", params));
    if (result.IsNull()) {
      return std::nullopt;
    }
    OUTCOME_TRY(bytes, jrpc::getBytes(result));
    return std::move(bytes);
  }

  outcome::result<std::vector<common::Buffer>> SubstrateRpc::getKeys(
      common::BufferView prefix, const primitives::BlockHash &at) const {
    std::vector<common::Buffer> keys;
    while (true) {
      rapidjson::Document params{rapidjson::kArrayType};
      auto &allocator = params.GetAllocator();
      params.PushBack(
          jrpc::makeString(common::hex_lower_0x(prefix), allocator), allocator);
      params.PushBack(kKeysPageSize, allocator);
      if (keys.empty()) {
        params.PushBack(rapidjson::Value{}, allocator);
      } else {
        params.PushBack(
            jrpc::makeString(common::hex_lower_0x(keys.back()), allocator),
            allocator);
      }
      params.PushBack(jrpc::makeString(at.toHexWithPrefix(), allocator),
                      allocator);

      OUTCOME_TRY(result, client_->call("state_getKeysPaged", params));
      if (not result.IsArray()) {
        return ChainError::BAD_RESPONSE;
      }
      for (const auto &key : result.GetArray()) {
        OUTCOME_TRY(bytes, jrpc::getBytes(key));
        keys.emplace_back(std::move(bytes));
      }
      if (result.Size() < kKeysPageSize) {
        return keys;
      }
    }
  }

  outcome::result<std::vector<std::optional<common::Buffer>>>
  SubstrateRpc::queryStorageAt(const std::vector<common::Buffer> &keys,
                               const primitives::BlockHash &at) const {
    std::vector<std::optional<common::Buffer>> values(keys.size());
    if (keys.empty()) {
      return values;
    }

    rapidjson::Document params{rapidjson::kArrayType};
    auto &allocator = params.GetAllocator();
    rapidjson::Value keys_json{rapidjson::kArrayType};
    for (const auto &key : keys) {
      keys_json.PushBack(jrpc::makeString(key.toHexWithPrefix(), allocator),
                         allocator);
    }
    params.PushBack(keys_json, allocator);
    params.PushBack(jrpc::makeString(at.toHexWithPrefix(), allocator),
                    allocator);
    OUTCOME_TRY(result, client_->call("state_queryStorageAt", params));

    // [{"block": hash, "changes": [[key, value | null], ...]}]
    if (not result.IsArray() or result.Size() != 1) {
      return ChainError::BAD_RESPONSE;
    }
    OUTCOME_TRY(changes, jrpc::getMember(result[0u], "changes"));
    if (not changes.get().IsArray()) {
      return ChainError::BAD_RESPONSE;
    }
    for (const auto &change : changes.get().GetArray()) {
      if (not change.IsArray() or change.Size() != 2) {
        return ChainError::BAD_RESPONSE;
      }
      OUTCOME_TRY(key, jrpc::getBytes(change[0u]));
      auto it = std::find(keys.begin(), keys.end(), key);
      if (it == keys.end()) {
        return ChainError::BAD_RESPONSE;
      }
      if (change[1].IsNull()) {
        continue;
      }
      OUTCOME_TRY(value, jrpc::getBytes(change[1]));
      values[std::distance(keys.begin(), it)] = std::move(value);
    }
    return values;
  }

  outcome::result<common::Buffer> SubstrateRpc::call(
      std::string_view function,
      common::BufferView args,
      const primitives::BlockHash &at) const {
    rapidjson::Document params{rapidjson::kArrayType};
    auto &allocator = params.GetAllocator();
    params.PushBack(jrpc::makeString(function, allocator), allocator);
    params.PushBack(jrpc::makeString(common::hex_lower_0x(args), allocator),
                    allocator);
    params.PushBack(jrpc::makeString(at.toHexWithPrefix(), allocator),
                    allocator);
    OUTCOME_TRY(result, client_->call("state_call", params));
    return jrpc::getBytes(result);
  }

}  // namespace parabridge::chain
