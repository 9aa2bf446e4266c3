/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string_view>

#include <rapidjson/document.h>

#include "chain/jrpc/http_transport.hpp"
#include "common/buffer.hpp"
#include "log/logger.hpp"

namespace parabridge::chain::jrpc {

  /**
   * JSON-RPC 2.0 client. Builds requests, posts them through the transport
   * and unwraps the `result` member of the reply.
   */
  class JrpcClient {
   public:
    explicit JrpcClient(std::shared_ptr<HttpTransport> transport);

    /**
     * @param method name of the RPC method
     * @param params array of positional parameters
     * @return copy of the `result` member, Null if the node returned null
     */
    outcome::result<rapidjson::Document> call(std::string_view method,
                                              const rapidjson::Value &params);

   private:
    std::shared_ptr<HttpTransport> transport_;
    std::atomic<uint64_t> next_id_{1};
    log::Logger log_;
  };

  /// Accessors that map an unexpected JSON shape to ChainError::BAD_RESPONSE
  outcome::result<std::string_view> getString(const rapidjson::Value &value);

  outcome::result<std::reference_wrapper<const rapidjson::Value>> getMember(
      const rapidjson::Value &object, std::string_view name);

  /// 0x-prefixed hex string decoded into bytes
  outcome::result<common::Buffer> getBytes(const rapidjson::Value &value);

  /// String value, owned by the given allocator
  inline rapidjson::Value makeString(std::string_view str,
                                     rapidjson::Document::AllocatorType &a) {
    return rapidjson::Value{
        str.data(), static_cast<rapidjson::SizeType>(str.size()), a};
  }

}  // namespace parabridge::chain::jrpc
