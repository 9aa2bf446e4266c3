/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/jrpc/jrpc_client.hpp"

#include <boost/assert.hpp>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "chain/chain_error.hpp"

namespace parabridge::chain::jrpc {

  JrpcClient::JrpcClient(std::shared_ptr<HttpTransport> transport)
      : transport_{std::move(transport)},
        log_{log::createLogger("JrpcClient", "jrpc")} {
    BOOST_ASSERT(transport_ != nullptr);
  }

  outcome::result<rapidjson::Document> JrpcClient::call(
      std::string_view method, const rapidjson::Value &params) {
    auto id = next_id_++;

    rapidjson::Document request{rapidjson::kObjectType};
    auto &allocator = request.GetAllocator();
    request.AddMember("jsonrpc", "2.0", allocator);
    request.AddMember("id", id, allocator);
    request.AddMember("method", makeString(method, allocator), allocator);
    request.AddMember(
        "params", rapidjson::Value{params, allocator}, allocator);

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer{buffer};
    request.Accept(writer);
    std::string_view body{buffer.GetString(), buffer.GetSize()};

    SL_TRACE(log_, "Request #{}: {}", id, body);
    OUTCOME_TRY(reply, transport_->post(body));
    SL_TRACE(log_, "Response #{}: {}", id, reply);

    rapidjson::Document response;
    response.Parse(reply.data(), reply.size());
    if (response.HasParseError()) {
      SL_WARN(log_,
              "Response to {} is not JSON: {} at offset {}",
              method,
              rapidjson::GetParseError_En(response.GetParseError()),
              response.GetErrorOffset());
      return ChainError::BAD_RESPONSE;
    }
    if (not response.IsObject()) {
      return ChainError::BAD_RESPONSE;
    }

    if (auto error = response.FindMember("error");
        error != response.MemberEnd()) {
      std::string_view message = "unknown";
      int64_t code = 0;
      if (error->value.IsObject()) {
        if (auto it = error->value.FindMember("message");
            it != error->value.MemberEnd() and it->value.IsString()) {
          message = {it->value.GetString(), it->value.GetStringLength()};
        }
        if (auto it = error->value.FindMember("code");
            it != error->value.MemberEnd() and it->value.IsInt64()) {
          code = it->value.GetInt64();
        }
      }
      SL_WARN(log_, "{} failed with code {}: {}", method, code, message);
      return ChainError::RPC_ERROR;
    }

    if (auto reply_id = response.FindMember("id");
        reply_id == response.MemberEnd() or not reply_id->value.IsUint64()
        or reply_id->value.GetUint64() != id) {
      SL_WARN(log_, "Response to {} #{} carries another id", method, id);
      return ChainError::BAD_RESPONSE;
    }

    auto result = response.FindMember("result");
    if (result == response.MemberEnd()) {
      return ChainError::BAD_RESPONSE;
    }
    rapidjson::Document value;
    value.CopyFrom(result->value, value.GetAllocator());
    return value;
  }

  outcome::result<std::string_view> getString(const rapidjson::Value &value) {
    if (not value.IsString()) {
      return ChainError::BAD_RESPONSE;
    }
    return std::string_view{value.GetString(), value.GetStringLength()};
  }

  outcome::result<std::reference_wrapper<const rapidjson::Value>> getMember(
      const rapidjson::Value &object, std::string_view name) {
    if (not object.IsObject()) {
      return ChainError::BAD_RESPONSE;
    }
    auto it = object.FindMember(rapidjson::Value{
        rapidjson::StringRef(name.data(), name.size())});
    if (it == object.MemberEnd()) {
      return ChainError::BAD_RESPONSE;
    }
    return std::cref(it->value);
  }

  outcome::result<common::Buffer> getBytes(const rapidjson::Value &value) {
    OUTCOME_TRY(str, getString(value));
    auto bytes = common::unhexWith0x(str);
    if (not bytes) {
      return ChainError::DECODE_FAILED;
    }
    return common::Buffer{std::move(bytes.value())};
  }

}  // namespace parabridge::chain::jrpc
