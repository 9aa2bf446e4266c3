/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "outcome/outcome.hpp"

namespace parabridge::chain::jrpc {

  /// Blocking request/response exchange with a single RPC endpoint
  class HttpTransport {
   public:
    virtual ~HttpTransport() = default;

    /**
     * Posts a JSON body to the endpoint
     * @return response body of a 2xx reply
     */
    virtual outcome::result<std::string> post(std::string_view body) = 0;
  };

}  // namespace parabridge::chain::jrpc
