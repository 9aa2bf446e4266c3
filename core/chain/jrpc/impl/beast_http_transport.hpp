/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "chain/jrpc/http_transport.hpp"

#include <chrono>
#include <memory>

#include <boost/asio/io_context.hpp>

#include "common/uri.hpp"
#include "log/logger.hpp"

namespace parabridge::chain::jrpc {

  /**
   * Synchronous http/https client over Boost.Beast. Opens a connection per
   * request; the object may be shared by independent scans.
   */
  class BeastHttpTransport final : public HttpTransport {
   public:
    static constexpr std::chrono::seconds kDefaultTimeout{30};

    static outcome::result<std::shared_ptr<BeastHttpTransport>> create(
        std::string_view url,
        std::chrono::milliseconds timeout = kDefaultTimeout);

    outcome::result<std::string> post(std::string_view body) override;

   private:
    BeastHttpTransport(common::Uri uri, std::chrono::milliseconds timeout);

    template <typename Stream>
    outcome::result<std::string> exchange(Stream &stream,
                                          boost::asio::io_context &io_context,
                                          std::string_view body);

    common::Uri uri_;
    bool secure_;
    std::chrono::milliseconds timeout_;
    log::Logger log_;
  };

}  // namespace parabridge::chain::jrpc
