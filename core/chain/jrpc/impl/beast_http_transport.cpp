/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/jrpc/impl/beast_http_transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>

#include "chain/chain_error.hpp"
#include "utils/asio_ssl_context_client.hpp"

namespace parabridge::chain::jrpc {

  namespace beast = boost::beast;
  namespace http = boost::beast::http;
  using boost::asio::ip::tcp;

  namespace {
    /// Runs one asynchronous operation to completion; the stream deadline
    /// turns a stalled operation into beast::error::timeout
    template <typename Initiate>
    boost::system::error_code await(boost::asio::io_context &io_context,
                                    Initiate &&initiate) {
      boost::system::error_code result = boost::asio::error::would_block;
      initiate([&result](const boost::system::error_code &ec, auto &&...) {
        result = ec;
      });
      io_context.restart();
      io_context.run();
      return result;
    }
  }  // namespace

  BeastHttpTransport::BeastHttpTransport(common::Uri uri,
                                         std::chrono::milliseconds timeout)
      : uri_{std::move(uri)},
        secure_{uri_.Schema == "https"},
        timeout_{timeout},
        log_{log::createLogger("HttpTransport", "jrpc")} {}

  outcome::result<std::shared_ptr<BeastHttpTransport>>
  BeastHttpTransport::create(std::string_view url,
                             std::chrono::milliseconds timeout) {
    auto log = log::createLogger("HttpTransport", "jrpc");
    if (url.empty()) {
      SL_ERROR(log, "URI is empty");
      return ChainError::INVALID_URI;
    }
    auto uri = common::Uri::parse(url);
    if (uri.error().has_value()) {
      SL_ERROR(log, "URI parsing was failed: {}", uri.error().value());
      return ChainError::INVALID_URI;
    }
    if (uri.Schema != "https" and uri.Schema != "http") {
      SL_ERROR(log, "URI has invalid schema: `{}`", uri.Schema);
      return ChainError::INVALID_URI;
    }
    if (uri.Port.empty()) {
      uri.Port = uri.Schema == "https" ? "443" : "80";
    }
    if (uri.Path.empty()) {
      uri.Path = "/";
    }
    SL_DEBUG(log, "Initialized for URL: {}", uri.to_string());
    return std::shared_ptr<BeastHttpTransport>(
        new BeastHttpTransport(std::move(uri), timeout));
  }

  outcome::result<std::string> BeastHttpTransport::post(
      std::string_view body) {
    boost::asio::io_context io_context;
    tcp::resolver resolver{io_context};

    SL_TRACE(log_, "Resolve hostname {}", uri_.Host);
    tcp::resolver::results_type endpoints;
    auto ec = await(io_context, [&](auto handler) {
      resolver.async_resolve(
          uri_.Host,
          uri_.Port,
          [&endpoints, handler = std::move(handler)](
              const boost::system::error_code &ec,
              tcp::resolver::results_type results) mutable {
            endpoints = std::move(results);
            handler(ec);
          });
    });
    if (ec) {
      SL_ERROR(log_, "Can't resolve hostname {}: {}", uri_.Host, ec.message());
      return ChainError::HTTP_ERROR;
    }

    if (secure_) {
      AsioSslContextClient ssl_ctx{uri_.Host};
      beast::ssl_stream<beast::tcp_stream> stream{io_context, ssl_ctx};

      // Set SNI Hostname (many hosts need this to handshake successfully)
      if (!SSL_set_tlsext_host_name(stream.native_handle(),
                                    uri_.Host.c_str())) {
        SL_ERROR(log_, "Can't set SNI hostname {}", uri_.Host);
        return ChainError::HTTP_ERROR;
      }

      beast::get_lowest_layer(stream).expires_after(timeout_);
      ec = await(io_context, [&](auto handler) {
        beast::get_lowest_layer(stream).async_connect(endpoints,
                                                      std::move(handler));
      });
      if (ec) {
        SL_ERROR(log_, "Connection failed: {}", ec.message());
        return ChainError::HTTP_ERROR;
      }

      ec = await(io_context, [&](auto handler) {
        stream.async_handshake(boost::asio::ssl::stream_base::client,
                               std::move(handler));
      });
      if (ec) {
        SL_ERROR(log_, "Handshake failed: {}", ec.message());
        return ChainError::HTTP_ERROR;
      }
      return exchange(stream, io_context, body);
    }

    beast::tcp_stream stream{io_context};
    stream.expires_after(timeout_);
    ec = await(io_context, [&](auto handler) {
      stream.async_connect(endpoints, std::move(handler));
    });
    if (ec) {
      SL_ERROR(log_, "Connection failed: {}", ec.message());
      return ChainError::HTTP_ERROR;
    }
    return exchange(stream, io_context, body);
  }

  template <typename Stream>
  outcome::result<std::string> BeastHttpTransport::exchange(
      Stream &stream,
      boost::asio::io_context &io_context,
      std::string_view body) {
    http::request<http::string_body> request{http::verb::post, uri_.Path, 11};
    request.set(http::field::host, uri_.Host);
    request.set(http::field::user_agent, "parabridge");
    request.set(http::field::content_type, "application/json");
    request.set(http::field::connection, "close");
    request.body().assign(body.begin(), body.end());
    request.prepare_payload();

    beast::get_lowest_layer(stream).expires_after(timeout_);
    auto ec = await(io_context, [&](auto handler) {
      http::async_write(stream, request, std::move(handler));
    });
    if (ec) {
      SL_ERROR(log_, "Request send was fail: {}", ec.message());
      return ChainError::HTTP_ERROR;
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    ec = await(io_context, [&](auto handler) {
      http::async_read(stream, buffer, response, std::move(handler));
    });
    if (ec) {
      SL_ERROR(log_, "Response reception has failed: {}", ec.message());
      return ChainError::HTTP_ERROR;
    }

    boost::system::error_code shutdown_ec;
    beast::get_lowest_layer(stream).socket().shutdown(
        tcp::socket::shutdown_both, shutdown_ec);

    if (response.result_int() / 100 != 2) {
      SL_WARN(log_,
              "{} replied with status {}",
              uri_.to_string(),
              response.result_int());
      return ChainError::HTTP_ERROR;
    }
    SL_TRACE(log_, "Response has received successful");
    return std::move(response.body());
  }

}  // namespace parabridge::chain::jrpc
