/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>
#include <filesystem>
#include <string_view>

#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/rfc2818_verification.hpp>

namespace parabridge {
  /// TLS client context for the https RPC endpoints, verifying the peer
  /// against the system certificate store
  struct AsioSslContextClient : boost::asio::ssl::context {
    explicit AsioSslContextClient(const std::string &host)
        : context{context::tls_client} {
      // X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT_LOCALLY
      [[maybe_unused]] static bool find_system_certificates = [] {
        // SSL_CERT_FILE
        if (getenv(X509_get_default_cert_file_env()) != nullptr) {
          return true;
        }
        constexpr auto extra = "/etc/ssl/cert.pem";
        if (std::string_view{X509_get_default_cert_file()} != extra
            and std::filesystem::exists(extra)) {
          setenv(X509_get_default_cert_file_env(), extra, true);
        }
        return true;
      }();
      set_options(context::default_workarounds | context::no_sslv2
                  | context::no_sslv3 | context::no_tlsv1 | context::no_tlsv1_1
                  | context::single_dh_use);
      set_default_verify_paths();
      set_verify_mode(boost::asio::ssl::verify_peer);
      set_verify_callback(boost::asio::ssl::rfc2818_verification{host});
    }
  };
}  // namespace parabridge
