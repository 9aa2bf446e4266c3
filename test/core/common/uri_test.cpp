/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "common/uri.hpp"

using parabridge::common::Uri;

TEST(UriTest, RpcEndpointWithPort) {
  auto original_url = "http://127.0.0.1:9944/";

  auto uri = Uri::parse(original_url);

  ASSERT_FALSE(uri.error().has_value());
  EXPECT_EQ(uri.Schema, "http");
  EXPECT_EQ(uri.Host, "127.0.0.1");
  EXPECT_EQ(uri.Port, "9944");
  EXPECT_EQ(uri.Path, "/");
  EXPECT_EQ(uri.to_string(), original_url);
}

TEST(UriTest, ProviderEndpointWithPathAndQuery) {
  auto original_url = "https://eth-node.example-provider.io/v1/abc?key=K#x";

  auto uri = Uri::parse(original_url);

  ASSERT_FALSE(uri.error().has_value());
  EXPECT_EQ(uri.Schema, "https");
  EXPECT_EQ(uri.Host, "eth-node.example-provider.io");
  EXPECT_EQ(uri.Port, "");
  EXPECT_EQ(uri.Path, "/v1/abc");
  EXPECT_EQ(uri.Query, "key=K");
  EXPECT_EQ(uri.Fragment, "x");
  EXPECT_EQ(uri.to_string(), original_url);
}

TEST(UriTest, HostOnly) {
  auto uri = Uri::parse("localhost:9933");

  ASSERT_FALSE(uri.error().has_value());
  EXPECT_EQ(uri.Schema, "");
  EXPECT_EQ(uri.Host, "localhost");
  EXPECT_EQ(uri.Port, "9933");
  EXPECT_EQ(uri.Path, "");
}

TEST(UriTest, InvalidSchema) {
  auto uri = Uri::parse("ws+tls://hostname:12345/");

  ASSERT_TRUE(uri.error().has_value());
  EXPECT_EQ(uri.error().value(), "Invalid schema");
}

TEST(UriTest, InvalidHostname) {
  for (auto original_url : {"https://goggle,com:12345/", "https://:12345/"}) {
    auto uri = Uri::parse(original_url);

    ASSERT_TRUE(uri.error().has_value()) << original_url;
    EXPECT_EQ(uri.error().value(), "Invalid hostname");
  }
}

TEST(UriTest, InvalidPort) {
  for (auto original_url : {"https://node.io:rpc/",
                            "https://node.io:77777/",
                            "https://node.io:0/",
                            "https://node.io:/"}) {
    auto uri = Uri::parse(original_url);

    ASSERT_TRUE(uri.error().has_value()) << original_url;
    EXPECT_EQ(uri.error().value(), "Invalid port");
  }
}
