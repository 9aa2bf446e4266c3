/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <cstdio>
#include <functional>
#include <memory>

#include <rapidjson/document.h>

#include "log/logger.hpp"

namespace parabridge::application {

  class AppConfigurationImpl final : public AppConfiguration {
    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

   public:
    static constexpr std::chrono::milliseconds kDefaultRpcTimeout{30000};

    explicit AppConfigurationImpl(log::Logger logger);
    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    const std::string &sourceRpcUrl() const override {
      return source_rpc_url_;
    }
    const std::string &relayRpcUrl() const override {
      return relay_rpc_url_;
    }
    const std::string &ethereumRpcUrl() const override {
      return ethereum_rpc_url_;
    }
    const common::Address &gatewayAddress() const override {
      return gateway_address_;
    }
    const scanner::ScannerConfig &scannerConfig() const override {
      return scanner_config_;
    }
    std::optional<primitives::BlockNumber> relayCheckpoint() const override {
      return relay_checkpoint_;
    }
    std::chrono::milliseconds rpcTimeout() const override {
      return rpc_timeout_;
    }
    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }

   private:
    void parse_general_segment(const rapidjson::Value &val);
    void parse_source_segment(const rapidjson::Value &val);
    void parse_relaychain_segment(const rapidjson::Value &val);
    void parse_ethereum_segment(const rapidjson::Value &val);
    void parse_scan_segment(const rapidjson::Value &val);

    struct SegmentHandler {
      using Handler = std::function<void(const rapidjson::Value &)>;
      const char *segment_name;
      Handler handler;
    };

    // clang-format off
    std::vector<SegmentHandler> handlers_ = {
        SegmentHandler{"general",    [this](const auto &val) { parse_general_segment(val); }},
        SegmentHandler{"source",     [this](const auto &val) { parse_source_segment(val); }},
        SegmentHandler{"relaychain", [this](const auto &val) { parse_relaychain_segment(val); }},
        SegmentHandler{"ethereum",   [this](const auto &val) { parse_ethereum_segment(val); }},
        SegmentHandler{"scan",       [this](const auto &val) { parse_scan_segment(val); }},
    };
    // clang-format on

    bool validate_config();

    bool read_config_from_file(const std::string &filepath);

    bool load_ms(const rapidjson::Value &val,
                 const char *name,
                 std::vector<std::string> &target);
    bool load_str(const rapidjson::Value &val,
                  const char *name,
                  std::string &target);
    bool load_u32(const rapidjson::Value &val,
                  const char *name,
                  uint32_t &target);

    bool set_gateway_address(const std::string &hex);

    FilePtr open_file(const std::string &filepath);

    log::Logger logger_;

    std::string source_rpc_url_;
    std::string relay_rpc_url_;
    std::string ethereum_rpc_url_;
    std::string gateway_address_str_;
    common::Address gateway_address_;
    std::optional<primitives::ChannelId> channel_id_;
    scanner::ScannerConfig scanner_config_;
    std::optional<primitives::BlockNumber> relay_checkpoint_;
    std::chrono::milliseconds rpc_timeout_{kDefaultRpcTimeout};
    std::vector<std::string> logger_tuning_config_;
  };

}  // namespace parabridge::application
