/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <array>
#include <iostream>
#include <limits>

#include <boost/program_options.hpp>
#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>

#include "common/uri.hpp"

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  bool is_valid_rpc_url(const std::string &url) {
    if (url.empty()) {
      return false;
    }
    auto uri = parabridge::common::Uri::parse(url);
    return not uri.error().has_value()
       and (uri.Schema == "http" or uri.Schema == "https");
  }
}  // namespace

namespace parabridge::application {

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : logger_(std::move(logger)) {}

  AppConfigurationImpl::FilePtr AppConfigurationImpl::open_file(
      const std::string &filepath) {
    return AppConfigurationImpl::FilePtr(std::fopen(filepath.c_str(), "r"),
                                         &std::fclose);
  }

  bool AppConfigurationImpl::load_ms(const rapidjson::Value &val,
                                     const char *name,
                                     std::vector<std::string> &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m or not m->value.IsArray()) {
      return false;
    }
    for (const auto &value : m->value.GetArray()) {
      if (value.IsString()) {
        target.emplace_back(value.GetString(), value.GetStringLength());
      }
    }
    return not target.empty();
  }

  bool AppConfigurationImpl::load_str(const rapidjson::Value &val,
                                      const char *name,
                                      std::string &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsString()) {
      target.assign(m->value.GetString(), m->value.GetStringLength());
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_u32(const rapidjson::Value &val,
                                      const char *name,
                                      uint32_t &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsUint()) {
      target = m->value.GetUint();
      return true;
    }
    return false;
  }

  void AppConfigurationImpl::parse_general_segment(
      const rapidjson::Value &val) {
    load_ms(val, "log", logger_tuning_config_);
    uint32_t timeout = 0;
    if (load_u32(val, "rpc-timeout", timeout)) {
      rpc_timeout_ = std::chrono::milliseconds{timeout};
    }
  }

  void AppConfigurationImpl::parse_source_segment(const rapidjson::Value &val) {
    load_str(val, "url", source_rpc_url_);
  }

  void AppConfigurationImpl::parse_relaychain_segment(
      const rapidjson::Value &val) {
    load_str(val, "url", relay_rpc_url_);
  }

  void AppConfigurationImpl::parse_ethereum_segment(
      const rapidjson::Value &val) {
    load_str(val, "url", ethereum_rpc_url_);
    load_str(val, "gateway", gateway_address_str_);
  }

  void AppConfigurationImpl::parse_scan_segment(const rapidjson::Value &val) {
    load_u32(val, "para-id", scanner_config_.para_id);
    uint32_t channel_id = 0;
    if (load_u32(val, "channel-id", channel_id)) {
      channel_id_ = channel_id;
    }
    load_u32(val, "finalization-timeout", scanner_config_.finalization_timeout);
    load_u32(val, "max-lookback", scanner_config_.max_lookback);
    uint32_t relay_block = 0;
    if (load_u32(val, "relay-block", relay_block)) {
      relay_checkpoint_ = relay_block;
    }
  }

  bool AppConfigurationImpl::read_config_from_file(
      const std::string &filepath) {
    auto file = open_file(filepath);
    if (!file) {
      SL_ERROR(logger_,
               "Configuration file path is invalid: {}, "
               "please specify a valid path with -c option",
               filepath);
      return false;
    }

    using FileReadStream = rapidjson::FileReadStream;
    using Document = rapidjson::Document;

    std::array<char, 1024> buffer{};
    FileReadStream input_stream(file.get(), buffer.data(), buffer.size());

    Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration file {} parse failed with error {}",
               filepath,
               GetParseError_En(document.GetParseError()));
      return false;
    }
    if (not document.IsObject()) {
      SL_ERROR(logger_, "Configuration file {} is not a JSON object", filepath);
      return false;
    }

    for (auto &handler : handlers_) {
      auto it = document.FindMember(handler.segment_name);
      if (document.MemberEnd() != it) {
        handler.handler(it->value);
      }
    }
    return true;
  }

  bool AppConfigurationImpl::set_gateway_address(const std::string &hex) {
    auto address = common::Address::fromHexWithPrefix(hex);
    if (not address) {
      address = common::Address::fromHex(hex);
    }
    if (not address) {
      SL_ERROR(logger_,
               "Gateway address '{}' is not a 20-byte hex string: {}",
               hex,
               address.error());
      return false;
    }
    gateway_address_ = address.value();
    return true;
  }

  bool AppConfigurationImpl::validate_config() {
    const std::array<std::pair<const char *, const std::string *>, 3> urls{{
        {"--source-url", &source_rpc_url_},
        {"--relay-url", &relay_rpc_url_},
        {"--ethereum-url", &ethereum_rpc_url_},
    }};
    for (const auto &[option, url] : urls) {
      if (not is_valid_rpc_url(*url)) {
        SL_ERROR(logger_,
                 "RPC endpoint '{}' is invalid, "
                 "please specify an http(s) URL with {} option",
                 *url,
                 option);
        return false;
      }
    }

    if (gateway_address_str_.empty()) {
      SL_ERROR(logger_,
               "Gateway address is not set, "
               "please specify it with --gateway option");
      return false;
    }
    if (not set_gateway_address(gateway_address_str_)) {
      return false;
    }

    if (scanner_config_.para_id == 0) {
      SL_ERROR(logger_,
               "Parachain id is not set, "
               "please specify it with --para-id option");
      return false;
    }
    scanner_config_.channel_id = channel_id_.value_or(scanner_config_.para_id);

    if (scanner_config_.finalization_timeout == 0) {
      SL_ERROR(logger_, "Finalization timeout must be at least 1 block");
      return false;
    }
    if (rpc_timeout_.count() == 0) {
      SL_ERROR(logger_, "RPC timeout must be positive");
      return false;
    }
    return true;
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<target>=<level>`, e.g. -lscanner=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Filepath of a soralog YAML configuration")
        ("config-file,c", po::value<std::string>(), "Filepath to load configuration from.")
        ("rpc-timeout", po::value<uint32_t>(), "Timeout of a single RPC request <ms>")
        ;

    po::options_description chains_desc("Chain options");
    chains_desc.add_options()
        ("source-url", po::value<std::string>(), "required, JSON-RPC endpoint of the source parachain")
        ("relay-url", po::value<std::string>(), "required, JSON-RPC endpoint of the relay chain")
        ("ethereum-url", po::value<std::string>(), "required, JSON-RPC endpoint of Ethereum")
        ("gateway", po::value<std::string>(), "required, address of the gateway contract")
        ;

    po::options_description scan_desc("Scan options");
    scan_desc.add_options()
        ("para-id", po::value<uint32_t>(), "required, id of the source parachain")
        ("channel-id", po::value<uint32_t>(), "channel to scan, the parachain id by default")
        ("finalization-timeout", po::value<uint32_t>()->default_value(scanner::ScannerConfig::kDefaultFinalizationTimeout),
          "Relay blocks after the relay parent in which a source block must become included")
        ("max-lookback", po::value<uint32_t>()->default_value(0),
          "Maximum number of source blocks to walk back, 0 for no limit")
        ("relay-block", po::value<uint32_t>(), "Relay chain block to scan at, the finalized head by default")
        ;
    // clang-format on

    desc.add(chains_desc).add(scan_desc);

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << desc << std::endl;
      return false;
    }

    bool config_is_read = true;
    find_argument<std::string>(vm, "config-file", [&](const std::string &path) {
      config_is_read = read_config_from_file(path);
    });
    if (not config_is_read) {
      return false;
    }

    find_argument<std::vector<std::string>>(
        vm, "log", [&](const std::vector<std::string> &val) {
          logger_tuning_config_ = val;
        });
    find_argument<uint32_t>(vm, "rpc-timeout", [&](uint32_t val) {
      rpc_timeout_ = std::chrono::milliseconds{val};
    });

    find_argument<std::string>(
        vm, "source-url", [&](const std::string &val) { source_rpc_url_ = val; });
    find_argument<std::string>(
        vm, "relay-url", [&](const std::string &val) { relay_rpc_url_ = val; });
    find_argument<std::string>(vm, "ethereum-url", [&](const std::string &val) {
      ethereum_rpc_url_ = val;
    });
    find_argument<std::string>(vm, "gateway", [&](const std::string &val) {
      gateway_address_str_ = val;
    });

    find_argument<uint32_t>(
        vm, "para-id", [&](uint32_t val) { scanner_config_.para_id = val; });
    find_argument<uint32_t>(
        vm, "channel-id", [&](uint32_t val) { channel_id_ = val; });
    find_argument<uint32_t>(vm, "finalization-timeout", [&](uint32_t val) {
      scanner_config_.finalization_timeout = val;
    });
    find_argument<uint32_t>(vm, "max-lookback", [&](uint32_t val) {
      scanner_config_.max_lookback = val;
    });
    find_argument<uint32_t>(
        vm, "relay-block", [&](uint32_t val) { relay_checkpoint_ = val; });

    if (not validate_config()) {
      std::cout << desc << std::endl;
      return false;
    }
    return true;
  }

}  // namespace parabridge::application
