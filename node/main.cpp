/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>

#include <soralog/logging_system.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "chain/impl/gateway_impl.hpp"
#include "chain/impl/relay_chain_impl.hpp"
#include "chain/impl/source_chain_impl.hpp"
#include "chain/jrpc/impl/beast_http_transport.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"
#include "scanner/impl/scanner_impl.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

using parabridge::application::AppConfigurationImpl;

namespace {
  std::atomic_bool cancel_scan{false};

  void on_signal(int) {
    cancel_scan = true;
  }

  outcome::result<std::shared_ptr<parabridge::chain::jrpc::JrpcClient>>
  make_client(const std::string &url, std::chrono::milliseconds timeout) {
    using parabridge::chain::jrpc::BeastHttpTransport;
    OUTCOME_TRY(transport, BeastHttpTransport::create(url, timeout));
    return std::make_shared<parabridge::chain::jrpc::JrpcClient>(
        std::move(transport));
  }

  int run_scan(int argc, const char **argv) {
    namespace pb = parabridge;

    auto logger = pb::log::createLogger("Main", "application");

    auto configuration = std::make_shared<AppConfigurationImpl>(
        pb::log::createLogger("AppConfiguration", "application"));
    if (not configuration->initializeFromArgs(argc, argv)) {
      return EXIT_FAILURE;
    }

    if (auto res = pb::log::tuneLoggingSystem(configuration->log());
        res.has_error()) {
      SL_ERROR(logger, "Can't apply --log option: {}", res.error());
      return EXIT_FAILURE;
    }

    auto hasher_res = pb::crypto::HasherImpl::create();
    if (not hasher_res) {
      SL_ERROR(logger, "Can't initialize hasher: {}", hasher_res.error());
      return EXIT_FAILURE;
    }
    auto hasher = std::move(hasher_res.value());

    const auto timeout = configuration->rpcTimeout();
    auto source_client = make_client(configuration->sourceRpcUrl(), timeout);
    auto relay_client = make_client(configuration->relayRpcUrl(), timeout);
    auto ethereum_client = make_client(configuration->ethereumRpcUrl(), timeout);
    for (const auto *client : {&source_client, &relay_client, &ethereum_client}) {
      if (not *client) {
        SL_ERROR(logger, "Can't create RPC client: {}", client->error());
        return EXIT_FAILURE;
      }
    }

    auto source = std::make_shared<pb::chain::SourceChainImpl>(
        std::move(source_client.value()));
    auto relay = std::make_shared<pb::chain::RelayChainImpl>(
        std::move(relay_client.value()));
    auto gateway = std::make_shared<pb::chain::GatewayImpl>(
        std::move(ethereum_client.value()),
        hasher,
        configuration->gatewayAddress());

    const auto &scanner_config = configuration->scannerConfig();
    pb::scanner::ScannerImpl scanner{
        scanner_config, source, relay, gateway, hasher};

    auto checkpoint = configuration->relayCheckpoint();
    if (not checkpoint.has_value()) {
      auto finalized = relay->finalizedBlockNumber();
      if (not finalized) {
        SL_ERROR(logger,
                 "Can't fetch finalized relay chain block: {}",
                 finalized.error());
        return EXIT_FAILURE;
      }
      checkpoint = finalized.value();
    }

    SL_INFO(logger,
            "Scanning channel {} of parachain {} at relay block #{}",
            scanner_config.channel_id,
            scanner_config.para_id,
            checkpoint.value());

    auto tasks = scanner.scan(checkpoint.value(), cancel_scan);
    if (not tasks) {
      SL_ERROR(logger, "Scan failed: {}", tasks.error());
      return EXIT_FAILURE;
    }

    if (tasks.value().empty()) {
      SL_INFO(logger, "No outstanding messages");
    }
    for (const auto &task : tasks.value()) {
      SL_INFO(logger,
              "Task: source block #{} ({}), nonces {}..{}, included at relay "
              "block #{}, {} parachain heads",
              task.header.number,
              task.header.hash(),
              task.proofs.front().message.nonce,
              task.proofs.back().message.nonce,
              task.proof_input->relay_block_number,
              task.proof_input->para_heads.size());
    }
    return EXIT_SUCCESS;
  }
}  // namespace

int main(int argc, const char **argv) {
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        parabridge::log::Configurator::getLogConfigFile(argc - 1, argv + 1);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<parabridge::log::Configurator>(
                  custom_log_config_path.value())
            : std::make_shared<parabridge::log::Configurator>();

    return std::make_shared<soralog::LoggingSystem>(std::move(configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  parabridge::log::setLoggingSystem(logging_system);

  auto exit_code = run_scan(argc, argv);

  auto logger = parabridge::log::createLogger(
      "Main", parabridge::log::defaultGroupName);
  logger->flush();

  return exit_code;
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
