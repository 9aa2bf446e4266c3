/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "common/blob.hpp"
#include "primitives/common.hpp"
#include "scanner/scanner_config.hpp"

namespace parabridge::application {

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    /**
     * @return JSON-RPC endpoint of a source parachain node
     */
    virtual const std::string &sourceRpcUrl() const = 0;

    /**
     * @return JSON-RPC endpoint of a relay chain node
     */
    virtual const std::string &relayRpcUrl() const = 0;

    /**
     * @return JSON-RPC endpoint of an Ethereum execution node
     */
    virtual const std::string &ethereumRpcUrl() const = 0;

    /**
     * @return address of the gateway contract on Ethereum
     */
    virtual const common::Address &gatewayAddress() const = 0;

    virtual const scanner::ScannerConfig &scannerConfig() const = 0;

    /**
     * @return relay chain block to scan at; nullopt means the finalized head
     */
    virtual std::optional<primitives::BlockNumber> relayCheckpoint() const = 0;

    /**
     * @return timeout of a single RPC request
     */
    virtual std::chrono::milliseconds rpcTimeout() const = 0;

    /**
     * @return logging filters in the form `<group>=<level>`
     */
    virtual const std::vector<std::string> &log() const = 0;
  };

}  // namespace parabridge::application
