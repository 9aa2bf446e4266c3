/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <vector>

#include "primitives/common.hpp"
#include "scanner/scanner_error.hpp"
#include "scanner/types.hpp"

namespace parabridge::scanner {

  /**
   * Finds the messages of a channel which are committed on the source chain
   * but not delivered to the destination chain, and proves them.
   * Holds no state between scans, so a failed scan is retried from scratch.
   */
  class Scanner {
   public:
    virtual ~Scanner() = default;

    /**
     * @param relay_checkpoint finalized relay chain block; the source chain
     * state is taken from its parent
     * @param cancel checked between chain queries
     * @return complete tasks in ascending block and nonce order, or an error
     * and no tasks at all
     */
    virtual ScanOutcome<std::vector<Task>> scan(
        primitives::BlockNumber relay_checkpoint,
        const std::atomic_bool &cancel) const = 0;
  };

}  // namespace parabridge::scanner
