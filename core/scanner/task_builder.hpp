/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <memory>
#include <vector>

#include "log/logger.hpp"
#include "scanner/inclusion_finder.hpp"

namespace parabridge::scanner {

  /**
   * Attaches the finality proof input to each task. Either every task is
   * completed or an error is returned, incomplete tasks are never released.
   */
  class TaskBuilder {
   public:
    explicit TaskBuilder(std::shared_ptr<InclusionFinder> inclusion_finder);

    ScanOutcome<std::vector<Task>> build(std::vector<Task> tasks,
                                         const std::atomic_bool &cancel) const;

    /// ScannerError::INCOMPLETE_TASK unless proofs and proof input are set
    static ScanOutcome<void> checkComplete(const Task &task);

   private:
    std::shared_ptr<InclusionFinder> inclusion_finder_;
    log::Logger log_;
  };

}  // namespace parabridge::scanner
