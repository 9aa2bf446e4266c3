/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scanner/task_builder.hpp"

#include <boost/assert.hpp>

namespace parabridge::scanner {

  TaskBuilder::TaskBuilder(std::shared_ptr<InclusionFinder> inclusion_finder)
      : inclusion_finder_{std::move(inclusion_finder)},
        log_{log::createLogger("TaskBuilder", "scanner")} {
    BOOST_ASSERT(inclusion_finder_ != nullptr);
  }

  ScanOutcome<void> TaskBuilder::checkComplete(const Task &task) {
    if (task.proofs.empty() or not task.proof_input.has_value()) {
      return ScanError{
          ScannerError::INCOMPLETE_TASK,
          fmt::format("task of source block #{} has {} proofs and {}",
                      task.header.number,
                      task.proofs.size(),
                      task.proof_input ? "proof input" : "no proof input")};
    }
    return outcome::success();
  }

  ScanOutcome<std::vector<Task>> TaskBuilder::build(
      std::vector<Task> tasks, const std::atomic_bool &cancel) const {
    for (auto &task : tasks) {
      if (cancel) {
        return ScanError{ScannerError::CANCELLED,
                         fmt::format("build task of source block #{}",
                                     task.header.number)};
      }
      OUTCOME_TRY(relay_block_number,
                  withContext(
                      inclusion_finder_->findInclusionBlock(task.header, cancel),
                      "find inclusion block for parachain block {}",
                      task.header.number));
      OUTCOME_TRY(proof_input,
                  withContext(
                      inclusion_finder_->gatherProofInput(relay_block_number),
                      "gather proof input for parachain block {}",
                      task.header.number));
      task.proof_input = std::move(proof_input);
    }

    for (const auto &task : tasks) {
      OUTCOME_TRY(checkComplete(task));
    }
    SL_DEBUG(log_, "Built {} tasks", tasks.size());
    return tasks;
  }

}  // namespace parabridge::scanner
