/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scanner/inclusion_finder.hpp"

#include <algorithm>
#include <limits>

#include <boost/assert.hpp>

#include "chain/scale_decode.hpp"
#include "chain/storage_keys.hpp"

namespace parabridge::scanner {

  InclusionFinder::InclusionFinder(std::shared_ptr<chain::SourceChain> source,
                                   std::shared_ptr<chain::RelayChain> relay,
                                   primitives::ParachainId para_id,
                                   uint32_t finalization_timeout)
      : source_{std::move(source)},
        relay_{std::move(relay)},
        para_id_{para_id},
        finalization_timeout_{finalization_timeout},
        log_{log::createLogger("InclusionFinder", "scanner")} {
    BOOST_ASSERT(source_ != nullptr);
    BOOST_ASSERT(relay_ != nullptr);
  }

  ScanOutcome<primitives::BlockNumber> InclusionFinder::findInclusionBlock(
      const primitives::BlockHeader &source_header,
      const std::atomic_bool &cancel) const {
    const auto &source_hash = source_header.hash();
    OUTCOME_TRY(stored,
                withContext(source_->storage(chain::validationDataKey(),
                                             source_hash),
                            "fetch validation data at {}",
                            source_hash));
    if (not stored.has_value()) {
      return ScanError{ScannerError::VALIDATION_DATA_NOT_FOUND,
                       fmt::format("at {}", source_hash)};
    }
    OUTCOME_TRY(validation_data,
                withContext(chain::decodeScale<
                                primitives::PersistedValidationData>(
                                stored.value()),
                            "decode validation data at {}",
                            source_hash));

    const auto relay_parent = validation_data.relay_parent_number;
    SL_DEBUG(log_,
             "Source block #{} is backed on relay parent #{}",
             source_header.number,
             relay_parent);

    // window end in 64 bits, relay numbers stop at the last 32-bit one
    const uint64_t last_number =
        std::min<uint64_t>(uint64_t{relay_parent} + finalization_timeout_,
                           std::numeric_limits<primitives::BlockNumber>::max());
    for (uint64_t next = uint64_t{relay_parent} + 1; next <= last_number;
         ++next) {
      const auto number = static_cast<primitives::BlockNumber>(next);
      if (cancel) {
        return ScanError{ScannerError::CANCELLED,
                         fmt::format("check relay block #{}", number)};
      }
      OUTCOME_TRY(relay_hash,
                  withContext(relay_->blockHash(number),
                              "fetch hash of relay block #{}",
                              number));
      OUTCOME_TRY(head,
                  withContext(relay_->parachainHead(para_id_, relay_hash),
                              "fetch head of parachain {} at relay block #{}",
                              para_id_,
                              number));
      if (not head.has_value()) {
        return ScanError{
            ScannerError::PARACHAIN_NOT_REGISTERED,
            fmt::format("parachain {} at relay block #{}", para_id_, number)};
      }
      if (head->number == source_header.number) {
        SL_DEBUG(log_,
                 "Source block #{} is included in relay block #{}",
                 source_header.number,
                 number);
        return number;
      }
    }

    return ScanError{ScannerError::INCLUSION_NOT_FOUND,
                     fmt::format("source block #{} not included in relay "
                                 "blocks #{}..#{}",
                                 source_header.number,
                                 uint64_t{relay_parent} + 1,
                                 last_number)};
  }

  ScanOutcome<ProofInput> InclusionFinder::gatherProofInput(
      primitives::BlockNumber relay_block_number) const {
    OUTCOME_TRY(relay_hash,
                withContext(relay_->blockHash(relay_block_number),
                            "fetch hash of relay block #{}",
                            relay_block_number));
    OUTCOME_TRY(heads,
                withContext(relay_->parachainHeads(relay_hash),
                            "fetch parachain heads at relay block #{}",
                            relay_block_number));
    SL_DEBUG(log_,
             "Gathered {} parachain heads at relay block #{}",
             heads.size(),
             relay_block_number);
    return ProofInput{
        .para_id = para_id_,
        .relay_block_number = relay_block_number,
        .para_heads = std::move(heads),
    };
  }

}  // namespace parabridge::scanner
