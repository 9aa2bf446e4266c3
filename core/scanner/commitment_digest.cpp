/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scanner/commitment_digest.hpp"

#include "scanner/scanner_error.hpp"

namespace parabridge::scanner {

  outcome::result<std::optional<common::Hash256>> extractCommitment(
      const primitives::Digest &digest) {
    for (const auto &item : digest) {
      const auto *other = boost::get<primitives::Other>(&item);
      if (other == nullptr or other->data.empty()
          or other->data[0] != kCommitmentDigestPrefix) {
        continue;
      }
      auto payload = other->data.view();
      payload.dropFirst(1);
      if (payload.size() != common::Hash256::size()) {
        return ScannerError::MALFORMED_COMMITMENT_DIGEST;
      }
      OUTCOME_TRY(commitment, common::Hash256::fromSpan(payload));
      return commitment;
    }
    return std::nullopt;
  }

}  // namespace parabridge::scanner
