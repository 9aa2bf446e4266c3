/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scanner/scanner_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(parabridge::scanner, ScannerError, e) {
  using E = parabridge::scanner::ScannerError;
  switch (e) {
    case E::PARACHAIN_NOT_REGISTERED:
      return "Parachain is not registered on the relay chain";
    case E::MESSAGES_NOT_FOUND:
      return "Block has a commitment but no committed messages";
    case E::PROOF_NOT_FOUND:
      return "Source chain returned no proof for the message";
    case E::PROOF_ROOT_MISMATCH:
      return "Proof root does not match the commitment in the block digest";
    case E::PROOF_INVALID:
      return "Merkle proof is inconsistent";
    case E::MALFORMED_COMMITMENT_DIGEST:
      return "Commitment digest item is malformed";
    case E::VALIDATION_DATA_NOT_FOUND:
      return "Validation data is not found";
    case E::INCLUSION_NOT_FOUND:
      return "Scan terminated: block is not included within the "
             "finalization timeout";
    case E::LOOKBACK_EXCEEDED:
      return "Maximum look-back is exceeded";
    case E::INCOMPLETE_TASK:
      return "Task is incomplete";
    case E::CANCELLED:
      return "Scan is cancelled";
  }
  return "Unknown scanner error";
}
