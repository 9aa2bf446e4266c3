/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/chain_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(parabridge::chain, ChainError, e) {
  using E = parabridge::chain::ChainError;
  switch (e) {
    case E::RPC_ERROR:
      return "JSON-RPC call returned an error";
    case E::BAD_RESPONSE:
      return "Unexpected JSON-RPC response";
    case E::DECODE_FAILED:
      return "Failed to decode chain data";
    case E::HTTP_ERROR:
      return "HTTP request failed";
    case E::INVALID_URI:
      return "Invalid endpoint URI";
    case E::VALUE_OUT_OF_RANGE:
      return "Value is out of range";
  }
  return "Unknown chain error";
}
