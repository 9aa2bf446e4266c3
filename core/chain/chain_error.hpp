/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace parabridge::chain {
  /// Failures of the chain connections, independent of which chain is queried
  enum class ChainError {
    RPC_ERROR = 1,       ///< node answered with a JSON-RPC error object
    BAD_RESPONSE,        ///< response is not the JSON shape we expect
    DECODE_FAILED,       ///< hex, SCALE or ABI payload could not be decoded
    HTTP_ERROR,          ///< transport failed or non-2xx status
    INVALID_URI,         ///< endpoint URL is not usable
    VALUE_OUT_OF_RANGE,  ///< number does not fit the target type
  };
}  // namespace parabridge::chain

OUTCOME_HPP_DECLARE_ERROR(parabridge::chain, ChainError);
