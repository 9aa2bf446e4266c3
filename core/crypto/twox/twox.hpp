/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace parabridge::crypto {

  common::Hash64 make_twox64(common::BufferView buf);

  common::Hash128 make_twox128(common::BufferView buf);

}  // namespace parabridge::crypto
