/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "crypto/hasher.hpp"
#include "outcome/outcome.hpp"

struct evp_md_st;

namespace parabridge::crypto {

  enum class HasherError {
    KECCAK_UNAVAILABLE = 1,
  };

  class HasherImpl : public Hasher {
   public:
    /**
     * Fetches the Keccak-256 digest from OpenSSL (available since 3.2);
     * fails if the linked libcrypto does not provide it
     */
    static outcome::result<std::shared_ptr<HasherImpl>> create();

    ~HasherImpl() override = default;

    Hash64 twox_64(common::BufferView data) const override;

    Hash128 twox_128(common::BufferView data) const override;

    Hash256 keccak_256(common::BufferView data) const override;

   private:
    struct MdDeleter {
      void operator()(evp_md_st *md) const;
    };

    explicit HasherImpl(std::unique_ptr<evp_md_st, MdDeleter> keccak);

    std::unique_ptr<evp_md_st, MdDeleter> keccak_;
  };

}  // namespace parabridge::crypto

OUTCOME_HPP_DECLARE_ERROR(parabridge::crypto, HasherError);
