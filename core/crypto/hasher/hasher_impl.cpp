/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include <boost/assert.hpp>
#include <openssl/evp.h>

#include "crypto/twox/twox.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(parabridge::crypto, HasherError, e) {
  using E = parabridge::crypto::HasherError;
  switch (e) {
    case E::KECCAK_UNAVAILABLE:
      return "KECCAK-256 digest is not provided by the linked OpenSSL";
  }
  return "Unknown HasherError";
}

namespace parabridge::crypto {
  using common::Hash128;
  using common::Hash256;
  using common::Hash64;

  void HasherImpl::MdDeleter::operator()(evp_md_st *md) const {
    EVP_MD_free(md);
  }

  outcome::result<std::shared_ptr<HasherImpl>> HasherImpl::create() {
    std::unique_ptr<evp_md_st, MdDeleter> keccak{
        EVP_MD_fetch(nullptr, "KECCAK-256", nullptr)};
    if (not keccak) {
      return HasherError::KECCAK_UNAVAILABLE;
    }
    return std::shared_ptr<HasherImpl>(new HasherImpl(std::move(keccak)));
  }

  HasherImpl::HasherImpl(std::unique_ptr<evp_md_st, MdDeleter> keccak)
      : keccak_{std::move(keccak)} {}

  Hash64 HasherImpl::twox_64(common::BufferView data) const {
    return make_twox64(data);
  }

  Hash128 HasherImpl::twox_128(common::BufferView data) const {
    return make_twox128(data);
  }

  Hash256 HasherImpl::keccak_256(common::BufferView data) const {
    Hash256 out;
    unsigned int size = 0;
    [[maybe_unused]] auto ok = EVP_Digest(
        data.data(), data.size(), out.data(), &size, keccak_.get(), nullptr);
    BOOST_ASSERT(ok == 1 and size == out.size());
    return out;
  }
}  // namespace parabridge::crypto
