/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scanner/nonce_reconciler.hpp"

#include <boost/assert.hpp>

#include "chain/scale_decode.hpp"
#include "chain/storage_keys.hpp"

namespace parabridge::scanner {

  NonceReconciler::NonceReconciler(
      std::shared_ptr<chain::SourceChain> source,
      std::shared_ptr<chain::DestinationChain> destination)
      : source_{std::move(source)},
        destination_{std::move(destination)},
        log_{log::createLogger("NonceReconciler", "scanner")} {
    BOOST_ASSERT(source_ != nullptr);
    BOOST_ASSERT(destination_ != nullptr);
  }

  ScanOutcome<primitives::Nonce> NonceReconciler::sourceNonce(
      primitives::ChannelId channel_id,
      const primitives::BlockHash &source_at) const {
    OUTCOME_TRY(stored,
                withContext(source_->storage(
                                chain::outboundQueueNonceKey(channel_id),
                                source_at),
                            "fetch outbound nonce of channel {} at {}",
                            channel_id,
                            source_at));
    if (not stored.has_value()) {
      return primitives::Nonce{0};
    }
    return withContext(chain::decodeScale<primitives::Nonce>(stored.value()),
                       "decode outbound nonce of channel {}",
                       channel_id);
  }

  ScanOutcome<std::optional<primitives::Nonce>> NonceReconciler::startingNonce(
      primitives::ChannelId channel_id,
      const primitives::BlockHash &source_at) const {
    OUTCOME_TRY(nonces,
                withContext(destination_->channelNonces(channel_id),
                            "fetch gateway nonces of channel {}",
                            channel_id));
    OUTCOME_TRY(source_nonce, sourceNonce(channel_id, source_at));

    SL_INFO(log_,
            "Channel {}: delivered nonce {}, committed nonce {}",
            channel_id,
            nonces.inbound,
            source_nonce);

    if (source_nonce <= nonces.inbound) {
      return std::nullopt;
    }
    return nonces.inbound + 1;
  }

}  // namespace parabridge::scanner
