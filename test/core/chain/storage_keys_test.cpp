/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/storage_keys.hpp"

#include <gtest/gtest.h>

#include "crypto/twox/twox.hpp"
#include "testutil/literals.hpp"

using namespace parabridge::chain;
using parabridge::common::Buffer;
using parabridge::crypto::make_twox128;

/**
 * @given relay chain head table
 * @when build the prefix and the key of parachain 1000
 * @then they match the keys a relay chain node serves
 */
TEST(StorageKeys, ParasHeads) {
  EXPECT_EQ(parasHeadsPrefix(),
            "cd710b30bd2eab0352ddcc26417aa194"
            "1b3c252fcb29d88eff4f3de5de4476c3"_unhex);
  EXPECT_EQ(parasHeadsKey(1000),
            "cd710b30bd2eab0352ddcc26417aa194"
            "1b3c252fcb29d88eff4f3de5de4476c3"
            "b6ff6f7d467b87a9e8030000"_unhex);
}

/**
 * @given key of a parachain head
 * @when extract the parachain id back
 * @then the id is restored, foreign keys give nothing
 */
TEST(StorageKeys, ParaIdFromHeadsKey) {
  EXPECT_EQ(paraIdFromHeadsKey(parasHeadsKey(2000)), 2000u);
  EXPECT_EQ(paraIdFromHeadsKey(parasHeadsKey(0xdeadbeef)), 0xdeadbeefu);

  EXPECT_EQ(paraIdFromHeadsKey(parasHeadsPrefix()), std::nullopt);
  EXPECT_EQ(paraIdFromHeadsKey(outboundQueueNonceKey(1000)), std::nullopt);
}

/**
 * @given outbound queue and parachain system items
 * @when build their keys
 * @then plain keys are two twox128 halves, map keys append the
 * Twox64Concat of the little-endian id
 */
TEST(StorageKeys, SourceChainItems) {
  Buffer messages;
  messages.put(make_twox128("EthereumOutboundQueue"_buf))
      .put(make_twox128("Messages"_buf));
  EXPECT_EQ(outboundQueueMessagesKey(), messages);

  Buffer validation_data;
  validation_data.put(make_twox128("ParachainSystem"_buf))
      .put(make_twox128("ValidationData"_buf));
  EXPECT_EQ(validationDataKey(), validation_data);

  auto nonce_key = outboundQueueNonceKey(1000);
  ASSERT_EQ(nonce_key.size(), 32u + 8u + 4u);
  EXPECT_EQ(Buffer(nonce_key.begin(), nonce_key.begin() + 32),
            plainStorageKey("EthereumOutboundQueue", "Nonce"));
  EXPECT_EQ(Buffer(nonce_key.end() - 12, nonce_key.end()),
            "b6ff6f7d467b87a9e8030000"_unhex);
  EXPECT_NE(outboundQueueNonceKey(1000), outboundQueueNonceKey(1001));
}
