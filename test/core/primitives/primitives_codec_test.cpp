/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <scale/scale.hpp>

#include "chain/chain_error.hpp"
#include "chain/scale_decode.hpp"
#include "primitives/block_header.hpp"
#include "primitives/outbound_queue.hpp"
#include "primitives/parachain.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using parabridge::chain::ChainError;
using parabridge::chain::decodeScale;
using parabridge::common::Buffer;
using parabridge::common::Hash256;
using parabridge::primitives::BlockHeader;
using parabridge::primitives::ConsensusEngineId;
using parabridge::primitives::DigestItem;
using parabridge::primitives::Other;
using parabridge::primitives::OutboundQueueMessage;
using parabridge::primitives::PersistedValidationData;
using parabridge::primitives::PreRuntime;
using parabridge::primitives::RuntimeEnvironmentUpdated;
using parabridge::primitives::Seal;

/**
 * @class Primitives is a test fixture which contains useful data
 */
class Primitives : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  BlockHeader makeHeader() const {
    BlockHeader header{
        .number = 5,
        .parent_hash = "parent"_hash256,
        .state_root = "state"_hash256,
        .extrinsics_root = "extrinsics"_hash256,
    };
    PreRuntime pre_runtime;
    pre_runtime.consensus_engine_id = ConsensusEngineId{{'a', 'u', 'r', 'a'}};
    pre_runtime.data = Buffer{0x01, 0x02};
    header.digest.emplace_back(std::move(pre_runtime));
    header.digest.emplace_back(Other{Buffer{0x00, 0xaa}});
    header.digest.emplace_back(RuntimeEnvironmentUpdated{});
    return header;
  }
};

/**
 * @given digest items of every kind the source chain puts in headers
 * @when encode them
 * @then tags and payloads follow the runtime enum layout
 */
TEST_F(Primitives, EncodeDigestItems) {
  PreRuntime pre_runtime;
  pre_runtime.consensus_engine_id = ConsensusEngineId{{'a', 'u', 'r', 'a'}};
  pre_runtime.data = Buffer{0x01, 0x02};
  Seal seal;
  seal.consensus_engine_id = ConsensusEngineId{{'a', 'u', 'r', 'a'}};
  seal.data = Buffer{0xff};

  EXPECT_OUTCOME_TRUE(other_bytes,
                      scale::encode(DigestItem{Other{Buffer{0x00, 0xaa}}}));
  EXPECT_EQ(Buffer{other_bytes}, "0008" "00aa"_unhex);

  EXPECT_OUTCOME_TRUE(pre_runtime_bytes,
                      scale::encode(DigestItem{pre_runtime}));
  EXPECT_EQ(Buffer{pre_runtime_bytes}, "06" "61757261" "08" "0102"_unhex);

  EXPECT_OUTCOME_TRUE(seal_bytes, scale::encode(DigestItem{seal}));
  EXPECT_EQ(Buffer{seal_bytes}, "05" "61757261" "04" "ff"_unhex);

  EXPECT_OUTCOME_TRUE(updated_bytes,
                      scale::encode(DigestItem{RuntimeEnvironmentUpdated{}}));
  EXPECT_EQ(Buffer{updated_bytes}, "08"_unhex);
}

/**
 * @given header with a digest
 * @when encode and decode it
 * @then the number is compact-encoded after the parent hash and the decoded
 * header equals the original
 */
TEST_F(Primitives, EncodeDecodeBlockHeader) {
  auto header = makeHeader();

  EXPECT_OUTCOME_TRUE(bytes, scale::encode(header));
  ASSERT_GT(bytes.size(), 33u);
  EXPECT_EQ(bytes[32], 0x14);

  EXPECT_OUTCOME_TRUE(decoded, decodeScale<BlockHeader>(bytes));
  EXPECT_EQ(decoded, header);
  EXPECT_FALSE(decoded.hash_opt.has_value());
}

/**
 * @given digest item with an unknown tag
 * @when decode it
 * @then decoding fails
 */
TEST_F(Primitives, DecodeUnknownDigestItem) {
  EXPECT_EC(decodeScale<DigestItem>("0300"_unhex), ChainError::DECODE_FAILED);
}

/**
 * @given valid encoding of a value followed by an extra byte
 * @when decode it
 * @then trailing bytes are rejected
 */
TEST_F(Primitives, DecodeTrailingBytes) {
  auto bytes = "2a00000000000000"_unhex;
  EXPECT_OUTCOME_TRUE(nonce, decodeScale<uint64_t>(bytes));
  EXPECT_EQ(nonce, 42u);

  bytes.putUint8(0);
  EXPECT_EC(decodeScale<uint64_t>(bytes), ChainError::DECODE_FAILED);
}

/**
 * @given outbound queue message
 * @when encode it
 * @then fields follow in declaration order, params length-prefixed
 */
TEST_F(Primitives, EncodeOutboundQueueMessage) {
  OutboundQueueMessage message{
      .origin = 1000,
      .nonce = 7,
      .command = 2,
      .params = Buffer{0xbe, 0xef},
  };
  EXPECT_OUTCOME_TRUE(bytes, scale::encode(message));
  EXPECT_EQ(Buffer{bytes},
            "e8030000" "0700000000000000" "02" "08" "beef"_unhex);
}

/**
 * @given encoded persisted validation data
 * @when decode it
 * @then relay parent number is read after the parent head
 */
TEST_F(Primitives, DecodeValidationData) {
  auto bytes = "08" "abcd" "f4010000"_unhex;
  bytes.put(Hash256{});
  bytes.put("00005000"_unhex);

  EXPECT_OUTCOME_TRUE(data, decodeScale<PersistedValidationData>(bytes));
  EXPECT_EQ(data.parent_head, "abcd"_unhex);
  EXPECT_EQ(data.relay_parent_number, 500u);
  EXPECT_EQ(data.max_pov_size, 5u * 1024 * 1024);
}
