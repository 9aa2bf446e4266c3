/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scanner/merkle_proof.hpp"

#include <gtest/gtest.h>

#include "crypto/hasher/hasher_impl.hpp"
#include "scanner/scanner_error.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/scanner/chain_fixture.hpp"

using namespace parabridge::scanner;
using parabridge::common::Buffer;
using parabridge::common::Hash256;
using parabridge::primitives::OutboundQueueMessage;
using testutil::buildMerkleProof;

namespace {
  Hash256 hash(std::string_view hex) {
    return Hash256::fromHex(hex).value();
  }
}  // namespace

class MerkleProofTest : public testing::Test {
 public:
  static std::vector<OutboundQueueMessage> makeMessages(size_t count) {
    std::vector<OutboundQueueMessage> messages;
    for (size_t i = 0; i < count; ++i) {
      messages.push_back(OutboundQueueMessage{
          .origin = 1000,
          .nonce = i + 1,
          .command = 0,
          .params = Buffer{static_cast<uint8_t>(i), 0xaa},
      });
    }
    return messages;
  }

  static std::vector<Hash256> leavesOf(
      const std::vector<OutboundQueueMessage> &messages) {
    std::vector<Hash256> leaves;
    for (const auto &message : messages) {
      leaves.push_back(testutil::messageLeaf(message));
    }
    return leaves;
  }

  std::shared_ptr<parabridge::crypto::HasherMock> hasher =
      testutil::ChainFixture::makeHasher();
};

/**
 * @given message with params shorter than a word
 * @when encode it as a leaf
 * @then the tuple offset, the head words and the padded params follow
 * each other
 */
TEST_F(MerkleProofTest, LeafEncoding) {
  auto encoded = encodeMessageLeaf(makeMessages(1).front());
  EXPECT_EQ(
      encoded,
      "0000000000000000000000000000000000000000000000000000000000000020"
      "00000000000000000000000000000000000000000000000000000000000003e8"
      "0000000000000000000000000000000000000000000000000000000000000001"
      "0000000000000000000000000000000000000000000000000000000000000000"
      "0000000000000000000000000000000000000000000000000000000000000080"
      "0000000000000000000000000000000000000000000000000000000000000002"
      "00aa000000000000000000000000000000000000000000000000000000000000"_unhex);

  OutboundQueueMessage empty{.origin = 1, .nonce = 2, .command = 3};
  EXPECT_EQ(encodeMessageLeaf(empty).size(), 6 * 32u);
}

/**
 * @given single message
 * @when compute the root from an empty proof
 * @then the root is the leaf itself
 */
TEST_F(MerkleProofTest, SingleLeaf) {
  auto leaf = "leaf"_hash256;
  EXPECT_EQ(computeMerkleRoot(*hasher, leaf, {}), leaf);

  auto message = makeMessages(1).front();
  auto proof = buildMerkleProof(leavesOf({message}), 0);
  EXPECT_OUTCOME_TRUE_1(
      verifyMessageProof(*hasher, proof, 0, message, proof.root));
}

/**
 * @given trees of sizes with odd levels
 * @when verify the proof of every message against the root
 * @then every proof is accepted
 */
TEST_F(MerkleProofTest, AllLeavesOfUnbalancedTrees) {
  for (size_t count : {2, 3, 5, 7}) {
    auto messages = makeMessages(count);
    auto leaves = leavesOf(messages);
    auto root = buildMerkleProof(leaves, 0).root;
    for (size_t i = 0; i < count; ++i) {
      auto proof = buildMerkleProof(leaves, i);
      EXPECT_EQ(computeMerkleRoot(*hasher, proof.leaf, proof.proof), root)
          << "leaf " << i << " of " << count;
      EXPECT_TRUE(
          verifyMessageProof(*hasher, proof, i, messages[i], root).has_value());
    }
  }
}

/**
 * @given pair of nodes
 * @when hash them in either order
 * @then the parent is the same
 */
TEST_F(MerkleProofTest, SortedPairs) {
  auto a = "a"_hash256;
  auto b = "b"_hash256;
  EXPECT_EQ(computeMerkleRoot(*hasher, a, {b}),
            computeMerkleRoot(*hasher, b, {a}));
}

/**
 * @given proof of message 1
 * @when verify it as the proof of message 2
 * @then PROOF_INVALID is returned
 */
TEST_F(MerkleProofTest, WrongIndex) {
  auto messages = makeMessages(4);
  auto proof = buildMerkleProof(leavesOf(messages), 1);

  EXPECT_EC(verifyMessageProof(*hasher, proof, 2, messages[2], proof.root),
            ScannerError::PROOF_INVALID);
}

/**
 * @given valid proof of the leaf at the index
 * @when verify it for a message with other params at that index
 * @then the leaf does not match the message, PROOF_INVALID
 */
TEST_F(MerkleProofTest, LeafOfAnotherMessage) {
  auto messages = makeMessages(3);
  auto proof = buildMerkleProof(leavesOf(messages), 1);
  auto stored = messages[1];
  stored.params = Buffer{0xde, 0xad};

  EXPECT_EC(verifyMessageProof(*hasher, proof, 1, stored, proof.root),
            ScannerError::PROOF_INVALID);
}

/**
 * @given proof claiming a leaf index beyond the number of leaves
 * @when verify it
 * @then PROOF_INVALID is returned
 */
TEST_F(MerkleProofTest, IndexBeyondLeaves) {
  auto messages = makeMessages(3);
  auto proof = buildMerkleProof(leavesOf(messages), 2);
  proof.number_of_leaves = 2;

  EXPECT_EC(verifyMessageProof(*hasher, proof, 2, messages[2], proof.root),
            ScannerError::PROOF_INVALID);
}

/**
 * @given proof with a tampered sibling
 * @when verify it
 * @then the path no longer leads to the claimed root, PROOF_INVALID
 */
TEST_F(MerkleProofTest, TamperedPath) {
  auto messages = makeMessages(5);
  auto proof = buildMerkleProof(leavesOf(messages), 3);
  proof.proof.front()[0] ^= 0x01;

  EXPECT_EC(verifyMessageProof(*hasher, proof, 3, messages[3], proof.root),
            ScannerError::PROOF_INVALID);
}

/**
 * @given consistent proof of another tree
 * @when verify it against the commitment of the block
 * @then PROOF_ROOT_MISMATCH is returned
 */
TEST_F(MerkleProofTest, RootMismatch) {
  auto messages = makeMessages(3);
  auto proof = buildMerkleProof(leavesOf(messages), 1);
  auto commitment = buildMerkleProof(leavesOf(makeMessages(4)), 1).root;

  EXPECT_OUTCOME_TRUE_1(
      verifyMessageProof(*hasher, proof, 1, messages[1], proof.root));
  EXPECT_EC(verifyMessageProof(*hasher, proof, 1, messages[1], commitment),
            ScannerError::PROOF_ROOT_MISMATCH);
}

/**
 * @given five messages hashed with keccak-256 into a sorted-pair tree,
 * with leaves, root and paths computed by an independent keccak
 * @when verify the proofs of a paired leaf and of the promoted last leaf
 * with the production hasher
 * @then leaves and roots match the fixed values and both proofs pass
 */
TEST(MerkleProofKeccakTest, FixedTree) {
  EXPECT_OUTCOME_TRUE(hasher, parabridge::crypto::HasherImpl::create());
  auto messages = MerkleProofTest::makeMessages(5);
  const auto root =
      hash("5592d6f4ab3f6a5ef0d9903c42ef98efbe76b0e1a661f992eaeeb186af8b372e");

  EXPECT_EQ(
      messageLeaf(*hasher, messages[0]),
      hash("14b1f634fb238f8ef367781d320746978e1938495f27e50c5f6b9efabc157e69"));

  parabridge::primitives::MerkleProof proof{
      .root = root,
      .proof =
          {hash("54ddcf8b26b88d84465db5ceda0399821e892ef8533f5abaf38818ca7fbbde35"),
           hash("6f0fe6097a4915a39ea3443774f9deb9bc5bf1609bf2ec9eab5ab37c9bb1414f"),
           hash("1d762121a657845f5287c0b7d3a1ce159da5bbc3998587ef4f4ad9ca8d37d569")},
      .number_of_leaves = 5,
      .leaf_index = 3,
      .leaf =
          hash("704c06dea687adeba6c2975002b8e74c1157f7860c4e553f81589b34432fc5e1"),
  };
  EXPECT_EQ(messageLeaf(*hasher, messages[3]), proof.leaf);
  EXPECT_OUTCOME_TRUE_1(
      verifyMessageProof(*hasher, proof, 3, messages[3], root));

  parabridge::primitives::MerkleProof last{
      .root = root,
      .proof =
          {hash("47ecebd1b30082501d5c868cdea132c448cbf08697823f398aa208c8e04aed2c")},
      .number_of_leaves = 5,
      .leaf_index = 4,
      .leaf =
          hash("1d762121a657845f5287c0b7d3a1ce159da5bbc3998587ef4f4ad9ca8d37d569"),
  };
  EXPECT_OUTCOME_TRUE_1(
      verifyMessageProof(*hasher, last, 4, messages[4], root));
}
