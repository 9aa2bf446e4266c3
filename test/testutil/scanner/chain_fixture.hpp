/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <map>
#include <set>

#include <gmock/gmock.h>
#include <scale/scale.hpp>

#include "chain/storage_keys.hpp"
#include "mock/core/chain/destination_chain_mock.hpp"
#include "mock/core/chain/relay_chain_mock.hpp"
#include "mock/core/chain/source_chain_mock.hpp"
#include "mock/core/crypto/hasher_mock.hpp"
#include "primitives/parachain.hpp"
#include "testutil/outcome/dummy_error.hpp"
#include "testutil/scanner/fake_keccak.hpp"

namespace testutil {

  /**
   * In-memory source parachain, relay chain and gateway, served through
   * the chain mocks.
   *
   * Source block `b` is built on relay parent `kRelayOffset + 2b` and
   * becomes the parachain head two relay blocks later, unless overridden.
   * Blocks with messages carry a commitment over all of their messages.
   */
  class ChainFixture {
   public:
    using BlockNumber = parabridge::primitives::BlockNumber;
    using BlockHash = parabridge::primitives::BlockHash;
    using ChannelId = parabridge::primitives::ChannelId;
    using Nonce = parabridge::primitives::Nonce;
    using Buffer = parabridge::common::Buffer;
    using Hash256 = parabridge::common::Hash256;
    using Message = parabridge::primitives::OutboundQueueMessage;

    static constexpr parabridge::primitives::ParachainId kParaId = 1000;
    static constexpr parabridge::primitives::ParachainId kOtherParaId = 2000;
    static constexpr BlockNumber kRelayOffset = 1000;

    explicit ChainFixture(BlockNumber best_block) : best_block_{best_block} {}

    /// Commits a message of the channel in the block, after those put before
    void emit(BlockNumber block, ChannelId channel, Nonce nonce) {
      messages_[block].push_back(Message{
          .origin = channel,
          .nonce = nonce,
          .command = 0,
          .params = Buffer{static_cast<uint8_t>(nonce),
                           static_cast<uint8_t>(channel)},
      });
      channels_.insert(channel);
    }

    void setDelivered(ChannelId channel, Nonce nonce) {
      delivered_[channel] = nonce;
      channels_.insert(channel);
    }

    void setInclusion(BlockNumber block,
                      BlockNumber relay_parent,
                      BlockNumber included_at) {
      inclusion_[block] = {relay_parent, included_at};
    }

    void overrideCommitment(BlockNumber block, Buffer digest_payload) {
      commitment_override_[block] = std::move(digest_payload);
    }

    /// Proof of the message is served for another message of the block
    void mixUpProof(BlockNumber block, uint64_t index, uint64_t served) {
      proof_swap_[{block, index}] = served;
    }

    /// Stored message list of the block holds other params at the index
    /// than the message committed in the tree
    void replaceStoredParams(BlockNumber block, uint64_t index, Buffer params) {
      stored_params_[{block, index}] = std::move(params);
    }

    void dropProof(BlockNumber block, uint64_t index) {
      dropped_proofs_.insert({block, index});
    }

    void dropMessages(BlockNumber block) {
      dropped_messages_.insert(block);
    }

    void dropValidationData(BlockNumber block) {
      dropped_validation_data_.insert(block);
    }

    static BlockHash sourceHash(BlockNumber number) {
      return makeHash(0x5a, number);
    }

    static BlockHash relayHash(BlockNumber number) {
      return makeHash(0x7e, number);
    }

    BlockNumber relayParent(BlockNumber block) const {
      if (auto it = inclusion_.find(block); it != inclusion_.end()) {
        return it->second.first;
      }
      return kRelayOffset + 2 * block;
    }

    BlockNumber includedAt(BlockNumber block) const {
      if (auto it = inclusion_.find(block); it != inclusion_.end()) {
        return it->second.second;
      }
      return relayParent(block) + 2;
    }

    /// Relay block whose parent has the best source block as the head
    BlockNumber relayCheckpoint() const {
      return includedAt(best_block_) + 1;
    }

    std::vector<Message> messages(BlockNumber block) const {
      if (auto it = messages_.find(block); it != messages_.end()) {
        return it->second;
      }
      return {};
    }

    std::vector<Hash256> leaves(BlockNumber block) const {
      std::vector<Hash256> result;
      for (const auto &message : messages(block)) {
        result.push_back(messageLeaf(message));
      }
      return result;
    }

    Hash256 commitment(BlockNumber block) const {
      auto block_leaves = leaves(block);
      return buildMerkleProof(block_leaves, 0).root;
    }

    parabridge::primitives::BlockHeader sourceHeader(
        BlockNumber number) const {
      using namespace parabridge::primitives;
      BlockHeader header{
          .number = number,
          .parent_hash = number > 0 ? sourceHash(number - 1) : BlockHash{},
          .state_root = makeHash(0x51, number),
          .extrinsics_root = makeHash(0xe1, number),
      };
      PreRuntime pre_runtime;
      pre_runtime.consensus_engine_id = ConsensusEngineId{{'a', 'u', 'r', 'a'}};
      pre_runtime.data = Buffer{0x01, 0x02};
      header.digest.emplace_back(std::move(pre_runtime));

      if (auto it = commitment_override_.find(number);
          it != commitment_override_.end()) {
        header.digest.emplace_back(Other{it->second});
      } else if (not messages(number).empty()) {
        Buffer payload;
        payload.putUint8(0x00).put(commitment(number));
        header.digest.emplace_back(Other{std::move(payload)});
      }

      Seal seal;
      seal.consensus_engine_id = ConsensusEngineId{{'a', 'u', 'r', 'a'}};
      seal.data = Buffer(64, 0xcc);
      header.digest.emplace_back(std::move(seal));
      header.hash_opt = sourceHash(number);
      return header;
    }

    /// Source block which is the parachain head at the relay block: the
    /// one included last by then
    std::optional<BlockNumber> headAt(BlockNumber relay_number) const {
      std::optional<BlockNumber> head;
      for (BlockNumber block = 0; block <= best_block_; ++block) {
        if (includedAt(block) <= relay_number
            and (not head or includedAt(block) >= includedAt(*head))) {
          head = block;
        }
      }
      return head;
    }

    /// Serves the chains through the mocks
    void attach(parabridge::chain::SourceChainMock &source,
                parabridge::chain::RelayChainMock &relay,
                parabridge::chain::DestinationChainMock &destination) const {
      using ::testing::_;
      using ::testing::Invoke;
      namespace chain = parabridge::chain;
      namespace primitives = parabridge::primitives;

      ON_CALL(source, blockHash(_))
          .WillByDefault(
              Invoke([this](BlockNumber n) -> outcome::result<BlockHash> {
                if (n > best_block_) {
                  return DummyError::ERROR;
                }
                return sourceHash(n);
              }));
      ON_CALL(source, header(_))
          .WillByDefault(Invoke(
              [this](const BlockHash &hash)
                  -> outcome::result<primitives::BlockHeader> {
                auto number = sourceNumber(hash);
                if (not number) {
                  return DummyError::ERROR;
                }
                return sourceHeader(*number);
              }));
      ON_CALL(source, storage(_, _))
          .WillByDefault(Invoke(
              [this](const Buffer &key, const BlockHash &at)
                  -> outcome::result<std::optional<Buffer>> {
                auto number = sourceNumber(at);
                if (not number) {
                  return DummyError::ERROR;
                }
                return sourceStorage(key, *number);
              }));
      ON_CALL(source, proveMessage(_, _))
          .WillByDefault(Invoke(
              [this](uint64_t index, const BlockHash &at)
                  -> outcome::result<std::optional<primitives::MerkleProof>> {
                auto number = sourceNumber(at);
                if (not number) {
                  return DummyError::ERROR;
                }
                return prove(*number, index);
              }));

      ON_CALL(relay, blockHash(_))
          .WillByDefault(Invoke(
              [](BlockNumber n) -> outcome::result<BlockHash> {
                return relayHash(n);
              }));
      ON_CALL(relay, finalizedBlockNumber())
          .WillByDefault(Invoke([this]() -> outcome::result<BlockNumber> {
            return relayCheckpoint();
          }));
      ON_CALL(relay, parachainHead(_, _))
          .WillByDefault(Invoke(
              [this](primitives::ParachainId para_id, const BlockHash &at)
                  -> outcome::result<std::optional<primitives::BlockHeader>> {
                if (para_id != kParaId) {
                  return std::nullopt;
                }
                auto head = headAt(relayNumber(at));
                if (not head) {
                  return std::nullopt;
                }
                return sourceHeader(*head);
              }));
      ON_CALL(relay, parachainHeads(_))
          .WillByDefault(Invoke(
              [this](const BlockHash &at)
                  -> outcome::result<std::vector<primitives::ParaHead>> {
                return paraHeads(relayNumber(at));
              }));

      ON_CALL(destination, channelNonces(_))
          .WillByDefault(Invoke(
              [this](ChannelId channel)
                  -> outcome::result<chain::ChannelNonces> {
                auto it = delivered_.find(channel);
                return chain::ChannelNonces{
                    .inbound = it == delivered_.end() ? 0 : it->second,
                    .outbound = 0,
                };
              }));
    }

    std::vector<parabridge::primitives::ParaHead> paraHeads(
        BlockNumber relay_number) const {
      std::vector<parabridge::primitives::ParaHead> heads;
      if (auto head = headAt(relay_number)) {
        auto header = sourceHeader(*head);
        heads.push_back({kParaId, Buffer{::scale::encode(header).value()}});
      }
      heads.push_back({kOtherParaId, Buffer{0xab, 0xcd}});
      return heads;
    }

    /// Hasher whose keccak is the fake one the fixture commits with
    static std::shared_ptr<parabridge::crypto::HasherMock> makeHasher() {
      auto hasher = std::make_shared<
          ::testing::NiceMock<parabridge::crypto::HasherMock>>();
      ON_CALL(*hasher, keccak_256(::testing::_))
          .WillByDefault(::testing::Invoke(
              [](parabridge::common::BufferView data) {
                return fakeKeccak(data);
              }));
      return hasher;
    }

   private:
    static Hash256 makeHash(uint8_t tag, BlockNumber number) {
      Hash256 hash;
      hash[0] = tag;
      for (size_t i = 0; i < sizeof(number); ++i) {
        hash[hash.size() - 1 - i] = static_cast<uint8_t>(number >> (8 * i));
      }
      return hash;
    }

    static BlockNumber numberOf(const Hash256 &hash) {
      BlockNumber number = 0;
      for (size_t i = 0; i < sizeof(number); ++i) {
        number |= static_cast<BlockNumber>(hash[hash.size() - 1 - i])
               << (8 * i);
      }
      return number;
    }

    std::optional<BlockNumber> sourceNumber(const BlockHash &hash) const {
      auto number = numberOf(hash);
      if (hash != sourceHash(number) or number > best_block_) {
        return std::nullopt;
      }
      return number;
    }

    static BlockNumber relayNumber(const BlockHash &hash) {
      return numberOf(hash);
    }

    std::optional<Buffer> sourceStorage(const Buffer &key,
                                        BlockNumber number) const {
      namespace chain = parabridge::chain;
      if (key == chain::outboundQueueMessagesKey()) {
        if (dropped_messages_.contains(number)) {
          return std::nullopt;
        }
        auto stored = messages(number);
        for (uint64_t index = 0; index < stored.size(); ++index) {
          if (auto it = stored_params_.find({number, index});
              it != stored_params_.end()) {
            stored[index].params = it->second;
          }
        }
        return Buffer{::scale::encode(stored).value()};
      }
      if (key == chain::validationDataKey()) {
        if (dropped_validation_data_.contains(number)) {
          return std::nullopt;
        }
        parabridge::primitives::PersistedValidationData data{
            .parent_head = Buffer{0x00},
            .relay_parent_number = relayParent(number),
            .relay_parent_storage_root = makeHash(0x55, relayParent(number)),
            .max_pov_size = 5 * 1024 * 1024,
        };
        return Buffer{::scale::encode(data).value()};
      }
      for (auto channel : channels_) {
        if (key == chain::outboundQueueNonceKey(channel)) {
          return committedNonce(channel, number);
        }
      }
      return std::nullopt;
    }

    /// Largest nonce of the channel committed up to the block
    std::optional<Buffer> committedNonce(ChannelId channel,
                                         BlockNumber number) const {
      std::optional<Nonce> last;
      for (const auto &[block, list] : messages_) {
        if (block > number) {
          break;
        }
        for (const auto &message : list) {
          if (message.origin == channel) {
            last = std::max(last.value_or(0), message.nonce);
          }
        }
      }
      if (not last) {
        return std::nullopt;
      }
      return Buffer{::scale::encode(*last).value()};
    }

    std::optional<parabridge::primitives::MerkleProof> prove(
        BlockNumber number, uint64_t index) const {
      if (dropped_proofs_.contains({number, index})) {
        return std::nullopt;
      }
      auto block_leaves = leaves(number);
      if (auto it = proof_swap_.find({number, index});
          it != proof_swap_.end()) {
        index = it->second;
      }
      if (index >= block_leaves.size()) {
        return std::nullopt;
      }
      return buildMerkleProof(block_leaves, index);
    }

    BlockNumber best_block_;
    std::map<BlockNumber, std::vector<Message>> messages_;
    std::map<ChannelId, Nonce> delivered_;
    std::set<ChannelId> channels_;
    std::map<BlockNumber, std::pair<BlockNumber, BlockNumber>> inclusion_;
    std::map<BlockNumber, Buffer> commitment_override_;
    std::map<std::pair<BlockNumber, uint64_t>, uint64_t> proof_swap_;
    std::map<std::pair<BlockNumber, uint64_t>, Buffer> stored_params_;
    std::set<std::pair<BlockNumber, uint64_t>> dropped_proofs_;
    std::set<BlockNumber> dropped_messages_;
    std::set<BlockNumber> dropped_validation_data_;
  };

}  // namespace testutil
