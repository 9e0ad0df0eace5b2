// VINDEX - Block Tests
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include <gtest/gtest.h>
#include "vindex/core/block.h"
#include "vindex/core/merkle.h"
#include "vindex/crypto/keys.h"

#include <stdexcept>
#include <vector>

using namespace vindex;
namespace RejectReason = vindex::consensus::RejectReason;

// ============================================================================
// Reward Schedule Tests
// ============================================================================

TEST(RewardScheduleTest, Halving) {
    RewardSchedule schedule;
    EXPECT_DOUBLE_EQ(schedule.BaseComponent(0), 10.0);
    EXPECT_DOUBLE_EQ(schedule.BaseComponent(209999), 10.0);
    EXPECT_DOUBLE_EQ(schedule.BaseComponent(210000), 5.0);
    EXPECT_DOUBLE_EQ(schedule.BaseComponent(420000), 2.5);
}

TEST(RewardScheduleTest, TxBonusIsCapped) {
    RewardSchedule schedule;
    EXPECT_NEAR(schedule.TxBonus(3), 0.3, 1e-12);
    EXPECT_DOUBLE_EQ(schedule.TxBonus(50), 5.0);
    EXPECT_DOUBLE_EQ(schedule.TxBonus(500), 5.0);
}

TEST(RewardScheduleTest, Compute) {
    RewardSchedule schedule;
    EXPECT_DOUBLE_EQ(schedule.Compute(1, 0, 0.0), 0.0);
    EXPECT_NEAR(schedule.Compute(1, 2, 0.05), 10.0 + 0.2 + 0.05, 1e-12);
    EXPECT_NEAR(schedule.Compute(210000, 1, 0.0), 5.1, 1e-12);
}

// ============================================================================
// Block Tests
// ============================================================================

class BlockTest : public ::testing::Test {
protected:
    static constexpr Timestamp NOW = 1700000000000;

    Block genesis;
    std::vector<Transaction> txs;
    std::string producerKey;

    void SetUp() override {
        genesis = Block::CreateGenesis(NOW - 10000);
        txs.push_back(Transaction::CreateAt("alice", "bob", 10.0, TxType::Transfer, TxPayload(), NOW));
        txs.push_back(Transaction::CreateAt("bob", "carol", 2000.0, TxType::Transfer, TxPayload(), NOW));
        producerKey = DeterministicKeyStore::DeriveKey("validator_1", KeyRole::Producer);
    }

    Block MakeBlock() const {
        return Block::Create(1, txs, genesis.GetHash(), "validator_1", NOW);
    }
};

TEST_F(BlockTest, Genesis) {
    EXPECT_TRUE(genesis.IsGenesis());
    EXPECT_EQ(genesis.GetIndex(), 0u);
    EXPECT_TRUE(genesis.GetPreviousHash().IsNull());
    EXPECT_TRUE(genesis.GetTransactions().empty());
    EXPECT_EQ(genesis.GetProducer(), GENESIS_PRODUCER);
    EXPECT_EQ(genesis.GetSignature(), GENESIS_SIGNATURE);
    EXPECT_DOUBLE_EQ(genesis.GetReward(), 0.0);
    EXPECT_EQ(genesis.GetHash(), genesis.ComputeHash());

    consensus::ValidationState state;
    EXPECT_TRUE(genesis.Check(state, NOW));
    EXPECT_EQ(genesis.ToJSON()["previousHash"].GetString(), "0");
}

TEST_F(BlockTest, CreateDerivesFields) {
    Block block = MakeBlock();
    Amount fees = txs[0].GetFee() + txs[1].GetFee();

    EXPECT_EQ(block.GetIndex(), 1u);
    EXPECT_EQ(block.GetPreviousHash(), genesis.GetHash());
    EXPECT_EQ(block.GetTransactionCount(), 2u);
    EXPECT_NEAR(block.GetTotalFees(), fees, 1e-12);
    EXPECT_NEAR(block.GetReward(), 10.0 + 0.2 + fees, 1e-9);
    EXPECT_EQ(block.GetMerkleRoot(), ComputeMerkleRoot(block.GetTransactionDigests()));
    EXPECT_EQ(block.GetHash(), block.ComputeHash());
    EXPECT_FALSE(block.IsSigned());
    EXPECT_EQ(block.FindTransaction(txs[1].GetId()), 1);
    EXPECT_EQ(block.FindTransaction("missing"), -1);

    consensus::ValidationState state;
    EXPECT_TRUE(block.Check(state, NOW)) << state.ToString();
}

TEST_F(BlockTest, EmptyBlockEarnsNothing) {
    Block block = Block::Create(5, {}, genesis.GetHash(), "validator_1", NOW);
    EXPECT_DOUBLE_EQ(block.GetReward(), 0.0);
    EXPECT_EQ(block.GetMerkleRoot(), ComputeMerkleRoot(std::vector<Hash256>()));
}

TEST_F(BlockTest, AddTransactionRederives) {
    Block block = Block::Create(1, {txs[0]}, genesis.GetHash(), "validator_1", NOW);
    Hash256 before = block.GetHash();

    consensus::ValidationState state;
    ASSERT_TRUE(block.AddTransaction(txs[1], state));
    EXPECT_EQ(block.GetTransactionCount(), 2u);
    EXPECT_NE(block.GetHash(), before);
    EXPECT_EQ(block.GetHash(), MakeBlock().GetHash());
}

TEST_F(BlockTest, SignedBlockIsFrozen) {
    Block block = MakeBlock();
    consensus::ValidationState state;
    ASSERT_TRUE(block.Sign(producerKey, state));
    ASSERT_TRUE(block.IsSigned());
    Hash256 hash = block.GetHash();

    Transaction extra = Transaction::CreateAt("carol", "dave", 1.0, TxType::Transfer, TxPayload(), NOW);
    EXPECT_FALSE(block.AddTransaction(extra, state));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::BLOCK_SIGNED);
    EXPECT_EQ(block.GetTransactionCount(), 2u);
    EXPECT_EQ(block.GetHash(), hash);

    // Re-signing with another key leaves the original signature in place
    const std::string signature = block.GetSignature();
    state.Reset();
    EXPECT_FALSE(block.Sign(DeterministicKeyStore::DeriveKey("validator_2", KeyRole::Producer),
                            state));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::BLOCK_SIGNED);
    EXPECT_EQ(block.GetSignature(), signature);
    EXPECT_TRUE(block.VerifySignature(producerKey));
}

TEST_F(BlockTest, SignatureVerification) {
    Block block = MakeBlock();
    EXPECT_FALSE(block.VerifySignature(producerKey));
    consensus::ValidationState state;
    ASSERT_TRUE(block.Sign(producerKey, state));
    EXPECT_TRUE(block.VerifySignature(producerKey));
    EXPECT_FALSE(block.VerifySignature(
        DeterministicKeyStore::DeriveKey("validator_2", KeyRole::Producer)));
}

TEST_F(BlockTest, SizeIsSerializedLength) {
    Block block = MakeBlock();
    consensus::ValidationState state;
    ASSERT_TRUE(block.Sign(producerKey, state));

    const size_t size = block.GetSize();
    EXPECT_EQ(size, block.ToJSON().ToJSON().size());
    EXPECT_GT(size, genesis.GetSize());

    Block restored = Block::FromJSON(util::JSONValue::Parse(block.ToJSON().ToJSON()));
    EXPECT_EQ(restored.GetSize(), size);
}

TEST_F(BlockTest, FutureTimestampRejected) {
    Block block = MakeBlock();
    consensus::ValidationState state;
    EXPECT_TRUE(block.Check(state, NOW - 60 * 1000));
    EXPECT_FALSE(block.Check(state, NOW - 60 * 1000 - 1));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::BLOCK_TIME_TOO_NEW);
}

// ============================================================================
// Tamper Detection Tests
// ============================================================================

TEST_F(BlockTest, JSONRoundTripStaysValid) {
    Block block = MakeBlock();
    consensus::ValidationState state;
    ASSERT_TRUE(block.Sign(producerKey, state));

    Block restored = Block::FromJSON(util::JSONValue::Parse(block.ToJSON().ToJSON()));
    EXPECT_EQ(restored.GetHash(), block.GetHash());
    EXPECT_EQ(restored.GetSignature(), block.GetSignature());
    EXPECT_EQ(restored.GetTransactions().size(), 2u);

    EXPECT_TRUE(restored.Check(state, NOW)) << state.ToString();
    EXPECT_TRUE(restored.VerifySignature(producerKey));
}

TEST_F(BlockTest, TamperedTransactionDetected) {
    util::JSONValue json = MakeBlock().ToJSON();
    util::JSONValue::Array transactions = json["transactions"].GetArray();
    transactions.front()["amount"] = 9999.0;
    json["transactions"] = util::JSONValue(std::move(transactions));

    Block tampered = Block::FromJSON(json);
    consensus::ValidationState state;
    EXPECT_FALSE(tampered.Check(state, NOW));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::BLOCK_BAD_MERKLE_ROOT);
}

TEST_F(BlockTest, TamperedFeesDetected) {
    util::JSONValue json = MakeBlock().ToJSON();
    json["totalFees"] = 0.0;

    Block tampered = Block::FromJSON(json);
    consensus::ValidationState state;
    EXPECT_FALSE(tampered.Check(state, NOW));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::BLOCK_BAD_STATE_ROOT);
}

TEST_F(BlockTest, TamperedRewardDetected) {
    util::JSONValue json = MakeBlock().ToJSON();
    json["reward"] = 1000.0;

    Block tampered = Block::FromJSON(json);
    consensus::ValidationState state;
    EXPECT_FALSE(tampered.Check(state, NOW));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::BLOCK_BAD_REWARD);
}

TEST_F(BlockTest, TamperedHashDetected) {
    util::JSONValue json = MakeBlock().ToJSON();
    json["hash"] = std::string(64, 'a');

    Block tampered = Block::FromJSON(json);
    consensus::ValidationState state;
    EXPECT_FALSE(tampered.Check(state, NOW));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::BLOCK_BAD_HASH);
}

TEST_F(BlockTest, FromJSONRejectsMissingFields) {
    util::JSONValue json = MakeBlock().ToJSON();
    json["merkleRoot"] = 42;
    EXPECT_THROW(Block::FromJSON(json), std::invalid_argument);
    EXPECT_THROW(Block::FromJSON(util::JSONValue()), std::invalid_argument);
}
