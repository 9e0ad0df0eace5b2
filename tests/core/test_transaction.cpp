// VINDEX - Transaction Tests
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include <gtest/gtest.h>
#include "vindex/core/transaction.h"
#include "vindex/crypto/keys.h"
#include "vindex/util/time.h"

#include <stdexcept>

using namespace vindex;
namespace RejectReason = vindex::consensus::RejectReason;

namespace {
constexpr Timestamp NOW = 1700000000000;
}

// ============================================================================
// Fee Policy Tests
// ============================================================================

TEST(FeeTest, TransferFee) {
    // base 0.001 + 0.01% of 100
    EXPECT_NEAR(CalculateFee(TxType::Transfer, 100.0), 0.011, 1e-12);
}

TEST(FeeTest, TypeMultipliers) {
    EXPECT_NEAR(CalculateFee(TxType::Stake, 500.0), 0.002 + 0.05, 1e-12);
    EXPECT_NEAR(CalculateFee(TxType::Unstake, 500.0), 0.003 + 0.05, 1e-12);
    EXPECT_NEAR(CalculateFee(TxType::Swap, 1000.0), 0.0015 + 0.1, 1e-12);
}

TEST(FeeTest, LargeAmountSurchargeOnExcessOnly) {
    // 0.001 + 2000 * 0.0001 + (2000 - 1000) * 0.0005
    EXPECT_NEAR(CalculateFee(TxType::Transfer, 2000.0), 0.701, 1e-12);
    EXPECT_NEAR(CalculateFee(TxType::Transfer, 1000.0), 0.101, 1e-12);
}

TEST(FeeTest, NeverBelowBaseFee) {
    EXPECT_GE(CalculateFee(TxType::Transfer, 0.0), BASE_FEE);
    EXPECT_GE(CalculateFee(TxType::Transfer, 1e-9), BASE_FEE);
}

TEST(TxTypeTest, StringRoundTrip) {
    for (TxType type : {TxType::Transfer, TxType::Stake, TxType::Unstake, TxType::Swap}) {
        auto parsed = TxTypeFromString(TxTypeToString(type));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, type);
    }
    EXPECT_FALSE(TxTypeFromString("mint").has_value());
}

// ============================================================================
// Construction Tests
// ============================================================================

TEST(TransactionTest, CreateAssignsIdAndFee) {
    Transaction tx = Transaction::CreateAt("alice", "bob", 100.0, TxType::Transfer,
                                           TxPayload(), NOW);
    EXPECT_EQ(tx.GetId().size(), 36u);
    EXPECT_EQ(tx.GetFrom(), "alice");
    EXPECT_EQ(tx.GetTo(), "bob");
    EXPECT_DOUBLE_EQ(tx.GetAmount(), 100.0);
    EXPECT_DOUBLE_EQ(tx.GetFee(), CalculateFee(TxType::Transfer, 100.0));
    EXPECT_EQ(tx.GetTimestamp(), NOW);
    EXPECT_FALSE(tx.IsSigned());
    EXPECT_DOUBLE_EQ(tx.GetTotalCost(), 100.0 + tx.GetFee());
}

TEST(TransactionTest, IdsAreUnique) {
    Transaction a = Transaction::CreateAt("alice", "bob", 1.0, TxType::Transfer, TxPayload(), NOW);
    Transaction b = Transaction::CreateAt("alice", "bob", 1.0, TxType::Transfer, TxPayload(), NOW);
    EXPECT_NE(a.GetId(), b.GetId());
    EXPECT_EQ(a.GetContentDigest(), b.GetContentDigest());
}

TEST(TransactionTest, StakeTargetDefaultsToRecipient) {
    Transaction direct = Transaction::CreateAt("alice", "validator_1", 200.0, TxType::Stake,
                                               TxPayload(), NOW);
    EXPECT_EQ(direct.GetStakeTarget(), "validator_1");

    TxPayload payload;
    payload.validator = "validator_2";
    Transaction viaPayload = Transaction::CreateAt("alice", "validator_1", 200.0, TxType::Stake,
                                                   payload, NOW);
    EXPECT_EQ(viaPayload.GetStakeTarget(), "validator_2");
}

// ============================================================================
// Validation Tests
// ============================================================================

class TransactionCheckTest : public ::testing::Test {
protected:
    consensus::ValidationState state;

    bool CheckAt(const Transaction& tx, Timestamp now = NOW) {
        state.Reset();
        return tx.Check(state, now);
    }
};

TEST_F(TransactionCheckTest, ValidTransfer) {
    Transaction tx = Transaction::CreateAt("alice", "bob", 10.0, TxType::Transfer, TxPayload(), NOW);
    EXPECT_TRUE(CheckAt(tx));
    EXPECT_TRUE(state.IsValid());
}

TEST_F(TransactionCheckTest, RejectsNonPositiveAmount) {
    Transaction zero = Transaction::CreateAt("alice", "bob", 0.0, TxType::Transfer, TxPayload(), NOW);
    EXPECT_FALSE(CheckAt(zero));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::TX_BAD_AMOUNT);

    Transaction negative = Transaction::CreateAt("alice", "bob", -5.0, TxType::Transfer, TxPayload(), NOW);
    EXPECT_FALSE(CheckAt(negative));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::TX_BAD_AMOUNT);
}

TEST_F(TransactionCheckTest, RejectsMissingParty) {
    Transaction tx = Transaction::CreateAt("", "bob", 10.0, TxType::Transfer, TxPayload(), NOW);
    EXPECT_FALSE(CheckAt(tx));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::TX_MISSING_FIELD);
}

TEST_F(TransactionCheckTest, SelfTransferOnlyForStake) {
    Transaction transfer = Transaction::CreateAt("alice", "alice", 10.0, TxType::Transfer,
                                                 TxPayload(), NOW);
    EXPECT_FALSE(CheckAt(transfer));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::TX_SELF_TRANSFER);

    Transaction selfBond = Transaction::CreateAt("alice", "alice", 500.0, TxType::Stake,
                                                 TxPayload(), NOW);
    EXPECT_TRUE(CheckAt(selfBond));
}

TEST_F(TransactionCheckTest, TimestampWindow) {
    TxLimits limits;
    Transaction tx = Transaction::CreateAt("alice", "bob", 10.0, TxType::Transfer, TxPayload(), NOW);

    // Ten minutes later is still inside the window, one more millisecond is not
    EXPECT_TRUE(CheckAt(tx, NOW + limits.maxAgeMs));
    EXPECT_FALSE(CheckAt(tx, NOW + limits.maxAgeMs + 1));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::TX_TOO_OLD);

    // Up to one minute of future drift is tolerated
    EXPECT_TRUE(CheckAt(tx, NOW - limits.maxFutureDriftMs));
    EXPECT_FALSE(CheckAt(tx, NOW - limits.maxFutureDriftMs - 1));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::TX_TIME_TOO_NEW);
}

TEST_F(TransactionCheckTest, StakeMinimum) {
    Transaction small = Transaction::CreateAt("alice", "validator_1", 99.0, TxType::Stake,
                                              TxPayload(), NOW);
    EXPECT_FALSE(CheckAt(small));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::STAKE_BELOW_MINIMUM);

    Transaction exact = Transaction::CreateAt("alice", "validator_1", 100.0, TxType::Stake,
                                              TxPayload(), NOW);
    EXPECT_TRUE(CheckAt(exact));
}

TEST_F(TransactionCheckTest, SwapPayload) {
    Transaction missing = Transaction::CreateAt("alice", "USDV-VDX", 10.0, TxType::Swap,
                                                TxPayload(), NOW);
    EXPECT_FALSE(CheckAt(missing));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::SWAP_BAD_PAYLOAD);

    TxPayload same;
    same.tokenA = "VDX";
    same.tokenB = "VDX";
    Transaction sameTokens = Transaction::CreateAt("alice", "pool", 10.0, TxType::Swap, same, NOW);
    EXPECT_FALSE(CheckAt(sameTokens));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::SWAP_BAD_PAYLOAD);

    TxPayload good;
    good.tokenA = "VDX";
    good.tokenB = "USDV";
    good.minAmountOut = 5.0;
    Transaction swap = Transaction::CreateAt("alice", "USDV-VDX", 10.0, TxType::Swap, good, NOW);
    EXPECT_TRUE(CheckAt(swap));
}

TEST(TransactionClockTest, IsValidUsesMockClock) {
    Transaction tx = Transaction::CreateAt("alice", "bob", 10.0, TxType::Transfer, TxPayload(), NOW);

    util::SetMockTimeMillis(NOW + 1000);
    util::EnableMockTime();
    EXPECT_TRUE(tx.IsValid());

    util::SetMockTimeMillis(NOW + 11 * 60 * 1000);
    EXPECT_FALSE(tx.IsValid());

    util::DisableMockTime();
}

// ============================================================================
// Signature Tests
// ============================================================================

TEST(TransactionSignatureTest, SignAndVerify) {
    const std::string key = DeterministicKeyStore::DeriveKey("alice", KeyRole::Account);
    Transaction tx = Transaction::CreateAt("alice", "bob", 10.0, TxType::Transfer, TxPayload(), NOW);

    EXPECT_FALSE(tx.VerifySignature(key));
    tx.Sign(key);
    EXPECT_TRUE(tx.IsSigned());
    EXPECT_EQ(tx.GetSignature().size(), 64u);
    EXPECT_TRUE(tx.VerifySignature(key));
    EXPECT_FALSE(tx.VerifySignature(DeterministicKeyStore::DeriveKey("bob", KeyRole::Account)));
}

TEST(TransactionSignatureTest, TamperedContentFailsVerification) {
    const std::string key = DeterministicKeyStore::DeriveKey("alice", KeyRole::Account);
    Transaction tx = Transaction::CreateAt("alice", "bob", 10.0, TxType::Transfer, TxPayload(), NOW);
    tx.Sign(key);

    util::JSONValue json = tx.ToJSON();
    json["amount"] = 10000.0;
    Transaction tampered = Transaction::FromJSON(json);
    EXPECT_FALSE(tampered.VerifySignature(key));
}

// ============================================================================
// Serialization Tests
// ============================================================================

TEST(TransactionJSONTest, RoundTrip) {
    TxPayload payload;
    payload.tokenA = "VDX";
    payload.tokenB = "USDV";
    payload.minAmountOut = 24.5;
    Transaction tx = Transaction::CreateAt("alice", "USDV-VDX", 10.0, TxType::Swap, payload, NOW);
    tx.Sign(DeterministicKeyStore::DeriveKey("alice", KeyRole::Account));

    const util::JSONValue json = tx.ToJSON();
    EXPECT_EQ(json["type"].GetString(), "swap");
    EXPECT_EQ(json["data"]["tokenA"].GetString(), "VDX");
    EXPECT_EQ(json["timestamp"].GetInt(), NOW);

    Transaction restored = Transaction::FromJSON(util::JSONValue::Parse(json.ToJSON()));
    EXPECT_EQ(restored, tx);
}

TEST(TransactionJSONTest, EmptyPayloadIsEmptyObject) {
    Transaction tx = Transaction::CreateAt("alice", "bob", 1.0, TxType::Transfer, TxPayload(), NOW);
    const util::JSONValue json = tx.ToJSON();
    ASSERT_TRUE(json["data"].IsObject());
    EXPECT_EQ(json["data"].Size(), 0u);
}

TEST(TransactionJSONTest, RejectsMalformed) {
    EXPECT_THROW(Transaction::FromJSON(util::JSONValue("tx")), std::invalid_argument);

    util::JSONValue json =
        Transaction::CreateAt("alice", "bob", 1.0, TxType::Transfer, TxPayload(), NOW).ToJSON();
    json["type"] = "mint";
    EXPECT_THROW(Transaction::FromJSON(json), std::invalid_argument);

    json["type"] = "transfer";
    json["amount"] = "lots";
    EXPECT_THROW(Transaction::FromJSON(json), std::invalid_argument);
}
