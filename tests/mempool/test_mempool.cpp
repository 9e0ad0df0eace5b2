// VINDEX - Mempool Tests
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include <gtest/gtest.h>
#include "vindex/mempool/mempool.h"

#include <string>
#include <utility>
#include <vector>

using namespace vindex;
namespace RejectReason = vindex::consensus::RejectReason;

// ============================================================================
// Test Fixture
// ============================================================================

class MempoolTest : public ::testing::Test {
protected:
    static constexpr Timestamp NOW = 1700000000000;

    Mempool pool;
    consensus::ValidationState state;

    Transaction MakeTx(const Address& from, const Address& to, Amount amount,
                       Timestamp timestamp = NOW) {
        return Transaction::CreateAt(from, to, amount, TxType::Transfer, TxPayload(), timestamp);
    }

    bool Add(const Transaction& tx) {
        state.Reset();
        return pool.AddTx(tx, state);
    }
};

// ============================================================================
// Admission
// ============================================================================

TEST_F(MempoolTest, AddAndQuery) {
    EXPECT_TRUE(pool.Empty());

    Transaction tx = MakeTx("alice", "bob", 10.0);
    ASSERT_TRUE(Add(tx));
    EXPECT_EQ(pool.Size(), 1u);
    EXPECT_TRUE(pool.Exists(tx.GetId()));

    auto stored = pool.Get(tx.GetId());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, tx);
    EXPECT_FALSE(pool.Get("missing").has_value());
    EXPECT_DOUBLE_EQ(pool.GetTotalFees(), tx.GetFee());
}

TEST_F(MempoolTest, RejectsDuplicateId) {
    Transaction tx = MakeTx("alice", "bob", 10.0);
    ASSERT_TRUE(Add(tx));

    util::JSONValue json = tx.ToJSON();
    json["to"] = "carol";
    Transaction sameId = Transaction::FromJSON(json);

    EXPECT_FALSE(Add(sameId));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::TX_DUPLICATE_ID);
    EXPECT_EQ(pool.Size(), 1u);
}

TEST_F(MempoolTest, RejectsEquivalentWithinWindow) {
    ASSERT_TRUE(Add(MakeTx("alice", "bob", 10.0, NOW)));

    EXPECT_FALSE(Add(MakeTx("alice", "bob", 10.0, NOW + 59999)));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::DUPLICATE_PENDING_TX);

    EXPECT_FALSE(Add(MakeTx("alice", "bob", 10.0, NOW - 30000)));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::DUPLICATE_PENDING_TX);

    // Outside the window, or differing in amount or recipient
    EXPECT_TRUE(Add(MakeTx("alice", "bob", 10.0, NOW + 60000)));
    EXPECT_TRUE(Add(MakeTx("alice", "bob", 10.5, NOW)));
    EXPECT_TRUE(Add(MakeTx("alice", "carol", 10.0, NOW)));
    EXPECT_EQ(pool.Size(), 4u);
}

TEST_F(MempoolTest, CheckTxDoesNotAdd) {
    Transaction tx = MakeTx("alice", "bob", 10.0);
    EXPECT_TRUE(pool.CheckTx(tx, state));
    EXPECT_TRUE(pool.Empty());
}

TEST_F(MempoolTest, MaxSize) {
    MempoolLimits limits;
    limits.maxSize = 2;
    pool.SetLimits(limits);
    EXPECT_EQ(pool.GetLimits().maxSize, 2u);

    ASSERT_TRUE(Add(MakeTx("a", "b", 1.0)));
    ASSERT_TRUE(Add(MakeTx("a", "b", 2.0)));
    EXPECT_FALSE(Add(MakeTx("a", "b", 3.0)));
    EXPECT_EQ(state.GetRejectReason(), RejectReason::MEMPOOL_FULL);
}

// ============================================================================
// Ordering
// ============================================================================

TEST_F(MempoolTest, SelectForBlockByFeeThenArrival) {
    Transaction small1 = MakeTx("a", "b", 1.0);
    Transaction large = MakeTx("c", "d", 5000.0);
    Transaction small2 = MakeTx("e", "f", 1.0);
    Transaction medium = MakeTx("g", "h", 500.0);
    for (const auto* tx : {&small1, &large, &small2, &medium}) {
        ASSERT_TRUE(Add(*tx));
    }

    auto selected = pool.SelectForBlock(10);
    ASSERT_EQ(selected.size(), 4u);
    EXPECT_EQ(selected[0].GetId(), large.GetId());
    EXPECT_EQ(selected[1].GetId(), medium.GetId());
    EXPECT_EQ(selected[2].GetId(), small1.GetId());
    EXPECT_EQ(selected[3].GetId(), small2.GetId());

    auto capped = pool.SelectForBlock(2);
    ASSERT_EQ(capped.size(), 2u);
    EXPECT_EQ(capped[1].GetId(), medium.GetId());

    // Selection leaves the pool untouched
    EXPECT_EQ(pool.Size(), 4u);
}

TEST_F(MempoolTest, GetAllInAdmissionOrder) {
    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        Transaction tx = MakeTx("alice", "bob", 100.0 - i);
        ids.push_back(tx.GetId());
        ASSERT_TRUE(Add(tx));
    }
    auto all = pool.GetAll();
    ASSERT_EQ(all.size(), ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        EXPECT_EQ(all[i].GetId(), ids[i]);
    }
}

// ============================================================================
// Removal
// ============================================================================

TEST_F(MempoolTest, RemoveNotifies) {
    std::vector<std::pair<std::string, MempoolRemovalReason>> removed;
    pool.SetNotifyRemoved([&removed](const Transaction& tx, MempoolRemovalReason reason) {
        removed.emplace_back(tx.GetId(), reason);
    });

    Transaction a = MakeTx("a", "b", 1.0);
    Transaction b = MakeTx("c", "d", 2.0);
    Transaction c = MakeTx("e", "f", 3.0);
    ASSERT_TRUE(Add(a));
    ASSERT_TRUE(Add(b));
    ASSERT_TRUE(Add(c));

    EXPECT_EQ(pool.RemoveForBlock({a}), 1u);
    EXPECT_EQ(pool.RemoveTxs({b.GetId(), "unknown"}, MempoolRemovalReason::FAILED), 1u);
    pool.Clear();
    EXPECT_TRUE(pool.Empty());

    ASSERT_EQ(removed.size(), 3u);
    EXPECT_EQ(removed[0].first, a.GetId());
    EXPECT_EQ(removed[0].second, MempoolRemovalReason::BLOCK);
    EXPECT_EQ(removed[1].second, MempoolRemovalReason::FAILED);
    EXPECT_EQ(removed[2].first, c.GetId());
    EXPECT_EQ(removed[2].second, MempoolRemovalReason::CLEARED);
}

TEST_F(MempoolTest, RemovedTxCanBeResubmitted) {
    Transaction tx = MakeTx("alice", "bob", 10.0);
    ASSERT_TRUE(Add(tx));
    pool.RemoveTxs({tx.GetId()}, MempoolRemovalReason::FAILED);
    EXPECT_TRUE(Add(tx));
}

TEST(MempoolRemovalReasonTest, ToString) {
    EXPECT_EQ(RemovalReasonToString(MempoolRemovalReason::BLOCK), "block");
    EXPECT_EQ(RemovalReasonToString(MempoolRemovalReason::FAILED), "failed");
    EXPECT_EQ(RemovalReasonToString(MempoolRemovalReason::CLEARED), "cleared");
    EXPECT_EQ(RemovalReasonToString(MempoolRemovalReason::UNKNOWN), "unknown");
}
