// VINDEX - Mempool Header
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// Pending transactions waiting for the next block. Admission here covers only
// pool policy (duplicate ids and equivalent resubmissions); balance and
// validity checks belong to the ledger.

#ifndef VINDEX_MEMPOOL_MEMPOOL_H
#define VINDEX_MEMPOOL_MEMPOOL_H

#include "vindex/consensus/validation.h"
#include "vindex/core/transaction.h"
#include "vindex/core/types.h"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vindex {

// ============================================================================
// Mempool Removal Reason
// ============================================================================

enum class MempoolRemovalReason {
    UNKNOWN = 0,
    BLOCK,      // Included in a block
    FAILED,     // Failed to apply while mining
    CLEARED,    // Pool cleared
};

std::string RemovalReasonToString(MempoolRemovalReason reason);

// ============================================================================
// Mempool Limits
// ============================================================================

struct MempoolLimits {
    /// Equivalent transactions (same from, to, amount) closer than this are duplicates
    int64_t duplicateWindowMs = 60 * 1000;

    /// Maximum number of pending transactions (0 = unlimited)
    size_t maxSize = 0;
};

// ============================================================================
// Mempool Entry
// ============================================================================

struct MempoolEntry {
    Transaction tx;

    /// Admission sequence number, used to break fee ties
    uint64_t sequence{0};

    /// Clock time of admission
    Timestamp entryTime{0};
};

// ============================================================================
// Mempool
// ============================================================================

class Mempool {
public:
    Mempool();
    explicit Mempool(const MempoolLimits& limitsIn);

    Mempool(const Mempool&) = delete;
    Mempool& operator=(const Mempool&) = delete;

    void SetLimits(const MempoolLimits& limitsIn) {
        std::lock_guard<std::mutex> lock(cs);
        limits = limitsIn;
    }

    MempoolLimits GetLimits() const {
        std::lock_guard<std::mutex> lock(cs);
        return limits;
    }

    /// Called once per removed transaction
    void SetNotifyRemoved(std::function<void(const Transaction&, MempoolRemovalReason)> callback) {
        std::lock_guard<std::mutex> lock(cs);
        notifyRemoved = std::move(callback);
    }

    // ========================================================================
    // Adding Transactions
    // ========================================================================

    /**
     * Add a transaction.
     *
     * Fails with tx-duplicate-id if the id is already pending, and with
     * duplicate-pending-tx if a pending transaction has the same from, to
     * and amount and a timestamp within the duplicate window.
     */
    bool AddTx(const Transaction& tx, consensus::ValidationState& state);

    /// Same checks as AddTx() without adding
    bool CheckTx(const Transaction& tx, consensus::ValidationState& state) const;

    // ========================================================================
    // Removing Transactions
    // ========================================================================

    /// Remove the given ids; returns how many were pending
    size_t RemoveTxs(const std::vector<std::string>& ids, MempoolRemovalReason reason);

    /// Remove every transaction contained in a committed block
    size_t RemoveForBlock(const std::vector<Transaction>& vtx);

    void Clear();

    // ========================================================================
    // Querying
    // ========================================================================

    bool Exists(const std::string& txid) const;
    std::optional<Transaction> Get(const std::string& txid) const;

    size_t Size() const;
    bool Empty() const;
    Amount GetTotalFees() const;

    /**
     * Up to maxCount transactions ordered by fee, highest first; equal fees
     * keep admission order.
     */
    std::vector<Transaction> SelectForBlock(size_t maxCount) const;

    /// All pending transactions in admission order
    std::vector<Transaction> GetAll() const;

private:
    mutable std::mutex cs;
    MempoolLimits limits;
    uint64_t nextSequence{0};

    std::map<std::string, MempoolEntry> entries;

    std::function<void(const Transaction&, MempoolRemovalReason)> notifyRemoved;

    bool CheckTxLocked(const Transaction& tx, consensus::ValidationState& state) const;
    std::vector<const MempoolEntry*> SortedByFeeLocked() const;
};

} // namespace vindex

#endif // VINDEX_MEMPOOL_MEMPOOL_H
