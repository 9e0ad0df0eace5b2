// VINDEX - Mempool Implementation
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include "vindex/mempool/mempool.h"
#include "vindex/util/logging.h"
#include "vindex/util/time.h"

#include <algorithm>
#include <cstdlib>

namespace vindex {

std::string RemovalReasonToString(MempoolRemovalReason reason) {
    switch (reason) {
        case MempoolRemovalReason::BLOCK: return "block";
        case MempoolRemovalReason::FAILED: return "failed";
        case MempoolRemovalReason::CLEARED: return "cleared";
        default: return "unknown";
    }
}

Mempool::Mempool() : Mempool(MempoolLimits()) {}

Mempool::Mempool(const MempoolLimits& limitsIn) : limits(limitsIn) {}

// ============================================================================
// Adding Transactions
// ============================================================================

bool Mempool::CheckTxLocked(const Transaction& tx, consensus::ValidationState& state) const {
    if (entries.count(tx.GetId()) > 0) {
        return state.Invalid(consensus::RejectReason::TX_DUPLICATE_ID,
                             "already pending: " + tx.GetId());
    }

    for (const auto& [id, entry] : entries) {
        const Transaction& other = entry.tx;
        if (other.GetFrom() == tx.GetFrom() && other.GetTo() == tx.GetTo() &&
            other.GetAmount() == tx.GetAmount() &&
            std::llabs(other.GetTimestamp() - tx.GetTimestamp()) < limits.duplicateWindowMs) {
            return state.Invalid(consensus::RejectReason::DUPLICATE_PENDING_TX,
                                 "equivalent to pending " + id);
        }
    }

    if (limits.maxSize > 0 && entries.size() >= limits.maxSize) {
        return state.Invalid(consensus::RejectReason::MEMPOOL_FULL,
                             std::to_string(entries.size()) + " transactions pending");
    }
    return true;
}

bool Mempool::CheckTx(const Transaction& tx, consensus::ValidationState& state) const {
    std::lock_guard<std::mutex> lock(cs);
    return CheckTxLocked(tx, state);
}

bool Mempool::AddTx(const Transaction& tx, consensus::ValidationState& state) {
    std::lock_guard<std::mutex> lock(cs);
    if (!CheckTxLocked(tx, state)) {
        return false;
    }

    MempoolEntry entry;
    entry.tx = tx;
    entry.sequence = nextSequence++;
    entry.entryTime = util::GetTimeMillis();
    entries.emplace(tx.GetId(), std::move(entry));

    LOG_TRACE(util::LogCategory::MEMPOOL) << "Accepted " << tx.GetId()
                                          << " (pool size " << entries.size() << ")";
    return true;
}

// ============================================================================
// Removing Transactions
// ============================================================================

size_t Mempool::RemoveTxs(const std::vector<std::string>& ids, MempoolRemovalReason reason) {
    std::lock_guard<std::mutex> lock(cs);
    size_t removed = 0;
    for (const auto& id : ids) {
        auto it = entries.find(id);
        if (it == entries.end()) {
            continue;
        }
        if (notifyRemoved) {
            notifyRemoved(it->second.tx, reason);
        }
        entries.erase(it);
        ++removed;
    }
    if (removed > 0) {
        LOG_DEBUG(util::LogCategory::MEMPOOL) << "Removed " << removed << " transactions ("
                                              << RemovalReasonToString(reason) << ")";
    }
    return removed;
}

size_t Mempool::RemoveForBlock(const std::vector<Transaction>& vtx) {
    std::vector<std::string> ids;
    ids.reserve(vtx.size());
    for (const auto& tx : vtx) {
        ids.push_back(tx.GetId());
    }
    return RemoveTxs(ids, MempoolRemovalReason::BLOCK);
}

void Mempool::Clear() {
    std::lock_guard<std::mutex> lock(cs);
    if (notifyRemoved) {
        for (const auto& [id, entry] : entries) {
            notifyRemoved(entry.tx, MempoolRemovalReason::CLEARED);
        }
    }
    entries.clear();
}

// ============================================================================
// Querying
// ============================================================================

bool Mempool::Exists(const std::string& txid) const {
    std::lock_guard<std::mutex> lock(cs);
    return entries.count(txid) > 0;
}

std::optional<Transaction> Mempool::Get(const std::string& txid) const {
    std::lock_guard<std::mutex> lock(cs);
    auto it = entries.find(txid);
    if (it == entries.end()) {
        return std::nullopt;
    }
    return it->second.tx;
}

size_t Mempool::Size() const {
    std::lock_guard<std::mutex> lock(cs);
    return entries.size();
}

bool Mempool::Empty() const {
    std::lock_guard<std::mutex> lock(cs);
    return entries.empty();
}

Amount Mempool::GetTotalFees() const {
    std::lock_guard<std::mutex> lock(cs);
    Amount total = 0.0;
    for (const auto& [id, entry] : entries) {
        total += entry.tx.GetFee();
    }
    return total;
}

std::vector<const MempoolEntry*> Mempool::SortedByFeeLocked() const {
    std::vector<const MempoolEntry*> sorted;
    sorted.reserve(entries.size());
    for (const auto& [id, entry] : entries) {
        sorted.push_back(&entry);
    }
    std::sort(sorted.begin(), sorted.end(), [](const MempoolEntry* a, const MempoolEntry* b) {
        if (a->tx.GetFee() != b->tx.GetFee()) {
            return a->tx.GetFee() > b->tx.GetFee();
        }
        return a->sequence < b->sequence;
    });
    return sorted;
}

std::vector<Transaction> Mempool::SelectForBlock(size_t maxCount) const {
    std::lock_guard<std::mutex> lock(cs);
    std::vector<Transaction> result;
    for (const MempoolEntry* entry : SortedByFeeLocked()) {
        if (result.size() >= maxCount) {
            break;
        }
        result.push_back(entry->tx);
    }
    return result;
}

std::vector<Transaction> Mempool::GetAll() const {
    std::lock_guard<std::mutex> lock(cs);
    std::vector<const MempoolEntry*> ordered;
    ordered.reserve(entries.size());
    for (const auto& [id, entry] : entries) {
        ordered.push_back(&entry);
    }
    std::sort(ordered.begin(), ordered.end(), [](const MempoolEntry* a, const MempoolEntry* b) {
        return a->sequence < b->sequence;
    });

    std::vector<Transaction> result;
    result.reserve(ordered.size());
    for (const MempoolEntry* entry : ordered) {
        result.push_back(entry->tx);
    }
    return result;
}

} // namespace vindex
