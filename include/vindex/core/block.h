// VINDEX - Block
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// A block bundles transactions with the digests that pin them down:
// Merkle root over transaction content digests, a state root over the
// header summary, and the header hash over everything. Once signed a block
// is frozen; AddTransaction() and Sign() on a signed block fail without effect.

#ifndef VINDEX_CORE_BLOCK_H
#define VINDEX_CORE_BLOCK_H

#include "vindex/consensus/validation.h"
#include "vindex/core/transaction.h"
#include "vindex/core/types.h"
#include "vindex/util/json.h"

#include <cstdint>
#include <string>
#include <vector>

namespace vindex {

// ============================================================================
// Reward Schedule
// ============================================================================

/**
 * Block reward: baseReward / 2^floor(index / halvingInterval), plus a
 * per-transaction bonus capped at maxTxBonus, plus the block's fees.
 * Empty blocks earn nothing.
 */
struct RewardSchedule {
    Amount baseReward{10.0};
    uint64_t halvingInterval{210000};
    Amount perTxBonus{0.1};
    Amount maxTxBonus{5.0};

    /// Halved base component at a block height
    Amount BaseComponent(uint64_t index) const;

    /// Transaction bonus component for a block with txCount transactions
    Amount TxBonus(size_t txCount) const;

    /// Full reward (issued part plus fees); 0 if txCount == 0
    Amount Compute(uint64_t index, size_t txCount, Amount totalFees) const;
};

// ============================================================================
// Block
// ============================================================================

/// Producer name and signature recorded on the genesis block
constexpr const char* GENESIS_PRODUCER = "genesis";
constexpr const char* GENESIS_SIGNATURE = "genesis_signature";

class Block {
public:
    Block() = default;

    /**
     * Assemble an unsigned block and derive all computed fields.
     *
     * @param index Height (0 for genesis)
     * @param transactions Ordered transaction list
     * @param previousHash Header hash of the parent (null for genesis)
     * @param producer Address of the producing validator
     * @param timestamp Block time in milliseconds
     * @param schedule Reward schedule used to compute the reward
     */
    static Block Create(uint64_t index, std::vector<Transaction> transactions,
                        const Hash256& previousHash, const Address& producer,
                        Timestamp timestamp,
                        const RewardSchedule& schedule = RewardSchedule());

    /// Block 0: no transactions, null parent, signed with GENESIS_SIGNATURE
    static Block CreateGenesis(Timestamp timestamp);

    /// Restore from wire JSON with every header field verbatim; throws
    /// std::invalid_argument on missing or malformed fields
    static Block FromJSON(const util::JSONValue& json);

    // ========================================================================
    // Accessors
    // ========================================================================

    uint64_t GetIndex() const { return index_; }
    Timestamp GetTimestamp() const { return timestamp_; }
    const std::vector<Transaction>& GetTransactions() const { return transactions_; }
    const Hash256& GetPreviousHash() const { return previousHash_; }
    const Hash256& GetHash() const { return hash_; }
    uint64_t GetNonce() const { return nonce_; }
    const Address& GetProducer() const { return producer_; }
    const std::string& GetSignature() const { return signature_; }
    const Hash256& GetMerkleRoot() const { return merkleRoot_; }
    const Hash256& GetStateRoot() const { return stateRoot_; }
    size_t GetTransactionCount() const { return transactionCount_; }
    Amount GetTotalFees() const { return totalFees_; }
    Amount GetReward() const { return reward_; }
    bool IsSigned() const { return !signature_.empty(); }
    bool IsGenesis() const { return index_ == 0; }

    /// Position of a transaction id in this block, -1 if absent
    int FindTransaction(const std::string& txId) const;

    // ========================================================================
    // Mutation (unsigned blocks only)
    // ========================================================================

    /// Append a transaction and re-derive counts, fees, reward and digests
    bool AddTransaction(const Transaction& tx, consensus::ValidationState& state,
                        const RewardSchedule& schedule = RewardSchedule());

    /// Recompute the hash, then sign it with key; a signed block is frozen
    bool Sign(const std::string& key, consensus::ValidationState& state);

    /// True if signed and the signature over the stored hash matches key
    bool VerifySignature(const std::string& key) const;

    // ========================================================================
    // Digests
    // ========================================================================

    Hash256 ComputeMerkleRoot() const;
    Hash256 ComputeStateRoot() const;
    Hash256 ComputeHash() const;

    /// Content digests of the transactions, in block order
    std::vector<Hash256> GetTransactionDigests() const;

    // ========================================================================
    // Validation
    // ========================================================================

    /**
     * Stateless validity against a reference time.
     *
     * Checks that a non-genesis block has a parent hash, that the producer is
     * set, that hash and Merkle root re-derive, that every transaction has
     * an id and a non-negative amount, that the timestamp is not beyond
     * now + maxFutureDriftMs, and that fees and reward re-derive within
     * BLOCK_AMOUNT_EPSILON.
     */
    bool Check(consensus::ValidationState& state, Timestamp now,
               const RewardSchedule& schedule = RewardSchedule(),
               int64_t maxFutureDriftMs = 60 * 1000) const;

    /// Check() against the current clock and default schedule
    bool IsValid() const;

    // ========================================================================
    // Serialization
    // ========================================================================

    util::JSONValue ToJSON() const;

    /// Size of the compact JSON encoding in bytes
    size_t GetSize() const;

    std::string ToString() const;

private:
    uint64_t index_{0};
    Timestamp timestamp_{0};
    std::vector<Transaction> transactions_;
    Hash256 previousHash_;
    Hash256 hash_;
    uint64_t nonce_{0};
    Address producer_;
    std::string signature_;
    Hash256 merkleRoot_;
    Hash256 stateRoot_;
    size_t transactionCount_{0};
    Amount totalFees_{0.0};
    Amount reward_{0.0};

    /// Recompute count, fees, reward, roots and hash from the contents
    void Derive(const RewardSchedule& schedule);

    /// Hex for wire form; the genesis parent is written as "0"
    static std::string EncodeParentHash(const Hash256& hash);
};

} // namespace vindex

#endif // VINDEX_CORE_BLOCK_H
