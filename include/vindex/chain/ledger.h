// VINDEX - Ledger Engine
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// The single committer of the ledger. Owns the chain, the mempool, the
// stake ledger and the swap pools, and serializes every admission, mining
// cycle and mutating query behind one mutex.
//
// Lifecycle of a transaction:
//   AddTransaction() -> mempool -> MineBlock() candidate (fee ordered)
//   -> applied and committed, or dropped if it fails to apply.

#ifndef VINDEX_CHAIN_LEDGER_H
#define VINDEX_CHAIN_LEDGER_H

#include "vindex/consensus/params.h"
#include "vindex/consensus/validation.h"
#include "vindex/core/account.h"
#include "vindex/core/block.h"
#include "vindex/core/transaction.h"
#include "vindex/core/types.h"
#include "vindex/crypto/keys.h"
#include "vindex/mempool/mempool.h"
#include "vindex/staking/staking.h"
#include "vindex/swap/amm.h"
#include "vindex/util/json.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vindex {
namespace chain {

// ============================================================================
// Genesis Allocation
// ============================================================================

constexpr const char* TREASURY_ADDRESS = "vindex_treasury";
constexpr const char* COMMUNITY_FUND_ADDRESS = "vindex_community_fund";
constexpr const char* DEVELOPMENT_FUND_ADDRESS = "vindex_development_fund";

/// Holds the undistributed remainder of the total supply
constexpr const char* RESERVE_ADDRESS = "vindex_reserve";

struct GenesisAllocation {
    Address address;
    Amount balance;
};

/// Spendable balances credited at genesis (the reserve is derived)
std::vector<GenesisAllocation> DefaultGenesisAllocations();

// ============================================================================
// Supply and Statistics
// ============================================================================

/**
 * Where the native supply currently sits. The buckets partition the supply:
 * circulating + burned + reserve + staked + unbonding + pooled == total.
 */
struct SupplyInfo {
    Amount totalSupply{0.0};

    /// Spendable balances outside the reserve plus accrued staking rewards
    Amount circulatingSupply{0.0};

    Amount burnedTokens{0.0};
    Amount reserveBalance{0.0};
    Amount totalStaked{0.0};
    Amount totalUnbonding{0.0};

    /// Native tokens held as swap pool reserves
    Amount pooledNative{0.0};

    /// Sum of every bucket
    Amount Accounted() const {
        return circulatingSupply + burnedTokens + reserveBalance + totalStaked +
               totalUnbonding + pooledNative;
    }

    util::JSONValue ToJSON() const;
};

struct NetworkStats {
    Amount totalSupply{0.0};
    Amount circulatingSupply{0.0};
    Amount burnedTokens{0.0};
    Amount totalStaked{0.0};
    size_t totalValidators{0};
    size_t activeValidators{0};
    size_t chainLength{0};
    size_t pendingTransactions{0};
    uint64_t totalTransactions{0};
    size_t swapPools{0};

    /// Mean interval between blocks over the whole chain (ms)
    double averageBlockTimeMs{0.0};

    /// Committed transactions per second over the whole chain
    double tps{0.0};

    util::JSONValue ToJSON() const;
};

// ============================================================================
// Ledger Engine
// ============================================================================

class LedgerEngine {
public:
    /**
     * Build an engine at genesis.
     *
     * @param params Chain parameters
     * @param keys Key store used to sign produced blocks and to verify
     *             signatures; defaults to DeterministicKeyStore
     * @param selector Leader selection; defaults to LcgLeaderSelector
     */
    explicit LedgerEngine(const consensus::ChainParams& params = consensus::ChainParams(),
                          std::shared_ptr<const KeyStore> keys = nullptr,
                          std::unique_ptr<staking::LeaderSelector> selector = nullptr);

    LedgerEngine(const LedgerEngine&) = delete;
    LedgerEngine& operator=(const LedgerEngine&) = delete;

    // ========================================================================
    // Transactions and Blocks
    // ========================================================================

    /**
     * Admit a transaction to the mempool, then mine if the pool is full or
     * the block interval has elapsed.
     *
     * Rejects invalid transactions, a signature that does not verify, an
     * unknown sender, a sender who cannot cover the cost, an id that is
     * already pending or committed, and an equivalent pending transaction
     * inside the duplicate window.
     */
    bool AddTransaction(const Transaction& tx, consensus::ValidationState& state);

    /**
     * Produce one block from the mempool.
     *
     * Candidates are taken in fee order up to the per-block cap and applied
     * one by one; failures are dropped from the mempool. Returns nullopt if
     * the mempool is empty or no producer is eligible.
     */
    std::optional<Block> MineBlock();

    // ========================================================================
    // Supply Operations
    // ========================================================================

    /**
     * Open a pool for an unordered token pair. Native liquidity is drawn
     * from the reserve account; other tokens are minted into the pool.
     */
    bool CreateSwapPool(const std::string& tokenA, const std::string& tokenB,
                        Amount reserveA, Amount reserveB, consensus::ValidationState& state);

    /// Destroy amount of holder's spendable native balance
    bool BurnTokens(Amount amount, consensus::ValidationState& state,
                    const Address& holder = TREASURY_ADDRESS);

    /// Release matured unbonding stake of address to its spendable balance
    Amount CompleteUnstaking(const Address& address);

    // ========================================================================
    // Queries
    // ========================================================================

    std::optional<Block> GetBlock(uint64_t index) const;
    std::optional<Block> GetBlockByHash(const Hash256& hash) const;
    Block GetLatestBlock() const;
    size_t GetChainLength() const;

    /// Committed transaction by id
    std::optional<Transaction> GetTransaction(const std::string& txId) const;

    /// Height of the block that committed txId
    std::optional<uint64_t> GetTransactionHeight(const std::string& txId) const;

    Amount GetBalance(const Address& address) const;
    Amount GetTokenBalance(const Address& address, const std::string& symbol) const;
    std::optional<Account> GetAccount(const Address& address) const;

    std::vector<Transaction> GetPendingTransactions() const;
    size_t GetPendingCount() const;

    std::optional<swap::SwapPool> GetSwapPool(const std::string& tokenA,
                                              const std::string& tokenB) const;
    std::vector<swap::SwapPool> GetSwapPools() const;

    /// Price a swap against the current pool state without executing it
    std::optional<swap::SwapQuote> QuoteSwap(const std::string& inputToken,
                                             const std::string& outputToken,
                                             Amount amountIn) const;

    std::vector<staking::Validator> GetValidators() const;
    std::vector<staking::StakePosition> GetStakePositions(const Address& delegator) const;
    staking::StakingStats GetStakingStats() const;

    // ========================================================================
    // Consistency
    // ========================================================================

    /**
     * Walk the chain: genesis shape, per-block validity, heights, parent
     * links, producer signatures and uniqueness of transaction ids.
     */
    bool IsChainValid() const;
    bool IsChainValid(consensus::ValidationState& state) const;

    SupplyInfo GetSupplyInfo() const;

    /// |Accounted() - totalSupply| <= epsilon
    bool CheckSupplyInvariant(Amount epsilon = 0.01) const;

    NetworkStats GetNetworkStats() const;

    /// Full snapshot of chain, mempool, supply, pools, accounts and validators
    util::JSONValue ExportChain() const;

    const consensus::ChainParams& GetParams() const { return params_; }

private:
    const consensus::ChainParams params_;
    std::shared_ptr<const KeyStore> keys_;

    mutable std::mutex mutex_;
    staking::StakeLedger stakes_;
    Mempool mempool_;
    std::vector<Block> chain_;
    std::map<std::string, uint64_t> txIndex_;
    std::map<std::string, swap::SwapPool> pools_;
    Amount burned_{0.0};
    Timestamp lastBlockTime_{0};

    void InitializeGenesis();

    bool CheckAdmissionLocked(const Transaction& tx, consensus::ValidationState& state) const;
    void TryAutoMineLocked();
    std::optional<Block> MineBlockLocked();

    bool ApplyTransactionLocked(const Transaction& tx, consensus::ValidationState& state);
    bool ApplyTransferLocked(const Transaction& tx, consensus::ValidationState& state);
    bool ApplyStakeLocked(const Transaction& tx, consensus::ValidationState& state);
    bool ApplyUnstakeLocked(const Transaction& tx, consensus::ValidationState& state);
    bool ApplySwapLocked(const Transaction& tx, consensus::ValidationState& state);

    void PayRewardLocked(const Block& block);

    bool IsChainValidLocked(consensus::ValidationState& state) const;
    SupplyInfo GetSupplyInfoLocked() const;
};

} // namespace chain
} // namespace vindex

#endif // VINDEX_CHAIN_LEDGER_H
