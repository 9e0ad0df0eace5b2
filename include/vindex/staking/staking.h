// VINDEX - Stake Ledger
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// Proof-of-Stake bookkeeping:
// - Account table (spendable, bonded and unbonding balances, swap tokens)
// - Validator registry with capacity limit and activation threshold
// - Stake positions (delegator -> validator) with unbonding
// - Weighted leader selection through a pluggable LeaderSelector
// - Reward distribution (commission plus pro-rata delegator shares)
//
// All queries return copies. Every mutating call either succeeds completely
// or fails with a reason in the ValidationState and changes nothing.

#ifndef VINDEX_STAKING_STAKING_H
#define VINDEX_STAKING_STAKING_H

#include "vindex/consensus/params.h"
#include "vindex/consensus/validation.h"
#include "vindex/core/account.h"
#include "vindex/core/types.h"
#include "vindex/staking/leader.h"
#include "vindex/util/json.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vindex {
namespace staking {

// ============================================================================
// Validator
// ============================================================================

struct Validator {
    Address address;

    /// Stake bonded by the validator itself
    Amount selfStake{0.0};

    /// Self stake plus delegations
    Amount totalStake{0.0};

    /// Fraction of rewards kept before delegator shares
    double commissionRate{0.0};

    /// totalStake >= minimum stake
    bool active{false};

    uint64_t blocksProduced{0};
    uint64_t lastActiveBlock{0};

    /// Commission on a reward
    Amount CalculateCommission(Amount reward) const { return reward * commissionRate; }

    util::JSONValue ToJSON() const;
    std::string ToString() const;
};

// ============================================================================
// Stake Position
// ============================================================================

/**
 * Stake bonded by one delegator to one validator.
 *
 * Unstaked coins move from amount to unbondingAmount and become spendable
 * at unlockTime. A further unstake resets unlockTime to now + unbonding.
 */
struct StakePosition {
    Address delegator;
    Address validator;
    Amount amount{0.0};
    Amount unbondingAmount{0.0};
    std::optional<Timestamp> unlockTime;
    Amount rewards{0.0};

    bool IsEmpty() const {
        return amount <= AMOUNT_EPSILON && unbondingAmount <= AMOUNT_EPSILON;
    }

    util::JSONValue ToJSON() const;
};

// ============================================================================
// Genesis
// ============================================================================

struct GenesisValidator {
    Address address;
    Amount selfStake;
    double commissionRate;
};

/// The three validators bonded at genesis
std::vector<GenesisValidator> DefaultGenesisValidators();

// ============================================================================
// Statistics
// ============================================================================

struct StakingStats {
    size_t totalValidators{0};
    size_t activeValidators{0};
    size_t maxValidators{0};
    size_t totalAccounts{0};
    size_t totalPositions{0};
    Amount totalStaked{0.0};
    Amount totalUnbonding{0.0};
    Amount minStake{0.0};
    int64_t unbondingMs{0};

    util::JSONValue ToJSON() const;
};

// ============================================================================
// Stake Ledger
// ============================================================================

class StakeLedger {
public:
    /// Ledger with the given parameters; selector defaults to LcgLeaderSelector
    explicit StakeLedger(const consensus::ChainParams& params = consensus::ChainParams(),
                         std::unique_ptr<LeaderSelector> selector = nullptr);

    StakeLedger(const StakeLedger&) = delete;
    StakeLedger& operator=(const StakeLedger&) = delete;

    /**
     * Register the genesis validators: a zero-balance validator account per
     * entry, a self-bond position, and an active registry entry.
     * Bonded coins are not taken from any balance.
     */
    void InitializeGenesis(const std::vector<GenesisValidator>& validators =
                               DefaultGenesisValidators());

    // ========================================================================
    // Accounts
    // ========================================================================

    /// Create an empty account; false if it already exists
    bool CreateAccount(const Address& address);

    bool HasAccount(const Address& address) const;

    /// Add to the spendable balance, creating the account if absent
    void Credit(const Address& address, Amount amount);

    /// Take from the spendable balance; fails without effect if short
    bool Debit(const Address& address, Amount amount, consensus::ValidationState& state);

    /// Credit a swap asset (NATIVE_TOKEN goes to the balance)
    void CreditToken(const Address& address, const std::string& symbol, Amount amount);

    /// Debit a swap asset; fails without effect if short
    bool DebitToken(const Address& address, const std::string& symbol, Amount amount,
                    consensus::ValidationState& state);

    /// Spendable balance of a symbol (0 for unknown accounts)
    Amount GetTokenBalance(const Address& address, const std::string& symbol) const;

    void IncrementNonce(const Address& address);

    /// Spendable native balance (0 for unknown accounts)
    Amount GetBalance(const Address& address) const;

    std::optional<Account> GetAccount(const Address& address) const;
    std::vector<Account> GetAllAccounts() const;

    // ========================================================================
    // Staking
    // ========================================================================

    /**
     * Bond amount from delegator to validatorAddress.
     *
     * A self-bond (delegator == validatorAddress) to an unknown validator
     * registers a new validator if the registry has room. On success the
     * delegator is also charged extraDebit (the transaction fee) from the
     * spendable balance; the balance must cover amount + extraDebit.
     */
    bool Stake(const Address& delegator, const Address& validatorAddress, Amount amount,
               consensus::ValidationState& state, Amount extraDebit = 0.0);

    /**
     * Begin unbonding amount from an existing position.
     *
     * Stake leaves the validator immediately; the coins become spendable
     * after the unbonding period via CompleteUnstaking(). extraDebit is
     * charged from the spendable balance on success.
     */
    bool Unstake(const Address& delegator, const Address& validatorAddress, Amount amount,
                 consensus::ValidationState& state, Amount extraDebit = 0.0);

    /// Release every unbonding amount of delegator whose unlock time has
    /// passed; returns the total credited to the spendable balance
    Amount CompleteUnstaking(const Address& delegator);

    // ========================================================================
    // Block Production
    // ========================================================================

    /// Producer for blockIndex among the active validators
    std::optional<Address> SelectValidator(uint64_t blockIndex) const;

    void RecordBlockProduced(const Address& validatorAddress, uint64_t blockIndex);

    /**
     * Pay reward: commission to the validator's stakingRewards, the rest
     * split over all positions bonded to it by share of totalStake.
     *
     * @return false if the validator is unknown (nothing is paid)
     */
    bool DistributeStakingRewards(Amount reward, const Address& validatorAddress);

    // ========================================================================
    // Queries
    // ========================================================================

    std::optional<Validator> GetValidator(const Address& address) const;

    /// Active validators in registration order
    std::vector<Validator> GetActiveValidators() const;

    /// All validators in registration order
    std::vector<Validator> GetAllValidators() const;

    std::vector<StakePosition> GetStakePositions(const Address& delegator) const;

    /// Sum of bonded stake over all accounts
    Amount GetTotalStaked() const;

    /// Sum of unbonding stake over all accounts
    Amount GetTotalUnbonding() const;

    StakingStats GetStats() const;

    const consensus::ChainParams& GetParams() const { return params_; }
    const LeaderSelector& GetLeaderSelector() const { return *selector_; }

private:
    using PositionKey = std::pair<Address, Address>;  // (delegator, validator)

    consensus::ChainParams params_;
    std::unique_ptr<LeaderSelector> selector_;

    mutable std::mutex mutex_;
    std::map<Address, Account> accounts_;
    std::map<Address, Validator> validators_;
    std::vector<Address> validatorOrder_;
    std::map<PositionKey, StakePosition> positions_;

    Account& GetOrCreateAccountLocked(const Address& address);
    Amount SpendableLocked(const Address& address) const;
    void UpdateActivationLocked(Validator& validator);
    std::vector<LeaderCandidate> ActiveCandidatesLocked() const;
};

} // namespace staking
} // namespace vindex

#endif // VINDEX_STAKING_STAKING_H
