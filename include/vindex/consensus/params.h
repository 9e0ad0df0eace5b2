// VINDEX - Chain Parameters
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// Every tunable constant of the ledger, with defaults and an override path
// from the [chain] section of a configuration file.

#ifndef VINDEX_CONSENSUS_PARAMS_H
#define VINDEX_CONSENSUS_PARAMS_H

#include "vindex/core/block.h"
#include "vindex/core/transaction.h"
#include "vindex/core/types.h"

#include <cstddef>
#include <cstdint>

namespace vindex {

namespace util {
class ConfigManager;
}

namespace consensus {

/// Config section holding chain parameter overrides
constexpr const char* CHAIN_CONFIG_SECTION = "chain";

struct ChainParams {
    // ========================================================================
    // Supply
    // ========================================================================

    /// Fixed total token supply
    Amount totalSupply{1000000000.0};

    // ========================================================================
    // Block Production
    // ========================================================================

    /// Mempool size that triggers immediate mining, and per-block cap
    size_t maxTxPerBlock{1000};

    /// Target interval between blocks (ms)
    int64_t blockTimeMs{10 * 1000};

    /// Reward issued per non-empty block
    RewardSchedule reward;

    // ========================================================================
    // Staking
    // ========================================================================

    /// Minimum stake; also the activation threshold of a validator
    Amount minStake{100.0};

    /// Registry capacity
    size_t maxValidators{21};

    /// Delay between unstake and release of funds (ms)
    int64_t unbondingMs{7LL * 24 * 60 * 60 * 1000};

    /// Commission rate given to a validator registered by self-bonding
    double defaultCommission{0.05};

    // ========================================================================
    // Mempool and Transactions
    // ========================================================================

    /// Window for rejecting equivalent pending submissions (ms)
    int64_t duplicateWindowMs{60 * 1000};

    /// Oldest accepted transaction, relative to now (ms)
    int64_t maxTxAgeMs{10 * 60 * 1000};

    /// Furthest accepted future timestamp for transactions and blocks (ms)
    int64_t maxFutureDriftMs{60 * 1000};

    // ========================================================================
    // Swaps
    // ========================================================================

    /// Pool fee applied to swap input
    double swapFee{0.003};

    /// Transaction validity limits derived from these parameters
    TxLimits GetTxLimits() const {
        TxLimits limits;
        limits.minStake = minStake;
        limits.maxAgeMs = maxTxAgeMs;
        limits.maxFutureDriftMs = maxFutureDriftMs;
        return limits;
    }

    /// Defaults
    static ChainParams Default() { return ChainParams(); }

    /**
     * Defaults overridden by the [chain] section of config.
     *
     * Keys: totalsupply, maxtxperblock, blocktimems, minstake, maxvalidators,
     * unbondingms, defaultcommission, basereward, halvinginterval, swapfee.
     * A missing key keeps the default; an invalid value is logged and ignored.
     */
    static ChainParams FromConfig(const util::ConfigManager& config);
};

} // namespace consensus
} // namespace vindex

#endif // VINDEX_CONSENSUS_PARAMS_H
