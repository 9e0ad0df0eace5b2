// VINDEX - Ledger Engine Implementation
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include "vindex/chain/ledger.h"
#include "vindex/util/logging.h"
#include "vindex/util/time.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace vindex {
namespace chain {

namespace RejectReason = consensus::RejectReason;

std::vector<GenesisAllocation> DefaultGenesisAllocations() {
    return {
        {"vindex_genesis_validator_1", 100000000.0},
        {"vindex_genesis_validator_2", 80000000.0},
        {"vindex_genesis_validator_3", 60000000.0},
        {TREASURY_ADDRESS, 200000000.0},
        {COMMUNITY_FUND_ADDRESS, 100000000.0},
        {DEVELOPMENT_FUND_ADDRESS, 50000000.0},
    };
}

// ============================================================================
// SupplyInfo / NetworkStats
// ============================================================================

util::JSONValue SupplyInfo::ToJSON() const {
    util::JSONValue::Object obj;
    obj["totalSupply"] = totalSupply;
    obj["circulatingSupply"] = circulatingSupply;
    obj["burnedTokens"] = burnedTokens;
    obj["reserveBalance"] = reserveBalance;
    obj["totalStaked"] = totalStaked;
    obj["totalUnbonding"] = totalUnbonding;
    obj["pooledNative"] = pooledNative;
    return util::JSONValue(std::move(obj));
}

util::JSONValue NetworkStats::ToJSON() const {
    util::JSONValue::Object obj;
    obj["totalSupply"] = totalSupply;
    obj["circulatingSupply"] = circulatingSupply;
    obj["burnedTokens"] = burnedTokens;
    obj["totalStaked"] = totalStaked;
    obj["totalValidators"] = static_cast<uint64_t>(totalValidators);
    obj["activeValidators"] = static_cast<uint64_t>(activeValidators);
    obj["chainLength"] = static_cast<uint64_t>(chainLength);
    obj["pendingTransactions"] = static_cast<uint64_t>(pendingTransactions);
    obj["totalTransactions"] = totalTransactions;
    obj["swapPools"] = static_cast<uint64_t>(swapPools);
    obj["averageBlockTime"] = averageBlockTimeMs;
    obj["tps"] = tps;
    return util::JSONValue(std::move(obj));
}

// ============================================================================
// Construction
// ============================================================================

LedgerEngine::LedgerEngine(const consensus::ChainParams& params,
                           std::shared_ptr<const KeyStore> keys,
                           std::unique_ptr<staking::LeaderSelector> selector)
    : params_(params),
      keys_(std::move(keys)),
      stakes_(params, std::move(selector)) {
    if (!keys_) {
        keys_ = std::make_shared<DeterministicKeyStore>();
    }

    MempoolLimits limits;
    limits.duplicateWindowMs = params_.duplicateWindowMs;
    mempool_.SetLimits(limits);

    InitializeGenesis();
}

void LedgerEngine::InitializeGenesis() {
    std::lock_guard<std::mutex> lock(mutex_);

    Block genesis = Block::CreateGenesis(util::GetTimeMillis());
    lastBlockTime_ = genesis.GetTimestamp();
    chain_.push_back(std::move(genesis));

    const auto validators = staking::DefaultGenesisValidators();
    stakes_.InitializeGenesis(validators);

    Amount allocated = 0.0;
    for (const auto& validator : validators) {
        allocated += validator.selfStake;
    }
    // Credit adds to the accounts the stake ledger already created
    for (const auto& allocation : DefaultGenesisAllocations()) {
        stakes_.Credit(allocation.address, allocation.balance);
        allocated += allocation.balance;
    }

    Amount reserve = params_.totalSupply - allocated;
    if (reserve < 0.0) {
        LOG_WARN(util::LogCategory::LEDGER)
            << "Genesis allocations exceed total supply by " << util::FormatNumber(-reserve);
        reserve = 0.0;
    }
    stakes_.Credit(RESERVE_ADDRESS, reserve);

    LOG_INFO(util::LogCategory::LEDGER)
        << "Genesis " << chain_.front().GetHash().ToHex().substr(0, 16)
        << " with reserve " << util::FormatNumber(reserve);
}

// ============================================================================
// Admission
// ============================================================================

bool LedgerEngine::CheckAdmissionLocked(const Transaction& tx,
                                        consensus::ValidationState& state) const {
    if (!tx.Check(state, util::GetTimeMillis(), params_.GetTxLimits())) {
        return false;
    }

    if (tx.IsSigned()) {
        auto key = keys_->GetSigningKey(tx.GetFrom(), KeyRole::Account);
        if (key && !tx.VerifySignature(*key)) {
            return state.Invalid(RejectReason::BAD_SIGNATURE,
                                 "signature does not verify for " + tx.GetFrom());
        }
    }

    if (txIndex_.count(tx.GetId()) > 0) {
        return state.Invalid(RejectReason::TX_ALREADY_MINED,
                             tx.GetId() + " committed at height " +
                             std::to_string(txIndex_.at(tx.GetId())));
    }

    auto sender = stakes_.GetAccount(tx.GetFrom());
    if (!sender) {
        return state.Invalid(RejectReason::UNKNOWN_SENDER, "no account " + tx.GetFrom());
    }

    // Swaps of a non-native asset spend that asset; the fee is always native
    const bool tokenSwap = tx.GetType() == TxType::Swap &&
                           *tx.GetPayload().tokenA != NATIVE_TOKEN;
    if (tokenSwap) {
        Amount held = sender->GetTokenBalance(*tx.GetPayload().tokenA);
        if (!AmountAtLeast(held, tx.GetAmount()) || !AmountAtLeast(sender->balance, tx.GetFee())) {
            return state.Invalid(RejectReason::INSUFFICIENT_BALANCE,
                                 tx.GetFrom() + " cannot cover swap of " +
                                 util::FormatNumber(tx.GetAmount()) + " " +
                                 *tx.GetPayload().tokenA);
        }
    } else if (!AmountAtLeast(sender->balance, tx.GetTotalCost())) {
        return state.Invalid(RejectReason::INSUFFICIENT_BALANCE,
                             tx.GetFrom() + " has " + util::FormatNumber(sender->balance) +
                             ", needs " + util::FormatNumber(tx.GetTotalCost()));
    }

    return mempool_.CheckTx(tx, state);
}

bool LedgerEngine::AddTransaction(const Transaction& tx, consensus::ValidationState& state) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!CheckAdmissionLocked(tx, state) || !mempool_.AddTx(tx, state)) {
        LOG_DEBUG(util::LogCategory::MEMPOOL)
            << "Rejected " << tx.GetId() << ": " << state.ToString();
        return false;
    }

    LOG_DEBUG(util::LogCategory::MEMPOOL) << "Admitted " << tx.ToString();
    TryAutoMineLocked();
    return true;
}

void LedgerEngine::TryAutoMineLocked() {
    const size_t pending = mempool_.Size();
    const int64_t sinceLastBlock = util::GetTimeMillis() - lastBlockTime_;

    if (pending >= params_.maxTxPerBlock ||
        (pending > 0 && sinceLastBlock >= params_.blockTimeMs)) {
        LOG_DEBUG(util::LogCategory::MINING)
            << "Auto-mining: " << pending << " pending, "
            << sinceLastBlock << "ms since last block";
        MineBlockLocked();
    }
}

// ============================================================================
// Mining
// ============================================================================

std::optional<Block> LedgerEngine::MineBlock() {
    std::lock_guard<std::mutex> lock(mutex_);
    return MineBlockLocked();
}

std::optional<Block> LedgerEngine::MineBlockLocked() {
    if (mempool_.Empty()) {
        return std::nullopt;
    }

    const Block& parent = chain_.back();
    const uint64_t height = parent.GetIndex() + 1;

    auto producer = stakes_.SelectValidator(height);
    if (!producer) {
        LOG_ERROR(util::LogCategory::MINING) << "No active validator for block " << height;
        return std::nullopt;
    }

    std::vector<Transaction> candidates = mempool_.SelectForBlock(params_.maxTxPerBlock);
    std::vector<Transaction> included;
    std::vector<std::string> failed;
    included.reserve(candidates.size());

    for (const auto& tx : candidates) {
        consensus::ValidationState state;
        if (ApplyTransactionLocked(tx, state)) {
            included.push_back(tx);
        } else {
            LOG_DEBUG(util::LogCategory::LEDGER)
                << "Dropping " << tx.GetId() << ": " << state.ToString();
            failed.push_back(tx.GetId());
        }
    }

    Block block = Block::Create(height, included, parent.GetHash(), *producer,
                                util::GetTimeMillis(), params_.reward);
    auto producerKey = keys_->GetSigningKey(*producer, KeyRole::Producer);
    consensus::ValidationState signState;
    if (producerKey && !block.Sign(*producerKey, signState)) {
        LOG_WARN(util::LogCategory::MINING) << "Cannot sign block " << height << ": "
                                            << signState.ToString();
    } else if (!producerKey) {
        LOG_WARN(util::LogCategory::MINING) << "No producer key for " << *producer;
    }

    for (const auto& tx : included) {
        txIndex_[tx.GetId()] = height;
    }
    lastBlockTime_ = block.GetTimestamp();
    chain_.push_back(block);

    stakes_.RecordBlockProduced(*producer, height);
    if (block.GetReward() > 0.0) {
        PayRewardLocked(block);
    }

    mempool_.RemoveForBlock(included);
    mempool_.RemoveTxs(failed, MempoolRemovalReason::FAILED);

    LOG_INFO(util::LogCategory::MINING)
        << "Block " << height << " by " << *producer << ": "
        << included.size() << " txs, " << failed.size() << " dropped, reward "
        << util::FormatNumber(block.GetReward());
    return block;
}

void LedgerEngine::PayRewardLocked(const Block& block) {
    // Fees already left the senders; only the issued part comes from the reserve
    Amount issued = std::max(0.0, block.GetReward() - block.GetTotalFees());
    Amount payout = block.GetReward();

    consensus::ValidationState state;
    if (issued > 0.0 && !stakes_.Debit(RESERVE_ADDRESS, issued, state)) {
        Amount available = stakes_.GetBalance(RESERVE_ADDRESS);
        LOG_WARN(util::LogCategory::LEDGER)
            << "Reserve cannot fund block " << block.GetIndex() << " reward: "
            << state.ToString();
        consensus::ValidationState partial;
        if (available > 0.0 && stakes_.Debit(RESERVE_ADDRESS, available, partial)) {
            payout = block.GetTotalFees() + available;
        } else {
            payout = block.GetTotalFees();
        }
    }

    if (!stakes_.DistributeStakingRewards(payout, block.GetProducer())) {
        // Producer left the registry; keep the supply whole by paying it directly
        stakes_.Credit(block.GetProducer(), payout);
    }
}

// ============================================================================
// Transaction Application
// ============================================================================

bool LedgerEngine::ApplyTransactionLocked(const Transaction& tx,
                                          consensus::ValidationState& state) {
    if (txIndex_.count(tx.GetId()) > 0) {
        return state.Invalid(RejectReason::TX_ALREADY_MINED, tx.GetId());
    }

    switch (tx.GetType()) {
        case TxType::Transfer: return ApplyTransferLocked(tx, state);
        case TxType::Stake:    return ApplyStakeLocked(tx, state);
        case TxType::Unstake:  return ApplyUnstakeLocked(tx, state);
        case TxType::Swap:     return ApplySwapLocked(tx, state);
    }
    return state.Invalid(RejectReason::TX_INVALID, "unknown type");
}

bool LedgerEngine::ApplyTransferLocked(const Transaction& tx,
                                       consensus::ValidationState& state) {
    if (!stakes_.Debit(tx.GetFrom(), tx.GetTotalCost(), state)) {
        return false;
    }
    stakes_.Credit(tx.GetTo(), tx.GetAmount());
    stakes_.IncrementNonce(tx.GetFrom());
    return true;
}

bool LedgerEngine::ApplyStakeLocked(const Transaction& tx, consensus::ValidationState& state) {
    if (!stakes_.Stake(tx.GetFrom(), tx.GetStakeTarget(), tx.GetAmount(), state, tx.GetFee())) {
        return false;
    }
    stakes_.IncrementNonce(tx.GetFrom());
    return true;
}

bool LedgerEngine::ApplyUnstakeLocked(const Transaction& tx,
                                      consensus::ValidationState& state) {
    if (!stakes_.Unstake(tx.GetFrom(), tx.GetStakeTarget(), tx.GetAmount(), state,
                         tx.GetFee())) {
        return false;
    }
    stakes_.IncrementNonce(tx.GetFrom());
    return true;
}

bool LedgerEngine::ApplySwapLocked(const Transaction& tx, consensus::ValidationState& state) {
    const TxPayload& payload = tx.GetPayload();
    if (!payload.tokenA || !payload.tokenB) {
        return state.Invalid(RejectReason::SWAP_BAD_PAYLOAD, "swap without tokens");
    }
    const std::string& tokenIn = *payload.tokenA;
    const std::string& tokenOut = *payload.tokenB;

    auto poolIt = pools_.find(swap::MakePairKey(tokenIn, tokenOut));
    if (poolIt == pools_.end()) {
        return state.Invalid(RejectReason::NO_POOL,
                             "no pool for " + swap::MakePairKey(tokenIn, tokenOut));
    }
    swap::SwapPool& pool = poolIt->second;

    auto amountOut = swap::ComputeSwapOutput(pool, tokenIn, tx.GetAmount());
    if (!amountOut) {
        return state.Invalid(RejectReason::BAD_POOL, "pool cannot price " + tokenIn);
    }
    const Amount minOut = payload.minAmountOut.value_or(0.0);
    if (*amountOut < minOut) {
        return state.Invalid(RejectReason::SLIPPAGE,
                             "output " + util::FormatNumber(*amountOut) + " below minimum " +
                             util::FormatNumber(minOut));
    }

    // Take the input and the native fee; refund the fee if the input is short
    if (tokenIn == NATIVE_TOKEN) {
        if (!stakes_.Debit(tx.GetFrom(), tx.GetTotalCost(), state)) {
            return false;
        }
    } else {
        if (!stakes_.Debit(tx.GetFrom(), tx.GetFee(), state)) {
            return false;
        }
        if (!stakes_.DebitToken(tx.GetFrom(), tokenIn, tx.GetAmount(), state)) {
            stakes_.Credit(tx.GetFrom(), tx.GetFee());
            return false;
        }
    }

    pool.Apply(tokenIn, tx.GetAmount(), *amountOut);
    stakes_.CreditToken(tx.GetFrom(), tokenOut, *amountOut);
    stakes_.IncrementNonce(tx.GetFrom());

    LOG_DEBUG(util::LogCategory::SWAP)
        << tx.GetFrom() << " swapped " << util::FormatNumber(tx.GetAmount()) << " " << tokenIn
        << " for " << util::FormatNumber(*amountOut) << " " << tokenOut;
    return true;
}

// ============================================================================
// Supply Operations
// ============================================================================

bool LedgerEngine::CreateSwapPool(const std::string& tokenA, const std::string& tokenB,
                                  Amount reserveA, Amount reserveB,
                                  consensus::ValidationState& state) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (tokenA.empty() || tokenB.empty() || tokenA == tokenB) {
        return state.Invalid(RejectReason::BAD_POOL, "pool needs two distinct tokens");
    }
    if (!(reserveA > 0.0) || !(reserveB > 0.0)) {
        return state.Invalid(RejectReason::BAD_POOL, "pool reserves must be positive");
    }
    const std::string key = swap::MakePairKey(tokenA, tokenB);
    if (pools_.count(key) > 0) {
        return state.Invalid(RejectReason::POOL_EXISTS, key);
    }

    Amount nativeLiquidity = 0.0;
    if (tokenA == NATIVE_TOKEN) {
        nativeLiquidity = reserveA;
    } else if (tokenB == NATIVE_TOKEN) {
        nativeLiquidity = reserveB;
    }
    if (nativeLiquidity > 0.0) {
        consensus::ValidationState debitState;
        if (!stakes_.Debit(RESERVE_ADDRESS, nativeLiquidity, debitState)) {
            return state.Invalid(RejectReason::RESERVE_EXHAUSTED, debitState.GetDebugMessage());
        }
    }

    swap::SwapPool pool(tokenA, tokenB, reserveA, reserveB, params_.swapFee);
    LOG_INFO(util::LogCategory::SWAP)
        << "Created pool " << key << " (" << util::FormatNumber(reserveA) << " " << tokenA
        << " / " << util::FormatNumber(reserveB) << " " << tokenB << ")";
    pools_.emplace(key, std::move(pool));
    return true;
}

bool LedgerEngine::BurnTokens(Amount amount, consensus::ValidationState& state,
                              const Address& holder) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!(amount > 0.0)) {
        return state.Invalid(RejectReason::BAD_BURN_AMOUNT, "burn amount must be positive");
    }
    if (!stakes_.Debit(holder, amount, state)) {
        return false;
    }
    burned_ += amount;

    LOG_INFO(util::LogCategory::LEDGER)
        << "Burned " << util::FormatNumber(amount) << " from " << holder
        << " (total burned " << util::FormatNumber(burned_) << ")";
    return true;
}

Amount LedgerEngine::CompleteUnstaking(const Address& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    return stakes_.CompleteUnstaking(address);
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Block> LedgerEngine::GetBlock(uint64_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= chain_.size()) {
        return std::nullopt;
    }
    return chain_[index];
}

std::optional<Block> LedgerEngine::GetBlockByHash(const Hash256& hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& block : chain_) {
        if (block.GetHash() == hash) {
            return block;
        }
    }
    return std::nullopt;
}

Block LedgerEngine::GetLatestBlock() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chain_.back();
}

size_t LedgerEngine::GetChainLength() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chain_.size();
}

std::optional<Transaction> LedgerEngine::GetTransaction(const std::string& txId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = txIndex_.find(txId);
    if (it == txIndex_.end()) {
        return std::nullopt;
    }
    const Block& block = chain_[it->second];
    int pos = block.FindTransaction(txId);
    if (pos < 0) {
        return std::nullopt;
    }
    return block.GetTransactions()[static_cast<size_t>(pos)];
}

std::optional<uint64_t> LedgerEngine::GetTransactionHeight(const std::string& txId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = txIndex_.find(txId);
    if (it == txIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Amount LedgerEngine::GetBalance(const Address& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stakes_.GetBalance(address);
}

Amount LedgerEngine::GetTokenBalance(const Address& address, const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stakes_.GetTokenBalance(address, symbol);
}

std::optional<Account> LedgerEngine::GetAccount(const Address& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stakes_.GetAccount(address);
}

std::vector<Transaction> LedgerEngine::GetPendingTransactions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mempool_.GetAll();
}

size_t LedgerEngine::GetPendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mempool_.Size();
}

std::optional<swap::SwapPool> LedgerEngine::GetSwapPool(const std::string& tokenA,
                                                        const std::string& tokenB) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(swap::MakePairKey(tokenA, tokenB));
    if (it == pools_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<swap::SwapPool> LedgerEngine::GetSwapPools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<swap::SwapPool> result;
    result.reserve(pools_.size());
    for (const auto& [key, pool] : pools_) {
        result.push_back(pool);
    }
    return result;
}

std::optional<swap::SwapQuote> LedgerEngine::QuoteSwap(const std::string& inputToken,
                                                       const std::string& outputToken,
                                                       Amount amountIn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(swap::MakePairKey(inputToken, outputToken));
    if (it == pools_.end()) {
        return std::nullopt;
    }
    return swap::QuoteSwap(it->second, inputToken, amountIn);
}

std::vector<staking::Validator> LedgerEngine::GetValidators() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stakes_.GetAllValidators();
}

std::vector<staking::StakePosition> LedgerEngine::GetStakePositions(const Address& delegator) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stakes_.GetStakePositions(delegator);
}

staking::StakingStats LedgerEngine::GetStakingStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stakes_.GetStats();
}

// ============================================================================
// Consistency
// ============================================================================

bool LedgerEngine::IsChainValid() const {
    consensus::ValidationState state;
    return IsChainValid(state);
}

bool LedgerEngine::IsChainValid(consensus::ValidationState& state) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!IsChainValidLocked(state)) {
        LOG_WARN(util::LogCategory::VALIDATION) << "Chain invalid: " << state.ToString();
        return false;
    }
    return true;
}

bool LedgerEngine::IsChainValidLocked(consensus::ValidationState& state) const {
    const Timestamp now = util::GetTimeMillis();

    const Block& genesis = chain_.front();
    if (genesis.GetIndex() != 0 || !genesis.GetPreviousHash().IsNull() ||
        !genesis.GetTransactions().empty() || genesis.GetHash() != genesis.ComputeHash()) {
        return state.Invalid(RejectReason::CHAIN_BAD_GENESIS, "genesis block altered");
    }

    std::set<std::string> seen;
    for (size_t i = 1; i < chain_.size(); ++i) {
        const Block& block = chain_[i];
        const Block& previous = chain_[i - 1];

        if (!block.Check(state, now, params_.reward, params_.maxFutureDriftMs)) {
            const std::string reason = state.GetRejectReason();
            return state.Invalid(reason,
                                 "block " + std::to_string(i) + ": " + state.GetDebugMessage());
        }
        if (block.GetIndex() != i) {
            return state.Invalid(RejectReason::BLOCK_BAD_INDEX,
                                 "block at position " + std::to_string(i) + " has index " +
                                 std::to_string(block.GetIndex()));
        }
        if (block.GetPreviousHash() != previous.GetHash()) {
            return state.Invalid(RejectReason::BLOCK_BAD_LINK,
                                 "block " + std::to_string(i) + " does not link to its parent");
        }

        auto key = keys_->GetSigningKey(block.GetProducer(), KeyRole::Producer);
        if (key && !block.VerifySignature(*key)) {
            return state.Invalid(RejectReason::BLOCK_BAD_SIGNATURE,
                                 "block " + std::to_string(i) + " signature");
        }

        for (const auto& tx : block.GetTransactions()) {
            if (!seen.insert(tx.GetId()).second) {
                return state.Invalid(RejectReason::TX_DUPLICATE_ID,
                                     tx.GetId() + " committed twice");
            }
        }
    }
    return true;
}

SupplyInfo LedgerEngine::GetSupplyInfoLocked() const {
    SupplyInfo info;
    info.totalSupply = params_.totalSupply;
    info.burnedTokens = burned_;

    for (const auto& account : stakes_.GetAllAccounts()) {
        if (account.address == RESERVE_ADDRESS) {
            info.reserveBalance += account.balance;
        } else {
            info.circulatingSupply += account.balance;
        }
        info.circulatingSupply += account.stakingRewards;
        info.totalStaked += account.staked;
        info.totalUnbonding += account.unbonding;
    }
    for (const auto& [key, pool] : pools_) {
        info.pooledNative += pool.ReserveOf(NATIVE_TOKEN);
    }
    return info;
}

SupplyInfo LedgerEngine::GetSupplyInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return GetSupplyInfoLocked();
}

bool LedgerEngine::CheckSupplyInvariant(Amount epsilon) const {
    std::lock_guard<std::mutex> lock(mutex_);
    SupplyInfo info = GetSupplyInfoLocked();
    const Amount drift = info.Accounted() - info.totalSupply;
    if (std::fabs(drift) > epsilon) {
        LOG_WARN(util::LogCategory::LEDGER)
            << "Supply drift " << util::FormatNumber(drift) << " exceeds "
            << util::FormatNumber(epsilon);
        return false;
    }
    return true;
}

NetworkStats LedgerEngine::GetNetworkStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    NetworkStats stats;
    SupplyInfo supply = GetSupplyInfoLocked();
    staking::StakingStats stakingStats = stakes_.GetStats();

    stats.totalSupply = supply.totalSupply;
    stats.circulatingSupply = supply.circulatingSupply;
    stats.burnedTokens = supply.burnedTokens;
    stats.totalStaked = supply.totalStaked;
    stats.totalValidators = stakingStats.totalValidators;
    stats.activeValidators = stakingStats.activeValidators;
    stats.chainLength = chain_.size();
    stats.pendingTransactions = mempool_.Size();
    stats.swapPools = pools_.size();

    for (const auto& block : chain_) {
        stats.totalTransactions += block.GetTransactionCount();
    }
    if (chain_.size() > 1) {
        const int64_t span = chain_.back().GetTimestamp() - chain_.front().GetTimestamp();
        stats.averageBlockTimeMs = static_cast<double>(span) / static_cast<double>(chain_.size() - 1);
        if (span > 0) {
            stats.tps = static_cast<double>(stats.totalTransactions) * 1000.0 /
                        static_cast<double>(span);
        }
    }
    return stats;
}

util::JSONValue LedgerEngine::ExportChain() const {
    std::lock_guard<std::mutex> lock(mutex_);

    util::JSONValue::Array blocks;
    blocks.reserve(chain_.size());
    for (const auto& block : chain_) {
        blocks.push_back(block.ToJSON());
    }

    util::JSONValue::Array pending;
    for (const auto& tx : mempool_.GetAll()) {
        pending.push_back(tx.ToJSON());
    }

    util::JSONValue::Array pairs;
    for (const auto& [key, pool] : pools_) {
        util::JSONValue::Array entry;
        entry.push_back(util::JSONValue(key));
        entry.push_back(pool.ToJSON());
        pairs.push_back(util::JSONValue(std::move(entry)));
    }

    util::JSONValue::Object accounts;
    for (const auto& account : stakes_.GetAllAccounts()) {
        accounts[account.address] = account.ToJSON();
    }

    util::JSONValue::Array validators;
    for (const auto& validator : stakes_.GetAllValidators()) {
        validators.push_back(validator.ToJSON());
    }

    SupplyInfo supply = GetSupplyInfoLocked();

    util::JSONValue::Object obj;
    obj["chain"] = util::JSONValue(std::move(blocks));
    obj["pendingTransactions"] = util::JSONValue(std::move(pending));
    obj["totalSupply"] = supply.totalSupply;
    obj["circulatingSupply"] = supply.circulatingSupply;
    obj["burnedTokens"] = supply.burnedTokens;
    obj["swapPairs"] = util::JSONValue(std::move(pairs));
    obj["accounts"] = util::JSONValue(std::move(accounts));
    obj["validators"] = util::JSONValue(std::move(validators));
    return util::JSONValue(std::move(obj));
}

} // namespace chain
} // namespace vindex
