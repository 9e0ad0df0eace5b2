// VINDEX - Stake Ledger Implementation
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include "vindex/staking/staking.h"
#include "vindex/util/logging.h"
#include "vindex/util/time.h"

#include <algorithm>
#include <sstream>

namespace vindex {
namespace staking {

namespace RejectReason = consensus::RejectReason;

// ============================================================================
// Validator / StakePosition
// ============================================================================

util::JSONValue Validator::ToJSON() const {
    util::JSONValue::Object obj;
    obj["address"] = address;
    obj["selfStake"] = selfStake;
    obj["totalStake"] = totalStake;
    obj["commissionRate"] = commissionRate;
    obj["active"] = active;
    obj["blocksProduced"] = static_cast<uint64_t>(blocksProduced);
    obj["lastActiveBlock"] = static_cast<uint64_t>(lastActiveBlock);
    return util::JSONValue(std::move(obj));
}

std::string Validator::ToString() const {
    std::ostringstream ss;
    ss << "Validator(" << address
       << ", stake=" << util::FormatNumber(totalStake)
       << ", self=" << util::FormatNumber(selfStake)
       << ", commission=" << commissionRate
       << ", " << (active ? "active" : "inactive")
       << ", blocks=" << blocksProduced << ")";
    return ss.str();
}

util::JSONValue StakePosition::ToJSON() const {
    util::JSONValue::Object obj;
    obj["delegator"] = delegator;
    obj["validator"] = validator;
    obj["amount"] = amount;
    obj["unbondingAmount"] = unbondingAmount;
    obj["unlockTime"] = unlockTime ? util::JSONValue(static_cast<int64_t>(*unlockTime))
                                   : util::JSONValue();
    obj["rewards"] = rewards;
    return util::JSONValue(std::move(obj));
}

util::JSONValue StakingStats::ToJSON() const {
    util::JSONValue::Object obj;
    obj["totalValidators"] = static_cast<uint64_t>(totalValidators);
    obj["activeValidators"] = static_cast<uint64_t>(activeValidators);
    obj["maxValidators"] = static_cast<uint64_t>(maxValidators);
    obj["totalAccounts"] = static_cast<uint64_t>(totalAccounts);
    obj["totalPositions"] = static_cast<uint64_t>(totalPositions);
    obj["totalStaked"] = totalStaked;
    obj["totalUnbonding"] = totalUnbonding;
    obj["minStake"] = minStake;
    obj["unbondingPeriodMs"] = static_cast<int64_t>(unbondingMs);
    return util::JSONValue(std::move(obj));
}

std::vector<GenesisValidator> DefaultGenesisValidators() {
    return {
        {"vindex_genesis_validator_1", 1000000.0, 0.05},
        {"vindex_genesis_validator_2", 800000.0, 0.04},
        {"vindex_genesis_validator_3", 600000.0, 0.06},
    };
}

// ============================================================================
// Construction
// ============================================================================

StakeLedger::StakeLedger(const consensus::ChainParams& params,
                         std::unique_ptr<LeaderSelector> selector)
    : params_(params), selector_(std::move(selector)) {
    if (!selector_) {
        selector_ = std::make_unique<LcgLeaderSelector>();
    }
}

void StakeLedger::InitializeGenesis(const std::vector<GenesisValidator>& validators) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& genesis : validators) {
        Account& account = GetOrCreateAccountLocked(genesis.address);
        account.staked += genesis.selfStake;
        account.isValidator = true;

        auto [it, inserted] = validators_.emplace(genesis.address, Validator());
        Validator& validator = it->second;
        if (inserted) {
            validator.address = genesis.address;
            validator.commissionRate = genesis.commissionRate;
            validatorOrder_.push_back(genesis.address);
        }
        validator.selfStake += genesis.selfStake;
        validator.totalStake += genesis.selfStake;
        UpdateActivationLocked(validator);

        StakePosition& position = positions_[{genesis.address, genesis.address}];
        position.delegator = genesis.address;
        position.validator = genesis.address;
        position.amount += genesis.selfStake;

        LOG_DEBUG(util::LogCategory::STAKING) << "Genesis " << validator.ToString();
    }
}

// ============================================================================
// Internal Helpers
// ============================================================================

Account& StakeLedger::GetOrCreateAccountLocked(const Address& address) {
    auto it = accounts_.find(address);
    if (it == accounts_.end()) {
        it = accounts_.emplace(address, Account(address)).first;
    }
    return it->second;
}

Amount StakeLedger::SpendableLocked(const Address& address) const {
    auto it = accounts_.find(address);
    return it == accounts_.end() ? 0.0 : it->second.balance;
}

void StakeLedger::UpdateActivationLocked(Validator& validator) {
    bool shouldBeActive = AmountAtLeast(validator.totalStake, params_.minStake);
    if (shouldBeActive != validator.active) {
        validator.active = shouldBeActive;
        LOG_INFO(util::LogCategory::STAKING)
            << "Validator " << validator.address
            << (shouldBeActive ? " activated" : " deactivated")
            << " (stake " << util::FormatNumber(validator.totalStake) << ")";
    }
}

std::vector<LeaderCandidate> StakeLedger::ActiveCandidatesLocked() const {
    std::vector<LeaderCandidate> candidates;
    for (const auto& address : validatorOrder_) {
        const Validator& validator = validators_.at(address);
        if (validator.active) {
            candidates.push_back({validator.address, validator.totalStake});
        }
    }
    return candidates;
}

// ============================================================================
// Accounts
// ============================================================================

bool StakeLedger::CreateAccount(const Address& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (address.empty() || accounts_.count(address) > 0) {
        return false;
    }
    accounts_.emplace(address, Account(address));
    return true;
}

bool StakeLedger::HasAccount(const Address& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.count(address) > 0;
}

void StakeLedger::Credit(const Address& address, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    GetOrCreateAccountLocked(address).balance += amount;
}

bool StakeLedger::Debit(const Address& address, Amount amount,
                        consensus::ValidationState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(address);
    if (it == accounts_.end()) {
        return state.Invalid(RejectReason::UNKNOWN_SENDER, "no account " + address);
    }
    if (!AmountAtLeast(it->second.balance, amount)) {
        return state.Invalid(RejectReason::INSUFFICIENT_BALANCE,
                             address + " has " + util::FormatNumber(it->second.balance) +
                             ", needs " + util::FormatNumber(amount));
    }
    it->second.balance -= amount;
    return true;
}

void StakeLedger::CreditToken(const Address& address, const std::string& symbol,
                              Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    Account& account = GetOrCreateAccountLocked(address);
    if (symbol == NATIVE_TOKEN) {
        account.balance += amount;
    } else {
        account.tokens[symbol] += amount;
    }
}

bool StakeLedger::DebitToken(const Address& address, const std::string& symbol,
                             Amount amount, consensus::ValidationState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(address);
    if (it == accounts_.end()) {
        return state.Invalid(RejectReason::UNKNOWN_SENDER, "no account " + address);
    }
    Account& account = it->second;
    Amount available = account.GetTokenBalance(symbol);
    if (!AmountAtLeast(available, amount)) {
        return state.Invalid(RejectReason::INSUFFICIENT_BALANCE,
                             address + " has " + util::FormatNumber(available) + " " +
                             symbol + ", needs " + util::FormatNumber(amount));
    }
    if (symbol == NATIVE_TOKEN) {
        account.balance -= amount;
    } else {
        account.tokens[symbol] -= amount;
    }
    return true;
}

Amount StakeLedger::GetTokenBalance(const Address& address, const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(address);
    return it == accounts_.end() ? 0.0 : it->second.GetTokenBalance(symbol);
}

void StakeLedger::IncrementNonce(const Address& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++GetOrCreateAccountLocked(address).nonce;
}

Amount StakeLedger::GetBalance(const Address& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return SpendableLocked(address);
}

std::optional<Account> StakeLedger::GetAccount(const Address& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(address);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Account> StakeLedger::GetAllAccounts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Account> result;
    result.reserve(accounts_.size());
    for (const auto& [address, account] : accounts_) {
        result.push_back(account);
    }
    return result;
}

// ============================================================================
// Staking
// ============================================================================

bool StakeLedger::Stake(const Address& delegator, const Address& validatorAddress,
                        Amount amount, consensus::ValidationState& state,
                        Amount extraDebit) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!AmountAtLeast(amount, params_.minStake)) {
        return state.Invalid(RejectReason::STAKE_BELOW_MINIMUM,
                             "stake " + util::FormatNumber(amount) + " below minimum " +
                             util::FormatNumber(params_.minStake));
    }
    auto accountIt = accounts_.find(delegator);
    if (accountIt == accounts_.end()) {
        return state.Invalid(RejectReason::UNKNOWN_SENDER, "no account " + delegator);
    }
    if (!AmountAtLeast(accountIt->second.balance, amount + extraDebit)) {
        return state.Invalid(RejectReason::INSUFFICIENT_BALANCE,
                             delegator + " has " + util::FormatNumber(accountIt->second.balance) +
                             ", needs " + util::FormatNumber(amount + extraDebit));
    }

    const bool selfBond = delegator == validatorAddress;
    auto validatorIt = validators_.find(validatorAddress);
    if (validatorIt == validators_.end()) {
        if (!selfBond) {
            return state.Invalid(RejectReason::UNKNOWN_VALIDATOR,
                                 "no validator " + validatorAddress);
        }
        if (validators_.size() >= params_.maxValidators) {
            return state.Invalid(RejectReason::VALIDATOR_SET_FULL,
                                 "registry holds " + std::to_string(validators_.size()) +
                                 " validators");
        }
    }

    // All checks passed; mutate.
    if (validatorIt == validators_.end()) {
        Validator fresh;
        fresh.address = validatorAddress;
        fresh.commissionRate = params_.defaultCommission;
        validatorIt = validators_.emplace(validatorAddress, fresh).first;
        validatorOrder_.push_back(validatorAddress);
        LOG_INFO(util::LogCategory::STAKING) << "Registered validator " << validatorAddress;
    }
    Validator& validator = validatorIt->second;

    Account& account = accountIt->second;
    account.balance -= amount + extraDebit;
    account.staked += amount;
    if (selfBond) {
        account.isValidator = true;
        validator.selfStake += amount;
    }
    validator.totalStake += amount;
    UpdateActivationLocked(validator);

    StakePosition& position = positions_[{delegator, validatorAddress}];
    position.delegator = delegator;
    position.validator = validatorAddress;
    position.amount += amount;

    LOG_DEBUG(util::LogCategory::STAKING)
        << delegator << " staked " << util::FormatNumber(amount) << " to " << validatorAddress;
    return true;
}

bool StakeLedger::Unstake(const Address& delegator, const Address& validatorAddress,
                          Amount amount, consensus::ValidationState& state,
                          Amount extraDebit) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!(amount > 0.0)) {
        return state.Invalid(consensus::RejectReason::TX_BAD_AMOUNT, "unstake amount must be positive");
    }
    auto positionIt = positions_.find({delegator, validatorAddress});
    if (positionIt == positions_.end() ||
        !AmountAtLeast(positionIt->second.amount, amount)) {
        Amount bonded = positionIt == positions_.end() ? 0.0 : positionIt->second.amount;
        return state.Invalid(RejectReason::INSUFFICIENT_STAKE,
                             delegator + " has " + util::FormatNumber(bonded) +
                             " bonded to " + validatorAddress);
    }
    auto accountIt = accounts_.find(delegator);
    if (accountIt == accounts_.end()) {
        return state.Invalid(RejectReason::UNKNOWN_SENDER, "no account " + delegator);
    }
    if (!AmountAtLeast(accountIt->second.balance, extraDebit)) {
        return state.Invalid(RejectReason::INSUFFICIENT_BALANCE,
                             delegator + " cannot pay " + util::FormatNumber(extraDebit));
    }

    StakePosition& position = positionIt->second;
    Account& account = accountIt->second;

    position.amount -= amount;
    position.unbondingAmount += amount;
    position.unlockTime = util::GetTimeMillis() + params_.unbondingMs;

    account.balance -= extraDebit;
    account.staked -= amount;
    account.unbonding += amount;

    auto validatorIt = validators_.find(validatorAddress);
    if (validatorIt != validators_.end()) {
        Validator& validator = validatorIt->second;
        validator.totalStake -= amount;
        if (delegator == validatorAddress) {
            validator.selfStake = std::max(0.0, validator.selfStake - amount);
        }
        UpdateActivationLocked(validator);
    }

    LOG_DEBUG(util::LogCategory::STAKING)
        << delegator << " unbonding " << util::FormatNumber(amount) << " from "
        << validatorAddress << " until " << *position.unlockTime;
    return true;
}

Amount StakeLedger::CompleteUnstaking(const Address& delegator) {
    std::lock_guard<std::mutex> lock(mutex_);

    const Timestamp now = util::GetTimeMillis();
    Amount released = 0.0;

    for (auto it = positions_.begin(); it != positions_.end();) {
        StakePosition& position = it->second;
        if (position.delegator != delegator || !position.unlockTime ||
            *position.unlockTime > now) {
            ++it;
            continue;
        }
        released += position.unbondingAmount;
        position.unbondingAmount = 0.0;
        position.unlockTime.reset();

        if (position.IsEmpty()) {
            it = positions_.erase(it);
        } else {
            ++it;
        }
    }

    if (released > 0.0) {
        Account& account = GetOrCreateAccountLocked(delegator);
        account.unbonding -= released;
        account.balance += released;
        LOG_DEBUG(util::LogCategory::STAKING)
            << delegator << " released " << util::FormatNumber(released) << " from unbonding";
    }
    return released;
}

// ============================================================================
// Block Production
// ============================================================================

std::optional<Address> StakeLedger::SelectValidator(uint64_t blockIndex) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return selector_->Select(ActiveCandidatesLocked(), blockIndex);
}

void StakeLedger::RecordBlockProduced(const Address& validatorAddress, uint64_t blockIndex) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = validators_.find(validatorAddress);
    if (it == validators_.end()) {
        return;
    }
    ++it->second.blocksProduced;
    it->second.lastActiveBlock = blockIndex;
}

bool StakeLedger::DistributeStakingRewards(Amount reward, const Address& validatorAddress) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto validatorIt = validators_.find(validatorAddress);
    if (validatorIt == validators_.end()) {
        return false;
    }
    const Validator& validator = validatorIt->second;

    const Amount commission = validator.CalculateCommission(reward);
    Amount remainder = reward - commission;
    Account& validatorAccount = GetOrCreateAccountLocked(validatorAddress);
    validatorAccount.stakingRewards += commission;

    if (validator.totalStake > AMOUNT_EPSILON) {
        Amount paid = 0.0;
        for (auto& [key, position] : positions_) {
            if (position.validator != validatorAddress || position.amount <= 0.0) {
                continue;
            }
            Amount share = remainder * (position.amount / validator.totalStake);
            position.rewards += share;
            GetOrCreateAccountLocked(position.delegator).stakingRewards += share;
            paid += share;
        }
        remainder -= paid;
    }
    // Whatever no position absorbed stays with the validator
    validatorAccount.stakingRewards += remainder;

    LOG_DEBUG(util::LogCategory::STAKING)
        << "Distributed " << util::FormatNumber(reward) << " for " << validatorAddress
        << " (commission " << util::FormatNumber(commission) << ")";
    return true;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Validator> StakeLedger::GetValidator(const Address& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = validators_.find(address);
    if (it == validators_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Validator> StakeLedger::GetActiveValidators() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Validator> result;
    for (const auto& address : validatorOrder_) {
        const Validator& validator = validators_.at(address);
        if (validator.active) {
            result.push_back(validator);
        }
    }
    return result;
}

std::vector<Validator> StakeLedger::GetAllValidators() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Validator> result;
    result.reserve(validatorOrder_.size());
    for (const auto& address : validatorOrder_) {
        result.push_back(validators_.at(address));
    }
    return result;
}

std::vector<StakePosition> StakeLedger::GetStakePositions(const Address& delegator) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StakePosition> result;
    for (const auto& [key, position] : positions_) {
        if (key.first == delegator) {
            result.push_back(position);
        }
    }
    return result;
}

Amount StakeLedger::GetTotalStaked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount total = 0.0;
    for (const auto& [address, account] : accounts_) {
        total += account.staked;
    }
    return total;
}

Amount StakeLedger::GetTotalUnbonding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount total = 0.0;
    for (const auto& [address, account] : accounts_) {
        total += account.unbonding;
    }
    return total;
}

StakingStats StakeLedger::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StakingStats stats;
    stats.totalValidators = validators_.size();
    for (const auto& [address, validator] : validators_) {
        if (validator.active) {
            ++stats.activeValidators;
        }
    }
    stats.maxValidators = params_.maxValidators;
    stats.totalAccounts = accounts_.size();
    stats.totalPositions = positions_.size();
    for (const auto& [address, account] : accounts_) {
        stats.totalStaked += account.staked;
        stats.totalUnbonding += account.unbonding;
    }
    stats.minStake = params_.minStake;
    stats.unbondingMs = params_.unbondingMs;
    return stats;
}

} // namespace staking
} // namespace vindex
