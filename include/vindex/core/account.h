// VINDEX - Account
// Copyright (c) 2024 VINDEX Developers
// MIT License

#ifndef VINDEX_CORE_ACCOUNT_H
#define VINDEX_CORE_ACCOUNT_H

#include "vindex/core/types.h"
#include "vindex/util/json.h"

#include <cstdint>
#include <map>
#include <string>

namespace vindex {

/**
 * Ledger account. Created on first credit and never deleted.
 *
 * The native token lives in balance; other swap assets live in tokens.
 * Bonded stake (staked) and stake waiting out the unbonding period
 * (unbonding) are not spendable.
 */
struct Account {
    Address address;
    Amount balance{0.0};
    uint64_t nonce{0};
    Amount staked{0.0};
    Amount unbonding{0.0};
    Amount stakingRewards{0.0};
    bool isValidator{false};
    std::map<std::string, Amount> tokens;

    Account() = default;
    explicit Account(Address addr) : address(std::move(addr)) {}

    /// Balance of a symbol; NATIVE_TOKEN maps to balance
    Amount GetTokenBalance(const std::string& symbol) const {
        if (symbol == NATIVE_TOKEN) {
            return balance;
        }
        auto it = tokens.find(symbol);
        return it == tokens.end() ? 0.0 : it->second;
    }

    util::JSONValue ToJSON() const {
        util::JSONValue::Object obj;
        obj["address"] = address;
        obj["balance"] = balance;
        obj["nonce"] = static_cast<uint64_t>(nonce);
        obj["staked"] = staked;
        obj["unbonding"] = unbonding;
        obj["stakingRewards"] = stakingRewards;
        obj["isValidator"] = isValidator;
        util::JSONValue::Object tokenObj;
        for (const auto& [symbol, amount] : tokens) {
            tokenObj[symbol] = amount;
        }
        obj["tokens"] = util::JSONValue(std::move(tokenObj));
        return util::JSONValue(std::move(obj));
    }
};

} // namespace vindex

#endif // VINDEX_CORE_ACCOUNT_H
