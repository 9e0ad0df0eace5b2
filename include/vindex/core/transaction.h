// VINDEX - Transaction
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// Account-model transaction: transfer, stake, unstake or swap. A transaction
// is built once by Create() (or restored by FromJSON()), optionally signed,
// and never mutated afterwards.

#ifndef VINDEX_CORE_TRANSACTION_H
#define VINDEX_CORE_TRANSACTION_H

#include "vindex/consensus/validation.h"
#include "vindex/core/types.h"
#include "vindex/util/json.h"

#include <optional>
#include <string>

namespace vindex {

// ============================================================================
// Transaction Type
// ============================================================================

enum class TxType {
    Transfer,
    Stake,
    Unstake,
    Swap
};

/// "transfer", "stake", "unstake", "swap"
const char* TxTypeToString(TxType type);

/// Inverse of TxTypeToString
std::optional<TxType> TxTypeFromString(const std::string& str);

// ============================================================================
// Fee Policy
// ============================================================================

/// Minimum fee for any transaction
constexpr Amount BASE_FEE = 0.001;

/// Proportional fee on the whole amount (0.01%)
constexpr double PROPORTIONAL_FEE_RATE = 0.0001;

/// Surcharge on the part of the amount above LARGE_AMOUNT_THRESHOLD (0.05%)
constexpr double LARGE_AMOUNT_FEE_RATE = 0.0005;
constexpr Amount LARGE_AMOUNT_THRESHOLD = 1000.0;

/// Base-fee multiplier per type: transfer 1, stake 2, unstake 3, swap 1.5
double FeeMultiplier(TxType type);

/// Fee charged for a transaction of the given type and amount
Amount CalculateFee(TxType type, Amount amount);

// ============================================================================
// Payload
// ============================================================================

/// Type-specific transaction data
struct TxPayload {
    /// Stake/unstake target; the transaction's "to" when absent
    std::optional<Address> validator;

    /// Swap input token symbol
    std::optional<std::string> tokenA;

    /// Swap output token symbol
    std::optional<std::string> tokenB;

    /// Swap slippage guard: minimum acceptable output
    std::optional<Amount> minAmountOut;

    bool IsEmpty() const {
        return !validator && !tokenA && !tokenB && !minAmountOut;
    }

    /// Object with only the fields that are set ("{}" when empty)
    util::JSONValue ToJSON() const;

    /// Reads known fields; throws std::invalid_argument on wrong field types
    static TxPayload FromJSON(const util::JSONValue& json);

    bool operator==(const TxPayload& other) const;
};

// ============================================================================
// Validity Limits
// ============================================================================

struct TxLimits {
    /// Smallest stake a transaction may carry
    Amount minStake{100.0};

    /// Oldest accepted timestamp, relative to now
    int64_t maxAgeMs{10 * 60 * 1000};

    /// Furthest accepted future timestamp, relative to now
    int64_t maxFutureDriftMs{60 * 1000};
};

// ============================================================================
// Transaction
// ============================================================================

class Transaction {
public:
    /// Empty transaction (fails validation)
    Transaction() = default;

    /**
     * Build a new unsigned transaction.
     *
     * Assigns a random UUID id, the current time, and the policy fee.
     */
    static Transaction Create(const Address& from, const Address& to, Amount amount,
                              TxType type, TxPayload payload = TxPayload());

    /// As Create(), with an explicit timestamp (milliseconds)
    static Transaction CreateAt(const Address& from, const Address& to, Amount amount,
                                TxType type, TxPayload payload, Timestamp timestamp);

    /// Restore from wire JSON, keeping id, fee, timestamp and signature as
    /// given. Throws std::invalid_argument on missing or malformed fields.
    static Transaction FromJSON(const util::JSONValue& json);

    // ========================================================================
    // Accessors
    // ========================================================================

    const std::string& GetId() const { return id_; }
    const Address& GetFrom() const { return from_; }
    const Address& GetTo() const { return to_; }
    Amount GetAmount() const { return amount_; }
    Amount GetFee() const { return fee_; }
    Timestamp GetTimestamp() const { return timestamp_; }
    TxType GetType() const { return type_; }
    const TxPayload& GetPayload() const { return payload_; }
    const std::string& GetSignature() const { return signature_; }
    bool IsSigned() const { return !signature_.empty(); }

    /// Validator targeted by a stake/unstake (payload validator or "to")
    const Address& GetStakeTarget() const {
        return payload_.validator ? *payload_.validator : to_;
    }

    /// amount + fee, what a transfer or stake takes from the sender
    Amount GetTotalCost() const { return amount_ + fee_; }

    // ========================================================================
    // Digest and Signature
    // ========================================================================

    /// SHA256 over from, to, amount, fee, timestamp, type and payload JSON
    Hash256 GetContentDigest() const;

    /// Sign the content digest with the given key
    void Sign(const std::string& key);

    /// True if signed and the signature matches key
    bool VerifySignature(const std::string& key) const;

    // ========================================================================
    // Validation
    // ========================================================================

    /**
     * Stateless validity check against a reference time.
     *
     * Requires non-empty parties, amount > 0, fee >= 0, from != to except
     * for stakes, timestamp within [now - maxAge, now + drift], and the
     * per-type minimums (stake >= minStake, swap names both tokens).
     */
    bool Check(consensus::ValidationState& state, Timestamp now,
               const TxLimits& limits = TxLimits()) const;

    /// Check() against the current clock and default limits
    bool IsValid() const;

    // ========================================================================
    // Serialization
    // ========================================================================

    util::JSONValue ToJSON() const;
    std::string ToString() const;

    bool operator==(const Transaction& other) const;
    bool operator!=(const Transaction& other) const { return !(*this == other); }

private:
    std::string id_;
    Address from_;
    Address to_;
    Amount amount_{0.0};
    Amount fee_{0.0};
    Timestamp timestamp_{0};
    TxType type_{TxType::Transfer};
    TxPayload payload_;
    std::string signature_;
};

} // namespace vindex

#endif // VINDEX_CORE_TRANSACTION_H
