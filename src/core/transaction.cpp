// VINDEX - Transaction Implementation
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include "vindex/core/transaction.h"
#include "vindex/core/random.h"
#include "vindex/crypto/keys.h"
#include "vindex/crypto/sha256.h"
#include "vindex/util/time.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace vindex {

using consensus::RejectReason::TX_BAD_AMOUNT;
using consensus::RejectReason::TX_BAD_FEE;
using consensus::RejectReason::TX_MISSING_FIELD;
using consensus::RejectReason::TX_SELF_TRANSFER;
using consensus::RejectReason::TX_TIME_TOO_NEW;
using consensus::RejectReason::TX_TOO_OLD;

// ============================================================================
// Transaction Type
// ============================================================================

const char* TxTypeToString(TxType type) {
    switch (type) {
        case TxType::Transfer: return "transfer";
        case TxType::Stake:    return "stake";
        case TxType::Unstake:  return "unstake";
        case TxType::Swap:     return "swap";
    }
    return "unknown";
}

std::optional<TxType> TxTypeFromString(const std::string& str) {
    if (str == "transfer") return TxType::Transfer;
    if (str == "stake")    return TxType::Stake;
    if (str == "unstake")  return TxType::Unstake;
    if (str == "swap")     return TxType::Swap;
    return std::nullopt;
}

// ============================================================================
// Fee Policy
// ============================================================================

double FeeMultiplier(TxType type) {
    switch (type) {
        case TxType::Transfer: return 1.0;
        case TxType::Stake:    return 2.0;
        case TxType::Unstake:  return 3.0;
        case TxType::Swap:     return 1.5;
    }
    return 1.0;
}

Amount CalculateFee(TxType type, Amount amount) {
    Amount fee = BASE_FEE * FeeMultiplier(type);
    fee += amount * PROPORTIONAL_FEE_RATE;
    if (amount > LARGE_AMOUNT_THRESHOLD) {
        fee += (amount - LARGE_AMOUNT_THRESHOLD) * LARGE_AMOUNT_FEE_RATE;
    }
    return std::max(fee, BASE_FEE);
}

// ============================================================================
// Payload
// ============================================================================

util::JSONValue TxPayload::ToJSON() const {
    util::JSONValue::Object obj;
    if (validator) obj["validator"] = *validator;
    if (tokenA) obj["tokenA"] = *tokenA;
    if (tokenB) obj["tokenB"] = *tokenB;
    if (minAmountOut) obj["minAmountOut"] = *minAmountOut;
    return util::JSONValue(std::move(obj));
}

TxPayload TxPayload::FromJSON(const util::JSONValue& json) {
    TxPayload payload;
    if (json.IsNull()) {
        return payload;
    }
    if (!json.IsObject()) {
        throw std::invalid_argument("transaction data must be an object");
    }

    auto readString = [&json](const char* key) -> std::optional<std::string> {
        const util::JSONValue& value = json[key];
        if (value.IsNull()) return std::nullopt;
        if (!value.IsString()) {
            throw std::invalid_argument(std::string("data.") + key + " must be a string");
        }
        return value.GetString();
    };

    payload.validator = readString("validator");
    payload.tokenA = readString("tokenA");
    payload.tokenB = readString("tokenB");

    const util::JSONValue& minOut = json["minAmountOut"];
    if (!minOut.IsNull()) {
        if (!minOut.IsNumber()) {
            throw std::invalid_argument("data.minAmountOut must be a number");
        }
        payload.minAmountOut = minOut.GetDouble();
    }
    return payload;
}

bool TxPayload::operator==(const TxPayload& other) const {
    return validator == other.validator && tokenA == other.tokenA &&
           tokenB == other.tokenB && minAmountOut == other.minAmountOut;
}

// ============================================================================
// Construction
// ============================================================================

Transaction Transaction::Create(const Address& from, const Address& to, Amount amount,
                                TxType type, TxPayload payload) {
    return CreateAt(from, to, amount, type, std::move(payload), util::GetTimeMillis());
}

Transaction Transaction::CreateAt(const Address& from, const Address& to, Amount amount,
                                  TxType type, TxPayload payload, Timestamp timestamp) {
    Transaction tx;
    tx.id_ = GenerateUUID();
    tx.from_ = from;
    tx.to_ = to;
    tx.amount_ = amount;
    tx.fee_ = CalculateFee(type, amount);
    tx.timestamp_ = timestamp;
    tx.type_ = type;
    tx.payload_ = std::move(payload);
    return tx;
}

Transaction Transaction::FromJSON(const util::JSONValue& json) {
    if (!json.IsObject()) {
        throw std::invalid_argument("transaction must be a JSON object");
    }

    auto requireString = [&json](const char* key) -> const std::string& {
        const util::JSONValue& value = json[key];
        if (!value.IsString()) {
            throw std::invalid_argument(std::string("transaction field '") + key +
                                        "' must be a string");
        }
        return value.GetString();
    };
    auto requireNumber = [&json](const char* key) -> const util::JSONValue& {
        const util::JSONValue& value = json[key];
        if (!value.IsNumber()) {
            throw std::invalid_argument(std::string("transaction field '") + key +
                                        "' must be a number");
        }
        return value;
    };

    Transaction tx;
    tx.id_ = requireString("id");
    tx.from_ = requireString("from");
    tx.to_ = requireString("to");
    tx.amount_ = requireNumber("amount").GetDouble();
    tx.fee_ = requireNumber("fee").GetDouble();
    tx.timestamp_ = requireNumber("timestamp").GetInt();

    auto type = TxTypeFromString(requireString("type"));
    if (!type) {
        throw std::invalid_argument("unknown transaction type: " + json["type"].GetString());
    }
    tx.type_ = *type;

    tx.payload_ = TxPayload::FromJSON(json["data"]);

    const util::JSONValue& signature = json["signature"];
    if (signature.IsString()) {
        tx.signature_ = signature.GetString();
    } else if (!signature.IsNull()) {
        throw std::invalid_argument("transaction field 'signature' must be a string");
    }
    return tx;
}

// ============================================================================
// Digest and Signature
// ============================================================================

Hash256 Transaction::GetContentDigest() const {
    SHA256 hasher;
    hasher.Write(from_)
          .Write(to_)
          .Write(util::FormatNumber(amount_))
          .Write(util::FormatNumber(fee_))
          .Write(std::to_string(timestamp_))
          .Write(std::string(TxTypeToString(type_)))
          .Write(payload_.ToJSON().ToJSON());
    return hasher.Finalize();
}

void Transaction::Sign(const std::string& key) {
    signature_ = SignDigest(GetContentDigest(), key);
}

bool Transaction::VerifySignature(const std::string& key) const {
    if (!IsSigned()) {
        return false;
    }
    return VerifyDigestSignature(GetContentDigest(), signature_, key);
}

// ============================================================================
// Validation
// ============================================================================

bool Transaction::Check(consensus::ValidationState& state, Timestamp now,
                        const TxLimits& limits) const {
    if (id_.empty()) {
        return state.Invalid(TX_MISSING_FIELD, "empty transaction id");
    }
    if (from_.empty() || to_.empty()) {
        return state.Invalid(TX_MISSING_FIELD, "empty sender or recipient");
    }
    if (!(amount_ > 0.0)) {
        return state.Invalid(TX_BAD_AMOUNT, "amount must be positive");
    }
    if (!(fee_ >= 0.0)) {
        return state.Invalid(TX_BAD_FEE, "negative fee");
    }
    if (from_ == to_ && type_ != TxType::Stake) {
        return state.Invalid(TX_SELF_TRANSFER, "sender equals recipient");
    }
    if (timestamp_ < now - limits.maxAgeMs) {
        return state.Invalid(TX_TOO_OLD, "timestamp " + std::to_string(timestamp_) +
                             " older than allowed window");
    }
    if (timestamp_ > now + limits.maxFutureDriftMs) {
        return state.Invalid(TX_TIME_TOO_NEW, "timestamp " + std::to_string(timestamp_) +
                             " too far in the future");
    }

    switch (type_) {
        case TxType::Stake:
            if (!AmountAtLeast(amount_, limits.minStake)) {
                return state.Invalid(consensus::RejectReason::STAKE_BELOW_MINIMUM,
                                     "stake " + util::FormatNumber(amount_) +
                                     " below minimum " + util::FormatNumber(limits.minStake));
            }
            break;
        case TxType::Swap:
            if (!payload_.tokenA || !payload_.tokenB ||
                payload_.tokenA->empty() || payload_.tokenB->empty()) {
                return state.Invalid(consensus::RejectReason::SWAP_BAD_PAYLOAD,
                                     "swap must name tokenA and tokenB");
            }
            if (*payload_.tokenA == *payload_.tokenB) {
                return state.Invalid(consensus::RejectReason::SWAP_BAD_PAYLOAD,
                                     "swap tokens must differ");
            }
            if (payload_.minAmountOut && *payload_.minAmountOut < 0.0) {
                return state.Invalid(consensus::RejectReason::SWAP_BAD_PAYLOAD,
                                     "negative minAmountOut");
            }
            break;
        case TxType::Transfer:
        case TxType::Unstake:
            break;
    }
    return true;
}

bool Transaction::IsValid() const {
    consensus::ValidationState state;
    return Check(state, util::GetTimeMillis());
}

// ============================================================================
// Serialization
// ============================================================================

util::JSONValue Transaction::ToJSON() const {
    util::JSONValue::Object obj;
    obj["id"] = id_;
    obj["from"] = from_;
    obj["to"] = to_;
    obj["amount"] = amount_;
    obj["fee"] = fee_;
    obj["timestamp"] = static_cast<int64_t>(timestamp_);
    obj["signature"] = signature_;
    obj["type"] = TxTypeToString(type_);
    obj["data"] = payload_.ToJSON();
    return util::JSONValue(std::move(obj));
}

std::string Transaction::ToString() const {
    std::ostringstream ss;
    ss << "Transaction(id=" << id_
       << ", type=" << TxTypeToString(type_)
       << ", from=" << from_
       << ", to=" << to_
       << ", amount=" << util::FormatNumber(amount_)
       << ", fee=" << util::FormatNumber(fee_)
       << ", timestamp=" << timestamp_
       << ", signed=" << (IsSigned() ? "yes" : "no") << ")";
    return ss.str();
}

bool Transaction::operator==(const Transaction& other) const {
    return id_ == other.id_ && from_ == other.from_ && to_ == other.to_ &&
           amount_ == other.amount_ && fee_ == other.fee_ &&
           timestamp_ == other.timestamp_ && type_ == other.type_ &&
           payload_ == other.payload_ && signature_ == other.signature_;
}

} // namespace vindex
