// VINDEX - Block Implementation
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include "vindex/core/block.h"
#include "vindex/core/merkle.h"
#include "vindex/crypto/keys.h"
#include "vindex/crypto/sha256.h"
#include "vindex/util/time.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace vindex {

namespace RejectReason = consensus::RejectReason;

// ============================================================================
// Reward Schedule
// ============================================================================

Amount RewardSchedule::BaseComponent(uint64_t index) const {
    if (halvingInterval == 0) {
        return baseReward;
    }
    uint64_t halvings = index / halvingInterval;
    if (halvings >= 64) {
        return 0.0;
    }
    return std::ldexp(baseReward, -static_cast<int>(halvings));
}

Amount RewardSchedule::TxBonus(size_t txCount) const {
    return std::min(perTxBonus * static_cast<double>(txCount), maxTxBonus);
}

Amount RewardSchedule::Compute(uint64_t index, size_t txCount, Amount totalFees) const {
    if (txCount == 0) {
        return 0.0;
    }
    return BaseComponent(index) + TxBonus(txCount) + totalFees;
}

// ============================================================================
// Construction
// ============================================================================

Block Block::Create(uint64_t index, std::vector<Transaction> transactions,
                    const Hash256& previousHash, const Address& producer,
                    Timestamp timestamp, const RewardSchedule& schedule) {
    Block block;
    block.index_ = index;
    block.timestamp_ = timestamp;
    block.transactions_ = std::move(transactions);
    block.previousHash_ = previousHash;
    block.producer_ = producer;
    block.Derive(schedule);
    return block;
}

Block Block::CreateGenesis(Timestamp timestamp) {
    Block genesis = Create(0, {}, Hash256(), GENESIS_PRODUCER, timestamp);
    genesis.signature_ = GENESIS_SIGNATURE;
    return genesis;
}

void Block::Derive(const RewardSchedule& schedule) {
    transactionCount_ = transactions_.size();
    totalFees_ = 0.0;
    for (const auto& tx : transactions_) {
        totalFees_ += tx.GetFee();
    }
    reward_ = schedule.Compute(index_, transactionCount_, totalFees_);
    merkleRoot_ = ComputeMerkleRoot();
    stateRoot_ = ComputeStateRoot();
    hash_ = ComputeHash();
}

int Block::FindTransaction(const std::string& txId) const {
    for (size_t i = 0; i < transactions_.size(); ++i) {
        if (transactions_[i].GetId() == txId) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

// ============================================================================
// Mutation
// ============================================================================

bool Block::AddTransaction(const Transaction& tx, consensus::ValidationState& state,
                           const RewardSchedule& schedule) {
    if (IsSigned()) {
        return state.Invalid(RejectReason::BLOCK_SIGNED,
                             "block " + std::to_string(index_) + " is signed and immutable");
    }
    transactions_.push_back(tx);
    Derive(schedule);
    return true;
}

bool Block::Sign(const std::string& key, consensus::ValidationState& state) {
    if (IsSigned()) {
        return state.Invalid(RejectReason::BLOCK_SIGNED,
                             "block " + std::to_string(index_) + " is already signed");
    }
    hash_ = ComputeHash();
    signature_ = SignDigest(hash_, key);
    return true;
}

bool Block::VerifySignature(const std::string& key) const {
    if (!IsSigned()) {
        return false;
    }
    return VerifyDigestSignature(hash_, signature_, key);
}

// ============================================================================
// Digests
// ============================================================================

std::vector<Hash256> Block::GetTransactionDigests() const {
    std::vector<Hash256> digests;
    digests.reserve(transactions_.size());
    for (const auto& tx : transactions_) {
        digests.push_back(tx.GetContentDigest());
    }
    return digests;
}

Hash256 Block::ComputeMerkleRoot() const {
    return vindex::ComputeMerkleRoot(GetTransactionDigests());
}

Hash256 Block::ComputeStateRoot() const {
    util::JSONValue::Object summary;
    summary["blockIndex"] = static_cast<uint64_t>(index_);
    summary["timestamp"] = static_cast<int64_t>(timestamp_);
    summary["transactionCount"] = static_cast<uint64_t>(transactionCount_);
    summary["totalFees"] = totalFees_;
    summary["validator"] = producer_;
    return SHA256Hash(util::JSONValue(std::move(summary)).ToJSON());
}

Hash256 Block::ComputeHash() const {
    SHA256 hasher;
    hasher.Write(std::to_string(index_))
          .Write(std::to_string(timestamp_))
          .Write(EncodeParentHash(previousHash_))
          .Write(merkleRoot_.ToHex())
          .Write(stateRoot_.ToHex())
          .Write(producer_)
          .Write(std::to_string(nonce_))
          .Write(std::to_string(transactionCount_))
          .Write(util::FormatNumber(totalFees_));
    return hasher.Finalize();
}

std::string Block::EncodeParentHash(const Hash256& hash) {
    return hash.IsNull() ? "0" : hash.ToHex();
}

// ============================================================================
// Validation
// ============================================================================

bool Block::Check(consensus::ValidationState& state, Timestamp now,
                  const RewardSchedule& schedule, int64_t maxFutureDriftMs) const {
    if (index_ > 0 && previousHash_.IsNull()) {
        return state.Invalid(RejectReason::BLOCK_BAD_PARENT, "missing previous hash");
    }
    if (producer_.empty()) {
        return state.Invalid(RejectReason::BLOCK_BAD_PRODUCER, "missing producer");
    }
    if (transactionCount_ != transactions_.size()) {
        return state.Invalid(RejectReason::BLOCK_BAD_TX_COUNT,
                             "transactionCount " + std::to_string(transactionCount_) +
                             " but " + std::to_string(transactions_.size()) + " transactions");
    }
    for (const auto& tx : transactions_) {
        if (tx.GetId().empty() || tx.GetAmount() < 0.0) {
            return state.Invalid(RejectReason::BLOCK_BAD_TX,
                                 "malformed transaction '" + tx.GetId() + "'");
        }
    }
    if (merkleRoot_ != ComputeMerkleRoot()) {
        return state.Invalid(RejectReason::BLOCK_BAD_MERKLE_ROOT, "merkle root mismatch");
    }
    if (stateRoot_ != ComputeStateRoot()) {
        return state.Invalid(RejectReason::BLOCK_BAD_STATE_ROOT, "state root mismatch");
    }
    if (hash_ != ComputeHash()) {
        return state.Invalid(RejectReason::BLOCK_BAD_HASH, "header hash mismatch");
    }
    if (timestamp_ > now + maxFutureDriftMs) {
        return state.Invalid(RejectReason::BLOCK_TIME_TOO_NEW,
                             "block timestamp " + std::to_string(timestamp_) + " in the future");
    }

    Amount fees = 0.0;
    for (const auto& tx : transactions_) {
        fees += tx.GetFee();
    }
    if (!AmountsEqual(fees, totalFees_, BLOCK_AMOUNT_EPSILON)) {
        return state.Invalid(RejectReason::BLOCK_BAD_FEES,
                             "totalFees " + util::FormatNumber(totalFees_) +
                             " expected " + util::FormatNumber(fees));
    }
    Amount reward = schedule.Compute(index_, transactions_.size(), fees);
    if (!AmountsEqual(reward, reward_, BLOCK_AMOUNT_EPSILON)) {
        return state.Invalid(RejectReason::BLOCK_BAD_REWARD,
                             "reward " + util::FormatNumber(reward_) +
                             " expected " + util::FormatNumber(reward));
    }
    return true;
}

bool Block::IsValid() const {
    consensus::ValidationState state;
    return Check(state, util::GetTimeMillis());
}

// ============================================================================
// Serialization
// ============================================================================

util::JSONValue Block::ToJSON() const {
    util::JSONValue::Array txs;
    txs.reserve(transactions_.size());
    for (const auto& tx : transactions_) {
        txs.push_back(tx.ToJSON());
    }

    util::JSONValue::Object obj;
    obj["index"] = static_cast<uint64_t>(index_);
    obj["timestamp"] = static_cast<int64_t>(timestamp_);
    obj["transactions"] = util::JSONValue(std::move(txs));
    obj["previousHash"] = EncodeParentHash(previousHash_);
    obj["hash"] = hash_.ToHex();
    obj["nonce"] = static_cast<uint64_t>(nonce_);
    obj["validator"] = producer_;
    obj["signature"] = signature_;
    obj["merkleRoot"] = merkleRoot_.ToHex();
    obj["stateRoot"] = stateRoot_.ToHex();
    obj["transactionCount"] = static_cast<uint64_t>(transactionCount_);
    obj["totalFees"] = totalFees_;
    obj["reward"] = reward_;
    return util::JSONValue(std::move(obj));
}

Block Block::FromJSON(const util::JSONValue& json) {
    if (!json.IsObject()) {
        throw std::invalid_argument("block must be a JSON object");
    }

    auto requireField = [&json](const char* key, bool (util::JSONValue::*is)() const,
                                const char* what) -> const util::JSONValue& {
        const util::JSONValue& value = json[key];
        if (!(value.*is)()) {
            throw std::invalid_argument(std::string("block field '") + key +
                                        "' must be " + what);
        }
        return value;
    };
    auto requireHash = [&](const char* key) {
        const std::string& hex = requireField(key, &util::JSONValue::IsString, "a string").GetString();
        auto hash = Hash256::FromHex(hex);
        if (!hash) {
            throw std::invalid_argument(std::string("block field '") + key +
                                        "' is not a 256-bit hex digest");
        }
        return *hash;
    };

    Block block;
    int64_t index = requireField("index", &util::JSONValue::IsNumber, "a number").GetInt();
    if (index < 0) {
        throw std::invalid_argument("block index must be non-negative");
    }
    block.index_ = static_cast<uint64_t>(index);
    block.timestamp_ = requireField("timestamp", &util::JSONValue::IsNumber, "a number").GetInt();

    for (const auto& tx : requireField("transactions", &util::JSONValue::IsArray, "an array").GetArray()) {
        block.transactions_.push_back(Transaction::FromJSON(tx));
    }

    const std::string& parent =
        requireField("previousHash", &util::JSONValue::IsString, "a string").GetString();
    if (parent != "0") {
        block.previousHash_ = requireHash("previousHash");
    }

    block.hash_ = requireHash("hash");
    block.nonce_ = static_cast<uint64_t>(
        requireField("nonce", &util::JSONValue::IsNumber, "a number").GetInt());
    block.producer_ = requireField("validator", &util::JSONValue::IsString, "a string").GetString();
    block.signature_ = requireField("signature", &util::JSONValue::IsString, "a string").GetString();
    block.merkleRoot_ = requireHash("merkleRoot");
    block.stateRoot_ = requireHash("stateRoot");
    block.transactionCount_ = static_cast<size_t>(
        requireField("transactionCount", &util::JSONValue::IsNumber, "a number").GetInt());
    block.totalFees_ = requireField("totalFees", &util::JSONValue::IsNumber, "a number").GetDouble();
    block.reward_ = requireField("reward", &util::JSONValue::IsNumber, "a number").GetDouble();
    return block;
}

size_t Block::GetSize() const {
    return ToJSON().ToJSON().size();
}

std::string Block::ToString() const {
    std::ostringstream ss;
    ss << "Block(index=" << index_
       << ", hash=" << hash_.ToHex().substr(0, 16)
       << ", prev=" << EncodeParentHash(previousHash_).substr(0, 16)
       << ", producer=" << producer_
       << ", txs=" << transactionCount_
       << ", fees=" << util::FormatNumber(totalFees_)
       << ", reward=" << util::FormatNumber(reward_) << ")";
    return ss.str();
}

} // namespace vindex
