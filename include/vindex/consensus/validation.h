// VINDEX - Validation State
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// Outcome of a fallible ledger operation. Every mutating operation takes a
// ValidationState by reference, returns bool, and on failure records a
// short reject reason plus a human-readable debug message.

#ifndef VINDEX_CONSENSUS_VALIDATION_H
#define VINDEX_CONSENSUS_VALIDATION_H

#include <string>

namespace vindex {
namespace consensus {

// ============================================================================
// Validation State
// ============================================================================

class ValidationState {
public:
    enum class Mode {
        VALID,      ///< Everything ok
        INVALID,    ///< Rule violation or insufficient resources
        ERROR       ///< Runtime error
    };

    bool IsValid() const { return mode_ == Mode::VALID; }
    bool IsInvalid() const { return mode_ == Mode::INVALID; }
    bool IsError() const { return mode_ == Mode::ERROR; }

    Mode GetMode() const { return mode_; }
    const std::string& GetRejectReason() const { return rejectReason_; }
    const std::string& GetDebugMessage() const { return debugMessage_; }

    /// Mark as invalid with reason; always returns false
    bool Invalid(const std::string& rejectReason,
                 const std::string& debugMessage = "") {
        mode_ = Mode::INVALID;
        rejectReason_ = rejectReason;
        debugMessage_ = debugMessage;
        return false;
    }

    /// Mark as runtime error; always returns false
    bool Error(const std::string& message) {
        mode_ = Mode::ERROR;
        rejectReason_ = message;
        debugMessage_.clear();
        return false;
    }

    /// Back to VALID (for reusing one state across calls)
    void Reset() {
        mode_ = Mode::VALID;
        rejectReason_.clear();
        debugMessage_.clear();
    }

    /// "VALID" or "INVALID: reason (debug)"
    std::string ToString() const;

private:
    Mode mode_ = Mode::VALID;
    std::string rejectReason_;
    std::string debugMessage_;
};

// ============================================================================
// Reject Reasons
// ============================================================================

namespace RejectReason {
    // Validation errors
    constexpr const char* TX_INVALID = "tx-invalid";
    constexpr const char* TX_MISSING_FIELD = "tx-missing-field";
    constexpr const char* TX_BAD_AMOUNT = "tx-bad-amount";
    constexpr const char* TX_BAD_FEE = "tx-bad-fee";
    constexpr const char* TX_SELF_TRANSFER = "tx-self-transfer";
    constexpr const char* TX_TOO_OLD = "tx-too-old";
    constexpr const char* TX_TIME_TOO_NEW = "tx-time-too-new";
    constexpr const char* TX_DUPLICATE_ID = "tx-duplicate-id";
    constexpr const char* BAD_SIGNATURE = "bad-signature";
    constexpr const char* STAKE_BELOW_MINIMUM = "stake-below-minimum";
    constexpr const char* SWAP_BAD_PAYLOAD = "swap-bad-payload";
    constexpr const char* BLOCK_SIGNED = "block-signed";
    constexpr const char* BLOCK_BAD_PARENT = "bad-prevblk";
    constexpr const char* BLOCK_BAD_PRODUCER = "bad-producer";
    constexpr const char* BLOCK_BAD_HASH = "bad-blk-hash";
    constexpr const char* BLOCK_BAD_MERKLE_ROOT = "bad-txnmrklroot";
    constexpr const char* BLOCK_BAD_STATE_ROOT = "bad-stateroot";
    constexpr const char* BLOCK_BAD_TX = "bad-blk-tx";
    constexpr const char* BLOCK_TIME_TOO_NEW = "time-too-new";
    constexpr const char* BLOCK_BAD_TX_COUNT = "bad-blk-txcount";
    constexpr const char* BLOCK_BAD_FEES = "bad-blk-fees";
    constexpr const char* BLOCK_BAD_REWARD = "bad-blk-reward";
    constexpr const char* BLOCK_BAD_INDEX = "bad-blk-index";
    constexpr const char* BLOCK_BAD_LINK = "bad-prevblk-link";
    constexpr const char* BLOCK_BAD_SIGNATURE = "bad-blk-signature";

    // Consistency violations
    constexpr const char* CHAIN_BAD_GENESIS = "bad-genesis";

    // Resource errors
    constexpr const char* INSUFFICIENT_BALANCE = "insufficient-balance";
    constexpr const char* INSUFFICIENT_STAKE = "insufficient-stake";
    constexpr const char* VALIDATOR_SET_FULL = "validator-set-full";
    constexpr const char* DUPLICATE_PENDING_TX = "duplicate-pending-tx";
    constexpr const char* TX_ALREADY_MINED = "tx-already-mined";
    constexpr const char* MEMPOOL_FULL = "mempool-full";
    constexpr const char* UNKNOWN_SENDER = "unknown-sender";
    constexpr const char* UNKNOWN_VALIDATOR = "unknown-validator";
    constexpr const char* POOL_EXISTS = "pool-exists";
    constexpr const char* NO_POOL = "no-pool";
    constexpr const char* BAD_POOL = "bad-pool";
    constexpr const char* SLIPPAGE = "slippage";
    constexpr const char* RESERVE_EXHAUSTED = "reserve-exhausted";
    constexpr const char* BAD_BURN_AMOUNT = "bad-burn-amount";
}

} // namespace consensus
} // namespace vindex

#endif // VINDEX_CONSENSUS_VALIDATION_H
