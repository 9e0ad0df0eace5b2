// VINDEX - Core Types Header
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// Fundamental types shared by the ledger: amounts, timestamps, digests.

#ifndef VINDEX_CORE_TYPES_H
#define VINDEX_CORE_TYPES_H

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>

namespace vindex {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token quantity. Fees are fractional, so amounts are floating point and
/// compared with AMOUNT_EPSILON.
using Amount = double;

/// Unix epoch milliseconds
using Timestamp = int64_t;

/// Address of an account (opaque string key)
using Address = std::string;

/// Symbol of the native token held in Account::balance
constexpr const char* NATIVE_TOKEN = "VDX";

/// Tolerance for amount comparisons
constexpr Amount AMOUNT_EPSILON = 1e-9;

/// Tolerance for re-derived block figures (fees, reward)
constexpr Amount BLOCK_AMOUNT_EPSILON = 0.001;

/// a >= b up to AMOUNT_EPSILON
inline bool AmountAtLeast(Amount a, Amount b) {
    return a + AMOUNT_EPSILON >= b;
}

/// |a - b| <= epsilon
inline bool AmountsEqual(Amount a, Amount b, Amount epsilon = AMOUNT_EPSILON) {
    return std::fabs(a - b) <= epsilon;
}

// ============================================================================
// Hash256
// ============================================================================

/// 256-bit digest; hex form is the plain big-endian byte order
class Hash256 {
public:
    static constexpr size_t SIZE = 32;

    /// Null hash (all zeros)
    Hash256() noexcept { data_.fill(0); }

    explicit Hash256(const std::array<Byte, SIZE>& data) noexcept : data_(data) {}

    Hash256(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const Hash256& other) const noexcept { return data_ == other.data_; }
    bool operator!=(const Hash256& other) const noexcept { return data_ != other.data_; }
    bool operator<(const Hash256& other) const noexcept { return data_ < other.data_; }

    /// Lowercase hex, 64 characters
    std::string ToHex() const;

    /// Parse 64 hex characters; nullopt on any other input
    static std::optional<Hash256> FromHex(const std::string& hex);

private:
    std::array<Byte, SIZE> data_;
};

} // namespace vindex

#endif // VINDEX_CORE_TYPES_H
