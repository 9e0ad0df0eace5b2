// VINDEX - HMAC-SHA256
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// HMAC (RFC 2104) with SHA-256 over OpenSSL.

#ifndef VINDEX_CRYPTO_HMAC_H
#define VINDEX_CRYPTO_HMAC_H

#include "vindex/core/types.h"

#include <cstddef>
#include <string>
#include <vector>

namespace vindex {

/**
 * HMAC-SHA256 message authentication code.
 *
 * Data written is buffered and authenticated in one pass at Finalize().
 */
class HMAC_SHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    HMAC_SHA256(const Byte* key, size_t keyLen);
    explicit HMAC_SHA256(const std::string& key);
    ~HMAC_SHA256();

    HMAC_SHA256(const HMAC_SHA256&) = delete;
    HMAC_SHA256& operator=(const HMAC_SHA256&) = delete;

    HMAC_SHA256& Write(const Byte* data, size_t len);

    HMAC_SHA256& Write(const std::string& data) {
        return Write(reinterpret_cast<const Byte*>(data.data()), data.size());
    }

    Hash256 Finalize();

    /// Drop buffered data, keep the key
    HMAC_SHA256& Reset();

private:
    std::vector<Byte> key_;
    std::vector<Byte> buffer_;
};

/// HMAC-SHA256 of a string message under a string key
Hash256 ComputeHMAC_SHA256(const std::string& key, const std::string& message);

/// Constant-time comparison of two equal-length byte ranges
bool ConstantTimeCompare(const Byte* a, const Byte* b, size_t len);

} // namespace vindex

#endif // VINDEX_CRYPTO_HMAC_H
