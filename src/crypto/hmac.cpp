// VINDEX - HMAC Implementation
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include "vindex/crypto/hmac.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>

namespace vindex {

HMAC_SHA256::HMAC_SHA256(const Byte* key, size_t keyLen)
    : key_(key, key + keyLen) {}

HMAC_SHA256::HMAC_SHA256(const std::string& key)
    : key_(key.begin(), key.end()) {}

HMAC_SHA256::~HMAC_SHA256() {
    if (!key_.empty()) {
        OPENSSL_cleanse(key_.data(), key_.size());
    }
}

HMAC_SHA256& HMAC_SHA256::Write(const Byte* data, size_t len) {
    buffer_.insert(buffer_.end(), data, data + len);
    return *this;
}

Hash256 HMAC_SHA256::Finalize() {
    std::array<Byte, OUTPUT_SIZE> mac{};
    unsigned int macLen = 0;
    // OpenSSL rejects a null key pointer even for empty keys
    static const Byte emptyKey = 0;
    const Byte* keyPtr = key_.empty() ? &emptyKey : key_.data();
    if (HMAC(EVP_sha256(), keyPtr, static_cast<int>(key_.size()),
             buffer_.data(), buffer_.size(), mac.data(), &macLen) == nullptr ||
        macLen != OUTPUT_SIZE) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return Hash256(mac);
}

HMAC_SHA256& HMAC_SHA256::Reset() {
    buffer_.clear();
    return *this;
}

Hash256 ComputeHMAC_SHA256(const std::string& key, const std::string& message) {
    return HMAC_SHA256(key).Write(message).Finalize();
}

bool ConstantTimeCompare(const Byte* a, const Byte* b, size_t len) {
    return CRYPTO_memcmp(a, b, len) == 0;
}

} // namespace vindex
