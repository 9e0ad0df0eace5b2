// VINDEX - Signing Keys Implementation
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include "vindex/crypto/keys.h"
#include "vindex/crypto/hmac.h"

namespace vindex {

// ============================================================================
// DeterministicKeyStore
// ============================================================================

std::string DeterministicKeyStore::DeriveKey(const Address& address, KeyRole role) {
    switch (role) {
        case KeyRole::Producer:
            return "validator_private_key_" + address;
        case KeyRole::Account:
            break;
    }
    return "private_key_" + address;
}

std::optional<std::string> DeterministicKeyStore::GetSigningKey(const Address& address,
                                                                KeyRole role) const {
    if (address.empty()) {
        return std::nullopt;
    }
    return DeriveKey(address, role);
}

// ============================================================================
// InMemoryKeyStore
// ============================================================================

void InMemoryKeyStore::SetKey(const Address& address, KeyRole role, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    keys_[{address, role}] = key;
}

std::optional<std::string> InMemoryKeyStore::GetSigningKey(const Address& address,
                                                           KeyRole role) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find({address, role});
    if (it == keys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// Signatures
// ============================================================================

std::string SignDigest(const Hash256& digest, const std::string& key) {
    return ComputeHMAC_SHA256(key, digest.ToHex()).ToHex();
}

bool VerifyDigestSignature(const Hash256& digest, const std::string& signature,
                           const std::string& key) {
    std::string expected = SignDigest(digest, key);
    if (signature.size() != expected.size()) {
        return false;
    }
    return ConstantTimeCompare(reinterpret_cast<const Byte*>(signature.data()),
                               reinterpret_cast<const Byte*>(expected.data()),
                               expected.size());
}

} // namespace vindex
