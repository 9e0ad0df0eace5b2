// VINDEX - Signing Keys
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// Key management seam for transaction and block signatures.
//
// Signatures are keyed digests: hex(HMAC-SHA256(key, hex(digest))). This is
// a placeholder, not an authentication scheme; a real asymmetric scheme can
// replace it behind the KeyStore and Sign/Verify functions without changing
// callers.

#ifndef VINDEX_CRYPTO_KEYS_H
#define VINDEX_CRYPTO_KEYS_H

#include "vindex/core/types.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace vindex {

// ============================================================================
// Key Store
// ============================================================================

/// Purpose of a signing key
enum class KeyRole {
    Account,    // Signs transactions
    Producer    // Signs blocks
};

/// Source of signing keys by address
class KeyStore {
public:
    virtual ~KeyStore() = default;

    /// Signing key for an address, nullopt if this store has none
    virtual std::optional<std::string> GetSigningKey(const Address& address,
                                                     KeyRole role) const = 0;
};

/**
 * Derives keys from the address string.
 *
 * Account keys are "private_key_" + address, producer keys are
 * "validator_private_key_" + address. Anyone who knows an address can
 * sign for it.
 */
class DeterministicKeyStore : public KeyStore {
public:
    std::optional<std::string> GetSigningKey(const Address& address,
                                             KeyRole role) const override;

    /// The derivation itself, usable without an instance
    static std::string DeriveKey(const Address& address, KeyRole role);
};

/// Keys registered explicitly; unknown addresses have no key
class InMemoryKeyStore : public KeyStore {
public:
    void SetKey(const Address& address, KeyRole role, const std::string& key);

    std::optional<std::string> GetSigningKey(const Address& address,
                                             KeyRole role) const override;

private:
    mutable std::mutex mutex_;
    std::map<std::pair<Address, KeyRole>, std::string> keys_;
};

// ============================================================================
// Keyed-digest Signatures
// ============================================================================

/// Sign a digest: lowercase hex of HMAC-SHA256(key, digest.ToHex())
std::string SignDigest(const Hash256& digest, const std::string& key);

/// Constant-time check of a signature produced by SignDigest
bool VerifyDigestSignature(const Hash256& digest, const std::string& signature,
                           const std::string& key);

} // namespace vindex

#endif // VINDEX_CRYPTO_KEYS_H
