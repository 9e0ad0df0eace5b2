// VINDEX - Signing Key Tests
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include <gtest/gtest.h>
#include "vindex/crypto/hmac.h"
#include "vindex/crypto/keys.h"
#include "vindex/crypto/sha256.h"

namespace vindex {
namespace test {

TEST(KeyStoreTest, DeterministicDerivation) {
    EXPECT_EQ(DeterministicKeyStore::DeriveKey("alice", KeyRole::Account), "private_key_alice");
    EXPECT_EQ(DeterministicKeyStore::DeriveKey("validator_1", KeyRole::Producer),
              "validator_private_key_validator_1");

    DeterministicKeyStore store;
    auto key = store.GetSigningKey("alice", KeyRole::Account);
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(*key, "private_key_alice");
    EXPECT_FALSE(store.GetSigningKey("", KeyRole::Account).has_value());
}

TEST(KeyStoreTest, InMemoryStore) {
    InMemoryKeyStore store;
    EXPECT_FALSE(store.GetSigningKey("alice", KeyRole::Account).has_value());

    store.SetKey("alice", KeyRole::Account, "secret");
    auto key = store.GetSigningKey("alice", KeyRole::Account);
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(*key, "secret");

    // Roles are keyed separately
    EXPECT_FALSE(store.GetSigningKey("alice", KeyRole::Producer).has_value());

    store.SetKey("alice", KeyRole::Account, "rotated");
    EXPECT_EQ(*store.GetSigningKey("alice", KeyRole::Account), "rotated");
}

TEST(SignatureTest, SignDigestIsHMACOfHex) {
    Hash256 digest = SHA256Hash("payload");
    std::string signature = SignDigest(digest, "key");
    EXPECT_EQ(signature, ComputeHMAC_SHA256("key", digest.ToHex()).ToHex());
    EXPECT_EQ(signature.size(), 64u);
}

TEST(SignatureTest, Verify) {
    Hash256 digest = SHA256Hash("payload");
    std::string signature = SignDigest(digest, "key");

    EXPECT_TRUE(VerifyDigestSignature(digest, signature, "key"));
    EXPECT_FALSE(VerifyDigestSignature(digest, signature, "other"));
    EXPECT_FALSE(VerifyDigestSignature(SHA256Hash("payload2"), signature, "key"));
    EXPECT_FALSE(VerifyDigestSignature(digest, signature.substr(1), "key"));
    EXPECT_FALSE(VerifyDigestSignature(digest, "", "key"));
}

} // namespace test
} // namespace vindex
