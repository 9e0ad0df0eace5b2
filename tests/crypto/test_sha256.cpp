// VINDEX - SHA256 and HMAC Tests
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// Known-answer vectors from FIPS 180-2 and RFC 4231.

#include <gtest/gtest.h>
#include "vindex/crypto/hmac.h"
#include "vindex/crypto/sha256.h"
#include "vindex/core/types.h"

#include <string>
#include <vector>

namespace vindex {
namespace test {

// ============================================================================
// SHA256
// ============================================================================

TEST(SHA256Test, EmptyString) {
    EXPECT_EQ(SHA256Hash("").ToHex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    EXPECT_EQ(SHA256Hash("abc").ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockMessage) {
    EXPECT_EQ(SHA256Hash("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq").ToHex(),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256Test, IncrementalMatchesOneShot) {
    SHA256 hasher;
    hasher.Write("ab").Write("").Write("c");
    EXPECT_EQ(hasher.Finalize(), SHA256Hash("abc"));
}

TEST(SHA256Test, ResetAllowsReuse) {
    SHA256 hasher;
    hasher.Write("garbage");
    hasher.Finalize();
    hasher.Reset().Write("abc");
    EXPECT_EQ(hasher.Finalize(), SHA256Hash("abc"));
}

TEST(SHA256Test, MillionA) {
    SHA256 hasher;
    std::string chunk(1000, 'a');
    for (int i = 0; i < 1000; ++i) {
        hasher.Write(chunk);
    }
    EXPECT_EQ(hasher.Finalize().ToHex(),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

// ============================================================================
// HMAC-SHA256
// ============================================================================

TEST(HMACTest, RFC4231Case1) {
    std::vector<Byte> key(20, 0x0b);
    HMAC_SHA256 hmac(key.data(), key.size());
    hmac.Write("Hi There");
    EXPECT_EQ(hmac.Finalize().ToHex(),
              "b0344c61d8db38535ca8afceaf0bf12b881dc200c9833da726e9376c2e32cff7");
}

TEST(HMACTest, RFC4231Case2) {
    EXPECT_EQ(ComputeHMAC_SHA256("Jefe", "what do ya want for nothing?").ToHex(),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(HMACTest, LongKeyIsHashed) {
    // RFC 4231 case 6: 131-byte key
    std::vector<Byte> key(131, 0xaa);
    HMAC_SHA256 hmac(key.data(), key.size());
    hmac.Write("Test Using Larger Than Block-Size Key - Hash Key First");
    EXPECT_EQ(hmac.Finalize().ToHex(),
              "60e431591ee0b67f0d8a26aacbf5b77f8e0bc6213728c5140546040f0ee37f54");
}

TEST(HMACTest, ResetKeepsKey) {
    HMAC_SHA256 hmac(std::string("Jefe"));
    hmac.Write("noise");
    hmac.Reset().Write("what do ya want ").Write("for nothing?");
    EXPECT_EQ(hmac.Finalize(), ComputeHMAC_SHA256("Jefe", "what do ya want for nothing?"));
}

TEST(HMACTest, ConstantTimeCompare) {
    const Byte a[] = {1, 2, 3, 4};
    const Byte b[] = {1, 2, 3, 4};
    const Byte c[] = {1, 2, 3, 5};
    EXPECT_TRUE(ConstantTimeCompare(a, b, 4));
    EXPECT_FALSE(ConstantTimeCompare(a, c, 4));
    EXPECT_TRUE(ConstantTimeCompare(a, c, 3));
}

} // namespace test
} // namespace vindex
