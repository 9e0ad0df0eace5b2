// VINDEX - Secure Random Number Generation Implementation
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include "vindex/core/random.h"
#include "vindex/core/hex.h"

#include <openssl/rand.h>

#include <array>
#include <stdexcept>

namespace vindex {

void GetRandBytes(uint8_t* buf, size_t len) {
    if (len == 0) {
        return;
    }
    if (RAND_bytes(buf, static_cast<int>(len)) != 1) {
        throw std::runtime_error("Failed to get random bytes from OpenSSL");
    }
}

std::string GenerateUUID() {
    std::array<uint8_t, 16> bytes;
    GetRandBytes(bytes.data(), bytes.size());

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // variant 10xx

    std::string hex = BytesToHex(bytes.data(), bytes.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
           "-" + hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace vindex
