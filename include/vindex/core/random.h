// VINDEX - Secure Random Number Generation
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// Cryptographically secure randomness from OpenSSL's RAND_bytes.

#ifndef VINDEX_CORE_RANDOM_H
#define VINDEX_CORE_RANDOM_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace vindex {

/// Fill buffer with random bytes; throws std::runtime_error on RNG failure
void GetRandBytes(uint8_t* buf, size_t len);

/// Random RFC 4122 version 4 UUID, lowercase with hyphens
std::string GenerateUUID();

} // namespace vindex

#endif // VINDEX_CORE_RANDOM_H
