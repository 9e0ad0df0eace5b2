// VINDEX - SHA256 Hash Function
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// SHA-256 over OpenSSL EVP.

#ifndef VINDEX_CRYPTO_SHA256_H
#define VINDEX_CRYPTO_SHA256_H

#include "vindex/core/types.h"

#include <cstddef>
#include <memory>
#include <string>

namespace vindex {

/// Incremental SHA-256 hasher
class SHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Append bytes; returns *this for chaining
    SHA256& Write(const Byte* data, size_t len);

    SHA256& Write(const std::string& data) {
        return Write(reinterpret_cast<const Byte*>(data.data()), data.size());
    }

    /// Produce the digest; the hasher must be Reset() before reuse
    Hash256 Finalize();

    SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// SHA-256 of a byte range in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

/// SHA-256 of the UTF-8 bytes of a string
inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

} // namespace vindex

#endif // VINDEX_CRYPTO_SHA256_H
