// VINDEX - SHA256 Implementation
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include "vindex/crypto/sha256.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace vindex {

struct SHA256::Impl {
    EVP_MD_CTX* ctx{nullptr};

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
    }

    ~Impl() { EVP_MD_CTX_free(ctx); }

    void Init() {
        if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex failed");
        }
    }
};

SHA256::SHA256() : impl_(std::make_unique<Impl>()) {
    impl_->Init();
}

SHA256::~SHA256() = default;

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return *this;
}

Hash256 SHA256::Finalize() {
    std::array<Byte, OUTPUT_SIZE> out{};
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, out.data(), &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return Hash256(out);
}

SHA256& SHA256::Reset() {
    impl_->Init();
    return *this;
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    return SHA256().Write(data, len).Finalize();
}

} // namespace vindex
