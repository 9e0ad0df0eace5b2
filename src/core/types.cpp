// VINDEX - Core Types Implementation
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include "vindex/core/types.h"
#include "vindex/core/hex.h"

namespace vindex {

std::string Hash256::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

std::optional<Hash256> Hash256::FromHex(const std::string& hex) {
    if (hex.size() != SIZE * 2 || !IsValidHex(hex)) {
        return std::nullopt;
    }
    std::vector<uint8_t> bytes = HexToBytes(hex);
    return Hash256(bytes.data(), bytes.size());
}

} // namespace vindex
