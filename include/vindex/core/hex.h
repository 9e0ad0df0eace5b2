// VINDEX - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 VINDEX Developers
// MIT License

#ifndef VINDEX_CORE_HEX_H
#define VINDEX_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vindex {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Convert hex string to bytes; throws std::invalid_argument on bad input
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Check if string is non-empty, even-length hex
bool IsValidHex(const std::string& str);

} // namespace vindex

#endif // VINDEX_CORE_HEX_H
