// DAOSTAKE - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#ifndef DAOSTAKE_CORE_HEX_H
#define DAOSTAKE_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace daostake {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

/// Convert hex string to bytes (throws std::invalid_argument on bad input)
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid hex
bool IsValidHex(const std::string& str);

} // namespace daostake

#endif // DAOSTAKE_CORE_HEX_H
