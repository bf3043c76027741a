// PAMTALK - Hex Encoding
// Copyright (c) 2024 PAMTALK Developers
// MIT License
//
// Lowercase hex for digests, committee keys and snapshot dumps.

#ifndef PAMTALK_CORE_HEX_H
#define PAMTALK_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pamtalk {

// Kept independent of types.h so either header can include the other
using HexByte = uint8_t;

std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

/// Decode without throwing. Odd length or a non-hex digit yields nullopt.
std::optional<std::vector<HexByte>> TryHexToBytes(const std::string& hex);

/// Decode, throwing std::invalid_argument on malformed input
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Non-empty, even length, hex digits only
bool IsValidHex(const std::string& str);

} // namespace pamtalk

#endif // PAMTALK_CORE_HEX_H
