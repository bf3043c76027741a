// PAMTALK - Hex Encoding Implementation
// Copyright (c) 2024 PAMTALK Developers
// MIT License

#include "pamtalk/core/hex.h"

#include <stdexcept>

namespace pamtalk {

namespace {

constexpr char DIGITS[] = "0123456789abcdef";

int DigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

} // namespace

std::string BytesToHex(const HexByte* data, size_t len) {
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = DIGITS[data[i] >> 4];
        out[2 * i + 1] = DIGITS[data[i] & 0x0F];
    }
    return out;
}

std::string BytesToHex(const std::vector<HexByte>& data) {
    return BytesToHex(data.data(), data.size());
}

std::optional<std::vector<HexByte>> TryHexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    std::vector<HexByte> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = DigitValue(hex[2 * i]);
        int lo = DigitValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out[i] = static_cast<HexByte>((hi << 4) | lo);
    }
    return out;
}

std::vector<HexByte> HexToBytes(const std::string& hex) {
    auto bytes = TryHexToBytes(hex);
    if (!bytes) {
        throw std::invalid_argument("malformed hex string");
    }
    return std::move(*bytes);
}

bool IsValidHex(const std::string& str) {
    return !str.empty() && TryHexToBytes(str).has_value();
}

} // namespace pamtalk
