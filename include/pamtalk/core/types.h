// PAMTALK - Core Types Header
// Copyright (c) 2024 PAMTALK Developers
// MIT License
//
// This file defines fundamental types used throughout PAMTALK.

#ifndef PAMTALK_CORE_TYPES_H
#define PAMTALK_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>
#include <limits>

namespace pamtalk {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in smallest token units. Never negative.
using Amount = uint64_t;

/// Timestamp (Unix epoch seconds), supplied by the hosting substrate
using Timestamp = int64_t;

/// Opaque participant address
using AccountId = std::string;

/// Largest representable amount
constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

/// Basis point denominator (1 bps = 1/100 of a percent)
constexpr uint64_t BPS_DENOMINATOR = 10000;

/// Seconds per day
constexpr Timestamp SECONDS_PER_DAY = 86400;

/// Check whether a + b fits in an Amount
inline bool AddWouldOverflow(Amount a, Amount b) {
    return a > MAX_AMOUNT - b;
}

/// Check whether a * b fits in an Amount
inline bool MulWouldOverflow(Amount a, Amount b) {
    return b != 0 && a > MAX_AMOUNT / b;
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Generic fixed-size digest
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes
    BaseHash(const Byte* data, size_t len) noexcept {
        if (len >= SIZE) {
            std::memcpy(data_.data(), data, SIZE);
        } else {
            data_.fill(0);
            if (data && len > 0) {
                std::memcpy(data_.data(), data, len);
            }
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Set hash to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Convert to hex string (storage byte order)
    std::string ToHex() const;

    /// Create from hex string
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit digest (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& h) : BaseHash<256>(h) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

} // namespace pamtalk

#endif // PAMTALK_CORE_TYPES_H
