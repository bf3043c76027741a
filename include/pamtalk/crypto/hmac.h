// PAMTALK - HMAC (Hash-based Message Authentication Code)
// Copyright (c) 2024 PAMTALK Developers
// MIT License
//
// HMAC-SHA256 (RFC 2104) backed by OpenSSL. Used to seal governance
// authorization tokens with the committee key.

#ifndef PAMTALK_CRYPTO_HMAC_H
#define PAMTALK_CRYPTO_HMAC_H

#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "pamtalk/core/types.h"

namespace pamtalk {

// ============================================================================
// HMAC-SHA256
// ============================================================================

/**
 * HMAC-SHA256 message authentication code.
 *
 * Provides incremental hashing capability for streaming data.
 */
class HMAC_SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Create HMAC with key
    explicit HMAC_SHA256(const Byte* key, size_t keyLen);

    /// Create HMAC with vector key
    explicit HMAC_SHA256(const std::vector<Byte>& key)
        : HMAC_SHA256(key.data(), key.size()) {}

    ~HMAC_SHA256();

    /// Non-copyable (contains key material)
    HMAC_SHA256(const HMAC_SHA256&) = delete;
    HMAC_SHA256& operator=(const HMAC_SHA256&) = delete;

    HMAC_SHA256(HMAC_SHA256&& other) noexcept;
    HMAC_SHA256& operator=(HMAC_SHA256&& other) noexcept;

    /// Write data to HMAC
    HMAC_SHA256& Write(const Byte* data, size_t len);

    HMAC_SHA256& Write(const std::vector<Byte>& data) {
        return Write(data.data(), data.size());
    }

    /// Finalize and get MAC as Hash256. The object cannot be written afterwards.
    Hash256 Finalize();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Compute HMAC-SHA256 in one call
Hash256 ComputeHMAC_SHA256(const std::vector<Byte>& key,
                           const std::vector<Byte>& data);

/// Constant-time comparison of two MACs
bool ConstantTimeCompare(const Hash256& a, const Hash256& b);

} // namespace pamtalk

#endif // PAMTALK_CRYPTO_HMAC_H
