// PAMTALK - HMAC Implementation
// Copyright (c) 2024 PAMTALK Developers
// MIT License

#include "pamtalk/crypto/hmac.h"

#include <stdexcept>

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/params.h>

namespace pamtalk {

// ============================================================================
// HMAC-SHA256 Implementation
// ============================================================================

struct HMAC_SHA256::Impl {
    EVP_MAC* mac{nullptr};
    EVP_MAC_CTX* ctx{nullptr};
    bool finalized{false};

    Impl(const Byte* key, size_t keyLen) {
        mac = EVP_MAC_fetch(nullptr, "HMAC", nullptr);
        if (!mac) {
            throw std::runtime_error("HMAC: EVP_MAC_fetch failed");
        }
        ctx = EVP_MAC_CTX_new(mac);
        if (!ctx) {
            EVP_MAC_free(mac);
            throw std::runtime_error("HMAC: EVP_MAC_CTX_new failed");
        }

        char digest[] = "SHA256";
        OSSL_PARAM params[] = {
            OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest, 0),
            OSSL_PARAM_construct_end()
        };

        // OpenSSL rejects a null key pointer even for zero length
        static const Byte emptyKey = 0;
        const Byte* keyPtr = (key && keyLen > 0) ? key : &emptyKey;
        if (EVP_MAC_init(ctx, keyPtr, keyLen, params) != 1) {
            EVP_MAC_CTX_free(ctx);
            EVP_MAC_free(mac);
            throw std::runtime_error("HMAC: EVP_MAC_init failed");
        }
    }

    ~Impl() {
        EVP_MAC_CTX_free(ctx);
        EVP_MAC_free(mac);
    }
};

HMAC_SHA256::HMAC_SHA256(const Byte* key, size_t keyLen)
    : impl_(std::make_unique<Impl>(key, keyLen)) {
}

HMAC_SHA256::~HMAC_SHA256() = default;

HMAC_SHA256::HMAC_SHA256(HMAC_SHA256&& other) noexcept = default;
HMAC_SHA256& HMAC_SHA256::operator=(HMAC_SHA256&& other) noexcept = default;

HMAC_SHA256& HMAC_SHA256::Write(const Byte* data, size_t len) {
    if (impl_->finalized) {
        throw std::logic_error("HMAC: write after finalize");
    }
    if (len > 0 && EVP_MAC_update(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("HMAC: EVP_MAC_update failed");
    }
    return *this;
}

Hash256 HMAC_SHA256::Finalize() {
    if (impl_->finalized) {
        throw std::logic_error("HMAC: already finalized");
    }
    Byte out[OUTPUT_SIZE];
    size_t outLen = 0;
    if (EVP_MAC_final(impl_->ctx, out, &outLen, sizeof(out)) != 1 ||
        outLen != OUTPUT_SIZE) {
        throw std::runtime_error("HMAC: EVP_MAC_final failed");
    }
    impl_->finalized = true;
    return Hash256(out, outLen);
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 ComputeHMAC_SHA256(const std::vector<Byte>& key,
                           const std::vector<Byte>& data) {
    HMAC_SHA256 hmac(key);
    hmac.Write(data);
    return hmac.Finalize();
}

bool ConstantTimeCompare(const Hash256& a, const Hash256& b) {
    return CRYPTO_memcmp(a.data(), b.data(), Hash256::SIZE) == 0;
}

} // namespace pamtalk
