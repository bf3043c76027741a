// PAMTALK - Core Types Implementation
// Copyright (c) 2024 PAMTALK Developers
// MIT License

#include "pamtalk/core/types.h"
#include "pamtalk/core/hex.h"

namespace pamtalk {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }

    std::vector<HexByte> bytes = HexToBytes(hex);
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;

} // namespace pamtalk
