// PAMTALK - Serialization Implementation
// Copyright (c) 2024 PAMTALK Developers
// MIT License

#include "pamtalk/core/serialize.h"
#include "pamtalk/core/hex.h"

namespace pamtalk {

// ============================================================================
// DataStream Implementation
// ============================================================================

std::string DataStream::ToHex() const {
    return BytesToHex(data_.data() + read_pos_, data_.size() - read_pos_);
}

void DataStream::FromHex(const std::string& hex) {
    clear();
    data_ = HexToBytes(hex);
}

} // namespace pamtalk
