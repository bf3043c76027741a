// PAMTALK - Authorization Token Implementation
// Copyright (c) 2024 PAMTALK Developers
// MIT License

#include "pamtalk/ledger/authorization.h"
#include "pamtalk/core/serialize.h"
#include "pamtalk/crypto/hmac.h"

namespace pamtalk {

namespace {

/// Domain separator mixed into every MAC
const std::string AUTH_DOMAIN = "PAMTALK/auth/v1";

} // namespace

const char* AuthorizedActionToString(AuthorizedAction action) {
    switch (action) {
        case AuthorizedAction::Mint:      return "Mint";
        case AuthorizedAction::SetPaused: return "SetPaused";
        case AuthorizedAction::SetFrozen: return "SetFrozen";
        default:                          return "Unknown";
    }
}

std::vector<Byte> AuthorizationToken::GetSigningPayload() const {
    DataStream ss;
    ss << AUTH_DOMAIN;
    ss << proposalId;
    ser_writedata8(ss, static_cast<uint8_t>(action));
    ss << target;
    ss << amount;
    ss << flag;
    return ss.Data();
}

void AuthorizationToken::Seal(const std::vector<Byte>& committeeKey) {
    mac = ComputeHMAC_SHA256(committeeKey, GetSigningPayload());
}

bool AuthorizationToken::Verify(const std::vector<Byte>& committeeKey) const {
    if (committeeKey.empty()) {
        return false;
    }
    Hash256 expected = ComputeHMAC_SHA256(committeeKey, GetSigningPayload());
    return ConstantTimeCompare(expected, mac);
}

std::vector<Byte> AuthorizationToken::Serialize() const {
    DataStream ss;
    ss << proposalId;
    ser_writedata8(ss, static_cast<uint8_t>(action));
    ss << target << amount << flag << mac;
    return ss.Data();
}

std::optional<AuthorizationToken> AuthorizationToken::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }

    try {
        DataStream ss(data, len);
        AuthorizationToken token;
        ss >> token.proposalId;
        uint8_t action = ser_readdata8(ss);
        if (action < static_cast<uint8_t>(AuthorizedAction::Mint) ||
            action > static_cast<uint8_t>(AuthorizedAction::SetFrozen)) {
            return std::nullopt;
        }
        token.action = static_cast<AuthorizedAction>(action);
        ss >> token.target >> token.amount >> token.flag >> token.mac;
        if (!ss.empty()) {
            return std::nullopt;
        }
        return token;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace pamtalk
