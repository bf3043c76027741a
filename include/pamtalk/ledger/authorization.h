// PAMTALK - Authorization Tokens
// Copyright (c) 2024 PAMTALK Developers
// MIT License
//
// A capability issued when a committee proposal executes. The token names
// exactly one privileged ledger action and its arguments, and is sealed
// with HMAC-SHA256 under the committee key. The ledger accepts each token
// at most once.

#ifndef PAMTALK_LEDGER_AUTHORIZATION_H
#define PAMTALK_LEDGER_AUTHORIZATION_H

#include "pamtalk/core/types.h"

#include <optional>
#include <string>
#include <vector>

namespace pamtalk {

/// Privileged ledger actions that require committee approval
enum class AuthorizedAction : uint8_t {
    Mint = 1,
    SetPaused = 2,
    SetFrozen = 3,
};

const char* AuthorizedActionToString(AuthorizedAction action);

/**
 * Sealed proof that a committee proposal approved one ledger action.
 *
 * For Mint, target and amount name the recipient and quantity.
 * For SetPaused, flag is the new paused state.
 * For SetFrozen, target is the account and flag the new frozen state.
 */
struct AuthorizationToken {
    /// Executed proposal that produced the token (single-use key)
    std::string proposalId;

    AuthorizedAction action{AuthorizedAction::Mint};
    AccountId target;
    Amount amount{0};
    bool flag{false};

    /// HMAC-SHA256 over GetSigningPayload()
    Hash256 mac;

    /// Canonical byte encoding of every field except the MAC
    std::vector<Byte> GetSigningPayload() const;

    /// Compute and store the MAC
    void Seal(const std::vector<Byte>& committeeKey);

    /// Check the MAC in constant time. An empty key never verifies.
    bool Verify(const std::vector<Byte>& committeeKey) const;

    std::vector<Byte> Serialize() const;
    static std::optional<AuthorizationToken> Deserialize(const Byte* data, size_t len);
};

} // namespace pamtalk

#endif // PAMTALK_LEDGER_AUTHORIZATION_H
