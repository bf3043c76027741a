// PAMTALK - Token Ledger
// Copyright (c) 2024 PAMTALK Developers
// MIT License
//
// The ledger is the single owner of account balances and total supply.
// Every other component moves value exclusively through the mint, burn
// and transfer primitives defined here.
//
// Invariants:
// - sum of all balances == total supply after every operation
// - a failed operation leaves no observable change

#ifndef PAMTALK_LEDGER_LEDGER_H
#define PAMTALK_LEDGER_LEDGER_H

#include "pamtalk/core/status.h"
#include "pamtalk/core/types.h"
#include "pamtalk/ledger/authorization.h"

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pamtalk {

// ============================================================================
// Account
// ============================================================================

struct Account {
    AccountId id;
    Amount balance{0};
    bool frozen{false};
};

/// One leg of a multi-recipient transfer
using TransferLeg = std::pair<AccountId, Amount>;

// ============================================================================
// Ledger
// ============================================================================

class Ledger {
public:
    explicit Ledger(AccountId admin);

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    // ========================================================================
    // Account Lifecycle
    // ========================================================================

    /// Create (or reset an empty) account. AlreadyActive if balance > 0.
    Status OptIn(const AccountId& account);

    /// Remove an account. InvalidState unless its balance is zero.
    Status CloseOut(const AccountId& account);

    // ========================================================================
    // Supply Operations
    // ========================================================================

    /// Mint under a committee authorization token. The token must name
    /// this recipient and amount and is consumed on success.
    Status Mint(const AccountId& recipient, Amount amount,
                const AuthorizationToken& token);

    /// Mint on behalf of a registered in-process component
    Status MintTrusted(const std::string& minterId,
                       const AccountId& recipient, Amount amount);

    /// Destroy tokens held by holder
    Status Burn(const AccountId& holder, Amount amount);

    // ========================================================================
    // Transfers
    // ========================================================================

    Status Transfer(const AccountId& sender, const AccountId& recipient,
                    Amount amount);

    /// Pay several recipients from one sender as a single atomic step.
    /// Zero-amount legs are skipped; at least one leg must be non-zero.
    Status Distribute(const AccountId& sender,
                      const std::vector<TransferLeg>& legs);

    // ========================================================================
    // Administration
    // ========================================================================

    Status SetPaused(const AccountId& caller, bool paused);
    Status SetPaused(const AuthorizationToken& token, bool paused);

    Status SetFrozen(const AccountId& caller, const AccountId& account, bool frozen);
    Status SetFrozen(const AuthorizationToken& token, const AccountId& account, bool frozen);

    /// Install the key used to verify authorization tokens
    Status SetCommitteeKey(const AccountId& caller, const std::vector<Byte>& key);

    Status RegisterTrustedMinter(const AccountId& caller, const std::string& minterId);
    Status RevokeTrustedMinter(const AccountId& caller, const std::string& minterId);

    // ========================================================================
    // Queries
    // ========================================================================

    bool IsOptedIn(const AccountId& account) const;
    std::optional<Account> GetAccount(const AccountId& account) const;

    /// Zero for unknown accounts
    Amount GetBalance(const AccountId& account) const;

    bool IsFrozen(const AccountId& account) const;
    bool IsPaused() const;
    Amount GetTotalSupply() const;
    size_t GetAccountCount() const;

    const AccountId& GetAdmin() const { return admin_; }
    bool IsAdmin(const AccountId& caller) const { return caller == admin_; }

    bool IsTrustedMinter(const std::string& minterId) const;
    bool IsTokenConsumed(const std::string& proposalId) const;

    /// Verify sum(balances) == total supply
    bool CheckConservation() const;

    // ========================================================================
    // Persistence
    // ========================================================================

    std::vector<Byte> Serialize() const;
    bool Deserialize(const Byte* data, size_t len);

private:
    AccountId admin_;
    bool paused_{false};
    Amount totalSupply_{0};
    std::vector<Byte> committeeKey_;

    std::map<AccountId, Account> accounts_;
    std::set<std::string> trustedMinters_;
    std::set<std::string> consumedTokens_;

    mutable std::mutex mutex_;

    /// Common checks for a committee token; caller holds mutex_
    Status CheckTokenLocked(const AuthorizationToken& token,
                            AuthorizedAction expected) const;

    /// Credit recipient and grow supply; caller holds mutex_
    Status MintLocked(const AccountId& recipient, Amount amount);
};

} // namespace pamtalk

#endif // PAMTALK_LEDGER_LEDGER_H
