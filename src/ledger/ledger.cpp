// PAMTALK - Token Ledger Implementation
// Copyright (c) 2024 PAMTALK Developers
// MIT License

#include "pamtalk/ledger/ledger.h"
#include "pamtalk/core/serialize.h"
#include "pamtalk/util/logging.h"

namespace pamtalk {

namespace {

Status Reject(ErrorCode code, const std::string& op, const std::string& msg) {
    LOG_DEBUG(util::LogCategory::LEDGER) << op << " rejected: "
                                         << ErrorCodeToString(code) << " (" << msg << ")";
    return Status::Error(code, msg);
}

} // namespace

Ledger::Ledger(AccountId admin) : admin_(std::move(admin)) {}

// ============================================================================
// Account Lifecycle
// ============================================================================

Status Ledger::OptIn(const AccountId& account) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (account.empty()) {
        return Reject(ErrorCode::InvalidAmount, "OptIn", "empty account id");
    }

    auto it = accounts_.find(account);
    if (it != accounts_.end() && it->second.balance > 0) {
        return Reject(ErrorCode::AlreadyActive, "OptIn", account + " holds a balance");
    }

    Account fresh;
    fresh.id = account;
    accounts_[account] = fresh;

    LOG_INFO(util::LogCategory::LEDGER) << "opt-in " << account;
    return Status::Ok();
}

Status Ledger::CloseOut(const AccountId& account) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = accounts_.find(account);
    if (it == accounts_.end()) {
        return Reject(ErrorCode::NotFound, "CloseOut", account);
    }
    if (it->second.balance != 0) {
        return Reject(ErrorCode::InvalidState, "CloseOut", account + " holds a balance");
    }

    accounts_.erase(it);
    LOG_INFO(util::LogCategory::LEDGER) << "close-out " << account;
    return Status::Ok();
}

// ============================================================================
// Supply Operations
// ============================================================================

Status Ledger::CheckTokenLocked(const AuthorizationToken& token,
                                AuthorizedAction expected) const {
    if (token.action != expected) {
        return Status::Error(ErrorCode::Unauthorized,
                             std::string("token authorizes ") +
                             AuthorizedActionToString(token.action));
    }
    if (!token.Verify(committeeKey_)) {
        return Status::Error(ErrorCode::Unauthorized, "token MAC mismatch");
    }
    if (consumedTokens_.count(token.proposalId)) {
        return Status::Error(ErrorCode::AlreadyExecuted,
                             "token for " + token.proposalId + " already used");
    }
    return Status::Ok();
}

Status Ledger::MintLocked(const AccountId& recipient, Amount amount) {
    if (amount == 0) {
        return Status::Error(ErrorCode::InvalidAmount, "zero amount");
    }
    auto it = accounts_.find(recipient);
    if (it == accounts_.end()) {
        return Status::Error(ErrorCode::NotFound, recipient);
    }
    if (AddWouldOverflow(totalSupply_, amount)) {
        return Status::Error(ErrorCode::InvalidAmount, "total supply overflow");
    }

    it->second.balance += amount;
    totalSupply_ += amount;
    return Status::Ok();
}

Status Ledger::Mint(const AccountId& recipient, Amount amount,
                    const AuthorizationToken& token) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (paused_) {
        return Reject(ErrorCode::Paused, "Mint", "ledger paused");
    }

    Status s = CheckTokenLocked(token, AuthorizedAction::Mint);
    if (!s.ok()) {
        return Reject(s.code(), "Mint", s.message());
    }
    if (token.target != recipient || token.amount != amount) {
        return Reject(ErrorCode::Unauthorized, "Mint", "token does not match mint arguments");
    }

    s = MintLocked(recipient, amount);
    if (!s.ok()) {
        return Reject(s.code(), "Mint", s.message());
    }
    consumedTokens_.insert(token.proposalId);

    LOG_INFO(util::LogCategory::LEDGER) << "mint " << amount << " to " << recipient
                                        << " (proposal " << token.proposalId << ")";
    return Status::Ok();
}

Status Ledger::MintTrusted(const std::string& minterId,
                           const AccountId& recipient, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (paused_) {
        return Reject(ErrorCode::Paused, "MintTrusted", "ledger paused");
    }
    if (!trustedMinters_.count(minterId)) {
        return Reject(ErrorCode::Unauthorized, "MintTrusted", minterId + " is not a trusted minter");
    }

    Status s = MintLocked(recipient, amount);
    if (!s.ok()) {
        return Reject(s.code(), "MintTrusted", s.message());
    }

    LOG_INFO(util::LogCategory::LEDGER) << "mint " << amount << " to " << recipient
                                        << " (by " << minterId << ")";
    return Status::Ok();
}

Status Ledger::Burn(const AccountId& holder, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (paused_) {
        return Reject(ErrorCode::Paused, "Burn", "ledger paused");
    }
    if (amount == 0) {
        return Reject(ErrorCode::InvalidAmount, "Burn", "zero amount");
    }
    auto it = accounts_.find(holder);
    if (it == accounts_.end()) {
        return Reject(ErrorCode::NotFound, "Burn", holder);
    }
    if (it->second.balance < amount) {
        return Reject(ErrorCode::InsufficientBalance, "Burn", holder);
    }

    it->second.balance -= amount;
    totalSupply_ -= amount;

    LOG_INFO(util::LogCategory::LEDGER) << "burn " << amount << " from " << holder;
    return Status::Ok();
}

// ============================================================================
// Transfers
// ============================================================================

Status Ledger::Transfer(const AccountId& sender, const AccountId& recipient,
                        Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (paused_) {
        return Reject(ErrorCode::Paused, "Transfer", "ledger paused");
    }
    if (amount == 0) {
        return Reject(ErrorCode::InvalidAmount, "Transfer", "zero amount");
    }

    auto from = accounts_.find(sender);
    if (from == accounts_.end()) {
        return Reject(ErrorCode::NotFound, "Transfer", sender);
    }
    auto to = accounts_.find(recipient);
    if (to == accounts_.end()) {
        return Reject(ErrorCode::NotFound, "Transfer", recipient);
    }
    if (from->second.frozen) {
        return Reject(ErrorCode::Frozen, "Transfer", sender);
    }
    if (from->second.balance < amount) {
        return Reject(ErrorCode::InsufficientBalance, "Transfer", sender);
    }

    from->second.balance -= amount;
    to->second.balance += amount;

    LOG_INFO(util::LogCategory::LEDGER) << "transfer " << amount << " "
                                        << sender << " -> " << recipient;
    return Status::Ok();
}

Status Ledger::Distribute(const AccountId& sender,
                          const std::vector<TransferLeg>& legs) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (paused_) {
        return Reject(ErrorCode::Paused, "Distribute", "ledger paused");
    }

    auto from = accounts_.find(sender);
    if (from == accounts_.end()) {
        return Reject(ErrorCode::NotFound, "Distribute", sender);
    }
    if (from->second.frozen) {
        return Reject(ErrorCode::Frozen, "Distribute", sender);
    }

    Amount total = 0;
    for (const auto& [recipient, amount] : legs) {
        if (!accounts_.count(recipient)) {
            return Reject(ErrorCode::NotFound, "Distribute", recipient);
        }
        if (AddWouldOverflow(total, amount)) {
            return Reject(ErrorCode::InvalidAmount, "Distribute", "leg total overflow");
        }
        total += amount;
    }
    if (total == 0) {
        return Reject(ErrorCode::InvalidAmount, "Distribute", "zero amount");
    }
    if (from->second.balance < total) {
        return Reject(ErrorCode::InsufficientBalance, "Distribute", sender);
    }

    from->second.balance -= total;
    for (const auto& [recipient, amount] : legs) {
        accounts_[recipient].balance += amount;
    }

    LOG_INFO(util::LogCategory::LEDGER) << "distribute " << total << " from " << sender
                                        << " over " << legs.size() << " legs";
    return Status::Ok();
}

// ============================================================================
// Administration
// ============================================================================

Status Ledger::SetPaused(const AccountId& caller, bool paused) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (caller != admin_) {
        return Reject(ErrorCode::Unauthorized, "SetPaused", caller);
    }
    paused_ = paused;

    LOG_INFO(util::LogCategory::LEDGER) << (paused ? "paused" : "unpaused") << " by admin";
    return Status::Ok();
}

Status Ledger::SetPaused(const AuthorizationToken& token, bool paused) {
    std::lock_guard<std::mutex> lock(mutex_);

    Status s = CheckTokenLocked(token, AuthorizedAction::SetPaused);
    if (!s.ok()) {
        return Reject(s.code(), "SetPaused", s.message());
    }
    if (token.flag != paused) {
        return Reject(ErrorCode::Unauthorized, "SetPaused", "token does not match pause state");
    }

    paused_ = paused;
    consumedTokens_.insert(token.proposalId);

    LOG_INFO(util::LogCategory::LEDGER) << (paused ? "paused" : "unpaused")
                                        << " by proposal " << token.proposalId;
    return Status::Ok();
}

Status Ledger::SetFrozen(const AccountId& caller, const AccountId& account, bool frozen) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (caller != admin_) {
        return Reject(ErrorCode::Unauthorized, "SetFrozen", caller);
    }
    auto it = accounts_.find(account);
    if (it == accounts_.end()) {
        return Reject(ErrorCode::NotFound, "SetFrozen", account);
    }
    it->second.frozen = frozen;

    LOG_INFO(util::LogCategory::LEDGER) << account << (frozen ? " frozen" : " unfrozen");
    return Status::Ok();
}

Status Ledger::SetFrozen(const AuthorizationToken& token, const AccountId& account, bool frozen) {
    std::lock_guard<std::mutex> lock(mutex_);

    Status s = CheckTokenLocked(token, AuthorizedAction::SetFrozen);
    if (!s.ok()) {
        return Reject(s.code(), "SetFrozen", s.message());
    }
    if (token.target != account || token.flag != frozen) {
        return Reject(ErrorCode::Unauthorized, "SetFrozen", "token does not match freeze arguments");
    }
    auto it = accounts_.find(account);
    if (it == accounts_.end()) {
        return Reject(ErrorCode::NotFound, "SetFrozen", account);
    }

    it->second.frozen = frozen;
    consumedTokens_.insert(token.proposalId);

    LOG_INFO(util::LogCategory::LEDGER) << account << (frozen ? " frozen" : " unfrozen")
                                        << " by proposal " << token.proposalId;
    return Status::Ok();
}

Status Ledger::SetCommitteeKey(const AccountId& caller, const std::vector<Byte>& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (caller != admin_) {
        return Reject(ErrorCode::Unauthorized, "SetCommitteeKey", caller);
    }
    if (key.empty()) {
        return Reject(ErrorCode::InvalidAmount, "SetCommitteeKey", "empty key");
    }
    committeeKey_ = key;

    LOG_INFO(util::LogCategory::LEDGER) << "committee key installed (" << key.size() << " bytes)";
    return Status::Ok();
}

Status Ledger::RegisterTrustedMinter(const AccountId& caller, const std::string& minterId) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (caller != admin_) {
        return Reject(ErrorCode::Unauthorized, "RegisterTrustedMinter", caller);
    }
    if (!trustedMinters_.insert(minterId).second) {
        return Reject(ErrorCode::AlreadyExists, "RegisterTrustedMinter", minterId);
    }

    LOG_INFO(util::LogCategory::LEDGER) << "trusted minter registered: " << minterId;
    return Status::Ok();
}

Status Ledger::RevokeTrustedMinter(const AccountId& caller, const std::string& minterId) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (caller != admin_) {
        return Reject(ErrorCode::Unauthorized, "RevokeTrustedMinter", caller);
    }
    if (trustedMinters_.erase(minterId) == 0) {
        return Reject(ErrorCode::NotFound, "RevokeTrustedMinter", minterId);
    }

    LOG_INFO(util::LogCategory::LEDGER) << "trusted minter revoked: " << minterId;
    return Status::Ok();
}

// ============================================================================
// Queries
// ============================================================================

bool Ledger::IsOptedIn(const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.count(account) != 0;
}

std::optional<Account> Ledger::GetAccount(const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(account);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Amount Ledger::GetBalance(const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(account);
    return it == accounts_.end() ? 0 : it->second.balance;
}

bool Ledger::IsFrozen(const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(account);
    return it != accounts_.end() && it->second.frozen;
}

bool Ledger::IsPaused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

Amount Ledger::GetTotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

size_t Ledger::GetAccountCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.size();
}

bool Ledger::IsTrustedMinter(const std::string& minterId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trustedMinters_.count(minterId) != 0;
}

bool Ledger::IsTokenConsumed(const std::string& proposalId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consumedTokens_.count(proposalId) != 0;
}

bool Ledger::CheckConservation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount sum = 0;
    for (const auto& [id, account] : accounts_) {
        if (AddWouldOverflow(sum, account.balance)) {
            return false;
        }
        sum += account.balance;
    }
    return sum == totalSupply_;
}

// ============================================================================
// Persistence
// ============================================================================

std::vector<Byte> Ledger::Serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);

    DataStream ss;
    ss << admin_ << paused_ << totalSupply_ << committeeKey_;

    WriteCompactSize(ss, accounts_.size());
    for (const auto& [id, account] : accounts_) {
        ss << id << account.balance << account.frozen;
    }

    ss << std::vector<std::string>(trustedMinters_.begin(), trustedMinters_.end());
    ss << std::vector<std::string>(consumedTokens_.begin(), consumedTokens_.end());
    return ss.Data();
}

bool Ledger::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return false;
    }

    AccountId admin;
    bool paused = false;
    Amount supply = 0;
    std::vector<Byte> key;
    std::map<AccountId, Account> accounts;
    std::vector<std::string> minters;
    std::vector<std::string> consumed;

    try {
        DataStream ss(data, len);
        ss >> admin >> paused >> supply >> key;

        uint64_t count = ReadCompactSize(ss);
        for (uint64_t i = 0; i < count; ++i) {
            Account account;
            ss >> account.id >> account.balance >> account.frozen;
            accounts[account.id] = account;
        }

        ss >> minters >> consumed;
        if (!ss.empty()) {
            return false;
        }
    } catch (const std::exception& e) {
        LOG_WARN(util::LogCategory::LEDGER) << "ledger snapshot rejected: " << e.what();
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    admin_ = std::move(admin);
    paused_ = paused;
    totalSupply_ = supply;
    committeeKey_ = std::move(key);
    accounts_ = std::move(accounts);
    trustedMinters_ = std::set<std::string>(minters.begin(), minters.end());
    consumedTokens_ = std::set<std::string>(consumed.begin(), consumed.end());
    return true;
}

} // namespace pamtalk
