// PAMTALK - Committee Governance
// Copyright (c) 2024 PAMTALK Developers
// MIT License
//
// Multi-party propose/vote/execute workflow gating privileged ledger
// actions. An executed proposal yields a sealed AuthorizationToken that
// the ledger accepts exactly once.
//
// Votes are counted, not deduplicated: every approving vote increments
// the tally regardless of who cast it, and the vote log keeps repeats.

#ifndef PAMTALK_GOVERNANCE_GOVERNANCE_H
#define PAMTALK_GOVERNANCE_GOVERNANCE_H

#include "pamtalk/core/status.h"
#include "pamtalk/core/types.h"
#include "pamtalk/ledger/authorization.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pamtalk {
namespace governance {

// ============================================================================
// Constants
// ============================================================================

/// Approvals needed to execute (3 of 5 committee members)
constexpr uint32_t DEFAULT_REQUIRED_APPROVALS = 3;

/// Proposal lifetime (7 days)
constexpr Timestamp DEFAULT_PROPOSAL_LIFETIME = 7 * SECONDS_PER_DAY;

// ============================================================================
// Proposal Types
// ============================================================================

enum class ProposalType : uint8_t {
    /// Mint payload.amount to payload.target
    Mint = 0,

    /// Halt mint, burn and transfer
    Pause = 1,
    Unpause = 2,

    /// Freeze or unfreeze payload.target
    Freeze = 3,
    Unfreeze = 4,

    /// Replace the approval threshold with payload.amount
    SetRequiredApprovals = 5,

    /// Non-binding signaling, no side effect
    Signal = 6,
};

const char* ProposalTypeToString(ProposalType type);
std::optional<ProposalType> ProposalTypeFromString(const std::string& str);

struct ProposalPayload {
    AccountId target;
    Amount amount{0};
    std::string memo;
};

struct VoteRecord {
    AccountId voter;
    bool approve{false};
    Timestamp castAt{0};
};

// ============================================================================
// Proposal
// ============================================================================

struct Proposal {
    std::string id;
    AccountId creator;
    ProposalType type{ProposalType::Signal};
    ProposalPayload payload;

    /// Starts at 1 for the creator's implicit approval
    uint32_t voteCount{1};

    /// Every vote() call in order, duplicates included
    std::vector<VoteRecord> votes;

    bool executed{false};
    Timestamp createdAt{0};
    Timestamp expiry{0};

    bool IsExpired(Timestamp now) const { return now >= expiry; }
};

/// What Execute() produced
struct ExecutionOutcome {
    std::string proposalId;
    ProposalType type{ProposalType::Signal};

    /// Present for Mint, Pause, Unpause, Freeze and Unfreeze
    std::optional<AuthorizationToken> token;
};

// ============================================================================
// Governance Engine
// ============================================================================

class Governance {
public:
    Governance(AccountId admin, std::vector<Byte> committeeKey,
               uint32_t requiredApprovals = DEFAULT_REQUIRED_APPROVALS,
               Timestamp proposalLifetime = DEFAULT_PROPOSAL_LIFETIME);

    Governance(const Governance&) = delete;
    Governance& operator=(const Governance&) = delete;

    /// Create a proposal expiring at now + lifetime
    Status Propose(const std::string& id, const AccountId& creator,
                   ProposalType type, const ProposalPayload& payload,
                   Timestamp now);

    /// Record a vote; approving votes increment the tally
    Status Vote(const std::string& id, const AccountId& voter,
                bool approve, Timestamp now);

    /// Execute once the tally reaches the threshold before expiry
    Result<ExecutionOutcome> Execute(const std::string& id, Timestamp now);

    /// Admin-only. Zero is rejected.
    Status SetRequiredApprovals(const AccountId& caller, uint32_t n);

    // ========================================================================
    // Queries
    // ========================================================================

    std::optional<Proposal> GetProposal(const std::string& id) const;
    std::vector<std::string> GetProposalIds() const;
    size_t GetProposalCount() const;

    /// True when Execute(id, now) would succeed
    bool CanExecute(const std::string& id, Timestamp now) const;

    uint32_t GetRequiredApprovals() const;
    Timestamp GetProposalLifetime() const { return proposalLifetime_; }
    const AccountId& GetAdmin() const { return admin_; }

    // ========================================================================
    // Persistence
    // ========================================================================

    std::vector<Byte> Serialize() const;
    bool Deserialize(const Byte* data, size_t len);

private:
    AccountId admin_;
    std::vector<Byte> committeeKey_;
    uint32_t requiredApprovals_;
    Timestamp proposalLifetime_;

    std::map<std::string, Proposal> proposals_;

    mutable std::mutex mutex_;

    Status CheckExecutableLocked(const Proposal& proposal, Timestamp now) const;
    AuthorizationToken MakeTokenLocked(const Proposal& proposal) const;
};

} // namespace governance
} // namespace pamtalk

#endif // PAMTALK_GOVERNANCE_GOVERNANCE_H
