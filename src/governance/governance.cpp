// PAMTALK - Committee Governance Implementation
// Copyright (c) 2024 PAMTALK Developers
// MIT License

#include "pamtalk/governance/governance.h"
#include "pamtalk/core/serialize.h"
#include "pamtalk/util/logging.h"

#include <limits>

namespace pamtalk {
namespace governance {

// ============================================================================
// Enum Conversions
// ============================================================================

const char* ProposalTypeToString(ProposalType type) {
    switch (type) {
        case ProposalType::Mint:                 return "Mint";
        case ProposalType::Pause:                return "Pause";
        case ProposalType::Unpause:              return "Unpause";
        case ProposalType::Freeze:               return "Freeze";
        case ProposalType::Unfreeze:             return "Unfreeze";
        case ProposalType::SetRequiredApprovals: return "SetRequiredApprovals";
        case ProposalType::Signal:               return "Signal";
        default:                                 return "Unknown";
    }
}

std::optional<ProposalType> ProposalTypeFromString(const std::string& str) {
    static const std::map<std::string, ProposalType> kByName = {
        {"Mint", ProposalType::Mint},
        {"Pause", ProposalType::Pause},
        {"Unpause", ProposalType::Unpause},
        {"Freeze", ProposalType::Freeze},
        {"Unfreeze", ProposalType::Unfreeze},
        {"SetRequiredApprovals", ProposalType::SetRequiredApprovals},
        {"Signal", ProposalType::Signal},
    };
    auto it = kByName.find(str);
    if (it == kByName.end()) {
        return std::nullopt;
    }
    return it->second;
}

namespace {

Status Reject(ErrorCode code, const std::string& op, const std::string& msg) {
    LOG_DEBUG(util::LogCategory::GOVERNANCE) << op << " rejected: "
                                             << ErrorCodeToString(code) << " (" << msg << ")";
    return Status::Error(code, msg);
}

/// Type-specific payload checks applied at proposal time
Status ValidatePayload(ProposalType type, const ProposalPayload& payload) {
    switch (type) {
        case ProposalType::Mint:
            if (payload.target.empty()) {
                return Status::Error(ErrorCode::InvalidAmount, "mint proposal without recipient");
            }
            if (payload.amount == 0) {
                return Status::Error(ErrorCode::InvalidAmount, "mint proposal with zero amount");
            }
            break;
        case ProposalType::Freeze:
        case ProposalType::Unfreeze:
            if (payload.target.empty()) {
                return Status::Error(ErrorCode::InvalidAmount, "freeze proposal without target");
            }
            break;
        case ProposalType::SetRequiredApprovals:
            if (payload.amount == 0 ||
                payload.amount > std::numeric_limits<uint32_t>::max()) {
                return Status::Error(ErrorCode::InvalidAmount, "approval threshold out of range");
            }
            break;
        case ProposalType::Pause:
        case ProposalType::Unpause:
        case ProposalType::Signal:
            break;
        default:
            return Status::Error(ErrorCode::InvalidAmount, "unknown proposal type");
    }
    return Status::Ok();
}

} // namespace

// ============================================================================
// Governance
// ============================================================================

Governance::Governance(AccountId admin, std::vector<Byte> committeeKey,
                       uint32_t requiredApprovals, Timestamp proposalLifetime)
    : admin_(std::move(admin))
    , committeeKey_(std::move(committeeKey))
    , requiredApprovals_(requiredApprovals)
    , proposalLifetime_(proposalLifetime) {}

Status Governance::Propose(const std::string& id, const AccountId& creator,
                           ProposalType type, const ProposalPayload& payload,
                           Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (id.empty()) {
        return Reject(ErrorCode::InvalidAmount, "Propose", "empty proposal id");
    }
    if (proposals_.count(id)) {
        return Reject(ErrorCode::AlreadyExists, "Propose", id);
    }
    Status s = ValidatePayload(type, payload);
    if (!s.ok()) {
        return Reject(s.code(), "Propose", s.message());
    }

    Proposal proposal;
    proposal.id = id;
    proposal.creator = creator;
    proposal.type = type;
    proposal.payload = payload;
    proposal.voteCount = 1;
    proposal.createdAt = now;
    proposal.expiry = now + proposalLifetime_;
    proposals_.emplace(id, std::move(proposal));

    LOG_INFO(util::LogCategory::GOVERNANCE) << "proposal " << id << " ("
                                            << ProposalTypeToString(type) << ") by " << creator;
    return Status::Ok();
}

Status Governance::Vote(const std::string& id, const AccountId& voter,
                        bool approve, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return Reject(ErrorCode::NotFound, "Vote", id);
    }
    Proposal& proposal = it->second;
    if (proposal.executed) {
        return Reject(ErrorCode::AlreadyExecuted, "Vote", id);
    }
    if (proposal.IsExpired(now)) {
        return Reject(ErrorCode::Expired, "Vote", id);
    }

    proposal.votes.push_back(VoteRecord{voter, approve, now});
    if (approve) {
        ++proposal.voteCount;
    }

    LOG_INFO(util::LogCategory::GOVERNANCE) << voter << (approve ? " approved " : " declined ")
                                            << id << " (" << proposal.voteCount << "/"
                                            << requiredApprovals_ << ")";
    return Status::Ok();
}

Status Governance::CheckExecutableLocked(const Proposal& proposal, Timestamp now) const {
    if (proposal.executed) {
        return Status::Error(ErrorCode::AlreadyExecuted, proposal.id);
    }
    if (proposal.IsExpired(now)) {
        return Status::Error(ErrorCode::Expired, proposal.id);
    }
    if (proposal.voteCount < requiredApprovals_) {
        return Status::Error(ErrorCode::QuorumNotMet,
                             std::to_string(proposal.voteCount) + " of " +
                             std::to_string(requiredApprovals_) + " approvals");
    }
    return Status::Ok();
}

AuthorizationToken Governance::MakeTokenLocked(const Proposal& proposal) const {
    AuthorizationToken token;
    token.proposalId = proposal.id;

    switch (proposal.type) {
        case ProposalType::Mint:
            token.action = AuthorizedAction::Mint;
            token.target = proposal.payload.target;
            token.amount = proposal.payload.amount;
            break;
        case ProposalType::Pause:
        case ProposalType::Unpause:
            token.action = AuthorizedAction::SetPaused;
            token.flag = (proposal.type == ProposalType::Pause);
            break;
        case ProposalType::Freeze:
        case ProposalType::Unfreeze:
            token.action = AuthorizedAction::SetFrozen;
            token.target = proposal.payload.target;
            token.flag = (proposal.type == ProposalType::Freeze);
            break;
        default:
            break;
    }

    token.Seal(committeeKey_);
    return token;
}

Result<ExecutionOutcome> Governance::Execute(const std::string& id, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return Reject(ErrorCode::NotFound, "Execute", id);
    }
    Proposal& proposal = it->second;

    Status s = CheckExecutableLocked(proposal, now);
    if (!s.ok()) {
        return Reject(s.code(), "Execute", s.message());
    }

    ExecutionOutcome outcome;
    outcome.proposalId = id;
    outcome.type = proposal.type;

    switch (proposal.type) {
        case ProposalType::SetRequiredApprovals:
            requiredApprovals_ = static_cast<uint32_t>(proposal.payload.amount);
            break;
        case ProposalType::Signal:
            break;
        default:
            outcome.token = MakeTokenLocked(proposal);
            break;
    }
    proposal.executed = true;

    LOG_INFO(util::LogCategory::GOVERNANCE) << "executed " << id << " ("
                                            << ProposalTypeToString(proposal.type) << ")";
    return outcome;
}

Status Governance::SetRequiredApprovals(const AccountId& caller, uint32_t n) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (caller != admin_) {
        return Reject(ErrorCode::Unauthorized, "SetRequiredApprovals", caller);
    }
    if (n == 0) {
        return Reject(ErrorCode::InvalidAmount, "SetRequiredApprovals", "threshold must be positive");
    }
    requiredApprovals_ = n;

    LOG_INFO(util::LogCategory::GOVERNANCE) << "required approvals set to " << n;
    return Status::Ok();
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Proposal> Governance::GetProposal(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> Governance::GetProposalIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(proposals_.size());
    for (const auto& [id, proposal] : proposals_) {
        ids.push_back(id);
    }
    return ids;
}

size_t Governance::GetProposalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proposals_.size();
}

bool Governance::CanExecute(const std::string& id, Timestamp now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = proposals_.find(id);
    return it != proposals_.end() && CheckExecutableLocked(it->second, now).ok();
}

uint32_t Governance::GetRequiredApprovals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requiredApprovals_;
}

// ============================================================================
// Persistence
// ============================================================================

std::vector<Byte> Governance::Serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);

    DataStream ss;
    ss << requiredApprovals_;
    WriteCompactSize(ss, proposals_.size());
    for (const auto& [id, p] : proposals_) {
        ss << p.id << p.creator;
        ser_writedata8(ss, static_cast<uint8_t>(p.type));
        ss << p.payload.target << p.payload.amount << p.payload.memo;
        ss << p.voteCount << p.executed << p.createdAt << p.expiry;

        WriteCompactSize(ss, p.votes.size());
        for (const auto& v : p.votes) {
            ss << v.voter << v.approve << v.castAt;
        }
    }
    return ss.Data();
}

bool Governance::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return false;
    }

    uint32_t required = 0;
    std::map<std::string, Proposal> proposals;

    try {
        DataStream ss(data, len);
        ss >> required;

        uint64_t count = ReadCompactSize(ss);
        for (uint64_t i = 0; i < count; ++i) {
            Proposal p;
            ss >> p.id >> p.creator;
            uint8_t type = ser_readdata8(ss);
            if (type > static_cast<uint8_t>(ProposalType::Signal)) {
                return false;
            }
            p.type = static_cast<ProposalType>(type);
            ss >> p.payload.target >> p.payload.amount >> p.payload.memo;
            ss >> p.voteCount >> p.executed >> p.createdAt >> p.expiry;

            uint64_t voteCount = ReadCompactSize(ss);
            for (uint64_t j = 0; j < voteCount; ++j) {
                VoteRecord v;
                ss >> v.voter >> v.approve >> v.castAt;
                p.votes.push_back(std::move(v));
            }
            proposals[p.id] = std::move(p);
        }
        if (!ss.empty() || required == 0) {
            return false;
        }
    } catch (const std::exception& e) {
        LOG_WARN(util::LogCategory::GOVERNANCE) << "governance snapshot rejected: " << e.what();
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    requiredApprovals_ = required;
    proposals_ = std::move(proposals);
    return true;
}

} // namespace governance
} // namespace pamtalk
