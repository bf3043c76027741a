// PAMTALK - Engine Context Implementation
// Copyright (c) 2024 PAMTALK Developers
// MIT License

#include "pamtalk/node/context.h"
#include "pamtalk/core/hex.h"
#include "pamtalk/core/serialize.h"

#include <limits>
#include <utility>

namespace pamtalk {

namespace {

/// Snapshot header
constexpr uint32_t SNAPSHOT_MAGIC = 0x544D4150;  // "PAMT"
constexpr uint32_t SNAPSHOT_VERSION = 1;

} // namespace

EngineContext::~EngineContext() {
    ShutdownEngine(*this);
}

// ============================================================================
// LoadEngineOptions
// ============================================================================

namespace {

util::ConfigParseResult ParseEngineOptions(const util::ConfigManager& config,
                                           EngineInitOptions& options) {
    using util::ConfigKeys::GOVERNANCE_SECTION;
    using util::ConfigKeys::REWARD_SECTION;
    using util::ConfigKeys::SETTLEMENT_SECTION;
    using util::ConfigParseResult;

    EngineInitOptions out;

    out.admin = config.GetString(util::ConfigKeys::ADMIN);
    if (out.admin.empty()) {
        return ConfigParseResult::Error("Required key missing: admin");
    }

    if (auto hex = config.TryGetString(util::ConfigKeys::COMMITTEE_KEY)) {
        auto key = TryHexToBytes(*hex);
        if (!key || key->empty()) {
            return ConfigParseResult::Error("committee_key is not valid hex");
        }
        out.committeeKey = std::move(*key);
    }

    out.escrowHolding = config.GetString(util::ConfigKeys::ESCROW_HOLDING, out.escrowHolding);
    if (out.escrowHolding.empty() || out.escrowHolding == out.admin) {
        return ConfigParseResult::Error("escrow_holding must be a distinct account");
    }

    if (config.HasKey(util::ConfigKeys::REQUIRED_APPROVALS, GOVERNANCE_SECTION)) {
        auto n = config.TryGetUInt(util::ConfigKeys::REQUIRED_APPROVALS, GOVERNANCE_SECTION);
        if (!n || *n == 0 || *n > std::numeric_limits<uint32_t>::max()) {
            return ConfigParseResult::Error("governance.required_approvals out of range");
        }
        out.requiredApprovals = static_cast<uint32_t>(*n);
    }

    if (config.HasKey(util::ConfigKeys::PROPOSAL_LIFETIME, GOVERNANCE_SECTION)) {
        auto secs = config.TryGetInt(util::ConfigKeys::PROPOSAL_LIFETIME, GOVERNANCE_SECTION);
        if (!secs || *secs <= 0) {
            return ConfigParseResult::Error("governance.proposal_lifetime must be positive");
        }
        out.proposalLifetime = *secs;
    }

    if (config.HasKey(util::ConfigKeys::REWARD_RATE, REWARD_SECTION)) {
        auto rate = config.TryGetUInt(util::ConfigKeys::REWARD_RATE, REWARD_SECTION);
        if (!rate || *rate == 0) {
            return ConfigParseResult::Error("reward.reward_rate must be positive");
        }
        out.rewardRate = *rate;
    }

    if (config.HasKey(util::ConfigKeys::FEE_RATE_BPS, SETTLEMENT_SECTION)) {
        auto bps = config.TryGetUInt(util::ConfigKeys::FEE_RATE_BPS, SETTLEMENT_SECTION);
        if (!bps || *bps > BPS_DENOMINATOR) {
            return ConfigParseResult::Error("settlement.fee_rate_bps must be 0..10000");
        }
        out.feeRateBps = static_cast<uint32_t>(*bps);
    }

    out.logLevel = util::LogLevelFromString(
        config.GetString(util::ConfigKeys::LOG_LEVEL, "info", util::ConfigKeys::LOG_SECTION));

    options = std::move(out);
    return ConfigParseResult::Success();
}

} // namespace

util::ConfigParseResult LoadEngineOptions(const util::ConfigManager& config,
                                          EngineInitOptions& options) {
    util::ConfigParseResult result = ParseEngineOptions(config, options);
    if (!result.success) {
        LOG_ERROR(util::LogCategory::CONFIG) << "engine options rejected: "
                                             << result.errorMessage;
    } else {
        LOG_DEBUG(util::LogCategory::CONFIG) << "engine options loaded for admin "
                                             << options.admin;
    }
    return result;
}

// ============================================================================
// InitializeEngine
// ============================================================================

Status InitializeEngine(EngineContext& ctx, const EngineInitOptions& options) {
    if (options.admin.empty()) {
        return Status::Error(ErrorCode::Unauthorized, "admin identity required");
    }
    if (options.feeRateBps > BPS_DENOMINATOR || options.requiredApprovals == 0 ||
        options.rewardRate == 0) {
        return Status::Error(ErrorCode::InvalidAmount, "engine parameter out of range");
    }

    util::Logger::Instance().SetLevel(options.logLevel);
    LOG_INFO(util::LogCategory::DEFAULT) << "Initializing exchange engine (admin "
                                         << options.admin << ")";

    auto ledger = std::make_unique<Ledger>(options.admin);

    if (!options.committeeKey.empty()) {
        Status s = ledger->SetCommitteeKey(options.admin, options.committeeKey);
        if (!s.ok()) {
            return s;
        }
    } else {
        LOG_WARN(util::LogCategory::DEFAULT) << "No committee key configured; "
                                             << "governance tokens will be rejected";
    }

    for (const char* minter : {economics::REWARD_MINTER_ID, economics::SETTLEMENT_MINTER_ID}) {
        Status s = ledger->RegisterTrustedMinter(options.admin, minter);
        if (!s.ok()) {
            return s;
        }
    }

    Status s = ledger->OptIn(options.escrowHolding);
    if (!s.ok()) {
        return s;
    }

    ShutdownEngine(ctx);

    ctx.options = options;
    ctx.governance = std::make_unique<governance::Governance>(
        options.admin, options.committeeKey, options.requiredApprovals,
        options.proposalLifetime);
    ctx.rewards = std::make_unique<economics::RewardAccrual>(
        *ledger, options.admin, options.rewardRate);
    ctx.settlement = std::make_unique<economics::StationSettlement>(
        *ledger, options.admin, options.feeRateBps);
    ctx.escrow = std::make_unique<economics::EnterpriseEscrow>(
        *ledger, options.admin, options.escrowHolding);
    ctx.ledger = std::move(ledger);
    ctx.initialized = true;

    LOG_INFO(util::LogCategory::DEFAULT) << "Engine ready: " << options.requiredApprovals
                                         << " approvals, reward rate " << options.rewardRate
                                         << ", fee " << options.feeRateBps << " bps";
    return Status::Ok();
}

void ShutdownEngine(EngineContext& ctx) {
    ctx.initialized = false;
    ctx.escrow.reset();
    ctx.settlement.reset();
    ctx.rewards.reset();
    ctx.governance.reset();
    ctx.ledger.reset();
}

Status ApplyGovernanceOutcome(EngineContext& ctx,
                              const governance::ExecutionOutcome& outcome) {
    if (!ctx.IsReady()) {
        return Status::Error(ErrorCode::InvalidState, "engine not initialized");
    }
    if (!outcome.token) {
        return Status::Ok();
    }

    const AuthorizationToken& token = *outcome.token;
    switch (token.action) {
        case AuthorizedAction::Mint:
            return ctx.ledger->Mint(token.target, token.amount, token);
        case AuthorizedAction::SetPaused:
            return ctx.ledger->SetPaused(token, token.flag);
        case AuthorizedAction::SetFrozen:
            return ctx.ledger->SetFrozen(token, token.target, token.flag);
        default:
            return Status::Error(ErrorCode::Unauthorized, "unknown token action");
    }
}

// ============================================================================
// Snapshots
// ============================================================================

std::vector<Byte> SaveSnapshot(const EngineContext& ctx) {
    if (!ctx.IsReady()) {
        return {};
    }

    DataStream ss;
    ss << SNAPSHOT_MAGIC << SNAPSHOT_VERSION;
    ss << ctx.ledger->Serialize()
       << ctx.governance->Serialize()
       << ctx.rewards->Serialize()
       << ctx.settlement->Serialize()
       << ctx.escrow->Serialize();
    return ss.Data();
}

Status LoadSnapshot(EngineContext& ctx, const std::vector<Byte>& snapshot) {
    if (!ctx.IsReady()) {
        return Status::Error(ErrorCode::InvalidState, "engine not initialized");
    }

    std::vector<Byte> ledgerBlob, governanceBlob, rewardBlob, settlementBlob, escrowBlob;
    try {
        DataStream ss(snapshot);
        uint32_t magic = 0;
        uint32_t version = 0;
        ss >> magic >> version;
        if (magic != SNAPSHOT_MAGIC || version != SNAPSHOT_VERSION) {
            return Status::Error(ErrorCode::InvalidState, "unrecognized snapshot header");
        }
        ss >> ledgerBlob >> governanceBlob >> rewardBlob >> settlementBlob >> escrowBlob;
        if (!ss.empty()) {
            return Status::Error(ErrorCode::InvalidState, "trailing snapshot data");
        }
    } catch (const std::exception& e) {
        return Status::Error(ErrorCode::InvalidState, std::string("truncated snapshot: ") + e.what());
    }

    const EngineInitOptions& opt = ctx.options;

    // Rebuild into fresh components so a bad blob leaves ctx untouched
    auto ledger = std::make_unique<Ledger>(opt.admin);
    auto gov = std::make_unique<governance::Governance>(
        opt.admin, opt.committeeKey, opt.requiredApprovals, opt.proposalLifetime);
    auto rewards = std::make_unique<economics::RewardAccrual>(*ledger, opt.admin, opt.rewardRate);
    auto settlement = std::make_unique<economics::StationSettlement>(*ledger, opt.admin, opt.feeRateBps);
    auto escrow = std::make_unique<economics::EnterpriseEscrow>(*ledger, opt.admin, opt.escrowHolding);

    if (!ledger->Deserialize(ledgerBlob.data(), ledgerBlob.size()) ||
        !gov->Deserialize(governanceBlob.data(), governanceBlob.size()) ||
        !rewards->Deserialize(rewardBlob.data(), rewardBlob.size()) ||
        !settlement->Deserialize(settlementBlob.data(), settlementBlob.size()) ||
        !escrow->Deserialize(escrowBlob.data(), escrowBlob.size())) {
        return Status::Error(ErrorCode::InvalidState, "component snapshot rejected");
    }
    if (ledger->GetAdmin() != opt.admin) {
        return Status::Error(ErrorCode::InvalidState, "snapshot admin does not match options");
    }
    if (escrow->GetHoldingAccount() != opt.escrowHolding) {
        return Status::Error(ErrorCode::InvalidState,
                             "snapshot holding account does not match options");
    }
    if (!ledger->CheckConservation()) {
        return Status::Error(ErrorCode::InvalidState, "snapshot violates supply conservation");
    }

    ShutdownEngine(ctx);
    ctx.ledger = std::move(ledger);
    ctx.governance = std::move(gov);
    ctx.rewards = std::move(rewards);
    ctx.settlement = std::move(settlement);
    ctx.escrow = std::move(escrow);
    ctx.initialized = true;

    LOG_INFO(util::LogCategory::DEFAULT) << "Snapshot loaded (" << snapshot.size() << " bytes)";
    return Status::Ok();
}

} // namespace pamtalk
