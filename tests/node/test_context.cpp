// PAMTALK - Engine Context Tests
// Copyright (c) 2024 PAMTALK Developers
// MIT License

#include <gtest/gtest.h>
#include <pamtalk/node/context.h>

#include <string>
#include <vector>

using namespace pamtalk;

// ============================================================================
// Option Loading
// ============================================================================

class EngineOptionsTest : public ::testing::Test {
protected:
    util::ConfigParseResult Load(const std::string& text) {
        auto parsed = config_.ParseString(text, "engine.conf");
        if (!parsed.success) {
            return parsed;
        }
        return LoadEngineOptions(config_, options_);
    }

    util::ConfigManager config_;
    EngineInitOptions options_;
};

TEST_F(EngineOptionsTest, DefaultsApply) {
    auto result = Load("admin = operator\n");
    ASSERT_TRUE(result.success) << result.ToString();

    EXPECT_EQ(options_.admin, "operator");
    EXPECT_TRUE(options_.committeeKey.empty());
    EXPECT_EQ(options_.escrowHolding, economics::DEFAULT_ESCROW_HOLDING);
    EXPECT_EQ(options_.requiredApprovals, governance::DEFAULT_REQUIRED_APPROVALS);
    EXPECT_EQ(options_.proposalLifetime, governance::DEFAULT_PROPOSAL_LIFETIME);
    EXPECT_EQ(options_.rewardRate, economics::DEFAULT_REWARD_RATE);
    EXPECT_EQ(options_.feeRateBps, economics::DEFAULT_FEE_RATE_BPS);
    EXPECT_EQ(options_.logLevel, util::LogLevel::Info);
}

TEST_F(EngineOptionsTest, SectionsOverrideDefaults) {
    auto result = Load(
        "admin = operator\n"
        "committee_key = 00ff10ab\n"
        "escrow_holding = vault\n"
        "[governance]\n"
        "required_approvals = 2\n"
        "proposal_lifetime = 600\n"
        "[reward]\n"
        "reward_rate = 5\n"
        "[settlement]\n"
        "fee_rate_bps = 250\n"
        "[log]\n"
        "level = debug\n");
    ASSERT_TRUE(result.success) << result.ToString();

    EXPECT_EQ(options_.committeeKey, (std::vector<Byte>{0x00, 0xff, 0x10, 0xab}));
    EXPECT_EQ(options_.escrowHolding, "vault");
    EXPECT_EQ(options_.requiredApprovals, 2u);
    EXPECT_EQ(options_.proposalLifetime, 600);
    EXPECT_EQ(options_.rewardRate, 5u);
    EXPECT_EQ(options_.feeRateBps, 250u);
    EXPECT_EQ(options_.logLevel, util::LogLevel::Debug);
}

TEST_F(EngineOptionsTest, InvalidValuesRejected) {
    EXPECT_FALSE(Load("committee_key = 00\n").success);

    config_.Clear();
    EXPECT_FALSE(Load("admin = a\ncommittee_key = xyz\n").success);

    config_.Clear();
    EXPECT_FALSE(Load("admin = a\nescrow_holding = a\n").success);

    config_.Clear();
    EXPECT_FALSE(Load("admin = a\n[governance]\nrequired_approvals = 0\n").success);

    config_.Clear();
    EXPECT_FALSE(Load("admin = a\n[governance]\nproposal_lifetime = -1\n").success);

    config_.Clear();
    EXPECT_FALSE(Load("admin = a\n[reward]\nreward_rate = lots\n").success);

    config_.Clear();
    EXPECT_FALSE(Load("admin = a\n[settlement]\nfee_rate_bps = 10001\n").success);
}

TEST_F(EngineOptionsTest, FailureLeavesOptionsUntouched) {
    options_.admin = "previous";
    EXPECT_FALSE(Load("admin = a\n[reward]\nreward_rate = 0\n").success);
    EXPECT_EQ(options_.admin, "previous");
}

TEST_F(EngineOptionsTest, RejectionIsLoggedUnderConfig) {
    std::vector<util::LogEntry> entries;
    auto sink = std::make_shared<util::CallbackSink>(
        [&entries](const util::LogEntry& entry) { entries.push_back(entry); },
        util::LogLevel::Trace);
    util::Logger::Instance().AddSink(sink);

    EXPECT_FALSE(Load("admin = a\ncommittee_key = zz\n").success);
    util::Logger::Instance().RemoveSink(sink);

    ASSERT_FALSE(entries.empty());
    EXPECT_EQ(entries.back().category, util::LogCategory::CONFIG);
    EXPECT_EQ(entries.back().level, util::LogLevel::Error);
    EXPECT_NE(entries.back().message.find("committee_key"), std::string::npos);
}

// ============================================================================
// Engine Fixture
// ============================================================================

class EngineContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.admin = "admin";
        options_.committeeKey = std::vector<Byte>(32, 0x7E);
        options_.requiredApprovals = 2;
        options_.logLevel = util::LogLevel::Warn;
        ASSERT_TRUE(InitializeEngine(ctx_, options_).ok());

        for (const char* id : {"alice", "bob", "op"}) {
            ASSERT_TRUE(ctx_.ledger->OptIn(id).ok());
        }
    }

    void TearDown() override {
        util::Logger::Instance().SetLevel(util::LogLevel::Info);
    }

    /// Propose, approve and execute a governance action, then apply it
    Status PassProposal(const std::string& id, governance::ProposalType type,
                        const AccountId& target = "", Amount amount = 0) {
        governance::ProposalPayload payload;
        payload.target = target;
        payload.amount = amount;

        Status s = ctx_.governance->Propose(id, "alice", type, payload, NOW);
        if (!s.ok()) return s;
        s = ctx_.governance->Vote(id, "bob", true, NOW + 1);
        if (!s.ok()) return s;

        auto outcome = ctx_.governance->Execute(id, NOW + 2);
        if (!outcome.ok()) return outcome.status();
        return ApplyGovernanceOutcome(ctx_, *outcome);
    }

    static constexpr Timestamp NOW = 1700000000;

    EngineInitOptions options_;
    EngineContext ctx_;
};

// ============================================================================
// Initialization
// ============================================================================

TEST_F(EngineContextTest, InitializeWiresComponents) {
    EXPECT_TRUE(ctx_.IsReady());
    EXPECT_TRUE(ctx_.ledger->IsTrustedMinter(economics::REWARD_MINTER_ID));
    EXPECT_TRUE(ctx_.ledger->IsTrustedMinter(economics::SETTLEMENT_MINTER_ID));
    EXPECT_TRUE(ctx_.ledger->IsOptedIn(economics::DEFAULT_ESCROW_HOLDING));
    EXPECT_EQ(ctx_.governance->GetRequiredApprovals(), 2u);
    EXPECT_EQ(util::Logger::Instance().GetLevel(), util::LogLevel::Warn);
}

TEST_F(EngineContextTest, InitializeRejectsBadOptions) {
    EngineContext other;
    EngineInitOptions bad;
    EXPECT_EQ(InitializeEngine(other, bad).code(), ErrorCode::Unauthorized);

    bad.admin = "admin";
    bad.feeRateBps = 20000;
    EXPECT_EQ(InitializeEngine(other, bad).code(), ErrorCode::InvalidAmount);
    EXPECT_FALSE(other.IsReady());
}

TEST_F(EngineContextTest, ShutdownReleasesComponents) {
    ShutdownEngine(ctx_);
    EXPECT_FALSE(ctx_.IsReady());
    EXPECT_EQ(ctx_.escrow.get(), nullptr);
    EXPECT_EQ(ctx_.ledger.get(), nullptr);
    EXPECT_TRUE(SaveSnapshot(ctx_).empty());
}

// ============================================================================
// End-to-end Flows
// ============================================================================

TEST_F(EngineContextTest, RewardClaimThenTransfer) {
    auto reward = ctx_.rewards->RegisterActivity("alice", 100, "ev-charge-1", NOW);
    ASSERT_TRUE(reward.ok());
    EXPECT_EQ(*reward, 100000u);

    auto claimed = ctx_.rewards->Claim("alice");
    ASSERT_TRUE(claimed.ok());
    EXPECT_EQ(*claimed, 100000u);

    ASSERT_TRUE(ctx_.ledger->Transfer("alice", "bob", 40000).ok());
    EXPECT_EQ(ctx_.ledger->GetBalance("alice"), 60000u);
    EXPECT_EQ(ctx_.ledger->GetBalance("bob"), 40000u);
    EXPECT_EQ(ctx_.ledger->GetTotalSupply(), 100000u);
    EXPECT_TRUE(ctx_.ledger->CheckConservation());
}

TEST_F(EngineContextTest, GovernanceMint) {
    ASSERT_TRUE(PassProposal("mint-1", governance::ProposalType::Mint, "bob", 2500).ok());
    EXPECT_EQ(ctx_.ledger->GetBalance("bob"), 2500u);
    EXPECT_TRUE(ctx_.ledger->IsTokenConsumed("mint-1"));
}

TEST_F(EngineContextTest, GovernanceOutcomeAppliesOnce) {
    governance::ProposalPayload payload;
    payload.target = "bob";
    payload.amount = 10;
    ASSERT_TRUE(ctx_.governance->Propose("m", "alice", governance::ProposalType::Mint,
                                         payload, NOW).ok());
    ASSERT_TRUE(ctx_.governance->Vote("m", "bob", true, NOW).ok());
    auto outcome = ctx_.governance->Execute("m", NOW);
    ASSERT_TRUE(outcome.ok());

    ASSERT_TRUE(ApplyGovernanceOutcome(ctx_, *outcome).ok());
    EXPECT_EQ(ApplyGovernanceOutcome(ctx_, *outcome).code(), ErrorCode::AlreadyExecuted);
    EXPECT_EQ(ctx_.ledger->GetBalance("bob"), 10u);
}

TEST_F(EngineContextTest, GovernancePauseAndFreeze) {
    ASSERT_TRUE(PassProposal("pause", governance::ProposalType::Pause).ok());
    EXPECT_TRUE(ctx_.ledger->IsPaused());

    ASSERT_TRUE(PassProposal("unpause", governance::ProposalType::Unpause).ok());
    EXPECT_FALSE(ctx_.ledger->IsPaused());

    ASSERT_TRUE(PassProposal("freeze", governance::ProposalType::Freeze, "bob").ok());
    EXPECT_TRUE(ctx_.ledger->IsFrozen("bob"));
}

TEST_F(EngineContextTest, SignalOutcomeIsNoOp) {
    ASSERT_TRUE(PassProposal("sig", governance::ProposalType::Signal).ok());
    EXPECT_EQ(ctx_.ledger->GetTotalSupply(), 0u);
}

TEST_F(EngineContextTest, StationSettlementPaysOperator) {
    auto& settlement = *ctx_.settlement;
    ASSERT_TRUE(settlement.RegisterStation("admin", "st1", "op", NOW).ok());
    ASSERT_TRUE(settlement.RecordTransaction("st1", 100000).ok());
    ASSERT_TRUE(settlement.RequestSettlement("op", "st1", "s1", "2024-06", NOW).ok());
    ASSERT_TRUE(settlement.ApproveSettlement("admin", "s1", NOW).ok());
    ASSERT_TRUE(settlement.Withdraw("op", "s1", NOW).ok());

    EXPECT_EQ(ctx_.ledger->GetBalance("op"), 95000u);
    EXPECT_EQ(settlement.GetStation("st1")->pending, 0u);
    EXPECT_EQ(settlement.GetStation("st1")->settled, 95000u);
}

TEST_F(EngineContextTest, EscrowThroughHoldingAccount) {
    ASSERT_TRUE(ctx_.rewards->RegisterActivity("alice", 10, "ev", NOW).ok());
    ASSERT_TRUE(ctx_.rewards->Claim("alice").ok());

    auto& escrow = *ctx_.escrow;
    ASSERT_TRUE(escrow.CreateEscrow("e1", "alice", "bob", 6000, NOW + 100, Hash256(), NOW).ok());
    ASSERT_TRUE(escrow.DepositFunds("e1", "alice").ok());
    EXPECT_EQ(ctx_.ledger->GetBalance(escrow.GetHoldingAccount()), 6000u);

    ASSERT_TRUE(escrow.ConfirmShipment("e1", "bob", "trk").ok());
    ASSERT_TRUE(escrow.ConfirmReceipt("e1", "alice", "rcpt").ok());
    ASSERT_TRUE(escrow.ReleaseFunds("e1", "alice", NOW + 1).ok());

    EXPECT_EQ(ctx_.ledger->GetBalance("alice"), 4000u);
    EXPECT_EQ(ctx_.ledger->GetBalance("bob"), 6000u);
    EXPECT_TRUE(ctx_.ledger->CheckConservation());
}

// ============================================================================
// Snapshots
// ============================================================================

TEST_F(EngineContextTest, SnapshotRoundTrip) {
    ASSERT_TRUE(ctx_.rewards->RegisterActivity("alice", 100, "ev", NOW).ok());
    ASSERT_TRUE(ctx_.rewards->Claim("alice").ok());
    ASSERT_TRUE(ctx_.ledger->Transfer("alice", "bob", 40000).ok());
    ASSERT_TRUE(PassProposal("mint-1", governance::ProposalType::Mint, "bob", 5).ok());

    auto snapshot = SaveSnapshot(ctx_);
    ASSERT_FALSE(snapshot.empty());

    // Diverge, then restore
    ASSERT_TRUE(ctx_.ledger->Transfer("bob", "alice", 1000).ok());
    ASSERT_TRUE(LoadSnapshot(ctx_, snapshot).ok());

    EXPECT_EQ(ctx_.ledger->GetBalance("alice"), 60000u);
    EXPECT_EQ(ctx_.ledger->GetBalance("bob"), 40005u);
    EXPECT_EQ(ctx_.rewards->GetClaimedRewards("alice"), 100000u);
    EXPECT_TRUE(ctx_.governance->GetProposal("mint-1")->executed);
    EXPECT_TRUE(ctx_.ledger->IsTokenConsumed("mint-1"));

    // Restored components still share one ledger
    ASSERT_TRUE(ctx_.rewards->RegisterActivity("alice", 1, "ev2", NOW).ok());
    ASSERT_TRUE(ctx_.rewards->Claim("alice").ok());
    EXPECT_EQ(ctx_.ledger->GetBalance("alice"), 61000u);
}

TEST_F(EngineContextTest, CorruptSnapshotLeavesStateUntouched) {
    ASSERT_TRUE(ctx_.rewards->RegisterActivity("alice", 1, "ev", NOW).ok());
    ASSERT_TRUE(ctx_.rewards->Claim("alice").ok());

    auto snapshot = SaveSnapshot(ctx_);

    auto truncated = snapshot;
    truncated.resize(truncated.size() - 3);
    EXPECT_EQ(LoadSnapshot(ctx_, truncated).code(), ErrorCode::InvalidState);

    auto badMagic = snapshot;
    badMagic[0] ^= 0xFF;
    EXPECT_EQ(LoadSnapshot(ctx_, badMagic).code(), ErrorCode::InvalidState);

    EXPECT_EQ(LoadSnapshot(ctx_, {}).code(), ErrorCode::InvalidState);

    EXPECT_TRUE(ctx_.IsReady());
    EXPECT_EQ(ctx_.ledger->GetBalance("alice"), 1000u);
}

TEST_F(EngineContextTest, SnapshotFromDifferentDeploymentRejected) {
    ASSERT_TRUE(ctx_.rewards->RegisterActivity("alice", 1, "ev", NOW).ok());
    ASSERT_TRUE(ctx_.rewards->Claim("alice").ok());

    EngineInitOptions otherAdmin = options_;
    otherAdmin.admin = "someone_else";
    EngineContext foreign;
    ASSERT_TRUE(InitializeEngine(foreign, otherAdmin).ok());
    EXPECT_EQ(LoadSnapshot(ctx_, SaveSnapshot(foreign)).code(), ErrorCode::InvalidState);

    EngineInitOptions otherHolding = options_;
    otherHolding.escrowHolding = "vault";
    EngineContext relocated;
    ASSERT_TRUE(InitializeEngine(relocated, otherHolding).ok());
    EXPECT_EQ(LoadSnapshot(ctx_, SaveSnapshot(relocated)).code(), ErrorCode::InvalidState);

    EXPECT_TRUE(ctx_.IsReady());
    EXPECT_EQ(ctx_.ledger->GetAdmin(), "admin");
    EXPECT_EQ(ctx_.escrow->GetHoldingAccount(), economics::DEFAULT_ESCROW_HOLDING);
    EXPECT_EQ(ctx_.ledger->GetBalance("alice"), 1000u);
}
