// PAMTALK - Enterprise Escrow Tests
// Copyright (c) 2024 PAMTALK Developers
// MIT License

#include <gtest/gtest.h>
#include <pamtalk/economics/escrow.h>

#include <memory>

using namespace pamtalk;
using namespace pamtalk::economics;

// ============================================================================
// Test Fixture
// ============================================================================

class EscrowTest : public ::testing::Test {
protected:
    void SetUp() override {
        ledger_ = std::make_unique<Ledger>("admin");
        ASSERT_TRUE(ledger_->RegisterTrustedMinter("admin", "faucet").ok());
        for (const char* id : {"buyer", "seller", DEFAULT_ESCROW_HOLDING}) {
            ASSERT_TRUE(ledger_->OptIn(id).ok());
        }
        ASSERT_TRUE(ledger_->MintTrusted("faucet", "buyer", 10000).ok());
        escrow_ = std::make_unique<EnterpriseEscrow>(*ledger_, "admin");
    }

    /// Create e1 for `amount` and deposit it
    void CreateFunded(Amount amount) {
        ASSERT_TRUE(escrow_->CreateEscrow("e1", "buyer", "seller", amount, DEADLINE,
                                          Hash256(), NOW).ok());
        ASSERT_TRUE(escrow_->DepositFunds("e1", "buyer").ok());
    }

    Amount Holding() const { return ledger_->GetBalance(DEFAULT_ESCROW_HOLDING); }

    static constexpr Timestamp NOW = 1700000000;
    static constexpr Timestamp DEADLINE = NOW + 86400;

    std::unique_ptr<Ledger> ledger_;
    std::unique_ptr<EnterpriseEscrow> escrow_;
};

// ============================================================================
// Creation and Funding
// ============================================================================

TEST_F(EscrowTest, CreateEscrow) {
    ASSERT_TRUE(escrow_->CreateEscrow("e1", "buyer", "seller", 500, DEADLINE,
                                      Hash256(), NOW).ok());

    auto e = escrow_->GetEscrow("e1");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->status, EscrowStatus::Created);
    EXPECT_EQ(e->depositAmount, 0u);
    EXPECT_FALSE(e->IsFunded());
    EXPECT_EQ(ledger_->GetBalance("buyer"), 10000u);
}

TEST_F(EscrowTest, CreateEscrowRejections) {
    EXPECT_EQ(escrow_->CreateEscrow("", "buyer", "seller", 1, DEADLINE, Hash256(), NOW).code(),
              ErrorCode::InvalidAmount);
    EXPECT_EQ(escrow_->CreateEscrow("e1", "buyer", "seller", 0, DEADLINE, Hash256(), NOW).code(),
              ErrorCode::InvalidAmount);
    EXPECT_EQ(escrow_->CreateEscrow("e1", "buyer", "buyer", 1, DEADLINE, Hash256(), NOW).code(),
              ErrorCode::InvalidAmount);
    EXPECT_EQ(escrow_->CreateEscrow("e1", "buyer", "seller", 1, NOW, Hash256(), NOW).code(),
              ErrorCode::InvalidAmount);
    EXPECT_EQ(escrow_->GetEscrowCount(), 0u);

    ASSERT_TRUE(escrow_->CreateEscrow("e1", "buyer", "seller", 1, DEADLINE, Hash256(), NOW).ok());
    EXPECT_EQ(escrow_->CreateEscrow("e1", "buyer", "seller", 1, DEADLINE, Hash256(), NOW).code(),
              ErrorCode::AlreadyExists);
}

TEST_F(EscrowTest, HoldingAccountCannotBeAParty) {
    CreateFunded(1000);

    EXPECT_EQ(escrow_->CreateEscrow("e2", DEFAULT_ESCROW_HOLDING, "seller", 1000, DEADLINE,
                                    Hash256(), NOW).code(),
              ErrorCode::InvalidAmount);
    EXPECT_EQ(escrow_->CreateEscrow("e2", "buyer", DEFAULT_ESCROW_HOLDING, 1000, DEADLINE,
                                    Hash256(), NOW).code(),
              ErrorCode::InvalidAmount);
    EXPECT_FALSE(escrow_->GetEscrow("e2").has_value());

    ASSERT_TRUE(escrow_->ReleaseFunds("e1", "seller", DEADLINE + 1).ok());
    EXPECT_EQ(ledger_->GetBalance("seller"), 1000u);
    EXPECT_EQ(Holding(), 0u);
    EXPECT_EQ(escrow_->GetTotalEscrowed(), 0u);
}

TEST_F(EscrowTest, DepositMovesFundsToHolding) {
    CreateFunded(4000);

    EXPECT_EQ(ledger_->GetBalance("buyer"), 6000u);
    EXPECT_EQ(Holding(), 4000u);
    EXPECT_EQ(escrow_->GetEscrow("e1")->status, EscrowStatus::Funded);
    EXPECT_EQ(escrow_->GetTotalEscrowed(), 4000u);

    EXPECT_EQ(escrow_->DepositFunds("e1", "buyer").code(), ErrorCode::InvalidState);
    EXPECT_EQ(Holding(), 4000u);
}

TEST_F(EscrowTest, DepositRejections) {
    ASSERT_TRUE(escrow_->CreateEscrow("e1", "buyer", "seller", 20000, DEADLINE,
                                      Hash256(), NOW).ok());

    EXPECT_EQ(escrow_->DepositFunds("e1", "seller").code(), ErrorCode::Unauthorized);
    EXPECT_EQ(escrow_->DepositFunds("e1", "buyer").code(), ErrorCode::InsufficientBalance);
    EXPECT_EQ(escrow_->DepositFunds("nope", "buyer").code(), ErrorCode::NotFound);
    EXPECT_EQ(escrow_->GetEscrow("e1")->status, EscrowStatus::Created);
}

// ============================================================================
// Delivery and Release
// ============================================================================

TEST_F(EscrowTest, ReleaseAfterDualConfirmation) {
    CreateFunded(4000);

    EXPECT_EQ(escrow_->ConfirmReceipt("e1", "buyer", "r").code(), ErrorCode::InvalidState);
    EXPECT_EQ(escrow_->ConfirmShipment("e1", "buyer", "t").code(), ErrorCode::Unauthorized);
    ASSERT_TRUE(escrow_->ConfirmShipment("e1", "seller", "TRACK-1").ok());
    EXPECT_EQ(escrow_->ReleaseFunds("e1", "seller", NOW).code(), ErrorCode::Unauthorized);

    ASSERT_TRUE(escrow_->ConfirmReceipt("e1", "buyer", "RCPT-1").ok());
    ASSERT_TRUE(escrow_->ReleaseFunds("e1", "seller", NOW + 5).ok());

    auto e = escrow_->GetEscrow("e1");
    EXPECT_EQ(e->status, EscrowStatus::Completed);
    EXPECT_EQ(e->trackingRef, "TRACK-1");
    EXPECT_EQ(e->receiptRef, "RCPT-1");
    EXPECT_EQ(e->completedAt, NOW + 5);

    EXPECT_EQ(ledger_->GetBalance("seller"), 4000u);
    EXPECT_EQ(Holding(), 0u);
    EXPECT_EQ(escrow_->GetTotalEscrowed(), 0u);
    EXPECT_EQ(escrow_->GetTotalCompleted(), 4000u);
}

TEST_F(EscrowTest, FundsReleaseOnlyOnce) {
    CreateFunded(4000);
    ASSERT_TRUE(escrow_->ReleaseFunds("e1", "admin", NOW).ok());

    EXPECT_EQ(escrow_->ReleaseFunds("e1", "admin", NOW).code(), ErrorCode::InvalidState);
    EXPECT_EQ(escrow_->CancelEscrow("e1", "admin", NOW).code(), ErrorCode::InvalidState);
    EXPECT_EQ(ledger_->GetBalance("seller"), 4000u);
    EXPECT_EQ(ledger_->GetBalance("buyer"), 6000u);
}

TEST_F(EscrowTest, ReleaseAfterDeadline) {
    CreateFunded(4000);

    EXPECT_EQ(escrow_->ReleaseFunds("e1", "seller", DEADLINE).code(), ErrorCode::Unauthorized);
    ASSERT_TRUE(escrow_->ReleaseFunds("e1", "seller", DEADLINE + 1).ok());
    EXPECT_EQ(ledger_->GetBalance("seller"), 4000u);
}

TEST_F(EscrowTest, ReleaseRequiresFunding) {
    ASSERT_TRUE(escrow_->CreateEscrow("e1", "buyer", "seller", 100, DEADLINE,
                                      Hash256(), NOW).ok());
    EXPECT_EQ(escrow_->ReleaseFunds("e1", "admin", NOW).code(), ErrorCode::InvalidState);
}

// ============================================================================
// Disputes
// ============================================================================

TEST_F(EscrowTest, RaiseDispute) {
    CreateFunded(4000);
    ASSERT_TRUE(escrow_->RaiseDispute("e1", "buyer", "damaged goods").ok());

    auto e = escrow_->GetEscrow("e1");
    EXPECT_EQ(e->status, EscrowStatus::Disputed);
    ASSERT_TRUE(e->disputeReason.has_value());
    EXPECT_EQ(*e->disputeReason, "damaged goods");

    EXPECT_EQ(escrow_->RaiseDispute("e1", "seller", "again").code(), ErrorCode::InvalidState);
    EXPECT_EQ(escrow_->RaiseDispute("e1", "admin", "x").code(), ErrorCode::Unauthorized);
}

TEST_F(EscrowTest, DisputedEscrowStillReleasesAfterDeadline) {
    CreateFunded(4000);
    ASSERT_TRUE(escrow_->RaiseDispute("e1", "buyer", "damaged goods").ok());

    EXPECT_EQ(escrow_->ReleaseFunds("e1", "seller", DEADLINE).code(), ErrorCode::Unauthorized);
    ASSERT_TRUE(escrow_->ReleaseFunds("e1", "seller", DEADLINE + 100).ok());

    EXPECT_EQ(ledger_->GetBalance("seller"), 4000u);
    EXPECT_EQ(Holding(), 0u);
    EXPECT_EQ(escrow_->GetEscrow("e1")->status, EscrowStatus::Completed);
    EXPECT_EQ(escrow_->ResolveDispute("e1", "admin", DisputeResolution::RefundBuyer,
                                      DEADLINE + 200).code(),
              ErrorCode::InvalidState);
}

TEST_F(EscrowTest, ResolveRefundBuyer) {
    CreateFunded(4000);
    ASSERT_TRUE(escrow_->RaiseDispute("e1", "seller", "unpaid").ok());

    EXPECT_EQ(escrow_->ResolveDispute("e1", "seller", DisputeResolution::PaySeller, NOW).code(),
              ErrorCode::Unauthorized);
    ASSERT_TRUE(escrow_->ResolveDispute("e1", "admin", DisputeResolution::RefundBuyer, NOW).ok());

    EXPECT_EQ(ledger_->GetBalance("buyer"), 10000u);
    EXPECT_EQ(ledger_->GetBalance("seller"), 0u);
    EXPECT_EQ(escrow_->GetTotalCompleted(), 0u);

    auto e = escrow_->GetEscrow("e1");
    EXPECT_EQ(e->status, EscrowStatus::Completed);
    ASSERT_TRUE(e->resolution.has_value());
    EXPECT_EQ(*e->resolution, DisputeResolution::RefundBuyer);
}

TEST_F(EscrowTest, ResolvePaySeller) {
    CreateFunded(4000);
    ASSERT_TRUE(escrow_->RaiseDispute("e1", "buyer", "late").ok());
    ASSERT_TRUE(escrow_->ResolveDispute("e1", "admin", DisputeResolution::PaySeller, NOW).ok());

    EXPECT_EQ(ledger_->GetBalance("seller"), 4000u);
    EXPECT_EQ(ledger_->GetBalance("buyer"), 6000u);
    EXPECT_EQ(escrow_->GetTotalCompleted(), 4000u);
}

TEST_F(EscrowTest, ResolveSplitGivesRemainderToBuyer) {
    CreateFunded(4001);
    ASSERT_TRUE(escrow_->RaiseDispute("e1", "buyer", "partial delivery").ok());
    ASSERT_TRUE(escrow_->ResolveDispute("e1", "admin", DisputeResolution::Split, NOW).ok());

    EXPECT_EQ(ledger_->GetBalance("seller"), 2000u);
    EXPECT_EQ(ledger_->GetBalance("buyer"), 5999u + 2001u);
    EXPECT_EQ(Holding(), 0u);
    EXPECT_TRUE(ledger_->CheckConservation());
}

TEST_F(EscrowTest, ResolveUnfundedDisputeMovesNothing) {
    ASSERT_TRUE(escrow_->CreateEscrow("e1", "buyer", "seller", 100, DEADLINE,
                                      Hash256(), NOW).ok());
    ASSERT_TRUE(escrow_->RaiseDispute("e1", "seller", "never paid").ok());
    ASSERT_TRUE(escrow_->ResolveDispute("e1", "admin", DisputeResolution::Split, NOW).ok());

    EXPECT_EQ(escrow_->GetEscrow("e1")->status, EscrowStatus::Completed);
    EXPECT_EQ(ledger_->GetBalance("buyer"), 10000u);
}

TEST_F(EscrowTest, ResolveRequiresDispute) {
    CreateFunded(100);
    EXPECT_EQ(escrow_->ResolveDispute("e1", "admin", DisputeResolution::PaySeller, NOW).code(),
              ErrorCode::InvalidState);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(EscrowTest, AdminCancelRefundsDeposit) {
    CreateFunded(4000);

    EXPECT_EQ(escrow_->CancelEscrow("e1", "buyer", NOW).code(), ErrorCode::Unauthorized);
    ASSERT_TRUE(escrow_->CancelEscrow("e1", "admin", NOW).ok());

    EXPECT_EQ(escrow_->GetEscrow("e1")->status, EscrowStatus::Cancelled);
    EXPECT_EQ(ledger_->GetBalance("buyer"), 10000u);
    EXPECT_EQ(Holding(), 0u);
    EXPECT_EQ(escrow_->GetTotalEscrowed(), 0u);
}

TEST_F(EscrowTest, PartyCancelAfterBothConfirm) {
    CreateFunded(4000);
    ASSERT_TRUE(escrow_->ConfirmShipment("e1", "seller", "t").ok());
    EXPECT_EQ(escrow_->CancelEscrow("e1", "seller", NOW).code(), ErrorCode::Unauthorized);

    ASSERT_TRUE(escrow_->ConfirmReceipt("e1", "buyer", "r").ok());
    ASSERT_TRUE(escrow_->CancelEscrow("e1", "seller", NOW).ok());
    EXPECT_EQ(ledger_->GetBalance("buyer"), 10000u);
}

// ============================================================================
// Queries and Persistence
// ============================================================================

TEST_F(EscrowTest, EscrowsForParty) {
    ASSERT_TRUE(escrow_->CreateEscrow("e1", "buyer", "seller", 1, DEADLINE, Hash256(), NOW).ok());
    ASSERT_TRUE(escrow_->CreateEscrow("e2", "seller", "buyer", 1, DEADLINE, Hash256(), NOW).ok());
    ASSERT_TRUE(escrow_->CreateEscrow("e3", "seller", "other", 1, DEADLINE, Hash256(), NOW).ok());

    EXPECT_EQ(escrow_->GetEscrowsForParty("buyer").size(), 2u);
    EXPECT_EQ(escrow_->GetEscrowsForParty("seller").size(), 3u);
    EXPECT_EQ(escrow_->GetEscrowCount(), 3u);
}

TEST_F(EscrowTest, SerializeRestoresEscrows) {
    CreateFunded(4000);
    ASSERT_TRUE(escrow_->RaiseDispute("e1", "buyer", "why").ok());

    auto bytes = escrow_->Serialize();

    EnterpriseEscrow restored(*ledger_, "admin");
    ASSERT_TRUE(restored.Deserialize(bytes.data(), bytes.size()));
    EXPECT_EQ(restored.GetTotalEscrowed(), 4000u);

    auto e = restored.GetEscrow("e1");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->status, EscrowStatus::Disputed);
    EXPECT_EQ(e->depositAmount, 4000u);
    EXPECT_EQ(*e->disputeReason, "why");

    ASSERT_TRUE(restored.ResolveDispute("e1", "admin", DisputeResolution::PaySeller, NOW).ok());
    EXPECT_EQ(ledger_->GetBalance("seller"), 4000u);
}
