// PAMTALK - Enterprise Escrow
// Copyright (c) 2024 PAMTALK Developers
// MIT License
//
// Holds a buyer's deposit in a ledger holding account until the seller's
// delivery is confirmed, the deadline passes, or an administrator settles
// a dispute.
//
// Escrow lifecycle:
//   Created -> Funded -> Shipped -> Completed
//   Disputed and Cancelled are reachable from any non-terminal state.
//
// Funds move buyer -> holding -> (seller | buyer) exactly once.

#ifndef PAMTALK_ECONOMICS_ESCROW_H
#define PAMTALK_ECONOMICS_ESCROW_H

#include "pamtalk/core/status.h"
#include "pamtalk/core/types.h"
#include "pamtalk/ledger/ledger.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pamtalk {
namespace economics {

/// Default ledger account holding deposited escrow funds
constexpr const char* DEFAULT_ESCROW_HOLDING = "escrow_holding";

enum class EscrowStatus : uint8_t {
    Created = 0,
    Funded = 1,
    Shipped = 2,
    Completed = 3,
    Disputed = 4,
    Cancelled = 5,
};

enum class DisputeResolution : uint8_t {
    /// Whole deposit back to the buyer
    RefundBuyer = 0,
    /// Whole deposit to the seller
    PaySeller = 1,
    /// Seller receives floor(amount / 2), buyer the remainder
    Split = 2,
};

const char* EscrowStatusToString(EscrowStatus status);
const char* DisputeResolutionToString(DisputeResolution resolution);

struct Escrow {
    std::string id;
    AccountId buyer;
    AccountId seller;
    Amount amount{0};

    /// Either 0 or amount
    Amount depositAmount{0};

    EscrowStatus status{EscrowStatus::Created};
    bool buyerConfirmed{false};
    bool sellerConfirmed{false};

    /// Hash of the off-ledger contract terms
    Hash256 termsHash;
    std::string trackingRef;
    std::string receiptRef;

    Timestamp createdAt{0};
    Timestamp deadline{0};
    Timestamp completedAt{0};

    std::optional<std::string> disputeReason;
    std::optional<DisputeResolution> resolution;

    bool IsTerminal() const {
        return status == EscrowStatus::Completed || status == EscrowStatus::Cancelled;
    }
    bool IsFunded() const { return depositAmount != 0 && depositAmount == amount; }
};

class EnterpriseEscrow {
public:
    EnterpriseEscrow(Ledger& ledger, AccountId admin,
                     AccountId holdingAccount = DEFAULT_ESCROW_HOLDING);

    EnterpriseEscrow(const EnterpriseEscrow&) = delete;
    EnterpriseEscrow& operator=(const EnterpriseEscrow&) = delete;

    Status CreateEscrow(const std::string& id, const AccountId& buyer,
                        const AccountId& seller, Amount amount, Timestamp deadline,
                        const Hash256& termsHash, Timestamp now);

    /// Buyer-only. Moves amount from the buyer into the holding account.
    Status DepositFunds(const std::string& id, const AccountId& caller);

    /// Seller-only. Funded -> Shipped.
    Status ConfirmShipment(const std::string& id, const AccountId& caller,
                           const std::string& trackingRef);

    /// Buyer-only, once shipped. Sets the buyer confirmation flag.
    Status ConfirmReceipt(const std::string& id, const AccountId& caller,
                          const std::string& receiptRef);

    /// Pay the seller. Allowed on dual confirmation, for the admin, or once
    /// now > deadline.
    Status ReleaseFunds(const std::string& id, const AccountId& caller, Timestamp now);

    /// Buyer or seller
    Status RaiseDispute(const std::string& id, const AccountId& caller,
                        const std::string& reason);

    /// Admin-only, on a disputed escrow
    Status ResolveDispute(const std::string& id, const AccountId& caller,
                          DisputeResolution resolution, Timestamp now);

    /// Admin, or either party once both confirmation flags are set.
    /// Refunds any deposit to the buyer.
    Status CancelEscrow(const std::string& id, const AccountId& caller, Timestamp now);

    // ========================================================================
    // Queries
    // ========================================================================

    std::optional<Escrow> GetEscrow(const std::string& id) const;
    std::vector<Escrow> GetEscrowsForParty(const AccountId& party) const;
    size_t GetEscrowCount() const;

    const AccountId& GetHoldingAccount() const { return holdingAccount_; }

    /// Funds currently held
    Amount GetTotalEscrowed() const;
    /// Funds released to sellers
    Amount GetTotalCompleted() const;

    std::vector<Byte> Serialize() const;
    bool Deserialize(const Byte* data, size_t len);

private:
    Ledger& ledger_;
    AccountId admin_;
    AccountId holdingAccount_;

    std::map<std::string, Escrow> escrows_;
    Amount totalEscrowed_{0};
    Amount totalCompleted_{0};

    mutable std::mutex mutex_;

    /// Move to a terminal status and release the deposit from the totals
    void CloseOutLocked(Escrow& escrow, EscrowStatus status,
                        Amount sellerShare, Timestamp now);
};

} // namespace economics
} // namespace pamtalk

#endif // PAMTALK_ECONOMICS_ESCROW_H
