// PAMTALK - Enterprise Escrow Implementation
// Copyright (c) 2024 PAMTALK Developers
// MIT License

#include "pamtalk/economics/escrow.h"
#include "pamtalk/core/serialize.h"
#include "pamtalk/util/logging.h"

namespace pamtalk {
namespace economics {

const char* EscrowStatusToString(EscrowStatus status) {
    switch (status) {
        case EscrowStatus::Created:   return "Created";
        case EscrowStatus::Funded:    return "Funded";
        case EscrowStatus::Shipped:   return "Shipped";
        case EscrowStatus::Completed: return "Completed";
        case EscrowStatus::Disputed:  return "Disputed";
        case EscrowStatus::Cancelled: return "Cancelled";
        default:                      return "Unknown";
    }
}

const char* DisputeResolutionToString(DisputeResolution resolution) {
    switch (resolution) {
        case DisputeResolution::RefundBuyer: return "RefundBuyer";
        case DisputeResolution::PaySeller:   return "PaySeller";
        case DisputeResolution::Split:       return "Split";
        default:                             return "Unknown";
    }
}

namespace {

Status Reject(ErrorCode code, const std::string& op, const std::string& msg) {
    LOG_DEBUG(util::LogCategory::ESCROW) << op << " rejected: "
                                         << ErrorCodeToString(code) << " (" << msg << ")";
    return Status::Error(code, msg);
}

Status WrongState(const std::string& op, const Escrow& escrow) {
    return Reject(ErrorCode::InvalidState, op,
                  escrow.id + " is " + EscrowStatusToString(escrow.status));
}

} // namespace

EnterpriseEscrow::EnterpriseEscrow(Ledger& ledger, AccountId admin, AccountId holdingAccount)
    : ledger_(ledger)
    , admin_(std::move(admin))
    , holdingAccount_(std::move(holdingAccount)) {}

void EnterpriseEscrow::CloseOutLocked(Escrow& escrow, EscrowStatus status,
                                      Amount sellerShare, Timestamp now) {
    totalEscrowed_ -= escrow.depositAmount;
    totalCompleted_ += sellerShare;
    escrow.status = status;
    escrow.completedAt = now;
}

// ============================================================================
// Lifecycle
// ============================================================================

Status EnterpriseEscrow::CreateEscrow(const std::string& id, const AccountId& buyer,
                                      const AccountId& seller, Amount amount,
                                      Timestamp deadline, const Hash256& termsHash,
                                      Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (id.empty() || buyer.empty() || seller.empty()) {
        return Reject(ErrorCode::InvalidAmount, "CreateEscrow", "empty identifier");
    }
    if (escrows_.count(id)) {
        return Reject(ErrorCode::AlreadyExists, "CreateEscrow", id);
    }
    if (amount == 0) {
        return Reject(ErrorCode::InvalidAmount, "CreateEscrow", "zero amount");
    }
    if (buyer == seller) {
        return Reject(ErrorCode::InvalidAmount, "CreateEscrow", "buyer and seller are the same");
    }
    if (buyer == holdingAccount_ || seller == holdingAccount_) {
        return Reject(ErrorCode::InvalidAmount, "CreateEscrow", "holding account cannot be a party");
    }
    if (deadline <= now) {
        return Reject(ErrorCode::InvalidAmount, "CreateEscrow", "deadline already passed");
    }

    Escrow escrow;
    escrow.id = id;
    escrow.buyer = buyer;
    escrow.seller = seller;
    escrow.amount = amount;
    escrow.termsHash = termsHash;
    escrow.createdAt = now;
    escrow.deadline = deadline;
    escrows_.emplace(id, std::move(escrow));

    LOG_INFO(util::LogCategory::ESCROW) << "escrow " << id << " created: " << buyer
                                        << " -> " << seller << " amount " << amount;
    return Status::Ok();
}

Status EnterpriseEscrow::DepositFunds(const std::string& id, const AccountId& caller) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = escrows_.find(id);
    if (it == escrows_.end()) {
        return Reject(ErrorCode::NotFound, "DepositFunds", id);
    }
    Escrow& escrow = it->second;
    if (caller != escrow.buyer) {
        return Reject(ErrorCode::Unauthorized, "DepositFunds", caller);
    }
    if (escrow.status != EscrowStatus::Created) {
        return WrongState("DepositFunds", escrow);
    }
    if (AddWouldOverflow(totalEscrowed_, escrow.amount)) {
        return Reject(ErrorCode::InvalidAmount, "DepositFunds", "escrow total overflow");
    }

    Status s = ledger_.Transfer(escrow.buyer, holdingAccount_, escrow.amount);
    if (!s.ok()) {
        return Reject(s.code(), "DepositFunds", s.message());
    }

    escrow.depositAmount = escrow.amount;
    escrow.status = EscrowStatus::Funded;
    totalEscrowed_ += escrow.amount;

    LOG_INFO(util::LogCategory::ESCROW) << "escrow " << id << " funded with " << escrow.amount;
    return Status::Ok();
}

Status EnterpriseEscrow::ConfirmShipment(const std::string& id, const AccountId& caller,
                                         const std::string& trackingRef) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = escrows_.find(id);
    if (it == escrows_.end()) {
        return Reject(ErrorCode::NotFound, "ConfirmShipment", id);
    }
    Escrow& escrow = it->second;
    if (caller != escrow.seller) {
        return Reject(ErrorCode::Unauthorized, "ConfirmShipment", caller);
    }
    if (escrow.status != EscrowStatus::Funded) {
        return WrongState("ConfirmShipment", escrow);
    }

    escrow.sellerConfirmed = true;
    escrow.trackingRef = trackingRef;
    escrow.status = EscrowStatus::Shipped;

    LOG_INFO(util::LogCategory::ESCROW) << "escrow " << id << " shipped (" << trackingRef << ")";
    return Status::Ok();
}

Status EnterpriseEscrow::ConfirmReceipt(const std::string& id, const AccountId& caller,
                                        const std::string& receiptRef) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = escrows_.find(id);
    if (it == escrows_.end()) {
        return Reject(ErrorCode::NotFound, "ConfirmReceipt", id);
    }
    Escrow& escrow = it->second;
    if (caller != escrow.buyer) {
        return Reject(ErrorCode::Unauthorized, "ConfirmReceipt", caller);
    }
    if (escrow.status != EscrowStatus::Shipped) {
        return WrongState("ConfirmReceipt", escrow);
    }

    escrow.buyerConfirmed = true;
    escrow.receiptRef = receiptRef;

    LOG_INFO(util::LogCategory::ESCROW) << "escrow " << id << " receipt confirmed";
    return Status::Ok();
}

Status EnterpriseEscrow::ReleaseFunds(const std::string& id, const AccountId& caller,
                                      Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = escrows_.find(id);
    if (it == escrows_.end()) {
        return Reject(ErrorCode::NotFound, "ReleaseFunds", id);
    }
    Escrow& escrow = it->second;
    if (escrow.IsTerminal() || !escrow.IsFunded()) {
        return WrongState("ReleaseFunds", escrow);
    }

    bool dualConfirmed = escrow.buyerConfirmed && escrow.sellerConfirmed;
    bool timedOut = now > escrow.deadline;
    if (!dualConfirmed && caller != admin_ && !timedOut) {
        return Reject(ErrorCode::Unauthorized, "ReleaseFunds",
                      "awaiting confirmations or deadline");
    }

    Status s = ledger_.Transfer(holdingAccount_, escrow.seller, escrow.depositAmount);
    if (!s.ok()) {
        return Reject(s.code(), "ReleaseFunds", s.message());
    }

    Amount paid = escrow.depositAmount;
    CloseOutLocked(escrow, EscrowStatus::Completed, paid, now);

    LOG_INFO(util::LogCategory::ESCROW) << "escrow " << id << " released " << paid
                                        << " to " << escrow.seller;
    return Status::Ok();
}

// ============================================================================
// Disputes
// ============================================================================

Status EnterpriseEscrow::RaiseDispute(const std::string& id, const AccountId& caller,
                                      const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = escrows_.find(id);
    if (it == escrows_.end()) {
        return Reject(ErrorCode::NotFound, "RaiseDispute", id);
    }
    Escrow& escrow = it->second;
    if (caller != escrow.buyer && caller != escrow.seller) {
        return Reject(ErrorCode::Unauthorized, "RaiseDispute", caller);
    }
    if (escrow.IsTerminal() || escrow.status == EscrowStatus::Disputed) {
        return WrongState("RaiseDispute", escrow);
    }

    escrow.status = EscrowStatus::Disputed;
    escrow.disputeReason = reason;

    LOG_INFO(util::LogCategory::ESCROW) << "escrow " << id << " disputed by " << caller
                                        << ": " << reason;
    return Status::Ok();
}

Status EnterpriseEscrow::ResolveDispute(const std::string& id, const AccountId& caller,
                                        DisputeResolution resolution, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (caller != admin_) {
        return Reject(ErrorCode::Unauthorized, "ResolveDispute", caller);
    }
    auto it = escrows_.find(id);
    if (it == escrows_.end()) {
        return Reject(ErrorCode::NotFound, "ResolveDispute", id);
    }
    Escrow& escrow = it->second;
    if (escrow.status != EscrowStatus::Disputed) {
        return WrongState("ResolveDispute", escrow);
    }

    Amount held = escrow.depositAmount;
    Amount sellerShare = 0;
    switch (resolution) {
        case DisputeResolution::RefundBuyer: sellerShare = 0; break;
        case DisputeResolution::PaySeller:   sellerShare = held; break;
        case DisputeResolution::Split:       sellerShare = held / 2; break;
        default:
            return Reject(ErrorCode::InvalidAmount, "ResolveDispute", "unknown resolution");
    }
    Amount buyerShare = held - sellerShare;

    if (held > 0) {
        Status s = ledger_.Distribute(holdingAccount_, {
            {escrow.seller, sellerShare},
            {escrow.buyer, buyerShare},
        });
        if (!s.ok()) {
            return Reject(s.code(), "ResolveDispute", s.message());
        }
    }

    escrow.resolution = resolution;
    CloseOutLocked(escrow, EscrowStatus::Completed, sellerShare, now);

    LOG_INFO(util::LogCategory::ESCROW) << "escrow " << id << " resolved ("
                                        << DisputeResolutionToString(resolution) << "): seller "
                                        << sellerShare << ", buyer " << buyerShare;
    return Status::Ok();
}

Status EnterpriseEscrow::CancelEscrow(const std::string& id, const AccountId& caller,
                                      Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = escrows_.find(id);
    if (it == escrows_.end()) {
        return Reject(ErrorCode::NotFound, "CancelEscrow", id);
    }
    Escrow& escrow = it->second;

    bool isParty = caller == escrow.buyer || caller == escrow.seller;
    bool mutual = isParty && escrow.buyerConfirmed && escrow.sellerConfirmed;
    if (caller != admin_ && !mutual) {
        return Reject(ErrorCode::Unauthorized, "CancelEscrow", caller);
    }
    if (escrow.IsTerminal()) {
        return WrongState("CancelEscrow", escrow);
    }

    if (escrow.depositAmount > 0) {
        Status s = ledger_.Transfer(holdingAccount_, escrow.buyer, escrow.depositAmount);
        if (!s.ok()) {
            return Reject(s.code(), "CancelEscrow", s.message());
        }
    }

    Amount refunded = escrow.depositAmount;
    CloseOutLocked(escrow, EscrowStatus::Cancelled, 0, now);

    LOG_INFO(util::LogCategory::ESCROW) << "escrow " << id << " cancelled, refunded " << refunded;
    return Status::Ok();
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Escrow> EnterpriseEscrow::GetEscrow(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = escrows_.find(id);
    if (it == escrows_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Escrow> EnterpriseEscrow::GetEscrowsForParty(const AccountId& party) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Escrow> out;
    for (const auto& [id, escrow] : escrows_) {
        if (escrow.buyer == party || escrow.seller == party) {
            out.push_back(escrow);
        }
    }
    return out;
}

size_t EnterpriseEscrow::GetEscrowCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return escrows_.size();
}

Amount EnterpriseEscrow::GetTotalEscrowed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalEscrowed_;
}

Amount EnterpriseEscrow::GetTotalCompleted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalCompleted_;
}

// ============================================================================
// Persistence
// ============================================================================

std::vector<Byte> EnterpriseEscrow::Serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);

    DataStream ss;
    ss << holdingAccount_ << totalEscrowed_ << totalCompleted_;
    WriteCompactSize(ss, escrows_.size());
    for (const auto& [id, e] : escrows_) {
        ss << e.id << e.buyer << e.seller << e.amount << e.depositAmount;
        ser_writedata8(ss, static_cast<uint8_t>(e.status));
        ss << e.buyerConfirmed << e.sellerConfirmed << e.termsHash
           << e.trackingRef << e.receiptRef
           << e.createdAt << e.deadline << e.completedAt;

        ss << e.disputeReason.has_value();
        if (e.disputeReason) {
            ss << *e.disputeReason;
        }
        ss << e.resolution.has_value();
        if (e.resolution) {
            ser_writedata8(ss, static_cast<uint8_t>(*e.resolution));
        }
    }
    return ss.Data();
}

bool EnterpriseEscrow::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return false;
    }

    AccountId holding;
    Amount escrowed = 0;
    Amount completed = 0;
    std::map<std::string, Escrow> escrows;

    try {
        DataStream ss(data, len);
        ss >> holding >> escrowed >> completed;

        uint64_t count = ReadCompactSize(ss);
        for (uint64_t i = 0; i < count; ++i) {
            Escrow e;
            ss >> e.id >> e.buyer >> e.seller >> e.amount >> e.depositAmount;
            uint8_t status = ser_readdata8(ss);
            if (status > static_cast<uint8_t>(EscrowStatus::Cancelled)) {
                return false;
            }
            e.status = static_cast<EscrowStatus>(status);
            ss >> e.buyerConfirmed >> e.sellerConfirmed >> e.termsHash
               >> e.trackingRef >> e.receiptRef
               >> e.createdAt >> e.deadline >> e.completedAt;

            bool hasReason = false;
            ss >> hasReason;
            if (hasReason) {
                std::string reason;
                ss >> reason;
                e.disputeReason = std::move(reason);
            }
            bool hasResolution = false;
            ss >> hasResolution;
            if (hasResolution) {
                uint8_t r = ser_readdata8(ss);
                if (r > static_cast<uint8_t>(DisputeResolution::Split)) {
                    return false;
                }
                e.resolution = static_cast<DisputeResolution>(r);
            }
            escrows[e.id] = std::move(e);
        }
        if (!ss.empty()) {
            return false;
        }
    } catch (const std::exception& e) {
        LOG_WARN(util::LogCategory::ESCROW) << "escrow snapshot rejected: " << e.what();
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    holdingAccount_ = std::move(holding);
    totalEscrowed_ = escrowed;
    totalCompleted_ = completed;
    escrows_ = std::move(escrows);
    return true;
}

} // namespace economics
} // namespace pamtalk
