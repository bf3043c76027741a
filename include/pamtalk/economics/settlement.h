// PAMTALK - Charging Station Settlement
// Copyright (c) 2024 PAMTALK Developers
// MIT License
//
// Tracks revenue collected by registered service points, withholds the
// platform fee, and pays the net proceeds to the station operator through
// a request / approve / withdraw cycle.
//
// Settlement lifecycle (strictly forward):
//   Pending -> Approved -> Completed

#ifndef PAMTALK_ECONOMICS_SETTLEMENT_H
#define PAMTALK_ECONOMICS_SETTLEMENT_H

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

/// Platform fee (5%)
constexpr uint32_t DEFAULT_FEE_RATE_BPS = 500;

/// Identity under which settlement payouts mint through the ledger
constexpr const char* SETTLEMENT_MINTER_ID = "station_settlement";

enum class StationStatus : uint8_t {
    Active = 0,
    Inactive = 1,
};

enum class SettlementStatus : uint8_t {
    Pending = 0,
    Approved = 1,
    Completed = 2,
};

const char* StationStatusToString(StationStatus status);
const char* SettlementStatusToString(SettlementStatus status);

struct Station {
    std::string id;
    AccountId operatorId;
    StationStatus status{StationStatus::Active};

    /// Gross revenue recorded
    Amount volume{0};
    /// Platform fees withheld
    Amount feesPaid{0};
    /// Net owed to the operator, not yet paid out
    Amount pending{0};
    /// Net paid out
    Amount settled{0};

    uint64_t transactionCount{0};
    std::string lastTransactionRef;
    Timestamp registeredAt{0};

    /// Settlement currently pending or approved, if any
    std::string openSettlement;
};

struct Settlement {
    std::string id;
    std::string stationId;
    std::string period;

    /// Station pending at request time
    Amount amount{0};
    /// Fee implied by amount at the rate in force when requested
    Amount platformFee{0};

    SettlementStatus status{SettlementStatus::Pending};
    Timestamp requestedAt{0};
    Timestamp approvedAt{0};
    Timestamp completedAt{0};
};

/// Outcome of one recorded transaction, for reconciliation
struct FeeBreakdown {
    Amount gross{0};
    Amount fee{0};
    Amount net{0};
};

/// fee = floor(gross * bps / 10000), net = gross - fee
FeeBreakdown ComputeFee(Amount gross, uint32_t feeRateBps);

/// Fee that was withheld to leave netAmount: floor(net * bps / (10000 - bps))
Amount ComputeImpliedFee(Amount netAmount, uint32_t feeRateBps);

class StationSettlement {
public:
    StationSettlement(Ledger& ledger, AccountId admin,
                      uint32_t feeRateBps = DEFAULT_FEE_RATE_BPS);

    StationSettlement(const StationSettlement&) = delete;
    StationSettlement& operator=(const StationSettlement&) = delete;

    // ========================================================================
    // Stations
    // ========================================================================

    /// Admin-only
    Status RegisterStation(const AccountId& caller, const std::string& stationId,
                           const AccountId& operatorId, Timestamp now);

    Status DeactivateStation(const AccountId& caller, const std::string& stationId);
    Status ReactivateStation(const AccountId& caller, const std::string& stationId);

    /// Record gross revenue on an active station
    Result<FeeBreakdown> RecordTransaction(const std::string& stationId,
                                           Amount grossAmount,
                                           const std::string& txRef = "");

    // ========================================================================
    // Settlements
    // ========================================================================

    /// Operator-only. Snapshots the station's pending amount.
    Status RequestSettlement(const AccountId& caller, const std::string& stationId,
                             const std::string& settlementId, const std::string& period,
                             Timestamp now);

    /// Admin-only. Pending -> Approved.
    Status ApproveSettlement(const AccountId& caller, const std::string& settlementId,
                             Timestamp now);

    /// Operator-only. Approved -> Completed; pays the amount to the operator.
    Status Withdraw(const AccountId& caller, const std::string& settlementId,
                    Timestamp now);

    /// Admin-only. Rates above 10000 bps are rejected.
    Status SetFeeRateBps(const AccountId& caller, uint32_t bps);

    // ========================================================================
    // Queries
    // ========================================================================

    std::optional<Station> GetStation(const std::string& stationId) const;
    std::optional<Settlement> GetSettlement(const std::string& settlementId) const;
    std::vector<Settlement> GetSettlementsForStation(const std::string& stationId) const;

    uint32_t GetFeeRateBps() const;
    Amount GetTotalVolume() const;
    Amount GetTotalFeesCollected() const;
    size_t GetStationCount() const;

    std::vector<Byte> Serialize() const;
    bool Deserialize(const Byte* data, size_t len);

private:
    Ledger& ledger_;
    AccountId admin_;
    uint32_t feeRateBps_;

    std::map<std::string, Station> stations_;
    std::map<std::string, Settlement> settlements_;
    Amount totalVolume_{0};
    Amount totalFeesCollected_{0};

    mutable std::mutex mutex_;

    Status SetStationStatus(const AccountId& caller, const std::string& stationId,
                            StationStatus status, const char* op);
};

} // namespace economics
} // namespace pamtalk

#endif // PAMTALK_ECONOMICS_SETTLEMENT_H
