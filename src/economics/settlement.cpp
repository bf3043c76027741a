// PAMTALK - Charging Station Settlement Implementation
// Copyright (c) 2024 PAMTALK Developers
// MIT License

#include "pamtalk/economics/settlement.h"
#include "pamtalk/core/serialize.h"
#include "pamtalk/util/logging.h"

#include <algorithm>

namespace pamtalk {
namespace economics {

const char* StationStatusToString(StationStatus status) {
    switch (status) {
        case StationStatus::Active:   return "Active";
        case StationStatus::Inactive: return "Inactive";
        default:                      return "Unknown";
    }
}

const char* SettlementStatusToString(SettlementStatus status) {
    switch (status) {
        case SettlementStatus::Pending:   return "Pending";
        case SettlementStatus::Approved:  return "Approved";
        case SettlementStatus::Completed: return "Completed";
        default:                          return "Unknown";
    }
}

// ============================================================================
// Fee Arithmetic
// ============================================================================

// Quotient and remainder are scaled separately so the product never
// leaves the 64-bit range.

FeeBreakdown ComputeFee(Amount gross, uint32_t feeRateBps) {
    Amount bps = std::min<Amount>(feeRateBps, BPS_DENOMINATOR);

    FeeBreakdown out;
    out.gross = gross;
    out.fee = (gross / BPS_DENOMINATOR) * bps + (gross % BPS_DENOMINATOR) * bps / BPS_DENOMINATOR;
    out.net = gross - out.fee;
    return out;
}

Amount ComputeImpliedFee(Amount netAmount, uint32_t feeRateBps) {
    if (feeRateBps >= BPS_DENOMINATOR) {
        return 0;
    }
    Amount divisor = BPS_DENOMINATOR - feeRateBps;
    Amount q = netAmount / divisor;
    Amount r = netAmount % divisor;
    if (MulWouldOverflow(q, feeRateBps)) {
        return MAX_AMOUNT;
    }
    Amount whole = q * feeRateBps;
    Amount part = r * feeRateBps / divisor;
    return AddWouldOverflow(whole, part) ? MAX_AMOUNT : whole + part;
}

namespace {

Status Reject(ErrorCode code, const std::string& op, const std::string& msg) {
    LOG_DEBUG(util::LogCategory::SETTLEMENT) << op << " rejected: "
                                             << ErrorCodeToString(code) << " (" << msg << ")";
    return Status::Error(code, msg);
}

} // namespace

StationSettlement::StationSettlement(Ledger& ledger, AccountId admin, uint32_t feeRateBps)
    : ledger_(ledger), admin_(std::move(admin)), feeRateBps_(feeRateBps) {}

// ============================================================================
// Stations
// ============================================================================

Status StationSettlement::RegisterStation(const AccountId& caller, const std::string& stationId,
                                          const AccountId& operatorId, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (caller != admin_) {
        return Reject(ErrorCode::Unauthorized, "RegisterStation", caller);
    }
    if (stationId.empty() || operatorId.empty()) {
        return Reject(ErrorCode::InvalidAmount, "RegisterStation", "empty station or operator id");
    }
    if (stations_.count(stationId)) {
        return Reject(ErrorCode::AlreadyExists, "RegisterStation", stationId);
    }

    Station station;
    station.id = stationId;
    station.operatorId = operatorId;
    station.registeredAt = now;
    stations_.emplace(stationId, std::move(station));

    LOG_INFO(util::LogCategory::SETTLEMENT) << "station " << stationId
                                            << " registered for " << operatorId;
    return Status::Ok();
}

Status StationSettlement::SetStationStatus(const AccountId& caller, const std::string& stationId,
                                           StationStatus status, const char* op) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (caller != admin_) {
        return Reject(ErrorCode::Unauthorized, op, caller);
    }
    auto it = stations_.find(stationId);
    if (it == stations_.end()) {
        return Reject(ErrorCode::NotFound, op, stationId);
    }
    it->second.status = status;

    LOG_INFO(util::LogCategory::SETTLEMENT) << "station " << stationId << " now "
                                            << StationStatusToString(status);
    return Status::Ok();
}

Status StationSettlement::DeactivateStation(const AccountId& caller, const std::string& stationId) {
    return SetStationStatus(caller, stationId, StationStatus::Inactive, "DeactivateStation");
}

Status StationSettlement::ReactivateStation(const AccountId& caller, const std::string& stationId) {
    return SetStationStatus(caller, stationId, StationStatus::Active, "ReactivateStation");
}

Result<FeeBreakdown> StationSettlement::RecordTransaction(const std::string& stationId,
                                                          Amount grossAmount,
                                                          const std::string& txRef) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = stations_.find(stationId);
    if (it == stations_.end()) {
        return Reject(ErrorCode::NotFound, "RecordTransaction", stationId);
    }
    Station& station = it->second;
    if (station.status != StationStatus::Active) {
        return Reject(ErrorCode::StationInactive, "RecordTransaction", stationId);
    }
    if (grossAmount == 0) {
        return Reject(ErrorCode::InvalidAmount, "RecordTransaction", "zero amount");
    }

    FeeBreakdown fb = ComputeFee(grossAmount, feeRateBps_);
    if (AddWouldOverflow(station.volume, fb.gross) ||
        AddWouldOverflow(station.feesPaid, fb.fee) ||
        AddWouldOverflow(station.pending, fb.net) ||
        AddWouldOverflow(totalVolume_, fb.gross) ||
        AddWouldOverflow(totalFeesCollected_, fb.fee)) {
        return Reject(ErrorCode::InvalidAmount, "RecordTransaction", "running total overflow");
    }

    station.volume += fb.gross;
    station.feesPaid += fb.fee;
    station.pending += fb.net;
    station.transactionCount += 1;
    station.lastTransactionRef = txRef;
    totalVolume_ += fb.gross;
    totalFeesCollected_ += fb.fee;

    LOG_INFO(util::LogCategory::SETTLEMENT) << "station " << stationId << " gross " << fb.gross
                                            << " fee " << fb.fee << " net " << fb.net;
    return fb;
}

// ============================================================================
// Settlements
// ============================================================================

Status StationSettlement::RequestSettlement(const AccountId& caller, const std::string& stationId,
                                            const std::string& settlementId,
                                            const std::string& period, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = stations_.find(stationId);
    if (it == stations_.end()) {
        return Reject(ErrorCode::NotFound, "RequestSettlement", stationId);
    }
    Station& station = it->second;
    if (caller != station.operatorId) {
        return Reject(ErrorCode::Unauthorized, "RequestSettlement", caller);
    }
    if (settlementId.empty()) {
        return Reject(ErrorCode::InvalidAmount, "RequestSettlement", "empty settlement id");
    }
    if (settlements_.count(settlementId)) {
        return Reject(ErrorCode::AlreadyExists, "RequestSettlement", settlementId);
    }
    if (!station.openSettlement.empty()) {
        return Reject(ErrorCode::InvalidState, "RequestSettlement",
                      "settlement " + station.openSettlement + " still open");
    }
    if (station.pending == 0) {
        return Reject(ErrorCode::NothingPending, "RequestSettlement", stationId);
    }

    Settlement settlement;
    settlement.id = settlementId;
    settlement.stationId = stationId;
    settlement.period = period;
    settlement.amount = station.pending;
    settlement.platformFee = ComputeImpliedFee(station.pending, feeRateBps_);
    settlement.status = SettlementStatus::Pending;
    settlement.requestedAt = now;

    station.openSettlement = settlementId;
    settlements_.emplace(settlementId, settlement);

    LOG_INFO(util::LogCategory::SETTLEMENT) << "settlement " << settlementId << " requested for "
                                            << stationId << " amount " << settlement.amount
                                            << " period " << period;
    return Status::Ok();
}

Status StationSettlement::ApproveSettlement(const AccountId& caller, const std::string& settlementId,
                                            Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (caller != admin_) {
        return Reject(ErrorCode::Unauthorized, "ApproveSettlement", caller);
    }
    auto it = settlements_.find(settlementId);
    if (it == settlements_.end()) {
        return Reject(ErrorCode::NotFound, "ApproveSettlement", settlementId);
    }
    if (it->second.status != SettlementStatus::Pending) {
        return Reject(ErrorCode::InvalidState, "ApproveSettlement",
                      std::string("settlement is ") + SettlementStatusToString(it->second.status));
    }

    it->second.status = SettlementStatus::Approved;
    it->second.approvedAt = now;

    LOG_INFO(util::LogCategory::SETTLEMENT) << "settlement " << settlementId << " approved";
    return Status::Ok();
}

Status StationSettlement::Withdraw(const AccountId& caller, const std::string& settlementId,
                                   Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = settlements_.find(settlementId);
    if (it == settlements_.end()) {
        return Reject(ErrorCode::NotFound, "Withdraw", settlementId);
    }
    Settlement& settlement = it->second;

    auto st = stations_.find(settlement.stationId);
    if (st == stations_.end()) {
        return Reject(ErrorCode::NotFound, "Withdraw", settlement.stationId);
    }
    Station& station = st->second;

    if (caller != station.operatorId) {
        return Reject(ErrorCode::Unauthorized, "Withdraw", caller);
    }
    if (settlement.status != SettlementStatus::Approved) {
        return Reject(ErrorCode::InvalidState, "Withdraw",
                      std::string("settlement is ") + SettlementStatusToString(settlement.status));
    }
    if (station.pending < settlement.amount ||
        AddWouldOverflow(station.settled, settlement.amount)) {
        return Reject(ErrorCode::InvalidState, "Withdraw", "station totals inconsistent");
    }

    Status s = ledger_.MintTrusted(SETTLEMENT_MINTER_ID, station.operatorId, settlement.amount);
    if (!s.ok()) {
        return Reject(s.code(), "Withdraw", s.message());
    }

    station.pending -= settlement.amount;
    station.settled += settlement.amount;
    station.openSettlement.clear();
    settlement.status = SettlementStatus::Completed;
    settlement.completedAt = now;

    LOG_INFO(util::LogCategory::SETTLEMENT) << "settlement " << settlementId << " paid "
                                            << settlement.amount << " to " << station.operatorId;
    return Status::Ok();
}

Status StationSettlement::SetFeeRateBps(const AccountId& caller, uint32_t bps) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (caller != admin_) {
        return Reject(ErrorCode::Unauthorized, "SetFeeRateBps", caller);
    }
    if (bps > BPS_DENOMINATOR) {
        return Reject(ErrorCode::InvalidAmount, "SetFeeRateBps", "rate above 10000 bps");
    }
    feeRateBps_ = bps;

    LOG_INFO(util::LogCategory::SETTLEMENT) << "platform fee set to " << bps << " bps";
    return Status::Ok();
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Station> StationSettlement::GetStation(const std::string& stationId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stations_.find(stationId);
    if (it == stations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Settlement> StationSettlement::GetSettlement(const std::string& settlementId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = settlements_.find(settlementId);
    if (it == settlements_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Settlement> StationSettlement::GetSettlementsForStation(
    const std::string& stationId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Settlement> out;
    for (const auto& [id, settlement] : settlements_) {
        if (settlement.stationId == stationId) {
            out.push_back(settlement);
        }
    }
    return out;
}

uint32_t StationSettlement::GetFeeRateBps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return feeRateBps_;
}

Amount StationSettlement::GetTotalVolume() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalVolume_;
}

Amount StationSettlement::GetTotalFeesCollected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalFeesCollected_;
}

size_t StationSettlement::GetStationCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stations_.size();
}

// ============================================================================
// Persistence
// ============================================================================

std::vector<Byte> StationSettlement::Serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);

    DataStream ss;
    ss << feeRateBps_ << totalVolume_ << totalFeesCollected_;

    WriteCompactSize(ss, stations_.size());
    for (const auto& [id, st] : stations_) {
        ss << st.id << st.operatorId;
        ser_writedata8(ss, static_cast<uint8_t>(st.status));
        ss << st.volume << st.feesPaid << st.pending << st.settled
           << st.transactionCount << st.lastTransactionRef << st.registeredAt
           << st.openSettlement;
    }

    WriteCompactSize(ss, settlements_.size());
    for (const auto& [id, se] : settlements_) {
        ss << se.id << se.stationId << se.period << se.amount << se.platformFee;
        ser_writedata8(ss, static_cast<uint8_t>(se.status));
        ss << se.requestedAt << se.approvedAt << se.completedAt;
    }
    return ss.Data();
}

bool StationSettlement::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return false;
    }

    uint32_t bps = 0;
    Amount volume = 0;
    Amount fees = 0;
    std::map<std::string, Station> stations;
    std::map<std::string, Settlement> settlements;

    try {
        DataStream ss(data, len);
        ss >> bps >> volume >> fees;

        uint64_t count = ReadCompactSize(ss);
        for (uint64_t i = 0; i < count; ++i) {
            Station st;
            ss >> st.id >> st.operatorId;
            uint8_t status = ser_readdata8(ss);
            if (status > static_cast<uint8_t>(StationStatus::Inactive)) {
                return false;
            }
            st.status = static_cast<StationStatus>(status);
            ss >> st.volume >> st.feesPaid >> st.pending >> st.settled
               >> st.transactionCount >> st.lastTransactionRef >> st.registeredAt
               >> st.openSettlement;
            stations[st.id] = std::move(st);
        }

        count = ReadCompactSize(ss);
        for (uint64_t i = 0; i < count; ++i) {
            Settlement se;
            ss >> se.id >> se.stationId >> se.period >> se.amount >> se.platformFee;
            uint8_t status = ser_readdata8(ss);
            if (status > static_cast<uint8_t>(SettlementStatus::Completed)) {
                return false;
            }
            se.status = static_cast<SettlementStatus>(status);
            ss >> se.requestedAt >> se.approvedAt >> se.completedAt;
            settlements[se.id] = std::move(se);
        }

        if (!ss.empty() || bps > BPS_DENOMINATOR) {
            return false;
        }
    } catch (const std::exception& e) {
        LOG_WARN(util::LogCategory::SETTLEMENT) << "settlement snapshot rejected: " << e.what();
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    feeRateBps_ = bps;
    totalVolume_ = volume;
    totalFeesCollected_ = fees;
    stations_ = std::move(stations);
    settlements_ = std::move(settlements);
    return true;
}

} // namespace economics
} // namespace pamtalk
