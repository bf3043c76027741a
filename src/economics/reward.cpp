// PAMTALK - Carbon Reward Accrual Implementation
// Copyright (c) 2024 PAMTALK Developers
// MIT License

#include "pamtalk/economics/reward.h"
#include "pamtalk/core/serialize.h"
#include "pamtalk/util/logging.h"

namespace pamtalk {
namespace economics {

namespace {

Status Reject(ErrorCode code, const std::string& op, const std::string& msg) {
    LOG_DEBUG(util::LogCategory::REWARD) << op << " rejected: "
                                         << ErrorCodeToString(code) << " (" << msg << ")";
    return Status::Error(code, msg);
}

} // namespace

RewardAccrual::RewardAccrual(Ledger& ledger, AccountId admin, Amount rewardRate)
    : ledger_(ledger), admin_(std::move(admin)), rewardRate_(rewardRate) {}

Result<Amount> RewardAccrual::RegisterActivity(const AccountId& account, int64_t carbonKg,
                                               const std::string& activityRef,
                                               Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (carbonKg <= 0) {
        return Reject(ErrorCode::InvalidAmount, "RegisterActivity",
                      "carbon reduction must be positive");
    }
    if (!ledger_.IsOptedIn(account)) {
        return Reject(ErrorCode::NotFound, "RegisterActivity", account);
    }

    Amount kg = static_cast<Amount>(carbonKg);
    if (MulWouldOverflow(kg, rewardRate_)) {
        return Reject(ErrorCode::InvalidAmount, "RegisterActivity", "reward overflow");
    }
    Amount reward = kg * rewardRate_;

    const RewardProfile* existing = nullptr;
    auto it = profiles_.find(account);
    if (it != profiles_.end()) {
        existing = &it->second;
    }
    Amount pending = existing ? existing->pendingRewards : 0;
    uint64_t carbon = existing ? existing->totalCarbonReductionKg : 0;
    if (AddWouldOverflow(pending, reward) || AddWouldOverflow(carbon, kg) ||
        AddWouldOverflow(totalCarbonReductionKg_, kg)) {
        return Reject(ErrorCode::InvalidAmount, "RegisterActivity", "accumulator overflow");
    }

    RewardProfile& profile = profiles_[account];
    profile.account = account;
    profile.pendingRewards += reward;
    profile.totalCarbonReductionKg += kg;
    profile.activityCount += 1;
    profile.lastActivity = activityRef;
    profile.lastActivityAt = now;
    totalCarbonReductionKg_ += kg;

    LOG_INFO(util::LogCategory::REWARD) << account << " +" << reward << " pending for "
                                        << carbonKg << " kg (" << activityRef << ")";
    return reward;
}

Result<Amount> RewardAccrual::Claim(const AccountId& account) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = profiles_.find(account);
    if (it == profiles_.end() || it->second.pendingRewards == 0) {
        return Amount{0};
    }
    RewardProfile& profile = it->second;
    Amount amount = profile.pendingRewards;

    if (AddWouldOverflow(profile.claimedRewards, amount) ||
        AddWouldOverflow(totalDistributed_, amount)) {
        return Reject(ErrorCode::InvalidAmount, "Claim", "claimed total overflow");
    }

    Status s = ledger_.MintTrusted(REWARD_MINTER_ID, account, amount);
    if (!s.ok()) {
        return Reject(s.code(), "Claim", s.message());
    }

    profile.claimedRewards += amount;
    profile.pendingRewards = 0;
    totalDistributed_ += amount;

    LOG_INFO(util::LogCategory::REWARD) << account << " claimed " << amount;
    return amount;
}

Status RewardAccrual::SetRewardRate(const AccountId& caller, Amount rate) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (caller != admin_) {
        return Reject(ErrorCode::Unauthorized, "SetRewardRate", caller);
    }
    if (rate == 0) {
        return Reject(ErrorCode::InvalidAmount, "SetRewardRate", "rate must be positive");
    }
    rewardRate_ = rate;

    LOG_INFO(util::LogCategory::REWARD) << "reward rate set to " << rate;
    return Status::Ok();
}

// ============================================================================
// Queries
// ============================================================================

std::optional<RewardProfile> RewardAccrual::GetProfile(const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(account);
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Amount RewardAccrual::GetPendingRewards(const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(account);
    return it == profiles_.end() ? 0 : it->second.pendingRewards;
}

Amount RewardAccrual::GetClaimedRewards(const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(account);
    return it == profiles_.end() ? 0 : it->second.claimedRewards;
}

Amount RewardAccrual::GetRewardRate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rewardRate_;
}

Amount RewardAccrual::GetTotalDistributed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalDistributed_;
}

uint64_t RewardAccrual::GetTotalCarbonReductionKg() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalCarbonReductionKg_;
}

// ============================================================================
// Persistence
// ============================================================================

std::vector<Byte> RewardAccrual::Serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);

    DataStream ss;
    ss << rewardRate_ << totalDistributed_ << totalCarbonReductionKg_;
    WriteCompactSize(ss, profiles_.size());
    for (const auto& [id, p] : profiles_) {
        ss << p.account << p.pendingRewards << p.claimedRewards
           << p.totalCarbonReductionKg << p.activityCount
           << p.lastActivity << p.lastActivityAt;
    }
    return ss.Data();
}

bool RewardAccrual::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return false;
    }

    Amount rate = 0;
    Amount distributed = 0;
    uint64_t carbon = 0;
    std::map<AccountId, RewardProfile> profiles;

    try {
        DataStream ss(data, len);
        ss >> rate >> distributed >> carbon;
        uint64_t count = ReadCompactSize(ss);
        for (uint64_t i = 0; i < count; ++i) {
            RewardProfile p;
            ss >> p.account >> p.pendingRewards >> p.claimedRewards
               >> p.totalCarbonReductionKg >> p.activityCount
               >> p.lastActivity >> p.lastActivityAt;
            profiles[p.account] = std::move(p);
        }
        if (!ss.empty() || rate == 0) {
            return false;
        }
    } catch (const std::exception& e) {
        LOG_WARN(util::LogCategory::REWARD) << "reward snapshot rejected: " << e.what();
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    rewardRate_ = rate;
    totalDistributed_ = distributed;
    totalCarbonReductionKg_ = carbon;
    profiles_ = std::move(profiles);
    return true;
}

} // namespace economics
} // namespace pamtalk
