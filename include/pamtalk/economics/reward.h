// PAMTALK - Carbon Reward Accrual
// Copyright (c) 2024 PAMTALK Developers
// MIT License
//
// Converts verified carbon-reduction activity into pending rewards and
// mints them into the participant's ledger balance on claim.

#ifndef PAMTALK_ECONOMICS_REWARD_H
#define PAMTALK_ECONOMICS_REWARD_H

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

/// Reward units credited per kilogram of verified reduction
constexpr Amount DEFAULT_REWARD_RATE = 1000;

/// Identity under which reward claims mint through the ledger
constexpr const char* REWARD_MINTER_ID = "reward_accrual";

/**
 * Per-account reward bookkeeping.
 *
 * pendingRewards only grows through RegisterActivity and only drops (to
 * zero) through Claim, which moves the same amount into claimedRewards.
 */
struct RewardProfile {
    AccountId account;
    Amount pendingRewards{0};
    Amount claimedRewards{0};
    uint64_t totalCarbonReductionKg{0};
    uint64_t activityCount{0};

    /// Reference (hash or label) of the most recent verified activity
    std::string lastActivity;
    Timestamp lastActivityAt{0};
};

class RewardAccrual {
public:
    RewardAccrual(Ledger& ledger, AccountId admin,
                  Amount rewardRate = DEFAULT_REWARD_RATE);

    RewardAccrual(const RewardAccrual&) = delete;
    RewardAccrual& operator=(const RewardAccrual&) = delete;

    /// Credit carbonKg * rewardRate to the account's pending rewards.
    /// Returns the reward credited.
    Result<Amount> RegisterActivity(const AccountId& account, int64_t carbonKg,
                                    const std::string& activityRef, Timestamp now);

    /// Mint all pending rewards. Returns the amount minted (0 when nothing
    /// is pending, which is not an error).
    Result<Amount> Claim(const AccountId& account);

    /// Admin-only
    Status SetRewardRate(const AccountId& caller, Amount rate);

    // ========================================================================
    // Queries
    // ========================================================================

    std::optional<RewardProfile> GetProfile(const AccountId& account) const;
    Amount GetPendingRewards(const AccountId& account) const;
    Amount GetClaimedRewards(const AccountId& account) const;

    Amount GetRewardRate() const;
    Amount GetTotalDistributed() const;
    uint64_t GetTotalCarbonReductionKg() const;

    std::vector<Byte> Serialize() const;
    bool Deserialize(const Byte* data, size_t len);

private:
    Ledger& ledger_;
    AccountId admin_;
    Amount rewardRate_;

    std::map<AccountId, RewardProfile> profiles_;
    Amount totalDistributed_{0};
    uint64_t totalCarbonReductionKg_{0};

    mutable std::mutex mutex_;
};

} // namespace economics
} // namespace pamtalk

#endif // PAMTALK_ECONOMICS_REWARD_H
