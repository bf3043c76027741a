// PAMTALK - Engine Context
// Copyright (c) 2024 PAMTALK Developers
// MIT License
//
// This file defines the EngineContext structure that owns the ledger and
// every component built on it, wired together and ready to serve calls.

#ifndef PAMTALK_NODE_CONTEXT_H
#define PAMTALK_NODE_CONTEXT_H

#include "pamtalk/core/status.h"
#include "pamtalk/core/types.h"
#include "pamtalk/economics/escrow.h"
#include "pamtalk/economics/reward.h"
#include "pamtalk/economics/settlement.h"
#include "pamtalk/governance/governance.h"
#include "pamtalk/ledger/ledger.h"
#include "pamtalk/util/config.h"
#include "pamtalk/util/logging.h"

#include <memory>
#include <string>
#include <vector>

namespace pamtalk {

// ============================================================================
// Engine Initialization Options
// ============================================================================

/**
 * Options for engine initialization.
 * Populated from the configuration file by LoadEngineOptions().
 */
struct EngineInitOptions {
    /// Administrator identity for every component
    AccountId admin;

    /// Shared secret sealing governance authorization tokens
    std::vector<Byte> committeeKey;

    /// Ledger account holding escrow deposits
    AccountId escrowHolding{economics::DEFAULT_ESCROW_HOLDING};

    uint32_t requiredApprovals{governance::DEFAULT_REQUIRED_APPROVALS};
    Timestamp proposalLifetime{governance::DEFAULT_PROPOSAL_LIFETIME};
    Amount rewardRate{economics::DEFAULT_REWARD_RATE};
    uint32_t feeRateBps{economics::DEFAULT_FEE_RATE_BPS};

    util::LogLevel logLevel{util::LogLevel::Info};
};

// ============================================================================
// Engine Context
// ============================================================================

/**
 * EngineContext owns one instance of each exchange component:
 * - Ledger (balances and supply)
 * - Governance (committee approvals)
 * - RewardAccrual, StationSettlement and EnterpriseEscrow, all of which
 *   hold a reference to the ledger and must not outlive it
 */
struct EngineContext {
    std::unique_ptr<Ledger> ledger;
    std::unique_ptr<governance::Governance> governance;
    std::unique_ptr<economics::RewardAccrual> rewards;
    std::unique_ptr<economics::StationSettlement> settlement;
    std::unique_ptr<economics::EnterpriseEscrow> escrow;

    /// Options the context was built from
    EngineInitOptions options;

    bool initialized{false};

    EngineContext() = default;
    ~EngineContext();

    EngineContext(const EngineContext&) = delete;
    EngineContext& operator=(const EngineContext&) = delete;

    bool IsReady() const { return initialized && ledger != nullptr; }
};

// ============================================================================
// Engine Lifecycle
// ============================================================================

/**
 * Read engine options from configuration.
 *
 * Requires `admin`. `committee_key` must be valid hex when present.
 * Section keys fall back to the defaults in EngineInitOptions.
 */
util::ConfigParseResult LoadEngineOptions(const util::ConfigManager& config,
                                          EngineInitOptions& options);

/**
 * Build every component and wire them together:
 * 1. Creates the ledger and installs the committee key
 * 2. Registers reward accrual and settlement as trusted minters
 * 3. Opts in the escrow holding account
 * 4. Creates governance, reward, settlement and escrow components
 */
Status InitializeEngine(EngineContext& ctx, const EngineInitOptions& options);

/// Release all components (dependents before the ledger)
void ShutdownEngine(EngineContext& ctx);

/**
 * Apply an executed proposal's authorization token to the ledger.
 * Outcomes without a token (threshold changes, signals) succeed trivially.
 */
Status ApplyGovernanceOutcome(EngineContext& ctx,
                              const governance::ExecutionOutcome& outcome);

// ============================================================================
// Snapshots
// ============================================================================

/// Serialize every component into one blob
std::vector<Byte> SaveSnapshot(const EngineContext& ctx);

/// Replace all component state from a blob. On failure ctx is untouched.
Status LoadSnapshot(EngineContext& ctx, const std::vector<Byte>& snapshot);

} // namespace pamtalk

#endif // PAMTALK_NODE_CONTEXT_H
