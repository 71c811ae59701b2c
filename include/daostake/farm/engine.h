// DAOSTAKE - Staking Engine
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License
//
// Multi-pool reward engine. Every mutating entry point:
//   - rejects nested entry from inside a token call
//   - snapshots the engine state and restores it if anything throws
//   - settles the pool before touching any stake or pending reward
//   - publishes its events only after it has fully succeeded

#ifndef DAOSTAKE_FARM_ENGINE_H
#define DAOSTAKE_FARM_ENGINE_H

#include "daostake/core/types.h"
#include "daostake/farm/emission.h"
#include "daostake/farm/ledger.h"
#include "daostake/farm/pool.h"
#include "daostake/farm/token.h"

#include <functional>
#include <string>
#include <vector>

namespace daostake {
namespace farm {

// ============================================================================
// Events
// ============================================================================

enum class FarmEventType {
    Deposit,
    Withdraw,
    EmergencyWithdraw,
    Settle,
    Claim,
    PoolAdded,
    PoolWeightChanged,
    WalletsChanged,
    RewardTokenChanged,
    AdminChanged,
};

const char* FarmEventTypeToString(FarmEventType type);

struct FarmEvent {
    FarmEventType type{FarmEventType::Deposit};
    PoolId poolId{0};
    Address account;
    Amount amount{0};
    BlockNumber block{0};

    std::string ToString() const;
};

// ============================================================================
// Engine State
// ============================================================================

/// Everything the engine persists. Copyable so it can be snapshotted.
struct FarmState {
    std::vector<PoolInfo> pools;   // Pool id == index, append-only
    UserLedger ledger;
    Amount totalWeight{0};
    Address treasury;
    Address community;
    Address rewardToken;
    Address admin;

    /// Sum of pool weights
    Amount SumWeights() const;

    bool operator==(const FarmState& other) const {
        return pools == other.pools && ledger == other.ledger &&
               totalWeight == other.totalWeight && treasury == other.treasury &&
               community == other.community && rewardToken == other.rewardToken &&
               admin == other.admin;
    }
};

// ============================================================================
// Farm Engine
// ============================================================================

class FarmEngine {
public:
    using EventCallback = std::function<void(const FarmEvent&)>;
    using SettlementCallback = std::function<void(const SettlementRecord&)>;

    /**
     * @param chain Host chain; must outlive the engine
     * @param self The engine's own address (custody of LP and reward tokens)
     * @param admin Holder of the admin capability
     * @param params Emission schedule parameters
     * @param treasury Externally owned treasury wallet
     * @param community Externally owned community wallet
     * @param rewardToken Mintable reward token contract
     */
    FarmEngine(IChainContext& chain,
               const Address& self,
               const Address& admin,
               const EmissionParams& params,
               const Address& treasury,
               const Address& community,
               const Address& rewardToken);

    FarmEngine(const FarmEngine&) = delete;
    FarmEngine& operator=(const FarmEngine&) = delete;

    // ========================================================================
    // Admin Operations
    // ========================================================================

    void SetWallets(const Address& caller, const Address& treasury, const Address& community);

    void SetRewardToken(const Address& caller, const Address& token);

    /// Append a pool. Rejects non-contract and duplicate tokens and pools
    /// added at or after the end of emission.
    PoolId AddPool(const Address& caller, const Amount& weight,
                   const Address& lpToken, bool withUpdate);

    void SetPoolWeight(const Address& caller, PoolId pid, const Amount& weight,
                       bool withUpdate);

    /// Irrevocably hand the reward token's ownership to `newOwner`
    void TransferRewardTokenOwnership(const Address& caller, const Address& newOwner);

    void TransferAdmin(const Address& caller, const Address& newAdmin);

    // ========================================================================
    // Settlement
    // ========================================================================

    /// Settle one pool to the current block
    void UpdatePool(PoolId pid);

    /// Settle every pool in ascending id order. Cost grows with pool count.
    void MassUpdatePools();

    // ========================================================================
    // Staking
    // ========================================================================

    /// Stake `amount` (0 claims only). The engine must hold an allowance.
    void Deposit(const Address& caller, PoolId pid, const Amount& amount);

    /// Unstake `amount` and claim the pending reward
    void Withdraw(const Address& caller, PoolId pid, const Amount& amount);

    /// Return the whole stake and forfeit any pending reward
    void EmergencyWithdraw(const Address& caller, PoolId pid);

    // ========================================================================
    // Queries
    // ========================================================================

    /// Reward `user` would receive if the pool were settled now
    Amount PendingReward(PoolId pid, const Address& user) const;

    size_t PoolLength() const { return state_.pools.size(); }

    const PoolInfo& GetPool(PoolId pid) const;

    UserPosition GetPosition(PoolId pid, const Address& user) const;

    const Amount& TotalWeight() const { return state_.totalWeight; }

    /// LP tokens held by the engine for a pool
    Amount LpSupply(PoolId pid) const;

    /// Reward tokens held by the engine
    Amount RewardBalance() const;

    const EmissionSchedule& Schedule() const { return schedule_; }

    const Address& Self() const { return self_; }

    const FarmState& State() const { return state_; }

    /// Install a previously persisted state after checking its invariants
    void ReplaceState(const FarmState& state);

    void SetEventCallback(EventCallback callback) { eventCallback_ = std::move(callback); }

    void SetSettlementCallback(SettlementCallback callback) {
        settlementCallback_ = std::move(callback);
    }

private:
    /// Snapshot of the state restored unless Commit() is reached
    class StateTransaction {
    public:
        StateTransaction(FarmEngine& engine, const char* operation);
        ~StateTransaction();

        StateTransaction(const StateTransaction&) = delete;
        StateTransaction& operator=(const StateTransaction&) = delete;

        /// Keep the changes and publish queued events
        void Commit();

    private:
        FarmEngine& engine_;
        FarmState snapshot_;
        const char* operation_;
        bool committed_{false};
    };

    /// Rejects entry while another entry point is running
    class ReentrancyGuard {
    public:
        explicit ReentrancyGuard(bool& entered);
        ~ReentrancyGuard();

        ReentrancyGuard(const ReentrancyGuard&) = delete;
        ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    private:
        bool& entered_;
    };

    void RequireAdmin(const Address& caller) const;
    void RequireWallet(const Address& wallet, const char* name) const;

    PoolInfo& PoolAt(PoolId pid);

    IMintableToken& RewardTokenContract() const;
    IFungibleToken& LpTokenContract(const Address& lpToken) const;

    /// Advance one pool, minting its shares
    void SettlePool(PoolId pid);
    void SettleAll();

    /// Pay min(amount, reward balance); returns the amount paid
    Amount SafeRewardTransfer(const Address& to, const Amount& amount);

    void Mint(const Address& to, const Amount& amount);

    void Emit(FarmEventType type, PoolId pid, const Address& account, const Amount& amount);

    void PublishEvents();
    void DiscardEvents();

    IChainContext& chain_;
    Address self_;
    EmissionSchedule schedule_;
    PoolAccumulator accumulator_;
    FarmState state_;

    bool entered_{false};

    std::vector<FarmEvent> pendingEvents_;
    std::vector<SettlementRecord> pendingSettlements_;
    EventCallback eventCallback_;
    SettlementCallback settlementCallback_;
};

} // namespace farm
} // namespace daostake

#endif // DAOSTAKE_FARM_ENGINE_H
