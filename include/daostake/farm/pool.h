// DAOSTAKE - Pool Accumulator
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License
//
// Per-pool reward state and the settlement arithmetic that advances it.
// Settlement is computed as a pure preview first; the engine performs
// the mints and only then applies the preview to the pool.

#ifndef DAOSTAKE_FARM_POOL_H
#define DAOSTAKE_FARM_POOL_H

#include "daostake/core/types.h"
#include "daostake/farm/emission.h"

#include <string>

namespace daostake {
namespace farm {

// ============================================================================
// Pool Record
// ============================================================================

struct PoolInfo {
    /// Staked-asset token (identity only)
    Address lpToken;

    /// Relative share of the emission
    Amount weight{0};

    /// Last block the accumulator was advanced to
    BlockNumber lastRewardBlock{0};

    /// Reward per staked unit, scaled by 1e18; never decreases
    Amount accRewardPerShare{0};

    bool operator==(const PoolInfo& other) const {
        return lpToken == other.lpToken && weight == other.weight &&
               lastRewardBlock == other.lastRewardBlock &&
               accRewardPerShare == other.accRewardPerShare;
    }
};

// ============================================================================
// Settlement Record
// ============================================================================

/// Outcome of advancing one pool to a block
struct SettlementRecord {
    PoolId poolId{0};
    BlockNumber fromBlock{0};
    BlockNumber lastRewardBlock{0};

    Amount totalReward{0};
    Amount treasuryShare{0};
    Amount communityShare{0};   // Base 15%, excluding any redirect
    Amount poolShare{0};

    /// No stake in the pool: poolShare goes to the community wallet
    bool poolShareRedirected{false};

    Amount lpSupply{0};
    Amount accRewardPerShare{0}; // Value after settlement

    /// Nothing to do (block did not advance)
    bool noop{true};

    /// Total minted to the community wallet
    Amount CommunityMint() const {
        return poolShareRedirected ? communityShare + poolShare : communityShare;
    }

    /// Amount minted into engine custody
    Amount PoolMint() const {
        return poolShareRedirected ? Amount(0) : poolShare;
    }

    std::string ToString() const;
};

// ============================================================================
// Pool Accumulator
// ============================================================================

class PoolAccumulator {
public:
    explicit PoolAccumulator(const EmissionSchedule& schedule) : schedule_(schedule) {}

    /**
     * Compute the settlement of `pool` up to `currentBlock` without
     * touching any state.
     *
     * totalReward = multiplier(last, current) * weight / totalWeight,
     * split 15% treasury, 15% community, 30% pool. With lpSupply == 0
     * the pool share is redirected and the accumulator is unchanged.
     */
    SettlementRecord Preview(PoolId poolId, const PoolInfo& pool,
                             const Amount& totalWeight, const Amount& lpSupply,
                             BlockNumber currentBlock) const;

    /// Write a previewed settlement into the pool record
    static void Apply(PoolInfo& pool, const SettlementRecord& record);

private:
    const EmissionSchedule& schedule_;
};

} // namespace farm
} // namespace daostake

#endif // DAOSTAKE_FARM_POOL_H
