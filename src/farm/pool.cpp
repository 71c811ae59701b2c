// DAOSTAKE - Pool Accumulator Implementation
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include "daostake/farm/pool.h"
#include "daostake/farm/arith.h"

#include <sstream>

namespace daostake {
namespace farm {

std::string SettlementRecord::ToString() const {
    std::ostringstream oss;
    oss << "Settlement(pool=" << poolId
        << ", blocks=[" << fromBlock << ", " << lastRewardBlock << ")"
        << ", total=" << FormatAmount(totalReward)
        << ", treasury=" << FormatAmount(treasuryShare)
        << ", community=" << FormatAmount(CommunityMint())
        << ", pool=" << FormatAmount(PoolMint());
    if (poolShareRedirected) {
        oss << ", redirected";
    }
    oss << ")";
    return oss.str();
}

SettlementRecord PoolAccumulator::Preview(PoolId poolId, const PoolInfo& pool,
                                          const Amount& totalWeight,
                                          const Amount& lpSupply,
                                          BlockNumber currentBlock) const {
    SettlementRecord record;
    record.poolId = poolId;
    record.fromBlock = pool.lastRewardBlock;
    record.lastRewardBlock = pool.lastRewardBlock;
    record.lpSupply = lpSupply;
    record.accRewardPerShare = pool.accRewardPerShare;

    if (currentBlock <= pool.lastRewardBlock) {
        return record;
    }

    record.noop = false;
    record.lastRewardBlock = currentBlock;

    if (totalWeight == 0) {
        return record;
    }

    Amount multiplier = schedule_.GetMultiplier(pool.lastRewardBlock, currentBlock);
    record.totalReward = MulDiv(multiplier, pool.weight, totalWeight);
    record.treasuryShare = Percentage(record.totalReward, TREASURY_PERCENT);
    record.communityShare = Percentage(record.totalReward, COMMUNITY_PERCENT);
    record.poolShare = Percentage(record.totalReward, POOL_PERCENT);

    if (lpSupply == 0) {
        record.poolShareRedirected = true;
    } else {
        record.accRewardPerShare += MulDiv(record.poolShare, AccPrecision(), lpSupply);
    }

    return record;
}

void PoolAccumulator::Apply(PoolInfo& pool, const SettlementRecord& record) {
    if (record.noop) {
        return;
    }
    pool.accRewardPerShare = record.accRewardPerShare;
    pool.lastRewardBlock = record.lastRewardBlock;
}

} // namespace farm
} // namespace daostake
