// DAOSTAKE - Pool Accumulator Tests
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include <gtest/gtest.h>

#include "daostake/farm/arith.h"
#include "daostake/farm/pool.h"

namespace daostake {
namespace farm {
namespace test {

class PoolAccumulatorTest : public ::testing::Test {
protected:
    PoolAccumulatorTest() : schedule_(MakeParams()), accumulator_(schedule_) {}

    /// 100 units per block for 10 periods of 1000 blocks, no decay
    static EmissionParams MakeParams() {
        EmissionParams params;
        params.startBlock = 0;
        params.periodLength = 1000;
        params.periodCount = 10;
        params.baseRate = 100;
        params.decayNumerator = 1;
        params.decayDenominator = 1;
        return params;
    }

    static PoolInfo MakePool(uint32_t weight, BlockNumber last) {
        PoolInfo pool;
        pool.weight = weight;
        pool.lastRewardBlock = last;
        return pool;
    }

    EmissionSchedule schedule_;
    PoolAccumulator accumulator_;
};

TEST_F(PoolAccumulatorTest, WeightedSplitAcrossTwoPools) {
    // 10 blocks * 100 = 1000 units, weights 1 and 3
    PoolInfo a = MakePool(1, 0);
    PoolInfo b = MakePool(3, 0);
    const Amount totalWeight = 4;

    SettlementRecord ra = accumulator_.Preview(0, a, totalWeight, 10, 10);
    SettlementRecord rb = accumulator_.Preview(1, b, totalWeight, 30, 10);

    EXPECT_EQ(ra.totalReward, 250);
    EXPECT_EQ(rb.totalReward, 750);
    EXPECT_EQ(ra.poolShare, 1000 * 30 / 100 / 4);
    EXPECT_EQ(rb.poolShare, 1000 * 30 / 100 * 3 / 4);

    // Increment is the pool share over the live stake, scaled by 1e18
    EXPECT_EQ(ra.accRewardPerShare, Amount(75) * AccPrecision() / 10);
    EXPECT_EQ(rb.accRewardPerShare, Amount(225) * AccPrecision() / 30);
}

TEST_F(PoolAccumulatorTest, SharesSplitFifteenFifteenThirty) {
    PoolInfo pool = MakePool(1, 0);
    SettlementRecord record = accumulator_.Preview(0, pool, 1, 5, 7);
    EXPECT_FALSE(record.noop);
    EXPECT_EQ(record.totalReward, 700);
    EXPECT_EQ(record.treasuryShare, 105);
    EXPECT_EQ(record.communityShare, 105);
    EXPECT_EQ(record.poolShare, 210);
    EXPECT_EQ(record.CommunityMint(), 105);
    EXPECT_EQ(record.PoolMint(), 210);
    EXPECT_FALSE(record.poolShareRedirected);
}

TEST_F(PoolAccumulatorTest, SharesTruncate) {
    // 3 units: each percentage rounds down to zero
    EmissionParams params = MakeParams();
    params.baseRate = 3;
    EmissionSchedule schedule(params);
    PoolAccumulator accumulator(schedule);

    SettlementRecord record = accumulator.Preview(0, MakePool(1, 0), 1, 1, 1);
    EXPECT_EQ(record.totalReward, 3);
    EXPECT_EQ(record.treasuryShare, 0);
    EXPECT_EQ(record.poolShare, 0);
    EXPECT_EQ(record.accRewardPerShare, 0);
}

TEST_F(PoolAccumulatorTest, EmptyPoolRedirectsToCommunity) {
    PoolInfo pool = MakePool(1, 0);
    SettlementRecord record = accumulator_.Preview(0, pool, 1, 0, 10);

    EXPECT_TRUE(record.poolShareRedirected);
    EXPECT_EQ(record.poolShare, 300);
    EXPECT_EQ(record.CommunityMint(), 150 + 300);
    EXPECT_EQ(record.PoolMint(), 0);
    EXPECT_EQ(record.accRewardPerShare, 0);
    EXPECT_EQ(record.lastRewardBlock, 10u);
}

TEST_F(PoolAccumulatorTest, ZeroTotalWeightAdvancesWithoutReward) {
    PoolInfo pool = MakePool(0, 0);
    SettlementRecord record = accumulator_.Preview(0, pool, 0, 100, 50);
    EXPECT_FALSE(record.noop);
    EXPECT_EQ(record.totalReward, 0);
    EXPECT_EQ(record.lastRewardBlock, 50u);

    PoolAccumulator::Apply(pool, record);
    EXPECT_EQ(pool.lastRewardBlock, 50u);
    EXPECT_EQ(pool.accRewardPerShare, 0);
}

TEST_F(PoolAccumulatorTest, SettlingTwiceAtSameBlockIsNoop) {
    PoolInfo pool = MakePool(2, 0);
    SettlementRecord first = accumulator_.Preview(0, pool, 2, 40, 25);
    PoolAccumulator::Apply(pool, first);
    PoolInfo settled = pool;

    SettlementRecord second = accumulator_.Preview(0, pool, 2, 40, 25);
    EXPECT_TRUE(second.noop);
    EXPECT_EQ(second.totalReward, 0);
    PoolAccumulator::Apply(pool, second);
    EXPECT_EQ(pool, settled);

    // An earlier block is ignored as well
    EXPECT_TRUE(accumulator_.Preview(0, pool, 2, 40, 20).noop);
}

TEST_F(PoolAccumulatorTest, AccumulatorNeverDecreases) {
    PoolInfo pool = MakePool(1, 0);
    Amount previous = 0;
    for (BlockNumber block = 5; block <= 50; block += 5) {
        Amount lpSupply = block % 10 == 0 ? Amount(0) : Amount(block * 7);
        SettlementRecord record = accumulator_.Preview(0, pool, 3, lpSupply, block);
        PoolAccumulator::Apply(pool, record);
        EXPECT_GE(pool.accRewardPerShare, previous);
        previous = pool.accRewardPerShare;
    }
}

TEST_F(PoolAccumulatorTest, SettlementAfterEmissionEnds) {
    PoolInfo pool = MakePool(1, 9990);
    SettlementRecord record = accumulator_.Preview(0, pool, 1, 1, 20000);
    EXPECT_EQ(record.totalReward, 1000);
    EXPECT_EQ(record.lastRewardBlock, 20000u);
}

} // namespace test
} // namespace farm
} // namespace daostake
