// DAOSTAKE - Emission Schedule Tests
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include <gtest/gtest.h>

#include "daostake/farm/arith.h"
#include "daostake/farm/emission.h"
#include "daostake/farm/errors.h"

#include <functional>
#include <limits>

namespace daostake {
namespace farm {
namespace test {

namespace {

/// 4 periods of 100 blocks from block 1000, rate halves each period
EmissionParams SmallParams() {
    EmissionParams params;
    params.startBlock = 1000;
    params.periodLength = 100;
    params.periodCount = 4;
    params.baseRate = 800;
    params.decayNumerator = 1;
    params.decayDenominator = 2;
    return params;
}

FarmErrorCode CodeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const FarmError& e) {
        return e.Code();
    }
    ADD_FAILURE() << "expected FarmError";
    return FarmErrorCode::LEDGER_INVARIANT;
}

} // namespace

// ============================================================================
// Parameters
// ============================================================================

TEST(EmissionParamsTest, ReferenceDeployment) {
    EmissionParams params = EmissionParams::Reference(50);
    EXPECT_EQ(params.startBlock, 50u);
    EXPECT_EQ(params.periodLength, 172800u);
    EXPECT_EQ(params.periodCount, 24u);
    EXPECT_EQ(params.baseRate, Coin() * 25);
    EXPECT_EQ(params.EndBlock(), 50u + 172800u * 24u);
    EXPECT_NO_THROW(params.Validate());
}

TEST(EmissionParamsTest, ValidateRejectsBadFields) {
    EmissionParams params = SmallParams();
    params.periodLength = 0;
    EXPECT_EQ(CodeOf([&] { params.Validate(); }), FarmErrorCode::INVALID_PARAMS);

    params = SmallParams();
    params.periodCount = 0;
    EXPECT_EQ(CodeOf([&] { params.Validate(); }), FarmErrorCode::INVALID_PARAMS);

    params = SmallParams();
    params.baseRate = 0;
    EXPECT_EQ(CodeOf([&] { params.Validate(); }), FarmErrorCode::INVALID_PARAMS);

    params = SmallParams();
    params.decayDenominator = 0;
    EXPECT_EQ(CodeOf([&] { params.Validate(); }), FarmErrorCode::INVALID_PARAMS);

    params = SmallParams();
    params.decayNumerator = 3;
    EXPECT_EQ(CodeOf([&] { params.Validate(); }), FarmErrorCode::INVALID_PARAMS);

    params = SmallParams();
    params.startBlock = std::numeric_limits<BlockNumber>::max() - 10;
    EXPECT_EQ(CodeOf([&] { params.Validate(); }), FarmErrorCode::INVALID_PARAMS);
}

// ============================================================================
// Rates and Periods
// ============================================================================

TEST(EmissionScheduleTest, RateTable) {
    EmissionSchedule schedule(SmallParams());
    EXPECT_EQ(schedule.RateOf(1), 800);
    EXPECT_EQ(schedule.RateOf(2), 400);
    EXPECT_EQ(schedule.RateOf(3), 200);
    EXPECT_EQ(schedule.RateOf(4), 100);
    EXPECT_EQ(schedule.Rates().size(), 4u);
    EXPECT_EQ(CodeOf([&] { schedule.RateOf(0); }), FarmErrorCode::INVALID_PERIOD);
    EXPECT_EQ(CodeOf([&] { schedule.RateOf(5); }), FarmErrorCode::INVALID_PERIOD);
}

TEST(EmissionScheduleTest, PeriodOf) {
    EmissionSchedule schedule(SmallParams());
    EXPECT_EQ(schedule.PeriodOf(1000), 1u);
    EXPECT_EQ(schedule.PeriodOf(1099), 1u);
    EXPECT_EQ(schedule.PeriodOf(1100), 2u);
    EXPECT_EQ(schedule.PeriodOf(1399), 4u);
    EXPECT_EQ(schedule.PeriodOf(1400), 5u);
    EXPECT_EQ(schedule.PeriodOf(9999), 5u);
    EXPECT_EQ(schedule.PeriodStart(3), 1200u);
    EXPECT_EQ(CodeOf([&] { schedule.PeriodOf(999); }), FarmErrorCode::INVALID_PERIOD);
}

TEST(EmissionScheduleTest, DecayTruncatesEachStep) {
    EmissionParams params = SmallParams();
    params.baseRate = 7;
    EmissionSchedule schedule(params);
    EXPECT_EQ(schedule.RateOf(2), 3);
    EXPECT_EQ(schedule.RateOf(3), 1);
    EXPECT_EQ(schedule.RateOf(4), 0);
}

// ============================================================================
// Multiplier
// ============================================================================

TEST(EmissionScheduleTest, MultiplierWithinOnePeriod) {
    EmissionSchedule schedule(SmallParams());
    for (BlockNumber a = 1100; a < 1200; a += 7) {
        for (BlockNumber b = a; b <= 1200; b += 13) {
            EXPECT_EQ(schedule.GetMultiplier(a, b), Amount(b - a) * schedule.RateOf(2));
        }
    }
}

TEST(EmissionScheduleTest, MultiplierAcrossPeriods) {
    EmissionSchedule schedule(SmallParams());
    // 50 blocks of period 1, all of period 2, 30 blocks of period 3
    EXPECT_EQ(schedule.GetMultiplier(1050, 1230), 50 * 800 + 100 * 400 + 30 * 200);
    // Ending exactly on a boundary
    EXPECT_EQ(schedule.GetMultiplier(1050, 1200), 50 * 800 + 100 * 400);
    EXPECT_EQ(schedule.TotalEmission(), 100 * (800 + 400 + 200 + 100));
}

TEST(EmissionScheduleTest, MultiplierIsAdditive) {
    EmissionSchedule schedule(SmallParams());
    const BlockNumber points[] = {1000, 1001, 1099, 1100, 1150, 1250, 1300, 1399, 1400};
    for (BlockNumber a : points) {
        for (BlockNumber b : points) {
            for (BlockNumber c : points) {
                if (a <= b && b <= c) {
                    EXPECT_EQ(schedule.GetMultiplier(a, c),
                              schedule.GetMultiplier(a, b) + schedule.GetMultiplier(b, c))
                        << a << " " << b << " " << c;
                }
            }
        }
    }
}

TEST(EmissionScheduleTest, MultiplierClampsToWindow) {
    EmissionSchedule schedule(SmallParams());
    EXPECT_EQ(schedule.GetMultiplier(0, 1000), 0);
    EXPECT_EQ(schedule.GetMultiplier(1400, 5000), 0);
    EXPECT_EQ(schedule.GetMultiplier(1200, 1100), 0);
    EXPECT_EQ(schedule.GetMultiplier(900, 1010), 10 * 800);
    EXPECT_EQ(schedule.GetMultiplier(1390, 2000), 10 * 100);
    EXPECT_EQ(schedule.GetMultiplier(0, 100000), schedule.TotalEmission());
}

TEST(EmissionScheduleTest, ConcreteDecayScenario) {
    EmissionParams params;
    params.startBlock = 0;
    params.periodLength = 172800;
    params.periodCount = 24;
    params.baseRate = 4320000;
    params.decayNumerator = 99;
    params.decayDenominator = 100;
    EmissionSchedule schedule(params);

    EXPECT_EQ(schedule.RateOf(2), Amount(4320000) * 9900 / 10000);
    EXPECT_EQ(schedule.RateOf(2), 4276800);
    EXPECT_EQ(schedule.GetMultiplier(0, 2 * 172800),
              Amount(172800) * schedule.RateOf(1) + Amount(172800) * schedule.RateOf(2));
}

TEST(EmissionScheduleTest, ReferenceEmissionMatchesPremint) {
    EmissionSchedule schedule(EmissionParams::Reference(0));
    // The engine mints 60% of each emission; the premint stands for the other 40%
    Amount premint = Coin() * REFERENCE_PREMINT_TOKENS;
    Amount fortyPercent = Percentage(schedule.TotalEmission(), PREMINT_PERCENT);
    Amount diff = premint > fortyPercent ? premint - fortyPercent : fortyPercent - premint;
    EXPECT_LT(diff * 100000, premint);
}

} // namespace test
} // namespace farm
} // namespace daostake
