// DAOSTAKE - Scenario Runner Tests
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include <gtest/gtest.h>

#include "daostake/crypto/hash.h"
#include "daostake/sim/scenario.h"

#include <sstream>

namespace daostake {
namespace sim {
namespace test {

/// Four periods of 100 blocks from block 100, one token per block, halving
static const char* const TEST_CONFIG = R"(
premint=1000

[emission]
start_block=100
period_length=100
period_count=4
base_rate=1
decay_numerator=1
decay_denominator=2

[pool.0]
lp_token=LPA
)";

class ScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        util::ConfigManager manager;
        ASSERT_TRUE(manager.ParseString(TEST_CONFIG).success);
        auto result = farm::FarmConfig::FromConfig(manager, config_);
        ASSERT_TRUE(result.success) << result.ToString();
        scenario_ = std::make_unique<Scenario>(config_);
    }

    std::string Run(const std::string& line) {
        CommandResult result = scenario_->Execute(line);
        EXPECT_TRUE(result.ok) << line << " -> " << result.output;
        return result.output;
    }

    farm::FarmConfig config_;
    std::unique_ptr<Scenario> scenario_;
};

TEST_F(ScenarioTest, SetupDeploysEngine) {
    farm::FarmEngine& engine = scenario_->Engine();
    EXPECT_EQ(engine.PoolLength(), 1u);
    EXPECT_EQ(engine.Self(), Scenario::AccountOf(ENGINE_LABEL));
    EXPECT_EQ(scenario_->RewardToken().Owner(), engine.Self());
    EXPECT_EQ(scenario_->RewardToken().BalanceOf(config_.treasury), Coin() * 1000);
    EXPECT_EQ(scenario_->LpToken(0).Symbol(), "LPA");
    EXPECT_EQ(engine.GetPool(0).lastRewardBlock, 100u);
}

TEST_F(ScenarioTest, StakeAndClaim) {
    EXPECT_EQ(Run("block 100"), "block 100");
    EXPECT_EQ(Run("fund alice 0 10"), "fund alice pool=0 amount=10");
    EXPECT_EQ(Run("deposit alice 0 10"), "deposit alice pool=0 amount=10 stake=10 reward=0");
    EXPECT_EQ(Run("advance 40"), "block 140");

    // 40 tokens emitted; the pool's 30% all belongs to alice
    EXPECT_EQ(Run("pending alice 0"), "pending alice pool=0 reward=12");
    EXPECT_EQ(Run("withdraw alice 0 4"), "withdraw alice pool=0 amount=4 stake=6 reward=12");
    EXPECT_EQ(Run("balance alice"), "balance alice DAO=12 LPA=4");
    EXPECT_EQ(Run("balance treasury"), "balance treasury DAO=1006 LPA=0");
    EXPECT_EQ(Run("balance community"), "balance community DAO=6 LPA=0");

    EXPECT_EQ(Run("emergency alice 0"), "emergency alice pool=0 returned=6");
    EXPECT_EQ(Run("pending alice 0"), "pending alice pool=0 reward=0");
}

TEST_F(ScenarioTest, AdminCommands) {
    EXPECT_EQ(Run("block 150"), "block 150");
    EXPECT_EQ(Run("update 0"), "update pool=0 lastRewardBlock=150 acc=0");
    EXPECT_EQ(Run("setweight 0 3"), "setweight pool=0 weight=3 total=3");
    EXPECT_EQ(Run("massupdate"), "massupdate pools=1");
}

TEST_F(ScenarioTest, FailuresAreReported) {
    CommandResult result = scenario_->Execute("withdraw alice 0 1");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.output.find("error: insufficient-balance"), 0u);

    result = scenario_->Execute("deposit alice 7 1");
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.output.find("unknown-pool"), std::string::npos);

    EXPECT_FALSE(scenario_->Execute("frobnicate").ok);
    EXPECT_FALSE(scenario_->Execute("fund alice 0 abc").ok);
    EXPECT_FALSE(scenario_->Execute("block").ok);

    ASSERT_TRUE(scenario_->Execute("block 120").ok);
    EXPECT_FALSE(scenario_->Execute("block 110").ok);
    EXPECT_FALSE(scenario_->Execute("advance 18446744073709551615").ok);
    EXPECT_EQ(scenario_->Execute("advance 0").output, "block 120");

    // Depositing without funds leaves nothing behind
    EXPECT_FALSE(scenario_->Execute("deposit bob 0 5").ok);
    EXPECT_EQ(scenario_->Engine().GetPosition(0, Scenario::AccountOf("bob")).stakeAmount, 0);
}

TEST_F(ScenarioTest, CommentsAndBlankLinesAreSkipped) {
    EXPECT_TRUE(scenario_->Execute("").skipped);
    EXPECT_TRUE(scenario_->Execute("   ").skipped);
    EXPECT_TRUE(scenario_->Execute("# a comment").skipped);
}

TEST_F(ScenarioTest, RunCountsFailures) {
    std::istringstream script(
        "# two stakers\n"
        "block 100\n"
        "fund alice 0 5\n"
        "fund bob 0 15\n"
        "deposit alice 0 5\n"
        "deposit bob 0 15\n"
        "\n"
        "block 120\n"
        "withdraw carol 0 1\n"
        "pending alice 0\n"
        "pending bob 0\n");
    std::ostringstream out;
    EXPECT_EQ(scenario_->Run(script, out), 1u);

    // 20 tokens emitted, 6 to the pool split 1:3
    std::string text = out.str();
    EXPECT_NE(text.find("pending alice pool=0 reward=1.5\n"), std::string::npos) << text;
    EXPECT_NE(text.find("pending bob pool=0 reward=4.5\n"), std::string::npos) << text;
    EXPECT_NE(text.find("error: "), std::string::npos);
}

} // namespace test
} // namespace sim
} // namespace daostake
