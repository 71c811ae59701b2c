// DAOSTAKE - Configuration File Parser Tests
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include <gtest/gtest.h>

#include "daostake/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace daostake {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/daostake_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Basic Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseComments) {
    std::string content = R"(
# This is a comment
; This is also a comment
# key=value
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePair) {
    auto result = config_.ParseString("premint = 37034997");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("premint", ""), "37034997");
    EXPECT_EQ(config_.GetUInt("premint", 0), 37034997u);
}

TEST_F(ConfigTest, ParseSections) {
    std::string content = R"(
loglevel=debug

[emission]
start_block=100
period_length=172800

[pool.0]
lp_token=DAO-ETH
weight=2
)";
    auto result = config_.ParseString(content);
    ASSERT_TRUE(result.success) << result.ToString();

    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
    EXPECT_EQ(config_.GetUInt("start_block", 0, "emission"), 100u);
    EXPECT_FALSE(config_.HasKey("start_block"));
    EXPECT_EQ(config_.GetString("lp_token", "", "pool.0"), "DAO-ETH");

    auto sections = config_.GetSections();
    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0], "emission");
    EXPECT_EQ(sections[1], "pool.0");
}

TEST_F(ConfigTest, QuotedValues) {
    auto result = config_.ParseString("name=\"two words\\n\"\nraw='a\\nb'");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("name", ""), "two words\n");
    EXPECT_EQ(config_.GetString("raw", ""), "a\\nb");
}

TEST_F(ConfigTest, BooleanValues) {
    auto result = config_.ParseString("a=yes\nb=off\nc=maybe\nprinttoconsole\nnodebug");
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(config_.GetBool("a", false));
    EXPECT_FALSE(config_.GetBool("b", true));
    EXPECT_FALSE(config_.TryGetBool("c").has_value());
    EXPECT_TRUE(config_.GetBool("printtoconsole", false));
    EXPECT_FALSE(config_.GetBool("debug", true));
}

TEST_F(ConfigTest, UIntRejectsNonDigits) {
    ASSERT_TRUE(config_.ParseString("a=-1\nb=12x\nc=18446744073709551616").success);
    EXPECT_FALSE(config_.TryGetUInt("a").has_value());
    EXPECT_FALSE(config_.TryGetUInt("b").has_value());
    EXPECT_FALSE(config_.TryGetUInt("c").has_value());
    EXPECT_EQ(config_.GetUInt("missing", 7), 7u);
}

TEST_F(ConfigTest, LineContinuation) {
    ASSERT_TRUE(config_.ParseString("key=abc\\\ndef").success);
    EXPECT_EQ(config_.GetString("key", ""), "abcdef");
}

TEST_F(ConfigTest, LastDefinitionWins) {
    ASSERT_TRUE(config_.ParseString("weight=1\nweight=3").success);
    EXPECT_EQ(config_.GetUInt("weight", 0), 3u);
}

// ============================================================================
// Error Tests
// ============================================================================

TEST_F(ConfigTest, MissingBracket) {
    auto result = config_.ParseString("ok=1\n[emission", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_EQ(result.ToString(), "test.conf:2: Missing closing bracket in section header");
}

TEST_F(ConfigTest, InvalidKey) {
    auto result = config_.ParseString("bad key=1");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Invalid key"), std::string::npos);
}

TEST_F(ConfigTest, MissingFile) {
    auto result = config_.ParseFile("/nonexistent/daostake.conf");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Cannot open file"), std::string::npos);
}

// ============================================================================
// File and Command-Line Tests
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("[wallets]\ntreasury=treasury\ncommunity=community\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(config_.GetString("treasury", "", "wallets"), "treasury");
    EXPECT_EQ(config_.GetKeys("wallets").size(), 2u);
}

TEST_F(ConfigTest, CommandLineSectionsAndFlags) {
    const char* argv[] = {"daostake-sim", "-emission.start_block=10", "--pool.0.weight=4",
                          "-noprinttoconsole", "-help", "extra"};
    auto result = config_.ParseCommandLine(6, argv);
    ASSERT_TRUE(result.success) << result.ToString();

    EXPECT_EQ(config_.GetUInt("start_block", 0, "emission"), 10u);
    EXPECT_EQ(config_.GetUInt("weight", 0, "pool.0"), 4u);
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));
    EXPECT_TRUE(config_.GetBool("help", false));
    ASSERT_EQ(config_.GetPositional().size(), 1u);
    EXPECT_EQ(config_.GetPositional()[0], "extra");
}

TEST_F(ConfigTest, CommandLineWinsOverFile) {
    const char* argv[] = {"daostake-sim", "-emission.start_block=10"};
    ASSERT_TRUE(config_.ParseCommandLine(2, argv).success);
    ASSERT_TRUE(config_.ParseString("[emission]\nstart_block=500\nperiod_count=24").success);

    EXPECT_EQ(config_.GetUInt("start_block", 0, "emission"), 10u);
    EXPECT_EQ(config_.GetUInt("period_count", 0, "emission"), 24u);
}

TEST_F(ConfigTest, CommandLineInvalidOption) {
    const char* argv[] = {"daostake-sim", "-bad key=1"};
    EXPECT_FALSE(config_.ParseCommandLine(2, argv).success);
}

// ============================================================================
// Utilities
// ============================================================================

TEST_F(ConfigTest, DefaultsDoNotOverride) {
    config_.Set("loglevel", "warn");
    config_.SetDefault("loglevel", "info");
    config_.SetDefault("logfile", "debug.log");
    EXPECT_EQ(config_.GetString("loglevel", ""), "warn");
    EXPECT_EQ(config_.GetString("logfile", ""), "debug.log");
}

TEST_F(ConfigTest, ExpandEnvVars) {
    setenv("DAOSTAKE_TEST_DIR", "/tmp/farm", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${DAOSTAKE_TEST_DIR}/state"), "/tmp/farm/state");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${DAOSTAKE_UNSET_VARIABLE_X}x"), "x");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${unterminated"), "${unterminated");
    unsetenv("DAOSTAKE_TEST_DIR");
}

TEST_F(ConfigTest, Dump) {
    ASSERT_TRUE(config_.ParseString("a=1\n[emission]\nstart_block=5").success);
    EXPECT_EQ(config_.Dump(), "a=1\n[emission]\nstart_block=5\n");
}

} // namespace test
} // namespace util
} // namespace daostake
