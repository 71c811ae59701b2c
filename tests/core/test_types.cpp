// DAOSTAKE - Core Types Tests
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include <gtest/gtest.h>
#include "daostake/core/hex.h"
#include "daostake/core/types.h"

#include <limits>
#include <stdexcept>
#include <string>

using namespace daostake;

// ============================================================================
// Amount Arithmetic
// ============================================================================

TEST(AmountTest, CoinIsTenToTheEighteen) {
    EXPECT_EQ(Coin().str(), "1000000000000000000");
    EXPECT_EQ(PowerOfTen(0), 1);
}

TEST(AmountTest, OverflowThrows) {
    Amount max = std::numeric_limits<Amount>::max();
    EXPECT_THROW(max + 1, std::overflow_error);
    EXPECT_THROW(max * 2, std::overflow_error);
}

TEST(AmountTest, UnderflowThrows) {
    Amount small = 5;
    EXPECT_THROW(small - Amount(6), std::range_error);
}

// ============================================================================
// Amount Formatting
// ============================================================================

TEST(FormatAmountTest, WholeTokens) {
    EXPECT_EQ(FormatAmount(Coin() * 25), "25");
    EXPECT_EQ(FormatAmount(0), "0");
}

TEST(FormatAmountTest, Fractions) {
    EXPECT_EQ(FormatAmount(Coin() / 2), "0.5");
    EXPECT_EQ(FormatAmount(Coin() + 1), "1.000000000000000001");
    EXPECT_EQ(FormatAmount(Amount(1234), 2), "12.34");
}

TEST(FormatAmountTest, ZeroDecimalsIsRaw) {
    EXPECT_EQ(FormatAmount(Amount(4320000), 0), "4320000");
}

TEST(ParseAmountTest, WholeAndFraction) {
    auto whole = ParseAmount("25");
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(*whole, Coin() * 25);

    auto frac = ParseAmount("0.5");
    ASSERT_TRUE(frac.has_value());
    EXPECT_EQ(*frac, Coin() / 2);

    auto leading = ParseAmount(".25");
    ASSERT_TRUE(leading.has_value());
    EXPECT_EQ(*leading, Coin() / 4);
}

TEST(ParseAmountTest, RejectsGarbage) {
    EXPECT_FALSE(ParseAmount("").has_value());
    EXPECT_FALSE(ParseAmount(".").has_value());
    EXPECT_FALSE(ParseAmount("-1").has_value());
    EXPECT_FALSE(ParseAmount("1e5").has_value());
    EXPECT_FALSE(ParseAmount("1.2.3").has_value());
}

TEST(ParseAmountTest, RejectsExcessPrecision) {
    EXPECT_FALSE(ParseAmount("0.0000000000000000001").has_value());
    EXPECT_FALSE(ParseAmount("1.5", 0).has_value());
    EXPECT_EQ(*ParseAmount("42", 0), 42);
}

TEST(ParseAmountTest, RejectsOverflow) {
    std::string huge(80, '9');
    EXPECT_FALSE(ParseAmount(huge, 0).has_value());
}

TEST(ParseAmountTest, FormatRoundTrip) {
    Amount value = Coin() * 37034997 + 123;
    EXPECT_EQ(*ParseAmount(FormatAmount(value)), value);
}

// ============================================================================
// Hashes and Addresses
// ============================================================================

TEST(Hash160Test, DefaultIsNull) {
    Address addr;
    EXPECT_TRUE(addr.IsNull());
    EXPECT_EQ(addr.ToHex(), std::string(40, '0'));
}

TEST(Hash160Test, FromHex) {
    const std::string hex = "00112233445566778899aabbccddeeff00112233";
    auto addr = Address::FromHex(hex);
    ASSERT_TRUE(addr.has_value());
    EXPECT_EQ(addr->ToHex(), hex);
    EXPECT_EQ((*addr)[1], 0x11);

    auto prefixed = Address::FromHex("0x" + hex);
    ASSERT_TRUE(prefixed.has_value());
    EXPECT_EQ(*prefixed, *addr);
}

TEST(Hash160Test, FromHexRejectsBadInput) {
    EXPECT_FALSE(Address::FromHex("0011").has_value());
    EXPECT_FALSE(Address::FromHex(std::string(39, 'a') + "g").has_value());
}

TEST(Hash160Test, Ordering) {
    Address a = *Address::FromHex("0000000000000000000000000000000000000001");
    Address b = *Address::FromHex("0000000000000000000000000000000000000002");
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_NE(a, b);
}

// ============================================================================
// Hex Utilities
// ============================================================================

TEST(HexTest, RoundTrip) {
    std::vector<HexByte> bytes = {0xde, 0xad, 0xbe, 0xef};
    EXPECT_EQ(BytesToHex(bytes), "deadbeef");
    EXPECT_EQ(HexToBytes("DEADBEEF"), bytes);
}

TEST(HexTest, InvalidInput) {
    EXPECT_FALSE(IsValidHex("abc"));
    EXPECT_FALSE(IsValidHex("zz"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
}
