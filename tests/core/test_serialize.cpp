// DAOSTAKE - Serialization Tests
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include <gtest/gtest.h>
#include "daostake/core/serialize.h"
#include "daostake/core/types.h"

#include <ios>
#include <limits>
#include <vector>

using namespace daostake;

// ============================================================================
// DataStream Basic Tests
// ============================================================================

TEST(DataStreamTest, DefaultConstructor) {
    DataStream ds;
    EXPECT_TRUE(ds.empty());
    EXPECT_EQ(ds.size(), 0u);
}

TEST(DataStreamTest, WriteAndRead) {
    DataStream ds;
    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04};
    ds.Write(data.data(), data.size());
    EXPECT_EQ(ds.size(), 4u);

    std::vector<uint8_t> result(4);
    ds.Read(result.data(), result.size());
    EXPECT_EQ(result, data);
    EXPECT_TRUE(ds.empty());
}

TEST(DataStreamTest, ReadPastEndThrows) {
    DataStream ds;
    ser_writedata8(ds, 7);
    uint8_t buf[2];
    EXPECT_THROW(ds.Read(buf, 2), std::ios_base::failure);
}

// ============================================================================
// Integer Encoding
// ============================================================================

TEST(SerializeTest, IntegersAreLittleEndian) {
    DataStream ds;
    ser_writedata32(ds, 0x01020304);
    EXPECT_EQ(ds.ToHex(), "04030201");

    EXPECT_EQ(ser_readdata32(ds), 0x01020304u);
}

TEST(SerializeTest, Uint64) {
    DataStream ds;
    ser_writedata64(ds, 172800ULL * 24);
    ser_writedata8(ds, 0xff);
    EXPECT_EQ(ser_readdata64(ds), 172800ULL * 24);
    EXPECT_EQ(ser_readdata8(ds), 0xff);
}

// ============================================================================
// Domain Types
// ============================================================================

TEST(SerializeTest, AmountIsBigEndianWord) {
    DataStream ds;
    SerializeAmount(ds, Amount(0x0102));
    ASSERT_EQ(ds.size(), AMOUNT_BYTES);
    EXPECT_EQ(ds.ToHex(), std::string(60, '0') + "0102");
}

TEST(SerializeTest, AmountExtremes) {
    DataStream ds;
    Amount max = std::numeric_limits<Amount>::max();
    SerializeAmount(ds, 0);
    SerializeAmount(ds, max);
    EXPECT_EQ(UnserializeAmount(ds), 0);
    EXPECT_EQ(UnserializeAmount(ds), max);
}

TEST(SerializeTest, Address) {
    Address addr = *Address::FromHex("00112233445566778899aabbccddeeff00112233");
    DataStream ds;
    SerializeHash(ds, addr);
    EXPECT_EQ(ds.size(), Address::SIZE);
    EXPECT_EQ(UnserializeAddress(ds), addr);
}
