// DAOSTAKE - Database Layer Tests
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include <gtest/gtest.h>
#include "daostake/crypto/hash.h"
#include "daostake/db/database.h"
#include "daostake/db/farmdb.h"
#include "daostake/db/leveldb.h"
#include <filesystem>
#include <random>
#include <vector>

using namespace daostake;
using namespace daostake::db;

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("daostake_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    std::unique_ptr<Database> OpenLevelDB() {
        auto [status, db] = OpenDatabase(testDir_ / "state");
        EXPECT_TRUE(status.ok()) << status.ToString();
        return std::move(db);
    }

    /// Keys 'a'..'c' under prefix P, one key under U
    static void Populate(Database& db) {
        WriteBatch batch;
        batch.Put(Slice("Pb"), Slice("2"));
        batch.Put(Slice("Pa"), Slice("1"));
        batch.Put(Slice("Pc"), Slice("3"));
        batch.Put(Slice("Ux"), Slice("9"));
        batch.Put(Slice("Pd"), Slice("4"));
        batch.Delete(Slice("Pd"));  // Delete in same batch
        ASSERT_TRUE(db.Write(&batch).ok());
    }

    /// Collect "key=value" pairs starting with `start`
    static std::string Scan(Database& db, const std::string& start) {
        std::string result;
        auto iter = db.NewIterator();
        for (iter->Seek(start); iter->Valid() && iter->key().starts_with(start); iter->Next()) {
            result += iter->key().ToString() + "=" + iter->value().ToString() + ";";
        }
        EXPECT_TRUE(iter->status().ok());
        return result;
    }
};

// ============================================================================
// LevelDB Tests
// ============================================================================

TEST_F(DatabaseTest, OpenAndClose) {
    auto db = OpenLevelDB();
    ASSERT_NE(db, nullptr);
}

TEST_F(DatabaseTest, PutGetDelete) {
    auto db = OpenLevelDB();
    ASSERT_NE(db, nullptr);

    ASSERT_TRUE(db->Put(Slice("key1"), Slice("value1")).ok());
    std::string value;
    ASSERT_TRUE(db->Get(Slice("key1"), &value).ok());
    EXPECT_EQ(value, "value1");
    EXPECT_TRUE(db->Exists(Slice("key1")));

    ASSERT_TRUE(db->Delete(Slice("key1")).ok());
    EXPECT_TRUE(db->Get(Slice("key1"), &value).IsNotFound());
    EXPECT_FALSE(db->Exists(Slice("key1")));
}

TEST_F(DatabaseTest, BatchAndPrefixScan) {
    auto db = OpenLevelDB();
    ASSERT_NE(db, nullptr);
    Populate(*db);
    EXPECT_EQ(Scan(*db, "P"), "Pa=1;Pb=2;Pc=3;");
    EXPECT_EQ(Scan(*db, "U"), "Ux=9;");
    EXPECT_EQ(Scan(*db, "Z"), "");
}

TEST_F(DatabaseTest, FarmStorePersistsAcrossReopen) {
    farm::EmissionParams params = farm::EmissionParams::Reference(10);
    farm::FarmState state;
    state.treasury = crypto::AddressFromLabel("treasury");
    state.community = crypto::AddressFromLabel("community");
    state.rewardToken = crypto::AddressFromLabel("DAO");
    state.admin = crypto::AddressFromLabel("admin");
    farm::PoolInfo pool;
    pool.lpToken = crypto::AddressFromLabel("LP");
    pool.weight = 2;
    pool.lastRewardBlock = 10;
    state.pools.push_back(pool);
    state.totalWeight = 2;
    state.ledger.At(0, crypto::AddressFromLabel("alice")).stakeAmount = Coin();

    {
        auto [status, store] = FarmStore::Open(testDir_ / "farm");
        ASSERT_TRUE(status.ok()) << status.ToString();
        ASSERT_TRUE(store->Save(params, state).ok());
    }

    auto [status, store] = FarmStore::Open(testDir_ / "farm");
    ASSERT_TRUE(status.ok()) << status.ToString();
    EXPECT_TRUE(store->HasState());
    farm::FarmState loaded;
    ASSERT_TRUE(store->Load(params, loaded).ok());
    EXPECT_EQ(loaded, state);
}

// ============================================================================
// Memory Database Tests
// ============================================================================

TEST_F(DatabaseTest, MemoryDatabaseMatchesLevelDBOrdering) {
    MemoryDatabase db;
    Populate(db);
    EXPECT_EQ(db.Size(), 4u);

    Database& base = db;
    EXPECT_EQ(Scan(base, "P"), "Pa=1;Pb=2;Pc=3;");
    EXPECT_EQ(Scan(base, "Pb"), "Pb=2;");

    std::string value;
    Status s = db.Get(ReadOptions(), Slice("Pd"), &value);
    EXPECT_TRUE(s.IsNotFound());

    db.Clear();
    EXPECT_EQ(db.Size(), 0u);
}

TEST_F(DatabaseTest, ScanPrefixStopsOnVisitorError) {
    MemoryDatabase db;
    Populate(db);

    std::vector<std::string> seen;
    Status s = db.ScanPrefix(Slice("P"), [&](const Slice& key, const Slice&) {
        seen.push_back(key.ToString());
        return key == Slice("Pb") ? Status::Corruption("stop") : Status::Ok();
    });
    EXPECT_TRUE(s.IsCorruption());
    EXPECT_EQ(seen, (std::vector<std::string>{"Pa", "Pb"}));
}

TEST_F(DatabaseTest, MakeKey) {
    std::string key1 = MakeKey(prefix::GLOBALS);
    EXPECT_EQ(key1.size(), 1u);
    EXPECT_EQ(key1[0], prefix::GLOBALS);

    std::string key2 = MakeKey(prefix::POOL, Slice("test"));
    EXPECT_EQ(key2[0], prefix::POOL);
    EXPECT_EQ(key2.substr(1), "test");
}

// ============================================================================
// Status Tests
// ============================================================================

TEST_F(DatabaseTest, StatusOk) {
    Status s = Status::Ok();
    EXPECT_TRUE(s.ok());
    EXPECT_FALSE(s.IsNotFound());
    EXPECT_FALSE(s.IsCorruption());
    EXPECT_FALSE(s.IsIOError());
    EXPECT_EQ(s.ToString(), "OK");
}

TEST_F(DatabaseTest, StatusCodes) {
    Status s = Status::NotFound("key not found");
    EXPECT_FALSE(s.ok());
    EXPECT_TRUE(s.IsNotFound());
    EXPECT_EQ(s.message(), "key not found");

    EXPECT_TRUE(Status::Corruption("bad").IsCorruption());
    EXPECT_TRUE(Status::IOError("disk full").IsIOError());
    EXPECT_EQ(Status::InvalidArgument().code(), Status::INVALID_ARGUMENT);
    EXPECT_EQ(Status::NotSupported("v2").ToString(), "NotSupported: v2");
}

// ============================================================================
// Slice Tests
// ============================================================================

TEST_F(DatabaseTest, SliceBasic) {
    std::string data = "hello world";
    Slice slice(data);

    EXPECT_EQ(slice.size(), data.size());
    EXPECT_EQ(slice.ToString(), data);
    EXPECT_FALSE(slice.empty());
    EXPECT_TRUE(slice.starts_with(Slice("hello")));
    EXPECT_FALSE(slice.starts_with(Slice("world")));

    EXPECT_TRUE(Slice("abc") == Slice("abc"));
    EXPECT_TRUE(Slice("abc") != Slice("abd"));
    EXPECT_TRUE(Slice().empty());
}
