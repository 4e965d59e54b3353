// AGORA - Database Tests
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <gtest/gtest.h>
#include <agora/db/database.h>
#include <agora/db/memorydb.h>

#include <filesystem>
#include <random>
#include <vector>

using namespace agora;
using namespace agora::db;

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;
    MemoryDatabase db_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("agora_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }
};

// ============================================================================
// Status
// ============================================================================

TEST_F(DatabaseTest, StatusCodes) {
    EXPECT_TRUE(Status::Ok().ok());
    EXPECT_TRUE(Status::NotFound("x").IsNotFound());
    EXPECT_TRUE(Status::Corruption("x").IsCorruption());
    EXPECT_TRUE(Status::NotSupported().IsNotSupported());
    EXPECT_TRUE(Status::IOError().IsIOError());
    EXPECT_EQ(Status::Ok().ToString(), "OK");
    EXPECT_NE(Status::Corruption("bad record").ToString().find("bad record"),
              std::string::npos);
}

// ============================================================================
// Memory Database
// ============================================================================

TEST_F(DatabaseTest, PutAndGet) {
    ASSERT_TRUE(db_.Put(Slice("key1"), Slice("value1")).ok());

    std::string value;
    ASSERT_TRUE(db_.Get(Slice("key1"), &value).ok());
    EXPECT_EQ(value, "value1");
    EXPECT_EQ(db_.Size(), 1u);
}

TEST_F(DatabaseTest, GetNotFound) {
    std::string value;
    EXPECT_TRUE(db_.Get(Slice("nonexistent"), &value).IsNotFound());
    EXPECT_FALSE(db_.Exists(Slice("nonexistent")));
}

TEST_F(DatabaseTest, Delete) {
    db_.Put(Slice("key1"), Slice("value1"));
    ASSERT_TRUE(db_.Delete(Slice("key1")).ok());

    std::string value;
    EXPECT_TRUE(db_.Get(Slice("key1"), &value).IsNotFound());
    EXPECT_TRUE(db_.Delete(Slice("key1")).ok());
}

TEST_F(DatabaseTest, WriteBatchAppliesInOrder) {
    db_.Put(Slice("gone"), Slice("1"));

    WriteBatch batch;
    batch.Put(Slice("a"), Slice("1"));
    batch.Put(Slice("b"), Slice("2"));
    batch.Put(Slice("a"), Slice("3"));
    batch.Delete(Slice("gone"));
    EXPECT_EQ(batch.Count(), 4u);

    ASSERT_TRUE(db_.Write(&batch).ok());

    std::string value;
    ASSERT_TRUE(db_.Get(Slice("a"), &value).ok());
    EXPECT_EQ(value, "3");
    EXPECT_TRUE(db_.Exists(Slice("b")));
    EXPECT_FALSE(db_.Exists(Slice("gone")));
}

TEST_F(DatabaseTest, IteratorIsOrdered) {
    db_.Put(Slice("p2"), Slice("b"));
    db_.Put(Slice("p1"), Slice("a"));
    db_.Put(Slice("q1"), Slice("c"));
    db_.Put(Slice("o9"), Slice("z"));

    auto iter = db_.NewIterator();
    std::vector<std::string> keys;
    for (iter->Seek(Slice("p")); iter->Valid(); iter->Next()) {
        if (!iter->key().starts_with(Slice("p"))) {
            break;
        }
        keys.push_back(iter->key().ToString());
    }
    ASSERT_TRUE(iter->status().ok());
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "p1");
    EXPECT_EQ(keys[1], "p2");

    iter->SeekToFirst();
    ASSERT_TRUE(iter->Valid());
    EXPECT_EQ(iter->key().ToString(), "o9");
    EXPECT_EQ(iter->value().ToString(), "z");
}

TEST_F(DatabaseTest, IteratorIsSnapshot) {
    db_.Put(Slice("a"), Slice("1"));
    auto iter = db_.NewIterator();
    db_.Put(Slice("b"), Slice("2"));

    size_t count = 0;
    for (iter->SeekToFirst(); iter->Valid(); iter->Next()) {
        ++count;
    }
    EXPECT_EQ(count, 1u);
}

TEST_F(DatabaseTest, ClearRemovesEverything) {
    db_.Put(Slice("a"), Slice("1"));
    db_.Put(Slice("b"), Slice("2"));
    db_.Clear();
    EXPECT_EQ(db_.Size(), 0u);
}

// ============================================================================
// Persistent Backend
// ============================================================================

TEST_F(DatabaseTest, OpenPersistentDatabase) {
    auto [status, db] = OpenDatabase(testDir_ / "gov", Options());
    if (status.IsNotSupported()) {
        EXPECT_TRUE(db == nullptr);
        GTEST_SKIP() << "built without a persistent backend";
    }
    ASSERT_TRUE(status.ok()) << status.ToString();
    ASSERT_TRUE(db != nullptr);

    ASSERT_TRUE(db->Put(Slice("k"), Slice("v")).ok());
    std::string value;
    ASSERT_TRUE(db->Get(Slice("k"), &value).ok());
    EXPECT_EQ(value, "v");
}

TEST_F(DatabaseTest, PersistentDataSurvivesReopen) {
    {
        auto [status, db] = OpenDatabase(testDir_ / "gov", Options());
        if (status.IsNotSupported()) {
            GTEST_SKIP() << "built without a persistent backend";
        }
        ASSERT_TRUE(status.ok());
        ASSERT_TRUE(db->Put(WriteOptions{true}, Slice("k"), Slice("v")).ok());
    }

    auto [status, db] = OpenDatabase(testDir_ / "gov", Options());
    ASSERT_TRUE(status.ok());
    EXPECT_TRUE(db->Exists(Slice("k")));
}

TEST_F(DatabaseTest, DestroyDatabase) {
    auto path = testDir_ / "to_destroy";
    std::filesystem::create_directories(path);
    EXPECT_TRUE(DestroyDatabase(path).ok());
}

// ============================================================================
// Serialization Helpers
// ============================================================================

TEST_F(DatabaseTest, SerializeDeserialize) {
    Hash256 original;
    for (size_t i = 0; i < 32; ++i) {
        original[i] = static_cast<uint8_t>(i);
    }

    std::string data = SerializeToString(original);
    EXPECT_EQ(data.size(), 32u);

    Hash256 restored;
    EXPECT_TRUE(DeserializeFromString(data, restored));
    EXPECT_EQ(original, restored);
}

TEST_F(DatabaseTest, DeserializeRejectsTruncatedAndTrailing) {
    std::string data = SerializeToString(uint64_t(5));
    uint64_t out = 0;

    EXPECT_FALSE(DeserializeFromString(data.substr(0, 4), out));
    EXPECT_FALSE(DeserializeFromString(data + "x", out));
    EXPECT_TRUE(DeserializeFromString(data, out));
    EXPECT_EQ(out, 5u);
}

TEST_F(DatabaseTest, MakeKey) {
    std::string key1 = MakeKey(prefix::SEQUENCE);
    ASSERT_EQ(key1.size(), 1u);
    EXPECT_EQ(key1[0], prefix::SEQUENCE);

    DaoId dao(Hash256::FromHex(
        "0101010101010101010101010101010101010101010101010101010101010101"));
    std::string key2 = MakeKey(prefix::DAO_CONFIG, dao);
    ASSERT_EQ(key2.size(), 33u);
    EXPECT_EQ(key2[0], prefix::DAO_CONFIG);
    EXPECT_EQ(key2[1], '\x01');

    ProposalId proposal;
    std::string key3 = MakeKey(prefix::PROPOSAL, dao, proposal);
    EXPECT_EQ(key3.size(), 65u);
    EXPECT_TRUE(Slice(key3).starts_with(Slice(MakeKey(prefix::PROPOSAL, dao))));
}
