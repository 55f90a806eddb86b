#include <gtest/gtest.h>
#include "core/allocate.h"
#include "database/chunk_store.h"
#include "crypto/crypto.h"
#include "utils/utils.h"
#include <filesystem>
#include <vector>

using namespace subvault;
using namespace subvault::core;

class AllocateTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "subvault_test_allocate";
        std::filesystem::remove_all(testDir);
    }
    
    void TearDown() override {
        std::filesystem::remove_all(testDir);
    }
    
    Allocation alloc(const std::string& miner, uint64_t n, bool hashOnly) {
        return makeAllocation(testDir.string(), "wallet", "hot", miner, "validator5", n, hashOnly, 64);
    }
    
    std::filesystem::path testDir;
};

TEST_F(AllocateTest, PathAndSeedLayout) {
    Allocation a = alloc("miner1", 10, true);
    EXPECT_EQ(a.path, (testDir / "wallet" / "hot" / "DB-miner1-validator5").string());
    EXPECT_EQ(a.seed, "miner1validator5");
    EXPECT_EQ(a.chunkSize, 64u);
}

TEST_F(AllocateTest, ChunkDataIsDeterministic) {
    std::string a = chunkData("seed", 1, 200);
    EXPECT_EQ(a.size(), 200u);
    EXPECT_EQ(a, chunkData("seed", 1, 200));
    EXPECT_NE(a, chunkData("seed", 2, 200));
    EXPECT_NE(a, chunkData("other", 1, 200));
    EXPECT_EQ(chunkData("seed", 1, 10), a.substr(0, 10));
    EXPECT_EQ(chunkHash("seed", 1, 200), crypto::sha256Hex(a));
}

TEST_F(AllocateTest, MinerAndValidatorStoresAgree) {
    Allocation full = makeAllocation((testDir / "m").string(), "w", "h", "minerA", "valB", 20, false, 64);
    Allocation hashes = makeAllocation((testDir / "v").string(), "w", "h", "minerA", "valB", 20, true, 64);
    ASSERT_TRUE(generate({full, hashes}, 2).ok());
    
    database::ChunkStore fs, hs;
    ASSERT_TRUE(fs.open(full.path, full.seed, false));
    ASSERT_TRUE(hs.open(hashes.path, hashes.seed, true));
    EXPECT_EQ(fs.count(), 20u);
    EXPECT_EQ(hs.count(), 20u);
    for (uint64_t id : {1ull, 7ull, 20ull}) {
        auto data = fs.data(id);
        ASSERT_TRUE(data.has_value());
        EXPECT_EQ(crypto::sha256Hex(*data), hs.hash(id).value());
    }
    EXPECT_FALSE(hs.data(1).has_value());
    EXPECT_FALSE(fs.data(21).has_value());
}

TEST_F(AllocateTest, GrowAndShrinkInPlace) {
    Allocation a = alloc("minerX", 10, true);
    ASSERT_TRUE(generate({a}).ok());
    std::string h5 = [&] {
        database::ChunkStore s;
        s.open(a.path, a.seed, true);
        return s.hash(5).value();
    }();
    
    a.nChunks = 25;
    ASSERT_TRUE(generate({a}).ok());
    {
        database::ChunkStore s;
        ASSERT_TRUE(s.open(a.path, a.seed, true));
        EXPECT_EQ(s.count(), 25u);
        EXPECT_EQ(s.hash(5).value(), h5);
    }
    
    a.nChunks = 4;
    ASSERT_TRUE(generate({a}).ok());
    database::ChunkStore s;
    ASSERT_TRUE(s.open(a.path, a.seed, true));
    EXPECT_EQ(s.count(), 4u);
    EXPECT_EQ(s.maxId(), 4u);
    EXPECT_FALSE(s.hash(5).has_value());
}

TEST_F(AllocateTest, RestartRebuildsFromEmpty) {
    Allocation a = alloc("minerR", 6, false);
    ASSERT_TRUE(generate({a}).ok());
    ASSERT_TRUE(generate({a}, 1, true).ok());
    database::ChunkStore s;
    ASSERT_TRUE(s.open(a.path, a.seed, false));
    EXPECT_EQ(s.count(), 6u);
    EXPECT_EQ(s.data(6).value(), chunkData(a.seed, 6, 64));
}

TEST_F(AllocateTest, RequiredBytesCountsOnlyMissingRows) {
    Allocation a = alloc("minerB", 10, false);
    uint64_t rows = 10 * (64 + HASH_ROW_BYTES);
    EXPECT_EQ(requiredBytes(a, false), rows + rows / 64 + GENERATE_HEADROOM_BYTES);
    ASSERT_TRUE(generate({a}).ok());
    EXPECT_EQ(requiredBytes(a, false), 0u);
    EXPECT_EQ(requiredBytes(a, true), rows + rows / 64 + GENERATE_HEADROOM_BYTES);
}

TEST_F(AllocateTest, RefusesWhenRowsFitButJournalDoesNot) {
    uint64_t avail = utils::availableDiskSpace(testDir.string());
    ASSERT_GT(avail, 64ull << 20);
    uint64_t perChunk = CHUNK_SIZE + HASH_ROW_BYTES;
    uint64_t n = (avail - (8ull << 20)) / perChunk;
    Allocation tight = makeAllocation(testDir.string(), "w", "h", "minerT", "val", n, false, CHUNK_SIZE);
    ASSERT_LE(n * perChunk, avail);
    
    auto r = generate({tight});
    ASSERT_TRUE(r.failed());
    EXPECT_EQ(r.error().code, ErrorCode::INSUFFICIENT_SPACE);
    EXPECT_FALSE(std::filesystem::exists(tight.path));
}

TEST_F(AllocateTest, RefusesWithoutRoom) {
    Allocation huge = alloc("minerH", 1ull << 40, false);
    auto r = generate({huge});
    ASSERT_TRUE(r.failed());
    EXPECT_EQ(r.error().code, ErrorCode::INSUFFICIENT_SPACE);
    EXPECT_FALSE(std::filesystem::exists(huge.path));
}

TEST_F(AllocateTest, RejectsUnsafeSeed) {
    Allocation bad = makeAllocation(testDir.string(), "w", "h", "mi\"ner", "val", 2, true, 64);
    auto r = generate({bad});
    ASSERT_TRUE(r.failed());
    EXPECT_EQ(r.error().code, ErrorCode::VALIDATION_FAILED);
}

TEST(AllocateFormatTest, HumanReadableSize) {
    EXPECT_EQ(humanReadableSize(512), "512.00 B");
    EXPECT_EQ(humanReadableSize(CHUNK_SIZE * MIN_N_CHUNKS), "1.00 GB");
}
