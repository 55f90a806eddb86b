#include <gtest/gtest.h>
#include "core/registry.h"
#include "database/database.h"
#include <filesystem>
#include <memory>

using namespace subvault;
using namespace subvault::core;

class RegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "subvault_test_registry";
        std::filesystem::remove_all(testDir);
        path = Registry::pathFor(testDir.string(), "127.0.0.1", 9946);
        registry = std::make_unique<Registry>(path);
        ASSERT_TRUE(registry->open().ok());
    }
    
    void TearDown() override {
        registry.reset();
        std::filesystem::remove_all(testDir);
    }
    
    std::filesystem::path testDir;
    std::string path;
    std::unique_ptr<Registry> registry;
};

TEST_F(RegistryTest, PathIsKeyedByEndpoint) {
    EXPECT_EQ(path, (testDir / "127.0.0.1_9946.db").string());
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(RegistryTest, CreateSubnetOnce) {
    EXPECT_FALSE(registry->subnetExists(12));
    ASSERT_TRUE(registry->createSubnet(12, "owner").ok());
    EXPECT_TRUE(registry->subnetExists(12));
    auto again = registry->createSubnet(12, "owner");
    ASSERT_TRUE(again.failed());
    EXPECT_EQ(again.error().code, ErrorCode::ALREADY_EXISTS);
}

TEST_F(RegistryTest, RegisterAssignsSequentialUidsIdempotently) {
    ASSERT_TRUE(registry->createSubnet(12, "owner").ok());
    auto a = registry->registerNeuron(12, "hotA", "cold");
    auto b = registry->registerNeuron(12, "hotB", "cold");
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(a.value(), 0);
    EXPECT_EQ(b.value(), 1);
    
    auto again = registry->registerNeuron(12, "hotA", "cold");
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again.value(), 0);
    
    auto mg = registry->metagraph(12);
    ASSERT_TRUE(mg.ok());
    EXPECT_EQ(mg.value().size(), 2u);
    EXPECT_EQ(mg.value().hotkeys[1], "hotB");
    EXPECT_EQ(mg.value().uidOf("hotB").value(), 1);
    EXPECT_FALSE(mg.value().hasHotkey("hotC"));
}

TEST_F(RegistryTest, RegisterErrors) {
    auto missing = registry->registerNeuron(5, "hot", "cold");
    ASSERT_TRUE(missing.failed());
    EXPECT_EQ(missing.error().code, ErrorCode::NOT_FOUND);
    
    ASSERT_TRUE(registry->createSubnet(5, "owner", 1).ok());
    ASSERT_TRUE(registry->registerNeuron(5, "first", "cold").ok());
    auto full = registry->registerNeuron(5, "second", "cold");
    ASSERT_TRUE(full.failed());
    EXPECT_EQ(full.error().code, ErrorCode::SUBNET_FULL);
}

TEST_F(RegistryTest, ServeAxonAndStake) {
    ASSERT_TRUE(registry->createSubnet(12, "owner").ok());
    ASSERT_TRUE(registry->registerNeuron(12, "miner", "cold").ok());
    ASSERT_TRUE(registry->serveAxon(12, "miner", "127.0.0.1", 8091).ok());
    ASSERT_TRUE(registry->setStake(12, "miner", 42.5).ok());
    
    auto unknown = registry->serveAxon(12, "ghost", "127.0.0.1", 1);
    ASSERT_TRUE(unknown.failed());
    EXPECT_EQ(unknown.error().code, ErrorCode::NOT_REGISTERED);
    
    auto mg = registry->metagraph(12).value();
    EXPECT_TRUE(mg.axons[0].isServing());
    EXPECT_EQ(mg.axons[0].port, 8091);
    EXPECT_EQ(mg.axons[0].hotkey, "miner");
    EXPECT_DOUBLE_EQ(mg.stake[0], 42.5);
}

TEST_F(RegistryTest, BlockAdvancesOnEveryMutation) {
    uint64_t b0 = registry->block();
    ASSERT_TRUE(registry->createSubnet(12, "owner").ok());
    uint64_t b1 = registry->block();
    ASSERT_TRUE(registry->registerNeuron(12, "hot", "cold").ok());
    uint64_t b2 = registry->block();
    EXPECT_GT(b1, b0);
    EXPECT_GT(b2, b1);
    EXPECT_EQ(registry->metagraph(12).value().block, b2);
}

TEST_F(RegistryTest, WeightsAreScaledToU16) {
    ASSERT_TRUE(registry->createSubnet(12, "owner").ok());
    ASSERT_TRUE(registry->registerNeuron(12, "validator", "cold").ok());
    ASSERT_TRUE(registry->registerNeuron(12, "miner", "cold").ok());
    
    ASSERT_TRUE(registry->setWeights(12, "validator", {0, 1}, {0.25, 0.75}).ok());
    auto w = registry->weights(12, 0);
    ASSERT_TRUE(w.ok());
    ASSERT_EQ(w.value().size(), 2u);
    EXPECT_EQ(w.value()[1].second, U16_MAX_WEIGHT);
    EXPECT_EQ(w.value()[0].second, 21845);
    
    EXPECT_EQ(registry->setWeights(12, "validator", {0, 5}, {1.0, 1.0}).error().code, ErrorCode::VALIDATION_FAILED);
    EXPECT_EQ(registry->setWeights(12, "validator", {0}, {-1.0}).error().code, ErrorCode::VALIDATION_FAILED);
    EXPECT_EQ(registry->setWeights(12, "ghost", {0}, {1.0}).error().code, ErrorCode::NOT_REGISTERED);
    EXPECT_TRUE(registry->weights(12, 1).failed());
}

TEST_F(RegistryTest, SharedAcrossHandles) {
    ASSERT_TRUE(registry->createSubnet(12, "owner").ok());
    Registry second(path);
    ASSERT_TRUE(second.open().ok());
    ASSERT_TRUE(second.registerNeuron(12, "hot", "cold").ok());
    EXPECT_TRUE(registry->metagraph(12).value().hasHotkey("hot"));
}

TEST_F(RegistryTest, MistypedRecordsAreSerializationErrors) {
    ASSERT_TRUE(registry->createSubnet(12, "owner").ok());
    ASSERT_TRUE(registry->registerNeuron(12, "validator", "cold").ok());
    ASSERT_TRUE(registry->setWeights(12, "validator", {0}, {1.0}).ok());
    
    database::Database raw;
    ASSERT_TRUE(raw.open(path));
    database::WriteBatch batch;
    batch.put("weights/12/0", R"({"uids": "zero", "weights": [65535]})");
    batch.put("neuron/12/00000", R"({"uid": 0, "hotkey": 7, "stake": "lots"})");
    ASSERT_TRUE(raw.write(batch));
    
    auto w = registry->weights(12, 0);
    ASSERT_TRUE(w.failed());
    EXPECT_EQ(w.error().code, ErrorCode::SERIALIZATION_ERROR);
    
    auto mg = registry->metagraph(12);
    ASSERT_TRUE(mg.failed());
    EXPECT_EQ(mg.error().code, ErrorCode::SERIALIZATION_ERROR);
}

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "subvault_test_database";
        std::filesystem::remove_all(testDir);
        std::filesystem::create_directories(testDir);
        ASSERT_TRUE(db.open((testDir / "kv.db").string()));
    }
    
    void TearDown() override {
        db.close();
        std::filesystem::remove_all(testDir);
    }
    
    std::filesystem::path testDir;
    database::Database db;
};

TEST_F(DatabaseTest, MissingKeyIsEmpty) {
    EXPECT_TRUE(db.isOpen());
    EXPECT_TRUE(db.get("absent").empty());
    EXPECT_EQ(db.getString("absent"), "");
}

TEST_F(DatabaseTest, BatchWritesAllAndEmpties) {
    database::WriteBatch batch;
    batch.put("n/1", "x");
    batch.put("n/2", "y");
    batch.put("n0", "outside");
    batch.put("other", "z");
    ASSERT_TRUE(db.write(batch));
    EXPECT_EQ(db.getString("n/2"), "y");
    
    std::vector<std::string> seen;
    db.forEach("n/", [&](const std::string& key, const std::vector<uint8_t>&) {
        seen.push_back(key);
        return true;
    });
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "n/1");
    EXPECT_EQ(seen[1], "n/2");
    
    // An emptied batch writes nothing the second time.
    batch.put("n/1", "replaced");
    ASSERT_TRUE(db.write(batch));
    EXPECT_EQ(db.getString("n/1"), "replaced");
    EXPECT_EQ(db.getString("n/2"), "y");
}

TEST_F(DatabaseTest, ForEachStopsWhenAsked) {
    database::WriteBatch batch;
    for (int i = 0; i < 5; i++) batch.put("k/" + std::to_string(i), std::to_string(i));
    ASSERT_TRUE(db.write(batch));
    int visited = 0;
    db.forEach("k/", [&](const std::string&, const std::vector<uint8_t>&) {
        return ++visited < 2;
    });
    EXPECT_EQ(visited, 2);
}

TEST_F(DatabaseTest, RollbackDiscardsBatchInTransaction) {
    ASSERT_TRUE(db.beginTransaction());
    database::WriteBatch temp;
    temp.put("temp", "v");
    ASSERT_TRUE(db.write(temp));
    ASSERT_TRUE(db.rollbackTransaction());
    EXPECT_TRUE(db.get("temp").empty());
    
    ASSERT_TRUE(db.beginTransaction());
    database::WriteBatch kept;
    kept.put("kept", "v");
    ASSERT_TRUE(db.write(kept));
    ASSERT_TRUE(db.commitTransaction());
    EXPECT_EQ(db.getString("kept"), "v");
}
