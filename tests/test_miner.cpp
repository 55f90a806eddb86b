#include <gtest/gtest.h>
#include "core/miner.h"
#include "core/registry.h"
#include "core/wallet.h"
#include "network/dendrite.h"
#include "crypto/crypto.h"
#include <filesystem>
#include <memory>
#include <thread>
#include <chrono>

using namespace subvault;
using namespace subvault::core;
using network::RetrieveRequest;

class MinerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "subvault_test_miner";
        std::filesystem::remove_all(testDir);
        
        config.role = Role::MINER;
        config.netuid = 12;
        config.endpoint = parseEndpoint(DEFAULT_CHAIN_ENDPOINT).value();
        config.registryDir = (testDir / "chain").string();
        config.selfRegister = true;
        config.wallet = WalletConfig{"minerwallet", "minerhot", (testDir / "wallets").string()};
        config.createWallet = true;
        config.axon.port = 0;
        config.axon.maxWorkers = 2;
        config.dbRootPath = (testDir / "db").string();
        config.chunkSize = 64;
        config.generateWorkers = 2;
        config.minerMaxChunks = 50;
        config.resyncInterval = 1;
        
        registry = std::make_unique<Registry>(config.registryPath());
        ASSERT_TRUE(registry->open().ok());
        ASSERT_TRUE(registry->createSubnet(12, "owner").ok());
        
        validatorWallet = makeWallet("valwallet", "valhot");
        ASSERT_TRUE(registry->registerNeuron(12, validatorWallet->hotkeyAddress(), validatorWallet->coldkeyAddress()).ok());
    }
    
    void TearDown() override {
        if (miner) miner->stop();
        miner.reset();
        registry.reset();
        std::filesystem::remove_all(testDir);
    }
    
    std::unique_ptr<Wallet> makeWallet(const std::string& name, const std::string& hotkey) {
        auto w = std::make_unique<Wallet>(WalletConfig{name, hotkey, (testDir / "wallets").string()});
        EXPECT_TRUE(w->create().ok());
        return w;
    }
    
    RetrieveRequest signedRequest(const Wallet& caller, const std::string& key, uint64_t nonce) {
        RetrieveRequest req;
        req.key = key;
        req.dendriteHotkey = caller.hotkeyAddress();
        req.axonHotkey = miner->wallet().hotkeyAddress();
        req.nonce = nonce;
        req.signature = crypto::toHex(caller.sign(req.signingMessage()));
        return req;
    }
    
    void startMiner() {
        miner = std::make_unique<Miner>(config);
        auto r = miner->start();
        ASSERT_TRUE(r.ok()) << r.error().describe();
    }
    
    std::filesystem::path testDir;
    NeuronConfig config;
    std::unique_ptr<Registry> registry;
    std::unique_ptr<Wallet> validatorWallet;
    std::unique_ptr<Miner> miner;
};

TEST_F(MinerTest, RefusesToStartUnregistered) {
    config.selfRegister = false;
    miner = std::make_unique<Miner>(config);
    auto r = miner->start();
    ASSERT_TRUE(r.failed());
    EXPECT_EQ(r.error().code, ErrorCode::NOT_REGISTERED);
    EXPECT_NE(r.error().message.find("register"), std::string::npos);
}

TEST_F(MinerTest, MissingWalletIsStartupError) {
    config.createWallet = false;
    config.wallet.name = "nobody";
    miner = std::make_unique<Miner>(config);
    auto r = miner->start();
    ASSERT_TRUE(r.failed());
    EXPECT_EQ(r.error().code, ErrorCode::FILE_NOT_FOUND);
}

TEST_F(MinerTest, StartAllocatesAndPublishesAxon) {
    startMiner();
    auto allocs = miner->allocations();
    ASSERT_EQ(allocs.size(), 1u);
    EXPECT_EQ(allocs[0].validator, validatorWallet->hotkeyAddress());
    EXPECT_EQ(allocs[0].nChunks, 50u);
    EXPECT_FALSE(allocs[0].hashOnly);
    EXPECT_TRUE(std::filesystem::exists(allocs[0].path));
    
    auto mg = registry->metagraph(12).value();
    auto uid = mg.uidOf(miner->wallet().hotkeyAddress());
    ASSERT_TRUE(uid.has_value());
    EXPECT_EQ(mg.axons[*uid].port, miner->axonPort());
    EXPECT_EQ(mg.axons[*uid].ip, "127.0.0.1");
}

TEST_F(MinerTest, RetrieveServesChunk) {
    startMiner();
    Allocation alloc = miner->allocations().at(0);
    auto resp = miner->handleRetrieve(signedRequest(*validatorWallet, "7", 1));
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.data, chunkData(alloc.seed, 7, 64));
}

TEST_F(MinerTest, RetrieveRejections) {
    startMiner();
    
    auto wrongAxon = signedRequest(*validatorWallet, "1", 10);
    wrongAxon.axonHotkey = validatorWallet->hotkeyAddress();
    wrongAxon.signature = crypto::toHex(validatorWallet->sign(wrongAxon.signingMessage()));
    EXPECT_EQ(miner->handleRetrieve(wrongAxon).status, 400);
    
    auto stranger = makeWallet("stranger", "hot");
    EXPECT_EQ(miner->handleRetrieve(signedRequest(*stranger, "1", 11)).status, 403);
    
    auto forged = signedRequest(*validatorWallet, "1", 12);
    forged.key = "2";
    EXPECT_EQ(miner->handleRetrieve(forged).status, 401);
    
    EXPECT_EQ(miner->handleRetrieve(signedRequest(*validatorWallet, "1", 20)).status, 200);
    EXPECT_EQ(miner->handleRetrieve(signedRequest(*validatorWallet, "1", 20)).status, 401);
    EXPECT_EQ(miner->handleRetrieve(signedRequest(*validatorWallet, "1", 19)).status, 401);
    
    EXPECT_EQ(miner->handleRetrieve(signedRequest(*validatorWallet, "abc", 21)).status, 400);
    EXPECT_EQ(miner->handleRetrieve(signedRequest(*validatorWallet, "51", 22)).status, 404);
    EXPECT_EQ(miner->handleRetrieve(signedRequest(*validatorWallet, "0", 23)).status, 404);
}

TEST_F(MinerTest, StakeFloorExcludesValidators) {
    config.minValidatorStake = 5.0;
    startMiner();
    EXPECT_TRUE(miner->allocations().empty());
    EXPECT_EQ(miner->handleRetrieve(signedRequest(*validatorWallet, "1", 1)).status, 403);
    
    ASSERT_TRUE(registry->setStake(12, validatorWallet->hotkeyAddress(), 10.0).ok());
    ASSERT_TRUE(miner->resyncMetagraph().ok());
    ASSERT_TRUE(miner->refreshAllocations().ok());
    ASSERT_EQ(miner->allocations().size(), 1u);
    std::string path = miner->allocations()[0].path;
    EXPECT_EQ(miner->handleRetrieve(signedRequest(*validatorWallet, "1", 2)).status, 200);
    
    ASSERT_TRUE(registry->setStake(12, validatorWallet->hotkeyAddress(), 1.0).ok());
    ASSERT_TRUE(miner->resyncMetagraph().ok());
    ASSERT_TRUE(miner->refreshAllocations().ok());
    EXPECT_TRUE(miner->allocations().empty());
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(MinerTest, NewValidatorGetsAllocation) {
    startMiner();
    auto second = makeWallet("valwallet", "valhot2");
    ASSERT_TRUE(registry->registerNeuron(12, second->hotkeyAddress(), second->coldkeyAddress()).ok());
    ASSERT_TRUE(miner->resyncMetagraph().ok());
    ASSERT_TRUE(miner->refreshAllocations().ok());
    EXPECT_EQ(miner->allocations().size(), 2u);
    EXPECT_EQ(miner->handleRetrieve(signedRequest(*second, "3", 1)).status, 200);
}

TEST_F(MinerTest, DepartedStoreIsRemovedBeforeNewOnesAreGenerated) {
    config.minValidatorStake = 5.0;
    ASSERT_TRUE(registry->setStake(12, validatorWallet->hotkeyAddress(), 10.0).ok());
    startMiner();
    ASSERT_EQ(miner->allocations().size(), 1u);
    std::string oldPath = miner->allocations()[0].path;
    
    auto replacement = makeWallet("valwallet", "valhot2");
    ASSERT_TRUE(registry->registerNeuron(12, replacement->hotkeyAddress(), replacement->coldkeyAddress()).ok());
    ASSERT_TRUE(registry->setStake(12, replacement->hotkeyAddress(), 10.0).ok());
    ASSERT_TRUE(registry->setStake(12, validatorWallet->hotkeyAddress(), 1.0).ok());
    
    // A directory in the way makes the new store fail to generate.
    std::string newPath = allocationPath(config.dbRootPath, config.wallet.name, config.wallet.hotkey,
                                         miner->wallet().hotkeyAddress(), replacement->hotkeyAddress());
    std::filesystem::create_directories(newPath);
    
    ASSERT_TRUE(miner->resyncMetagraph().ok());
    EXPECT_TRUE(miner->refreshAllocations().failed());
    EXPECT_FALSE(std::filesystem::exists(oldPath));
    EXPECT_TRUE(miner->allocations().empty());
    EXPECT_EQ(miner->handleRetrieve(signedRequest(*validatorWallet, "1", 1)).status, 403);
    
    // The next pass retries the unchanged validator set.
    std::filesystem::remove_all(newPath);
    ASSERT_TRUE(miner->refreshAllocations().ok());
    ASSERT_EQ(miner->allocations().size(), 1u);
    EXPECT_EQ(miner->allocations()[0].validator, replacement->hotkeyAddress());
    EXPECT_EQ(miner->handleRetrieve(signedRequest(*replacement, "4", 1)).status, 200);
}

TEST_F(MinerTest, RunLoopPicksUpNewValidators) {
    startMiner();
    ASSERT_EQ(miner->allocations().size(), 1u);
    auto second = makeWallet("valwallet", "valhot2");
    ASSERT_TRUE(registry->registerNeuron(12, second->hotkeyAddress(), second->coldkeyAddress()).ok());
    
    std::thread loop([this] { miner->run(); });
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (miner->allocations().size() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    miner->stop();
    loop.join();
    
    EXPECT_EQ(miner->allocations().size(), 2u);
    EXPECT_EQ(miner->handleRetrieve(signedRequest(*second, "2", 1)).status, 200);
}

TEST_F(MinerTest, ServesOverTheWire) {
    startMiner();
    auto mg = registry->metagraph(12).value();
    auto uid = mg.uidOf(miner->wallet().hotkeyAddress()).value();
    
    network::Dendrite dendrite(*validatorWallet);
    RetrieveRequest req;
    req.key = "50";
    auto data = dendrite.query(mg.axons[uid], req, 5.0);
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(*data, chunkData(miner->allocations()[0].seed, 50, 64));
    
    req.key = "51";
    auto miss = dendrite.call(mg.axons[uid], req, 5.0);
    ASSERT_TRUE(miss.ok());
    EXPECT_EQ(miss.value().status, 404);
}
