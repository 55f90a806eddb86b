#include <gtest/gtest.h>
#include "network/axon.h"
#include "network/dendrite.h"
#include "core/wallet.h"
#include <filesystem>
#include <thread>
#include <chrono>
#include <cstring>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

using namespace subvault;
using namespace subvault::network;

class TransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "subvault_test_transport";
        std::filesystem::remove_all(testDir);
        
        core::WalletConfig wc;
        wc.name = "client";
        wc.hotkey = "hot";
        wc.path = testDir.string();
        wallet = std::make_unique<core::Wallet>(wc);
        ASSERT_TRUE(wallet->create().ok());
        
        AxonConfig cfg;
        cfg.port = 0;
        cfg.maxWorkers = 2;
        axon = std::make_unique<Axon>(cfg);
    }
    
    void TearDown() override {
        if (axon) axon->stop();
        axon.reset();
        std::filesystem::remove_all(testDir);
    }
    
    core::AxonInfo axonInfo() const {
        core::AxonInfo info;
        info.ip = "127.0.0.1";
        info.port = axon->port();
        info.hotkey = "axon-hotkey";
        return info;
    }
    
    std::filesystem::path testDir;
    std::unique_ptr<core::Wallet> wallet;
    std::unique_ptr<Axon> axon;
};

TEST_F(TransportTest, BindsEphemeralPort) {
    ASSERT_TRUE(axon->start());
    EXPECT_TRUE(axon->isRunning());
    EXPECT_NE(axon->port(), 0);
    axon->stop();
    EXPECT_FALSE(axon->isRunning());
}

TEST_F(TransportTest, ExchangeRunsHandler) {
    axon->attach(CMD_RETRIEVE, [](const std::string&, const Message& req) {
        return Message::make(CMD_RESPONSE, "echo:" + req.body());
    });
    ASSERT_TRUE(axon->start());
    
    auto reply = exchange("127.0.0.1", axon->port(), Message::make(CMD_RETRIEVE, "ping"), 5.0);
    ASSERT_TRUE(reply.ok()) << reply.error().describe();
    EXPECT_EQ(reply.value().command, CMD_RESPONSE);
    EXPECT_EQ(reply.value().body(), "echo:ping");
    EXPECT_GE(axon->getStats().requestsHandled, 1u);
}

TEST_F(TransportTest, DendriteSignsRequests) {
    std::string seenMessage;
    crypto::Signature seenSig{};
    std::string seenHotkey;
    axon->attach(CMD_RETRIEVE, [&](const std::string&, const Message& msg) {
        auto req = RetrieveRequest::fromJson(msg.body());
        if (!req) return Message::make(CMD_RESPONSE, RetrieveResponse::failure(StatusCode::BAD_REQUEST, "").toJson());
        auto bytes = crypto::fromHex(req->signature);
        bool ok = bytes.size() == crypto::SIGNATURE_SIZE;
        if (ok) {
            std::memcpy(seenSig.data(), bytes.data(), bytes.size());
            ok = core::Wallet::verify(req->signingMessage(), seenSig, req->dendriteHotkey);
        }
        if (!ok || req->axonHotkey != "axon-hotkey") {
            return Message::make(CMD_RESPONSE, RetrieveResponse::failure(StatusCode::UNAUTHORIZED, "").toJson());
        }
        return Message::make(CMD_RESPONSE, RetrieveResponse::success("data-" + req->key).toJson());
    });
    ASSERT_TRUE(axon->start());
    
    Dendrite dendrite(*wallet);
    RetrieveRequest req;
    req.key = "42";
    auto data = dendrite.query(axonInfo(), req, 5.0);
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(*data, "data-42");
    
    auto resp = dendrite.call(axonInfo(), req, 5.0);
    ASSERT_TRUE(resp.ok());
    EXPECT_TRUE(resp.value().ok());
}

TEST_F(TransportTest, QueryReturnsNulloptOnFailure) {
    axon->attach(CMD_RETRIEVE, [](const std::string&, const Message&) {
        return Message::make(CMD_RESPONSE, RetrieveResponse::failure(StatusCode::NOT_FOUND, "none").toJson());
    });
    ASSERT_TRUE(axon->start());
    Dendrite dendrite(*wallet);
    RetrieveRequest req;
    req.key = "1";
    EXPECT_FALSE(dendrite.query(axonInfo(), req, 5.0).has_value());
    
    core::AxonInfo closed = axonInfo();
    uint16_t port = axon->port();
    axon->stop();
    closed.port = port;
    EXPECT_FALSE(dendrite.query(closed, req, 1.0).has_value());
}

TEST_F(TransportTest, SilentAxonTimesOut) {
    axon->attach(CMD_RETRIEVE, [](const std::string&, const Message&) {
        return Message();
    });
    ASSERT_TRUE(axon->start());
    auto start = std::chrono::steady_clock::now();
    auto reply = exchange("127.0.0.1", axon->port(), Message::make(CMD_RETRIEVE, "x"), 0.5);
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(reply.failed());
    EXPECT_EQ(reply.error().code, ErrorCode::TIMEOUT);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST_F(TransportTest, NoncesStrictlyIncrease) {
    Dendrite dendrite(*wallet);
    uint64_t prev = dendrite.nextNonce();
    for (int i = 0; i < 1000; i++) {
        uint64_t n = dendrite.nextNonce();
        EXPECT_GT(n, prev);
        prev = n;
    }
}

TEST_F(TransportTest, GarbageFrameBansPeer) {
    axon->attach(CMD_RETRIEVE, [](const std::string&, const Message& req) {
        return Message::make(CMD_RESPONSE, req.body());
    });
    ASSERT_TRUE(axon->start());
    
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(axon->port());
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    ASSERT_EQ(connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)), 0);
    std::vector<uint8_t> junk(64, 0x5a);
    ASSERT_EQ(send(fd, junk.data(), junk.size(), MSG_NOSIGNAL), static_cast<ssize_t>(junk.size()));
    
    for (int i = 0; i < 50 && !axon->isBanned("127.0.0.1"); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    close(fd);
    EXPECT_TRUE(axon->isBanned("127.0.0.1"));
    EXPECT_GE(axon->getStats().violations, 1u);
    EXPECT_TRUE(exchange("127.0.0.1", axon->port(), Message::make(CMD_RETRIEVE, "x"), 1.0).failed());
    
    EXPECT_TRUE(axon->unban("127.0.0.1"));
    auto reply = exchange("127.0.0.1", axon->port(), Message::make(CMD_RETRIEVE, "ok"), 5.0);
    ASSERT_TRUE(reply.ok()) << reply.error().describe();
    EXPECT_EQ(reply.value().body(), "ok");
}
