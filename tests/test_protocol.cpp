#include <gtest/gtest.h>
#include "network/protocol.h"
#include "crypto/crypto.h"
#include <cstring>

using namespace subvault;
using namespace subvault::network;

TEST(ProtocolTest, FrameLayout) {
    Message msg = Message::make(CMD_RETRIEVE, "{}");
    auto bytes = msg.serialize();
    ASSERT_EQ(bytes.size(), 24u + 2u);
    EXPECT_EQ(bytes[0], 'S');
    EXPECT_EQ(bytes[1], 'V');
    EXPECT_EQ(bytes[2], 'L');
    EXPECT_EQ(bytes[3], 'T');
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(bytes.data() + 4)), "retrieve");
    
    auto decoded = Message::deserialize(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->command, CMD_RETRIEVE);
    EXPECT_EQ(decoded->body(), "{}");
}

TEST(ProtocolTest, ParseFrameStreaming) {
    auto a = Message::make(CMD_RETRIEVE, "first").serialize();
    auto b = Message::make(CMD_RESPONSE, "second").serialize();
    std::vector<uint8_t> stream(a);
    stream.insert(stream.end(), b.begin(), b.end());
    
    Message out;
    size_t consumed = 0;
    EXPECT_EQ(parseFrame(stream.data(), 10, out, consumed), FrameStatus::INCOMPLETE);
    EXPECT_EQ(parseFrame(stream.data(), a.size() - 1, out, consumed), FrameStatus::INCOMPLETE);
    ASSERT_EQ(parseFrame(stream.data(), stream.size(), out, consumed), FrameStatus::OK);
    EXPECT_EQ(consumed, a.size());
    EXPECT_EQ(out.body(), "first");
    ASSERT_EQ(parseFrame(stream.data() + consumed, stream.size() - consumed, out, consumed), FrameStatus::OK);
    EXPECT_EQ(out.command, CMD_RESPONSE);
}

TEST(ProtocolTest, ParseFrameViolations) {
    auto good = Message::make(CMD_RETRIEVE, "payload").serialize();
    Message out;
    size_t consumed = 0;
    
    auto badMagic = good;
    badMagic[0] ^= 0xff;
    EXPECT_EQ(parseFrame(badMagic.data(), badMagic.size(), out, consumed), FrameStatus::BAD_MAGIC);
    
    auto badCommand = good;
    badCommand[4] = 0;
    EXPECT_EQ(parseFrame(badCommand.data(), badCommand.size(), out, consumed), FrameStatus::BAD_COMMAND);
    
    auto badChecksum = good;
    badChecksum.back() ^= 0x01;
    EXPECT_EQ(parseFrame(badChecksum.data(), badChecksum.size(), out, consumed), FrameStatus::BAD_CHECKSUM);
    
    MessageHeader hdr;
    std::memcpy(&hdr, good.data(), sizeof(hdr));
    hdr.length = static_cast<uint32_t>(MAX_MESSAGE_SIZE + 1);
    auto tooLarge = good;
    std::memcpy(tooLarge.data(), &hdr, sizeof(hdr));
    EXPECT_EQ(parseFrame(tooLarge.data(), tooLarge.size(), out, consumed), FrameStatus::TOO_LARGE);
    
    EXPECT_STREQ(frameStatusName(FrameStatus::BAD_CHECKSUM), "bad_checksum");
}

TEST(ProtocolTest, RetrieveRequestJson) {
    RetrieveRequest req;
    req.key = "17";
    req.dendriteHotkey = "dend";
    req.axonHotkey = "axon";
    req.nonce = 1234567890123ull;
    req.signature = "abcd";
    
    auto parsed = RetrieveRequest::fromJson(req.toJson());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->key, "17");
    EXPECT_EQ(parsed->nonce, req.nonce);
    EXPECT_EQ(parsed->signature, "abcd");
    
    EXPECT_EQ(req.signingMessage(), "1234567890123.dend.axon." + crypto::sha256Hex("17"));
    
    EXPECT_FALSE(RetrieveRequest::fromJson("not json").has_value());
    EXPECT_FALSE(RetrieveRequest::fromJson("{\"key\":\"1\"}").has_value());
    EXPECT_FALSE(RetrieveRequest::fromJson(
        "{\"key\":1,\"dendrite_hotkey\":\"a\",\"axon_hotkey\":\"b\",\"nonce\":1,\"signature\":\"c\"}").has_value());
}

TEST(ProtocolTest, RetrieveResponseJson) {
    auto ok = RetrieveResponse::fromJson(RetrieveResponse::success("chunk").toJson());
    ASSERT_TRUE(ok.has_value());
    EXPECT_TRUE(ok->ok());
    EXPECT_EQ(ok->data, "chunk");
    
    auto nf = RetrieveResponse::fromJson(RetrieveResponse::failure(StatusCode::NOT_FOUND, "gone").toJson());
    ASSERT_TRUE(nf.has_value());
    EXPECT_FALSE(nf->ok());
    EXPECT_EQ(nf->status, 404);
    EXPECT_EQ(nf->message, "gone");
}
