#include <gtest/gtest.h>
#include "crypto/crypto.h"
#include "crypto/keys.h"
#include "crypto/address.h"
#include <set>

using namespace subvault::crypto;

TEST(CryptoTest, Sha256KnownVectors) {
    EXPECT_EQ(sha256Hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CryptoTest, HexRoundTripAndRejects) {
    std::vector<uint8_t> bytes = {0x00, 0x01, 0xab, 0xff};
    EXPECT_EQ(toHex(bytes), "0001abff");
    EXPECT_EQ(fromHex("0001ABff"), bytes);
    EXPECT_TRUE(fromHex("abc").empty());
    EXPECT_TRUE(fromHex("zz").empty());
}

TEST(CryptoTest, Base58KeepsLeadingZeros) {
    std::vector<uint8_t> data = {0x00, 0x00, 0x01, 0x02};
    std::string encoded = base58Encode(data);
    EXPECT_EQ(encoded.substr(0, 2), "11");
    EXPECT_EQ(base58Decode(encoded), data);
    EXPECT_TRUE(base58Decode("0OIl").empty());
}

TEST(CryptoTest, RandomRangeStaysInBounds) {
    std::set<uint64_t> seen;
    for (int i = 0; i < 500; i++) {
        uint64_t v = randomRange(1, 4);
        EXPECT_GE(v, 1u);
        EXPECT_LE(v, 4u);
        seen.insert(v);
    }
    EXPECT_EQ(seen.size(), 4u);
    EXPECT_EQ(randomRange(7, 7), 7u);
}

TEST(CryptoTest, ConstantTimeEquals) {
    EXPECT_TRUE(constantTimeEquals("abcd", "abcd"));
    EXPECT_FALSE(constantTimeEquals("abcd", "abce"));
    EXPECT_FALSE(constantTimeEquals("abcd", "abc"));
}

TEST(KeypairTest, SignAndVerify) {
    Keypair kp = Keypair::generate();
    ASSERT_TRUE(kp.valid());
    Hash256 h = sha256(std::string("challenge"));
    Signature sig = kp.sign(h);
    EXPECT_TRUE(Keypair::verify(h, sig, kp.publicKey()));
    
    Hash256 other = sha256(std::string("challenge2"));
    EXPECT_FALSE(Keypair::verify(other, sig, kp.publicKey()));
    
    Keypair stranger = Keypair::generate();
    EXPECT_FALSE(Keypair::verify(h, sig, stranger.publicKey()));
}

TEST(KeypairTest, FromSecretIsDeterministic) {
    Keypair kp = Keypair::generate();
    std::vector<uint8_t> secret(kp.secret().begin(), kp.secret().end());
    auto restored = Keypair::fromSecret(secret);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->publicKey(), kp.publicKey());
    
    EXPECT_FALSE(Keypair::fromSecret(std::vector<uint8_t>(32, 0)).has_value());
    EXPECT_FALSE(Keypair::fromSecret(std::vector<uint8_t>(31, 1)).has_value());
}

TEST(AddressTest, RoundTripAndChecksum) {
    Keypair kp = Keypair::generate();
    std::string addr = Address::fromPublicKey(kp.publicKey());
    EXPECT_TRUE(Address::isValid(addr));
    auto pub = Address::toPublicKey(addr);
    ASSERT_TRUE(pub.has_value());
    EXPECT_EQ(*pub, kp.publicKey());
    
    std::string tampered = addr;
    tampered[tampered.size() / 2] = tampered[tampered.size() / 2] == 'A' ? 'B' : 'A';
    EXPECT_FALSE(Address::isValid(tampered));
    EXPECT_FALSE(Address::isValid(""));
}
