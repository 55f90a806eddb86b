#pragma once

#include <string>
#include <vector>
#include <array>
#include <cstdint>

namespace subvault {
namespace crypto {

constexpr size_t SHA256_SIZE = 32;

using Hash256 = std::array<uint8_t, SHA256_SIZE>;

Hash256 sha256(const uint8_t* data, size_t len);
Hash256 sha256(const std::vector<uint8_t>& data);
Hash256 sha256(const std::string& data);
Hash256 doubleSha256(const uint8_t* data, size_t len);

// Lowercase hex digest, the form chunk hashes are stored and compared in.
std::string sha256Hex(const std::string& data);

bool constantTimeCompare(const uint8_t* a, const uint8_t* b, size_t len);
bool constantTimeEquals(const std::string& a, const std::string& b);

std::vector<uint8_t> randomBytes(size_t count);
uint64_t randomRange(uint64_t lo, uint64_t hi);
void secureZero(void* ptr, size_t len);

std::string toHex(const uint8_t* data, size_t len);
std::string toHex(const std::vector<uint8_t>& data);
template<size_t N>
std::string toHex(const std::array<uint8_t, N>& data) {
    return toHex(data.data(), N);
}
// Empty result on odd length or a non-hex character.
std::vector<uint8_t> fromHex(const std::string& hex);

std::string base58Encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> base58Decode(const std::string& str);

}
}
