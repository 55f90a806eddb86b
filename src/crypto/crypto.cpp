#include "crypto/crypto.h"
#include <cstring>
#include <random>
#include <mutex>
#include <algorithm>

namespace subvault {
namespace crypto {

static inline uint32_t rotr32(uint32_t x, int n) { return (x >> n) | (x << (32 - n)); }
static inline uint32_t ch(uint32_t x, uint32_t y, uint32_t z) { return (x & y) ^ (~x & z); }
static inline uint32_t maj(uint32_t x, uint32_t y, uint32_t z) { return (x & y) ^ (x & z) ^ (y & z); }
static inline uint32_t sig0(uint32_t x) { return rotr32(x, 2) ^ rotr32(x, 13) ^ rotr32(x, 22); }
static inline uint32_t sig1(uint32_t x) { return rotr32(x, 6) ^ rotr32(x, 11) ^ rotr32(x, 25); }
static inline uint32_t ep0(uint32_t x) { return rotr32(x, 7) ^ rotr32(x, 18) ^ (x >> 3); }
static inline uint32_t ep1(uint32_t x) { return rotr32(x, 17) ^ rotr32(x, 19) ^ (x >> 10); }

static const uint32_t K256[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

static const char* BASE58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

static void sha256Transform(uint32_t state[8], const uint8_t block[64]) {
    uint32_t w[64];
    for (int i = 0; i < 16; i++) {
        w[i] = (static_cast<uint32_t>(block[i*4]) << 24) | (static_cast<uint32_t>(block[i*4+1]) << 16) |
               (static_cast<uint32_t>(block[i*4+2]) << 8) | block[i*4+3];
    }
    for (int i = 16; i < 64; i++) {
        w[i] = ep1(w[i-2]) + w[i-7] + ep0(w[i-15]) + w[i-16];
    }
    
    uint32_t a = state[0], b = state[1], c = state[2], d = state[3];
    uint32_t e = state[4], f = state[5], g = state[6], h = state[7];
    
    for (int i = 0; i < 64; i++) {
        uint32_t t1 = h + sig1(e) + ch(e, f, g) + K256[i] + w[i];
        uint32_t t2 = sig0(a) + maj(a, b, c);
        h = g; g = f; f = e; e = d + t1;
        d = c; c = b; b = a; a = t1 + t2;
    }
    
    state[0] += a; state[1] += b; state[2] += c; state[3] += d;
    state[4] += e; state[5] += f; state[6] += g; state[7] += h;
}

Hash256 sha256(const uint8_t* data, size_t len) {
    uint32_t state[8] = {
        0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
        0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
    };
    
    uint8_t block[64];
    size_t i = 0;
    
    while (i + 64 <= len) {
        sha256Transform(state, data + i);
        i += 64;
    }
    
    size_t rem = len - i;
    if (rem > 0) std::memcpy(block, data + i, rem);
    block[rem++] = 0x80;
    
    if (rem > 56) {
        std::memset(block + rem, 0, 64 - rem);
        sha256Transform(state, block);
        rem = 0;
    }
    
    std::memset(block + rem, 0, 56 - rem);
    uint64_t bits = static_cast<uint64_t>(len) * 8;
    for (int j = 0; j < 8; j++) {
        block[56 + j] = (bits >> (56 - j * 8)) & 0xff;
    }
    sha256Transform(state, block);
    
    Hash256 hash;
    for (int j = 0; j < 8; j++) {
        hash[j*4] = (state[j] >> 24) & 0xff;
        hash[j*4+1] = (state[j] >> 16) & 0xff;
        hash[j*4+2] = (state[j] >> 8) & 0xff;
        hash[j*4+3] = state[j] & 0xff;
    }
    return hash;
}

Hash256 sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

Hash256 sha256(const std::string& data) {
    return sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Hash256 doubleSha256(const uint8_t* data, size_t len) {
    Hash256 first = sha256(data, len);
    return sha256(first.data(), first.size());
}

std::string sha256Hex(const std::string& data) {
    Hash256 hash = sha256(data);
    return toHex(hash.data(), hash.size());
}

bool constantTimeCompare(const uint8_t* a, const uint8_t* b, size_t len) {
    uint8_t result = 0;
    for (size_t i = 0; i < len; i++) {
        result |= a[i] ^ b[i];
    }
    return result == 0;
}

bool constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return constantTimeCompare(reinterpret_cast<const uint8_t*>(a.data()),
                               reinterpret_cast<const uint8_t*>(b.data()), a.size());
}

std::vector<uint8_t> randomBytes(size_t count) {
    static std::mutex rngMutex;
    static std::random_device rd;
    std::vector<uint8_t> bytes(count);
    std::lock_guard<std::mutex> lock(rngMutex);
    size_t i = 0;
    while (i < count) {
        uint32_t v = rd();
        for (int k = 0; k < 4 && i < count; k++, i++) {
            bytes[i] = static_cast<uint8_t>(v >> (k * 8));
        }
    }
    return bytes;
}

uint64_t randomRange(uint64_t lo, uint64_t hi) {
    if (hi <= lo) return lo;
    static std::mutex rngMutex;
    static std::mt19937_64 gen(std::random_device{}());
    std::lock_guard<std::mutex> lock(rngMutex);
    std::uniform_int_distribution<uint64_t> dist(lo, hi);
    return dist(gen);
}

void secureZero(void* ptr, size_t len) {
    volatile uint8_t* p = static_cast<volatile uint8_t*>(ptr);
    while (len--) *p++ = 0;
}

std::string toHex(const uint8_t* data, size_t len) {
    static const char hex[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        result += hex[data[i] >> 4];
        result += hex[data[i] & 0x0f];
    }
    return result;
}

std::string toHex(const std::vector<uint8_t>& data) {
    return toHex(data.data(), data.size());
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::vector<uint8_t> fromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) return {};
    std::vector<uint8_t> result;
    result.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexValue(hex[i]);
        int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) return {};
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return result;
}

std::string base58Encode(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> digits(data.size() * 138 / 100 + 1, 0);
    size_t digitsLen = 0;
    
    for (size_t i = 0; i < data.size(); i++) {
        uint32_t carry = data[i];
        for (size_t j = 0; j < digitsLen; j++) {
            carry += static_cast<uint32_t>(digits[j]) << 8;
            digits[j] = carry % 58;
            carry /= 58;
        }
        while (carry > 0) {
            digits[digitsLen++] = carry % 58;
            carry /= 58;
        }
    }
    
    std::string result;
    for (size_t i = 0; i < data.size() && data[i] == 0; i++) {
        result += BASE58_ALPHABET[0];
    }
    for (size_t i = digitsLen; i-- > 0; ) {
        result += BASE58_ALPHABET[digits[i]];
    }
    return result;
}

std::vector<uint8_t> base58Decode(const std::string& str) {
    std::vector<uint8_t> bytes(str.size() * 733 / 1000 + 1, 0);
    size_t bytesLen = 0;
    
    for (char c : str) {
        const char* pos = std::strchr(BASE58_ALPHABET, c);
        if (c == '\0' || pos == nullptr) return {};
        
        uint32_t carry = static_cast<uint32_t>(pos - BASE58_ALPHABET);
        for (size_t i = 0; i < bytesLen; i++) {
            carry += static_cast<uint32_t>(bytes[i]) * 58;
            bytes[i] = carry & 0xff;
            carry >>= 8;
        }
        while (carry > 0) {
            bytes[bytesLen++] = carry & 0xff;
            carry >>= 8;
        }
    }
    
    std::vector<uint8_t> result;
    for (char c : str) {
        if (c != BASE58_ALPHABET[0]) break;
        result.push_back(0);
    }
    for (size_t i = bytesLen; i-- > 0; ) {
        result.push_back(bytes[i]);
    }
    return result;
}

}
}
