#pragma once

#include "keys.h"
#include <string>
#include <optional>

namespace subvault {
namespace crypto {

constexpr uint8_t ADDRESS_PREFIX = 0x2A;
constexpr size_t ADDRESS_CHECKSUM_SIZE = 2;

// ss58-style hotkey/coldkey address:
// base58(prefix || pubkey || doubleSha256(prefix || pubkey)[0..2]).
class Address {
public:
    static std::string fromPublicKey(const PublicKey& publicKey);
    static std::optional<PublicKey> toPublicKey(const std::string& address);
    static bool isValid(const std::string& address);
};

}
}
