#pragma once

#include "crypto.h"
#include <string>
#include <vector>
#include <array>
#include <cstdint>
#include <optional>

namespace subvault {
namespace crypto {

constexpr size_t PRIVATE_KEY_SIZE = 32;
constexpr size_t PUBLIC_KEY_SIZE = 33;
constexpr size_t SIGNATURE_SIZE = 64;

using PrivateKey = std::array<uint8_t, PRIVATE_KEY_SIZE>;
using PublicKey = std::array<uint8_t, PUBLIC_KEY_SIZE>;
using Signature = std::array<uint8_t, SIGNATURE_SIZE>;

class Keypair {
public:
    Keypair() = default;
    ~Keypair();

    Keypair(const Keypair& other) = default;
    Keypair& operator=(const Keypair& other) = default;

    static Keypair generate();
    // nullopt when the secret is zero or not below the curve order.
    static std::optional<Keypair> fromSecret(const std::vector<uint8_t>& secret);

    const PublicKey& publicKey() const { return publicKey_; }
    const PrivateKey& secret() const { return secret_; }
    bool valid() const { return valid_; }

    Signature sign(const Hash256& hash) const;
    static bool verify(const Hash256& hash, const Signature& signature, const PublicKey& publicKey);

private:
    PrivateKey secret_{};
    PublicKey publicKey_{};
    bool valid_ = false;
};

}
}
