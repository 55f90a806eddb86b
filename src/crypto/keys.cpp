#include "crypto/keys.h"
#include <secp256k1.h>
#include <stdexcept>
#include <cstring>

namespace subvault {
namespace crypto {

static secp256k1_context* context() {
    static secp256k1_context* ctx = [] {
        secp256k1_context* c = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
        auto seed = randomBytes(32);
        if (!secp256k1_context_randomize(c, seed.data())) {
            secp256k1_context_destroy(c);
            throw std::runtime_error("secp256k1 context randomization failed");
        }
        return c;
    }();
    return ctx;
}

Keypair::~Keypair() {
    secureZero(secret_.data(), secret_.size());
}

Keypair Keypair::generate() {
    for (int attempt = 0; attempt < 1000; ++attempt) {
        auto rnd = randomBytes(PRIVATE_KEY_SIZE);
        auto kp = fromSecret(rnd);
        secureZero(rnd.data(), rnd.size());
        if (kp) return *kp;
    }
    throw std::runtime_error("failed to generate secp256k1 key");
}

std::optional<Keypair> Keypair::fromSecret(const std::vector<uint8_t>& secret) {
    if (secret.size() != PRIVATE_KEY_SIZE) return std::nullopt;
    secp256k1_context* ctx = context();
    if (!secp256k1_ec_seckey_verify(ctx, secret.data())) return std::nullopt;

    Keypair kp;
    std::memcpy(kp.secret_.data(), secret.data(), PRIVATE_KEY_SIZE);

    secp256k1_pubkey pub{};
    if (!secp256k1_ec_pubkey_create(ctx, &pub, kp.secret_.data())) return std::nullopt;
    size_t outLen = kp.publicKey_.size();
    if (!secp256k1_ec_pubkey_serialize(ctx, kp.publicKey_.data(), &outLen, &pub, SECP256K1_EC_COMPRESSED) ||
        outLen != kp.publicKey_.size()) {
        return std::nullopt;
    }
    kp.valid_ = true;
    return kp;
}

Signature Keypair::sign(const Hash256& hash) const {
    if (!valid_) throw std::runtime_error("sign with empty keypair");
    secp256k1_context* ctx = context();
    secp256k1_ecdsa_signature sig{};
    if (!secp256k1_ecdsa_sign(ctx, &sig, hash.data(), secret_.data(), secp256k1_nonce_function_rfc6979, nullptr)) {
        throw std::runtime_error("secp256k1 signing failed");
    }
    secp256k1_ecdsa_signature_normalize(ctx, &sig, &sig);
    Signature out{};
    if (!secp256k1_ecdsa_signature_serialize_compact(ctx, out.data(), &sig)) {
        throw std::runtime_error("secp256k1 signature serialization failed");
    }
    return out;
}

bool Keypair::verify(const Hash256& hash, const Signature& signature, const PublicKey& publicKey) {
    secp256k1_context* ctx = context();
    secp256k1_pubkey pub{};
    if (!secp256k1_ec_pubkey_parse(ctx, &pub, publicKey.data(), publicKey.size())) return false;
    secp256k1_ecdsa_signature sig{};
    if (!secp256k1_ecdsa_signature_parse_compact(ctx, &sig, signature.data())) return false;
    secp256k1_ecdsa_signature_normalize(ctx, &sig, &sig);
    return secp256k1_ecdsa_verify(ctx, &sig, hash.data(), &pub) == 1;
}

}
}
