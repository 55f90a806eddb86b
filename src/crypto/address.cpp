#include "crypto/address.h"
#include <algorithm>

namespace subvault {
namespace crypto {

std::string Address::fromPublicKey(const PublicKey& publicKey) {
    std::vector<uint8_t> data;
    data.reserve(1 + publicKey.size() + ADDRESS_CHECKSUM_SIZE);
    data.push_back(ADDRESS_PREFIX);
    data.insert(data.end(), publicKey.begin(), publicKey.end());
    Hash256 check = doubleSha256(data.data(), data.size());
    data.insert(data.end(), check.begin(), check.begin() + ADDRESS_CHECKSUM_SIZE);
    return base58Encode(data);
}

std::optional<PublicKey> Address::toPublicKey(const std::string& address) {
    if (address.empty()) return std::nullopt;
    std::vector<uint8_t> decoded = base58Decode(address);
    if (decoded.size() != 1 + PUBLIC_KEY_SIZE + ADDRESS_CHECKSUM_SIZE) return std::nullopt;
    if (decoded[0] != ADDRESS_PREFIX) return std::nullopt;

    size_t bodyLen = 1 + PUBLIC_KEY_SIZE;
    Hash256 check = doubleSha256(decoded.data(), bodyLen);
    if (!std::equal(check.begin(), check.begin() + ADDRESS_CHECKSUM_SIZE, decoded.begin() + bodyLen)) {
        return std::nullopt;
    }

    PublicKey pk{};
    std::copy(decoded.begin() + 1, decoded.begin() + bodyLen, pk.begin());
    return pk;
}

bool Address::isValid(const std::string& address) {
    return toPublicKey(address).has_value();
}

}
}
