#include "core/wallet.h"
#include "crypto/address.h"
#include "crypto/crypto.h"
#include "utils/config.h"
#include "utils/logger.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <mutex>
#include <stdexcept>
#include <sys/stat.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

namespace subvault {
namespace core {

using json = nlohmann::json;

struct KeyfileContents {
    crypto::PublicKey publicKey{};
    std::string address;
    std::vector<uint8_t> secretSeed;
};

static Result<KeyfileContents> readKeyfile(const std::string& path, bool needSecret) {
    std::ifstream in(path);
    if (!in) return makeError(ErrorCode::FILE_NOT_FOUND, "keyfile not found", path);
    
    std::stringstream ss;
    ss << in.rdbuf();
    json j = json::parse(ss.str(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return makeError(ErrorCode::SERIALIZATION_ERROR, "keyfile is not valid JSON", path);
    }
    if (!j.contains("publicKey") || !j["publicKey"].is_string() ||
        !j.contains("ss58Address") || !j["ss58Address"].is_string()) {
        return makeError(ErrorCode::SERIALIZATION_ERROR, "keyfile lacks publicKey or ss58Address", path);
    }
    
    KeyfileContents out;
    auto pk = crypto::fromHex(j["publicKey"].get<std::string>());
    if (pk.size() != crypto::PUBLIC_KEY_SIZE) {
        return makeError(ErrorCode::CRYPTO_ERROR, "keyfile publicKey has wrong length", path);
    }
    std::copy(pk.begin(), pk.end(), out.publicKey.begin());
    out.address = j["ss58Address"].get<std::string>();
    
    auto decoded = crypto::Address::toPublicKey(out.address);
    if (!decoded || *decoded != out.publicKey) {
        return makeError(ErrorCode::INVALID_ADDRESS, "keyfile address does not match its public key", path);
    }
    
    if (needSecret) {
        if (!j.contains("secretSeed") || !j["secretSeed"].is_string()) {
            return makeError(ErrorCode::SERIALIZATION_ERROR, "hotkey file lacks secretSeed", path);
        }
        out.secretSeed = crypto::fromHex(j["secretSeed"].get<std::string>());
        if (out.secretSeed.size() != crypto::PRIVATE_KEY_SIZE) {
            return makeError(ErrorCode::CRYPTO_ERROR, "hotkey secretSeed has wrong length", path);
        }
    }
    return out;
}

static Result<void> writeKeyfile(const std::string& path, const crypto::Keypair& kp, bool withSecret) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    if (ec) return makeError(ErrorCode::PERMISSION_DENIED, "cannot create wallet directory: " + ec.message(), path);
    
    json j;
    j["publicKey"] = crypto::toHex(kp.publicKey());
    j["ss58Address"] = crypto::Address::fromPublicKey(kp.publicKey());
    if (withSecret) j["secretSeed"] = crypto::toHex(kp.secret());
    
    std::string body = j.dump(2) + "\n";
    
    // 0600 from creation; fchmod covers a pre-existing file before any byte lands.
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) return makeError(ErrorCode::PERMISSION_DENIED, "cannot write keyfile", path);
    if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
        ::close(fd);
        crypto::secureZero(&body[0], body.size());
        return makeError(ErrorCode::PERMISSION_DENIED, "cannot restrict keyfile permissions", path);
    }
    
    size_t off = 0;
    bool ok = true;
    while (off < body.size()) {
        ssize_t n = ::write(fd, body.data() + off, body.size() - off);
        if (n > 0) {
            off += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        ok = false;
        break;
    }
    if (::close(fd) != 0) ok = false;
    crypto::secureZero(&body[0], body.size());
    if (!ok) return makeError(ErrorCode::PERMISSION_DENIED, "short write on keyfile", path);
    return {};
}

struct Wallet::Impl {
    WalletConfig config;
    crypto::Keypair hotkey;
    crypto::PublicKey coldkeyPub{};
    std::string hotkeyAddress;
    std::string coldkeyAddress;
    bool loaded = false;
    mutable std::mutex mtx;
};

Wallet::Wallet(const WalletConfig& config) : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
    impl_->config.path = utils::expandUser(config.path);
}

Wallet::~Wallet() = default;

std::string Wallet::walletDir() const {
    return (std::filesystem::path(impl_->config.path) / impl_->config.name).string();
}

std::string Wallet::coldkeyPubPath() const {
    return (std::filesystem::path(walletDir()) / "coldkeypub.txt").string();
}

std::string Wallet::hotkeyPath() const {
    return (std::filesystem::path(walletDir()) / "hotkeys" / impl_->config.hotkey).string();
}

Result<void> Wallet::load() {
    auto cold = readKeyfile(coldkeyPubPath(), false);
    if (cold.failed()) return cold.error();
    auto hot = readKeyfile(hotkeyPath(), true);
    if (hot.failed()) return hot.error();
    
    auto kp = crypto::Keypair::fromSecret(hot.value().secretSeed);
    crypto::secureZero(hot.value().secretSeed.data(), hot.value().secretSeed.size());
    if (!kp) return makeError(ErrorCode::CRYPTO_ERROR, "hotkey secret is not a valid key", hotkeyPath());
    if (kp->publicKey() != hot.value().publicKey) {
        return makeError(ErrorCode::CRYPTO_ERROR, "hotkey secret does not match its public key", hotkeyPath());
    }
    
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->hotkey = *kp;
    impl_->hotkeyAddress = hot.value().address;
    impl_->coldkeyPub = cold.value().publicKey;
    impl_->coldkeyAddress = cold.value().address;
    impl_->loaded = true;
    return {};
}

Result<void> Wallet::create(bool overwrite) {
    std::error_code ec;
    bool haveCold = std::filesystem::exists(coldkeyPubPath(), ec);
    bool haveHot = std::filesystem::exists(hotkeyPath(), ec);
    
    if (overwrite || !haveCold) {
        crypto::Keypair cold = crypto::Keypair::generate();
        auto r = writeKeyfile(coldkeyPubPath(), cold, false);
        if (r.failed()) return r;
        LOG_INFO("Created coldkey " + utils::Logger::redactAddress(crypto::Address::fromPublicKey(cold.publicKey())));
    }
    if (overwrite || !haveHot) {
        crypto::Keypair hot = crypto::Keypair::generate();
        auto r = writeKeyfile(hotkeyPath(), hot, true);
        if (r.failed()) return r;
        LOG_INFO("Created hotkey " + utils::Logger::redactAddress(crypto::Address::fromPublicKey(hot.publicKey())));
    }
    return load();
}

bool Wallet::isLoaded() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->loaded;
}

std::string Wallet::hotkeyAddress() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->hotkeyAddress;
}

std::string Wallet::coldkeyAddress() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->coldkeyAddress;
}

crypto::Signature Wallet::sign(const std::string& message) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->loaded) throw std::runtime_error("wallet not loaded");
    return impl_->hotkey.sign(crypto::sha256(message));
}

bool Wallet::verify(const std::string& message, const crypto::Signature& signature,
                    const std::string& ss58Address) {
    auto pk = crypto::Address::toPublicKey(ss58Address);
    if (!pk) return false;
    return crypto::Keypair::verify(crypto::sha256(message), signature, *pk);
}

std::string Wallet::toString() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return "Wallet(name=" + impl_->config.name + ", hotkey=" + impl_->config.hotkey +
           ", path=" + impl_->config.path +
           ", coldkey=" + utils::Logger::redactAddress(impl_->coldkeyAddress) +
           ", hotkey_address=" + utils::Logger::redactAddress(impl_->hotkeyAddress) + ")";
}

}
}
