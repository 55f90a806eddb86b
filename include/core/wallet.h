#ifndef SUBVAULT_CORE_WALLET_H
#define SUBVAULT_CORE_WALLET_H

#include "crypto/keys.h"
#include "infrastructure/error_handling.h"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace subvault {
namespace core {

struct WalletConfig {
    std::string name = "default";
    std::string hotkey = "default";
    std::string path = "~/.subvault/wallets";
};

// Coldkey public file plus a hotkey keyfile under
// <path>/<name>/{coldkeypub.txt, hotkeys/<hotkey>}.
class Wallet {
public:
    explicit Wallet(const WalletConfig& config);
    ~Wallet();
    
    Wallet(const Wallet&) = delete;
    Wallet& operator=(const Wallet&) = delete;
    
    Result<void> load();
    Result<void> create(bool overwrite = false);
    bool isLoaded() const;
    
    std::string hotkeyAddress() const;
    std::string coldkeyAddress() const;
    
    // Signs sha256(message) with the hotkey.
    crypto::Signature sign(const std::string& message) const;
    static bool verify(const std::string& message, const crypto::Signature& signature,
                       const std::string& ss58Address);
    
    std::string walletDir() const;
    std::string coldkeyPubPath() const;
    std::string hotkeyPath() const;
    
    std::string toString() const;
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}

#endif
