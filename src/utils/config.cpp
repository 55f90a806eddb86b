#include "utils/config.h"
#include <map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdlib>
#include <mutex>

namespace subvault {
namespace utils {

struct Config::Impl {
    std::map<std::string, std::string> data;
    std::string configPath;
    mutable std::mutex mtx;
};

std::string expandUser(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;
    const char* home = std::getenv("HOME");
    std::string base = home ? home : ".";
    return base + path.substr(1);
}

Config::Config() : impl_(std::make_unique<Impl>()) {
    loadDefaults();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

bool Config::loadDefaults() {
    set("netuid", 12);
    set("subtensor.network", "local");
    set("subtensor.chain_endpoint", "");
    set("subtensor.registry_dir", "~/.subvault/chain");
    set("subtensor.register", false);
    
    set("wallet.name", "default");
    set("wallet.hotkey", "default");
    set("wallet.path", "~/.subvault/wallets");
    set("wallet.create", false);
    
    set("axon.ip", "127.0.0.1");
    set("axon.port", 8091);
    set("axon.max_workers", 10);
    set("axon.timeout", 12.0);
    
    set("logging.debug", false);
    set("logging.trace", false);
    set("logging.logging_dir", "~/.subvault/miners");
    
    set("db_root_path", "~/subvault-db");
    set("allocate.chunk_size", static_cast<int64_t>(1) << 20);
    set("allocate.workers", 10);
    set("allocate.restart", false);
    
    set("miner.threshold", 0.9);
    set("miner.max_chunks", static_cast<int64_t>(0));
    set("miner.min_validator_stake", 0.0);
    set("miner.resync_interval", 60);
    
    set("validator.min_chunks", static_cast<int64_t>(1) << 10);
    set("validator.alpha", 0.9);
    set("validator.epoch_length", 1000);
    set("validator.step_interval", 1.0);
    
    return true;
}

void Config::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.clear();
        impl_->configPath.clear();
    }
    loadDefaults();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;
    
    while (std::getline(file, line)) {
        auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#') continue;
        
        auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);
        
        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r") + 1);
        if (key.empty()) continue;
        
        impl_->data[key] = value;
    }
    return true;
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    return it != impl_->data.end() ? it->second : def;
}

bool Config::getBool(const std::string& key, bool def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    std::string val = it->second;
    std::transform(val.begin(), val.end(), val.begin(), ::tolower);
    return val == "true" || val == "1" || val == "yes" || val == "on";
}

void Config::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data[key] = value;
}

void Config::set(const std::string& key, const char* value) {
    set(key, std::string(value ? value : ""));
}

void Config::set(const std::string& key, int value) {
    set(key, std::to_string(value));
}

void Config::set(const std::string& key, int64_t value) {
    set(key, std::to_string(value));
}

void Config::set(const std::string& key, double value) {
    std::ostringstream oss;
    oss << value;
    set(key, oss.str());
}

void Config::set(const std::string& key, bool value) {
    set(key, std::string(value ? "true" : "false"));
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.find(key) != impl_->data.end();
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->configPath;
}

}
}
