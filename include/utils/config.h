#pragma once

#include <string>
#include <memory>
#include <cstdint>

namespace subvault {
namespace utils {

// Process-wide key/value settings. Keys are dotted, matching the command-line
// flags (`wallet.name`, `subtensor.network`, `logging.debug`, ...).
class Config {
public:
    static Config& instance();
    
    bool load(const std::string& path);
    bool loadDefaults();
    void reset();
    
    std::string getString(const std::string& key, const std::string& def = "") const;
    bool getBool(const std::string& key, bool def = false) const;
    
    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, int64_t value);
    void set(const std::string& key, double value);
    void set(const std::string& key, bool value);
    
    bool has(const std::string& key) const;
    std::string getConfigPath() const;
    
private:
    Config();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Expands a leading "~/" against $HOME.
std::string expandUser(const std::string& path);

}
}
