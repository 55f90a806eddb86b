#pragma once

#include "infrastructure/error_handling.h"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <utility>
#include <cstdint>

namespace subvault {
namespace core {

constexpr uint16_t DEFAULT_MAX_UIDS = 256;
constexpr uint16_t U16_MAX_WEIGHT = 65535;

struct AxonInfo {
    std::string ip;
    uint16_t port = 0;
    std::string hotkey;
    std::string coldkey;
    
    bool isServing() const { return !ip.empty() && port != 0; }
    std::string toString() const;
};

struct NeuronInfo {
    uint16_t uid = 0;
    std::string hotkey;
    std::string coldkey;
    AxonInfo axon;
    double stake = 0.0;
};

// Snapshot of one subnet, every vector indexed by uid.
struct Metagraph {
    uint16_t netuid = 0;
    uint64_t block = 0;
    std::vector<uint16_t> uids;
    std::vector<std::string> hotkeys;
    std::vector<std::string> coldkeys;
    std::vector<AxonInfo> axons;
    std::vector<double> stake;
    
    size_t size() const { return uids.size(); }
    std::optional<uint16_t> uidOf(const std::string& hotkey) const;
    bool hasHotkey(const std::string& hotkey) const { return uidOf(hotkey).has_value(); }
    std::string toString() const;
};

// Local stand-in for the subnet chain state, shared by every neuron
// pointed at the same endpoint through one SQLite file.
class Registry {
public:
    explicit Registry(const std::string& path);
    ~Registry();
    
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    
    // <registryDir>/<host>_<port>.db
    static std::string pathFor(const std::string& registryDir, const std::string& host, uint16_t port);
    
    Result<void> open();
    void close();
    const std::string& path() const;
    
    Result<void> createSubnet(uint16_t netuid, const std::string& ownerColdkey,
                              uint16_t maxUids = DEFAULT_MAX_UIDS);
    bool subnetExists(uint16_t netuid) const;
    
    Result<uint16_t> registerNeuron(uint16_t netuid, const std::string& hotkey, const std::string& coldkey);
    Result<void> serveAxon(uint16_t netuid, const std::string& hotkey, const std::string& ip, uint16_t port);
    Result<void> setStake(uint16_t netuid, const std::string& hotkey, double stake);
    
    Result<Metagraph> metagraph(uint16_t netuid) const;
    Result<uint16_t> uidOf(uint16_t netuid, const std::string& hotkey) const;
    
    Result<void> setWeights(uint16_t netuid, const std::string& hotkey,
                            const std::vector<uint16_t>& uids, const std::vector<double>& weights);
    Result<std::vector<std::pair<uint16_t, uint16_t>>> weights(uint16_t netuid, uint16_t uid) const;
    
    uint64_t block() const;
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
