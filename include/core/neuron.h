#pragma once

#include "core/neuron_config.h"
#include "core/registry.h"
#include "core/wallet.h"
#include "infrastructure/error_handling.h"
#include <atomic>
#include <mutex>
#include <memory>

namespace subvault {
namespace core {

// Points the process logger at <full_path>/<role>.log with the level the
// logging flags select.
void setupLogging(const NeuronConfig& config);

// State shared by both roles: wallet, registry connection, metagraph
// snapshot and the stop flag.
class Neuron {
public:
    explicit Neuron(const NeuronConfig& config);
    virtual ~Neuron();
    
    Neuron(const Neuron&) = delete;
    Neuron& operator=(const Neuron&) = delete;
    
    // Loads (or creates) the wallet, opens the registry and checks that the
    // hotkey is registered, registering it first with --subtensor.register.
    Result<void> setup();
    
    Result<void> resyncMetagraph();
    
    // Role lifecycle: start() sets up and begins serving, run() blocks
    // until a stop is requested, stop() releases what start() acquired.
    virtual Result<void> start() = 0;
    virtual void run() = 0;
    virtual void stop() = 0;
    
    void requestStop();
    bool stopRequested() const;
    
    const Wallet& wallet() const { return wallet_; }
    Registry& registry() { return registry_; }
    Metagraph metagraph() const;
    uint16_t uid() const { return uid_; }
    
protected:
    // Sleeps up to `seconds`, returning early when a stop is requested.
    bool sleepFor(double seconds);
    
    NeuronConfig config_;
    Wallet wallet_;
    Registry registry_;
    Metagraph metagraph_;
    mutable std::mutex metagraphMtx_;
    uint16_t uid_ = 0;
    std::atomic<bool> stop_{false};
};

}
}
