#include "core/neuron.h"
#include "utils/logger.h"
#include <chrono>
#include <thread>
#include <algorithm>

namespace subvault {
namespace core {

void setupLogging(const NeuronConfig& config) {
    utils::Logger::init(config.logPath());
    if (config.trace) utils::Logger::setLevel(utils::LogLevel::TRACE);
    else if (config.debug) utils::Logger::setLevel(utils::LogLevel::DEBUG);
    else utils::Logger::setLevel(utils::LogLevel::INFO);
    utils::Logger::setCategory(roleName(config.role));
}

Neuron::Neuron(const NeuronConfig& config)
    : config_(config), wallet_(config.wallet), registry_(config.registryPath()) {}

Neuron::~Neuron() = default;

Result<void> Neuron::setup() {
    LOG_INFO("Setting up " + std::string(roleName(config_.role)) + " objects.");
    
    Result<void> loaded = config_.createWallet ? wallet_.create(false) : wallet_.load();
    if (loaded.failed()) {
        if (!config_.createWallet && loaded.error().code == ErrorCode::FILE_NOT_FOUND) {
            return makeError(ErrorCode::FILE_NOT_FOUND, loaded.error().message +
                             " (create keys first or pass --wallet.create)", loaded.error().context);
        }
        return loaded;
    }
    LOG_INFO("Wallet: " + wallet_.toString());
    
    auto opened = registry_.open();
    if (opened.failed()) return opened;
    LOG_INFO("Subtensor: " + config_.network + " (" + config_.chainEndpoint + ") registry " + registry_.path());
    
    const std::string hotkey = wallet_.hotkeyAddress();
    if (config_.selfRegister) {
        if (!registry_.subnetExists(config_.netuid)) {
            auto created = registry_.createSubnet(config_.netuid, wallet_.coldkeyAddress());
            if (created.failed() && created.error().code != ErrorCode::ALREADY_EXISTS) return created;
        }
        auto reg = registry_.registerNeuron(config_.netuid, hotkey, wallet_.coldkeyAddress());
        if (reg.failed()) return reg.error();
    }
    
    auto synced = resyncMetagraph();
    if (synced.failed()) return synced;
    
    auto uid = metagraph().uidOf(hotkey);
    if (!uid) {
        return makeError(ErrorCode::NOT_REGISTERED,
                         "Your " + std::string(roleName(config_.role)) + ": " + wallet_.toString() +
                         " is not registered to chain connection: " + config_.chainEndpoint +
                         ". Run register and try again.");
    }
    uid_ = *uid;
    LOG_INFO("Running " + std::string(roleName(config_.role)) + " on uid: " + std::to_string(uid_));
    return {};
}

Result<void> Neuron::resyncMetagraph() {
    auto mg = registry_.metagraph(config_.netuid);
    if (mg.failed()) return mg.error();
    std::lock_guard<std::mutex> lock(metagraphMtx_);
    metagraph_ = mg.value();
    LOG_DEBUG("Metagraph: " + metagraph_.toString());
    return {};
}

Metagraph Neuron::metagraph() const {
    std::lock_guard<std::mutex> lock(metagraphMtx_);
    return metagraph_;
}

void Neuron::requestStop() {
    stop_ = true;
}

bool Neuron::stopRequested() const {
    return stop_;
}

bool Neuron::sleepFor(double seconds) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
    while (!stop_) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(100)));
    }
    return false;
}

}
}
