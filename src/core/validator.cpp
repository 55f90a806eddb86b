#include "core/validator.h"
#include "database/chunk_store.h"
#include "crypto/crypto.h"
#include "utils/logger.h"
#include <algorithm>
#include <filesystem>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace subvault {
namespace core {

Validator::Validator(const NeuronConfig& config) : Neuron(config) {}

Validator::~Validator() {
    stop();
}

Allocation Validator::freshAllocation(const std::string& minerHotkey, uint64_t nChunks) const {
    return makeAllocation(config_.dbRootPath, config_.wallet.name, config_.wallet.hotkey,
                          minerHotkey, wallet_.hotkeyAddress(), nChunks, true, config_.chunkSize);
}

Result<void> Validator::start() {
    auto ready = setup();
    if (ready.failed()) return ready;
    
    dendrite_ = std::make_unique<network::Dendrite>(wallet_);
    LOG_INFO("Dendrite: " + dendrite_->toString());
    
    LOG_INFO("Building validation weights.");
    syncMetagraph();
    LOG_INFO("Weights: " + std::to_string(scores_.size()) + " uid(s) at 1.0");
    
    auto generated = generate(generationSet(), config_.generateWorkers, config_.restart);
    if (generated.failed()) return generated;
    return {};
}

std::vector<Allocation> Validator::generationSet() const {
    std::vector<Allocation> out;
    const std::string self = wallet_.hotkeyAddress();
    for (const auto& alloc : next_) {
        if (alloc.miner != self) out.push_back(alloc);
    }
    return out;
}

std::vector<Allocation> Validator::syncMetagraph() {
    std::vector<Allocation> fresh;
    const std::string self = wallet_.hotkeyAddress();
    Metagraph mg = metagraph();
    size_t n = mg.size();
    if (hotkeys_.size() > n) {
        hotkeys_.resize(n);
        next_.resize(n);
        verified_.resize(n);
        scores_.resize(n);
    }
    for (size_t uid = 0; uid < n; uid++) {
        const std::string& hotkey = mg.hotkeys[uid];
        if (uid < hotkeys_.size() && hotkeys_[uid] == hotkey) continue;
        
        Allocation next = freshAllocation(hotkey, config_.validatorMinChunks);
        Allocation empty = freshAllocation(hotkey, 0);
        if (uid < hotkeys_.size()) {
            LOG_INFO("Uid " + std::to_string(uid) + " replaced by " + utils::Logger::redactAddress(hotkey));
            hotkeys_[uid] = hotkey;
            next_[uid] = next;
            verified_[uid] = empty;
            scores_[uid] = 1.0;
        } else {
            hotkeys_.push_back(hotkey);
            next_.push_back(next);
            verified_.push_back(empty);
            scores_.push_back(1.0);
        }
        if (hotkey != self) fresh.push_back(next);
    }
    return fresh;
}

void Validator::grow(Allocation& next, Allocation& verified) {
    verified.nChunks = next.nChunks;
    next.nChunks = static_cast<uint64_t>(std::floor(static_cast<double>(next.nChunks) * 1.1));
}

void Validator::shrink(Allocation& next, Allocation& verified, uint64_t minChunks) {
    uint64_t reduced = static_cast<uint64_t>(std::floor(static_cast<double>(next.nChunks) * 0.9));
    next.nChunks = std::max(reduced, minChunks);
    verified.nChunks = std::min(next.nChunks, verified.nChunks);
}

void Validator::challenge(size_t uid, const AxonInfo& axon) {
    Allocation& next = next_[uid];
    Allocation& verified = verified_[uid];
    LOG_DEBUG("Validating miner [uid " + std::to_string(uid) + "]: " + next.toString());
    
    if (next.nChunks == 0) return;
    uint64_t chunk = crypto::randomRange(1, next.nChunks);
    std::string key = std::to_string(chunk);
    LOG_DEBUG("Validating chunk: " + key);
    
    std::optional<std::string> expected;
    std::error_code ec;
    if (std::filesystem::exists(next.path, ec)) {
        database::ChunkStore store;
        if (store.open(next.path, next.seed, true)) expected = store.hash(chunk);
    }
    if (!expected) {
        LOG_ERROR("Failed to get validation hash for chunk: " + key + " from db: " + next.path);
        return;
    }
    
    network::RetrieveRequest request;
    request.key = key;
    auto data = dendrite_->query(axon, request, config_.queryTimeout);
    if (!data) {
        shrink(next, verified, config_.validatorMinChunks);
        LOG_DEBUG("Miner [uid " + std::to_string(uid) + "] did not respond with data, reducing allocation to: " +
                  std::to_string(next.nChunks));
        return;
    }
    
    std::string computed = crypto::sha256Hex(*data);
    if (crypto::constantTimeEquals(computed, *expected)) {
        grow(next, verified);
        LOG_DEBUG("Miner [uid " + std::to_string(uid) + "] provided correct response, increasing allocation to: " +
                  std::to_string(next.nChunks));
    } else {
        shrink(next, verified, config_.validatorMinChunks);
        LOG_DEBUG("Miner [uid " + std::to_string(uid) + "] provided incorrect response, reducing allocation to: " +
                  std::to_string(next.nChunks));
    }
}

void Validator::updateScores() {
    const std::string self = wallet_.hotkeyAddress();
    for (size_t uid = 0; uid < scores_.size(); uid++) {
        if (next_[uid].miner == self) continue;
        scores_[uid] = config_.alpha * scores_[uid] +
                       (1.0 - config_.alpha) * static_cast<double>(verified_[uid].nChunks);
    }
}

std::vector<double> Validator::normalizedWeights() const {
    std::vector<double> weights(scores_.size(), 0.0);
    double sum = 0.0;
    for (double s : scores_) sum += std::fabs(s);
    if (weights.empty()) return weights;
    if (sum <= 0.0) {
        std::fill(weights.begin(), weights.end(), 1.0 / static_cast<double>(weights.size()));
        return weights;
    }
    for (size_t i = 0; i < scores_.size(); i++) weights[i] = std::fabs(scores_[i]) / sum;
    return weights;
}

Result<void> Validator::setWeights() {
    std::vector<double> weights = normalizedWeights();
    std::vector<uint16_t> uids(weights.size());
    for (size_t i = 0; i < uids.size(); i++) uids[i] = static_cast<uint16_t>(i);
    
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < weights.size(); i++) ss << (i ? ", " : "") << weights[i];
    ss << "]";
    LOG_INFO("Setting weights: " + ss.str());
    
    return registry_.setWeights(config_.netuid, wallet_.hotkeyAddress(), uids, weights);
}

void Validator::step() {
    if (!dendrite_) throw std::runtime_error("validator not started");
    
    Metagraph mg = metagraph();
    const std::string self = wallet_.hotkeyAddress();
    std::vector<uint64_t> previous;
    previous.reserve(next_.size());
    for (const auto& a : next_) previous.push_back(a.nChunks);
    
    for (size_t uid = 0; uid < next_.size() && !stopRequested(); uid++) {
        if (next_[uid].miner == self) continue;
        AxonInfo axon = uid < mg.axons.size() ? mg.axons[uid] : AxonInfo{};
        challenge(uid, axon);
    }
    
    if (utils::Logger::getLevel() <= utils::LogLevel::DEBUG) {
        std::ostringstream prev;
        for (size_t i = 0; i < previous.size(); i++) prev << (i ? ", " : "") << previous[i];
        LOG_DEBUG("Prev allocations: [" + prev.str() + "]");
    }
    
    auto generated = generate(generationSet(), config_.generateWorkers, false);
    if (generated.failed()) throwIfError(generated.error());
    
    std::ostringstream sizes;
    for (size_t i = 0; i < next_.size(); i++) {
        sizes << (i ? ", " : "") << humanReadableSize(next_[i].nChunks * config_.chunkSize);
    }
    LOG_INFO("Allocations: [" + sizes.str() + "]");
    
    updateScores();
    
    if ((step_ + 1) % config_.epochLength == 0) {
        auto set = setWeights();
        if (set.ok()) LOG_INFO("Successfully set weights.");
        else LOG_ERROR("Failed to set weights: " + set.error().describe());
    }
    
    step_++;
    auto synced = resyncMetagraph();
    if (synced.failed()) throwIfError(synced.error());
    std::vector<Allocation> fresh = syncMetagraph();
    if (!fresh.empty()) {
        auto added = generate(fresh, config_.generateWorkers, false);
        if (added.failed()) throwIfError(added.error());
    }
}

void Validator::run() {
    LOG_INFO("Starting validator loop.");
    while (!stopRequested()) {
        try {
            step();
        } catch (const std::runtime_error& e) {
            LOG_ERROR(std::string("Validator step failed: ") + e.what());
        }
        if (!sleepFor(config_.stepInterval)) break;
    }
    LOG_INFO("Exiting validator");
}

void Validator::stop() {
    requestStop();
}

}
}
