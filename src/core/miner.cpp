#include "core/miner.h"
#include "crypto/crypto.h"
#include "crypto/keys.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <filesystem>
#include <algorithm>
#include <stdexcept>
#include <cctype>

namespace subvault {
namespace core {

using network::RetrieveRequest;
using network::RetrieveResponse;
using network::StatusCode;

Miner::Miner(const NeuronConfig& config) : Neuron(config) {}

Miner::~Miner() {
    stop();
}

Result<void> Miner::start() {
    auto ready = setup();
    if (ready.failed()) return ready;
    
    auto refreshed = refreshAllocations(true);
    if (refreshed.failed()) return refreshed;
    
    axon_ = std::make_unique<network::Axon>(config_.axon);
    axon_->attach(network::CMD_RETRIEVE, [this](const std::string& peerId, const network::Message& msg) {
        return onRetrieve(peerId, msg);
    });
    if (!axon_->start()) {
        return makeError(ErrorCode::NETWORK_ERROR,
                         "failed to start axon on " + config_.axon.ip + ":" + std::to_string(config_.axon.port));
    }
    LOG_INFO("Axon: " + axon_->toString());
    
    auto served = registry_.serveAxon(config_.netuid, wallet_.hotkeyAddress(), config_.axon.ip, axon_->port());
    if (served.failed()) return served;
    LOG_INFO("Serving axon on network: " + config_.chainEndpoint + " with netuid: " +
             std::to_string(config_.netuid));
    return resyncMetagraph();
}

void Miner::run() {
    LOG_INFO("Starting miner loop.");
    while (!stopRequested()) {
        if (!sleepFor(static_cast<double>(config_.resyncInterval))) break;
        
        auto synced = resyncMetagraph();
        if (synced.failed()) {
            LOG_ERROR("Metagraph resync failed: " + synced.error().describe());
            continue;
        }
        if (!metagraph().hasHotkey(wallet_.hotkeyAddress())) {
            LOG_WARN("Hotkey " + utils::Logger::redactAddress(wallet_.hotkeyAddress()) +
                     " is no longer registered on netuid " + std::to_string(config_.netuid));
        }
        auto refreshed = refreshAllocations();
        if (refreshed.failed()) {
            LOG_ERROR("Allocation refresh failed: " + refreshed.error().describe());
        }
    }
    LOG_INFO("Exiting miner");
}

void Miner::stop() {
    requestStop();
    if (axon_) axon_->stop();
}

uint16_t Miner::axonPort() const {
    return axon_ ? axon_->port() : 0;
}

std::vector<Allocation> Miner::allocations() const {
    std::lock_guard<std::mutex> lock(allocMtx_);
    return allocations_;
}

std::vector<std::string> Miner::validatorHotkeys(const Metagraph& metagraph) const {
    std::vector<std::string> out;
    const std::string self = wallet_.hotkeyAddress();
    for (size_t i = 0; i < metagraph.size(); i++) {
        if (metagraph.hotkeys[i] == self) continue;
        double stake = i < metagraph.stake.size() ? metagraph.stake[i] : 0.0;
        if (stake < config_.minValidatorStake) continue;
        out.push_back(metagraph.hotkeys[i]);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

uint64_t Miner::heldBytes(const std::vector<std::string>& validators) const {
    const std::string self = wallet_.hotkeyAddress();
    uint64_t total = 0;
    for (const auto& validator : validators) {
        std::string path = allocationPath(config_.dbRootPath, config_.wallet.name, config_.wallet.hotkey,
                                          self, validator);
        for (const char* suffix : {"", "-wal", "-shm"}) {
            std::error_code ec;
            uint64_t sz = std::filesystem::file_size(path + suffix, ec);
            if (!ec) total += sz;
        }
    }
    return total;
}

std::vector<Allocation> Miner::computeAllocations(const Metagraph& metagraph) const {
    std::vector<std::string> validators = validatorHotkeys(metagraph);
    std::vector<Allocation> out;
    if (validators.empty()) return out;
    
    uint64_t free = utils::availableDiskSpace(config_.dbRootPath);
    uint64_t reserve = GENERATE_HEADROOM_BYTES * validators.size();
    free = free > reserve ? free - reserve : 0;
    double budget = static_cast<double>(free) * config_.minerThreshold +
                    static_cast<double>(heldBytes(validators));
    uint64_t perChunk = config_.chunkSize + HASH_ROW_BYTES;
    uint64_t nChunks = static_cast<uint64_t>(budget / static_cast<double>(validators.size()) /
                                             static_cast<double>(perChunk));
    if (config_.minerMaxChunks > 0) nChunks = std::min(nChunks, config_.minerMaxChunks);
    
    const std::string self = wallet_.hotkeyAddress();
    for (const auto& validator : validators) {
        out.push_back(makeAllocation(config_.dbRootPath, config_.wallet.name, config_.wallet.hotkey,
                                     self, validator, nChunks, false, config_.chunkSize));
    }
    return out;
}

void Miner::removeStore(const std::string& path) {
    std::error_code ec;
    for (const char* suffix : {"", "-wal", "-shm"}) {
        std::filesystem::remove(path + suffix, ec);
        if (ec) LOG_WARN("Cannot remove " + path + suffix + ": " + ec.message());
    }
}

Result<void> Miner::refreshAllocations(bool force) {
    Metagraph mg = metagraph();
    std::vector<std::string> validators = validatorHotkeys(mg);
    std::set<std::string> next(validators.begin(), validators.end());
    
    {
        std::lock_guard<std::mutex> lock(allocMtx_);
        if (!force && generated_ && next == served_) return {};
    }
    
    // Departed stores go first so their space counts toward the new set.
    std::vector<Allocation> departed;
    {
        std::lock_guard<std::mutex> lock(allocMtx_);
        std::vector<Allocation> kept;
        for (const auto& old : allocations_) {
            if (next.count(old.validator)) {
                kept.push_back(old);
            } else {
                departed.push_back(old);
                stores_.erase(old.validator);
            }
        }
        allocations_.swap(kept);
    }
    for (const auto& old : departed) {
        LOG_INFO("Validator " + utils::Logger::redactAddress(old.validator) + " left, removing " + old.path);
        removeStore(old.path);
    }
    {
        std::lock_guard<std::mutex> lock(nonceMtx_);
        for (auto it = lastNonce_.begin(); it != lastNonce_.end();) {
            if (!next.count(it->first)) it = lastNonce_.erase(it);
            else ++it;
        }
    }
    
    std::vector<Allocation> allocs = computeAllocations(mg);
    LOG_INFO("Allocating " + std::to_string(allocs.size()) + " validator store(s) of " +
             (allocs.empty() ? std::string("0 B") : humanReadableSize(allocs.front().nChunks * config_.chunkSize)) +
             " each");
    
    bool restart = config_.restart && !generated_;
    auto result = generate(allocs, config_.generateWorkers, restart);
    if (result.failed()) return result;
    
    std::map<std::string, std::shared_ptr<database::ChunkStore>> stores;
    for (const auto& alloc : allocs) {
        auto store = std::make_shared<database::ChunkStore>();
        if (!store->open(alloc.path, alloc.seed, false)) {
            return makeError(ErrorCode::DATABASE_ERROR, "cannot open chunk store", alloc.path);
        }
        stores[alloc.validator] = store;
    }
    
    {
        std::lock_guard<std::mutex> lock(allocMtx_);
        allocations_ = allocs;
        stores_.swap(stores);
        served_ = next;
        generated_ = true;
    }
    // Old handles close once in-flight requests release them.
    stores.clear();
    return {};
}

static bool isChunkKey(const std::string& key) {
    if (key.empty() || key.size() > 19) return false;
    return std::all_of(key.begin(), key.end(), [](unsigned char c) { return std::isdigit(c); });
}

RetrieveResponse Miner::handleRetrieve(const RetrieveRequest& request) {
    const std::string self = wallet_.hotkeyAddress();
    if (request.dendriteHotkey.empty() || request.signature.empty()) {
        return RetrieveResponse::failure(StatusCode::BAD_REQUEST, "missing caller or signature");
    }
    if (request.axonHotkey != self) {
        return RetrieveResponse::failure(StatusCode::BAD_REQUEST, "request addressed to another axon");
    }
    
    Metagraph mg = metagraph();
    auto uid = mg.uidOf(request.dendriteHotkey);
    if (!uid) {
        LOG_DEBUG("Blacklisted unregistered hotkey " + utils::Logger::redactAddress(request.dendriteHotkey));
        return RetrieveResponse::failure(StatusCode::FORBIDDEN, "caller is not registered");
    }
    double stake = *uid < mg.stake.size() ? mg.stake[*uid] : 0.0;
    if (stake < config_.minValidatorStake) {
        return RetrieveResponse::failure(StatusCode::FORBIDDEN, "caller stake below minimum");
    }
    
    std::vector<uint8_t> sigBytes = crypto::fromHex(request.signature);
    if (sigBytes.size() != crypto::SIGNATURE_SIZE) {
        return RetrieveResponse::failure(StatusCode::UNAUTHORIZED, "malformed signature");
    }
    crypto::Signature sig;
    std::copy(sigBytes.begin(), sigBytes.end(), sig.begin());
    if (!Wallet::verify(request.signingMessage(), sig, request.dendriteHotkey)) {
        return RetrieveResponse::failure(StatusCode::UNAUTHORIZED, "bad signature");
    }
    
    {
        std::lock_guard<std::mutex> lock(nonceMtx_);
        auto it = lastNonce_.find(request.dendriteHotkey);
        if (it != lastNonce_.end() && request.nonce <= it->second) {
            return RetrieveResponse::failure(StatusCode::UNAUTHORIZED, "stale nonce");
        }
        lastNonce_[request.dendriteHotkey] = request.nonce;
    }
    
    if (!isChunkKey(request.key)) {
        return RetrieveResponse::failure(StatusCode::BAD_REQUEST, "key must be a chunk id");
    }
    uint64_t id = std::stoull(request.key);
    
    std::shared_ptr<database::ChunkStore> store;
    {
        std::lock_guard<std::mutex> lock(allocMtx_);
        auto it = stores_.find(request.dendriteHotkey);
        if (it != stores_.end()) store = it->second;
    }
    if (!store) {
        return RetrieveResponse::failure(StatusCode::NOT_FOUND, "no allocation for caller");
    }
    auto data = store->data(id);
    if (!data) {
        LOG_TRACE("Chunk " + request.key + " not held for " + utils::Logger::redactAddress(request.dendriteHotkey));
        return RetrieveResponse::failure(StatusCode::NOT_FOUND, "chunk not found");
    }
    LOG_TRACE("Serving chunk " + request.key + " to " + utils::Logger::redactAddress(request.dendriteHotkey));
    return RetrieveResponse::success(*data);
}

network::Message Miner::onRetrieve(const std::string& peerId, const network::Message& msg) {
    RetrieveResponse response;
    auto request = RetrieveRequest::fromJson(msg.body());
    if (!request) {
        LOG_DEBUG("Malformed retrieve from " + peerId);
        response = RetrieveResponse::failure(StatusCode::BAD_REQUEST, "malformed request");
    } else {
        response = handleRetrieve(*request);
    }
    return network::Message::make(network::CMD_RESPONSE, response.toJson());
}

}
}
