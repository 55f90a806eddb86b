#include "core/registry.h"
#include "database/database.h"
#include "utils/logger.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <mutex>
#include <cmath>
#include <algorithm>

namespace subvault {
namespace core {

using json = nlohmann::json;

static const char* KEY_BLOCK = "meta/block";

static std::string subnetKey(uint16_t netuid) {
    return "subnet/" + std::to_string(netuid);
}

static std::string neuronPrefix(uint16_t netuid) {
    return "neuron/" + std::to_string(netuid) + "/";
}

static std::string neuronKey(uint16_t netuid, uint16_t uid) {
    std::ostringstream ss;
    ss << neuronPrefix(netuid) << std::setw(5) << std::setfill('0') << uid;
    return ss.str();
}

static std::string hotkeyKey(uint16_t netuid, const std::string& hotkey) {
    return "hotkey/" + std::to_string(netuid) + "/" + hotkey;
}

static std::string weightsKey(uint16_t netuid, uint16_t uid) {
    return "weights/" + std::to_string(netuid) + "/" + std::to_string(uid);
}

static json neuronToJson(const NeuronInfo& n) {
    json j;
    j["uid"] = n.uid;
    j["hotkey"] = n.hotkey;
    j["coldkey"] = n.coldkey;
    j["ip"] = n.axon.ip;
    j["port"] = n.axon.port;
    j["stake"] = n.stake;
    return j;
}

static std::optional<NeuronInfo> neuronFromBytes(const std::vector<uint8_t>& bytes) {
    json j = json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    NeuronInfo n;
    try {
        n.uid = j.value("uid", static_cast<uint16_t>(0));
        n.hotkey = j.value("hotkey", std::string());
        n.coldkey = j.value("coldkey", std::string());
        n.axon.ip = j.value("ip", std::string());
        n.axon.port = j.value("port", static_cast<uint16_t>(0));
        n.stake = j.value("stake", 0.0);
    } catch (const json::exception& e) {
        LOG_WARN("Skipping malformed neuron record: " + std::string(e.what()));
        return std::nullopt;
    }
    n.axon.hotkey = n.hotkey;
    n.axon.coldkey = n.coldkey;
    return n;
}

std::string AxonInfo::toString() const {
    return "AxonInfo(" + ip + ":" + std::to_string(port) + ", " + utils::Logger::redactAddress(hotkey) + ")";
}

std::optional<uint16_t> Metagraph::uidOf(const std::string& hotkey) const {
    for (size_t i = 0; i < hotkeys.size(); i++) {
        if (hotkeys[i] == hotkey) return uids[i];
    }
    return std::nullopt;
}

std::string Metagraph::toString() const {
    std::ostringstream ss;
    ss << "Metagraph(netuid:" << netuid << ", n:" << size() << ", block:" << block << ")";
    return ss.str();
}

struct Registry::Impl {
    std::string path;
    database::Database db;
    mutable std::mutex mtx;
    
    uint64_t readBlock() const;
    std::optional<json> readSubnet(uint16_t netuid) const;
    std::optional<NeuronInfo> readNeuron(uint16_t netuid, const std::string& hotkey) const;
    // Adds the block bump to `batch` and writes it inside the open transaction.
    bool commitBatch(database::WriteBatch& batch);
};

uint64_t Registry::Impl::readBlock() const {
    std::string s = db.getString(KEY_BLOCK);
    if (s.empty()) return 0;
    try {
        return std::stoull(s);
    } catch (const std::exception&) {
        return 0;
    }
}

std::optional<json> Registry::Impl::readSubnet(uint16_t netuid) const {
    auto bytes = db.get(subnetKey(netuid));
    if (bytes.empty()) return std::nullopt;
    json j = json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    for (const char* field : {"n", "max_uids"}) {
        if (j.contains(field) && !j.at(field).is_number_unsigned()) return std::nullopt;
    }
    return j;
}

std::optional<NeuronInfo> Registry::Impl::readNeuron(uint16_t netuid, const std::string& hotkey) const {
    std::string uidStr = db.getString(hotkeyKey(netuid, hotkey));
    if (uidStr.empty()) return std::nullopt;
    uint16_t uid = 0;
    try {
        uid = static_cast<uint16_t>(std::stoul(uidStr));
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return neuronFromBytes(db.get(neuronKey(netuid, uid)));
}

bool Registry::Impl::commitBatch(database::WriteBatch& batch) {
    batch.put(KEY_BLOCK, std::to_string(readBlock() + 1));
    if (!db.write(batch)) {
        db.rollbackTransaction();
        return false;
    }
    if (!db.commitTransaction()) {
        db.rollbackTransaction();
        return false;
    }
    return true;
}

Registry::Registry(const std::string& path) : impl_(std::make_unique<Impl>()) {
    impl_->path = path;
}

Registry::~Registry() = default;

std::string Registry::pathFor(const std::string& registryDir, const std::string& host, uint16_t port) {
    return (std::filesystem::path(registryDir) / (host + "_" + std::to_string(port) + ".db")).string();
}

Result<void> Registry::open() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db.isOpen()) return {};
    std::error_code ec;
    auto parent = std::filesystem::path(impl_->path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    if (ec) return makeError(ErrorCode::PERMISSION_DENIED, "cannot create registry directory: " + ec.message(), impl_->path);
    if (!impl_->db.open(impl_->path)) {
        return makeError(ErrorCode::DATABASE_ERROR, "cannot open registry", impl_->path);
    }
    return {};
}

void Registry::close() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->db.close();
}

const std::string& Registry::path() const {
    return impl_->path;
}

Result<void> Registry::createSubnet(uint16_t netuid, const std::string& ownerColdkey, uint16_t maxUids) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    SUBVAULT_CHECK(impl_->db.isOpen(), ErrorCode::DATABASE_ERROR, "registry not open");
    SUBVAULT_CHECK(maxUids > 0, ErrorCode::INVALID_CONFIG, "max_uids must be positive");
    
    if (!impl_->db.beginTransaction()) return makeError(ErrorCode::DATABASE_ERROR, "registry busy");
    if (impl_->readSubnet(netuid)) {
        impl_->db.rollbackTransaction();
        return makeError(ErrorCode::ALREADY_EXISTS, "subnet " + std::to_string(netuid) + " already exists");
    }
    
    json j;
    j["owner"] = ownerColdkey;
    j["max_uids"] = maxUids;
    j["n"] = 0;
    database::WriteBatch batch;
    batch.put(subnetKey(netuid), j.dump());
    if (!impl_->commitBatch(batch)) return makeError(ErrorCode::DATABASE_ERROR, "subnet write failed");
    
    LOG_INFO("Created subnet " + std::to_string(netuid));
    return {};
}

bool Registry::subnetExists(uint16_t netuid) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->readSubnet(netuid).has_value();
}

Result<uint16_t> Registry::registerNeuron(uint16_t netuid, const std::string& hotkey, const std::string& coldkey) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    SUBVAULT_CHECK(impl_->db.isOpen(), ErrorCode::DATABASE_ERROR, "registry not open");
    SUBVAULT_CHECK(!hotkey.empty(), ErrorCode::INVALID_ADDRESS, "empty hotkey");
    
    if (!impl_->db.beginTransaction()) return makeError(ErrorCode::DATABASE_ERROR, "registry busy");
    
    auto subnet = impl_->readSubnet(netuid);
    if (!subnet) {
        impl_->db.rollbackTransaction();
        return makeError(ErrorCode::NOT_FOUND, "subnet " + std::to_string(netuid) + " does not exist");
    }
    if (auto existing = impl_->readNeuron(netuid, hotkey)) {
        impl_->db.rollbackTransaction();
        return existing->uid;
    }
    
    uint16_t n = (*subnet).value("n", static_cast<uint16_t>(0));
    uint16_t maxUids = (*subnet).value("max_uids", DEFAULT_MAX_UIDS);
    if (n >= maxUids) {
        impl_->db.rollbackTransaction();
        return makeError(ErrorCode::SUBNET_FULL, "subnet " + std::to_string(netuid) + " is full");
    }
    
    NeuronInfo info;
    info.uid = n;
    info.hotkey = hotkey;
    info.coldkey = coldkey;
    (*subnet)["n"] = n + 1;
    
    database::WriteBatch batch;
    batch.put(neuronKey(netuid, info.uid), neuronToJson(info).dump());
    batch.put(hotkeyKey(netuid, hotkey), std::to_string(info.uid));
    batch.put(subnetKey(netuid), subnet->dump());
    if (!impl_->commitBatch(batch)) return makeError(ErrorCode::DATABASE_ERROR, "neuron write failed");
    
    LOG_INFO("Registered " + utils::Logger::redactAddress(hotkey) + " on subnet " +
             std::to_string(netuid) + " as uid " + std::to_string(info.uid));
    return info.uid;
}

Result<void> Registry::serveAxon(uint16_t netuid, const std::string& hotkey, const std::string& ip, uint16_t port) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    SUBVAULT_CHECK(impl_->db.isOpen(), ErrorCode::DATABASE_ERROR, "registry not open");
    SUBVAULT_CHECK(port != 0, ErrorCode::INVALID_CONFIG, "axon port must be non-zero");
    
    if (!impl_->db.beginTransaction()) return makeError(ErrorCode::DATABASE_ERROR, "registry busy");
    auto neuron = impl_->readNeuron(netuid, hotkey);
    if (!neuron) {
        impl_->db.rollbackTransaction();
        return makeError(ErrorCode::NOT_REGISTERED, "hotkey not registered", utils::Logger::redactAddress(hotkey));
    }
    neuron->axon.ip = ip;
    neuron->axon.port = port;
    
    database::WriteBatch batch;
    batch.put(neuronKey(netuid, neuron->uid), neuronToJson(*neuron).dump());
    if (!impl_->commitBatch(batch)) return makeError(ErrorCode::DATABASE_ERROR, "axon write failed");
    return {};
}

Result<void> Registry::setStake(uint16_t netuid, const std::string& hotkey, double stake) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    SUBVAULT_CHECK(impl_->db.isOpen(), ErrorCode::DATABASE_ERROR, "registry not open");
    SUBVAULT_CHECK(std::isfinite(stake) && stake >= 0.0, ErrorCode::VALIDATION_FAILED, "stake must be non-negative");
    
    if (!impl_->db.beginTransaction()) return makeError(ErrorCode::DATABASE_ERROR, "registry busy");
    auto neuron = impl_->readNeuron(netuid, hotkey);
    if (!neuron) {
        impl_->db.rollbackTransaction();
        return makeError(ErrorCode::NOT_REGISTERED, "hotkey not registered", utils::Logger::redactAddress(hotkey));
    }
    neuron->stake = stake;
    
    database::WriteBatch batch;
    batch.put(neuronKey(netuid, neuron->uid), neuronToJson(*neuron).dump());
    if (!impl_->commitBatch(batch)) return makeError(ErrorCode::DATABASE_ERROR, "stake write failed");
    return {};
}

Result<Metagraph> Registry::metagraph(uint16_t netuid) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    SUBVAULT_CHECK(impl_->db.isOpen(), ErrorCode::DATABASE_ERROR, "registry not open");
    if (!impl_->readSubnet(netuid)) {
        return makeError(ErrorCode::NOT_FOUND, "subnet " + std::to_string(netuid) + " does not exist");
    }
    
    Metagraph mg;
    mg.netuid = netuid;
    mg.block = impl_->readBlock();
    bool corrupt = false;
    impl_->db.forEach(neuronPrefix(netuid), [&](const std::string&, const std::vector<uint8_t>& value) {
        auto n = neuronFromBytes(value);
        if (!n) {
            corrupt = true;
            return false;
        }
        mg.uids.push_back(n->uid);
        mg.hotkeys.push_back(n->hotkey);
        mg.coldkeys.push_back(n->coldkey);
        mg.axons.push_back(n->axon);
        mg.stake.push_back(n->stake);
        return true;
    });
    if (corrupt) return makeError(ErrorCode::SERIALIZATION_ERROR, "corrupt neuron record", impl_->path);
    return mg;
}

Result<uint16_t> Registry::uidOf(uint16_t netuid, const std::string& hotkey) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto n = impl_->readNeuron(netuid, hotkey);
    if (!n) return makeError(ErrorCode::NOT_REGISTERED, "hotkey not registered", utils::Logger::redactAddress(hotkey));
    return n->uid;
}

Result<void> Registry::setWeights(uint16_t netuid, const std::string& hotkey,
                                  const std::vector<uint16_t>& uids, const std::vector<double>& weights) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    SUBVAULT_CHECK(impl_->db.isOpen(), ErrorCode::DATABASE_ERROR, "registry not open");
    SUBVAULT_CHECK(uids.size() == weights.size(), ErrorCode::VALIDATION_FAILED, "uids and weights differ in length");
    for (double w : weights) {
        SUBVAULT_CHECK(std::isfinite(w) && w >= 0.0, ErrorCode::VALIDATION_FAILED, "weights must be non-negative");
    }
    
    if (!impl_->db.beginTransaction()) return makeError(ErrorCode::DATABASE_ERROR, "registry busy");
    auto subnet = impl_->readSubnet(netuid);
    auto caller = impl_->readNeuron(netuid, hotkey);
    if (!subnet || !caller) {
        impl_->db.rollbackTransaction();
        return makeError(ErrorCode::NOT_REGISTERED, "caller not registered on subnet " + std::to_string(netuid));
    }
    uint16_t n = (*subnet).value("n", static_cast<uint16_t>(0));
    for (uint16_t uid : uids) {
        if (uid >= n) {
            impl_->db.rollbackTransaction();
            return makeError(ErrorCode::VALIDATION_FAILED, "uid " + std::to_string(uid) + " out of range");
        }
    }
    
    double maxWeight = 0.0;
    for (double w : weights) maxWeight = std::max(maxWeight, w);
    
    json j;
    j["uids"] = uids;
    std::vector<uint16_t> scaled;
    scaled.reserve(weights.size());
    for (double w : weights) {
        double v = maxWeight > 0.0 ? std::round(w / maxWeight * U16_MAX_WEIGHT) : 0.0;
        scaled.push_back(static_cast<uint16_t>(v));
    }
    j["weights"] = scaled;
    
    database::WriteBatch batch;
    batch.put(weightsKey(netuid, caller->uid), j.dump());
    if (!impl_->commitBatch(batch)) return makeError(ErrorCode::DATABASE_ERROR, "weights write failed");
    return {};
}

Result<std::vector<std::pair<uint16_t, uint16_t>>> Registry::weights(uint16_t netuid, uint16_t uid) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto bytes = impl_->db.get(weightsKey(netuid, uid));
    if (bytes.empty()) return makeError(ErrorCode::NOT_FOUND, "no weights set by uid " + std::to_string(uid));
    
    json j = json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (j.is_discarded() || !j.contains("uids") || !j.contains("weights")) {
        return makeError(ErrorCode::SERIALIZATION_ERROR, "corrupt weights record");
    }
    std::vector<uint16_t> uids;
    std::vector<uint16_t> ws;
    try {
        uids = j.at("uids").get<std::vector<uint16_t>>();
        ws = j.at("weights").get<std::vector<uint16_t>>();
    } catch (const json::exception& e) {
        return makeError(ErrorCode::SERIALIZATION_ERROR, "corrupt weights record", e.what());
    }
    if (uids.size() != ws.size()) return makeError(ErrorCode::SERIALIZATION_ERROR, "corrupt weights record");
    
    std::vector<std::pair<uint16_t, uint16_t>> out;
    for (size_t i = 0; i < uids.size(); i++) out.emplace_back(uids[i], ws[i]);
    return out;
}

uint64_t Registry::block() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->readBlock();
}

}
}
