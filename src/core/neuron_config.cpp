#include "core/neuron_config.h"
#include "core/allocate.h"
#include "core/registry.h"
#include "utils/config.h"
#include "utils/utils.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <cmath>
#include <iterator>
#include <getopt.h>
#include <arpa/inet.h>

namespace subvault {
namespace core {

namespace {

struct FlagSpec {
    const char* name;
    bool takesValue;
    const char* help;
};

static const FlagSpec COMMON_FLAGS[] = {
    {"help", false, "Show this help"},
    {"config", true, "Read key=value settings from FILE"},
    {"netuid", true, "Subnet uid (default: 12)"},
    {"subtensor.network", true, "finney, test or local (default: local)"},
    {"subtensor.chain_endpoint", true, "ws:// or wss:// endpoint, overrides the network preset"},
    {"subtensor.registry_dir", true, "Directory holding the local registry files"},
    {"subtensor.register", false, "Register the hotkey on the local registry if missing"},
    {"wallet.name", true, "Coldkey wallet name (default: default)"},
    {"wallet.hotkey", true, "Hotkey name (default: default)"},
    {"wallet.path", true, "Wallet root directory"},
    {"wallet.create", false, "Create missing coldkey/hotkey files"},
    {"axon.ip", true, "Axon bind and advertised IPv4 address"},
    {"axon.port", true, "Axon port (default: 8091)"},
    {"axon.max_workers", true, "Axon request workers (default: 10)"},
    {"axon.timeout", true, "Dendrite query timeout in seconds (default: 12)"},
    {"logging.debug", false, "Log at DEBUG level"},
    {"logging.trace", false, "Log at TRACE level"},
    {"logging.logging_dir", true, "Root of per-neuron log directories"},
    {"db_root_path", true, "Root of allocation databases"},
    {"allocate.chunk_size", true, "Chunk size in bytes (default: 1048576)"},
    {"allocate.workers", true, "Allocation generation workers (default: 10)"},
    {"allocate.restart", false, "Regenerate allocations from empty stores"},
};

static const FlagSpec MINER_FLAGS[] = {
    {"miner.threshold", true, "Share of free disk to commit (default: 0.9)"},
    {"miner.max_chunks", true, "Cap on chunks per validator, 0 for none"},
    {"miner.min_validator_stake", true, "Ignore validators staking less than this"},
    {"miner.resync_interval", true, "Seconds between metagraph resyncs (default: 60)"},
};

static const FlagSpec VALIDATOR_FLAGS[] = {
    {"validator.min_chunks", true, "Lower bound of a miner's estimated allocation (default: 1024)"},
    {"validator.alpha", true, "Score moving-average factor (default: 0.9)"},
    {"validator.epoch_length", true, "Steps between weight updates (default: 1000)"},
    {"validator.step_interval", true, "Seconds to sleep between steps (default: 1)"},
};

static std::vector<FlagSpec> flagsFor(Role role) {
    std::vector<FlagSpec> flags(std::begin(COMMON_FLAGS), std::end(COMMON_FLAGS));
    if (role == Role::MINER) flags.insert(flags.end(), std::begin(MINER_FLAGS), std::end(MINER_FLAGS));
    else flags.insert(flags.end(), std::begin(VALIDATOR_FLAGS), std::end(VALIDATOR_FLAGS));
    return flags;
}

static bool parseUnsigned(const std::string& s, uint64_t& out) {
    if (s.empty() || s[0] == '-' || s[0] == '+') return false;
    try {
        size_t pos = 0;
        out = std::stoull(s, &pos);
        return pos == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

static bool parseReal(const std::string& s, double& out) {
    if (s.empty()) return false;
    try {
        size_t pos = 0;
        out = std::stod(s, &pos);
        return pos == s.size() && std::isfinite(out);
    } catch (const std::exception&) {
        return false;
    }
}

static Result<uint64_t> readUnsigned(const utils::Config& cfg, const std::string& key, uint64_t lo, uint64_t hi) {
    std::string raw = utils::Formatter::trim(cfg.getString(key));
    uint64_t v = 0;
    if (!parseUnsigned(raw, v) || v < lo || v > hi) {
        return makeError(ErrorCode::INVALID_CONFIG, "--" + key + " must be an integer in [" +
                         std::to_string(lo) + ", " + std::to_string(hi) + "], got '" + raw + "'");
    }
    return v;
}

static Result<double> readReal(const utils::Config& cfg, const std::string& key, double lo, double hi) {
    std::string raw = utils::Formatter::trim(cfg.getString(key));
    double v = 0.0;
    if (!parseReal(raw, v) || v < lo || v > hi) {
        std::ostringstream ss;
        ss << "--" << key << " must be a number in [" << lo << ", " << hi << "], got '" << raw << "'";
        return makeError(ErrorCode::INVALID_CONFIG, ss.str());
    }
    return v;
}

}

const char* roleName(Role role) {
    return role == Role::MINER ? "miner" : "validator";
}

std::string ChainEndpoint::toString() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

Result<ChainEndpoint> parseEndpoint(const std::string& url) {
    ChainEndpoint ep;
    auto sep = url.find("://");
    if (sep == std::string::npos) {
        return makeError(ErrorCode::INVALID_CONFIG, "chain endpoint lacks a scheme", url);
    }
    ep.scheme = utils::Formatter::toLower(url.substr(0, sep));
    if (ep.scheme != "ws" && ep.scheme != "wss") {
        return makeError(ErrorCode::INVALID_CONFIG, "chain endpoint must use ws:// or wss://", url);
    }
    
    std::string rest = url.substr(sep + 3);
    auto slash = rest.find('/');
    if (slash != std::string::npos) rest = rest.substr(0, slash);
    auto colon = rest.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        return makeError(ErrorCode::INVALID_CONFIG, "chain endpoint needs host:port", url);
    }
    ep.host = rest.substr(0, colon);
    uint64_t port = 0;
    if (!parseUnsigned(rest.substr(colon + 1), port) || port == 0 || port > 65535) {
        return makeError(ErrorCode::INVALID_CONFIG, "chain endpoint port is invalid", url);
    }
    ep.port = static_cast<uint16_t>(port);
    return ep;
}

std::optional<std::string> networkEndpoint(const std::string& network) {
    if (network == "finney") return std::string("wss://entrypoint-finney.opentensor.ai:443");
    if (network == "test") return std::string("wss://test.finney.opentensor.ai:443");
    if (network == "local") return std::string(DEFAULT_CHAIN_ENDPOINT);
    return std::nullopt;
}

std::string NeuronConfig::registryPath() const {
    return Registry::pathFor(registryDir, endpoint.host, endpoint.port);
}

std::string NeuronConfig::logPath() const {
    return (std::filesystem::path(fullPath) / (std::string(roleName(role)) + ".log")).string();
}

std::string NeuronConfig::toString() const {
    nlohmann::json j;
    j["role"] = roleName(role);
    j["netuid"] = netuid;
    j["subtensor"] = {{"network", network}, {"chain_endpoint", chainEndpoint},
                      {"registry_dir", registryDir}, {"register", selfRegister}};
    j["wallet"] = {{"name", wallet.name}, {"hotkey", wallet.hotkey}, {"path", wallet.path}};
    j["axon"] = {{"ip", axon.ip}, {"port", axon.port}, {"max_workers", axon.maxWorkers},
                 {"timeout", queryTimeout}};
    j["logging"] = {{"debug", debug}, {"trace", trace}, {"logging_dir", loggingDir}};
    j["full_path"] = fullPath;
    j["db_root_path"] = dbRootPath;
    j["allocate"] = {{"chunk_size", chunkSize}, {"workers", generateWorkers}, {"restart", restart}};
    if (role == Role::MINER) {
        j["miner"] = {{"threshold", minerThreshold}, {"max_chunks", minerMaxChunks},
                      {"min_validator_stake", minValidatorStake}, {"resync_interval", resyncInterval}};
    } else {
        j["validator"] = {{"min_chunks", validatorMinChunks}, {"alpha", alpha},
                          {"epoch_length", epochLength}, {"step_interval", stepInterval}};
    }
    return j.dump();
}

Result<CommandLine> parseCommandLine(int argc, char* argv[], Role role) {
    std::vector<FlagSpec> flags = flagsFor(role);
    std::vector<struct option> longOptions;
    longOptions.reserve(flags.size() + 1);
    for (size_t i = 0; i < flags.size(); i++) {
        longOptions.push_back({flags[i].name, flags[i].takesValue ? required_argument : no_argument,
                               nullptr, static_cast<int>(256 + i)});
    }
    longOptions.push_back({nullptr, 0, nullptr, 0});
    
    CommandLine cl;
    optind = 0;
    opterr = 0;
    int opt;
    int optionIndex = 0;
    while ((opt = getopt_long(argc, argv, "+h", longOptions.data(), &optionIndex)) != -1) {
        if (opt == 'h') {
            cl.showHelp = true;
            continue;
        }
        if (opt < 256 || opt >= static_cast<int>(256 + flags.size())) {
            std::string bad = optind > 0 && optind <= argc ? argv[optind - 1] : "?";
            return makeError(ErrorCode::INVALID_CONFIG, "unknown or incomplete option: " + bad);
        }
        const FlagSpec& flag = flags[static_cast<size_t>(opt - 256)];
        std::string name = flag.name;
        if (name == "help") {
            cl.showHelp = true;
        } else if (name == "config") {
            cl.configPath = optarg;
        } else if (flag.takesValue) {
            cl.overrides.emplace_back(name, optarg);
        } else {
            cl.overrides.emplace_back(name, "true");
        }
    }
    if (optind < argc) {
        return makeError(ErrorCode::INVALID_CONFIG, std::string("unexpected argument: ") + argv[optind]);
    }
    return cl;
}

Result<NeuronConfig> loadNeuronConfig(Role role) {
    const utils::Config& cfg = utils::Config::instance();
    NeuronConfig nc;
    nc.role = role;
    
    auto netuid = readUnsigned(cfg, "netuid", 1, 65535);
    if (netuid.failed()) return netuid.error();
    nc.netuid = static_cast<uint16_t>(netuid.value());
    
    nc.network = utils::Formatter::toLower(utils::Formatter::trim(cfg.getString("subtensor.network", DEFAULT_NETWORK)));
    auto preset = networkEndpoint(nc.network);
    if (!preset) {
        return makeError(ErrorCode::INVALID_CONFIG, "unknown --subtensor.network '" + nc.network +
                         "' (expected finney, test or local)");
    }
    std::string explicitEndpoint = utils::Formatter::trim(cfg.getString("subtensor.chain_endpoint"));
    nc.chainEndpoint = explicitEndpoint.empty() ? *preset : explicitEndpoint;
    auto ep = parseEndpoint(nc.chainEndpoint);
    if (ep.failed()) return ep.error();
    nc.endpoint = ep.value();
    nc.registryDir = utils::expandUser(cfg.getString("subtensor.registry_dir", "~/.subvault/chain"));
    nc.selfRegister = cfg.getBool("subtensor.register");
    
    nc.wallet.name = cfg.getString("wallet.name", "default");
    nc.wallet.hotkey = cfg.getString("wallet.hotkey", "default");
    nc.wallet.path = utils::expandUser(cfg.getString("wallet.path", "~/.subvault/wallets"));
    if (nc.wallet.name.empty() || nc.wallet.hotkey.empty() ||
        nc.wallet.name.find('/') != std::string::npos || nc.wallet.hotkey.find('/') != std::string::npos) {
        return makeError(ErrorCode::INVALID_CONFIG, "--wallet.name and --wallet.hotkey must be plain names");
    }
    nc.createWallet = cfg.getBool("wallet.create");
    
    nc.axon.ip = utils::Formatter::trim(cfg.getString("axon.ip", "127.0.0.1"));
    struct in_addr parsed;
    if (inet_pton(AF_INET, nc.axon.ip.c_str(), &parsed) != 1) {
        return makeError(ErrorCode::INVALID_CONFIG, "--axon.ip must be an IPv4 address, got '" + nc.axon.ip + "'");
    }
    auto port = readUnsigned(cfg, "axon.port", 1, 65535);
    if (port.failed()) return port.error();
    nc.axon.port = static_cast<uint16_t>(port.value());
    auto maxWorkers = readUnsigned(cfg, "axon.max_workers", 1, 1024);
    if (maxWorkers.failed()) return maxWorkers.error();
    nc.axon.maxWorkers = static_cast<size_t>(maxWorkers.value());
    auto timeout = readReal(cfg, "axon.timeout", 0.001, 3600.0);
    if (timeout.failed()) return timeout.error();
    nc.queryTimeout = timeout.value();
    
    nc.debug = cfg.getBool("logging.debug");
    nc.trace = cfg.getBool("logging.trace");
    nc.loggingDir = utils::expandUser(cfg.getString("logging.logging_dir", "~/.subvault/miners"));
    nc.fullPath = (std::filesystem::path(nc.loggingDir) / nc.wallet.name / nc.wallet.hotkey /
                   ("netuid" + std::to_string(nc.netuid)) / roleName(role)).string();
    
    nc.dbRootPath = utils::expandUser(cfg.getString("db_root_path", "~/subvault-db"));
    auto chunkSize = readUnsigned(cfg, "allocate.chunk_size", 1, MAX_CHUNK_SIZE);
    if (chunkSize.failed()) return chunkSize.error();
    nc.chunkSize = chunkSize.value();
    auto workers = readUnsigned(cfg, "allocate.workers", 1, 256);
    if (workers.failed()) return workers.error();
    nc.generateWorkers = static_cast<size_t>(workers.value());
    nc.restart = cfg.getBool("allocate.restart");
    
    if (role == Role::MINER) {
        auto threshold = readReal(cfg, "miner.threshold", 0.0, 1.0);
        if (threshold.failed()) return threshold.error();
        if (threshold.value() <= 0.0) return makeError(ErrorCode::INVALID_CONFIG, "--miner.threshold must be above 0");
        nc.minerThreshold = threshold.value();
        auto maxChunks = readUnsigned(cfg, "miner.max_chunks", 0, UINT64_MAX);
        if (maxChunks.failed()) return maxChunks.error();
        nc.minerMaxChunks = maxChunks.value();
        auto minStake = readReal(cfg, "miner.min_validator_stake", 0.0, 1e18);
        if (minStake.failed()) return minStake.error();
        nc.minValidatorStake = minStake.value();
        auto resync = readUnsigned(cfg, "miner.resync_interval", 1, 86400);
        if (resync.failed()) return resync.error();
        nc.resyncInterval = resync.value();
    } else {
        auto minChunks = readUnsigned(cfg, "validator.min_chunks", 1, UINT32_MAX);
        if (minChunks.failed()) return minChunks.error();
        nc.validatorMinChunks = minChunks.value();
        auto alpha = readReal(cfg, "validator.alpha", 0.0, 1.0);
        if (alpha.failed()) return alpha.error();
        nc.alpha = alpha.value();
        auto epoch = readUnsigned(cfg, "validator.epoch_length", 1, UINT32_MAX);
        if (epoch.failed()) return epoch.error();
        nc.epochLength = epoch.value();
        auto interval = readReal(cfg, "validator.step_interval", 0.0, 3600.0);
        if (interval.failed()) return interval.error();
        nc.stepInterval = interval.value();
    }
    return nc;
}

Result<NeuronConfig> configure(int argc, char* argv[], Role role, bool& showHelp) {
    showHelp = false;
    auto cl = parseCommandLine(argc, argv, role);
    if (cl.failed()) return cl.error();
    if (cl.value().showHelp) {
        showHelp = true;
        return NeuronConfig{};
    }
    
    utils::Config& cfg = utils::Config::instance();
    cfg.reset();
    if (!cl.value().configPath.empty()) {
        std::string path = utils::expandUser(cl.value().configPath);
        if (!cfg.load(path)) return makeError(ErrorCode::FILE_NOT_FOUND, "cannot read config file", path);
    }
    for (const auto& [key, value] : cl.value().overrides) {
        cfg.set(key, value);
    }
    
    auto nc = loadNeuronConfig(role);
    if (nc.failed()) return nc;
    
    std::error_code ec;
    std::filesystem::create_directories(nc.value().fullPath, ec);
    if (ec) {
        return makeError(ErrorCode::PERMISSION_DENIED, "cannot create " + nc.value().fullPath + ": " + ec.message());
    }
    return nc;
}

void printHelp(const char* progName, Role role) {
    std::cout << "SubVault " << roleName(role) << " - storage subnet neuron\n\n";
    std::cout << "Usage: " << progName << " [options]\n\n";
    std::cout << "Options:\n";
    for (const auto& flag : flagsFor(role)) {
        std::string left = std::string("  --") + flag.name + (flag.takesValue ? " VALUE" : "");
        if (left.size() < 36) left.resize(36, ' ');
        else left += " ";
        std::cout << left << flag.help << "\n";
    }
}

}
}
