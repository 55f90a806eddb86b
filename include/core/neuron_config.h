#pragma once

#include "core/allocate.h"
#include "core/wallet.h"
#include "network/axon.h"
#include "infrastructure/error_handling.h"
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <cstdint>

namespace subvault {
namespace core {

constexpr uint16_t DEFAULT_NETUID = 12;
constexpr const char* DEFAULT_CHAIN_ENDPOINT = "ws://127.0.0.1:9946";
constexpr const char* DEFAULT_NETWORK = "local";

enum class Role {
    MINER,
    VALIDATOR
};

const char* roleName(Role role);

struct ChainEndpoint {
    std::string scheme;
    std::string host;
    uint16_t port = 0;
    
    std::string toString() const;
};

// ws:// or wss:// with an explicit host and port.
Result<ChainEndpoint> parseEndpoint(const std::string& url);
// finney, test, local; nullopt for anything else.
std::optional<std::string> networkEndpoint(const std::string& network);

struct NeuronConfig {
    Role role = Role::MINER;
    uint16_t netuid = DEFAULT_NETUID;
    
    std::string network = DEFAULT_NETWORK;
    std::string chainEndpoint = DEFAULT_CHAIN_ENDPOINT;
    ChainEndpoint endpoint;
    std::string registryDir;
    bool selfRegister = false;
    
    WalletConfig wallet;
    bool createWallet = false;
    
    network::AxonConfig axon;
    double queryTimeout = 12.0;
    
    bool debug = false;
    bool trace = false;
    std::string loggingDir;
    std::string fullPath;
    
    std::string dbRootPath;
    uint64_t chunkSize = CHUNK_SIZE;
    size_t generateWorkers = 10;
    bool restart = false;
    
    double minerThreshold = 0.9;
    uint64_t minerMaxChunks = 0;
    double minValidatorStake = 0.0;
    uint64_t resyncInterval = 60;
    
    uint64_t validatorMinChunks = MIN_N_CHUNKS;
    double alpha = 0.9;
    uint64_t epochLength = 1000;
    double stepInterval = 1.0;
    
    std::string registryPath() const;
    std::string logPath() const;
    std::string toString() const;
};

struct CommandLine {
    bool showHelp = false;
    std::string configPath;
    std::vector<std::pair<std::string, std::string>> overrides;
};

// Parses --dotted.flags into key/value overrides for utils::Config.
Result<CommandLine> parseCommandLine(int argc, char* argv[], Role role);

// Builds and validates a NeuronConfig from the process Config.
Result<NeuronConfig> loadNeuronConfig(Role role);

// Defaults, then --config FILE, then flags; validates and creates full_path.
Result<NeuronConfig> configure(int argc, char* argv[], Role role, bool& showHelp);

void printHelp(const char* progName, Role role);

}
}
