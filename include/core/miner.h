#pragma once

#include "core/neuron.h"
#include "core/allocate.h"
#include "database/chunk_store.h"
#include "network/axon.h"
#include "network/protocol.h"
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace subvault {
namespace core {

// Commits disk to every validator on the subnet and answers their
// retrieve challenges from the generated chunk stores.
class Miner : public Neuron {
public:
    explicit Miner(const NeuronConfig& config);
    ~Miner() override;
    
    // Registration check, first allocation pass, axon start and publish.
    Result<void> start() override;
    // Blocks until stop(); resyncs every miner.resync_interval seconds.
    void run() override;
    void stop() override;
    
    network::RetrieveResponse handleRetrieve(const network::RetrieveRequest& request);
    
    // Hotkeys this miner serves: every other uid meeting the stake floor.
    std::vector<std::string> validatorHotkeys(const Metagraph& metagraph) const;
    std::vector<Allocation> computeAllocations(const Metagraph& metagraph) const;
    // Regenerates stores when the validator set changed since the last pass.
    // Stores of validators no longer served are deleted before generating.
    Result<void> refreshAllocations(bool force = false);
    
    std::vector<Allocation> allocations() const;
    uint16_t axonPort() const;
    
private:
    // On-disk size of the stores kept for `validators`.
    uint64_t heldBytes(const std::vector<std::string>& validators) const;
    void removeStore(const std::string& path);
    network::Message onRetrieve(const std::string& peerId, const network::Message& request);
    
    std::unique_ptr<network::Axon> axon_;
    
    mutable std::mutex allocMtx_;
    std::vector<Allocation> allocations_;
    std::map<std::string, std::shared_ptr<database::ChunkStore>> stores_;
    std::set<std::string> served_;
    bool generated_ = false;
    
    std::mutex nonceMtx_;
    std::map<std::string, uint64_t> lastNonce_;
};

}
}
