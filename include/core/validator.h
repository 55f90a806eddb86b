#pragma once

#include "core/neuron.h"
#include "core/allocate.h"
#include "network/dendrite.h"
#include <memory>
#include <string>
#include <atomic>
#include <vector>

namespace subvault {
namespace core {

// Estimates each miner's capacity by challenging random chunks and
// scores miners on what they have proven to hold.
class Validator : public Neuron {
public:
    explicit Validator(const NeuronConfig& config);
    ~Validator() override;
    
    // Registration check, initial allocations and hash store generation.
    Result<void> start() override;
    // One challenge pass over every miner; throws std::runtime_error when
    // hash generation or the registry fails.
    void step();
    // Loops step() until stop(), logging step failures.
    void run() override;
    void stop() override;
    
    // verified = next; next = floor(next * 1.1)
    static void grow(Allocation& next, Allocation& verified);
    // next = max(floor(next * 0.9), minChunks); verified = min(next, verified)
    static void shrink(Allocation& next, Allocation& verified, uint64_t minChunks);
    
    // L1-normalised copy of the scores; uniform when they sum to zero.
    std::vector<double> normalizedWeights() const;
    Result<void> setWeights();
    // Resizes the per-uid state after a metagraph change. Uids whose hotkey
    // changed start over with fresh allocations and a score of 1; those
    // allocations (other than our own) are returned for generation.
    std::vector<Allocation> syncMetagraph();
    
    const std::vector<Allocation>& nextAllocations() const { return next_; }
    const std::vector<Allocation>& verifiedAllocations() const { return verified_; }
    const std::vector<double>& scores() const { return scores_; }
    uint64_t stepCount() const { return step_; }
    
private:
    Allocation freshAllocation(const std::string& minerHotkey, uint64_t nChunks) const;
    void challenge(size_t uid, const AxonInfo& axon);
    void updateScores();
    std::vector<Allocation> generationSet() const;
    
    std::unique_ptr<network::Dendrite> dendrite_;
    std::vector<std::string> hotkeys_;
    std::vector<Allocation> next_;
    std::vector<Allocation> verified_;
    std::vector<double> scores_;
    std::atomic<uint64_t> step_{0};
};

}
}
