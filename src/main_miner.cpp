#include "core/miner.h"
#include "core/runner.h"

int main(int argc, char* argv[]) {
    using namespace subvault::core;
    return runNeuron(argc, argv, Role::MINER, [](const NeuronConfig& config) -> std::unique_ptr<Neuron> {
        return std::make_unique<Miner>(config);
    });
}
