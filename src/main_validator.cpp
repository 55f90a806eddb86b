#include "core/validator.h"
#include "core/runner.h"

int main(int argc, char* argv[]) {
    using namespace subvault::core;
    return runNeuron(argc, argv, Role::VALIDATOR, [](const NeuronConfig& config) -> std::unique_ptr<Neuron> {
        return std::make_unique<Validator>(config);
    });
}
