#pragma once

#include "core/neuron.h"
#include <functional>
#include <memory>

namespace subvault {
namespace core {

using NeuronFactory = std::function<std::unique_ptr<Neuron>(const NeuronConfig&)>;

// Process entry shared by both roles: parses flags, takes the per-role
// instance lock, sets up logging, then start/run/stop on the neuron the
// factory builds. SIGINT and SIGTERM request a stop. Returns the exit code.
int runNeuron(int argc, char* argv[], Role role, const NeuronFactory& makeNeuron);

}
}
