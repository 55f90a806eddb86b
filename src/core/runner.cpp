#include "core/runner.h"
#include "utils/logger.h"
#include "utils/single_instance.h"
#include <csignal>
#include <iostream>
#include <string>

namespace subvault {
namespace core {

static Neuron* g_neuron = nullptr;

static void signalHandler(int signal) {
    if ((signal == SIGINT || signal == SIGTERM) && g_neuron) {
        g_neuron->requestStop();
    }
}

int runNeuron(int argc, char* argv[], Role role, const NeuronFactory& makeNeuron) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);
    
    const std::string name = roleName(role);
    const std::string prog = "subvault-" + name;
    
    bool showHelp = false;
    auto config = configure(argc, argv, role, showHelp);
    if (showHelp) {
        printHelp(argv[0], role);
        return 0;
    }
    if (config.failed()) {
        std::cerr << prog << ": " << config.error().describe() << "\n";
        return 1;
    }
    const NeuronConfig& cfg = config.value();
    
    std::string instanceErr;
    auto instanceLock = utils::SingleInstanceLock::acquire(cfg.fullPath, name + ".lock", &instanceErr);
    if (!instanceLock) {
        std::cerr << prog << ": " << instanceErr << "\n";
        return 1;
    }
    
    setupLogging(cfg);
    LOG_INFO("Running " + name + " for subnet: " + std::to_string(cfg.netuid) +
             " on network: " + cfg.chainEndpoint + " with config:");
    LOG_INFO(cfg.toString());
    
    std::unique_ptr<Neuron> neuron = makeNeuron(cfg);
    g_neuron = neuron.get();
    
    int code = 0;
    auto started = neuron->start();
    if (started.failed()) {
        LOG_ERROR(started.error().describe());
        std::cerr << prog << ": " << started.error().describe() << "\n";
        code = 1;
    } else {
        neuron->run();
    }
    neuron->stop();
    g_neuron = nullptr;
    neuron.reset();
    utils::Logger::shutdown();
    return code;
}

}
}
