#pragma once

#include "network/protocol.h"
#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <cstdint>

namespace subvault {
namespace network {

struct AxonConfig {
    std::string ip = "127.0.0.1";
    uint16_t port = 8091;
    size_t maxWorkers = 10;
    uint32_t maxConnections = 256;
    uint32_t banSeconds = 3600;
    uint32_t idleTimeoutSeconds = 60;
};

struct AxonStats {
    uint64_t connections;
    uint64_t bytesSent;
    uint64_t bytesReceived;
    uint64_t requestsHandled;
    uint64_t violations;
    uint64_t uptime;
};

// Request/response server. Each inbound frame whose command has a handler
// is run on the worker pool and its reply is written back on the same
// connection. Framing violations and rate abuse ban the remote address.
class Axon {
public:
    using Handler = std::function<Message(const std::string& peerId, const Message& request)>;
    
    explicit Axon(const AxonConfig& config);
    ~Axon();
    
    Axon(const Axon&) = delete;
    Axon& operator=(const Axon&) = delete;
    
    void attach(const std::string& command, Handler handler);
    
    // Port 0 binds an ephemeral port; port() reports the bound one.
    bool start();
    void stop();
    bool isRunning() const;
    uint16_t port() const;
    
    void ban(const std::string& address, uint32_t seconds);
    bool unban(const std::string& address);
    bool isBanned(const std::string& address) const;
    
    AxonStats getStats() const;
    std::string toString() const;
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
