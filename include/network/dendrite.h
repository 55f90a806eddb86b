#pragma once

#include "network/protocol.h"
#include "core/registry.h"
#include "infrastructure/error_handling.h"
#include <string>
#include <optional>
#include <atomic>
#include <cstdint>

namespace subvault {
namespace core { class Wallet; }

namespace network {

constexpr double DEFAULT_QUERY_TIMEOUT = 12.0;

// Blocking client: one connection per call.
class Dendrite {
public:
    explicit Dendrite(const core::Wallet& wallet);
    
    // Fills in hotkeys, nonce and signature, then exchanges one frame.
    Result<RetrieveResponse> call(const core::AxonInfo& axon, RetrieveRequest request,
                                  double timeoutSeconds = DEFAULT_QUERY_TIMEOUT);
    
    // Chunk data on status 200, nullopt on any failure.
    std::optional<std::string> query(const core::AxonInfo& axon, const RetrieveRequest& request,
                                     double timeoutSeconds = DEFAULT_QUERY_TIMEOUT);
    
    // Strictly increasing across calls, seeded from wall-clock nanoseconds.
    uint64_t nextNonce();
    
    std::string toString() const;
    
private:
    const core::Wallet& wallet_;
    std::atomic<uint64_t> lastNonce_{0};
};

// Sends one frame and waits for one reply frame within the timeout.
Result<Message> exchange(const std::string& ip, uint16_t port, const Message& request, double timeoutSeconds);

}
}
