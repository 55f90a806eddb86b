#include "network/dendrite.h"
#include "core/wallet.h"
#include "utils/logger.h"
#include <chrono>
#include <array>
#include <cstring>
#include <sys/socket.h>
#include <netdb.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>

namespace subvault {
namespace network {

namespace {

using Clock = std::chrono::steady_clock;

class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() { if (fd_ >= 0) close(fd_); }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;
    int get() const { return fd_; }
private:
    int fd_;
};

static int remainingMs(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

static bool resolve(const std::string& host, uint16_t port, struct sockaddr_in& addr) {
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1) return true;
    
    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    struct addrinfo* res = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res) return false;
    struct sockaddr_in* ipv4 = reinterpret_cast<struct sockaddr_in*>(res->ai_addr);
    addr.sin_addr = ipv4->sin_addr;
    freeaddrinfo(res);
    return true;
}

}

Result<Message> exchange(const std::string& ip, uint16_t port, const Message& request, double timeoutSeconds) {
    auto deadline = Clock::now() + std::chrono::milliseconds(static_cast<int64_t>(timeoutSeconds * 1000.0));
    
    struct sockaddr_in addr;
    if (!resolve(ip, port, addr)) {
        return makeError(ErrorCode::NETWORK_ERROR, "cannot resolve " + ip);
    }
    
    SocketGuard sock(socket(AF_INET, SOCK_STREAM, 0));
    if (sock.get() < 0) return makeError(ErrorCode::NETWORK_ERROR, "socket() failed");
    int flags = fcntl(sock.get(), F_GETFL, 0);
    if (flags < 0 || fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        return makeError(ErrorCode::NETWORK_ERROR, "cannot make socket non-blocking");
    }
    
    std::string endpoint = ip + ":" + std::to_string(port);
    if (::connect(sock.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        if (errno != EINPROGRESS) return makeError(ErrorCode::NETWORK_ERROR, "connect failed", endpoint);
        struct pollfd pfd;
        pfd.fd = sock.get();
        pfd.events = POLLOUT;
        int pr = poll(&pfd, 1, remainingMs(deadline));
        if (pr == 0) return makeError(ErrorCode::TIMEOUT, "connect timed out", endpoint);
        if (pr < 0) return makeError(ErrorCode::NETWORK_ERROR, "connect poll failed", endpoint);
        int err = 0;
        socklen_t len = sizeof(err);
        if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &err, &len) != 0 || err != 0) {
            return makeError(ErrorCode::NETWORK_ERROR, "connect refused", endpoint);
        }
    }
    
    std::vector<uint8_t> out = request.serialize();
    size_t sent = 0;
    while (sent < out.size()) {
        ssize_t n = ::send(sock.get(), out.data() + sent, out.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            struct pollfd pfd;
            pfd.fd = sock.get();
            pfd.events = POLLOUT;
            int pr = poll(&pfd, 1, remainingMs(deadline));
            if (pr <= 0) return makeError(ErrorCode::TIMEOUT, "send timed out", endpoint);
            continue;
        }
        return makeError(ErrorCode::NETWORK_ERROR, "send failed", endpoint);
    }
    
    std::vector<uint8_t> buffer;
    std::array<uint8_t, 64 * 1024> tmp{};
    for (;;) {
        Message reply;
        size_t consumed = 0;
        FrameStatus st = parseFrame(buffer.data(), buffer.size(), reply, consumed);
        if (st == FrameStatus::OK) {
            reply.from = endpoint;
            return reply;
        }
        if (st != FrameStatus::INCOMPLETE) {
            return makeError(ErrorCode::SERIALIZATION_ERROR, std::string("bad reply frame: ") + frameStatusName(st), endpoint);
        }
        
        int wait = remainingMs(deadline);
        if (wait == 0) return makeError(ErrorCode::TIMEOUT, "reply timed out", endpoint);
        struct pollfd pfd;
        pfd.fd = sock.get();
        pfd.events = POLLIN;
        int pr = poll(&pfd, 1, wait);
        if (pr == 0) return makeError(ErrorCode::TIMEOUT, "reply timed out", endpoint);
        if (pr < 0) {
            if (errno == EINTR) continue;
            return makeError(ErrorCode::NETWORK_ERROR, "recv poll failed", endpoint);
        }
        
        ssize_t n = ::recv(sock.get(), tmp.data(), tmp.size(), 0);
        if (n > 0) {
            buffer.insert(buffer.end(), tmp.data(), tmp.data() + n);
            continue;
        }
        if (n == 0) return makeError(ErrorCode::NETWORK_ERROR, "connection closed before reply", endpoint);
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
        return makeError(ErrorCode::NETWORK_ERROR, "recv failed", endpoint);
    }
}

Dendrite::Dendrite(const core::Wallet& wallet) : wallet_(wallet) {}

uint64_t Dendrite::nextNonce() {
    uint64_t now = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
    uint64_t prev = lastNonce_.load();
    uint64_t next;
    do {
        next = now > prev ? now : prev + 1;
    } while (!lastNonce_.compare_exchange_weak(prev, next));
    return next;
}

Result<RetrieveResponse> Dendrite::call(const core::AxonInfo& axon, RetrieveRequest request, double timeoutSeconds) {
    if (!axon.isServing()) {
        return makeError(ErrorCode::NETWORK_ERROR, "axon not serving", utils::Logger::redactAddress(axon.hotkey));
    }
    request.dendriteHotkey = wallet_.hotkeyAddress();
    request.axonHotkey = axon.hotkey;
    request.nonce = nextNonce();
    request.signature = crypto::toHex(wallet_.sign(request.signingMessage()));
    
    auto reply = exchange(axon.ip, axon.port, Message::make(CMD_RETRIEVE, request.toJson()), timeoutSeconds);
    if (reply.failed()) return reply.error();
    if (reply.value().command != CMD_RESPONSE) {
        return makeError(ErrorCode::SERIALIZATION_ERROR, "unexpected reply command: " + reply.value().command);
    }
    auto resp = RetrieveResponse::fromJson(reply.value().body());
    if (!resp) return makeError(ErrorCode::SERIALIZATION_ERROR, "malformed retrieve response");
    return *resp;
}

std::optional<std::string> Dendrite::query(const core::AxonInfo& axon, const RetrieveRequest& request,
                                           double timeoutSeconds) {
    auto resp = call(axon, request, timeoutSeconds);
    if (resp.failed()) {
        LOG_DEBUG("Query to " + axon.toString() + " failed: " + resp.error().describe());
        return std::nullopt;
    }
    if (!resp.value().ok()) {
        LOG_DEBUG("Query to " + axon.toString() + " returned " + std::to_string(resp.value().status) +
                  " " + resp.value().message);
        return std::nullopt;
    }
    return resp.value().data;
}

std::string Dendrite::toString() const {
    return "Dendrite(" + utils::Logger::redactAddress(wallet_.hotkeyAddress()) + ")";
}

}
}
