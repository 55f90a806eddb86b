#include "network/axon.h"
#include "utils/logger.h"
#include "utils/threading.h"
#include <unordered_map>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <array>
#include <ctime>
#include <cstring>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <algorithm>

namespace subvault {
namespace network {

namespace {

struct Connection {
    std::string id;
    std::string address;
    uint16_t port = 0;
    int socket = -1;
    uint64_t connectedAt = 0;
    uint64_t lastSeen = 0;
    std::vector<uint8_t> buffer;
    uint64_t windowStart = 0;
    uint64_t bytesInWindow = 0;
    uint64_t messagesInWindow = 0;
    std::mutex sendMtx;
};

static constexpr size_t RX_BUFFER_LIMIT = MAX_MESSAGE_SIZE * 2;
static constexpr uint64_t RX_RATE_WINDOW_SECONDS = 1;
static constexpr uint64_t RX_MAX_BYTES_PER_WINDOW = MAX_MESSAGE_SIZE * 2;
static constexpr uint64_t RX_MAX_MESSAGES_PER_WINDOW = 500;

static bool setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) return false;
    return true;
}

static void closeConnection(Connection& conn) {
    std::lock_guard<std::mutex> lock(conn.sendMtx);
    if (conn.socket >= 0) {
        shutdown(conn.socket, SHUT_RDWR);
        close(conn.socket);
        conn.socket = -1;
    }
}

}

struct Axon::Impl {
    AxonConfig config;
    std::unordered_map<std::string, std::shared_ptr<Connection>> connections;
    std::unordered_map<std::string, uint64_t> banned;
    std::unordered_map<std::string, Handler> handlers;
    mutable std::mutex mtx;
    std::atomic<bool> running{false};
    uint16_t boundPort = 0;
    int listenSocket = -1;
    std::thread acceptThread;
    std::thread recvThread;
    std::unique_ptr<utils::ThreadPool> workers;
    uint64_t startTime = 0;
    std::atomic<uint64_t> totalConnections{0};
    std::atomic<uint64_t> bytesSent{0};
    std::atomic<uint64_t> bytesReceived{0};
    std::atomic<uint64_t> requestsHandled{0};
    std::atomic<uint64_t> violations{0};
    
    void acceptLoop();
    void recvLoop();
    void dispatch(const std::shared_ptr<Connection>& conn, Message msg);
    bool sendRaw(Connection& conn, const std::vector<uint8_t>& data);
    void dropLocked(const std::string& id);
    bool isBannedLocked(const std::string& address);
};

bool Axon::Impl::isBannedLocked(const std::string& address) {
    auto it = banned.find(address);
    if (it == banned.end()) return false;
    if (static_cast<uint64_t>(std::time(nullptr)) < it->second) return true;
    banned.erase(it);
    return false;
}

void Axon::Impl::dropLocked(const std::string& id) {
    auto it = connections.find(id);
    if (it == connections.end()) return;
    closeConnection(*it->second);
    connections.erase(it);
}

void Axon::Impl::acceptLoop() {
    while (running) {
        struct pollfd pfd;
        pfd.fd = listenSocket;
        pfd.events = POLLIN;
        
        if (poll(&pfd, 1, 100) <= 0) continue;
        
        struct sockaddr_in clientAddr;
        socklen_t addrLen = sizeof(clientAddr);
        int clientSock = accept(listenSocket, reinterpret_cast<struct sockaddr*>(&clientAddr), &addrLen);
        
        if (clientSock < 0) continue;
        
        setNonBlocking(clientSock);
        
        char buf[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &clientAddr.sin_addr, buf, sizeof(buf));
        std::string addr = buf;
        uint16_t clientPort = ntohs(clientAddr.sin_port);
        
        std::lock_guard<std::mutex> lock(mtx);
        if (isBannedLocked(addr)) {
            close(clientSock);
            continue;
        }
        if (connections.size() >= config.maxConnections) {
            LOG_WARN("Axon connection limit reached, refusing " + addr);
            close(clientSock);
            continue;
        }
        
        auto conn = std::make_shared<Connection>();
        conn->id = addr + ":" + std::to_string(clientPort);
        conn->address = addr;
        conn->port = clientPort;
        conn->socket = clientSock;
        conn->connectedAt = static_cast<uint64_t>(std::time(nullptr));
        conn->lastSeen = conn->connectedAt;
        connections[conn->id] = conn;
        totalConnections++;
        LOG_TRACE("Axon accepted " + conn->id);
    }
}

void Axon::Impl::recvLoop() {
    while (running) {
        std::vector<struct pollfd> fds;
        std::vector<std::shared_ptr<Connection>> conns;
        uint64_t now = static_cast<uint64_t>(std::time(nullptr));
        
        {
            std::lock_guard<std::mutex> lock(mtx);
            std::vector<std::string> idle;
            for (auto& [id, conn] : connections) {
                if (config.idleTimeoutSeconds > 0 && now > conn->lastSeen + config.idleTimeoutSeconds) {
                    idle.push_back(id);
                    continue;
                }
                struct pollfd pfd;
                pfd.fd = conn->socket;
                pfd.events = POLLIN;
                pfd.revents = 0;
                fds.push_back(pfd);
                conns.push_back(conn);
            }
            for (const auto& id : idle) dropLocked(id);
        }
        
        if (fds.empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        
        int ret = poll(fds.data(), fds.size(), 100);
        if (ret <= 0) continue;
        
        for (size_t i = 0; i < fds.size(); i++) {
            auto& conn = conns[i];
            if (!(fds[i].revents & POLLIN) && (fds[i].revents & (POLLHUP | POLLERR | POLLNVAL))) {
                std::lock_guard<std::mutex> lock(mtx);
                dropLocked(conn->id);
                continue;
            }
            if (!(fds[i].revents & POLLIN)) continue;
            
            std::vector<Message> decoded;
            std::string violation;
            bool disconnected = false;
            
            if (conn->windowStart == 0) conn->windowStart = now;
            if (now >= conn->windowStart + RX_RATE_WINDOW_SECONDS) {
                conn->windowStart = now;
                conn->bytesInWindow = 0;
                conn->messagesInWindow = 0;
            }
            
            std::array<uint8_t, 64 * 1024> tmp{};
            for (;;) {
                ssize_t n = ::recv(conn->socket, tmp.data(), tmp.size(), 0);
                if (n > 0) {
                    conn->lastSeen = now;
                    bytesReceived += static_cast<uint64_t>(n);
                    conn->bytesInWindow += static_cast<uint64_t>(n);
                    if (conn->bytesInWindow > RX_MAX_BYTES_PER_WINDOW) {
                        violation = "rate_bytes";
                        break;
                    }
                    if (conn->buffer.size() + static_cast<size_t>(n) > RX_BUFFER_LIMIT) {
                        violation = "rx_buffer_overflow";
                        break;
                    }
                    conn->buffer.insert(conn->buffer.end(), tmp.data(), tmp.data() + n);
                    continue;
                }
                if (n == 0) {
                    disconnected = true;
                    break;
                }
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) break;
                violation = "recv_error";
                break;
            }
            
            if (violation.empty()) {
                size_t offset = 0;
                while (offset < conn->buffer.size()) {
                    Message msg;
                    size_t consumed = 0;
                    FrameStatus st = parseFrame(conn->buffer.data() + offset, conn->buffer.size() - offset, msg, consumed);
                    if (st == FrameStatus::INCOMPLETE) break;
                    if (st != FrameStatus::OK) {
                        violation = frameStatusName(st);
                        break;
                    }
                    offset += consumed;
                    msg.from = conn->id;
                    msg.timestamp = now;
                    decoded.push_back(std::move(msg));
                    conn->messagesInWindow += 1;
                    if (conn->messagesInWindow > RX_MAX_MESSAGES_PER_WINDOW) {
                        violation = "rate_msgs";
                        break;
                    }
                }
                if (offset > 0) {
                    conn->buffer.erase(conn->buffer.begin(), conn->buffer.begin() + static_cast<std::ptrdiff_t>(offset));
                }
            }
            
            if (!violation.empty()) {
                violations++;
                LOG_WARN("Axon banning " + conn->address + " (" + violation + ")");
                std::lock_guard<std::mutex> lock(mtx);
                banned[conn->address] = static_cast<uint64_t>(std::time(nullptr)) + config.banSeconds;
                dropLocked(conn->id);
                continue;
            }
            
            for (auto& msg : decoded) {
                dispatch(conn, std::move(msg));
            }
            
            if (disconnected) {
                std::lock_guard<std::mutex> lock(mtx);
                dropLocked(conn->id);
            }
        }
    }
}

void Axon::Impl::dispatch(const std::shared_ptr<Connection>& conn, Message msg) {
    Handler handler;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = handlers.find(msg.command);
        if (it != handlers.end()) handler = it->second;
    }
    if (!handler) {
        LOG_DEBUG("Axon has no handler for '" + msg.command + "' from " + conn->id);
        return;
    }
    
    try {
        workers->enqueue([this, conn, handler, msg = std::move(msg)]() {
            Message reply;
            try {
                reply = handler(conn->id, msg);
            } catch (const std::exception& e) {
                LOG_ERROR("Axon handler '" + msg.command + "' failed: " + e.what());
                return;
            }
            requestsHandled++;
            if (reply.command.empty()) return;
            if (!sendRaw(*conn, reply.serialize())) {
                LOG_DEBUG("Axon reply to " + conn->id + " not delivered");
            }
        });
    } catch (const std::runtime_error& e) {
        LOG_DEBUG(std::string("Axon dropped request: ") + e.what());
    }
}

bool Axon::Impl::sendRaw(Connection& conn, const std::vector<uint8_t>& data) {
    std::lock_guard<std::mutex> lock(conn.sendMtx);
    if (conn.socket < 0) return false;
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(conn.socket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            struct pollfd pfd;
            pfd.fd = conn.socket;
            pfd.events = POLLOUT;
            int pr = poll(&pfd, 1, 1000);
            if (pr <= 0) return false;
            continue;
        }
        return false;
    }
    bytesSent += data.size();
    return true;
}

Axon::Axon(const AxonConfig& config) : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
}

Axon::~Axon() { stop(); }

void Axon::attach(const std::string& command, Handler handler) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->handlers[command] = std::move(handler);
}

bool Axon::start() {
    if (impl_->running) return false;
    
    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        LOG_ERROR("Axon socket() failed errno=" + std::to_string(errno));
        return false;
    }
    
    int opt = 1;
    setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    setNonBlocking(sock);
    
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(impl_->config.port);
    if (impl_->config.ip.empty() || impl_->config.ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, impl_->config.ip.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("Axon ip is not an IPv4 address: " + impl_->config.ip);
        close(sock);
        return false;
    }
    
    if (bind(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0 || listen(sock, 64) != 0) {
        int err = errno;
        LOG_ERROR("Axon failed to bind " + impl_->config.ip + ":" + std::to_string(impl_->config.port) +
                  " errno=" + std::to_string(err));
        close(sock);
        return false;
    }
    
    struct sockaddr_in bound;
    socklen_t len = sizeof(bound);
    if (getsockname(sock, reinterpret_cast<struct sockaddr*>(&bound), &len) == 0) {
        impl_->boundPort = ntohs(bound.sin_port);
    } else {
        impl_->boundPort = impl_->config.port;
    }
    
    impl_->listenSocket = sock;
    impl_->workers = std::make_unique<utils::ThreadPool>(std::max<size_t>(1, impl_->config.maxWorkers));
    impl_->running = true;
    impl_->startTime = static_cast<uint64_t>(std::time(nullptr));
    impl_->acceptThread = std::thread(&Impl::acceptLoop, impl_.get());
    impl_->recvThread = std::thread(&Impl::recvLoop, impl_.get());
    LOG_INFO("Axon listening on " + impl_->config.ip + ":" + std::to_string(impl_->boundPort));
    return true;
}

void Axon::stop() {
    if (!impl_->running) return;
    
    impl_->running = false;
    if (impl_->acceptThread.joinable()) impl_->acceptThread.join();
    if (impl_->recvThread.joinable()) impl_->recvThread.join();
    
    if (impl_->listenSocket >= 0) {
        shutdown(impl_->listenSocket, SHUT_RDWR);
        close(impl_->listenSocket);
        impl_->listenSocket = -1;
    }
    
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        for (auto& [id, conn] : impl_->connections) {
            closeConnection(*conn);
        }
        impl_->connections.clear();
    }
    
    if (impl_->workers) {
        impl_->workers->shutdown();
        impl_->workers.reset();
    }
    impl_->boundPort = 0;
    LOG_INFO("Axon stopped");
}

bool Axon::isRunning() const {
    return impl_->running;
}

uint16_t Axon::port() const {
    return impl_->boundPort;
}

void Axon::ban(const std::string& address, uint32_t seconds) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->banned[address] = static_cast<uint64_t>(std::time(nullptr)) + seconds;
    std::vector<std::string> drop;
    for (const auto& [id, conn] : impl_->connections) {
        if (conn->address == address) drop.push_back(id);
    }
    for (const auto& id : drop) impl_->dropLocked(id);
}

bool Axon::unban(const std::string& address) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->banned.erase(address) > 0;
}

bool Axon::isBanned(const std::string& address) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->isBannedLocked(address);
}

AxonStats Axon::getStats() const {
    AxonStats stats{};
    stats.connections = impl_->totalConnections;
    stats.bytesSent = impl_->bytesSent;
    stats.bytesReceived = impl_->bytesReceived;
    stats.requestsHandled = impl_->requestsHandled;
    stats.violations = impl_->violations;
    stats.uptime = impl_->running ? static_cast<uint64_t>(std::time(nullptr)) - impl_->startTime : 0;
    return stats;
}

std::string Axon::toString() const {
    return "Axon(" + impl_->config.ip + ":" + std::to_string(port()) + ", workers=" +
           std::to_string(impl_->config.maxWorkers) + ")";
}

}
}
