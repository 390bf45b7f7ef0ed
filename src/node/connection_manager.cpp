/*
 * LanChat - connection manager implementation
 */

#include "connection_manager.hpp"

#include "errors.hpp"
#include "utils.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace lanchat {

namespace {
std::string describe(const PeerIdentity& peer) {
    return peer.display_name + " [" + peer.instance_id.substr(0, 8) + "]";
}

std::string errno_text() {
    return std::string(std::strerror(errno));
}

// Connects with a bounded wait. Returns a blocking socket or throws.
int open_stream(const std::string& address, uint16_t port, std::chrono::milliseconds timeout) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        throw ConnectionError("invalid peer address " + address);
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw ConnectionError("failed to create socket: " + errno_text());
    }

    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        std::string reason = errno_text();
        ::close(fd);
        throw ConnectionError("failed to make socket non-blocking: " + reason);
    }

    int rc = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc < 0 && errno != EINPROGRESS) {
        std::string reason = errno_text();
        ::close(fd);
        throw ConnectionError("connect to " + address + ":" + std::to_string(port) + " failed: " + reason);
    }

    if (rc < 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        int ready = 0;
        do {
            ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (ready < 0 && errno == EINTR);
        if (ready == 0) {
            ::close(fd);
            throw ConnectionError("connect to " + address + ":" + std::to_string(port) + " timed out");
        }
        if (ready < 0) {
            std::string reason = errno_text();
            ::close(fd);
            throw ConnectionError("poll failed: " + reason);
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
            std::string reason = so_error != 0 ? std::strerror(so_error) : errno_text();
            ::close(fd);
            throw ConnectionError("connect to " + address + ":" + std::to_string(port) + " failed: " + reason);
        }
    }

    if (::fcntl(fd, F_SETFL, flags) < 0) {
        std::string reason = errno_text();
        ::close(fd);
        throw ConnectionError("failed to restore blocking mode: " + reason);
    }
    return fd;
}
} // namespace

const char* to_string(ConnectOutcome outcome) {
    switch (outcome) {
        case ConnectOutcome::Connected:
            return "connected";
        case ConnectOutcome::Superseded:
            return "superseded";
        case ConnectOutcome::Failed:
            return "failed";
        case ConnectOutcome::Skipped:
            return "skipped";
    }
    return "unknown";
}

ConnectionManager::ConnectionManager(PeerIdentity self, PeerRegistry& registry, ConnectionSettings settings)
    : self_(std::move(self)), registry_(registry), settings_(settings) {}

ConnectionManager::~ConnectionManager() {
    shutdown();
}

void ConnectionManager::set_frame_handler(FrameHandler handler) {
    on_frame_ = std::move(handler);
}

void ConnectionManager::set_established_handler(EstablishedHandler handler) {
    on_established_ = std::move(handler);
}

void ConnectionManager::set_lost_handler(LostHandler handler) {
    on_lost_ = std::move(handler);
}

uint16_t ConnectionManager::run_listener(uint16_t port, const std::string& bind_address) {
    if (running_) {
        return listen_port_;
    }

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        throw ConnectionError("failed to create listening socket: " + errno_text());
    }

    int opt = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (bind_address.empty()) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (::inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw ConnectionError("invalid bind address " + bind_address);
    }

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string reason = errno_text();
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw ConnectionError("failed to bind port " + std::to_string(port) + ": " + reason);
    }

    if (::listen(listen_fd_, 16) < 0) {
        std::string reason = errno_text();
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw ConnectionError("failed to listen: " + reason);
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) < 0) {
        std::string reason = errno_text();
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw ConnectionError("failed to read bound port: " + reason);
    }
    listen_port_ = ntohs(bound.sin_port);

    running_ = true;
    accept_thread_ = std::thread(&ConnectionManager::accept_loop, this, listen_fd_);
    log_info("listening for peers on port " + std::to_string(listen_port_));
    return listen_port_;
}

void ConnectionManager::accept_loop(int listen_fd) {
    while (running_) {
        sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);
        int client_fd = ::accept(listen_fd, reinterpret_cast<sockaddr*>(&client_addr), &addr_len);
        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (!running_) {
                break;
            }
            log_warn("accept failed: " + errno_text());
            continue;
        }

        char text[INET_ADDRSTRLEN] = {0};
        ::inet_ntop(AF_INET, &client_addr.sin_addr, text, sizeof(text));
        std::string address(text);
        spawn_worker([this, client_fd, address]() { handle_inbound(client_fd, address); });
    }
}

void ConnectionManager::spawn_worker(std::function<void()> task) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    Worker worker;
    worker.done = done;
    worker.thread = std::thread([task = std::move(task), done]() {
        task();
        done->store(true);
    });
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.push_back(std::move(worker));
}

bool ConnectionManager::track_pending(int fd) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        return false;
    }
    pending_fds_.insert(fd);
    return true;
}

void ConnectionManager::untrack_pending(int fd) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_fds_.erase(fd);
}

void ConnectionManager::handle_inbound(int client_fd, std::string address) {
    if (!track_pending(client_fd)) {
        ::close(client_fd);
        return;
    }

    HandshakeResult handshake;
    try {
        handshake = perform_handshake(client_fd, Role::Responder, self_, listen_port_,
                                      settings_.handshake_timeout, settings_.max_plaintext_size);
    } catch (const HandshakeError& ex) {
        untrack_pending(client_fd);
        log_warn("inbound handshake from " + address + " failed: " + ex.what());
        ::close(client_fd);
        return;
    } catch (const Error& ex) {
        untrack_pending(client_fd);
        log_error("inbound handshake from " + address + " aborted: " + ex.what());
        ::close(client_fd);
        return;
    }
    untrack_pending(client_fd);

    auto connection = make_connection(client_fd, Role::Responder, std::move(handshake), address);
    if (register_connection(connection)) {
        activate(connection);
    } else {
        connection->close("duplicate connection superseded");
    }
}

ConnectOutcome ConnectionManager::connect_to(const PeerRecord& peer) {
    if (!registry_.try_begin_connect(peer.identity.instance_id)) {
        return ConnectOutcome::Skipped;
    }
    return run_outbound(peer);
}

bool ConnectionManager::connect_async(const PeerRecord& peer) {
    if (!running_ || !registry_.try_begin_connect(peer.identity.instance_id)) {
        return false;
    }
    spawn_worker([this, peer]() {
        const ConnectOutcome outcome = run_outbound(peer);
        log_debug("outbound attempt to " + describe(peer.identity) + ": " + to_string(outcome));
    });
    return true;
}

ConnectOutcome ConnectionManager::run_outbound(const PeerRecord& peer) {
    const std::string& id = peer.identity.instance_id;
    const std::string& address = peer.identity.network_address;

    int fd = -1;
    try {
        fd = open_stream(address, peer.listen_port, settings_.connect_timeout);
    } catch (const ConnectionError& ex) {
        log_warn("connect to " + describe(peer.identity) + " failed: " + ex.what());
        registry_.connect_failed(id);
        return ConnectOutcome::Failed;
    }

    if (outbound_would_lose(id)) {
        ::close(fd);
        registry_.connect_abandoned(id);
        return ConnectOutcome::Superseded;
    }

    if (!track_pending(fd)) {
        ::close(fd);
        registry_.connect_abandoned(id);
        return ConnectOutcome::Failed;
    }

    HandshakeResult handshake;
    try {
        handshake = perform_handshake(fd, Role::Initiator, self_, listen_port_, settings_.handshake_timeout,
                                      settings_.max_plaintext_size, id);
    } catch (const Error& ex) {
        untrack_pending(fd);
        ::close(fd);
        if (outbound_would_lose(id)) {
            registry_.connect_abandoned(id);
            return ConnectOutcome::Superseded;
        }
        log_warn("handshake with " + describe(peer.identity) + " failed: " + ex.what());
        registry_.connect_failed(id);
        return ConnectOutcome::Failed;
    }
    untrack_pending(fd);

    auto connection = make_connection(fd, Role::Initiator, std::move(handshake), address);
    if (!register_connection(connection)) {
        connection->close("duplicate connection superseded");
        registry_.connect_abandoned(id);
        return ConnectOutcome::Superseded;
    }
    activate(connection);
    return ConnectOutcome::Connected;
}

std::shared_ptr<Connection> ConnectionManager::make_connection(int fd, Role role, HandshakeResult handshake,
                                                               const std::string& address) {
    handshake.peer.network_address = address;
    return std::make_shared<Connection>(fd, role, std::move(handshake.peer), handshake.peer_listen_port,
                                        std::move(handshake.channel), settings_.outbound_queue_capacity,
                                        settings_.send_timeout);
}

bool ConnectionManager::preferred(const Connection& connection) const {
    const std::string& peer_id = connection.peer().instance_id;
    const std::string& smaller = should_initiate(self_.instance_id, peer_id) ? self_.instance_id : peer_id;
    return connection.initiator_id(self_.instance_id) == smaller;
}

bool ConnectionManager::outbound_would_lose(const std::string& instance_id) const {
    if (should_initiate(self_.instance_id, instance_id)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(instance_id);
    return it != connections_.end() && !it->second->closed();
}

bool ConnectionManager::register_connection(const std::shared_ptr<Connection>& connection) {
    const PeerIdentity& peer = connection->peer();
    std::shared_ptr<Connection> victim;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            retired_.push_back(connection);
            return false;
        }

        auto& slot = connections_[peer.instance_id];
        if (slot && !slot->closed()) {
            // The connection initiated by the smaller id wins; between two
            // equally ranked ones the newer reflects the peer's current view.
            if (preferred(*slot) && !preferred(*connection)) {
                retired_.push_back(connection);
                log_debug("dropping " + std::string(to_string(connection->role())) + " duplicate for " +
                          describe(peer));
                return false;
            }
            victim = slot;
        } else if (slot) {
            retired_.push_back(slot);
        }
        if (victim) {
            retired_.push_back(victim);
        }
        slot = connection;
        registry_.mark_connected(peer, connection->peer_listen_port());
    }

    if (victim) {
        victim->close("superseded by " + std::string(to_string(connection->role())) + " connection");
    }
    return true;
}

void ConnectionManager::activate(const std::shared_ptr<Connection>& connection) {
    connection->start(on_frame_, [this](Connection& closed, const std::string& reason) {
        handle_closed(closed, reason);
    });
    if (connection->closed()) {
        return;
    }
    log_info("connected to " + describe(connection->peer()) + " at " + connection->peer().network_address +
             " as " + to_string(connection->role()));
    if (on_established_) {
        on_established_(connection);
    }
}

void ConnectionManager::handle_closed(Connection& connection, const std::string& reason) {
    const PeerIdentity peer = connection.peer();
    bool lost = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(peer.instance_id);
        if (it == connections_.end() || it->second.get() != &connection) {
            return;
        }
        retired_.push_back(it->second);
        connections_.erase(it);
        lost = registry_.mark_lost(peer.instance_id);
    }
    if (lost) {
        log_info("lost " + describe(peer) + ": " + reason);
        if (on_lost_) {
            on_lost_(peer, reason);
        }
    }
}

std::vector<std::shared_ptr<Connection>> ConnectionManager::connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Connection>> result;
    result.reserve(connections_.size());
    for (const auto& [id, connection] : connections_) {
        if (!connection->closed()) {
            result.push_back(connection);
        }
    }
    return result;
}

std::shared_ptr<Connection> ConnectionManager::find(const std::string& instance_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(instance_id);
    if (it == connections_.end() || it->second->closed()) {
        return nullptr;
    }
    return it->second;
}

std::size_t ConnectionManager::connection_count() const {
    return connections().size();
}

void ConnectionManager::disconnect(const std::string& instance_id, const std::string& reason) {
    std::shared_ptr<Connection> target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(instance_id);
        if (it == connections_.end()) {
            return;
        }
        target = it->second;
    }
    target->close(reason);
}

void ConnectionManager::reap() {
    std::vector<std::shared_ptr<Connection>> closed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = retired_.begin(); it != retired_.end();) {
            if ((*it)->closed()) {
                closed.push_back(std::move(*it));
                it = retired_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& connection : closed) {
        connection->join();
    }

    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load()) {
                finished.push_back(std::move(*it));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& worker : finished) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void ConnectionManager::shutdown() {
    std::vector<std::shared_ptr<Connection>> open;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ && connections_.empty() && retired_.empty()) {
            return;
        }
        running_ = false;
        for (int fd : pending_fds_) {
            ::shutdown(fd, SHUT_RDWR);
        }
        for (auto& [id, connection] : connections_) {
            open.push_back(connection);
        }
    }

    // Closed only after the accept thread has returned.
    if (listen_fd_ >= 0) {
        ::shutdown(listen_fd_, SHUT_RDWR);
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }

    for (auto& connection : open) {
        connection->close("node shutting down");
    }

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    // Workers may have retired connections while we waited on them.
    reap();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_.clear();
    }
    log_info("connection manager stopped");
}

} // namespace lanchat
