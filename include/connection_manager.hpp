/*
 * LanChat - connection manager
 *
 * Turns discovered peers into authenticated connections and accepts
 * inbound ones symmetrically. Holds at most one Connection per instance_id.
 *
 * Two peers that sight each other at the same moment may both dial. The
 * pair keeps the connection initiated by the lexicographically smaller
 * instance_id; both ends apply the same rule to the same TCP stream, so
 * they agree on the survivor regardless of timing. A losing outbound
 * attempt is dropped silently.
 */

#pragma once

#include "connection.hpp"
#include "peer.hpp"
#include "peer_registry.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace lanchat {

struct ConnectionSettings {
    std::chrono::milliseconds handshake_timeout{5000};
    std::chrono::milliseconds connect_timeout{3000};
    std::chrono::milliseconds send_timeout{5000};
    std::size_t outbound_queue_capacity = 64;
    // Largest plaintext (serialized envelope) a frame may carry.
    std::size_t max_plaintext_size = 0;
};

enum class ConnectOutcome {
    Connected,
    Superseded,
    Failed,
    Skipped
};

const char* to_string(ConnectOutcome outcome);

class ConnectionManager {
public:
    using FrameHandler = Connection::FrameHandler;
    using EstablishedHandler = std::function<void(const std::shared_ptr<Connection>&)>;
    using LostHandler = std::function<void(const PeerIdentity&, const std::string&)>;

    ConnectionManager(PeerIdentity self, PeerRegistry& registry, ConnectionSettings settings);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Handlers must be set before run_listener() or any connect.
    void set_frame_handler(FrameHandler handler);
    void set_established_handler(EstablishedHandler handler);
    void set_lost_handler(LostHandler handler);

    // Binds and starts the accept loop. Port 0 picks an ephemeral port.
    // Returns the bound port; throws ConnectionError if binding fails.
    uint16_t run_listener(uint16_t port, const std::string& bind_address = std::string());

    // Blocking outbound attempt, guarded by PeerRegistry::try_begin_connect.
    ConnectOutcome connect_to(const PeerRecord& peer);

    // Same as connect_to on a worker thread. Returns false when the
    // registry guard refused the attempt.
    bool connect_async(const PeerRecord& peer);

    std::vector<std::shared_ptr<Connection>> connections() const;

    std::shared_ptr<Connection> find(const std::string& instance_id) const;

    std::size_t connection_count() const;

    void disconnect(const std::string& instance_id, const std::string& reason);

    // Joins finished workers and closed connections.
    void reap();

    void shutdown();

    uint16_t listen_port() const { return listen_port_; }

    const PeerIdentity& self() const { return self_; }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop(int listen_fd);
    void handle_inbound(int client_fd, std::string address);
    ConnectOutcome run_outbound(const PeerRecord& peer);
    void spawn_worker(std::function<void()> task);

    bool preferred(const Connection& connection) const;
    bool outbound_would_lose(const std::string& instance_id) const;
    bool register_connection(const std::shared_ptr<Connection>& connection);
    std::shared_ptr<Connection> make_connection(int fd, Role role, HandshakeResult handshake,
                                                const std::string& address);
    void activate(const std::shared_ptr<Connection>& connection);
    void handle_closed(Connection& connection, const std::string& reason);

    bool track_pending(int fd);
    void untrack_pending(int fd);

    const PeerIdentity self_;
    PeerRegistry& registry_;
    const ConnectionSettings settings_;

    FrameHandler on_frame_;
    EstablishedHandler on_established_;
    LostHandler on_lost_;

    int listen_fd_ = -1;
    uint16_t listen_port_ = 0;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Connection>> connections_;
    std::vector<std::shared_ptr<Connection>> retired_;
    std::set<int> pending_fds_;

    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

} // namespace lanchat
