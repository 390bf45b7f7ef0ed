/*
 * LanChat - chat node
 *
 * The handle the application holds. It owns one of each core component,
 * wires discovery into the registry and the registry into the connection
 * manager, and runs the background maintenance: staleness, reaping,
 * keepalives and connect retries.
 */

#pragma once

#include "blocking_queue.hpp"
#include "broadcaster.hpp"
#include "config.hpp"
#include "connection_manager.hpp"
#include "discovery.hpp"
#include "peer.hpp"
#include "peer_registry.hpp"
#include "secure_channel.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lanchat {

enum class PeerEventKind {
    Joined,
    Left
};

struct PeerEvent {
    PeerEventKind kind = PeerEventKind::Joined;
    PeerIdentity peer;
    std::string reason;
};

struct ConnectionSummary {
    PeerIdentity peer;
    uint16_t peer_listen_port = 0;
    Role role = Role::Initiator;
    uint64_t established_at_ms = 0;
    uint64_t frames_sent = 0;
    uint64_t frames_received = 0;
};

struct NodeCounters {
    uint64_t discovery_send_errors = 0;
    uint64_t discovery_receive_errors = 0;
    // Messages lost because their connection closed while the stream was full.
    uint64_t inbound_dropped = 0;
};

class ChatNode {
public:
    // Throws std::invalid_argument if the configuration does not validate.
    explicit ChatNode(NodeConfig config);
    ~ChatNode();

    ChatNode(const ChatNode&) = delete;
    ChatNode& operator=(const ChatNode&) = delete;

    // Binds the listener, opens discovery and starts every background task.
    // ConnectionError and DiscoveryError escape; both are fatal.
    void start();

    std::vector<DeliveryOutcome> send(MessageKind kind, std::vector<uint8_t> payload);

    std::vector<PeerIdentity> connected_peers() const;

    BlockingQueue<InboundMessage>& inbound_stream();

    // Joins and departures, for the UI's peer list.
    BlockingQueue<PeerEvent>& peer_events() { return events_; }

    // Feeds one sighting as if discovery had reported it.
    void observe(const PeerSighting& sighting);

    std::vector<PeerRecord> peers() const;

    std::vector<ConnectionSummary> connections() const;

    NodeCounters counters() const;

    void shutdown();

    const PeerIdentity& identity() const { return identity_; }
    const NodeConfig& config() const { return config_; }
    uint16_t listen_port() const { return manager_.listen_port(); }
    bool running() const { return running_.load(); }

private:
    void consume_sightings(BlockingQueue<PeerSighting>* sightings);
    void maintenance_loop();
    void maintain_once(uint64_t now);
    bool wants_to_dial(const PeerRecord& record, uint64_t now) const;
    void on_frame(Connection& connection, std::vector<uint8_t> plaintext);
    void publish(PeerEventKind kind, const PeerIdentity& peer, const std::string& reason);

    const NodeConfig config_;
    const PeerIdentity identity_;
    PeerRegistry registry_;
    ConnectionManager manager_;
    MessageBroadcaster broadcaster_;
    std::unique_ptr<DiscoveryService> discovery_;
    BlockingQueue<PeerEvent> events_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::thread sighting_thread_;
    std::thread maintenance_thread_;
    uint64_t last_keepalive_ms_ = 0;
};

} // namespace lanchat
