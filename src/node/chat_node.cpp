/*
 * LanChat - chat node implementation
 */

#include "chat_node.hpp"

#include "errors.hpp"
#include "message.hpp"
#include "protocol.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>

namespace lanchat {

namespace {
constexpr uint64_t kMaintenanceTickMs = 250;
constexpr const char* kKeepalivePayload = "keepalive";

NodeConfig validated(NodeConfig config) {
    config.validate();
    return config;
}

PeerIdentity make_identity(const NodeConfig& config) {
    PeerIdentity identity;
    identity.display_name = config.display_name;
    identity.instance_id = generate_instance_id();
    return identity;
}

RegistryLimits registry_limits(const NodeConfig& config) {
    RegistryLimits limits;
    limits.stale_after_ms = config.stale_after_ms;
    limits.evict_after_ms = config.evict_after_ms;
    limits.retry_backoff_ms = config.retry_backoff_ms;
    limits.retry_backoff_max_ms = config.retry_backoff_max_ms;
    return limits;
}

ConnectionSettings connection_settings(const NodeConfig& config) {
    ConnectionSettings settings;
    settings.handshake_timeout = std::chrono::milliseconds(config.handshake_timeout_ms);
    settings.connect_timeout = std::chrono::milliseconds(config.connect_timeout_ms);
    settings.send_timeout = std::chrono::milliseconds(config.send_timeout_ms);
    settings.outbound_queue_capacity = config.outbound_queue_capacity;
    settings.max_plaintext_size = max_envelope_size(config.max_payload_bytes);
    return settings;
}

BroadcastSettings broadcast_settings(const NodeConfig& config) {
    BroadcastSettings settings;
    settings.max_payload_bytes = config.max_payload_bytes;
    settings.send_timeout = std::chrono::milliseconds(config.send_timeout_ms);
    settings.inbound_capacity = config.inbound_queue_capacity;
    return settings;
}
} // namespace

ChatNode::ChatNode(NodeConfig config)
    : config_(validated(std::move(config))),
      identity_(make_identity(config_)),
      registry_(registry_limits(config_)),
      manager_(identity_, registry_, connection_settings(config_)),
      broadcaster_(identity_, [this]() { return manager_.connections(); }, broadcast_settings(config_)) {}

ChatNode::~ChatNode() {
    shutdown();
}

void ChatNode::start() {
    if (running_ || stopped_) {
        return;
    }

    manager_.set_frame_handler([this](Connection& connection, std::vector<uint8_t> plaintext) {
        on_frame(connection, std::move(plaintext));
    });
    // A reader held up by a slow consumer still counts as traffic.
    broadcaster_.set_backlog_handler([this](const Connection& connection) {
        registry_.touch(connection.peer().instance_id);
    });
    manager_.set_established_handler([this](const std::shared_ptr<Connection>& connection) {
        publish(PeerEventKind::Joined, connection->peer(), std::string());
    });
    manager_.set_lost_handler([this](const PeerIdentity& peer, const std::string& reason) {
        publish(PeerEventKind::Left, peer, reason);
    });

    const uint16_t port = manager_.run_listener(config_.listen_port);

    if (config_.discovery_enabled) {
        DiscoverySettings settings;
        settings.multicast_group = config_.multicast_group;
        settings.port = config_.discovery_port;
        settings.announce_interval = std::chrono::milliseconds(config_.announce_interval_ms);
        discovery_ = std::make_unique<DiscoveryService>(identity_, settings);
        try {
            discovery_->open();
            discovery_->advertise(identity_, port);
            sighting_thread_ = std::thread(&ChatNode::consume_sightings, this, &discovery_->browse());
        } catch (const DiscoveryError&) {
            discovery_->stop();
            manager_.shutdown();
            throw;
        }
    }

    running_ = true;
    maintenance_thread_ = std::thread(&ChatNode::maintenance_loop, this);
    log_info(identity_.display_name + " [" + identity_.instance_id.substr(0, 8) + "] up on port " +
             std::to_string(port));
}

std::vector<DeliveryOutcome> ChatNode::send(MessageKind kind, std::vector<uint8_t> payload) {
    return broadcaster_.send(kind, std::move(payload));
}

std::vector<PeerIdentity> ChatNode::connected_peers() const {
    return registry_.list_connected();
}

BlockingQueue<InboundMessage>& ChatNode::inbound_stream() {
    return broadcaster_.inbound_stream();
}

std::vector<PeerRecord> ChatNode::peers() const {
    return registry_.snapshot();
}

std::vector<ConnectionSummary> ChatNode::connections() const {
    std::vector<ConnectionSummary> summaries;
    for (const auto& connection : manager_.connections()) {
        ConnectionSummary summary;
        summary.peer = connection->peer();
        summary.peer_listen_port = connection->peer_listen_port();
        summary.role = connection->role();
        summary.established_at_ms = connection->established_at_ms();
        summary.frames_sent = connection->frames_sent();
        summary.frames_received = connection->frames_received();
        summaries.push_back(summary);
    }
    return summaries;
}

NodeCounters ChatNode::counters() const {
    NodeCounters counters;
    if (discovery_) {
        counters.discovery_send_errors = discovery_->send_errors();
        counters.discovery_receive_errors = discovery_->receive_errors();
    }
    counters.inbound_dropped = broadcaster_.dropped_inbound();
    return counters;
}

void ChatNode::observe(const PeerSighting& sighting) {
    if (sighting.identity.instance_id == identity_.instance_id ||
        !is_valid_instance_id(sighting.identity.instance_id)) {
        return;
    }
    if (!registry_.on_sighting(sighting)) {
        return;
    }
    auto record = registry_.find(sighting.identity.instance_id);
    if (record.has_value() && wants_to_dial(record.value(), monotonic_millis())) {
        manager_.connect_async(record.value());
    }
}

bool ChatNode::wants_to_dial(const PeerRecord& record, uint64_t now) const {
    if (record.status != PeerStatus::Discovered) {
        return false;
    }
    if (should_initiate(identity_.instance_id, record.identity.instance_id)) {
        return true;
    }
    // The larger id only dials when the smaller one evidently cannot reach us.
    return now - record.status_since_ms >= config_.initiator_grace_ms;
}

void ChatNode::on_frame(Connection& connection, std::vector<uint8_t> plaintext) {
    registry_.touch(connection.peer().instance_id);
    broadcaster_.deliver(connection, plaintext);
}

void ChatNode::publish(PeerEventKind kind, const PeerIdentity& peer, const std::string& reason) {
    PeerEvent event;
    event.kind = kind;
    event.peer = peer;
    event.reason = reason;
    if (!events_.push(std::move(event))) {
        log_debug("peer event for " + peer.display_name + " after shutdown");
    }
}

void ChatNode::consume_sightings(BlockingQueue<PeerSighting>* sightings) {
    while (auto sighting = sightings->pop()) {
        observe(sighting.value());
    }
}

void ChatNode::maintenance_loop() {
    const auto tick = std::chrono::milliseconds(std::min<uint64_t>(kMaintenanceTickMs, config_.keepalive_interval_ms));
    std::unique_lock<std::mutex> lock(wake_mutex_);
    while (!stopped_) {
        wake_.wait_for(lock, tick, [this] { return stopped_.load(); });
        if (stopped_) {
            break;
        }
        lock.unlock();
        try {
            maintain_once(monotonic_millis());
        } catch (const Error& ex) {
            log_error(std::string("maintenance pass failed: ") + ex.what());
        }
        lock.lock();
    }
}

void ChatNode::maintain_once(uint64_t now) {
    ExpiryReport report = registry_.expire();
    for (const auto& expired : report.lost) {
        if (expired.previous == PeerStatus::Connected) {
            manager_.disconnect(expired.identity.instance_id, "no traffic within staleness window");
            publish(PeerEventKind::Left, expired.identity, "went silent");
        }
    }
    for (const auto& evicted : report.evicted) {
        log_debug("evicted peer " + evicted.substr(0, 8));
    }

    manager_.reap();

    if (now - last_keepalive_ms_ >= config_.keepalive_interval_ms) {
        last_keepalive_ms_ = now;
        const std::string text(kKeepalivePayload);
        broadcaster_.post(MessageKind::Control, std::vector<uint8_t>(text.begin(), text.end()));
    }

    for (const auto& record : registry_.snapshot()) {
        if (wants_to_dial(record, now)) {
            manager_.connect_async(record);
        }
    }
}

void ChatNode::shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_.notify_all();

    if (discovery_) {
        discovery_->stop();
    }
    if (sighting_thread_.joinable()) {
        sighting_thread_.join();
    }
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }

    manager_.shutdown();
    broadcaster_.close();
    events_.close();
    running_ = false;
    log_info(identity_.display_name + " shut down");
}

} // namespace lanchat
