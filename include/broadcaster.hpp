/*
 * LanChat - message broadcaster
 *
 * The only component that knows application message kinds. Outbound, one
 * envelope is serialized once and handed to every connected peer's queue
 * concurrently; each peer gets its own outcome. Inbound, every connection's
 * reader feeds one merged stream, preserving per-connection order.
 */

#pragma once

#include "blocking_queue.hpp"
#include "connection.hpp"
#include "message.hpp"
#include "peer.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace lanchat {

enum class DeliveryStatus {
    Delivered,
    Failed,
    // Queue stayed full or the write did not finish in time.
    Unreachable
};

const char* to_string(DeliveryStatus status);

// How long send() waits for the writer to finish one frame: twice the send
// timeout for frames queued ahead, plus the frame's transfer time on a slow
// link.
std::chrono::milliseconds write_wait(std::size_t frame_bytes, std::chrono::milliseconds send_timeout);

struct DeliveryOutcome {
    PeerIdentity peer;
    DeliveryStatus status = DeliveryStatus::Failed;
    std::string detail;
};

struct InboundMessage {
    PeerIdentity peer;
    MessageEnvelope envelope;
};

struct BroadcastSettings {
    std::size_t max_payload_bytes = 50u * 1024u * 1024u;
    std::chrono::milliseconds send_timeout{5000};
    std::size_t inbound_capacity = 1024;
};

class MessageBroadcaster {
public:
    using PeerSource = std::function<std::vector<std::shared_ptr<Connection>>()>;
    using BacklogHandler = std::function<void(const Connection&)>;

    MessageBroadcaster(PeerIdentity self, PeerSource peers, BroadcastSettings settings);

    MessageBroadcaster(const MessageBroadcaster&) = delete;
    MessageBroadcaster& operator=(const MessageBroadcaster&) = delete;

    // Throws ProtocolError when the envelope cannot be serialized (payload
    // too large). Otherwise returns one outcome per peer connected at the
    // time of the call, possibly none.
    std::vector<DeliveryOutcome> send(MessageKind kind, std::vector<uint8_t> payload);

    // Queues without waiting for room or for the write. Returns the number
    // of peers the envelope was queued for.
    std::size_t post(MessageKind kind, std::vector<uint8_t> payload);

    // Called from a connection's reader with one opened frame. Blocks while
    // the inbound stream is full; a message is lost only when its connection
    // closes first. Throws ProtocolError for a malformed envelope or one
    // whose sender is not the authenticated peer; the reader turns that into
    // teardown.
    void deliver(Connection& from, const std::vector<uint8_t>& plaintext);

    // Runs on the reader, between waits, while deliver() is blocked.
    void set_backlog_handler(BacklogHandler handler);

    BlockingQueue<InboundMessage>& inbound_stream() { return inbound_; }

    // Ends the inbound stream.
    void close();

    uint64_t dropped_inbound() const { return dropped_inbound_.load(); }

private:
    std::shared_ptr<const std::vector<uint8_t>> encode(MessageKind kind, std::vector<uint8_t> payload) const;

    const PeerIdentity self_;
    PeerSource peers_;
    const BroadcastSettings settings_;
    BlockingQueue<InboundMessage> inbound_;
    BacklogHandler on_backlog_;
    std::atomic<uint64_t> dropped_inbound_{0};
};

} // namespace lanchat
