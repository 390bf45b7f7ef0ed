/*
 * LanChat - message broadcaster implementation
 */

#include "broadcaster.hpp"

#include "errors.hpp"
#include "utils.hpp"

#include <future>

namespace lanchat {

namespace {
constexpr auto kInboundPoll = std::chrono::milliseconds(100);
// Slowest link a write is expected to sustain before it is called stuck.
constexpr std::size_t kMinimumBytesPerSecond = 1024 * 1024;

// Waits for the writer to report on one queued frame.
bool await_write(Submission& submission, std::chrono::milliseconds timeout) {
    if (submission.written.wait_for(timeout) != std::future_status::ready) {
        throw ResourceError("write still in progress after " + std::to_string(timeout.count()) + " ms");
    }
    return submission.written.get();
}

DeliveryOutcome deliver_to(const std::shared_ptr<Connection>& connection,
                           const std::shared_ptr<const std::vector<uint8_t>>& frame,
                           std::chrono::milliseconds send_timeout) {
    DeliveryOutcome outcome;
    outcome.peer = connection->peer();
    try {
        Submission submission = connection->submit(frame, send_timeout);
        switch (submission.queued) {
            case PushResult::Full:
                throw ResourceError("outbound queue full");
            case PushResult::Closed:
                outcome.status = DeliveryStatus::Failed;
                outcome.detail = "connection closed";
                return outcome;
            case PushResult::Ok:
                break;
        }
        if (await_write(submission, write_wait(frame->size(), send_timeout))) {
            outcome.status = DeliveryStatus::Delivered;
        } else {
            outcome.status = DeliveryStatus::Failed;
            outcome.detail = "connection dropped mid-send";
        }
    } catch (const ResourceError& ex) {
        outcome.status = DeliveryStatus::Unreachable;
        outcome.detail = ex.what();
    }
    return outcome;
}
} // namespace

std::chrono::milliseconds write_wait(std::size_t frame_bytes, std::chrono::milliseconds send_timeout) {
    const auto transfer = std::chrono::milliseconds(frame_bytes * 1000 / kMinimumBytesPerSecond);
    return send_timeout * 2 + transfer;
}

const char* to_string(DeliveryStatus status) {
    switch (status) {
        case DeliveryStatus::Delivered:
            return "delivered";
        case DeliveryStatus::Failed:
            return "failed";
        case DeliveryStatus::Unreachable:
            return "unreachable";
    }
    return "unknown";
}

MessageBroadcaster::MessageBroadcaster(PeerIdentity self, PeerSource peers, BroadcastSettings settings)
    : self_(std::move(self)), peers_(std::move(peers)), settings_(settings), inbound_(settings.inbound_capacity) {}

std::shared_ptr<const std::vector<uint8_t>> MessageBroadcaster::encode(MessageKind kind,
                                                                        std::vector<uint8_t> payload) const {
    MessageEnvelope envelope;
    envelope.sender = self_;
    envelope.kind = kind;
    envelope.payload = std::move(payload);
    return std::make_shared<const std::vector<uint8_t>>(serialize_envelope(envelope, settings_.max_payload_bytes));
}

std::vector<DeliveryOutcome> MessageBroadcaster::send(MessageKind kind, std::vector<uint8_t> payload) {
    auto frame = encode(kind, std::move(payload));
    auto targets = peers_();

    std::vector<std::future<DeliveryOutcome>> pending;
    pending.reserve(targets.size());
    for (const auto& connection : targets) {
        pending.push_back(std::async(std::launch::async, deliver_to, connection, frame, settings_.send_timeout));
    }

    std::vector<DeliveryOutcome> outcomes;
    outcomes.reserve(pending.size());
    for (auto& result : pending) {
        outcomes.push_back(result.get());
    }

    for (const auto& outcome : outcomes) {
        if (outcome.status != DeliveryStatus::Delivered) {
            log_warn(std::string(to_string(kind)) + " to " + outcome.peer.display_name + " " +
                     to_string(outcome.status) + ": " + outcome.detail);
        }
    }
    return outcomes;
}

std::size_t MessageBroadcaster::post(MessageKind kind, std::vector<uint8_t> payload) {
    auto frame = encode(kind, std::move(payload));
    std::size_t queued = 0;
    for (const auto& connection : peers_()) {
        if (connection->submit(frame, std::chrono::milliseconds(0)).queued == PushResult::Ok) {
            queued++;
        }
    }
    return queued;
}

void MessageBroadcaster::deliver(Connection& from, const std::vector<uint8_t>& plaintext) {
    MessageEnvelope envelope = deserialize_envelope(plaintext, settings_.max_payload_bytes);
    if (envelope.sender.instance_id != from.peer().instance_id) {
        throw ProtocolError("envelope sender " + envelope.sender.instance_id.substr(0, 8) +
                            " does not match authenticated peer");
    }
    if (envelope.kind == MessageKind::Control) {
        return;
    }
    envelope.sender.network_address = from.peer().network_address;

    InboundMessage message;
    message.peer = from.peer();
    message.envelope = std::move(envelope);
    // The reader waits for the consumer, so a full stream stalls this
    // connection and the sender's own queue fills up behind it.
    while (true) {
        switch (inbound_.offer_for(message, kInboundPoll)) {
            case PushResult::Ok:
            case PushResult::Closed:
                return;
            case PushResult::Full:
                break;
        }
        if (from.closed()) {
            dropped_inbound_++;
            log_warn("connection to " + from.peer().display_name + " closed with a message still undelivered");
            return;
        }
        if (on_backlog_) {
            on_backlog_(from);
        }
    }
}

void MessageBroadcaster::set_backlog_handler(BacklogHandler handler) {
    on_backlog_ = std::move(handler);
}

void MessageBroadcaster::close() {
    inbound_.close();
}

} // namespace lanchat
