/*
 * LanChat - application message envelope
 *
 * Serialized layout (big-endian):
 *
 *   version(1) | kind(1) | id_len(1) | instance_id | name_len(2) | name |
 *   payload_len(4) | payload
 */

#pragma once

#include "peer.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace lanchat {

enum class MessageKind : uint8_t {
    Text = 0x01,
    Image = 0x02,
    Video = 0x03,
    Control = 0x04
};

const char* to_string(MessageKind kind);

struct MessageEnvelope {
    PeerIdentity sender;
    MessageKind kind = MessageKind::Text;
    std::vector<uint8_t> payload;

    std::size_t payload_length() const { return payload.size(); }
};

// Bytes added around the payload for a sender with the given identity.
std::size_t envelope_overhead(const PeerIdentity& sender);

// Largest envelope any sender may produce for the given payload limit.
std::size_t max_envelope_size(std::size_t max_payload_bytes);

// Throws ProtocolError if the payload exceeds max_payload_bytes or the
// sender fields do not fit the layout.
std::vector<uint8_t> serialize_envelope(const MessageEnvelope& envelope, std::size_t max_payload_bytes);

// Throws ProtocolError on any malformed, truncated or oversized input.
// The returned sender carries no network address.
MessageEnvelope deserialize_envelope(const std::vector<uint8_t>& bytes, std::size_t max_payload_bytes);

} // namespace lanchat
