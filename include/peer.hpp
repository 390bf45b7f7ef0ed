/*
 * LanChat - peer data model
 */

#pragma once

#include <cstdint>
#include <string>

namespace lanchat {

struct PeerIdentity {
    std::string display_name;
    std::string network_address;
    // 32 lowercase hex chars, generated once per process.
    std::string instance_id;
};

inline bool operator==(const PeerIdentity& lhs, const PeerIdentity& rhs) {
    return lhs.instance_id == rhs.instance_id &&
           lhs.display_name == rhs.display_name &&
           lhs.network_address == rhs.network_address;
}

enum class PeerStatus {
    Discovered,
    Connecting,
    Connected,
    Lost
};

const char* to_string(PeerStatus status);

struct PeerRecord {
    PeerIdentity identity;
    uint16_t listen_port = 0;
    PeerStatus status = PeerStatus::Discovered;
    uint64_t last_seen_ms = 0;
    // Time of the most recent status change.
    uint64_t status_since_ms = 0;
    uint32_t failed_attempts = 0;
    uint64_t retry_after_ms = 0;
};

struct PeerSighting {
    PeerIdentity identity;
    std::string address;
    uint16_t port = 0;
    uint64_t seen_at_ms = 0;
};

std::string generate_instance_id();

// Deterministic tie-break: the lexicographically smaller id initiates.
inline bool should_initiate(const std::string& local_id, const std::string& remote_id) {
    return local_id < remote_id;
}

} // namespace lanchat
