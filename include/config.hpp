/*
 * LanChat - node configuration
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace lanchat {

struct NodeConfig {
    std::string display_name;
    uint16_t listen_port = 50000;

    std::string multicast_group = "239.255.77.77";
    uint16_t discovery_port = 50505;
    bool discovery_enabled = true;
    uint32_t announce_interval_ms = 2000;

    // Registry lifecycle windows.
    uint32_t stale_after_ms = 10000;
    uint32_t evict_after_ms = 30000;

    uint32_t handshake_timeout_ms = 5000;
    uint32_t connect_timeout_ms = 3000;
    uint32_t send_timeout_ms = 5000;
    uint32_t retry_backoff_ms = 1000;
    uint32_t retry_backoff_max_ms = 30000;
    uint32_t initiator_grace_ms = 6000;
    uint32_t keepalive_interval_ms = 3000;

    std::size_t outbound_queue_capacity = 64;
    std::size_t inbound_queue_capacity = 1024;
    std::size_t max_payload_bytes = 50u * 1024u * 1024u;

    // Applies "key=value;key=value". Throws std::invalid_argument on an
    // unknown key or an unparsable value.
    void apply_overrides(const std::string& overrides);

    // Throws std::invalid_argument describing the first violated constraint.
    void validate() const;
};

} // namespace lanchat
