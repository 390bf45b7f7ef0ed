/*
 * LanChat - node configuration implementation
 */

#include "config.hpp"

#include "utils.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace lanchat {

namespace {

uint64_t parse_unsigned(const std::string& key, const std::string& value, uint64_t max) {
    if (value.empty() ||
        !std::all_of(value.begin(), value.end(), [](unsigned char ch) { return std::isdigit(ch); })) {
        throw std::invalid_argument("config: " + key + " expects an unsigned integer, got '" + value + "'");
    }
    uint64_t parsed = 0;
    try {
        parsed = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("config: " + key + " is out of range");
    }
    if (parsed > max) {
        throw std::invalid_argument("config: " + key + " must be <= " + std::to_string(max));
    }
    return parsed;
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    throw std::invalid_argument("config: " + key + " expects a boolean, got '" + value + "'");
}

} // namespace

void NodeConfig::apply_overrides(const std::string& overrides) {
    constexpr uint64_t kU32 = std::numeric_limits<uint32_t>::max();
    constexpr uint64_t kU16 = std::numeric_limits<uint16_t>::max();

    for (const auto& [key, value] : parse_kv_string(overrides)) {
        if (key == "name") {
            display_name = value;
        } else if (key == "port") {
            listen_port = static_cast<uint16_t>(parse_unsigned(key, value, kU16));
        } else if (key == "group") {
            multicast_group = value;
        } else if (key == "discovery_port") {
            discovery_port = static_cast<uint16_t>(parse_unsigned(key, value, kU16));
        } else if (key == "discovery") {
            discovery_enabled = parse_bool(key, value);
        } else if (key == "announce_interval_ms") {
            announce_interval_ms = static_cast<uint32_t>(parse_unsigned(key, value, kU32));
        } else if (key == "stale_after_ms") {
            stale_after_ms = static_cast<uint32_t>(parse_unsigned(key, value, kU32));
        } else if (key == "evict_after_ms") {
            evict_after_ms = static_cast<uint32_t>(parse_unsigned(key, value, kU32));
        } else if (key == "handshake_timeout_ms") {
            handshake_timeout_ms = static_cast<uint32_t>(parse_unsigned(key, value, kU32));
        } else if (key == "connect_timeout_ms") {
            connect_timeout_ms = static_cast<uint32_t>(parse_unsigned(key, value, kU32));
        } else if (key == "send_timeout_ms") {
            send_timeout_ms = static_cast<uint32_t>(parse_unsigned(key, value, kU32));
        } else if (key == "retry_backoff_ms") {
            retry_backoff_ms = static_cast<uint32_t>(parse_unsigned(key, value, kU32));
        } else if (key == "retry_backoff_max_ms") {
            retry_backoff_max_ms = static_cast<uint32_t>(parse_unsigned(key, value, kU32));
        } else if (key == "initiator_grace_ms") {
            initiator_grace_ms = static_cast<uint32_t>(parse_unsigned(key, value, kU32));
        } else if (key == "keepalive_interval_ms") {
            keepalive_interval_ms = static_cast<uint32_t>(parse_unsigned(key, value, kU32));
        } else if (key == "outbound_queue") {
            outbound_queue_capacity = static_cast<std::size_t>(parse_unsigned(key, value, kU32));
        } else if (key == "inbound_queue") {
            inbound_queue_capacity = static_cast<std::size_t>(parse_unsigned(key, value, kU32));
        } else if (key == "max_payload_mb") {
            max_payload_bytes = static_cast<std::size_t>(parse_unsigned(key, value, 1024)) * 1024u * 1024u;
        } else if (key == "max_payload_bytes") {
            max_payload_bytes = static_cast<std::size_t>(parse_unsigned(key, value, kU32 / 2));
        } else if (key == "log_level") {
            auto level = parse_log_level(value);
            if (!level.has_value()) {
                throw std::invalid_argument("config: unknown log level '" + value + "'");
            }
            set_log_level(level.value());
        } else {
            throw std::invalid_argument("config: unknown key '" + key + "'");
        }
    }
}

void NodeConfig::validate() const {
    if (trim(display_name).empty()) {
        throw std::invalid_argument("display name must not be empty");
    }
    if (display_name.size() > 64) {
        throw std::invalid_argument("display name must be at most 64 bytes");
    }
    in_addr group{};
    if (inet_pton(AF_INET, multicast_group.c_str(), &group) != 1 ||
        !IN_MULTICAST(ntohl(group.s_addr))) {
        throw std::invalid_argument("multicast group '" + multicast_group + "' is not an IPv4 multicast address");
    }
    if (discovery_enabled && discovery_port == 0) {
        throw std::invalid_argument("discovery port must be non-zero");
    }
    if (announce_interval_ms == 0 || stale_after_ms <= announce_interval_ms) {
        throw std::invalid_argument("stale_after_ms must exceed a non-zero announce_interval_ms");
    }
    if (evict_after_ms == 0) {
        throw std::invalid_argument("evict_after_ms must be non-zero");
    }
    if (handshake_timeout_ms == 0 || connect_timeout_ms == 0 || send_timeout_ms == 0) {
        throw std::invalid_argument("timeouts must be non-zero");
    }
    if (retry_backoff_max_ms < retry_backoff_ms) {
        throw std::invalid_argument("retry_backoff_max_ms must be >= retry_backoff_ms");
    }
    if (keepalive_interval_ms == 0) {
        throw std::invalid_argument("keepalive_interval_ms must be non-zero");
    }
    if (outbound_queue_capacity == 0 || inbound_queue_capacity == 0) {
        throw std::invalid_argument("queue capacities must be non-zero");
    }
    if (max_payload_bytes == 0) {
        throw std::invalid_argument("max_payload_bytes must be non-zero");
    }
}

} // namespace lanchat
