/*
 * LanChat - peer registry
 *
 * The registry is the only place a peer's status changes. Per instance_id:
 *
 *   Discovered -> Connecting -> Connected -> Lost -> (evicted)
 *
 * Lost is reached from Connected on teardown, or from any live state when
 * no sighting or traffic arrived within the staleness window. A Lost record
 * is evicted after a grace period unless it is sighted again, which puts it
 * back into Discovered. Every operation takes the registry lock, so each
 * transition is atomic with respect to every other task.
 */

#pragma once

#include "peer.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanchat {

struct RegistryLimits {
    uint32_t stale_after_ms = 10000;
    uint32_t evict_after_ms = 30000;
    uint32_t retry_backoff_ms = 1000;
    uint32_t retry_backoff_max_ms = 30000;
};

struct ExpiredPeer {
    PeerIdentity identity;
    PeerStatus previous = PeerStatus::Discovered;
};

struct ExpiryReport {
    std::vector<ExpiredPeer> lost;
    std::vector<std::string> evicted;
};

class PeerRegistry {
public:
    using Clock = std::function<uint64_t()>;

    explicit PeerRegistry(RegistryLimits limits, Clock clock = Clock());

    PeerRegistry(const PeerRegistry&) = delete;
    PeerRegistry& operator=(const PeerRegistry&) = delete;

    // Idempotent. Inserts a Discovered record, refreshes last_seen of a live
    // one, or revives a Lost one. Never downgrades Connecting/Connected.
    // Returns true when the record is Discovered afterwards.
    bool on_sighting(const PeerSighting& sighting);

    // Discovered -> Connecting, unless a retry backoff is still pending.
    bool try_begin_connect(const std::string& instance_id);

    // Connecting -> Discovered and lengthen the retry backoff.
    void connect_failed(const std::string& instance_id);

    // Connecting -> Discovered without penalty (attempt superseded).
    void connect_abandoned(const std::string& instance_id);

    // Any state (or no record) -> Connected. Returns false if it already was.
    bool mark_connected(const PeerIdentity& identity, uint16_t listen_port);

    // Connected -> Lost. Returns true only for the call that performed the
    // transition; any other status is left alone.
    bool mark_lost(const std::string& instance_id);

    // Refreshes last_seen from live traffic.
    void touch(const std::string& instance_id);

    ExpiryReport expire();

    std::vector<PeerIdentity> list_connected() const;

    std::vector<PeerRecord> snapshot() const;

    std::optional<PeerRecord> find(const std::string& instance_id) const;

    std::size_t size() const;

private:
    void set_status(PeerRecord& record, PeerStatus status, uint64_t now);

    RegistryLimits limits_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::map<std::string, PeerRecord> peers_;
};

} // namespace lanchat
