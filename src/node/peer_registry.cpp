/*
 * LanChat - peer registry implementation
 */

#include "peer_registry.hpp"

#include "utils.hpp"

#include <algorithm>

namespace lanchat {

PeerRegistry::PeerRegistry(RegistryLimits limits, Clock clock)
    : limits_(limits), clock_(clock ? std::move(clock) : Clock(monotonic_millis)) {}

void PeerRegistry::set_status(PeerRecord& record, PeerStatus status, uint64_t now) {
    if (record.status != status) {
        log_debug("peer " + record.identity.display_name + " [" + record.identity.instance_id.substr(0, 8) +
                  "] " + to_string(record.status) + " -> " + to_string(status));
    }
    record.status = status;
    record.status_since_ms = now;
}

bool PeerRegistry::on_sighting(const PeerSighting& sighting) {
    const uint64_t now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = peers_.find(sighting.identity.instance_id);
    if (it == peers_.end()) {
        PeerRecord record;
        record.identity = sighting.identity;
        record.identity.network_address = sighting.address;
        record.listen_port = sighting.port;
        record.last_seen_ms = now;
        record.status = PeerStatus::Discovered;
        record.status_since_ms = now;
        peers_.emplace(sighting.identity.instance_id, record);
        log_info("discovered " + sighting.identity.display_name + " at " + sighting.address + ":" +
                 std::to_string(sighting.port));
        return true;
    }

    PeerRecord& record = it->second;
    record.last_seen_ms = now;
    switch (record.status) {
        case PeerStatus::Connecting:
        case PeerStatus::Connected:
            return false;
        case PeerStatus::Lost:
            set_status(record, PeerStatus::Discovered, now);
            record.failed_attempts = 0;
            record.retry_after_ms = 0;
            break;
        case PeerStatus::Discovered:
            break;
    }
    // Only an unconnected record follows the advertised address.
    record.identity.display_name = sighting.identity.display_name;
    record.identity.network_address = sighting.address;
    record.listen_port = sighting.port;
    return true;
}

bool PeerRegistry::try_begin_connect(const std::string& instance_id) {
    const uint64_t now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(instance_id);
    if (it == peers_.end() || it->second.status != PeerStatus::Discovered) {
        return false;
    }
    if (now < it->second.retry_after_ms) {
        return false;
    }
    set_status(it->second, PeerStatus::Connecting, now);
    return true;
}

void PeerRegistry::connect_failed(const std::string& instance_id) {
    const uint64_t now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(instance_id);
    if (it == peers_.end() || it->second.status != PeerStatus::Connecting) {
        return;
    }
    PeerRecord& record = it->second;
    record.failed_attempts++;
    uint64_t backoff = limits_.retry_backoff_ms;
    for (uint32_t i = 1; i < record.failed_attempts && backoff < limits_.retry_backoff_max_ms; ++i) {
        backoff *= 2;
    }
    backoff = std::min<uint64_t>(backoff, limits_.retry_backoff_max_ms);
    record.retry_after_ms = now + backoff;
    set_status(record, PeerStatus::Discovered, now);
}

void PeerRegistry::connect_abandoned(const std::string& instance_id) {
    const uint64_t now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(instance_id);
    if (it != peers_.end() && it->second.status == PeerStatus::Connecting) {
        set_status(it->second, PeerStatus::Discovered, now);
    }
}

bool PeerRegistry::mark_connected(const PeerIdentity& identity, uint16_t listen_port) {
    const uint64_t now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = peers_.try_emplace(identity.instance_id);
    PeerRecord& record = it->second;
    const bool changed = inserted || record.status != PeerStatus::Connected;

    record.identity = identity;
    if (listen_port != 0) {
        record.listen_port = listen_port;
    }
    record.last_seen_ms = now;
    record.failed_attempts = 0;
    record.retry_after_ms = 0;
    if (inserted) {
        record.status = PeerStatus::Connected;
        record.status_since_ms = now;
    } else {
        set_status(record, PeerStatus::Connected, now);
    }
    return changed;
}

bool PeerRegistry::mark_lost(const std::string& instance_id) {
    const uint64_t now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(instance_id);
    // A record already expired, revived or redialed belongs to a newer
    // lifecycle; its teardown was reported when it left Connected.
    if (it == peers_.end() || it->second.status != PeerStatus::Connected) {
        return false;
    }
    set_status(it->second, PeerStatus::Lost, now);
    return true;
}

void PeerRegistry::touch(const std::string& instance_id) {
    const uint64_t now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(instance_id);
    if (it != peers_.end() && it->second.status != PeerStatus::Lost) {
        it->second.last_seen_ms = now;
    }
}

ExpiryReport PeerRegistry::expire() {
    const uint64_t now = clock_();
    ExpiryReport report;
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto it = peers_.begin(); it != peers_.end();) {
        PeerRecord& record = it->second;
        if (record.status == PeerStatus::Lost) {
            if (now - record.status_since_ms > limits_.evict_after_ms) {
                report.evicted.push_back(it->first);
                it = peers_.erase(it);
                continue;
            }
        } else if (now - record.last_seen_ms > limits_.stale_after_ms) {
            report.lost.push_back({record.identity, record.status});
            set_status(record, PeerStatus::Lost, now);
        }
        ++it;
    }
    return report;
}

std::vector<PeerIdentity> PeerRegistry::list_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PeerIdentity> connected;
    for (const auto& [id, record] : peers_) {
        if (record.status == PeerStatus::Connected) {
            connected.push_back(record.identity);
        }
    }
    return connected;
}

std::vector<PeerRecord> PeerRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PeerRecord> records;
    records.reserve(peers_.size());
    for (const auto& [id, record] : peers_) {
        records.push_back(record);
    }
    return records;
}

std::optional<PeerRecord> PeerRegistry::find(const std::string& instance_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(instance_id);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t PeerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.size();
}

} // namespace lanchat
