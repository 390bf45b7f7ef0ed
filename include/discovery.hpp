/*
 * LanChat - multicast discovery service
 *
 * Announces this instance on a link-local multicast group and reports every
 * announcement heard from other instances. Sightings are not deduplicated
 * and imply no trust; the handshake authenticates.
 */

#pragma once

#include "blocking_queue.hpp"
#include "peer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace lanchat {

struct DiscoverySettings {
    std::string multicast_group = "239.255.77.77";
    uint16_t port = 50505;
    std::chrono::milliseconds announce_interval{2000};
    std::size_t sighting_capacity = 256;
};

class DiscoveryService {
public:
    DiscoveryService(PeerIdentity self, DiscoverySettings settings);
    ~DiscoveryService();

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    // Creates the socket and joins the group. Throws DiscoveryError.
    void open();

    // Starts (or retargets) the periodic announcement.
    void advertise(const PeerIdentity& identity, uint16_t listen_port);

    // Starts the receiver on first use. The queue is closed by stop(); a
    // consumer that finds it full loses the newest sightings, which the
    // next announcement cycle repeats anyway.
    BlockingQueue<PeerSighting>& browse();

    void stop();

    uint64_t send_errors() const { return send_errors_.load(); }
    uint64_t receive_errors() const { return receive_errors_.load(); }

private:
    void announce_loop();
    void receive_loop();
    void announce_once();

    PeerIdentity self_;
    const DiscoverySettings settings_;
    int socket_fd_ = -1;

    std::mutex mutex_;
    std::condition_variable wake_;
    std::string announcement_;
    bool stopping_ = false;

    std::atomic<bool> running_{false};
    std::thread announce_thread_;
    std::thread receive_thread_;
    BlockingQueue<PeerSighting> sightings_;

    std::atomic<uint64_t> send_errors_{0};
    std::atomic<uint64_t> receive_errors_{0};
};

} // namespace lanchat
