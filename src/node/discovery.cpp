/*
 * LanChat - multicast discovery implementation
 */

#include "discovery.hpp"

#include "errors.hpp"
#include "protocol.hpp"
#include "utils.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace lanchat {

namespace {
constexpr std::size_t kMaxDatagram = 1500;
constexpr long kReceivePollMicros = 250000;
} // namespace

DiscoveryService::DiscoveryService(PeerIdentity self, DiscoverySettings settings)
    : self_(std::move(self)), settings_(std::move(settings)), sightings_(settings_.sighting_capacity) {}

DiscoveryService::~DiscoveryService() {
    stop();
}

void DiscoveryService::open() {
    if (socket_fd_ >= 0) {
        return;
    }

    in_addr group{};
    if (::inet_pton(AF_INET, settings_.multicast_group.c_str(), &group) != 1 || !IN_MULTICAST(ntohl(group.s_addr))) {
        throw DiscoveryError("not a multicast group: " + settings_.multicast_group);
    }

    socket_fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (socket_fd_ < 0) {
        throw DiscoveryError("failed to create discovery socket: " + std::string(std::strerror(errno)));
    }

    auto fail = [this](const std::string& what) {
        std::string reason = std::strerror(errno);
        ::close(socket_fd_);
        socket_fd_ = -1;
        throw DiscoveryError(what + ": " + reason);
    };

    // Several instances on one host share the discovery port.
    int reuse = 1;
    if (::setsockopt(socket_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        fail("SO_REUSEADDR failed");
    }
#ifdef SO_REUSEPORT
    if (::setsockopt(socket_fd_, SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse)) < 0) {
        log_warn("SO_REUSEPORT failed on discovery socket: " + std::string(std::strerror(errno)));
    }
#endif

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(settings_.port);
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    if (::bind(socket_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        fail("failed to bind discovery port " + std::to_string(settings_.port));
    }

    ip_mreq mreq{};
    mreq.imr_multiaddr = group;
    mreq.imr_interface.s_addr = htonl(INADDR_ANY);
    if (::setsockopt(socket_fd_, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
        fail("failed to join " + settings_.multicast_group);
    }

    unsigned char ttl = 1;
    if (::setsockopt(socket_fd_, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
        fail("IP_MULTICAST_TTL failed");
    }
    unsigned char loop = 1;
    if (::setsockopt(socket_fd_, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) < 0) {
        fail("IP_MULTICAST_LOOP failed");
    }

    timeval tv{};
    tv.tv_usec = kReceivePollMicros;
    if (::setsockopt(socket_fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        fail("SO_RCVTIMEO failed");
    }

    running_ = true;
    log_info("discovery joined " + settings_.multicast_group + ":" + std::to_string(settings_.port));
}

void DiscoveryService::advertise(const PeerIdentity& identity, uint16_t listen_port) {
    if (!running_) {
        throw DiscoveryError("discovery socket is not open");
    }

    Announcement announcement;
    announcement.instance_id = identity.instance_id;
    announcement.display_name = identity.display_name;
    announcement.port = listen_port;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        self_.instance_id = identity.instance_id;
        self_.display_name = identity.display_name;
        announcement_ = encode_announcement(announcement);
    }
    wake_.notify_all();

    if (!announce_thread_.joinable()) {
        announce_thread_ = std::thread(&DiscoveryService::announce_loop, this);
    }
}

BlockingQueue<PeerSighting>& DiscoveryService::browse() {
    if (!running_) {
        throw DiscoveryError("discovery socket is not open");
    }
    if (!receive_thread_.joinable()) {
        receive_thread_ = std::thread(&DiscoveryService::receive_loop, this);
    }
    return sightings_;
}

void DiscoveryService::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    running_ = false;
    wake_.notify_all();

    if (announce_thread_.joinable()) {
        announce_thread_.join();
    }
    if (receive_thread_.joinable()) {
        receive_thread_.join();
    }
    sightings_.close();

    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

void DiscoveryService::announce_once() {
    std::string datagram;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        datagram = announcement_;
    }
    if (datagram.empty()) {
        return;
    }

    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(settings_.port);
    ::inet_pton(AF_INET, settings_.multicast_group.c_str(), &dest.sin_addr);

    ssize_t sent = ::sendto(socket_fd_, datagram.data(), datagram.size(), 0,
                            reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        // Retried on the next cycle.
        send_errors_++;
        log_debug("discovery announce failed: " + std::string(std::strerror(errno)));
    }
}

void DiscoveryService::announce_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        lock.unlock();
        announce_once();
        lock.lock();
        wake_.wait_for(lock, settings_.announce_interval, [this] { return stopping_; });
    }
}

void DiscoveryService::receive_loop() {
    std::vector<char> buffer(kMaxDatagram);
    while (running_) {
        sockaddr_in from{};
        socklen_t from_len = sizeof(from);
        ssize_t received = ::recvfrom(socket_fd_, buffer.data(), buffer.size(), 0,
                                      reinterpret_cast<sockaddr*>(&from), &from_len);
        if (received < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                receive_errors_++;
                log_debug("discovery receive failed: " + std::string(std::strerror(errno)));
            }
            continue;
        }

        auto announcement = decode_announcement(std::string(buffer.data(), static_cast<std::size_t>(received)));
        if (!announcement.has_value()) {
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (announcement->instance_id == self_.instance_id) {
                continue;
            }
        }

        char text[INET_ADDRSTRLEN] = {0};
        ::inet_ntop(AF_INET, &from.sin_addr, text, sizeof(text));

        PeerSighting sighting;
        sighting.identity.instance_id = announcement->instance_id;
        sighting.identity.display_name = announcement->display_name;
        sighting.identity.network_address = text;
        sighting.address = text;
        sighting.port = announcement->port;
        sighting.seen_at_ms = monotonic_millis();
        if (sightings_.push_for(std::move(sighting), std::chrono::milliseconds(0)) == PushResult::Full) {
            log_debug("sighting queue full, dropping announcement");
        }
    }
}

} // namespace lanchat
