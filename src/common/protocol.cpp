/*
 * LanChat - wire protocol helpers implementation
 */

#include "protocol.hpp"

#include "errors.hpp"
#include "utils.hpp"

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <map>

namespace lanchat {

namespace {
constexpr std::size_t kInstanceIdLength = 32;
constexpr std::size_t kMaxDisplayNameLength = 64;
} // namespace

void write_u32_be(uint8_t* out, uint32_t value) {
    out[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
    out[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
    out[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
    out[3] = static_cast<uint8_t>(value & 0xFF);
}

uint32_t read_u32_be(const uint8_t* in) {
    return (static_cast<uint32_t>(in[0]) << 24) |
           (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) |
           static_cast<uint32_t>(in[3]);
}

bool send_all(int fd, const uint8_t* data, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        ssize_t written = ::send(fd, data + total, len - total, MSG_NOSIGNAL);
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written <= 0) {
            return false;
        }
        total += static_cast<std::size_t>(written);
    }
    return true;
}

bool recv_all(int fd, uint8_t* data, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        ssize_t read_bytes = ::recv(fd, data + total, len - total, MSG_WAITALL);
        if (read_bytes < 0 && errno == EINTR) {
            continue;
        }
        if (read_bytes <= 0) {
            return false;
        }
        total += static_cast<std::size_t>(read_bytes);
    }
    return true;
}

bool send_frame(int socket_fd, const std::vector<uint8_t>& body) {
    if (body.size() > UINT32_MAX) {
        throw ProtocolError("frame body exceeds 32-bit length prefix");
    }
    uint8_t header[kLengthPrefixSize];
    write_u32_be(header, static_cast<uint32_t>(body.size()));

    if (!send_all(socket_fd, header, sizeof(header))) {
        return false;
    }
    if (!body.empty()) {
        return send_all(socket_fd, body.data(), body.size());
    }
    return true;
}

bool set_socket_timeouts(int socket_fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return ::setsockopt(socket_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
           ::setsockopt(socket_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

std::optional<std::vector<uint8_t>> receive_frame(int socket_fd, std::size_t max_length) {
    uint8_t header[kLengthPrefixSize];
    if (!recv_all(socket_fd, header, sizeof(header))) {
        return std::nullopt;
    }
    const uint32_t len = read_u32_be(header);
    if (len > max_length) {
        throw ProtocolError("declared frame length " + std::to_string(len) +
                            " exceeds limit " + std::to_string(max_length));
    }

    std::vector<uint8_t> body(len);
    if (len > 0 && !recv_all(socket_fd, body.data(), len)) {
        return std::nullopt;
    }
    return body;
}

std::string encode_announcement(const Announcement& announcement) {
    std::vector<uint8_t> name(announcement.display_name.begin(), announcement.display_name.end());
    return kv_string({
        {"svc", kServiceName},
        {"v", kProtocolVersion},
        {"id", announcement.instance_id},
        {"name", base64_encode(name)},
        {"port", std::to_string(announcement.port)}
    });
}

std::optional<Announcement> decode_announcement(const std::string& datagram) {
    auto kv = parse_kv_string(datagram);
    if (kv["svc"] != kServiceName || kv["v"] != kProtocolVersion) {
        return std::nullopt;
    }
    if (!is_valid_instance_id(kv["id"])) {
        return std::nullopt;
    }

    auto name = base64_decode(kv["name"]);
    if (!name.has_value() || name->empty() || name->size() > kMaxDisplayNameLength) {
        return std::nullopt;
    }

    const std::string& port_str = kv["port"];
    if (port_str.empty() || port_str.size() > 5 ||
        !std::all_of(port_str.begin(), port_str.end(), [](unsigned char ch) { return std::isdigit(ch); })) {
        return std::nullopt;
    }
    unsigned long port = std::stoul(port_str);
    if (port == 0 || port > 65535) {
        return std::nullopt;
    }

    Announcement announcement;
    announcement.instance_id = kv["id"];
    announcement.display_name.assign(name->begin(), name->end());
    announcement.port = static_cast<uint16_t>(port);
    return announcement;
}

bool is_valid_instance_id(const std::string& instance_id) {
    return instance_id.size() == kInstanceIdLength &&
           std::all_of(instance_id.begin(), instance_id.end(), [](unsigned char ch) {
               return std::isdigit(ch) || (ch >= 'a' && ch <= 'f');
           });
}

} // namespace lanchat
