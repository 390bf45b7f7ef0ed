/*
 * LanChat - wire protocol helpers
 *
 * Everything that crosses a stream socket is a length-prefixed unit:
 * a 4-byte big-endian length followed by that many body bytes. Handshake
 * hellos travel in cleartext units, everything after the handshake is a
 * sealed SecureChannel frame inside a unit.
 *
 * Discovery uses single UDP datagrams carrying a kv announcement string.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanchat {

constexpr std::size_t kLengthPrefixSize = 4;
constexpr std::size_t kMaxHelloSize = 1024;
constexpr const char* kServiceName = "lanchat";
constexpr const char* kProtocolVersion = "1";

void write_u32_be(uint8_t* out, uint32_t value);

uint32_t read_u32_be(const uint8_t* in);

bool send_all(int socket_fd, const uint8_t* data, std::size_t len);

bool recv_all(int socket_fd, uint8_t* data, std::size_t len);

bool send_frame(int socket_fd, const std::vector<uint8_t>& body);

// Sets SO_RCVTIMEO and SO_SNDTIMEO; zero clears them.
bool set_socket_timeouts(int socket_fd, std::chrono::milliseconds timeout);

// Returns std::nullopt when the peer closed the stream, the read timed out,
// or the socket failed. Throws ProtocolError if the declared length exceeds
// max_length; in that case only the 4 length bytes have been consumed and
// no body buffer was allocated.
std::optional<std::vector<uint8_t>> receive_frame(int socket_fd, std::size_t max_length);

struct Announcement {
    std::string instance_id;
    std::string display_name;
    uint16_t port = 0;
};

std::string encode_announcement(const Announcement& announcement);

// Foreign services, other protocol versions and malformed records yield
// std::nullopt.
std::optional<Announcement> decode_announcement(const std::string& datagram);

bool is_valid_instance_id(const std::string& instance_id);

} // namespace lanchat
