/*
 * LanChat - secure channel
 *
 * Turns a connected stream socket into an authenticated, confidential,
 * framed channel.
 *
 * Handshake (once per connection, before any application data):
 *   1. Initiator sends a cleartext hello carrying its instance id, display
 *      name, listen port, an ephemeral X25519 public share and a 4-byte
 *      nonce salt. The responder validates it and answers with its own.
 *   2. Both sides compute X25519 and derive one 256-bit session key with
 *      HKDF-SHA256, salted with the two public shares in sorted order so
 *      both ends derive the same key.
 *   3. Each side sends a confirmation frame sealed under the new key; the
 *      peer must open it and find the id announced in the hello.
 *
 * Frame body: nonce(12) | ciphertext | tag(16). The nonce is the sender's
 * salt followed by its 8-byte big-endian frame counter, and the 4-byte
 * length prefix of the unit is authenticated as associated data.
 */

#pragma once

#include "crypto.hpp"
#include "peer.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace lanchat {

enum class Role {
    Initiator,
    Responder
};

const char* to_string(Role role);

constexpr std::size_t kNonceSaltSize = 4;
constexpr std::size_t kFrameOverhead = kGcmNonceSize + kGcmTagSize;

class SecureChannel {
public:
    SecureChannel(std::vector<uint8_t> session_key,
                  std::vector<uint8_t> send_salt,
                  std::vector<uint8_t> recv_salt,
                  std::size_t max_plaintext_size);

    SecureChannel(const SecureChannel&) = delete;
    SecureChannel& operator=(const SecureChannel&) = delete;

    // Consumes exactly one send nonce. Throws CryptoError once the counter
    // space is exhausted and ProtocolError for an oversized plaintext.
    std::vector<uint8_t> seal(const std::vector<uint8_t>& plaintext);

    // Throws ProtocolError for a short body or a nonce other than the next
    // expected one, CryptoError when the tag does not verify.
    std::vector<uint8_t> open(const std::vector<uint8_t>& body);

    // Largest unit body the receive side accepts before allocating.
    std::size_t max_frame_length() const { return max_plaintext_size_ + kFrameOverhead; }

    uint64_t frames_sent() const { return send_counter_.load(); }
    uint64_t frames_received() const { return recv_counter_.load(); }

    static std::vector<uint8_t> make_nonce(const std::vector<uint8_t>& salt, uint64_t counter);

private:
    const std::vector<uint8_t> session_key_;
    const std::vector<uint8_t> send_salt_;
    const std::vector<uint8_t> recv_salt_;
    const std::size_t max_plaintext_size_;
    std::atomic<uint64_t> send_counter_{0};
    std::atomic<uint64_t> recv_counter_{0};
};

struct HandshakeResult {
    // network_address is left for the caller, who knows the socket peer.
    PeerIdentity peer;
    uint16_t peer_listen_port = 0;
    std::unique_ptr<SecureChannel> channel;
};

std::vector<uint8_t> derive_session_key(const std::vector<uint8_t>& shared_secret,
                                        const std::vector<uint8_t>& public_a,
                                        const std::vector<uint8_t>& public_b);

// Runs the whole handshake on a blocking socket, bounded by timeout.
// When expected_peer_id is non-empty the peer must present that id.
// Throws HandshakeError on any failure; the socket is left open for the
// caller to close.
HandshakeResult perform_handshake(int socket_fd,
                                  Role role,
                                  const PeerIdentity& self,
                                  uint16_t listen_port,
                                  std::chrono::milliseconds timeout,
                                  std::size_t max_plaintext_size,
                                  const std::string& expected_peer_id = std::string());

} // namespace lanchat
