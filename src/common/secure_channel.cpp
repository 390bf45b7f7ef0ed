/*
 * LanChat - secure channel implementation
 */

#include "secure_channel.hpp"

#include "errors.hpp"
#include "protocol.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>

namespace lanchat {

namespace {
constexpr const char* kSessionInfo = "lanchat-session-v1";
constexpr const char* kConfirmPrefix = "lanchat-confirm:";

using SteadyClock = std::chrono::steady_clock;

struct Hello {
    std::string instance_id;
    std::string display_name;
    uint16_t listen_port = 0;
    std::vector<uint8_t> public_share;
    std::vector<uint8_t> nonce_salt;
};

std::vector<uint8_t> length_aad(std::size_t body_len) {
    std::vector<uint8_t> aad(kLengthPrefixSize);
    write_u32_be(aad.data(), static_cast<uint32_t>(body_len));
    return aad;
}

// Re-arms the socket timeouts with whatever is left of the handshake window.
void arm_deadline(int fd, SteadyClock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
    if (remaining.count() <= 0) {
        throw HandshakeError("handshake timed out");
    }
    if (!set_socket_timeouts(fd, remaining)) {
        throw HandshakeError("could not set handshake timeout");
    }
}

void send_hello(int fd, const Hello& hello) {
    std::vector<uint8_t> name(hello.display_name.begin(), hello.display_name.end());
    std::string text = kv_string({
        {"type", "hello"},
        {"v", kProtocolVersion},
        {"id", hello.instance_id},
        {"name", base64_encode(name)},
        {"port", std::to_string(hello.listen_port)},
        {"pub", base64_encode(hello.public_share)},
        {"salt", base64_encode(hello.nonce_salt)}
    });
    if (!send_frame(fd, std::vector<uint8_t>(text.begin(), text.end()))) {
        throw HandshakeError("failed to send hello");
    }
}

Hello receive_hello(int fd) {
    std::optional<std::vector<uint8_t>> unit;
    try {
        unit = receive_frame(fd, kMaxHelloSize);
    } catch (const ProtocolError& ex) {
        throw HandshakeError(std::string("oversized hello: ") + ex.what());
    }
    if (!unit.has_value()) {
        throw HandshakeError("peer closed or timed out before hello");
    }

    auto kv = parse_kv_string(std::string(unit->begin(), unit->end()));
    if (kv["type"] != "hello" || kv["v"] != kProtocolVersion) {
        throw HandshakeError("unexpected hello type or version");
    }

    Hello hello;
    hello.instance_id = kv["id"];
    if (!is_valid_instance_id(hello.instance_id)) {
        throw HandshakeError("malformed instance id in hello");
    }

    auto name = base64_decode(kv["name"]);
    if (!name.has_value() || name->empty()) {
        throw HandshakeError("malformed display name in hello");
    }
    hello.display_name.assign(name->begin(), name->end());

    const std::string& port_str = kv["port"];
    if (port_str.empty() || port_str.size() > 5 ||
        !std::all_of(port_str.begin(), port_str.end(), [](unsigned char ch) { return std::isdigit(ch); })) {
        throw HandshakeError("malformed listen port in hello");
    }
    unsigned long port = std::stoul(port_str);
    if (port > 65535) {
        throw HandshakeError("listen port out of range in hello");
    }
    hello.listen_port = static_cast<uint16_t>(port);

    auto share = base64_decode(kv["pub"]);
    if (!share.has_value() || share->size() != kX25519KeySize) {
        throw HandshakeError("malformed public share in hello");
    }
    hello.public_share = std::move(share.value());

    auto salt = base64_decode(kv["salt"]);
    if (!salt.has_value() || salt->size() != kNonceSaltSize) {
        throw HandshakeError("malformed nonce salt in hello");
    }
    hello.nonce_salt = std::move(salt.value());
    return hello;
}

void send_confirmation(int fd, SecureChannel& channel, const std::string& own_id) {
    std::string text = std::string(kConfirmPrefix) + own_id;
    auto body = channel.seal(std::vector<uint8_t>(text.begin(), text.end()));
    if (!send_frame(fd, body)) {
        throw HandshakeError("failed to send confirmation");
    }
}

void verify_confirmation(int fd, SecureChannel& channel, const std::string& peer_id) {
    std::vector<uint8_t> plaintext;
    try {
        auto unit = receive_frame(fd, kMaxHelloSize);
        if (!unit.has_value()) {
            throw HandshakeError("peer closed or timed out before confirmation");
        }
        plaintext = channel.open(unit.value());
    } catch (const CryptoError& ex) {
        throw HandshakeError(std::string("confirmation did not verify: ") + ex.what());
    } catch (const ProtocolError& ex) {
        throw HandshakeError(std::string("malformed confirmation: ") + ex.what());
    }

    const std::string expected = std::string(kConfirmPrefix) + peer_id;
    if (std::string(plaintext.begin(), plaintext.end()) != expected) {
        throw HandshakeError("confirmation names a different peer");
    }
}

} // namespace

const char* to_string(Role role) {
    return role == Role::Initiator ? "initiator" : "responder";
}

SecureChannel::SecureChannel(std::vector<uint8_t> session_key,
                             std::vector<uint8_t> send_salt,
                             std::vector<uint8_t> recv_salt,
                             std::size_t max_plaintext_size)
    : session_key_(std::move(session_key)),
      send_salt_(std::move(send_salt)),
      recv_salt_(std::move(recv_salt)),
      max_plaintext_size_(max_plaintext_size) {
    if (session_key_.size() != kSessionKeySize) {
        throw std::invalid_argument("session key must be 32 bytes");
    }
    if (send_salt_.size() != kNonceSaltSize || recv_salt_.size() != kNonceSaltSize) {
        throw std::invalid_argument("nonce salts must be 4 bytes");
    }
    if (send_salt_ == recv_salt_) {
        throw std::invalid_argument("send and receive salts must differ");
    }
}

std::vector<uint8_t> SecureChannel::make_nonce(const std::vector<uint8_t>& salt, uint64_t counter) {
    std::vector<uint8_t> nonce(salt);
    for (int shift = 56; shift >= 0; shift -= 8) {
        nonce.push_back(static_cast<uint8_t>((counter >> shift) & 0xFF));
    }
    return nonce;
}

std::vector<uint8_t> SecureChannel::seal(const std::vector<uint8_t>& plaintext) {
    if (plaintext.size() > max_plaintext_size_) {
        throw ProtocolError("plaintext of " + std::to_string(plaintext.size()) +
                            " bytes exceeds channel limit");
    }
    uint64_t counter = send_counter_.load();
    do {
        if (counter == std::numeric_limits<uint64_t>::max()) {
            throw CryptoError("send nonce space exhausted");
        }
    } while (!send_counter_.compare_exchange_weak(counter, counter + 1));

    const std::size_t body_len = plaintext.size() + kFrameOverhead;
    auto sealed = aes256_gcm_encrypt(session_key_, make_nonce(send_salt_, counter), plaintext,
                                     length_aad(body_len));

    std::vector<uint8_t> body;
    body.reserve(body_len);
    body.insert(body.end(), sealed.nonce.begin(), sealed.nonce.end());
    body.insert(body.end(), sealed.data.begin(), sealed.data.end());
    body.insert(body.end(), sealed.tag.begin(), sealed.tag.end());
    return body;
}

std::vector<uint8_t> SecureChannel::open(const std::vector<uint8_t>& body) {
    if (body.size() < kFrameOverhead) {
        throw ProtocolError("frame shorter than nonce and tag");
    }
    if (body.size() > max_frame_length()) {
        throw ProtocolError("frame exceeds channel limit");
    }

    Ciphertext wrapped;
    wrapped.nonce.assign(body.begin(), body.begin() + kGcmNonceSize);
    wrapped.data.assign(body.begin() + kGcmNonceSize, body.end() - kGcmTagSize);
    wrapped.tag.assign(body.end() - kGcmTagSize, body.end());

    if (wrapped.nonce != make_nonce(recv_salt_, recv_counter_.load())) {
        throw ProtocolError("unexpected frame nonce (replayed or out of order)");
    }

    auto plaintext = aes256_gcm_decrypt(session_key_, wrapped, length_aad(body.size()));
    ++recv_counter_;
    return plaintext;
}

std::vector<uint8_t> derive_session_key(const std::vector<uint8_t>& shared_secret,
                                        const std::vector<uint8_t>& public_a,
                                        const std::vector<uint8_t>& public_b) {
    const auto& low = std::min(public_a, public_b);
    const auto& high = std::max(public_a, public_b);
    std::vector<uint8_t> salt;
    salt.reserve(low.size() + high.size());
    salt.insert(salt.end(), low.begin(), low.end());
    salt.insert(salt.end(), high.begin(), high.end());
    return hkdf_sha256(shared_secret, salt, kSessionInfo, kSessionKeySize);
}

HandshakeResult perform_handshake(int socket_fd,
                                  Role role,
                                  const PeerIdentity& self,
                                  uint16_t listen_port,
                                  std::chrono::milliseconds timeout,
                                  std::size_t max_plaintext_size,
                                  const std::string& expected_peer_id) {
    const auto deadline = SteadyClock::now() + timeout;

    KeyPair ephemeral = generate_x25519_keypair();
    Hello mine;
    mine.instance_id = self.instance_id;
    mine.display_name = self.display_name;
    mine.listen_port = listen_port;
    mine.public_share = ephemeral.public_key;
    mine.nonce_salt = random_bytes(kNonceSaltSize);

    Hello theirs;
    if (role == Role::Initiator) {
        arm_deadline(socket_fd, deadline);
        send_hello(socket_fd, mine);
        arm_deadline(socket_fd, deadline);
        theirs = receive_hello(socket_fd);
    } else {
        arm_deadline(socket_fd, deadline);
        theirs = receive_hello(socket_fd);
    }

    if (theirs.instance_id == self.instance_id) {
        throw HandshakeError("refusing to connect to ourselves");
    }
    if (!expected_peer_id.empty() && theirs.instance_id != expected_peer_id) {
        throw HandshakeError("peer presented " + theirs.instance_id.substr(0, 8) +
                             ", expected " + expected_peer_id.substr(0, 8));
    }
    if (theirs.nonce_salt == mine.nonce_salt) {
        throw HandshakeError("nonce salt collision");
    }

    if (role == Role::Responder) {
        arm_deadline(socket_fd, deadline);
        send_hello(socket_fd, mine);
    }

    auto shared = compute_x25519_shared(ephemeral.private_key, theirs.public_share);
    auto key = derive_session_key(shared, mine.public_share, theirs.public_share);
    std::fill(shared.begin(), shared.end(), 0);
    std::fill(ephemeral.private_key.begin(), ephemeral.private_key.end(), 0);

    auto channel = std::make_unique<SecureChannel>(std::move(key),
                                                   mine.nonce_salt,
                                                   theirs.nonce_salt,
                                                   max_plaintext_size);

    if (role == Role::Initiator) {
        arm_deadline(socket_fd, deadline);
        send_confirmation(socket_fd, *channel, self.instance_id);
        arm_deadline(socket_fd, deadline);
        verify_confirmation(socket_fd, *channel, theirs.instance_id);
    } else {
        arm_deadline(socket_fd, deadline);
        verify_confirmation(socket_fd, *channel, theirs.instance_id);
        arm_deadline(socket_fd, deadline);
        send_confirmation(socket_fd, *channel, self.instance_id);
    }

    if (!set_socket_timeouts(socket_fd, std::chrono::milliseconds(0))) {
        throw HandshakeError("could not clear handshake timeout");
    }

    HandshakeResult result;
    result.peer.display_name = theirs.display_name;
    result.peer.instance_id = theirs.instance_id;
    result.peer_listen_port = theirs.listen_port;
    result.channel = std::move(channel);
    log_debug("handshake complete as " + std::string(to_string(role)) + " with " +
              theirs.display_name + " [" + theirs.instance_id.substr(0, 8) + "]");
    return result;
}

} // namespace lanchat
