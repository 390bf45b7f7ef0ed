/*
 * LanChat - error taxonomy
 *
 * Every failure the core raises derives from lanchat::Error. The subclasses
 * map one-to-one onto how a failure is handled: discovery and listener
 * errors at startup are fatal, handshake/crypto/protocol errors tear down a
 * single connection, resource errors are reported per peer.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace lanchat {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Multicast interface could not be opened or used.
class DiscoveryError : public Error {
public:
    explicit DiscoveryError(const std::string& message) : Error(message) {}
};

// Refused, timed out or reset stream connection; also listener bind failure.
class ConnectionError : public Error {
public:
    explicit ConnectionError(const std::string& message) : Error(message) {}
};

// Malformed hello, bad public share, or confirmation mismatch.
class HandshakeError : public Error {
public:
    explicit HandshakeError(const std::string& message) : Error(message) {}
};

// AEAD failure after the handshake, or an exhausted nonce counter.
class CryptoError : public Error {
public:
    explicit CryptoError(const std::string& message) : Error(message) {}
};

// Oversized or malformed frame or envelope.
class ProtocolError : public Error {
public:
    explicit ProtocolError(const std::string& message) : Error(message) {}
};

// Outbound queue full or delivery timed out.
class ResourceError : public Error {
public:
    explicit ResourceError(const std::string& message) : Error(message) {}
};

} // namespace lanchat
