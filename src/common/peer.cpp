/*
 * LanChat - peer data model helpers
 */

#include "peer.hpp"

#include "utils.hpp"

namespace lanchat {

namespace {
constexpr std::size_t kInstanceIdBytes = 16;
} // namespace

const char* to_string(PeerStatus status) {
    switch (status) {
        case PeerStatus::Discovered:
            return "discovered";
        case PeerStatus::Connecting:
            return "connecting";
        case PeerStatus::Connected:
            return "connected";
        case PeerStatus::Lost:
            return "lost";
        default:
            return "unknown";
    }
}

std::string generate_instance_id() {
    return hex_encode(random_bytes(kInstanceIdBytes));
}

} // namespace lanchat
