/*
 * LanChat - application message envelope implementation
 */

#include "message.hpp"

#include "errors.hpp"
#include "protocol.hpp"

namespace lanchat {

namespace {
constexpr uint8_t kEnvelopeVersion = 1;
constexpr std::size_t kFixedHeaderSize = 1 + 1 + 1 + 2 + 4;
constexpr std::size_t kMaxIdLength = 0xFF;
constexpr std::size_t kMaxNameLength = 0xFFFF;

bool is_known_kind(uint8_t raw) {
    return raw >= static_cast<uint8_t>(MessageKind::Text) &&
           raw <= static_cast<uint8_t>(MessageKind::Control);
}

class Reader {
public:
    explicit Reader(const std::vector<uint8_t>& bytes) : bytes_(bytes) {}

    uint8_t u8() {
        require(1);
        return bytes_[offset_++];
    }

    uint16_t u16() {
        require(2);
        uint16_t value = static_cast<uint16_t>(bytes_[offset_] << 8 | bytes_[offset_ + 1]);
        offset_ += 2;
        return value;
    }

    uint32_t u32() {
        require(4);
        uint32_t value = read_u32_be(bytes_.data() + offset_);
        offset_ += 4;
        return value;
    }

    std::string string(std::size_t len) {
        require(len);
        std::string value(bytes_.begin() + offset_, bytes_.begin() + offset_ + len);
        offset_ += len;
        return value;
    }

    std::vector<uint8_t> bytes(std::size_t len) {
        require(len);
        std::vector<uint8_t> value(bytes_.begin() + offset_, bytes_.begin() + offset_ + len);
        offset_ += len;
        return value;
    }

    std::size_t remaining() const { return bytes_.size() - offset_; }

private:
    void require(std::size_t len) const {
        if (remaining() < len) {
            throw ProtocolError("envelope truncated");
        }
    }

    const std::vector<uint8_t>& bytes_;
    std::size_t offset_ = 0;
};

} // namespace

const char* to_string(MessageKind kind) {
    switch (kind) {
        case MessageKind::Text:
            return "text";
        case MessageKind::Image:
            return "image";
        case MessageKind::Video:
            return "video";
        case MessageKind::Control:
            return "control";
        default:
            return "unknown";
    }
}

std::size_t envelope_overhead(const PeerIdentity& sender) {
    return kFixedHeaderSize + sender.instance_id.size() + sender.display_name.size();
}

std::size_t max_envelope_size(std::size_t max_payload_bytes) {
    return kFixedHeaderSize + kMaxIdLength + kMaxNameLength + max_payload_bytes;
}

std::vector<uint8_t> serialize_envelope(const MessageEnvelope& envelope, std::size_t max_payload_bytes) {
    if (envelope.payload.size() > max_payload_bytes) {
        throw ProtocolError("payload of " + std::to_string(envelope.payload.size()) +
                            " bytes exceeds limit " + std::to_string(max_payload_bytes));
    }
    if (envelope.sender.instance_id.empty() || envelope.sender.instance_id.size() > kMaxIdLength) {
        throw ProtocolError("sender instance id has invalid length");
    }
    if (envelope.sender.display_name.size() > kMaxNameLength) {
        throw ProtocolError("sender display name too long");
    }

    std::vector<uint8_t> out;
    out.reserve(envelope_overhead(envelope.sender) + envelope.payload.size());
    out.push_back(kEnvelopeVersion);
    out.push_back(static_cast<uint8_t>(envelope.kind));

    out.push_back(static_cast<uint8_t>(envelope.sender.instance_id.size()));
    out.insert(out.end(), envelope.sender.instance_id.begin(), envelope.sender.instance_id.end());

    const auto name_len = static_cast<uint16_t>(envelope.sender.display_name.size());
    out.push_back(static_cast<uint8_t>(name_len >> 8));
    out.push_back(static_cast<uint8_t>(name_len & 0xFF));
    out.insert(out.end(), envelope.sender.display_name.begin(), envelope.sender.display_name.end());

    uint8_t len_bytes[4];
    write_u32_be(len_bytes, static_cast<uint32_t>(envelope.payload.size()));
    out.insert(out.end(), len_bytes, len_bytes + 4);
    out.insert(out.end(), envelope.payload.begin(), envelope.payload.end());
    return out;
}

MessageEnvelope deserialize_envelope(const std::vector<uint8_t>& bytes, std::size_t max_payload_bytes) {
    Reader reader(bytes);

    const uint8_t version = reader.u8();
    if (version != kEnvelopeVersion) {
        throw ProtocolError("unsupported envelope version " + std::to_string(version));
    }
    const uint8_t raw_kind = reader.u8();
    if (!is_known_kind(raw_kind)) {
        throw ProtocolError("unknown message kind " + std::to_string(raw_kind));
    }

    MessageEnvelope envelope;
    envelope.kind = static_cast<MessageKind>(raw_kind);

    const uint8_t id_len = reader.u8();
    if (id_len == 0) {
        throw ProtocolError("empty sender instance id");
    }
    envelope.sender.instance_id = reader.string(id_len);
    envelope.sender.display_name = reader.string(reader.u16());

    const uint32_t payload_len = reader.u32();
    if (payload_len > max_payload_bytes) {
        throw ProtocolError("declared payload of " + std::to_string(payload_len) +
                            " bytes exceeds limit " + std::to_string(max_payload_bytes));
    }
    envelope.payload = reader.bytes(payload_len);
    if (reader.remaining() != 0) {
        throw ProtocolError("trailing bytes after envelope payload");
    }
    return envelope;
}

} // namespace lanchat
