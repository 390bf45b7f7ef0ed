#include "errors.hpp"
#include "protocol.hpp"
#include "test_support.hpp"
#include "utils.hpp"

#include <gtest/gtest.h>

namespace lanchat {
namespace {

std::vector<uint8_t> bytes_of(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

TEST(ProtocolTest, BigEndianLength) {
    uint8_t buffer[4];
    write_u32_be(buffer, 0x01020304u);
    EXPECT_EQ(buffer[0], 0x01);
    EXPECT_EQ(buffer[3], 0x04);
    EXPECT_EQ(read_u32_be(buffer), 0x01020304u);
}

TEST(ProtocolTest, FramesArriveWholeAndInOrder) {
    test::SocketPair pair;
    ASSERT_TRUE(send_frame(pair.first(), bytes_of("one")));
    ASSERT_TRUE(send_frame(pair.first(), {}));
    ASSERT_TRUE(send_frame(pair.first(), bytes_of("three")));

    EXPECT_EQ(receive_frame(pair.second(), 64), bytes_of("one"));
    auto empty = receive_frame(pair.second(), 64);
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
    EXPECT_EQ(receive_frame(pair.second(), 64), bytes_of("three"));
}

TEST(ProtocolTest, OversizedLengthRejectedBeforeBodyAndStreamStaysUsable) {
    test::SocketPair pair;

    // Declare a 1 GiB body but never send it.
    uint8_t header[kLengthPrefixSize];
    write_u32_be(header, 1u << 30);
    ASSERT_TRUE(send_all(pair.first(), header, sizeof(header)));
    ASSERT_TRUE(send_frame(pair.first(), bytes_of("after")));

    EXPECT_THROW(receive_frame(pair.second(), 1024), ProtocolError);
    // Only the prefix was consumed; the next unit parses normally.
    EXPECT_EQ(receive_frame(pair.second(), 1024), bytes_of("after"));
}

TEST(ProtocolTest, ClosedStreamYieldsNullopt) {
    test::SocketPair pair;
    ::close(pair.release_first());
    EXPECT_FALSE(receive_frame(pair.second(), 64).has_value());
}

TEST(ProtocolTest, TruncatedBodyYieldsNullopt) {
    test::SocketPair pair;
    uint8_t header[kLengthPrefixSize];
    write_u32_be(header, 10);
    ASSERT_TRUE(send_all(pair.first(), header, sizeof(header)));
    ASSERT_TRUE(send_all(pair.first(), reinterpret_cast<const uint8_t*>("abc"), 3));
    ::close(pair.release_first());
    EXPECT_FALSE(receive_frame(pair.second(), 64).has_value());
}

TEST(ProtocolTest, ReceiveTimesOut) {
    test::SocketPair pair;
    ASSERT_TRUE(set_socket_timeouts(pair.second(), std::chrono::milliseconds(50)));
    EXPECT_FALSE(receive_frame(pair.second(), 64).has_value());
}

TEST(ProtocolTest, AnnouncementRoundTrip) {
    Announcement announcement;
    announcement.instance_id = generate_instance_id();
    announcement.display_name = "Alice; the =tester";
    announcement.port = 50000;

    auto decoded = decode_announcement(encode_announcement(announcement));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->instance_id, announcement.instance_id);
    EXPECT_EQ(decoded->display_name, announcement.display_name);
    EXPECT_EQ(decoded->port, 50000);
}

TEST(ProtocolTest, ForeignOrMalformedAnnouncementsIgnored) {
    const std::string id = generate_instance_id();
    const std::string name = base64_encode({'B', 'o', 'b'});

    EXPECT_FALSE(decode_announcement("svc=other;v=1;id=" + id + ";name=" + name + ";port=5").has_value());
    EXPECT_FALSE(decode_announcement("svc=lanchat;v=2;id=" + id + ";name=" + name + ";port=5").has_value());
    EXPECT_FALSE(decode_announcement("svc=lanchat;v=1;id=XYZ;name=" + name + ";port=5").has_value());
    EXPECT_FALSE(decode_announcement("svc=lanchat;v=1;id=" + id + ";name=;port=5").has_value());
    EXPECT_FALSE(decode_announcement("svc=lanchat;v=1;id=" + id + ";name=" + name + ";port=0").has_value());
    EXPECT_FALSE(decode_announcement("svc=lanchat;v=1;id=" + id + ";name=" + name + ";port=70000").has_value());
    EXPECT_FALSE(decode_announcement("svc=lanchat;v=1;id=" + id + ";name=" + name).has_value());
    EXPECT_FALSE(decode_announcement("garbage").has_value());
    EXPECT_TRUE(decode_announcement("svc=lanchat;v=1;id=" + id + ";name=" + name + ";port=5").has_value());
}

TEST(ProtocolTest, InstanceIdShape) {
    EXPECT_TRUE(is_valid_instance_id(generate_instance_id()));
    EXPECT_FALSE(is_valid_instance_id(""));
    EXPECT_FALSE(is_valid_instance_id(std::string(32, 'A')));
    EXPECT_FALSE(is_valid_instance_id(std::string(31, 'a')));
}

} // namespace
} // namespace lanchat
