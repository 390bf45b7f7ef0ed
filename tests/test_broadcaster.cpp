#include "broadcaster.hpp"
#include "connection_manager.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include "utils.hpp"

#include <gtest/gtest.h>

#include <sys/socket.h>

#include <atomic>
#include <future>

namespace lanchat {
namespace {

using std::chrono::milliseconds;

std::vector<uint8_t> bytes_of(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

BroadcastSettings broadcast_settings(milliseconds send_timeout = milliseconds(2000)) {
    BroadcastSettings settings;
    settings.max_payload_bytes = 64 * 1024;
    settings.send_timeout = send_timeout;
    settings.inbound_capacity = 16;
    return settings;
}

ConnectionSettings connection_settings() {
    ConnectionSettings settings;
    settings.handshake_timeout = milliseconds(1000);
    settings.connect_timeout = milliseconds(1000);
    settings.send_timeout = milliseconds(2000);
    settings.max_plaintext_size = max_envelope_size(64 * 1024);
    return settings;
}

// Registry, manager and broadcaster wired the way a node wires them.
struct ChatPeer {
    explicit ChatPeer(const std::string& name, BroadcastSettings settings = broadcast_settings())
        : identity(test::make_identity(name)),
          registry(RegistryLimits()),
          manager(identity, registry, connection_settings()),
          broadcaster(identity, [this] { return manager.connections(); }, settings) {
        manager.set_frame_handler([this](Connection& from, std::vector<uint8_t> plaintext) {
            broadcaster.deliver(from, plaintext);
        });
        port = manager.run_listener(0, "127.0.0.1");
    }

    ~ChatPeer() {
        manager.shutdown();
        broadcaster.close();
    }

    std::shared_ptr<Connection> dial(const ChatPeer& other) {
        registry.on_sighting(test::loopback_sighting(other.identity, other.port));
        if (manager.connect_to(registry.find(other.identity.instance_id).value()) != ConnectOutcome::Connected) {
            return nullptr;
        }
        return manager.find(other.identity.instance_id);
    }

    PeerIdentity identity;
    PeerRegistry registry;
    ConnectionManager manager;
    MessageBroadcaster broadcaster;
    uint16_t port = 0;
};

// A connection whose threads never start, so its outbound queue only fills.
std::shared_ptr<Connection> idle_connection(test::SocketPair& sockets, const PeerIdentity& peer,
                                            std::size_t capacity) {
    auto channel = std::make_unique<SecureChannel>(random_bytes(kSessionKeySize), std::vector<uint8_t>{1, 2, 3, 4},
                                                   std::vector<uint8_t>{5, 6, 7, 8}, 1 << 20);
    PeerIdentity with_address = peer;
    with_address.network_address = "192.0.2.10";
    return std::make_shared<Connection>(sockets.release_first(), Role::Initiator, with_address, 50000,
                                        std::move(channel), capacity, milliseconds(100));
}

std::vector<uint8_t> envelope_from(const PeerIdentity& sender, MessageKind kind, const std::string& text) {
    MessageEnvelope envelope;
    envelope.sender = sender;
    envelope.kind = kind;
    envelope.payload = bytes_of(text);
    return serialize_envelope(envelope, 64 * 1024);
}

TEST(BroadcasterTest, OneBrokenPeerDoesNotHoldUpTheOthers) {
    ChatPeer hub("Hub");
    ChatPeer p1("P1");
    ChatPeer p2("P2");
    ChatPeer p3("P3");

    std::vector<std::shared_ptr<Connection>> targets{hub.dial(p1), hub.dial(p2), hub.dial(p3)};
    for (const auto& connection : targets) {
        ASSERT_TRUE(connection);
    }

    // The broadcaster sees a fixed set so the broken peer is still targeted.
    MessageBroadcaster fanout(hub.identity, [&targets] { return targets; }, broadcast_settings());
    ASSERT_EQ(::shutdown(targets[2]->native_handle(), SHUT_WR), 0);

    const auto started = std::chrono::steady_clock::now();
    auto outcomes = fanout.send(MessageKind::Text, bytes_of("hello everyone"));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_EQ(outcomes[0].status, DeliveryStatus::Delivered);
    EXPECT_EQ(outcomes[1].status, DeliveryStatus::Delivered);
    EXPECT_EQ(outcomes[2].status, DeliveryStatus::Failed);
    EXPECT_EQ(outcomes[2].peer.instance_id, p3.identity.instance_id);
    EXPECT_FALSE(outcomes[2].detail.empty());
    EXPECT_LT(elapsed, milliseconds(1000));

    for (ChatPeer* receiver : {&p1, &p2}) {
        auto message = receiver->broadcaster.inbound_stream().pop_for(milliseconds(2000));
        ASSERT_TRUE(message.has_value());
        EXPECT_EQ(message->envelope.kind, MessageKind::Text);
        EXPECT_EQ(message->envelope.payload, bytes_of("hello everyone"));
        EXPECT_EQ(message->envelope.sender.display_name, "Hub");
        EXPECT_EQ(message->peer.instance_id, hub.identity.instance_id);
        EXPECT_EQ(message->envelope.sender.network_address, "127.0.0.1");
    }
}

TEST(BroadcasterTest, MessagesFromOnePeerArriveInOrder) {
    ChatPeer alice("Alice");
    ChatPeer bob("Bob");
    ASSERT_TRUE(alice.dial(bob));

    for (int i = 0; i < 20; ++i) {
        auto outcomes = alice.broadcaster.send(MessageKind::Text, bytes_of("line " + std::to_string(i)));
        ASSERT_EQ(outcomes.size(), 1u);
        EXPECT_EQ(outcomes[0].status, DeliveryStatus::Delivered);
    }
    for (int i = 0; i < 20; ++i) {
        auto message = bob.broadcaster.inbound_stream().pop_for(milliseconds(2000));
        ASSERT_TRUE(message.has_value());
        EXPECT_EQ(message->envelope.payload, bytes_of("line " + std::to_string(i)));
    }
}

TEST(BroadcasterTest, NoPeersMeansNoOutcomes) {
    MessageBroadcaster broadcaster(test::make_identity("Alone"), [] { return std::vector<std::shared_ptr<Connection>>(); },
                                   broadcast_settings());
    EXPECT_TRUE(broadcaster.send(MessageKind::Text, bytes_of("anyone?")).empty());
    EXPECT_EQ(broadcaster.post(MessageKind::Control, bytes_of("keepalive")), 0u);
}

TEST(BroadcasterTest, OversizedPayloadRefusedBeforeAnyDelivery) {
    test::SocketPair sockets;
    auto connection = idle_connection(sockets, test::make_identity("Bob"), 4);
    MessageBroadcaster broadcaster(test::make_identity("Alice"), [&] { return std::vector<std::shared_ptr<Connection>>{connection}; },
                                   broadcast_settings());
    EXPECT_THROW(broadcaster.send(MessageKind::Video, std::vector<uint8_t>(64 * 1024 + 1, 0)), ProtocolError);
}

TEST(BroadcasterTest, FullQueueReportsUnreachable) {
    test::SocketPair sockets;
    auto connection = idle_connection(sockets, test::make_identity("Bob"), 1);
    ASSERT_EQ(connection->submit(std::make_shared<const std::vector<uint8_t>>(bytes_of("stuck")), milliseconds(0)).queued,
              PushResult::Ok);

    MessageBroadcaster broadcaster(test::make_identity("Alice"), [&] { return std::vector<std::shared_ptr<Connection>>{connection}; },
                                   broadcast_settings(milliseconds(100)));
    auto outcomes = broadcaster.send(MessageKind::Text, bytes_of("hello"));
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].status, DeliveryStatus::Unreachable);
    EXPECT_EQ(broadcaster.post(MessageKind::Control, bytes_of("keepalive")), 0u);
}

TEST(BroadcasterTest, ClosedConnectionReportsFailed) {
    test::SocketPair sockets;
    auto connection = idle_connection(sockets, test::make_identity("Bob"), 4);
    connection->close("test");

    MessageBroadcaster broadcaster(test::make_identity("Alice"), [&] { return std::vector<std::shared_ptr<Connection>>{connection}; },
                                   broadcast_settings());
    auto outcomes = broadcaster.send(MessageKind::Text, bytes_of("hello"));
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].status, DeliveryStatus::Failed);
    EXPECT_EQ(outcomes[0].detail, "connection closed");
}

TEST(BroadcasterTest, DeliverChecksSenderAndHidesControl) {
    test::SocketPair sockets;
    PeerIdentity bob = test::make_identity("Bob");
    auto from_bob = idle_connection(sockets, bob, 4);
    MessageBroadcaster broadcaster(test::make_identity("Alice"), [] { return std::vector<std::shared_ptr<Connection>>(); },
                                   broadcast_settings());

    EXPECT_THROW(broadcaster.deliver(*from_bob, envelope_from(test::make_identity("Mallory"), MessageKind::Text, "hi")),
                 ProtocolError);
    EXPECT_THROW(broadcaster.deliver(*from_bob, bytes_of("not an envelope")), ProtocolError);

    broadcaster.deliver(*from_bob, envelope_from(bob, MessageKind::Control, "keepalive"));
    EXPECT_EQ(broadcaster.inbound_stream().size(), 0u);

    broadcaster.deliver(*from_bob, envelope_from(bob, MessageKind::Image, "png"));
    auto message = broadcaster.inbound_stream().pop_for(milliseconds(0));
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->envelope.kind, MessageKind::Image);
    EXPECT_EQ(message->envelope.sender.network_address, "192.0.2.10");
    EXPECT_EQ(message->peer.display_name, "Bob");
}

TEST(BroadcasterTest, SlowConsumerHoldsTheReaderInsteadOfDropping) {
    test::SocketPair sockets;
    PeerIdentity bob = test::make_identity("Bob");
    auto from_bob = idle_connection(sockets, bob, 4);
    BroadcastSettings settings = broadcast_settings(milliseconds(20));
    settings.inbound_capacity = 1;
    MessageBroadcaster broadcaster(test::make_identity("Alice"), [] { return std::vector<std::shared_ptr<Connection>>(); },
                                   settings);
    std::atomic<int> backlog_calls{0};
    broadcaster.set_backlog_handler([&](const Connection&) { ++backlog_calls; });

    broadcaster.deliver(*from_bob, envelope_from(bob, MessageKind::Text, "one"));
    auto second = std::async(std::launch::async, [&] {
        broadcaster.deliver(*from_bob, envelope_from(bob, MessageKind::Text, "two"));
    });
    EXPECT_EQ(second.wait_for(milliseconds(300)), std::future_status::timeout);
    EXPECT_GT(backlog_calls.load(), 0);

    auto first = broadcaster.inbound_stream().pop_for(milliseconds(1000));
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->envelope.payload, bytes_of("one"));
    ASSERT_EQ(second.wait_for(milliseconds(2000)), std::future_status::ready);
    second.get();

    auto next = broadcaster.inbound_stream().pop_for(milliseconds(1000));
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->envelope.payload, bytes_of("two"));
    EXPECT_EQ(broadcaster.dropped_inbound(), 0u);
}

TEST(BroadcasterTest, ClosingTheConnectionReleasesAWaitingReader) {
    test::SocketPair sockets;
    PeerIdentity bob = test::make_identity("Bob");
    auto from_bob = idle_connection(sockets, bob, 4);
    BroadcastSettings settings = broadcast_settings();
    settings.inbound_capacity = 1;
    MessageBroadcaster broadcaster(test::make_identity("Alice"), [] { return std::vector<std::shared_ptr<Connection>>(); },
                                   settings);

    broadcaster.deliver(*from_bob, envelope_from(bob, MessageKind::Text, "one"));
    auto second = std::async(std::launch::async, [&] {
        broadcaster.deliver(*from_bob, envelope_from(bob, MessageKind::Text, "two"));
    });
    EXPECT_EQ(second.wait_for(milliseconds(200)), std::future_status::timeout);

    from_bob->close("test");
    ASSERT_EQ(second.wait_for(milliseconds(2000)), std::future_status::ready);
    EXPECT_EQ(broadcaster.dropped_inbound(), 1u);
    EXPECT_EQ(broadcaster.inbound_stream().size(), 1u);
}

TEST(BroadcasterTest, ClosingTheStreamReleasesAWaitingReader) {
    test::SocketPair sockets;
    PeerIdentity bob = test::make_identity("Bob");
    auto from_bob = idle_connection(sockets, bob, 4);
    BroadcastSettings settings = broadcast_settings();
    settings.inbound_capacity = 1;
    MessageBroadcaster broadcaster(test::make_identity("Alice"), [] { return std::vector<std::shared_ptr<Connection>>(); },
                                   settings);

    broadcaster.deliver(*from_bob, envelope_from(bob, MessageKind::Text, "one"));
    auto second = std::async(std::launch::async, [&] {
        broadcaster.deliver(*from_bob, envelope_from(bob, MessageKind::Text, "two"));
    });
    broadcaster.close();
    ASSERT_EQ(second.wait_for(milliseconds(2000)), std::future_status::ready);
    EXPECT_EQ(broadcaster.dropped_inbound(), 0u);
}

TEST(BroadcasterTest, EveryDeliveredMessageReachesASlowConsumer) {
    BroadcastSettings narrow = broadcast_settings(milliseconds(300));
    narrow.inbound_capacity = 1;
    ChatPeer alice("Alice", broadcast_settings(milliseconds(300)));
    ChatPeer bob("Bob", narrow);
    ASSERT_TRUE(alice.dial(bob));

    std::vector<std::string> delivered;
    for (int i = 0; i < 5; ++i) {
        const std::string text = "line " + std::to_string(i);
        auto outcomes = alice.broadcaster.send(MessageKind::Text, bytes_of(text));
        ASSERT_EQ(outcomes.size(), 1u);
        if (outcomes[0].status == DeliveryStatus::Delivered) {
            delivered.push_back(text);
        }
    }
    EXPECT_FALSE(delivered.empty());

    for (std::size_t i = 0; i < delivered.size(); ++i) {
        auto message = bob.broadcaster.inbound_stream().pop_for(milliseconds(2000));
        ASSERT_TRUE(message.has_value()) << "message " << i << " of " << delivered.size();
        EXPECT_EQ(message->envelope.payload, bytes_of(delivered[i]));
    }
    EXPECT_EQ(bob.broadcaster.dropped_inbound(), 0u);
}

TEST(BroadcasterTest, WriteWaitGrowsWithFrameSize) {
    const milliseconds timeout(2000);
    EXPECT_EQ(write_wait(0, timeout), milliseconds(4000));
    EXPECT_EQ(write_wait(1024, timeout), milliseconds(4000));
    EXPECT_EQ(write_wait(50u * 1024u * 1024u, timeout), milliseconds(4000 + 50 * 1000));
}

} // namespace
} // namespace lanchat
