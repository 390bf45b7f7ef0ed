#include "peer_registry.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

namespace lanchat {
namespace {

class PeerRegistryTest : public ::testing::Test {
protected:
    PeerRegistryTest() : registry_(limits(), [this] { return now_; }) {}

    static RegistryLimits limits() {
        RegistryLimits limits;
        limits.stale_after_ms = 1000;
        limits.evict_after_ms = 5000;
        limits.retry_backoff_ms = 100;
        limits.retry_backoff_max_ms = 350;
        return limits;
    }

    PeerSighting sighting(const PeerIdentity& identity, uint16_t port = 50000) {
        PeerSighting s = test::loopback_sighting(identity, port);
        s.seen_at_ms = now_;
        return s;
    }

    PeerStatus status_of(const std::string& id) const {
        auto record = registry_.find(id);
        EXPECT_TRUE(record.has_value());
        return record ? record->status : PeerStatus::Lost;
    }

    uint64_t now_ = 1000;
    PeerRegistry registry_;
    PeerIdentity bob_ = test::make_identity("Bob");
};

TEST_F(PeerRegistryTest, RepeatedSightingsKeepOneRecord) {
    EXPECT_TRUE(registry_.on_sighting(sighting(bob_)));
    now_ += 10;
    EXPECT_TRUE(registry_.on_sighting(sighting(bob_)));
    EXPECT_EQ(registry_.size(), 1u);

    auto record = registry_.find(bob_.instance_id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, PeerStatus::Discovered);
    EXPECT_EQ(record->last_seen_ms, 1010u);
    EXPECT_EQ(record->identity.network_address, "127.0.0.1");
}

TEST_F(PeerRegistryTest, SightingNeverDowngradesLiveConnection) {
    registry_.on_sighting(sighting(bob_));
    ASSERT_TRUE(registry_.try_begin_connect(bob_.instance_id));
    EXPECT_FALSE(registry_.on_sighting(sighting(bob_, 50001)));
    EXPECT_EQ(status_of(bob_.instance_id), PeerStatus::Connecting);

    EXPECT_TRUE(registry_.mark_connected(bob_, 50000));
    EXPECT_FALSE(registry_.on_sighting(sighting(bob_, 50002)));
    auto record = registry_.find(bob_.instance_id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, PeerStatus::Connected);
    EXPECT_EQ(record->listen_port, 50000);
}

TEST_F(PeerRegistryTest, OnlyOneConnectAttemptAtATime) {
    registry_.on_sighting(sighting(bob_));
    EXPECT_TRUE(registry_.try_begin_connect(bob_.instance_id));
    EXPECT_FALSE(registry_.try_begin_connect(bob_.instance_id));
    EXPECT_FALSE(registry_.try_begin_connect("unknown"));

    registry_.connect_abandoned(bob_.instance_id);
    EXPECT_EQ(status_of(bob_.instance_id), PeerStatus::Discovered);
    EXPECT_TRUE(registry_.try_begin_connect(bob_.instance_id));
}

TEST_F(PeerRegistryTest, FailedConnectsBackOffExponentiallyUpToCap) {
    registry_.on_sighting(sighting(bob_));

    const uint64_t expected[] = {100, 200, 350, 350};
    for (uint64_t backoff : expected) {
        ASSERT_TRUE(registry_.try_begin_connect(bob_.instance_id));
        registry_.connect_failed(bob_.instance_id);
        EXPECT_EQ(status_of(bob_.instance_id), PeerStatus::Discovered);

        now_ += backoff - 1;
        EXPECT_FALSE(registry_.try_begin_connect(bob_.instance_id));
        now_ += 1;
    }
    EXPECT_EQ(registry_.find(bob_.instance_id)->failed_attempts, 4u);

    ASSERT_TRUE(registry_.try_begin_connect(bob_.instance_id));
    registry_.mark_connected(bob_, 0);
    EXPECT_EQ(registry_.find(bob_.instance_id)->failed_attempts, 0u);
}

TEST_F(PeerRegistryTest, LostIsReportedExactlyOnce) {
    registry_.on_sighting(sighting(bob_));
    registry_.mark_connected(bob_, 50000);
    EXPECT_FALSE(registry_.mark_connected(bob_, 50000));

    EXPECT_TRUE(registry_.mark_lost(bob_.instance_id));
    EXPECT_FALSE(registry_.mark_lost(bob_.instance_id));
    EXPECT_FALSE(registry_.mark_lost("unknown"));
    EXPECT_TRUE(registry_.list_connected().empty());
}

TEST_F(PeerRegistryTest, TeardownAfterExpiryAndRedialLeavesNewAttemptAlone) {
    registry_.on_sighting(sighting(bob_));
    registry_.mark_connected(bob_, 50000);

    now_ += 1001;
    auto report = registry_.expire();
    ASSERT_EQ(report.lost.size(), 1u);

    // A sighting and a new dial land before the old connection is closed.
    EXPECT_TRUE(registry_.on_sighting(sighting(bob_)));
    ASSERT_TRUE(registry_.try_begin_connect(bob_.instance_id));

    EXPECT_FALSE(registry_.mark_lost(bob_.instance_id));
    EXPECT_EQ(status_of(bob_.instance_id), PeerStatus::Connecting);

    registry_.connect_abandoned(bob_.instance_id);
    EXPECT_FALSE(registry_.mark_lost(bob_.instance_id));
    EXPECT_EQ(status_of(bob_.instance_id), PeerStatus::Discovered);
}

TEST_F(PeerRegistryTest, SilentPeerGoesStaleThenEvicted) {
    registry_.on_sighting(sighting(bob_));
    registry_.mark_connected(bob_, 50000);
    ASSERT_EQ(registry_.list_connected().size(), 1u);

    now_ += 1000;
    EXPECT_TRUE(registry_.expire().lost.empty());

    now_ += 1;
    auto report = registry_.expire();
    ASSERT_EQ(report.lost.size(), 1u);
    EXPECT_EQ(report.lost[0].identity.instance_id, bob_.instance_id);
    EXPECT_EQ(report.lost[0].previous, PeerStatus::Connected);
    EXPECT_EQ(status_of(bob_.instance_id), PeerStatus::Lost);
    EXPECT_TRUE(registry_.list_connected().empty());

    // A second sweep does not report the same peer again.
    now_ += 10;
    EXPECT_TRUE(registry_.expire().lost.empty());

    now_ += 5000;
    report = registry_.expire();
    ASSERT_EQ(report.evicted.size(), 1u);
    EXPECT_EQ(report.evicted[0], bob_.instance_id);
    EXPECT_FALSE(registry_.find(bob_.instance_id).has_value());
}

TEST_F(PeerRegistryTest, SightingRevivesLostPeer) {
    registry_.on_sighting(sighting(bob_));
    ASSERT_TRUE(registry_.try_begin_connect(bob_.instance_id));
    registry_.connect_failed(bob_.instance_id);
    registry_.mark_connected(bob_, 50000);
    ASSERT_TRUE(registry_.mark_lost(bob_.instance_id));

    now_ += 2000;
    EXPECT_TRUE(registry_.on_sighting(sighting(bob_, 50010)));
    auto record = registry_.find(bob_.instance_id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, PeerStatus::Discovered);
    EXPECT_EQ(record->listen_port, 50010);
    EXPECT_EQ(record->failed_attempts, 0u);
    EXPECT_TRUE(registry_.try_begin_connect(bob_.instance_id));
}

TEST_F(PeerRegistryTest, TrafficKeepsPeerFresh) {
    registry_.mark_connected(bob_, 50000);
    for (int i = 0; i < 5; ++i) {
        now_ += 600;
        registry_.touch(bob_.instance_id);
        EXPECT_TRUE(registry_.expire().lost.empty());
    }
    EXPECT_EQ(status_of(bob_.instance_id), PeerStatus::Connected);
}

TEST_F(PeerRegistryTest, SnapshotListsEveryRecord) {
    PeerIdentity carol = test::make_identity("Carol");
    registry_.on_sighting(sighting(bob_));
    registry_.on_sighting(sighting(carol, 50001));
    registry_.mark_connected(carol, 50001);

    auto records = registry_.snapshot();
    EXPECT_EQ(records.size(), 2u);
    auto connected = registry_.list_connected();
    ASSERT_EQ(connected.size(), 1u);
    EXPECT_EQ(connected[0].display_name, "Carol");
}

} // namespace
} // namespace lanchat
