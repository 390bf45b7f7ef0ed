#include "discovery.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <optional>

namespace lanchat {
namespace {

using std::chrono::milliseconds;

DiscoverySettings settings_on(uint16_t port) {
    DiscoverySettings settings;
    settings.port = port;
    settings.announce_interval = milliseconds(100);
    return settings;
}

// Pops sightings until one for instance_id arrives or the wait runs out.
std::optional<PeerSighting> await_sighting(BlockingQueue<PeerSighting>& sightings, const std::string& instance_id,
                                           milliseconds wait = milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + wait;
    while (std::chrono::steady_clock::now() < deadline) {
        auto sighting = sightings.pop_for(milliseconds(100));
        if (sighting.has_value() && sighting->identity.instance_id == instance_id) {
            return sighting;
        }
    }
    return std::nullopt;
}

TEST(DiscoveryTest, BrowserSeesAdvertisedPeer) {
    PeerIdentity alice = test::make_identity("Alice");
    PeerIdentity bob = test::make_identity("Bob");
    DiscoveryService advertiser(alice, settings_on(50771));
    DiscoveryService browser(bob, settings_on(50771));
    advertiser.open();
    browser.open();

    auto& sightings = browser.browse();
    advertiser.advertise(alice, 50000);

    auto sighting = await_sighting(sightings, alice.instance_id);
    ASSERT_TRUE(sighting.has_value());
    EXPECT_EQ(sighting->identity.display_name, "Alice");
    EXPECT_EQ(sighting->port, 50000);
    EXPECT_FALSE(sighting->address.empty());
    EXPECT_EQ(sighting->identity.network_address, sighting->address);
    EXPECT_GT(sighting->seen_at_ms, 0u);
}

TEST(DiscoveryTest, OwnAnnouncementsAreFiltered) {
    PeerIdentity alice = test::make_identity("Alice");
    PeerIdentity bob = test::make_identity("Bob");
    DiscoveryService alice_side(alice, settings_on(50772));
    DiscoveryService bob_side(bob, settings_on(50772));
    alice_side.open();
    bob_side.open();

    auto& heard_by_alice = alice_side.browse();
    alice_side.advertise(alice, 50000);
    bob_side.advertise(bob, 50001);

    // Once Bob is heard, Alice's own announcements have looped back too.
    ASSERT_TRUE(await_sighting(heard_by_alice, bob.instance_id).has_value());
    EXPECT_FALSE(await_sighting(heard_by_alice, alice.instance_id, milliseconds(500)).has_value());
}

TEST(DiscoveryTest, RetargetedAdvertisementCarriesNewPort) {
    PeerIdentity alice = test::make_identity("Alice");
    PeerIdentity bob = test::make_identity("Bob");
    DiscoveryService advertiser(alice, settings_on(50773));
    DiscoveryService browser(bob, settings_on(50773));
    advertiser.open();
    browser.open();

    auto& sightings = browser.browse();
    advertiser.advertise(alice, 50000);
    ASSERT_TRUE(await_sighting(sightings, alice.instance_id).has_value());

    advertiser.advertise(alice, 50009);
    bool moved = false;
    for (int i = 0; i < 20 && !moved; ++i) {
        auto sighting = await_sighting(sightings, alice.instance_id);
        moved = sighting.has_value() && sighting->port == 50009;
    }
    EXPECT_TRUE(moved);
}

TEST(DiscoveryTest, StopClosesTheSightingQueue) {
    DiscoveryService service(test::make_identity("Alice"), settings_on(50774));
    service.open();
    auto& sightings = service.browse();

    service.stop();
    EXPECT_TRUE(sightings.closed());
    sightings.drain();
    EXPECT_FALSE(sightings.pop().has_value());
    service.stop();
}

TEST(DiscoveryTest, UseBeforeOpenOrWithBadGroupFails) {
    PeerIdentity alice = test::make_identity("Alice");
    DiscoveryService closed(alice, settings_on(50775));
    EXPECT_THROW(closed.advertise(alice, 50000), DiscoveryError);
    EXPECT_THROW(closed.browse(), DiscoveryError);

    DiscoverySettings unicast = settings_on(50775);
    unicast.multicast_group = "10.0.0.1";
    DiscoveryService misconfigured(alice, unicast);
    EXPECT_THROW(misconfigured.open(), DiscoveryError);
    EXPECT_EQ(misconfigured.send_errors(), 0u);
    EXPECT_EQ(misconfigured.receive_errors(), 0u);
}

} // namespace
} // namespace lanchat
