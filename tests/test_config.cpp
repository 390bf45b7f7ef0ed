#include "config.hpp"
#include "utils.hpp"

#include <gtest/gtest.h>

namespace lanchat {
namespace {

NodeConfig named(const std::string& name) {
    NodeConfig config;
    config.display_name = name;
    return config;
}

TEST(ConfigTest, DefaultsAreValidOnceNamed) {
    NodeConfig config = named("Alice");
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.listen_port, 50000);
    EXPECT_EQ(config.multicast_group, "239.255.77.77");
    EXPECT_EQ(config.max_payload_bytes, 50u * 1024u * 1024u);
    EXPECT_TRUE(config.discovery_enabled);
}

TEST(ConfigTest, EmptyNameRejected) {
    EXPECT_THROW(named("").validate(), std::invalid_argument);
    EXPECT_THROW(named("   ").validate(), std::invalid_argument);
    EXPECT_THROW(named(std::string(65, 'x')).validate(), std::invalid_argument);
}

TEST(ConfigTest, OverridesApply) {
    NodeConfig config = named("Alice");
    config.apply_overrides("port=0;discovery=off;stale_after_ms=4000;max_payload_mb=2;outbound_queue=8");
    EXPECT_EQ(config.listen_port, 0);
    EXPECT_FALSE(config.discovery_enabled);
    EXPECT_EQ(config.stale_after_ms, 4000u);
    EXPECT_EQ(config.max_payload_bytes, 2u * 1024u * 1024u);
    EXPECT_EQ(config.outbound_queue_capacity, 8u);
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, BadOverridesRejected) {
    NodeConfig config = named("Alice");
    EXPECT_THROW(config.apply_overrides("colour=blue"), std::invalid_argument);
    EXPECT_THROW(config.apply_overrides("port=-1"), std::invalid_argument);
    EXPECT_THROW(config.apply_overrides("port=70000"), std::invalid_argument);
    EXPECT_THROW(config.apply_overrides("discovery=maybe"), std::invalid_argument);
    EXPECT_THROW(config.apply_overrides("log_level=loud"), std::invalid_argument);
}

TEST(ConfigTest, InconsistentWindowsRejected) {
    NodeConfig config = named("Alice");
    config.stale_after_ms = config.announce_interval_ms;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = named("Alice");
    config.retry_backoff_max_ms = config.retry_backoff_ms - 1;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = named("Alice");
    config.multicast_group = "10.0.0.1";
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = named("Alice");
    config.outbound_queue_capacity = 0;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(ConfigTest, LogLevelOverride) {
    NodeConfig config = named("Alice");
    config.apply_overrides("log_level=error");
    log_warn("suppressed on stderr but kept in memory");
    auto lines = recent_log_lines();
    ASSERT_FALSE(lines.empty());
    EXPECT_NE(lines.back().find("suppressed on stderr"), std::string::npos);
    set_log_level(LogLevel::Warn);
}

} // namespace
} // namespace lanchat
