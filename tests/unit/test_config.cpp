#include <gtest/gtest.h>
#include <opensea_stream/config.hpp>
#include <opensea_stream/errors.hpp>

using namespace opensea_stream;
using namespace std::chrono_literals;

class ConfigTest : public ::testing::Test {};

TEST_F(ConfigTest, DefaultConfigurationIsValid) {
    SocketConfig config;

    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.endpoint, "wss://stream.openseabeta.com/socket/websocket");
    EXPECT_EQ(config.heartbeat_interval, 30s);
    EXPECT_TRUE(config.reconnect.enabled);
    EXPECT_EQ(config.queue_capacity, 1024u);
}

TEST_F(ConfigTest, NetworkUrls) {
    EXPECT_EQ(network_url(Network::Mainnet), "wss://stream.openseabeta.com/socket/websocket");
    EXPECT_EQ(network_url(Network::Testnet), "wss://testnets-stream.openseabeta.com/socket/websocket");
}

TEST_F(ConfigTest, BuilderPatternWorks) {
    auto config = SocketConfigBuilder()
        .with_network(Network::Testnet)
        .with_token("abc123")
        .with_heartbeat_interval(5s)
        .with_join_timeout(2s)
        .with_queue_capacity(16)
        .with_log_level(LogLevel::DEBUG)
        .build();

    EXPECT_EQ(config.endpoint, network_url(Network::Testnet));
    EXPECT_EQ(config.token, "abc123");
    EXPECT_EQ(config.heartbeat_interval, 5s);
    EXPECT_EQ(config.join_timeout, 2s);
    EXPECT_EQ(config.queue_capacity, 16u);
    EXPECT_EQ(config.logging.level, LogLevel::DEBUG);
}

TEST_F(ConfigTest, SocketUrlCarriesToken) {
    auto config = SocketConfigBuilder().with_token("abc123").build();
    EXPECT_EQ(config.socket_url(), "wss://stream.openseabeta.com/socket/websocket?token=abc123");
}

TEST_F(ConfigTest, BuildSocketUrlAppendsToExistingQuery) {
    EXPECT_EQ(build_socket_url("ws://localhost:4000/socket/websocket?vsn=1.0.0", "t"),
              "ws://localhost:4000/socket/websocket?vsn=1.0.0&token=t");
    EXPECT_EQ(build_socket_url("ws://localhost/socket?", "t"), "ws://localhost/socket?token=t");
}

TEST_F(ConfigTest, BuildSocketUrlEncodesToken) {
    EXPECT_EQ(build_socket_url("wss://host/ws", "a b&c"), "wss://host/ws?token=a%20b%26c");
}

TEST_F(ConfigTest, EmptyTokenLeavesUrlUntouched) {
    EXPECT_EQ(build_socket_url("wss://host/ws", ""), "wss://host/ws");
}

TEST_F(ConfigTest, ValidationCatchesInvalidEndpoints) {
    EXPECT_THROW({
        SocketConfigBuilder()
            .with_endpoint("https://stream.openseabeta.com")
            .build();
    }, ConfigurationException);

    EXPECT_THROW({
        SocketConfigBuilder()
            .with_endpoint("")
            .build();
    }, ConfigurationException);
}

TEST_F(ConfigTest, ValidationAcceptsLocalEndpoint) {
    EXPECT_NO_THROW(SocketConfigBuilder().with_endpoint("ws://127.0.0.1:4000/socket/websocket").build());
}

TEST_F(ConfigTest, ValidationCatchesInvalidTimeouts) {
    EXPECT_THROW(SocketConfigBuilder().with_heartbeat_interval(0ms).build(), ConfigurationException);
    EXPECT_THROW(SocketConfigBuilder().with_join_timeout(-1ms).build(), ConfigurationException);
    EXPECT_THROW(SocketConfigBuilder().with_leave_timeout(0ms).build(), ConfigurationException);
    EXPECT_THROW(SocketConfigBuilder().with_connect_timeout(0ms).build(), ConfigurationException);
    EXPECT_THROW(SocketConfigBuilder().with_heartbeat_timeout_multiplier(0).build(), ConfigurationException);
}

TEST_F(ConfigTest, ValidationCatchesInvalidReconnectPolicy) {
    ReconnectPolicy policy;
    policy.multiplier = 0.5;
    EXPECT_THROW(SocketConfigBuilder().with_reconnect_policy(policy).build(), ConfigurationException);

    policy = ReconnectPolicy{};
    policy.max_delay = 100ms;
    policy.initial_delay = 200ms;
    EXPECT_THROW(policy.validate(), ConfigurationException);
}

TEST_F(ConfigTest, ConfigurationExceptionMessage) {
    try {
        SocketConfigBuilder().with_endpoint("ftp://x").build();
        FAIL() << "expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        EXPECT_NE(std::string(e.what()).find("Invalid configuration"), std::string::npos);
    }
}

TEST_F(ConfigTest, ReconnectDelayGrowsExponentially) {
    ReconnectPolicy policy;
    policy.initial_delay = 100ms;
    policy.multiplier = 2.0;
    policy.max_delay = 1000ms;

    EXPECT_EQ(policy.delay_for(1), 100ms);
    EXPECT_EQ(policy.delay_for(2), 200ms);
    EXPECT_EQ(policy.delay_for(3), 400ms);
    EXPECT_EQ(policy.delay_for(4), 800ms);
    EXPECT_EQ(policy.delay_for(5), 1000ms);
    EXPECT_EQ(policy.delay_for(500), 1000ms);
}

TEST_F(ConfigTest, ReconnectExhaustion) {
    ReconnectPolicy policy;
    EXPECT_FALSE(policy.exhausted(1000));

    policy.max_attempts = 3;
    EXPECT_FALSE(policy.exhausted(2));
    EXPECT_TRUE(policy.exhausted(3));
}

TEST_F(ConfigTest, StatsDerivedValues) {
    SocketStats stats;
    EXPECT_DOUBLE_EQ(stats.get_connection_success_rate(), 0.0);

    stats.connection_attempts = 4;
    stats.successful_connections = 3;
    EXPECT_DOUBLE_EQ(stats.get_connection_success_rate(), 0.75);

    stats.frames_malformed = 1;
    stats.frames_dropped_orphan = 2;
    stats.frames_dropped_stale = 3;
    stats.frames_undeliverable = 4;
    EXPECT_EQ(stats.frames_dropped(), 10u);

    stats.total_uptime = 1500ms;
    EXPECT_EQ(stats.get_current_uptime(), 1500ms);
}
