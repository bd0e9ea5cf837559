#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "opensea_stream/logging.hpp"

namespace opensea_stream {

/**
 * @brief OpenSea deployment to connect to
 */
enum class Network {
    Mainnet,
    Testnet
};

/**
 * @brief Base websocket URL of a network, without the token
 */
std::string network_url(Network network);

/**
 * @brief Append the API token to a socket URL as the "token" query parameter
 */
std::string build_socket_url(const std::string& base_url, const std::string& token);

/**
 * @brief Logging configuration applied to the client's loggers
 */
struct LoggingConfig {
    LogLevel level = LogLevel::INFO;
    bool enable_console = true;
    bool use_colors = true;
    std::string log_file;
    std::size_t max_file_size = 10 * 1024 * 1024;
    // Log every raw frame at TRACE
    bool log_frames = false;
};

/**
 * @brief Install the sinks and level from a LoggingConfig on the client loggers
 */
void apply_logging_config(const LoggingConfig& config);

/**
 * @brief Bounded exponential backoff between reconnect attempts
 */
struct ReconnectPolicy {
    bool enabled = true;
    std::chrono::milliseconds initial_delay{500};
    double multiplier = 2.0;
    std::chrono::milliseconds max_delay{30000};
    // 0 retries forever
    int max_attempts = 0;

    /**
     * @brief Delay to wait before the given attempt (1-based)
     *
     * initial_delay * multiplier^(attempt-1), clamped to max_delay.
     */
    std::chrono::milliseconds delay_for(int attempt) const;

    /**
     * @brief True once `attempts` failed attempts use up the policy
     */
    bool exhausted(int attempts) const noexcept;

    /**
     * @throws ConfigurationException if the policy is invalid
     */
    void validate() const;
};

/**
 * @brief Configuration parameters for Socket
 */
struct SocketConfig {
    // Connection settings
    std::string endpoint = network_url(Network::Mainnet);
    std::string token;
    std::chrono::milliseconds connect_timeout{10000};

    // Heartbeat settings
    std::chrono::milliseconds heartbeat_interval{30000};
    int heartbeat_timeout_multiplier = 3;

    // Channel handshakes
    std::chrono::milliseconds join_timeout{10000};
    std::chrono::milliseconds leave_timeout{10000};

    ReconnectPolicy reconnect;

    // Per channel delivery queue; 0 means unbounded
    std::size_t queue_capacity = 1024;

    LoggingConfig logging;

    /**
     * @brief Endpoint with the token query parameter appended
     */
    std::string socket_url() const;

    /**
     * @brief Validate configuration parameters
     * @throws ConfigurationException if configuration is invalid
     */
    void validate() const;
};

/**
 * @brief Fluent construction of a validated SocketConfig
 */
class SocketConfigBuilder {
public:
    SocketConfigBuilder();

    SocketConfigBuilder& with_network(Network network);
    SocketConfigBuilder& with_endpoint(const std::string& endpoint);
    SocketConfigBuilder& with_token(const std::string& token);
    SocketConfigBuilder& with_connect_timeout(std::chrono::milliseconds timeout);
    SocketConfigBuilder& with_heartbeat_interval(std::chrono::milliseconds interval);
    SocketConfigBuilder& with_heartbeat_timeout_multiplier(int multiplier);
    SocketConfigBuilder& with_join_timeout(std::chrono::milliseconds timeout);
    SocketConfigBuilder& with_leave_timeout(std::chrono::milliseconds timeout);
    SocketConfigBuilder& with_reconnect_policy(const ReconnectPolicy& policy);
    SocketConfigBuilder& with_auto_reconnect(bool enabled);
    SocketConfigBuilder& with_queue_capacity(std::size_t capacity);
    SocketConfigBuilder& with_log_level(LogLevel level);
    SocketConfigBuilder& with_log_file(const std::string& path);
    SocketConfigBuilder& with_frame_logging(bool enabled);

    /**
     * @brief Build the configuration
     * @throws ConfigurationException if the result does not validate
     */
    SocketConfig build() const;

private:
    SocketConfig config_;
};

/**
 * @brief Connection and traffic statistics of a Socket
 */
struct SocketStats {
    // Frame counters
    std::uint64_t frames_sent = 0;
    std::uint64_t frames_received = 0;
    std::uint64_t frames_malformed = 0;
    std::uint64_t frames_dropped_orphan = 0;
    std::uint64_t frames_dropped_stale = 0;
    std::uint64_t frames_undeliverable = 0;
    std::uint64_t frames_lagged = 0;

    // Heartbeats
    std::uint64_t heartbeats_sent = 0;
    std::uint64_t heartbeats_acknowledged = 0;
    std::uint64_t heartbeat_timeouts = 0;

    // Connection statistics
    std::uint64_t connection_attempts = 0;
    std::uint64_t successful_connections = 0;
    std::uint64_t reconnects = 0;

    // Channel statistics
    std::uint64_t joins = 0;
    std::uint64_t rejoins = 0;
    std::uint64_t join_failures = 0;
    std::uint64_t leaves = 0;
    std::uint64_t leave_timeouts = 0;
    std::size_t active_channels = 0;

    bool is_connected = false;

    // Timing information
    std::chrono::steady_clock::time_point connection_established_time;
    std::chrono::milliseconds total_uptime{0};
    std::chrono::microseconds last_heartbeat_rtt{0};

    /**
     * @brief Frames dropped for any reason (orphan, stale, undeliverable, malformed)
     */
    std::uint64_t frames_dropped() const;

    /**
     * @brief Uptime of all sessions, including the current one when connected
     */
    std::chrono::milliseconds get_current_uptime() const;

    /**
     * @brief Successful connections over attempts, in the range 0.0 - 1.0
     */
    double get_connection_success_rate() const;
};

} // namespace opensea_stream
