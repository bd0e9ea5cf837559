#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "opensea_stream/channel.hpp"
#include "opensea_stream/collection.hpp"
#include "opensea_stream/config.hpp"
#include "opensea_stream/subscription.hpp"
#include "opensea_stream/transport.hpp"

namespace opensea_stream {

/**
 * @brief Connection state enumeration
 */
enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    RECONNECTING,
    FAILED
};

std::string_view to_string(ConnectionState state) noexcept;

/**
 * @brief A Phoenix socket multiplexing channel subscriptions over one transport
 *
 * A coordinator thread owns the transport and the topic to channel map. Public
 * calls post commands to it and wait for the answer. Lost connections are
 * re-established with the configured ReconnectPolicy and every channel that was
 * joined is joined again without caller involvement.
 */
class Socket {
public:
    using ConnectionStateCallback = std::function<void(ConnectionState old_state, ConnectionState new_state)>;
    using ErrorCallback = std::function<void(const std::string& error_message)>;

    /**
     * @brief Socket using the Beast websocket transport
     * @throws ConfigurationException if the configuration does not validate
     */
    explicit Socket(const SocketConfig& config);

    /**
     * @brief Socket opening its connections through `transport_factory`
     */
    Socket(const SocketConfig& config, TransportFactory transport_factory);

    /**
     * @brief Destructor - disconnects if connected
     */
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    /**
     * @brief Open the connection and start heartbeats
     * @throws ConnectionError if the transport cannot be established
     */
    void connect();

    std::future<void> connect_async();

    /**
     * @brief Close every channel and the connection; receivers see a clean end
     */
    void disconnect();

    bool is_connected() const;
    ConnectionState get_connection_state() const;

    /**
     * @brief Subscribe to a topic
     *
     * Joining a topic that already has a channel never sends a second phx_join:
     * the returned handles share the existing channel.
     *
     * @throws JoinError on an error reply or when the join times out
     * @throws NotConnectedException when the socket is not connected
     */
    Subscription join(const std::string& topic);
    Subscription join(const Collection& collection);

    std::future<Subscription> join_async(const std::string& topic);

    /**
     * @brief Leave a topic, whichever handles it was joined through
     * @throws LeaveError when the topic is not subscribed or the server rejects the leave
     */
    void leave(const std::string& topic);

    /**
     * @brief Lifecycle state of the channel for a topic, nullopt if there is none
     */
    std::optional<ChannelStatus> channel_status(const std::string& topic) const;

    std::vector<std::string> active_topics() const;

    SocketStats get_stats() const;
    const SocketConfig& get_config() const;

    void set_connection_state_callback(ConnectionStateCallback callback);
    void set_error_callback(ErrorCallback callback);

private:
    class Impl;
    std::shared_ptr<Impl> pImpl_;
};

} // namespace opensea_stream
