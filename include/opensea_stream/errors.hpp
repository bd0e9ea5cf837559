#pragma once

#include <stdexcept>
#include <string>

namespace opensea_stream {

/**
 * @brief Base class of every exception thrown by the stream client
 */
class StreamException : public std::runtime_error {
public:
    explicit StreamException(const std::string& message) : std::runtime_error(message) {}
    explicit StreamException(const char* message) : std::runtime_error(message) {}
};

/**
 * @brief Thrown when the configuration is rejected by validate()
 */
class ConfigurationException : public StreamException {
public:
    explicit ConfigurationException(const std::string& message)
        : StreamException("Invalid configuration: " + message) {}
};

/**
 * @brief Initial connection could not be established (network, TLS, URL or credentials)
 */
class ConnectionError : public StreamException {
public:
    explicit ConnectionError(const std::string& message)
        : StreamException("Connection failed: " + message) {}
};

/**
 * @brief Raised by a Transport when a frame cannot be sent
 */
class TransportError : public StreamException {
public:
    explicit TransportError(const std::string& message)
        : StreamException("Transport error: " + message) {}
};

/**
 * @brief Operation requires a connected socket
 */
class NotConnectedException : public StreamException {
public:
    NotConnectedException() : StreamException("Socket is not connected") {}
};

/**
 * @brief The server rejected a join, or the join handshake timed out
 */
class JoinError : public StreamException {
public:
    JoinError(const std::string& topic, const std::string& reason)
        : StreamException("Join of '" + topic + "' failed: " + reason), topic_(topic) {}

    const std::string& topic() const noexcept { return topic_; }

private:
    std::string topic_;
};

/**
 * @brief The server answered a leave with an error reply
 *
 * The channel is already closed locally when this is thrown.
 */
class LeaveError : public StreamException {
public:
    LeaveError(const std::string& topic, const std::string& reason)
        : StreamException("Leave of '" + topic + "' failed: " + reason), topic_(topic) {}

    const std::string& topic() const noexcept { return topic_; }

private:
    std::string topic_;
};

/**
 * @brief Terminal error of a channel after it was joined
 */
class ChannelError : public StreamException {
public:
    ChannelError(const std::string& topic, const std::string& reason)
        : StreamException("Channel '" + topic + "' errored: " + reason), topic_(topic) {}

    const std::string& topic() const noexcept { return topic_; }

private:
    std::string topic_;
};

/**
 * @brief The channel could not be re-established after a reconnect
 */
class RejoinError : public ChannelError {
public:
    RejoinError(const std::string& topic, const std::string& reason)
        : ChannelError(topic, "rejoin failed: " + reason) {}
};

/**
 * @brief A text frame could not be parsed as a Phoenix message
 */
class ProtocolException : public StreamException {
public:
    explicit ProtocolException(const std::string& message)
        : StreamException("Protocol error: " + message) {}
};

} // namespace opensea_stream
