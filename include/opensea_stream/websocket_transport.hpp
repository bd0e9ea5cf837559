#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "opensea_stream/transport.hpp"

namespace opensea_stream {

/**
 * @brief Transport over a Boost.Beast websocket (ws:// or wss://)
 *
 * Owns an io_context running on a private thread. Reads are pumped into an
 * internal queue drained by receive(); writes are serialised on the stream's
 * strand. TLS peers are verified against the system trust store with SNI set.
 */
class WebSocketTransport : public Transport {
public:
    /**
     * @brief Resolve, connect and complete the TLS and websocket handshakes
     * @throws ConnectionError on any failure or when `timeout` expires first
     */
    static std::unique_ptr<WebSocketTransport> connect(const std::string& url,
                                                       std::chrono::milliseconds timeout);

    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void send(const std::string& text) override;
    std::optional<std::string> receive() override;
    void close() override;
    void abort() override;
    bool is_open() const override;

    class Impl;

private:
    explicit WebSocketTransport(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> pImpl_;
};

/**
 * @brief Factory opening a WebSocketTransport per connection attempt
 */
TransportFactory make_websocket_transport_factory(
    std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(10000));

} // namespace opensea_stream
