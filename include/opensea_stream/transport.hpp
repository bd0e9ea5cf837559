#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace opensea_stream {

/**
 * @brief One physical connection carrying text frames
 *
 * A transport is single use: once receive() returned nullopt the connection is
 * over and a new transport must be created.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Queue a text frame for sending
     * @throws TransportError if the connection is closed or the write fails
     */
    virtual void send(const std::string& text) = 0;

    /**
     * @brief Block until the next text frame arrives
     * @return nullopt once the connection has ended
     */
    virtual std::optional<std::string> receive() = 0;

    /**
     * @brief Start closing; a blocked receive() returns nullopt afterwards
     */
    virtual void close() = 0;

    /**
     * @brief Drop a connection that is known to be dead, skipping any close handshake
     */
    virtual void abort() { close(); }

    virtual bool is_open() const = 0;
};

/**
 * @brief Opens a connected transport for a URL, throws ConnectionError on failure
 */
using TransportFactory = std::function<std::unique_ptr<Transport>(const std::string& url)>;

/**
 * @brief Components of a ws:// or wss:// URL
 */
struct ParsedUrl {
    bool secure = false;
    std::string host;
    std::string port;
    // Path and query, as sent in the HTTP upgrade request
    std::string target;
};

/**
 * @brief Split a websocket URL; the port defaults to 443 for wss and 80 for ws
 * @throws ConnectionError for anything that is not a ws(s) URL
 */
ParsedUrl parse_url(const std::string& url);

} // namespace opensea_stream
