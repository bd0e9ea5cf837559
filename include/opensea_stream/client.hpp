#pragma once

#include <memory>
#include <string>

#include "opensea_stream/collection.hpp"
#include "opensea_stream/config.hpp"
#include "opensea_stream/socket.hpp"

namespace opensea_stream {

/**
 * @brief Build a socket for `network` authenticated with `token` and connect it
 * @throws ConnectionError if the connection cannot be established
 */
std::unique_ptr<Socket> make_client(Network network, const std::string& token);

/**
 * @brief As make_client() with a caller-supplied configuration
 *
 * `config` keeps its endpoint; the token is taken from `config.token`.
 */
std::unique_ptr<Socket> make_client(const SocketConfig& config);

/**
 * @brief Subscribe to every event of a collection
 */
Subscription subscribe_to(Socket& socket, const Collection& collection);

} // namespace opensea_stream
