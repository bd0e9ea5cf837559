#include "opensea_stream/client.hpp"

namespace opensea_stream {

std::unique_ptr<Socket> make_client(Network network, const std::string& token) {
    return make_client(SocketConfigBuilder()
                           .with_network(network)
                           .with_token(token)
                           .build());
}

std::unique_ptr<Socket> make_client(const SocketConfig& config) {
    auto socket = std::make_unique<Socket>(config);
    socket->connect();
    return socket;
}

Subscription subscribe_to(Socket& socket, const Collection& collection) {
    return socket.join(collection);
}

} // namespace opensea_stream
