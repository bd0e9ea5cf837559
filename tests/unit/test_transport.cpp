#include <gtest/gtest.h>
#include <opensea_stream/errors.hpp>
#include <opensea_stream/transport.hpp>
#include <opensea_stream/websocket_transport.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

using namespace opensea_stream;

TEST(TransportTest, ParsesSecureUrlWithQuery) {
    auto url = parse_url("wss://stream.openseabeta.com/socket/websocket?token=abc");
    EXPECT_TRUE(url.secure);
    EXPECT_EQ(url.host, "stream.openseabeta.com");
    EXPECT_EQ(url.port, "443");
    EXPECT_EQ(url.target, "/socket/websocket?token=abc");
}

TEST(TransportTest, ExplicitPortAndDefaultTarget) {
    auto url = parse_url("ws://localhost:4000");
    EXPECT_FALSE(url.secure);
    EXPECT_EQ(url.host, "localhost");
    EXPECT_EQ(url.port, "4000");
    EXPECT_EQ(url.target, "/");

    EXPECT_EQ(parse_url("WS://localhost?vsn=1.0.0").target, "/?vsn=1.0.0");
    EXPECT_EQ(parse_url("ws://localhost/socket#frag").target, "/socket");
}

TEST(TransportTest, RejectsBadUrls) {
    EXPECT_THROW(parse_url("https://stream.openseabeta.com"), ConnectionError);
    EXPECT_THROW(parse_url("stream.openseabeta.com/socket"), ConnectionError);
    EXPECT_THROW(parse_url("ws://localhost:99999/"), ConnectionError);
    EXPECT_THROW(parse_url("ws:///socket"), ConnectionError);
}

namespace {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// Accepts one websocket client, then stops reading so a close frame is never answered
class SilentWebSocketServer {
public:
    SilentWebSocketServer()
        : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0))
        , released_(release_.get_future().share()) {
        thread_ = std::thread([this]() { serve(); });
    }

    ~SilentWebSocketServer() {
        release_.set_value();
        if (!accepted_) {
            beast::error_code ec;
            tcp::socket poke(ioc_);
            poke.connect(acceptor_.local_endpoint(), ec);
        }
        thread_.join();
    }

    std::string url() const {
        return "ws://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + "/socket/websocket";
    }

private:
    void serve() {
        beast::error_code ec;
        tcp::socket socket(ioc_);
        acceptor_.accept(socket, ec);
        accepted_ = true;
        if (ec) {
            return;
        }
        beast::websocket::stream<tcp::socket> ws(std::move(socket));
        ws.accept(ec);
        if (ec) {
            return;
        }
        released_.wait();
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::promise<void> release_;
    std::shared_future<void> released_;
    std::atomic<bool> accepted_{false};
    std::thread thread_;
};

} // namespace

TEST(TransportTest, AbortSkipsCloseHandshakeWithSilentPeer) {
    SilentWebSocketServer server;
    auto transport = WebSocketTransport::connect(server.url(), std::chrono::seconds(2));
    ASSERT_TRUE(transport->is_open());

    auto start = std::chrono::steady_clock::now();
    transport->abort();
    EXPECT_FALSE(transport->receive().has_value());
    EXPECT_FALSE(transport->is_open());
    EXPECT_THROW(transport->send("{}"), TransportError);
    transport.reset();

    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
}

TEST(TransportTest, TlsHandshakeTimeoutIsConnectionError) {
    // Listening socket that completes TCP connects but never speaks TLS
    net::io_context ioc;
    tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    std::string url = "wss://127.0.0.1:" + std::to_string(acceptor.local_endpoint().port()) + "/";

    auto factory = make_websocket_transport_factory(std::chrono::milliseconds(300));
    EXPECT_THROW(factory(url), ConnectionError);
}
