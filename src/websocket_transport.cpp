#include "opensea_stream/websocket_transport.hpp"

#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <thread>
#include <type_traits>

#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "opensea_stream/errors.hpp"
#include "opensea_stream/logging.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace opensea_stream {

namespace {

constexpr const char* USER_AGENT = "opensea-stream-cpp";
constexpr auto SHUTDOWN_GRACE = std::chrono::seconds(2);

using PlainStream = websocket::stream<beast::tcp_stream>;
using TlsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

/**
 * Frames read by the io thread, waiting for receive()
 */
class InboundQueue {
public:
    void push(std::string frame) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            frames_.push_back(std::move(frame));
        }
        cv_.notify_one();
    }

    // First reason wins
    void close(const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            reason_ = reason;
        }
        cv_.notify_all();
    }

    // The connection is unusable; no close handshake will complete
    void fail(const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            failed_ = true;
            if (closed_) {
                return;
            }
            closed_ = true;
            reason_ = reason;
        }
        cv_.notify_all();
    }

    std::optional<std::string> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !frames_.empty() || closed_; });
        if (frames_.empty()) {
            return std::nullopt;
        }
        std::string frame = std::move(frames_.front());
        frames_.pop_front();
        return frame;
    }

    // The session will not touch the queue again
    void finish(const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!closed_) {
                closed_ = true;
                reason_ = reason;
            }
            finished_ = true;
        }
        cv_.notify_all();
    }

    bool wait_finished_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return finished_; });
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    bool failed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return failed_;
    }

    std::string reason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reason_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> frames_;
    bool closed_{false};
    bool failed_{false};
    bool finished_{false};
    std::string reason_;
};

class Session {
public:
    virtual ~Session() = default;

    virtual void start(const ParsedUrl& url, std::chrono::milliseconds timeout,
                       std::shared_ptr<std::promise<void>> ready) = 0;
    virtual void write(std::string text) = 0;
    virtual void close() = 0;
    virtual void abort() = 0;
};

template <typename WsStream>
class BeastSession final : public Session,
                           public std::enable_shared_from_this<BeastSession<WsStream>> {
public:
    static constexpr bool kSecure = std::is_same_v<WsStream, TlsStream>;

    template <typename... NextLayerArgs>
    BeastSession(net::io_context& ioc, InboundQueue& inbound, NextLayerArgs&... args)
        : strand_(net::make_strand(ioc))
        , resolver_(strand_)
        , ws_(strand_, args...)
        , inbound_(inbound)
        , logger_(OPENSEA_LOGGER("websocket")) {}

    void start(const ParsedUrl& url, std::chrono::milliseconds timeout,
               std::shared_ptr<std::promise<void>> ready) override {
        url_ = url;
        timeout_ = timeout;
        ready_ = std::move(ready);
        OPENSEA_LOG_DEBUG(logger_, "Resolving {}:{}", url_.host, url_.port);
        resolver_.async_resolve(url_.host, url_.port,
                                beast::bind_front_handler(&BeastSession::on_resolve, this->shared_from_this()));
    }

    void write(std::string text) override {
        net::post(strand_, [self = this->shared_from_this(), text = std::move(text)]() mutable {
            if (self->closing_) {
                return;
            }
            self->outbox_.push_back(std::move(text));
            if (self->outbox_.size() > 1) {
                return;
            }
            self->do_write();
        });
    }

    void close() override {
        net::post(strand_, [self = this->shared_from_this()]() { self->do_close(); });
    }

    void abort() override {
        net::post(strand_, [self = this->shared_from_this()]() {
            self->closing_ = true;
            self->resolver_.cancel();
            beast::get_lowest_layer(self->ws_).close();
            self->fail_handshake(net::error::operation_aborted, "connect");
        });
    }

private:
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            return fail_handshake(ec, "resolve");
        }
        beast::get_lowest_layer(ws_).expires_after(timeout_);
        beast::get_lowest_layer(ws_).async_connect(
            results, beast::bind_front_handler(&BeastSession::on_connect, this->shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type endpoint) {
        if (ec) {
            return fail_handshake(ec, "connect");
        }
        host_header_ = url_.host + ':' + std::to_string(endpoint.port());

        if constexpr (kSecure) {
            if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), url_.host.c_str())) {
                beast::error_code sni_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
                return fail_handshake(sni_ec, "set SNI host name");
            }
            ws_.next_layer().set_verify_callback(ssl::host_name_verification(url_.host));
            beast::get_lowest_layer(ws_).expires_after(timeout_);
            ws_.next_layer().async_handshake(
                ssl::stream_base::client,
                beast::bind_front_handler(&BeastSession::on_tls_handshake, this->shared_from_this()));
        } else {
            start_websocket_handshake();
        }
    }

    void on_tls_handshake(beast::error_code ec) {
        if (ec) {
            return fail_handshake(ec, "TLS handshake");
        }
        start_websocket_handshake();
    }

    void start_websocket_handshake() {
        // The websocket stream has its own timeouts from here on
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(http::field::user_agent, USER_AGENT);
        }));
        ws_.async_handshake(host_header_, url_.target,
                            beast::bind_front_handler(&BeastSession::on_websocket_handshake,
                                                      this->shared_from_this()));
    }

    void on_websocket_handshake(beast::error_code ec) {
        if (ec) {
            return fail_handshake(ec, "websocket handshake");
        }
        ws_.text(true);
        open_ = true;
        OPENSEA_LOG_DEBUG(logger_, "Websocket open to {}", host_header_);
        if (ready_) {
            ready_->set_value();
            ready_.reset();
        }
        if (closing_) {
            return do_close();
        }
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&BeastSession::on_read, this->shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec == websocket::error::closed) {
                inbound_.finish("closed by peer");
            } else {
                inbound_.finish("read failed: " + ec.message());
            }
            return;
        }
        inbound_.push(beast::buffers_to_string(buffer_.data()));
        buffer_.consume(buffer_.size());
        do_read();
    }

    void do_write() {
        ws_.async_write(net::buffer(outbox_.front()),
                        beast::bind_front_handler(&BeastSession::on_write, this->shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) {
            OPENSEA_LOG_WARN(logger_, "Write failed: {}", ec.message());
            outbox_.clear();
            inbound_.fail("write failed: " + ec.message());
            // The pending read fails next and finishes the queue
            beast::get_lowest_layer(ws_).close();
            return;
        }
        outbox_.pop_front();
        if (!outbox_.empty()) {
            do_write();
        }
    }

    void do_close() {
        if (closing_ && !open_) {
            return;
        }
        closing_ = true;
        if (!open_) {
            // Still handshaking; the handshake completion finishes the close
            return;
        }
        open_ = false;
        ws_.async_close(websocket::close_code::normal,
                        beast::bind_front_handler(&BeastSession::on_close, this->shared_from_this()));
    }

    void on_close(beast::error_code ec) {
        if (ec) {
            OPENSEA_LOG_DEBUG(logger_, "Close handshake failed: {}", ec.message());
        }
        beast::get_lowest_layer(ws_).close();
        inbound_.finish("closed");
    }

    void fail_handshake(beast::error_code ec, const char* what) {
        std::string reason = std::string(what) + ": " + ec.message();
        if (ready_) {
            ready_->set_exception(std::make_exception_ptr(ConnectionError(reason)));
            ready_.reset();
        }
        inbound_.finish(reason);
    }

    net::strand<net::io_context::executor_type> strand_;
    tcp::resolver resolver_;
    WsStream ws_;
    InboundQueue& inbound_;
    std::shared_ptr<Logger> logger_;

    ParsedUrl url_;
    std::string host_header_;
    std::chrono::milliseconds timeout_{0};
    std::shared_ptr<std::promise<void>> ready_;
    beast::flat_buffer buffer_;
    std::deque<std::string> outbox_;
    bool open_{false};
    bool closing_{false};
};

} // namespace

class WebSocketTransport::Impl {
public:
    Impl()
        : ssl_ctx_(ssl::context::tls_client)
        , logger_(OPENSEA_LOGGER("websocket")) {}

    ~Impl() {
        shutdown();
    }

    void open(const std::string& url, std::chrono::milliseconds timeout) {
        ParsedUrl parsed = parse_url(url);

        if (parsed.secure) {
            beast::error_code ec;
            ssl_ctx_.set_default_verify_paths(ec);
            if (ec) {
                throw ConnectionError("cannot load system trust store: " + ec.message());
            }
            ssl_ctx_.set_verify_mode(ssl::verify_peer);
            session_ = std::make_shared<BeastSession<TlsStream>>(ioc_, inbound_, ssl_ctx_);
        } else {
            session_ = std::make_shared<BeastSession<PlainStream>>(ioc_, inbound_);
        }

        auto ready = std::make_shared<std::promise<void>>();
        auto ready_future = ready->get_future();
        session_->start(parsed, timeout, ready);
        io_thread_ = std::thread([this]() { run_io(); });

        if (ready_future.wait_for(timeout) != std::future_status::ready) {
            session_->abort();
            throw ConnectionError("timed out after " + std::to_string(timeout.count()) +
                                  "ms connecting to " + parsed.host);
        }
        ready_future.get();
        OPENSEA_LOG_INFO(logger_, "Connected to {}:{}{}", parsed.host, parsed.port,
                         parsed.secure ? " (TLS)" : "");
    }

    void send(const std::string& text) {
        if (!session_ || inbound_.is_closed()) {
            throw TransportError("connection is closed" +
                                 (inbound_.reason().empty() ? std::string() : " (" + inbound_.reason() + ")"));
        }
        session_->write(text);
    }

    std::optional<std::string> receive() {
        return inbound_.pop();
    }

    void close() {
        if (session_) {
            session_->close();
        }
        inbound_.close("closed locally");
    }

    void abort() {
        if (session_) {
            session_->abort();
        }
        inbound_.fail("aborted");
    }

    bool is_open() const {
        return session_ != nullptr && !inbound_.is_closed();
    }

private:
    void run_io() {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            OPENSEA_LOG_ERROR(logger_, "I/O thread stopped: {}", e.what());
        }
        inbound_.finish("I/O stopped");
    }

    void shutdown() {
        close();
        if (!io_thread_.joinable()) {
            return;
        }
        if (!inbound_.failed() && !inbound_.wait_finished_for(SHUTDOWN_GRACE)) {
            OPENSEA_LOG_WARN(logger_, "Close handshake did not finish, stopping I/O");
        }
        ioc_.stop();
        io_thread_.join();
    }

    net::io_context ioc_;
    ssl::context ssl_ctx_;
    InboundQueue inbound_;
    std::shared_ptr<Session> session_;
    std::thread io_thread_;
    std::shared_ptr<Logger> logger_;
};

std::unique_ptr<WebSocketTransport> WebSocketTransport::connect(const std::string& url,
                                                                std::chrono::milliseconds timeout) {
    auto impl = std::make_unique<Impl>();
    impl->open(url, timeout);
    return std::unique_ptr<WebSocketTransport>(new WebSocketTransport(std::move(impl)));
}

WebSocketTransport::WebSocketTransport(std::unique_ptr<Impl> impl) : pImpl_(std::move(impl)) {}

WebSocketTransport::~WebSocketTransport() = default;

void WebSocketTransport::send(const std::string& text) {
    pImpl_->send(text);
}

std::optional<std::string> WebSocketTransport::receive() {
    return pImpl_->receive();
}

void WebSocketTransport::close() {
    pImpl_->close();
}

void WebSocketTransport::abort() {
    pImpl_->abort();
}

bool WebSocketTransport::is_open() const {
    return pImpl_->is_open();
}

TransportFactory make_websocket_transport_factory(std::chrono::milliseconds connect_timeout) {
    return [connect_timeout](const std::string& url) -> std::unique_ptr<Transport> {
        return WebSocketTransport::connect(url, connect_timeout);
    };
}

} // namespace opensea_stream
