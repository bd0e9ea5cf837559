#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <opensea_stream/errors.hpp>
#include <opensea_stream/protocol.hpp>
#include <opensea_stream/transport.hpp>

namespace opensea_stream {
namespace test {

/**
 * In-memory Phoenix server. Every transport the factory hands out is one session;
 * frames sent by the client are recorded and answered according to the switches
 * below. Frames pushed by the test go to the newest session.
 */
class MockServer : public std::enable_shared_from_this<MockServer> {
public:
    struct SentFrame {
        int session;
        Frame frame;
    };

    static std::shared_ptr<MockServer> create() {
        return std::shared_ptr<MockServer>(new MockServer());
    }

    TransportFactory factory() {
        std::weak_ptr<MockServer> weak = shared_from_this();
        return [weak](const std::string& url) -> std::unique_ptr<Transport> {
            auto server = weak.lock();
            if (!server) {
                throw ConnectionError("mock server is gone");
            }
            return server->connect(url);
        };
    }

    // ---- behaviour switches ----

    void set_auto_ack_joins(bool enabled) { with_lock([&] { auto_ack_joins_ = enabled; }); }
    void set_auto_ack_leaves(bool enabled) { with_lock([&] { auto_ack_leaves_ = enabled; }); }
    void set_ack_heartbeats(bool enabled) { with_lock([&] { ack_heartbeats_ = enabled; }); }
    void set_refuse_connects(bool enabled) { with_lock([&] { refuse_connects_ = enabled; }); }

    // Leaves get an error reply with this reason instead of an ack; empty turns it off
    void reject_leaves(const std::string& reason) { with_lock([&] { leave_rejection_ = reason; }); }

    // Joins of `topic` on sessions >= from_session get an error reply
    void reject_topic(const std::string& topic, int from_session = 0) {
        with_lock([&] { rejected_topics_[topic] = from_session; });
    }

    // ---- server side actions ----

    void push_event(const std::string& topic, const std::string& event, const Json::Value& payload) {
        std::lock_guard<std::mutex> lock(mutex_);
        Frame frame;
        frame.topic = topic;
        frame.event = event;
        frame.payload = payload;
        auto it = join_refs_.find(topic);
        if (it != join_refs_.end()) {
            frame.join_ref = it->second;
        }
        push_locked(current_session(), encode_frame(frame));
    }

    void push_raw(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        push_locked(current_session(), text);
    }

    void push_frame(const Frame& frame) {
        std::lock_guard<std::mutex> lock(mutex_);
        push_locked(current_session(), encode_frame(frame));
    }

    // Abrupt end of the newest session, as a dropped TCP connection
    void drop_connection() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!sessions_.empty()) {
                sessions_.back().open = false;
            }
        }
        cv_.notify_all();
    }

    // ---- inspection ----

    // True when the client dropped the session without a close handshake
    bool was_aborted(int session) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return aborted_.count(session) > 0;
    }

    int session_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(sessions_.size());
    }

    std::string last_url() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_url_;
    }

    std::optional<std::string> join_ref(const std::string& topic) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = join_refs_.find(topic);
        if (it == join_refs_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    int count(const std::string& event, const std::string& topic = std::string()) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (const auto& sent : sent_) {
            if (sent.frame.event == event && (topic.empty() || sent.frame.topic == topic)) {
                ++n;
            }
        }
        return n;
    }

    std::optional<SentFrame> wait_for_frame(const std::function<bool(const SentFrame&)>& predicate,
                                            std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::unique_lock<std::mutex> lock(mutex_);
        std::optional<SentFrame> found;
        cv_.wait_for(lock, timeout, [&] {
            for (const auto& sent : sent_) {
                if (predicate(sent)) {
                    found = sent;
                    return true;
                }
            }
            return false;
        });
        return found;
    }

    std::optional<SentFrame> wait_for_event(const std::string& event, const std::string& topic,
                                            int session = -1) {
        return wait_for_frame([&](const SentFrame& sent) {
            return sent.frame.event == event && sent.frame.topic == topic &&
                   (session < 0 || sent.session == session);
        });
    }

    bool wait_for_sessions(int count, std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return static_cast<int>(sessions_.size()) >= count; });
    }

private:
    struct Session {
        std::deque<std::string> inbound;
        bool open = true;
    };

    class MockTransport : public Transport {
    public:
        MockTransport(std::shared_ptr<MockServer> server, int session)
            : server_(std::move(server)), session_(session) {}

        ~MockTransport() override { close(); }

        void send(const std::string& text) override { server_->on_client_frame(session_, text); }
        std::optional<std::string> receive() override { return server_->next_frame(session_); }
        void close() override { server_->close_session(session_); }
        void abort() override { server_->abort_session(session_); }
        bool is_open() const override { return server_->is_session_open(session_); }

    private:
        std::shared_ptr<MockServer> server_;
        int session_;
    };

    MockServer() = default;

    template <typename F>
    void with_lock(F&& f) {
        std::lock_guard<std::mutex> lock(mutex_);
        f();
    }

    std::unique_ptr<Transport> connect(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_url_ = url;
        if (refuse_connects_) {
            throw ConnectionError("connection refused");
        }
        sessions_.emplace_back();
        cv_.notify_all();
        return std::make_unique<MockTransport>(shared_from_this(), static_cast<int>(sessions_.size()) - 1);
    }

    void on_client_frame(int session, const std::string& text) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!sessions_[session].open) {
                throw TransportError("mock session closed");
            }
            auto decoded = decode_frame(text);
            if (decoded.isError()) {
                throw TransportError("client sent an undecodable frame");
            }
            Frame frame = decoded.value();
            sent_.push_back(SentFrame{session, frame});
            respond_locked(session, frame);
        }
        cv_.notify_all();
    }

    void respond_locked(int session, const Frame& frame) {
        if (frame.event == EVENT_JOIN) {
            join_refs_[frame.topic] = frame.ref.value_or(std::string());
            auto rejected = rejected_topics_.find(frame.topic);
            if (rejected != rejected_topics_.end() && session >= rejected->second) {
                Json::Value response(Json::objectValue);
                response["reason"] = "unauthorized";
                reply_locked(session, frame, REPLY_STATUS_ERROR, response);
            } else if (auto_ack_joins_) {
                reply_locked(session, frame, REPLY_STATUS_OK, Json::Value(Json::objectValue));
            }
        } else if (frame.event == EVENT_LEAVE) {
            if (!leave_rejection_.empty()) {
                Json::Value response(Json::objectValue);
                response["reason"] = leave_rejection_;
                reply_locked(session, frame, REPLY_STATUS_ERROR, response);
            } else if (auto_ack_leaves_) {
                reply_locked(session, frame, REPLY_STATUS_OK, Json::Value(Json::objectValue));
            }
        } else if (frame.event == EVENT_HEARTBEAT) {
            if (ack_heartbeats_) {
                reply_locked(session, frame, REPLY_STATUS_OK, Json::Value(Json::objectValue));
            }
        }
    }

    void reply_locked(int session, const Frame& request, const char* status, const Json::Value& response) {
        Frame reply;
        reply.topic = request.topic;
        reply.event = EVENT_REPLY;
        Json::Value payload(Json::objectValue);
        payload["status"] = status;
        payload["response"] = response;
        reply.payload = payload;
        reply.ref = request.ref;
        reply.join_ref = request.join_ref;
        push_locked(session, encode_frame(reply));
    }

    void push_locked(int session, std::string text) {
        if (session < 0 || !sessions_[session].open) {
            return;
        }
        sessions_[session].inbound.push_back(std::move(text));
        cv_.notify_all();
    }

    std::optional<std::string> next_frame(int session) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return !sessions_[session].open || !sessions_[session].inbound.empty(); });
        if (!sessions_[session].open) {
            return std::nullopt;
        }
        std::string text = std::move(sessions_[session].inbound.front());
        sessions_[session].inbound.pop_front();
        return text;
    }

    void close_session(int session) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sessions_[session].open = false;
        }
        cv_.notify_all();
    }

    void abort_session(int session) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            aborted_.insert(session);
            sessions_[session].open = false;
        }
        cv_.notify_all();
    }

    bool is_session_open(int session) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_[session].open;
    }

    int current_session() const {
        return static_cast<int>(sessions_.size()) - 1;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Session> sessions_;
    std::vector<SentFrame> sent_;
    std::map<std::string, std::string> join_refs_;
    std::map<std::string, int> rejected_topics_;
    std::string leave_rejection_;
    std::set<int> aborted_;
    std::string last_url_;
    bool auto_ack_joins_ = true;
    bool auto_ack_leaves_ = true;
    bool ack_heartbeats_ = true;
    bool refuse_connects_ = false;
};

} // namespace test
} // namespace opensea_stream
