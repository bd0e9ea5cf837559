#include "opensea_stream/socket.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <variant>

#include "opensea_stream/debug_utils.hpp"
#include "opensea_stream/errors.hpp"
#include "opensea_stream/heartbeat.hpp"
#include "opensea_stream/logging.hpp"
#include "opensea_stream/protocol.hpp"
#include "opensea_stream/websocket_transport.hpp"

namespace opensea_stream {

std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTING:   return "CONNECTING";
        case ConnectionState::CONNECTED:    return "CONNECTED";
        case ConnectionState::RECONNECTING: return "RECONNECTING";
        case ConnectionState::FAILED:       return "FAILED";
    }
    return "UNKNOWN";
}

namespace {

using Clock = std::chrono::steady_clock;

struct JoinCommand {
    std::string topic;
    std::promise<Subscription> reply;
};

// channel_id is set when the leave comes from a handle of one channel instance
struct LeaveCommand {
    std::string topic;
    std::optional<std::uint64_t> channel_id;
    std::promise<void> reply;
};

struct InboundCommand {
    std::uint64_t generation;
    std::string text;
};

struct TransportClosedCommand {
    std::uint64_t generation;
    std::string reason;
};

struct HeartbeatTickCommand {};

struct ReconnectedCommand {
    std::unique_ptr<Transport> transport;
    int attempts;
};

struct ReconnectFailedCommand {
    std::string reason;
    int attempts;
};

struct StatusQueryCommand {
    std::string topic;
    std::promise<std::optional<ChannelStatus>> reply;
};

struct TopicsQueryCommand {
    std::promise<std::vector<std::string>> reply;
};

struct ShutdownCommand {};

using Command = std::variant<JoinCommand,
                             LeaveCommand,
                             InboundCommand,
                             TransportClosedCommand,
                             HeartbeatTickCommand,
                             ReconnectedCommand,
                             ReconnectFailedCommand,
                             StatusQueryCommand,
                             TopicsQueryCommand,
                             ShutdownCommand>;

/**
 * Commands waiting for the coordinator thread
 */
class CommandMailbox {
public:
    bool post(Command command) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            commands_.push_back(std::move(command));
        }
        cv_.notify_one();
        return true;
    }

    // nullopt when the deadline passed first
    std::optional<Command> wait(std::optional<Clock::time_point> deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto ready = [this] { return !commands_.empty(); };
        if (deadline) {
            if (!cv_.wait_until(lock, *deadline, ready)) {
                return std::nullopt;
            }
        } else {
            cv_.wait(lock, ready);
        }
        Command command = std::move(commands_.front());
        commands_.pop_front();
        return command;
    }

    std::deque<Command> close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        std::deque<Command> leftovers;
        leftovers.swap(commands_);
        return leftovers;
    }

    void reopen() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
        commands_.clear();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Command> commands_;
    bool closed_{true};
};

} // namespace

class Socket::Impl : public detail::ChannelCloser, public std::enable_shared_from_this<Socket::Impl> {
public:
    Impl(const SocketConfig& config, TransportFactory factory)
        : config_(config)
        , url_(config.socket_url())
        , factory_(std::move(factory))
        , heartbeat_(config.heartbeat_interval, config.heartbeat_timeout_multiplier)
        , logger_(OPENSEA_LOGGER("socket")) {
        if (!factory_) {
            throw ConfigurationException("transport factory is empty");
        }
    }

    ~Impl() override {
        try {
            shutdown();
        } catch (const std::exception& e) {
            DEBUG_LOG("Error in destructor: ", e.what());
        }
    }

    void connect() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        ConnectionState current = state_.load();
        if (current == ConnectionState::CONNECTED || current == ConnectionState::RECONNECTING) {
            return;
        }

        // A socket that FAILED still has an idle coordinator
        stop_coordinator();

        set_connection_state(ConnectionState::CONNECTING);
        {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            stats_.connection_attempts++;
        }

        OPENSEA_LOG_INFO(logger_, "Connecting to {}", config_.endpoint);
        std::unique_ptr<Transport> transport;
        try {
            transport = factory_(url_);
            if (!transport) {
                throw ConnectionError("transport factory returned no transport");
            }
        } catch (const ConnectionError& e) {
            OPENSEA_LOG_ERROR(logger_, "{}", e.what());
            set_connection_state(ConnectionState::FAILED);
            notify_error(e.what());
            throw;
        } catch (const std::exception& e) {
            OPENSEA_LOG_ERROR(logger_, "Connection failed: {}", e.what());
            set_connection_state(ConnectionState::FAILED);
            notify_error(e.what());
            throw ConnectionError(e.what());
        }

        mailbox_.reopen();
        install_transport(std::move(transport));
        record_connected(false);

        // CONNECTED before the coordinator can observe a connection loss
        set_connection_state(ConnectionState::CONNECTED);
        coordinator_thread_ = std::thread([this]() { run_coordinator(); });
        heartbeat_.start([this]() {
            if (!mailbox_.post(HeartbeatTickCommand{})) {
                DEBUG_LOG("Heartbeat tick dropped, coordinator stopped");
            }
        });
        OPENSEA_LOG_INFO(logger_, "Connected to {}", config_.endpoint);
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        bool was_running = coordinator_thread_.joinable();
        stop_coordinator();
        if (was_running) {
            record_disconnected();
            set_connection_state(ConnectionState::DISCONNECTED);
            OPENSEA_LOG_INFO(logger_, "Disconnected");
        }
    }

    bool is_connected() const {
        return state_.load() == ConnectionState::CONNECTED;
    }

    ConnectionState get_connection_state() const {
        return state_.load();
    }

    std::future<Subscription> join_async(const std::string& topic) {
        std::promise<Subscription> promise;
        auto future = promise.get_future();
        if (!mailbox_.post(JoinCommand{topic, std::move(promise)})) {
            throw NotConnectedException();
        }
        return future;
    }

    void leave(const std::string& topic) {
        std::promise<void> promise;
        auto future = promise.get_future();
        if (!mailbox_.post(LeaveCommand{topic, std::nullopt, std::move(promise)})) {
            throw LeaveError(topic, "socket is not connected");
        }
        future.get();
    }

    void close_channel(const std::string& topic, std::uint64_t channel_id) override {
        std::promise<void> promise;
        auto future = promise.get_future();
        if (!mailbox_.post(LeaveCommand{topic, channel_id, std::move(promise)})) {
            // Disconnected sockets have no channels left
            return;
        }
        future.get();
    }

    std::optional<ChannelStatus> channel_status(const std::string& topic) {
        std::promise<std::optional<ChannelStatus>> promise;
        auto future = promise.get_future();
        if (!mailbox_.post(StatusQueryCommand{topic, std::move(promise)})) {
            return std::nullopt;
        }
        return future.get();
    }

    std::vector<std::string> active_topics() {
        std::promise<std::vector<std::string>> promise;
        auto future = promise.get_future();
        if (!mailbox_.post(TopicsQueryCommand{std::move(promise)})) {
            return {};
        }
        return future.get();
    }

    SocketStats get_stats() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        return stats_;
    }

    const SocketConfig& get_config() const {
        return config_;
    }

    void set_connection_state_callback(ConnectionStateCallback callback) {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        state_callback_ = std::move(callback);
    }

    void set_error_callback(ErrorCallback callback) {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        error_callback_ = std::move(callback);
    }

private:
    struct ChannelEntry {
        std::unique_ptr<Channel> channel;
        std::vector<std::promise<Subscription>> join_waiters;
        std::vector<std::promise<void>> leave_waiters;
        // Joins that arrived while the channel was leaving
        std::deque<JoinCommand> deferred_joins;
    };

    using ChannelMap = std::unordered_map<std::string, ChannelEntry>;

    // ---- lifecycle (caller threads, lifecycle_mutex_ held) ----

    void stop_coordinator() {
        if (coordinator_thread_.joinable()) {
            if (!mailbox_.post(ShutdownCommand{})) {
                DEBUG_LOG("Coordinator mailbox already closed");
            }
            coordinator_thread_.join();
        }
        heartbeat_.stop();
    }

    // ---- coordinator thread ----

    void run_coordinator() {
        for (;;) {
            auto command = mailbox_.wait(next_deadline());
            if (command) {
                if (std::holds_alternative<ShutdownCommand>(*command)) {
                    on_shutdown();
                    return;
                }
                try {
                    std::visit([this](auto& cmd) { handle(cmd); }, *command);
                } catch (const std::exception& e) {
                    OPENSEA_LOG_ERROR(logger_, "Command failed: {}", e.what());
                }
            }
            expire_handshakes(Clock::now());
            if (pending_loss_) {
                std::string reason = std::move(*pending_loss_);
                pending_loss_.reset();
                handle_connection_loss(reason);
            }
        }
    }

    std::optional<Clock::time_point> next_deadline() const {
        std::optional<Clock::time_point> earliest;
        for (const auto& [topic, entry] : channels_) {
            auto deadline = entry.channel->deadline();
            if (deadline && (!earliest || *deadline < *earliest)) {
                earliest = deadline;
            }
        }
        return earliest;
    }

    void handle(JoinCommand& cmd) {
        ConnectionState state = state_.load();
        if (state != ConnectionState::CONNECTED && state != ConnectionState::RECONNECTING) {
            cmd.reply.set_exception(std::make_exception_ptr(NotConnectedException()));
            return;
        }

        auto it = channels_.find(cmd.topic);
        if (it != channels_.end()) {
            ChannelEntry& entry = it->second;
            switch (entry.channel->status()) {
                case ChannelStatus::Joined:
                    cmd.reply.set_value(make_subscription(*entry.channel));
                    return;
                case ChannelStatus::Joining:
                    entry.join_waiters.push_back(std::move(cmd.reply));
                    return;
                case ChannelStatus::Leaving:
                    OPENSEA_LOG_DEBUG(logger_, "Deferring join of {} until its leave completes", cmd.topic);
                    entry.deferred_joins.push_back(std::move(cmd));
                    return;
                case ChannelStatus::Closed:
                case ChannelStatus::Errored:
                    // Terminal channels are removed right away; never reached
                    break;
            }
        }
        start_join(cmd.topic, std::move(cmd.reply));
    }

    void start_join(const std::string& topic, std::promise<Subscription> reply) {
        auto now = Clock::now();
        ChannelEntry entry;
        entry.channel = std::make_unique<Channel>(topic, ++next_channel_id_, config_.queue_capacity,
                                                  now + config_.join_timeout);
        entry.join_waiters.push_back(std::move(reply));
        auto inserted = channels_.emplace(topic, std::move(entry));
        update_channel_count();

        OPENSEA_LOG_DEBUG(logger_, "Joining {}", topic);
        if (state_.load() == ConnectionState::CONNECTED) {
            send_join(*inserted.first->second.channel, now);
        }
    }

    void send_join(Channel& channel, Clock::time_point now) {
        std::string ref = next_ref();
        auto deadline = channel.is_rejoin() || !channel.deadline()
                            ? now + config_.join_timeout
                            : *channel.deadline();
        channel.mark_join_sent(ref, deadline);
        send_frame(make_join_frame(channel.topic(), ref));
    }

    void handle(LeaveCommand& cmd) {
        auto it = channels_.find(cmd.topic);
        if (it == channels_.end() ||
            (cmd.channel_id && *cmd.channel_id != it->second.channel->id())) {
            if (cmd.channel_id) {
                cmd.reply.set_value();
            } else {
                cmd.reply.set_exception(std::make_exception_ptr(LeaveError(cmd.topic, "not subscribed")));
            }
            return;
        }

        ChannelEntry& entry = it->second;
        Channel& channel = *entry.channel;
        switch (channel.status()) {
            case ChannelStatus::Joined: {
                std::string ref = next_ref();
                std::string join_ref = channel.join_ref().value_or(std::string());
                channel.begin_leave(ref, Clock::now() + config_.leave_timeout);
                entry.leave_waiters.push_back(std::move(cmd.reply));
                {
                    std::lock_guard<std::mutex> lock(stats_mutex_);
                    stats_.leaves++;
                }
                OPENSEA_LOG_DEBUG(logger_, "Leaving {}", cmd.topic);
                send_frame(make_leave_frame(cmd.topic, ref, join_ref));
                return;
            }
            case ChannelStatus::Leaving:
                entry.leave_waiters.push_back(std::move(cmd.reply));
                return;
            case ChannelStatus::Joining: {
                if (auto join_ref = channel.join_ref()) {
                    send_frame(make_leave_frame(cmd.topic, next_ref(), *join_ref));
                }
                reject_join_waiters(entry, cmd.topic, "left before the join completed");
                channel.close();
                cmd.reply.set_value();
                remove_channel(it);
                return;
            }
            case ChannelStatus::Closed:
            case ChannelStatus::Errored:
                cmd.reply.set_value();
                return;
        }
    }

    void handle(InboundCommand& cmd) {
        if (cmd.generation != generation_) {
            return;
        }
        auto now = Clock::now();
        heartbeat_.record_traffic(now);
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.frames_received++;
        }
        if (config_.logging.log_frames) {
            OPENSEA_LOG_TRACE(logger_, "<< {}", cmd.text);
        }
        DEBUG_FRAME("in", cmd.text);

        auto decoded = decode_frame(cmd.text);
        if (decoded.isError()) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.frames_malformed++;
            OPENSEA_LOG_WARN(logger_, "Dropping frame: {}", decoded.error().what());
            return;
        }
        Frame& frame = decoded.value();

        if (frame.topic == TOPIC_PHOENIX) {
            handle_socket_reply(frame, now);
            return;
        }

        auto it = channels_.find(frame.topic);
        if (it == channels_.end()) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.frames_dropped_orphan++;
            OPENSEA_LOG_DEBUG(logger_, "Dropping {} for unknown topic {}", frame.event, frame.topic);
            return;
        }
        route(it, std::move(frame));
    }

    void handle_socket_reply(const Frame& frame, Clock::time_point now) {
        if (frame.event != EVENT_REPLY || !frame.ref) {
            return;
        }
        if (heartbeat_.record_ack(*frame.ref, now)) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.heartbeats_acknowledged++;
            if (auto rtt = heartbeat_.last_round_trip()) {
                stats_.last_heartbeat_rtt = *rtt;
            }
        }
    }

    void route(ChannelMap::iterator it, Frame frame) {
        Channel& channel = *it->second.channel;

        if (frame.event == EVENT_REPLY) {
            handle_reply(it, frame);
            return;
        }

        auto current_join_ref = channel.join_ref();
        if (frame.join_ref && (!current_join_ref || *frame.join_ref != *current_join_ref)) {
            count_stale(frame);
            return;
        }

        if (frame.event == EVENT_ERROR) {
            OPENSEA_LOG_WARN(logger_, "Server reported an error on {}", channel.topic());
            std::string reason = "server sent phx_error";
            fail_channel(it, reason, channel_error_for(channel, reason));
            return;
        }
        if (frame.event == EVENT_CLOSE) {
            OPENSEA_LOG_INFO(logger_, "Server closed {}", channel.topic());
            ChannelEntry& entry = it->second;
            reject_join_waiters(entry, channel.topic(), "closed by server");
            channel.close();
            resolve_leave_waiters(entry, std::nullopt);
            remove_channel(it);
            return;
        }

        ChannelStatus status = channel.status();
        if (status != ChannelStatus::Joined && status != ChannelStatus::Leaving) {
            count_stale(frame);
            return;
        }

        switch (channel.deliver(Message::from_frame(std::move(frame)))) {
            case Channel::Queue::PushResult::Delivered:
                break;
            case Channel::Queue::PushResult::DroppedOldest: {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.frames_lagged++;
                break;
            }
            case Channel::Queue::PushResult::NoConsumer:
            case Channel::Queue::PushResult::Closed: {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.frames_undeliverable++;
                break;
            }
        }
    }

    void handle_reply(ChannelMap::iterator it, const Frame& frame) {
        ChannelEntry& entry = it->second;
        Channel& channel = *entry.channel;
        auto reply = parse_reply(frame);
        if (!reply || !frame.ref) {
            count_stale(frame);
            return;
        }

        const auto* joining = std::get_if<channel_state::Joining>(&channel.state());
        if (joining != nullptr && joining->sent && joining->join_ref == *frame.ref) {
            bool rejoin = joining->rejoin;
            if (reply->is_ok()) {
                channel.on_join_ok(*frame.ref);
                {
                    std::lock_guard<std::mutex> lock(stats_mutex_);
                    (rejoin ? stats_.rejoins : stats_.joins)++;
                }
                OPENSEA_LOG_INFO(logger_, "{} {}", rejoin ? "Rejoined" : "Joined", channel.topic());
                for (auto& waiter : entry.join_waiters) {
                    waiter.set_value(make_subscription(channel));
                }
                entry.join_waiters.clear();
            } else {
                std::string reason = reply->describe();
                {
                    std::lock_guard<std::mutex> lock(stats_mutex_);
                    stats_.join_failures++;
                }
                OPENSEA_LOG_WARN(logger_, "Join of {} rejected: {}", channel.topic(), reason);
                fail_channel(it, reason, channel_error_for(channel, reason));
            }
            return;
        }

        const auto* leaving = std::get_if<channel_state::Leaving>(&channel.state());
        if (leaving != nullptr && leaving->leave_ref == *frame.ref) {
            std::optional<std::string> error;
            if (!reply->is_ok()) {
                error = reply->describe();
                OPENSEA_LOG_WARN(logger_, "Leave of {} rejected: {}", channel.topic(), *error);
            }
            finish_leave(it, error);
            return;
        }

        count_stale(frame);
    }

    void handle(TransportClosedCommand& cmd) {
        if (cmd.generation != generation_) {
            return;
        }
        handle_connection_loss(cmd.reason);
    }

    void handle(HeartbeatTickCommand&) {
        if (state_.load() != ConnectionState::CONNECTED || !transport_) {
            return;
        }
        auto now = Clock::now();
        if (heartbeat_.is_timed_out(now)) {
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.heartbeat_timeouts++;
            }
            pending_loss_ = "heartbeat timeout, no traffic for " +
                            std::to_string(heartbeat_.timeout().count()) + "ms";
            return;
        }
        std::string ref = next_ref();
        if (send_frame(make_heartbeat_frame(ref))) {
            heartbeat_.record_sent(ref, now);
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.heartbeats_sent++;
        }
    }

    void handle(ReconnectedCommand& cmd) {
        if (state_.load() != ConnectionState::RECONNECTING) {
            return;
        }
        install_transport(std::move(cmd.transport));
        record_connected(true);
        set_connection_state(ConnectionState::CONNECTED);
        OPENSEA_LOG_INFO(logger_, "Reconnected after {} attempt(s), rejoining {} channel(s)",
                         cmd.attempts, channels_.size());

        auto now = Clock::now();
        for (auto& [topic, entry] : channels_) {
            if (entry.channel->awaiting_send()) {
                send_join(*entry.channel, now);
            }
        }
    }

    void handle(ReconnectFailedCommand& cmd) {
        if (state_.load() != ConnectionState::RECONNECTING) {
            return;
        }
        std::string reason = "gave up after " + std::to_string(cmd.attempts) +
                             " reconnect attempt(s): " + cmd.reason;
        OPENSEA_LOG_ERROR(logger_, "Reconnect failed, {}", reason);
        set_connection_state(ConnectionState::FAILED);
        notify_error("Auto-reconnect failed, " + reason);

        for (const auto& topic : topics()) {
            auto it = channels_.find(topic);
            if (it != channels_.end()) {
                fail_channel(it, reason, std::make_exception_ptr(RejoinError(topic, reason)));
            }
        }
    }

    void handle(StatusQueryCommand& cmd) {
        auto it = channels_.find(cmd.topic);
        if (it == channels_.end()) {
            cmd.reply.set_value(std::nullopt);
        } else {
            cmd.reply.set_value(it->second.channel->status());
        }
    }

    void handle(TopicsQueryCommand& cmd) {
        cmd.reply.set_value(topics());
    }

    void handle(ShutdownCommand&) {}

    void handle_connection_loss(const std::string& reason) {
        if (state_.load() != ConnectionState::CONNECTED) {
            return;
        }
        OPENSEA_LOG_WARN(logger_, "Connection lost: {}", reason);
        teardown_transport(false);
        record_disconnected();

        std::vector<std::string> closed;
        for (auto& [topic, entry] : channels_) {
            bool was_leaving = entry.channel->status() == ChannelStatus::Leaving;
            entry.channel->on_session_lost();
            if (was_leaving) {
                closed.push_back(topic);
            }
        }

        if (config_.reconnect.enabled) {
            set_connection_state(ConnectionState::RECONNECTING);
        } else {
            set_connection_state(ConnectionState::DISCONNECTED);
        }
        notify_error(reason);

        // The server forgot these with the session
        for (const auto& topic : closed) {
            auto it = channels_.find(topic);
            if (it != channels_.end()) {
                resolve_leave_waiters(it->second, std::nullopt);
                remove_channel(it);
            }
        }

        if (config_.reconnect.enabled) {
            start_reconnect_worker();
            return;
        }

        std::string channel_reason = "connection lost: " + reason;
        for (const auto& topic : topics()) {
            auto it = channels_.find(topic);
            if (it != channels_.end()) {
                fail_channel(it, channel_reason,
                             std::make_exception_ptr(ChannelError(topic, channel_reason)));
            }
        }
    }

    void expire_handshakes(Clock::time_point now) {
        std::vector<std::string> expired;
        for (const auto& [topic, entry] : channels_) {
            auto deadline = entry.channel->deadline();
            if (deadline && *deadline <= now) {
                expired.push_back(topic);
            }
        }

        for (const auto& topic : expired) {
            auto it = channels_.find(topic);
            if (it == channels_.end()) {
                continue;
            }
            Channel& channel = *it->second.channel;
            if (channel.status() == ChannelStatus::Joining) {
                std::string reason = "timed out after " + std::to_string(config_.join_timeout.count()) + "ms";
                {
                    std::lock_guard<std::mutex> lock(stats_mutex_);
                    stats_.join_failures++;
                }
                OPENSEA_LOG_WARN(logger_, "Join of {} {}", topic, reason);
                fail_channel(it, reason, channel_error_for(channel, reason));
            } else if (channel.status() == ChannelStatus::Leaving) {
                {
                    std::lock_guard<std::mutex> lock(stats_mutex_);
                    stats_.leave_timeouts++;
                }
                OPENSEA_LOG_WARN(logger_, "Leave of {} not acknowledged within {}ms, closing locally",
                                 topic, config_.leave_timeout.count());
                finish_leave(it, std::nullopt);
            }
        }
    }

    void on_shutdown() {
        stop_reconnect_worker();

        for (auto& [topic, entry] : channels_) {
            Channel& channel = *entry.channel;
            if (channel.status() == ChannelStatus::Joined && transport_) {
                // Best effort, nobody waits for the reply
                send_frame(make_leave_frame(topic, next_ref(), channel.join_ref().value_or(std::string())));
            }
            reject_join_waiters(entry, topic, "socket disconnected");
            channel.close();
            resolve_leave_waiters(entry, std::nullopt);
            for (auto& deferred : entry.deferred_joins) {
                deferred.reply.set_exception(std::make_exception_ptr(NotConnectedException()));
            }
        }
        channels_.clear();
        update_channel_count();
        pending_loss_.reset();
        teardown_transport(true);

        for (auto& command : mailbox_.close()) {
            reject(command);
        }
    }

    void reject(Command& command) {
        if (auto* join = std::get_if<JoinCommand>(&command)) {
            join->reply.set_exception(std::make_exception_ptr(NotConnectedException()));
        } else if (auto* leave = std::get_if<LeaveCommand>(&command)) {
            leave->reply.set_value();
        } else if (auto* status = std::get_if<StatusQueryCommand>(&command)) {
            status->reply.set_value(std::nullopt);
        } else if (auto* query = std::get_if<TopicsQueryCommand>(&command)) {
            query->reply.set_value({});
        }
    }

    // ---- channel helpers (coordinator thread) ----

    Subscription make_subscription(const Channel& channel) {
        return Subscription{ChannelHandler(weak_from_this(), channel.topic(), channel.id()),
                            Receiver(channel.queue(), channel.topic())};
    }

    std::exception_ptr channel_error_for(const Channel& channel, const std::string& reason) const {
        if (channel.is_rejoin()) {
            return std::make_exception_ptr(RejoinError(channel.topic(), reason));
        }
        return std::make_exception_ptr(ChannelError(channel.topic(), reason));
    }

    void fail_channel(ChannelMap::iterator it, const std::string& reason, std::exception_ptr error) {
        ChannelEntry& entry = it->second;
        reject_join_waiters(entry, it->first, reason);
        entry.channel->fail(reason, std::move(error));
        resolve_leave_waiters(entry, std::nullopt);
        remove_channel(it);
    }

    void finish_leave(ChannelMap::iterator it, const std::optional<std::string>& error) {
        ChannelEntry& entry = it->second;
        entry.channel->on_leave_done();
        resolve_leave_waiters(entry, error);
        OPENSEA_LOG_DEBUG(logger_, "Left {}", it->first);
        remove_channel(it);
    }

    void reject_join_waiters(ChannelEntry& entry, const std::string& topic, const std::string& reason) {
        for (auto& waiter : entry.join_waiters) {
            waiter.set_exception(std::make_exception_ptr(JoinError(topic, reason)));
        }
        entry.join_waiters.clear();
    }

    void resolve_leave_waiters(ChannelEntry& entry, const std::optional<std::string>& error) {
        for (auto& waiter : entry.leave_waiters) {
            if (error) {
                waiter.set_exception(std::make_exception_ptr(LeaveError(entry.channel->topic(), *error)));
            } else {
                waiter.set_value();
            }
        }
        entry.leave_waiters.clear();
    }

    // Erases the entry, then replays the joins that waited for it
    void remove_channel(ChannelMap::iterator it) {
        std::deque<JoinCommand> deferred = std::move(it->second.deferred_joins);
        channels_.erase(it);
        update_channel_count();
        for (auto& cmd : deferred) {
            handle(cmd);
        }
    }

    std::vector<std::string> topics() const {
        std::vector<std::string> result;
        result.reserve(channels_.size());
        for (const auto& [topic, entry] : channels_) {
            result.push_back(topic);
        }
        return result;
    }

    void count_stale(const Frame& frame) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.frames_dropped_stale++;
        }
        OPENSEA_LOG_DEBUG(logger_, "Dropping stale {} on {}", frame.event, frame.topic);
    }

    void update_channel_count() {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.active_channels = channels_.size();
    }

    // ---- transport (coordinator thread, or connect() before it starts) ----

    std::string next_ref() {
        return std::to_string(++next_ref_);
    }

    // A failed send schedules the connection loss for after the current command
    bool send_frame(const Frame& frame) {
        if (!transport_) {
            return false;
        }
        std::string text = encode_frame(frame);
        try {
            transport_->send(text);
        } catch (const TransportError& e) {
            OPENSEA_LOG_WARN(logger_, "Send of {} on {} failed: {}", frame.event, frame.topic, e.what());
            if (!pending_loss_) {
                pending_loss_ = std::string("send failed: ") + e.what();
            }
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.frames_sent++;
        }
        if (config_.logging.log_frames) {
            OPENSEA_LOG_TRACE(logger_, ">> {}", text);
        }
        DEBUG_FRAME("out", text);
        return true;
    }

    void install_transport(std::unique_ptr<Transport> transport) {
        transport_ = std::move(transport);
        ++generation_;
        heartbeat_.reset(Clock::now());
        reader_thread_ = std::thread([this, transport = transport_.get(), generation = generation_]() {
            run_reader(transport, generation);
        });
    }

    // A lost connection is aborted; only a shutdown closes gracefully
    void teardown_transport(bool graceful) {
        if (transport_) {
            if (graceful) {
                transport_->close();
            } else {
                transport_->abort();
            }
        }
        if (reader_thread_.joinable()) {
            reader_thread_.join();
        }
        transport_.reset();
        ++generation_;
    }

    void run_reader(Transport* transport, std::uint64_t generation) {
        std::string reason = "connection closed";
        try {
            while (auto text = transport->receive()) {
                if (!mailbox_.post(InboundCommand{generation, std::move(*text)})) {
                    return;
                }
            }
        } catch (const std::exception& e) {
            reason = e.what();
        }
        if (!mailbox_.post(TransportClosedCommand{generation, reason})) {
            DEBUG_LOG("Transport closed after shutdown: ", reason);
        }
    }

    // ---- reconnect worker ----

    void start_reconnect_worker() {
        stop_reconnect_worker();
        {
            std::lock_guard<std::mutex> lock(reconnect_mutex_);
            reconnect_stop_ = false;
        }
        reconnect_thread_ = std::thread([this]() { run_reconnect(); });
    }

    void stop_reconnect_worker() {
        {
            std::lock_guard<std::mutex> lock(reconnect_mutex_);
            reconnect_stop_ = true;
        }
        reconnect_cv_.notify_all();
        if (reconnect_thread_.joinable()) {
            reconnect_thread_.join();
        }
    }

    void run_reconnect() {
        const ReconnectPolicy& policy = config_.reconnect;
        std::string last_error = "no attempt made";

        for (int attempt = 1;; ++attempt) {
            auto delay = policy.delay_for(attempt);
            {
                std::unique_lock<std::mutex> lock(reconnect_mutex_);
                if (reconnect_cv_.wait_for(lock, delay, [this] { return reconnect_stop_; })) {
                    return;
                }
            }

            OPENSEA_LOG_INFO(logger_, "Reconnect attempt {} after {}ms", attempt, delay.count());
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.connection_attempts++;
            }
            try {
                auto transport = factory_(url_);
                if (!transport) {
                    throw ConnectionError("transport factory returned no transport");
                }
                if (!mailbox_.post(ReconnectedCommand{std::move(transport), attempt})) {
                    DEBUG_LOG("Reconnected after shutdown, dropping transport");
                }
                return;
            } catch (const std::exception& e) {
                last_error = e.what();
                OPENSEA_LOG_WARN(logger_, "Reconnect attempt {} failed: {}", attempt, last_error);
            }

            if (policy.exhausted(attempt)) {
                if (!mailbox_.post(ReconnectFailedCommand{last_error, attempt})) {
                    DEBUG_LOG("Reconnect gave up after shutdown");
                }
                return;
            }
        }
    }

    // ---- state, stats and callbacks (any thread) ----

    void set_connection_state(ConnectionState new_state) {
        ConnectionState old_state = state_.exchange(new_state);
        if (old_state == new_state) {
            return;
        }
        OPENSEA_LOG_DEBUG(logger_, "Connection state {} -> {}", to_string(old_state), to_string(new_state));

        ConnectionStateCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            callback = state_callback_;
        }
        if (callback) {
            try {
                callback(old_state, new_state);
            } catch (const std::exception& e) {
                OPENSEA_LOG_ERROR(logger_, "Connection state callback threw: {}", e.what());
            }
        }
    }

    void notify_error(const std::string& message) {
        ErrorCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            callback = error_callback_;
        }
        if (callback) {
            try {
                callback(message);
            } catch (const std::exception& e) {
                OPENSEA_LOG_ERROR(logger_, "Error callback threw: {}", e.what());
            }
        }
    }

    void record_connected(bool reconnect) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.successful_connections++;
        if (reconnect) {
            stats_.reconnects++;
        }
        stats_.is_connected = true;
        stats_.connection_established_time = Clock::now();
    }

    void record_disconnected() {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        if (stats_.is_connected) {
            stats_.total_uptime += std::chrono::duration_cast<std::chrono::milliseconds>(
                Clock::now() - stats_.connection_established_time);
        }
        stats_.is_connected = false;
    }

    const SocketConfig config_;
    const std::string url_;
    TransportFactory factory_;

    // Owned by the coordinator thread
    ChannelMap channels_;
    std::unique_ptr<Transport> transport_;
    std::thread reader_thread_;
    std::uint64_t generation_{0};
    std::uint64_t next_ref_{0};
    std::uint64_t next_channel_id_{0};
    std::optional<std::string> pending_loss_;
    HeartbeatDriver heartbeat_;

    CommandMailbox mailbox_;
    std::atomic<ConnectionState> state_{ConnectionState::DISCONNECTED};
    std::mutex lifecycle_mutex_;
    std::thread coordinator_thread_;

    std::mutex reconnect_mutex_;
    std::condition_variable reconnect_cv_;
    bool reconnect_stop_{false};
    std::thread reconnect_thread_;

    mutable std::mutex stats_mutex_;
    SocketStats stats_;

    std::mutex callbacks_mutex_;
    ConnectionStateCallback state_callback_;
    ErrorCallback error_callback_;

    std::shared_ptr<Logger> logger_;
};

Socket::Socket(const SocketConfig& config)
    : Socket(config, make_websocket_transport_factory(config.connect_timeout)) {}

Socket::Socket(const SocketConfig& config, TransportFactory transport_factory) {
    config.validate();
    apply_logging_config(config.logging);
    pImpl_ = std::make_shared<Impl>(config, std::move(transport_factory));
}

Socket::~Socket() {
    if (pImpl_) {
        pImpl_->shutdown();
    }
}

void Socket::connect() {
    pImpl_->connect();
}

std::future<void> Socket::connect_async() {
    return std::async(std::launch::async, [impl = pImpl_]() { impl->connect(); });
}

void Socket::disconnect() {
    pImpl_->shutdown();
}

bool Socket::is_connected() const {
    return pImpl_->is_connected();
}

ConnectionState Socket::get_connection_state() const {
    return pImpl_->get_connection_state();
}

Subscription Socket::join(const std::string& topic) {
    return pImpl_->join_async(topic).get();
}

Subscription Socket::join(const Collection& collection) {
    return join(collection.to_topic());
}

std::future<Subscription> Socket::join_async(const std::string& topic) {
    return pImpl_->join_async(topic);
}

void Socket::leave(const std::string& topic) {
    pImpl_->leave(topic);
}

std::optional<ChannelStatus> Socket::channel_status(const std::string& topic) const {
    return pImpl_->channel_status(topic);
}

std::vector<std::string> Socket::active_topics() const {
    return pImpl_->active_topics();
}

SocketStats Socket::get_stats() const {
    return pImpl_->get_stats();
}

const SocketConfig& Socket::get_config() const {
    return pImpl_->get_config();
}

void Socket::set_connection_state_callback(ConnectionStateCallback callback) {
    pImpl_->set_connection_state_callback(std::move(callback));
}

void Socket::set_error_callback(ErrorCallback callback) {
    pImpl_->set_error_callback(std::move(callback));
}

} // namespace opensea_stream
