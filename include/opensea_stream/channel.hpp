#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "opensea_stream/delivery_queue.hpp"
#include "opensea_stream/protocol.hpp"

namespace opensea_stream {

enum class ChannelStatus {
    Joining,
    Joined,
    Leaving,
    Closed,
    Errored
};

std::string_view to_string(ChannelStatus status) noexcept;

namespace channel_state {

using Clock = std::chrono::steady_clock;

/**
 * A phx_join is in flight, or waits for the transport to come back (sent == false).
 */
struct Joining {
    std::string join_ref;
    std::optional<Clock::time_point> deadline;
    bool rejoin = false;
    bool sent = false;
};

struct Joined {
    std::string join_ref;
};

struct Leaving {
    std::string join_ref;
    std::string leave_ref;
    Clock::time_point deadline;
};

struct Closed {};

struct Errored {
    std::string reason;
};

} // namespace channel_state

using ChannelState = std::variant<channel_state::Joining,
                                  channel_state::Joined,
                                  channel_state::Leaving,
                                  channel_state::Closed,
                                  channel_state::Errored>;

/**
 * @brief One logical subscription to one topic
 *
 * Holds the lifecycle state and the delivery queue. Every transition function
 * returns false and leaves the state untouched when the transition is not legal
 * from the current state. Entering Closed or Errored terminates the queue.
 *
 * Not thread-safe; owned by the socket coordinator. Only the queue is shared.
 */
class Channel {
public:
    using Clock = channel_state::Clock;
    using Queue = DeliveryQueue<Message>;

    /**
     * @param join_deadline initial join timeout; nullopt leaves it to mark_join_sent()
     */
    Channel(std::string topic, std::uint64_t id, std::size_t queue_capacity,
            std::optional<Clock::time_point> join_deadline = std::nullopt);

    const std::string& topic() const noexcept { return topic_; }

    /**
     * @brief Identity of this channel instance; a topic rejoined after a leave gets a new id
     */
    std::uint64_t id() const noexcept { return id_; }

    const ChannelState& state() const noexcept { return state_; }
    ChannelStatus status() const noexcept;
    bool is_terminal() const noexcept;

    /**
     * @brief join_ref of the current session membership, if any
     */
    std::optional<std::string> join_ref() const;

    /**
     * @brief Earliest time at which a handshake in flight times out
     */
    std::optional<Clock::time_point> deadline() const;

    std::shared_ptr<Queue> queue() const noexcept { return queue_; }

    // Joining with a join frame not yet on the wire
    bool awaiting_send() const noexcept;

    // Joining that follows a session loss of a joined channel
    bool is_rejoin() const noexcept;

    // Transitions
    bool mark_join_sent(std::string join_ref, Clock::time_point deadline);
    bool on_join_ok(const std::string& ref);
    bool begin_leave(std::string leave_ref, Clock::time_point deadline);
    bool on_leave_done();
    bool on_session_lost();
    bool close();
    bool fail(std::string reason, std::exception_ptr error);

    /**
     * @brief Push an inbound message to the receivers
     */
    Queue::PushResult deliver(Message message);

private:
    std::string topic_;
    std::uint64_t id_;
    ChannelState state_;
    std::shared_ptr<Queue> queue_;
};

} // namespace opensea_stream
