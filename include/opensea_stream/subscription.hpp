#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "opensea_stream/delivery_queue.hpp"
#include "opensea_stream/protocol.hpp"

namespace opensea_stream {

namespace detail {

/**
 * @brief Back channel from a handle to the socket that owns its channel
 */
class ChannelCloser {
public:
    virtual ~ChannelCloser() = default;

    /**
     * @brief Leave the channel instance `channel_id` of `topic`, blocking until done
     *
     * A channel that is already gone, or was replaced by a newer instance, counts as
     * closed and returns immediately.
     */
    virtual void close_channel(const std::string& topic, std::uint64_t channel_id) = 0;
};

} // namespace detail

/**
 * @brief Read side of a subscription
 *
 * Copies share the channel queue and split its messages between them. The channel
 * keeps running when every receiver is gone; frames are then dropped and counted.
 */
class Receiver {
public:
    using Queue = DeliveryQueue<Message>;

    Receiver(std::shared_ptr<Queue> queue, std::string topic);
    ~Receiver();

    Receiver(const Receiver& other);
    Receiver& operator=(const Receiver& other);
    Receiver(Receiver&& other) noexcept;
    Receiver& operator=(Receiver&& other) noexcept;

    /**
     * @brief Block until the next message
     * @return nullopt once the channel closed cleanly and the buffer is drained
     * @throws ChannelError (or RejoinError) once an errored channel is drained
     */
    std::optional<Message> recv();

    /**
     * @brief As recv() but gives up after `timeout`; nullopt on timeout or close
     */
    std::optional<Message> recv_for(std::chrono::milliseconds timeout);

    /**
     * @brief Non-blocking variant of recv()
     */
    std::optional<Message> try_recv();

    /**
     * @brief True when the channel ended and nothing is left to read
     */
    bool is_finished() const;

    const std::string& topic() const noexcept { return topic_; }
    std::size_t pending() const;

private:
    std::optional<Message> handle(Queue::PopStatus status, Message& message);
    void release() noexcept;

    std::shared_ptr<Queue> queue_;
    std::string topic_;
};

/**
 * @brief Write side of a subscription: owns the right to leave the channel
 */
class ChannelHandler {
public:
    ChannelHandler(std::weak_ptr<detail::ChannelCloser> closer, std::string topic,
                   std::uint64_t channel_id);

    /**
     * @brief Leave the channel; returns once the server acknowledged or the leave timed out
     * @throws LeaveError when the server answered with an error (the channel is closed anyway)
     */
    void close();

    std::future<void> close_async();

    const std::string& topic() const noexcept { return topic_; }
    std::uint64_t channel_id() const noexcept { return channel_id_; }

private:
    std::weak_ptr<detail::ChannelCloser> closer_;
    std::string topic_;
    std::uint64_t channel_id_;
};

/**
 * @brief Result of a successful join
 */
struct Subscription {
    ChannelHandler handler;
    Receiver receiver;
};

} // namespace opensea_stream
