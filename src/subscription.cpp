#include "opensea_stream/subscription.hpp"

#include "opensea_stream/errors.hpp"

namespace opensea_stream {

Receiver::Receiver(std::shared_ptr<Queue> queue, std::string topic)
    : queue_(std::move(queue))
    , topic_(std::move(topic)) {
    if (queue_) {
        queue_->attach();
    }
}

Receiver::~Receiver() {
    release();
}

Receiver::Receiver(const Receiver& other)
    : queue_(other.queue_)
    , topic_(other.topic_) {
    if (queue_) {
        queue_->attach();
    }
}

Receiver& Receiver::operator=(const Receiver& other) {
    if (this != &other) {
        if (other.queue_) {
            other.queue_->attach();
        }
        release();
        queue_ = other.queue_;
        topic_ = other.topic_;
    }
    return *this;
}

Receiver::Receiver(Receiver&& other) noexcept
    : queue_(std::move(other.queue_))
    , topic_(std::move(other.topic_)) {}

Receiver& Receiver::operator=(Receiver&& other) noexcept {
    if (this != &other) {
        release();
        queue_ = std::move(other.queue_);
        topic_ = std::move(other.topic_);
    }
    return *this;
}

void Receiver::release() noexcept {
    if (queue_) {
        queue_->detach();
        queue_.reset();
    }
}

std::optional<Message> Receiver::handle(Queue::PopStatus status, Message& message) {
    switch (status) {
        case Queue::PopStatus::Item:
            return std::move(message);
        case Queue::PopStatus::Failed:
            std::rethrow_exception(queue_->error());
        case Queue::PopStatus::Empty:
        case Queue::PopStatus::Closed:
            break;
    }
    return std::nullopt;
}

std::optional<Message> Receiver::recv() {
    if (!queue_) {
        return std::nullopt;
    }
    Message message;
    return handle(queue_->pop(message), message);
}

std::optional<Message> Receiver::recv_for(std::chrono::milliseconds timeout) {
    if (!queue_) {
        return std::nullopt;
    }
    Message message;
    return handle(queue_->pop_for(message, timeout), message);
}

std::optional<Message> Receiver::try_recv() {
    if (!queue_) {
        return std::nullopt;
    }
    Message message;
    return handle(queue_->try_pop(message), message);
}

bool Receiver::is_finished() const {
    return !queue_ || (queue_->is_closed() && queue_->size() == 0);
}

std::size_t Receiver::pending() const {
    return queue_ ? queue_->size() : 0;
}

ChannelHandler::ChannelHandler(std::weak_ptr<detail::ChannelCloser> closer, std::string topic,
                               std::uint64_t channel_id)
    : closer_(std::move(closer))
    , topic_(std::move(topic))
    , channel_id_(channel_id) {}

void ChannelHandler::close() {
    // The socket is gone together with all of its channels
    if (auto closer = closer_.lock()) {
        closer->close_channel(topic_, channel_id_);
    }
}

std::future<void> ChannelHandler::close_async() {
    return std::async(std::launch::async, [closer = closer_, topic = topic_, id = channel_id_]() {
        if (auto locked = closer.lock()) {
            locked->close_channel(topic, id);
        }
    });
}

} // namespace opensea_stream
