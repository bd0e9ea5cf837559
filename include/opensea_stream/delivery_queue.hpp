#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>

namespace opensea_stream {

/**
 * @brief Multi-producer multi-consumer queue feeding the receivers of one channel
 *
 * A capacity of 0 means unbounded. When bounded and full, the oldest item is
 * dropped to make room. Closing lets consumers drain what is buffered; after that
 * pop() reports Closed, or Failed with the stored error.
 *
 * Receivers register with attach()/detach(). Once at least one receiver attached
 * and all of them detached, push() reports NoConsumer and discards the item.
 */
template <typename T>
class DeliveryQueue {
public:
    enum class PushResult {
        Delivered,
        DroppedOldest,
        NoConsumer,
        Closed
    };

    enum class PopStatus {
        Item,
        Empty,
        Closed,
        Failed
    };

    explicit DeliveryQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    DeliveryQueue(const DeliveryQueue&) = delete;
    DeliveryQueue& operator=(const DeliveryQueue&) = delete;

    PushResult push(T value) {
        PushResult result = PushResult::Delivered;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return PushResult::Closed;
            }
            if (ever_attached_ && receivers_ == 0) {
                return PushResult::NoConsumer;
            }
            if (capacity_ > 0 && items_.size() >= capacity_) {
                items_.pop_front();
                ++dropped_;
                result = PushResult::DroppedOldest;
            }
            items_.push_back(std::move(value));
        }
        cond_.notify_one();
        return result;
    }

    /**
     * @brief Block until an item is available or the queue is closed and drained
     */
    PopStatus pop(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait(lock, [this] { return !items_.empty() || closed_; });
        return take(out);
    }

    template <typename Rep, typename Period>
    PopStatus pop_for(T& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cond_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; })) {
            return PopStatus::Empty;
        }
        return take(out);
    }

    PopStatus try_pop(T& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty() && !closed_) {
            return PopStatus::Empty;
        }
        return take(out);
    }

    /**
     * @brief End of stream; buffered items stay readable
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
        }
        cond_.notify_all();
    }

    /**
     * @brief End of stream with an error, rethrown to consumers once drained
     */
    void fail(std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            error_ = std::move(error);
        }
        cond_.notify_all();
    }

    std::exception_ptr error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_;
    }

    void attach() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++receivers_;
        ever_attached_ = true;
    }

    void detach() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (receivers_ > 0) {
            --receivers_;
        }
        // Nobody can read what is left
        if (receivers_ == 0) {
            items_.clear();
        }
    }

    std::size_t receivers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return receivers_;
    }

    bool has_consumer() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return !ever_attached_ || receivers_ > 0;
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    std::size_t capacity() const noexcept { return capacity_; }

    std::uint64_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    // Requires mutex_ held and (!items_.empty() || closed_)
    PopStatus take(T& out) {
        if (!items_.empty()) {
            out = std::move(items_.front());
            items_.pop_front();
            return PopStatus::Item;
        }
        return error_ ? PopStatus::Failed : PopStatus::Closed;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<T> items_;
    std::size_t receivers_{0};
    bool ever_attached_{false};
    bool closed_{false};
    std::exception_ptr error_;
    std::uint64_t dropped_{0};
};

} // namespace opensea_stream
