#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace opensea_stream {

/**
 * @brief Keep-alive scheduling and liveness tracking for one socket
 *
 * The driver thread only calls the tick callback every interval. The liveness
 * bookkeeping (record_*, is_timed_out) takes explicit time points and belongs to
 * the thread that owns the socket; it is not synchronised.
 */
class HeartbeatDriver {
public:
    using Clock = std::chrono::steady_clock;
    using TickCallback = std::function<void()>;

    HeartbeatDriver(std::chrono::milliseconds interval, int timeout_multiplier);
    ~HeartbeatDriver();

    HeartbeatDriver(const HeartbeatDriver&) = delete;
    HeartbeatDriver& operator=(const HeartbeatDriver&) = delete;

    void start(TickCallback on_tick);
    void stop();
    bool is_running() const noexcept { return running_.load(); }

    std::chrono::milliseconds interval() const noexcept { return interval_; }
    std::chrono::milliseconds timeout() const noexcept { return interval_ * timeout_multiplier_; }

    /**
     * @brief Start a fresh session: everything before `now` is forgotten
     */
    void reset(Clock::time_point now);

    /**
     * @brief Any inbound frame proves the connection is alive
     */
    void record_traffic(Clock::time_point now);

    void record_sent(std::string ref, Clock::time_point now);

    /**
     * @return true when `ref` answers the outstanding heartbeat
     */
    bool record_ack(const std::string& ref, Clock::time_point now);

    bool is_timed_out(Clock::time_point now) const;

    const std::optional<std::string>& pending_ref() const noexcept { return pending_ref_; }
    std::optional<std::chrono::microseconds> last_round_trip() const noexcept { return last_rtt_; }

private:
    void run(TickCallback on_tick);

    const std::chrono::milliseconds interval_;
    const int timeout_multiplier_;

    std::atomic<bool> running_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::thread thread_;

    Clock::time_point last_traffic_{};
    std::optional<std::string> pending_ref_;
    Clock::time_point pending_since_{};
    std::optional<std::chrono::microseconds> last_rtt_;
};

} // namespace opensea_stream
