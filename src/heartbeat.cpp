#include "opensea_stream/heartbeat.hpp"

namespace opensea_stream {

HeartbeatDriver::HeartbeatDriver(std::chrono::milliseconds interval, int timeout_multiplier)
    : interval_(interval)
    , timeout_multiplier_(timeout_multiplier) {}

HeartbeatDriver::~HeartbeatDriver() {
    stop();
}

void HeartbeatDriver::start(TickCallback on_tick) {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread([this, on_tick = std::move(on_tick)]() { run(on_tick); });
}

void HeartbeatDriver::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        running_.store(false);
    }
    wait_cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void HeartbeatDriver::run(TickCallback on_tick) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    while (running_.load()) {
        if (wait_cv_.wait_for(lock, interval_, [this] { return !running_.load(); })) {
            break;
        }
        lock.unlock();
        on_tick();
        lock.lock();
    }
}

void HeartbeatDriver::reset(Clock::time_point now) {
    last_traffic_ = now;
    pending_ref_.reset();
}

void HeartbeatDriver::record_traffic(Clock::time_point now) {
    if (now > last_traffic_) {
        last_traffic_ = now;
    }
}

void HeartbeatDriver::record_sent(std::string ref, Clock::time_point now) {
    // An unanswered heartbeat keeps its original send time
    if (!pending_ref_) {
        pending_since_ = now;
    }
    pending_ref_ = std::move(ref);
}

bool HeartbeatDriver::record_ack(const std::string& ref, Clock::time_point now) {
    if (!pending_ref_ || *pending_ref_ != ref) {
        return false;
    }
    last_rtt_ = std::chrono::duration_cast<std::chrono::microseconds>(now - pending_since_);
    pending_ref_.reset();
    record_traffic(now);
    return true;
}

bool HeartbeatDriver::is_timed_out(Clock::time_point now) const {
    return now - last_traffic_ > timeout();
}

} // namespace opensea_stream
