#include "opensea_stream/channel.hpp"

namespace opensea_stream {

using namespace channel_state;

std::string_view to_string(ChannelStatus status) noexcept {
    switch (status) {
        case ChannelStatus::Joining: return "joining";
        case ChannelStatus::Joined:  return "joined";
        case ChannelStatus::Leaving: return "leaving";
        case ChannelStatus::Closed:  return "closed";
        case ChannelStatus::Errored: return "errored";
    }
    return "unknown";
}

Channel::Channel(std::string topic, std::uint64_t id, std::size_t queue_capacity,
                 std::optional<Clock::time_point> join_deadline)
    : topic_(std::move(topic))
    , id_(id)
    , state_(Joining{std::string(), join_deadline, false, false})
    , queue_(std::make_shared<Queue>(queue_capacity)) {}

ChannelStatus Channel::status() const noexcept {
    return static_cast<ChannelStatus>(state_.index());
}

bool Channel::is_terminal() const noexcept {
    return std::holds_alternative<Closed>(state_) || std::holds_alternative<Errored>(state_);
}

std::optional<std::string> Channel::join_ref() const {
    if (const auto* joining = std::get_if<Joining>(&state_)) {
        if (joining->sent) {
            return joining->join_ref;
        }
        return std::nullopt;
    }
    if (const auto* joined = std::get_if<Joined>(&state_)) {
        return joined->join_ref;
    }
    if (const auto* leaving = std::get_if<Leaving>(&state_)) {
        return leaving->join_ref;
    }
    return std::nullopt;
}

std::optional<Channel::Clock::time_point> Channel::deadline() const {
    if (const auto* joining = std::get_if<Joining>(&state_)) {
        return joining->deadline;
    }
    if (const auto* leaving = std::get_if<Leaving>(&state_)) {
        return leaving->deadline;
    }
    return std::nullopt;
}

bool Channel::awaiting_send() const noexcept {
    const auto* joining = std::get_if<Joining>(&state_);
    return joining != nullptr && !joining->sent;
}

bool Channel::is_rejoin() const noexcept {
    const auto* joining = std::get_if<Joining>(&state_);
    return joining != nullptr && joining->rejoin;
}

bool Channel::mark_join_sent(std::string join_ref, Clock::time_point deadline) {
    auto* joining = std::get_if<Joining>(&state_);
    if (joining == nullptr) {
        return false;
    }
    joining->join_ref = std::move(join_ref);
    joining->deadline = deadline;
    joining->sent = true;
    return true;
}

bool Channel::on_join_ok(const std::string& ref) {
    const auto* joining = std::get_if<Joining>(&state_);
    if (joining == nullptr || !joining->sent || joining->join_ref != ref) {
        return false;
    }
    state_ = Joined{ref};
    return true;
}

bool Channel::begin_leave(std::string leave_ref, Clock::time_point deadline) {
    const auto* joined = std::get_if<Joined>(&state_);
    if (joined == nullptr) {
        return false;
    }
    state_ = Leaving{joined->join_ref, std::move(leave_ref), deadline};
    return true;
}

bool Channel::on_leave_done() {
    if (!std::holds_alternative<Leaving>(state_)) {
        return false;
    }
    return close();
}

bool Channel::on_session_lost() {
    if (std::holds_alternative<Joined>(state_)) {
        state_ = Joining{std::string(), std::nullopt, true, false};
        return true;
    }
    if (auto* joining = std::get_if<Joining>(&state_)) {
        if (!joining->sent) {
            return false;
        }
        joining->sent = false;
        joining->join_ref.clear();
        // A rejoin gets a fresh deadline once resent; a first join keeps the caller's
        if (joining->rejoin) {
            joining->deadline.reset();
        }
        return true;
    }
    if (std::holds_alternative<Leaving>(state_)) {
        return close();
    }
    return false;
}

bool Channel::close() {
    if (is_terminal()) {
        return false;
    }
    state_ = Closed{};
    queue_->close();
    return true;
}

bool Channel::fail(std::string reason, std::exception_ptr error) {
    if (is_terminal()) {
        return false;
    }
    state_ = Errored{std::move(reason)};
    queue_->fail(std::move(error));
    return true;
}

Channel::Queue::PushResult Channel::deliver(Message message) {
    return queue_->push(std::move(message));
}

} // namespace opensea_stream
