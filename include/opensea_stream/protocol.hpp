#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <json/json.h>

#include "opensea_stream/errors.hpp"
#include "opensea_stream/logging.hpp"

namespace opensea_stream {

// Phoenix reserved events
inline constexpr const char* EVENT_JOIN      = "phx_join";
inline constexpr const char* EVENT_LEAVE     = "phx_leave";
inline constexpr const char* EVENT_REPLY     = "phx_reply";
inline constexpr const char* EVENT_ERROR     = "phx_error";
inline constexpr const char* EVENT_CLOSE     = "phx_close";
inline constexpr const char* EVENT_HEARTBEAT = "heartbeat";

// Topic carrying socket level traffic (heartbeats)
inline constexpr const char* TOPIC_PHOENIX = "phoenix";

inline constexpr const char* REPLY_STATUS_OK    = "ok";
inline constexpr const char* REPLY_STATUS_ERROR = "error";

/**
 * @brief One Phoenix channel message as it travels on the socket
 */
struct Frame {
    std::string topic;
    std::string event;
    std::optional<Json::Value> payload;
    std::optional<std::string> ref;
    std::optional<std::string> join_ref;
};

/**
 * @brief Classification of an inbound frame
 */
enum class MessageKind {
    Event,
    Reply,
    Error,
    Close,
    HeartbeatAck
};

std::string_view to_string(MessageKind kind) noexcept;

/**
 * @brief Inbound message routed to a channel
 */
struct Message {
    std::string topic;
    std::string event;
    MessageKind kind = MessageKind::Event;
    std::optional<Json::Value> payload;
    std::optional<std::string> ref;
    std::optional<std::string> join_ref;

    static Message from_frame(Frame frame);
};

MessageKind classify(const Frame& frame) noexcept;

/**
 * @brief Parsed body of a phx_reply
 */
struct Reply {
    std::string status;
    Json::Value response;

    bool is_ok() const noexcept { return status == REPLY_STATUS_OK; }

    /**
     * @brief Short human readable reason, taken from response.reason when present
     */
    std::string describe() const;
};

/**
 * @brief Extract status and response from a phx_reply frame
 * @return nullopt when the frame is not a reply or the payload has no status
 */
std::optional<Reply> parse_reply(const Frame& frame);

/**
 * @brief Serialize a frame with the JSON object serializer (vsn 1.0.0)
 */
std::string encode_frame(const Frame& frame);

/**
 * @brief Parse a text frame; accepts the object form and the vsn 2.0.0 array form
 */
Result<Frame, ProtocolException> decode_frame(std::string_view text);

Frame make_join_frame(const std::string& topic, const std::string& ref);
Frame make_leave_frame(const std::string& topic, const std::string& ref, const std::string& join_ref);
Frame make_heartbeat_frame(const std::string& ref);

/**
 * @brief Compact single line rendering of a JSON value, for logs and the wire
 */
std::string to_compact_json(const Json::Value& value);

} // namespace opensea_stream
