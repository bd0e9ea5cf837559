#include "opensea_stream/protocol.hpp"

#include <memory>

namespace opensea_stream {

namespace {

std::optional<std::string> read_ref(const Json::Value& value) {
    if (value.isString()) {
        return value.asString();
    }
    // Some servers send numeric refs
    if (value.isIntegral()) {
        return value.isUInt64() ? std::to_string(value.asUInt64()) : std::to_string(value.asInt64());
    }
    return std::nullopt;
}

Json::Value write_ref(const std::optional<std::string>& ref) {
    return ref ? Json::Value(*ref) : Json::Value(Json::nullValue);
}

Result<Frame, ProtocolException> frame_from_object(const Json::Value& root) {
    const Json::Value& topic = root["topic"];
    const Json::Value& event = root["event"];
    if (!topic.isString()) {
        return Result<Frame, ProtocolException>::error(ProtocolException("frame has no string topic"));
    }
    if (!event.isString()) {
        return Result<Frame, ProtocolException>::error(ProtocolException("frame has no string event"));
    }

    Frame frame;
    frame.topic = topic.asString();
    frame.event = event.asString();
    if (root.isMember("payload") && !root["payload"].isNull()) {
        frame.payload = root["payload"];
    }
    frame.ref = read_ref(root["ref"]);
    frame.join_ref = read_ref(root["join_ref"]);
    return Result<Frame, ProtocolException>::success(std::move(frame));
}

// [join_ref, ref, topic, event, payload]
Result<Frame, ProtocolException> frame_from_array(const Json::Value& root) {
    if (root.size() != 5) {
        return Result<Frame, ProtocolException>::error(
            ProtocolException("array frame must have 5 elements, got " + std::to_string(root.size())));
    }
    if (!root[2].isString() || !root[3].isString()) {
        return Result<Frame, ProtocolException>::error(
            ProtocolException("array frame topic and event must be strings"));
    }

    Frame frame;
    frame.join_ref = read_ref(root[0]);
    frame.ref = read_ref(root[1]);
    frame.topic = root[2].asString();
    frame.event = root[3].asString();
    if (!root[4].isNull()) {
        frame.payload = root[4];
    }
    return Result<Frame, ProtocolException>::success(std::move(frame));
}

} // namespace

std::string_view to_string(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::Event:        return "event";
        case MessageKind::Reply:        return "reply";
        case MessageKind::Error:        return "error";
        case MessageKind::Close:        return "close";
        case MessageKind::HeartbeatAck: return "heartbeat_ack";
    }
    return "unknown";
}

MessageKind classify(const Frame& frame) noexcept {
    if (frame.event == EVENT_REPLY) {
        return frame.topic == TOPIC_PHOENIX ? MessageKind::HeartbeatAck : MessageKind::Reply;
    }
    if (frame.event == EVENT_ERROR) {
        return MessageKind::Error;
    }
    if (frame.event == EVENT_CLOSE) {
        return MessageKind::Close;
    }
    return MessageKind::Event;
}

Message Message::from_frame(Frame frame) {
    Message message;
    message.kind = classify(frame);
    message.topic = std::move(frame.topic);
    message.event = std::move(frame.event);
    message.payload = std::move(frame.payload);
    message.ref = std::move(frame.ref);
    message.join_ref = std::move(frame.join_ref);
    return message;
}

std::string Reply::describe() const {
    if (response.isObject() && response["reason"].isString()) {
        return response["reason"].asString();
    }
    if (response.isString()) {
        return response.asString();
    }
    if (response.isNull() || (response.isObject() && response.empty())) {
        return status;
    }
    return status + " " + to_compact_json(response);
}

std::optional<Reply> parse_reply(const Frame& frame) {
    if (frame.event != EVENT_REPLY || !frame.payload || !frame.payload->isObject()) {
        return std::nullopt;
    }
    const Json::Value& status = (*frame.payload)["status"];
    if (!status.isString()) {
        return std::nullopt;
    }
    Reply reply;
    reply.status = status.asString();
    reply.response = (*frame.payload)["response"];
    return reply;
}

std::string to_compact_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

std::string encode_frame(const Frame& frame) {
    Json::Value root(Json::objectValue);
    root["topic"] = frame.topic;
    root["event"] = frame.event;
    root["payload"] = frame.payload ? *frame.payload : Json::Value(Json::objectValue);
    root["ref"] = write_ref(frame.ref);
    root["join_ref"] = write_ref(frame.join_ref);
    return to_compact_json(root);
}

Result<Frame, ProtocolException> decode_frame(std::string_view text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return Result<Frame, ProtocolException>::error(ProtocolException("invalid JSON: " + errors));
    }

    if (root.isObject()) {
        return frame_from_object(root);
    }
    if (root.isArray()) {
        return frame_from_array(root);
    }
    return Result<Frame, ProtocolException>::error(
        ProtocolException("frame must be a JSON object or array"));
}

Frame make_join_frame(const std::string& topic, const std::string& ref) {
    Frame frame;
    frame.topic = topic;
    frame.event = EVENT_JOIN;
    frame.payload = Json::Value(Json::objectValue);
    frame.ref = ref;
    frame.join_ref = ref;
    return frame;
}

Frame make_leave_frame(const std::string& topic, const std::string& ref, const std::string& join_ref) {
    Frame frame;
    frame.topic = topic;
    frame.event = EVENT_LEAVE;
    frame.payload = Json::Value(Json::objectValue);
    frame.ref = ref;
    frame.join_ref = join_ref;
    return frame;
}

Frame make_heartbeat_frame(const std::string& ref) {
    Frame frame;
    frame.topic = TOPIC_PHOENIX;
    frame.event = EVENT_HEARTBEAT;
    frame.payload = Json::Value(Json::objectValue);
    frame.ref = ref;
    return frame;
}

} // namespace opensea_stream
