#pragma once

#include <optional>
#include <string_view>

#include <json/json.h>

#include "opensea_stream/protocol.hpp"
#include "opensea_stream/schema.hpp"

namespace opensea_stream {

/**
 * @brief Decode a collection event payload into its typed schema
 *
 * The envelope is `{"event_type": kind, "sent_at": ts, "payload": {...}}`. The kind
 * falls back to a "type" member and then to `declared_kind` (the Phoenix event of the
 * frame); the body falls back to the envelope itself when there is no "payload"
 * object.
 *
 * @return nullopt when the payload is absent or not an object, or when a known kind
 *         does not match its schema. Unknown kinds give Unrecognized. Never throws.
 */
std::optional<StreamEvent> decode_event(const std::optional<Json::Value>& payload,
                                        std::string_view declared_kind);

/**
 * @brief decode_event() on a delivered channel message
 */
std::optional<StreamEvent> decode_message(const Message& message);

} // namespace opensea_stream
