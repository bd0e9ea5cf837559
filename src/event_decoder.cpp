#include "opensea_stream/event_decoder.hpp"

#include <cstdlib>
#include <string>

#include "opensea_stream/errors.hpp"
#include "opensea_stream/logging.hpp"

namespace opensea_stream {

namespace {

/**
 * Typed access to the members of one JSON object. Every mismatch throws a
 * ProtocolException naming the full path of the offending member.
 */
class FieldReader {
public:
    FieldReader(const Json::Value& object, std::string path)
        : object_(object)
        , path_(std::move(path)) {
        if (!object_.isObject()) {
            throw ProtocolException(where() + " is not an object");
        }
    }

    bool has(const char* key) const {
        return object_.isMember(key) && !object_[key].isNull();
    }

    FieldReader object(const char* key) const {
        return FieldReader(required(key), path_of(key));
    }

    std::string string(const char* key) const {
        const Json::Value& value = required(key);
        if (!value.isString()) {
            throw mismatch(key, "a string");
        }
        return value.asString();
    }

    std::optional<std::string> optional_string(const char* key) const {
        if (!has(key)) {
            return std::nullopt;
        }
        return string(key);
    }

    bool boolean(const char* key) const {
        const Json::Value& value = required(key);
        if (!value.isBool()) {
            throw mismatch(key, "a boolean");
        }
        return value.asBool();
    }

    std::uint64_t unsigned_integer(const char* key) const {
        const Json::Value& value = required(key);
        if (!value.isUInt64()) {
            throw mismatch(key, "an unsigned integer");
        }
        return value.asUInt64();
    }

    // 256-bit amount: decimal string, or a JSON integer that fits 64 bits
    std::string decimal(const char* key) const {
        const Json::Value& value = required(key);
        if (value.isUInt64()) {
            return std::to_string(value.asUInt64());
        }
        if (!value.isString()) {
            throw mismatch(key, "a decimal string");
        }
        std::string text = value.asString();
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
            throw mismatch(key, "a decimal string");
        }
        return text;
    }

    // Price that arrives as a number or as a numeric string
    double number(const char* key) const {
        const Json::Value& value = required(key);
        if (value.isNumeric()) {
            return value.asDouble();
        }
        if (value.isString()) {
            std::string text = value.asString();
            char* end = nullptr;
            double parsed = std::strtod(text.c_str(), &end);
            if (!text.empty() && end == text.c_str() + text.size()) {
                return parsed;
            }
        }
        throw mismatch(key, "a number");
    }

    // Accounts are wrapped as {"address": "0x..."}
    std::string account(const char* key) const {
        return object(key).string("address");
    }

    std::optional<std::string> optional_account(const char* key) const {
        if (!has(key)) {
            return std::nullopt;
        }
        return account(key);
    }

    std::optional<ListingType> listing_type(const char* key) const {
        if (!has(key)) {
            return std::nullopt;
        }
        auto type = parse_listing_type(string(key));
        if (!type) {
            throw mismatch(key, "english or dutch");
        }
        return type;
    }

    std::vector<Json::Value> array(const char* key) const {
        std::vector<Json::Value> items;
        if (!has(key)) {
            return items;
        }
        const Json::Value& value = object_[key];
        if (!value.isArray()) {
            throw mismatch(key, "an array");
        }
        for (const auto& item : value) {
            items.push_back(item);
        }
        return items;
    }

private:
    const Json::Value& required(const char* key) const {
        if (!has(key)) {
            throw ProtocolException(path_of(key) + " is missing");
        }
        return object_[key];
    }

    ProtocolException mismatch(const char* key, const char* expected) const {
        return ProtocolException(path_of(key) + " is not " + expected);
    }

    std::string path_of(const char* key) const {
        return path_.empty() ? std::string(key) : path_ + '.' + key;
    }

    std::string where() const {
        return path_.empty() ? std::string("payload") : path_;
    }

    const Json::Value& object_;
    std::string path_;
};

Context read_context(const FieldReader& body) {
    Context context;
    context.collection_slug = body.object("collection").string("slug");

    FieldReader item = body.object("item");
    std::string nft_id = item.string("nft_id");
    auto parsed = parse_nft_id(nft_id);
    if (!parsed) {
        throw ProtocolException("item.nft_id '" + nft_id + "' is not chain/address/id");
    }
    context.item.nft_id = std::move(*parsed);
    context.item.permalink = item.string("permalink");
    context.item.chain = parse_chain(item.object("chain").string("name"));

    FieldReader metadata = item.object("metadata");
    context.item.metadata.name = metadata.optional_string("name");
    context.item.metadata.description = metadata.optional_string("description");
    context.item.metadata.image_url = metadata.optional_string("image_url");
    context.item.metadata.animation_url = metadata.optional_string("animation_url");
    context.item.metadata.metadata_url = metadata.optional_string("metadata_url");
    return context;
}

PaymentToken read_payment_token(const FieldReader& body) {
    FieldReader token = body.object("payment_token");
    PaymentToken result;
    result.address = token.string("address");
    result.decimals = token.unsigned_integer("decimals");
    result.eth_price = token.number("eth_price");
    result.name = token.string("name");
    result.symbol = token.string("symbol");
    result.usd_price = token.number("usd_price");
    return result;
}

Transaction read_transaction(const FieldReader& body) {
    FieldReader transaction = body.object("transaction");
    return Transaction{transaction.string("hash"), transaction.string("timestamp")};
}

Payload read_item_listed(const FieldReader& body) {
    ItemListed event;
    event.context = read_context(body);
    event.event_timestamp = body.string("event_timestamp");
    event.base_price = body.decimal("base_price");
    event.expiration_date = body.string("expiration_date");
    event.is_private = body.boolean("is_private");
    event.listing_date = body.string("listing_date");
    event.listing_type = body.listing_type("listing_type");
    event.maker = body.account("maker");
    event.payment_token = read_payment_token(body);
    event.quantity = body.unsigned_integer("quantity");
    event.taker = body.optional_account("taker");
    return event;
}

Payload read_item_sold(const FieldReader& body) {
    ItemSold event;
    event.context = read_context(body);
    event.event_timestamp = body.string("event_timestamp");
    event.closing_date = body.string("closing_date");
    event.is_private = body.boolean("is_private");
    event.listing_type = body.listing_type("listing_type");
    event.maker = body.account("maker");
    event.payment_token = read_payment_token(body);
    event.quantity = body.unsigned_integer("quantity");
    event.sale_price = body.decimal("sale_price");
    event.taker = body.account("taker");
    event.transaction = read_transaction(body);
    return event;
}

Payload read_item_transferred(const FieldReader& body) {
    ItemTransferred event;
    event.context = read_context(body);
    event.event_timestamp = body.string("event_timestamp");
    event.transaction = read_transaction(body);
    event.from_account = body.account("from_account");
    event.to_account = body.account("to_account");
    event.quantity = body.unsigned_integer("quantity");
    return event;
}

Payload read_item_metadata_updated(const FieldReader& body) {
    ItemMetadataUpdated event;
    event.context = read_context(body);
    event.name = body.optional_string("name");
    event.description = body.optional_string("description");
    event.image_preview_url = body.optional_string("image_preview_url");
    event.animation_url = body.optional_string("animation_url");
    event.background_color = body.optional_string("background_color");
    event.metadata_url = body.optional_string("metadata_url");
    event.traits = body.array("traits");
    return event;
}

Payload read_item_cancelled(const FieldReader& body) {
    ItemCancelled event;
    event.context = read_context(body);
    event.event_timestamp = body.string("event_timestamp");
    event.listing_type = body.listing_type("listing_type");
    event.payment_token = read_payment_token(body);
    event.quantity = body.unsigned_integer("quantity");
    event.transaction = read_transaction(body);
    return event;
}

// Offers and bids share one shape
template<typename T>
Payload read_order(const FieldReader& body) {
    T event;
    event.context = read_context(body);
    event.event_timestamp = body.string("event_timestamp");
    event.base_price = body.decimal("base_price");
    event.created_date = body.string("created_date");
    event.expiration_date = body.string("expiration_date");
    event.maker = body.account("maker");
    event.payment_token = read_payment_token(body);
    event.quantity = body.unsigned_integer("quantity");
    event.taker = body.optional_account("taker");
    return event;
}

Payload read_payload(Event kind, const FieldReader& body) {
    switch (kind) {
        case Event::ItemListed:          return read_item_listed(body);
        case Event::ItemSold:            return read_item_sold(body);
        case Event::ItemTransferred:     return read_item_transferred(body);
        case Event::ItemMetadataUpdated: return read_item_metadata_updated(body);
        case Event::ItemCancelled:       return read_item_cancelled(body);
        case Event::ItemReceivedOffer:   return read_order<ItemReceivedOffer>(body);
        case Event::ItemReceivedBid:     return read_order<ItemReceivedBid>(body);
    }
    throw ProtocolException("unhandled event kind");
}

std::string tag_of(const Json::Value& envelope, std::string_view declared_kind) {
    for (const char* key : {"event_type", "type"}) {
        const Json::Value& tag = envelope[key];
        if (tag.isString() && !tag.asString().empty()) {
            return tag.asString();
        }
    }
    return std::string(declared_kind);
}

} // namespace

std::optional<StreamEvent> decode_event(const std::optional<Json::Value>& payload,
                                        std::string_view declared_kind) {
    if (!payload || !payload->isObject()) {
        return std::nullopt;
    }
    const Json::Value& envelope = *payload;
    std::string kind_name = tag_of(envelope, declared_kind);

    try {
        StreamEvent event;
        const Json::Value& sent_at = envelope["sent_at"];
        if (sent_at.isString()) {
            event.sent_at = sent_at.asString();
        } else if (!sent_at.isNull()) {
            throw ProtocolException("sent_at is not a string");
        }

        auto kind = parse_event(kind_name);
        if (!kind) {
            event.payload = Unrecognized{kind_name, envelope};
            return event;
        }

        const Json::Value& inner = envelope["payload"];
        FieldReader body(inner.isObject() ? inner : envelope, "");
        event.payload = read_payload(*kind, body);
        return event;
    } catch (const ProtocolException& e) {
        auto logger = OPENSEA_LOGGER("decoder");
        OPENSEA_LOG_DEBUG(logger, "Cannot decode {}: {}", kind_name, e.what());
    } catch (const Json::Exception& e) {
        auto logger = OPENSEA_LOGGER("decoder");
        OPENSEA_LOG_DEBUG(logger, "Cannot decode {}: {}", kind_name, e.what());
    }
    return std::nullopt;
}

std::optional<StreamEvent> decode_message(const Message& message) {
    return decode_event(message.payload, message.event);
}

} // namespace opensea_stream
