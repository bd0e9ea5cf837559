#include "opensea_stream/collection.hpp"

#include <array>
#include <utility>

namespace opensea_stream {

namespace {

constexpr std::array<std::pair<Event, std::string_view>, 7> EVENT_NAMES{{
    {Event::ItemListed,          "item_listed"},
    {Event::ItemSold,            "item_sold"},
    {Event::ItemTransferred,     "item_transferred"},
    {Event::ItemMetadataUpdated, "item_metadata_updated"},
    {Event::ItemCancelled,       "item_cancelled"},
    {Event::ItemReceivedOffer,   "item_received_offer"},
    {Event::ItemReceivedBid,     "item_received_bid"},
}};

} // namespace

Collection Collection::slug(std::string name) {
    if (name == COLLECTION_WILDCARD) {
        return all();
    }
    return Collection(std::move(name), false);
}

Collection Collection::all() {
    return Collection(COLLECTION_WILDCARD, true);
}

std::optional<Collection> Collection::parse(std::string_view topic) {
    const std::string_view prefix(COLLECTION_TOPIC_PREFIX);
    if (topic.size() <= prefix.size() || topic.substr(0, prefix.size()) != prefix) {
        return std::nullopt;
    }
    return slug(std::string(topic.substr(prefix.size())));
}

std::string Collection::to_topic() const {
    return std::string(COLLECTION_TOPIC_PREFIX) + name_;
}

std::string_view to_string(Event event) noexcept {
    for (const auto& [value, name] : EVENT_NAMES) {
        if (value == event) {
            return name;
        }
    }
    return "unknown";
}

std::optional<Event> parse_event(std::string_view name) noexcept {
    for (const auto& [value, event_name] : EVENT_NAMES) {
        if (event_name == name) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace opensea_stream
