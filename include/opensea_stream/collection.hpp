#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace opensea_stream {

inline constexpr const char* COLLECTION_TOPIC_PREFIX = "collection:";
inline constexpr const char* COLLECTION_WILDCARD     = "*";

/**
 * @brief Subscription target: one collection by slug, or every collection
 */
class Collection {
public:
    static Collection slug(std::string name);
    static Collection all();

    /**
     * @brief Inverse of to_topic(); nullopt for topics outside "collection:"
     */
    static std::optional<Collection> parse(std::string_view topic);

    bool is_all() const noexcept { return all_; }

    /**
     * @brief The slug, or "*" for all collections
     */
    const std::string& name() const noexcept { return name_; }

    std::string to_topic() const;

    bool operator==(const Collection& other) const noexcept {
        return all_ == other.all_ && name_ == other.name_;
    }
    bool operator!=(const Collection& other) const noexcept { return !(*this == other); }

private:
    Collection(std::string name, bool all) : name_(std::move(name)), all_(all) {}

    std::string name_;
    bool all_;
};

/**
 * @brief Event names published on collection topics
 */
enum class Event {
    ItemListed,
    ItemSold,
    ItemTransferred,
    ItemMetadataUpdated,
    ItemCancelled,
    ItemReceivedOffer,
    ItemReceivedBid
};

std::string_view to_string(Event event) noexcept;
std::optional<Event> parse_event(std::string_view name) noexcept;

} // namespace opensea_stream
