#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <json/json.h>

#include "opensea_stream/collection.hpp"

namespace opensea_stream {

/**
 * @brief Network an item lives on
 */
enum class Chain {
    Ethereum,
    Polygon,   // "matic" on the wire
    Klaytn,
    Solana,
    Rinkeby,
    Mumbai,
    Baobab,
    Unknown
};

std::string_view to_string(Chain chain) noexcept;

/**
 * @brief Chain for its wire name; Unknown for names this client does not know
 */
Chain parse_chain(std::string_view name) noexcept;

enum class ListingType {
    English,
    Dutch
};

std::string_view to_string(ListingType type) noexcept;
std::optional<ListingType> parse_listing_type(std::string_view name) noexcept;

/**
 * @brief Identifier of an NFT, "chain/contract/token_id" on the wire
 *
 * Token ids are 256-bit, kept as their decimal string. The chain's wire
 * name is kept so ids on chains this client does not know print unchanged.
 */
struct NftId {
    Chain chain = Chain::Unknown;
    std::string chain_name;
    std::string address;
    std::string token_id;

    std::string to_string() const;
};

/**
 * @brief Parse "chain/address/id"
 *
 * The address must be 40 hex digits with an optional 0x prefix and the id a
 * decimal that fits in 256 bits; nullopt otherwise.
 */
std::optional<NftId> parse_nft_id(std::string_view text);

struct Metadata {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> image_url;
    std::optional<std::string> animation_url;
    std::optional<std::string> metadata_url;
};

struct Item {
    NftId nft_id;
    std::string permalink;
    Chain chain = Chain::Unknown;
    Metadata metadata;
};

/**
 * @brief Collection and item every event refers to
 */
struct Context {
    std::string collection_slug;
    Item item;
};

/**
 * @brief Currency a price is denominated in
 *
 * eth_price and usd_price arrive either as JSON numbers or as decimal strings.
 */
struct PaymentToken {
    std::string address;
    std::uint64_t decimals = 0;
    double eth_price = 0.0;
    std::string name;
    std::string symbol;
    double usd_price = 0.0;
};

struct Transaction {
    std::string hash;
    std::string timestamp;
};

// Timestamps are kept as the ISO-8601 strings the server sends.
// Prices are wei-like 256-bit integers kept as decimal strings.

struct ItemListed {
    Context context;
    std::string event_timestamp;
    std::string base_price;
    std::string expiration_date;
    bool is_private = false;
    std::string listing_date;
    std::optional<ListingType> listing_type;   // nullopt for a buyout
    std::string maker;
    PaymentToken payment_token;
    std::uint64_t quantity = 0;
    std::optional<std::string> taker;
};

struct ItemSold {
    Context context;
    std::string event_timestamp;
    std::string closing_date;
    bool is_private = false;
    std::optional<ListingType> listing_type;
    std::string maker;
    PaymentToken payment_token;
    std::uint64_t quantity = 0;
    std::string sale_price;
    std::string taker;
    Transaction transaction;
};

struct ItemTransferred {
    Context context;
    std::string event_timestamp;
    Transaction transaction;
    std::string from_account;
    std::string to_account;
    std::uint64_t quantity = 0;
};

struct ItemMetadataUpdated {
    Context context;
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> image_preview_url;
    std::optional<std::string> animation_url;
    std::optional<std::string> background_color;
    std::optional<std::string> metadata_url;
    std::vector<Json::Value> traits;
};

struct ItemCancelled {
    Context context;
    std::string event_timestamp;
    std::optional<ListingType> listing_type;
    PaymentToken payment_token;
    std::uint64_t quantity = 0;
    Transaction transaction;
};

struct ItemReceivedOffer {
    Context context;
    std::string event_timestamp;
    std::string base_price;
    std::string created_date;
    std::string expiration_date;
    std::string maker;
    PaymentToken payment_token;
    std::uint64_t quantity = 0;
    std::optional<std::string> taker;
};

struct ItemReceivedBid {
    Context context;
    std::string event_timestamp;
    std::string base_price;
    std::string created_date;
    std::string expiration_date;
    std::string maker;
    PaymentToken payment_token;
    std::uint64_t quantity = 0;
    std::optional<std::string> taker;
};

/**
 * @brief An event kind this client has no schema for
 */
struct Unrecognized {
    std::string event_type;
    Json::Value raw;
};

using Payload = std::variant<ItemListed,
                             ItemSold,
                             ItemTransferred,
                             ItemMetadataUpdated,
                             ItemCancelled,
                             ItemReceivedOffer,
                             ItemReceivedBid,
                             Unrecognized>;

/**
 * @brief Phoenix event name matching a payload; nullopt for Unrecognized
 */
std::optional<Event> event_of(const Payload& payload) noexcept;

struct StreamEvent {
    std::string sent_at;
    Payload payload;
};

} // namespace opensea_stream
