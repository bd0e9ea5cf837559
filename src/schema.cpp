#include "opensea_stream/schema.hpp"

#include <array>
#include <cctype>
#include <type_traits>
#include <utility>

namespace opensea_stream {

namespace {

constexpr std::array<std::pair<Chain, std::string_view>, 7> CHAIN_NAMES{{
    {Chain::Ethereum, "ethereum"},
    {Chain::Polygon,  "matic"},
    {Chain::Klaytn,   "klaytn"},
    {Chain::Solana,   "solana"},
    {Chain::Rinkeby,  "rinkeby"},
    {Chain::Mumbai,   "mumbai"},
    {Chain::Baobab,   "baobab"},
}};

// 2^256 - 1
constexpr std::string_view MAX_TOKEN_ID =
    "115792089237316195423570985008687907853269984665640564039457584007913129639935";

bool is_contract_address(std::string_view text) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    if (text.size() != 40) {
        return false;
    }
    for (char c : text) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool is_token_id(std::string_view text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    auto significant = text.find_first_not_of('0');
    if (significant == std::string_view::npos) {
        return true;
    }
    text.remove_prefix(significant);
    // Equal lengths compare lexicographically as numbers
    return text.size() < MAX_TOKEN_ID.size() ||
           (text.size() == MAX_TOKEN_ID.size() && text <= MAX_TOKEN_ID);
}

} // namespace

std::string_view to_string(Chain chain) noexcept {
    for (const auto& [value, name] : CHAIN_NAMES) {
        if (value == chain) {
            return name;
        }
    }
    return "unknown";
}

Chain parse_chain(std::string_view name) noexcept {
    for (const auto& [value, chain_name] : CHAIN_NAMES) {
        if (chain_name == name) {
            return value;
        }
    }
    return Chain::Unknown;
}

std::string_view to_string(ListingType type) noexcept {
    return type == ListingType::English ? "english" : "dutch";
}

std::optional<ListingType> parse_listing_type(std::string_view name) noexcept {
    if (name == "english") {
        return ListingType::English;
    }
    if (name == "dutch") {
        return ListingType::Dutch;
    }
    return std::nullopt;
}

std::string NftId::to_string() const {
    std::string name = chain_name.empty() ? std::string(opensea_stream::to_string(chain)) : chain_name;
    return name + '/' + address + '/' + token_id;
}

std::optional<NftId> parse_nft_id(std::string_view text) {
    auto first = text.find('/');
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    auto second = text.find('/', first + 1);
    if (second == std::string_view::npos) {
        return std::nullopt;
    }

    auto chain = text.substr(0, first);
    auto address = text.substr(first + 1, second - first - 1);
    auto token_id = text.substr(second + 1);
    if (chain.empty() || !is_contract_address(address) || !is_token_id(token_id)) {
        return std::nullopt;
    }

    NftId id;
    id.chain = parse_chain(chain);
    id.chain_name = std::string(chain);
    id.address = std::string(address);
    id.token_id = std::string(token_id);
    return id;
}

std::optional<Event> event_of(const Payload& payload) noexcept {
    return std::visit([](const auto& body) -> std::optional<Event> {
        using Body = std::decay_t<decltype(body)>;
        if constexpr (std::is_same_v<Body, ItemListed>) {
            return Event::ItemListed;
        } else if constexpr (std::is_same_v<Body, ItemSold>) {
            return Event::ItemSold;
        } else if constexpr (std::is_same_v<Body, ItemTransferred>) {
            return Event::ItemTransferred;
        } else if constexpr (std::is_same_v<Body, ItemMetadataUpdated>) {
            return Event::ItemMetadataUpdated;
        } else if constexpr (std::is_same_v<Body, ItemCancelled>) {
            return Event::ItemCancelled;
        } else if constexpr (std::is_same_v<Body, ItemReceivedOffer>) {
            return Event::ItemReceivedOffer;
        } else if constexpr (std::is_same_v<Body, ItemReceivedBid>) {
            return Event::ItemReceivedBid;
        } else {
            return std::nullopt;
        }
    }, payload);
}

} // namespace opensea_stream
