#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include <json/json.h>

namespace opensea_stream {
namespace test {

inline Json::Value parse_json(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw std::runtime_error("bad fixture: " + errors);
    }
    return root;
}

inline std::string context_json(const std::string& slug = "wandernauts") {
    return R"("collection":{"slug":")" + slug + R"("},
        "item":{
            "nft_id":"ethereum/0x8a90cab2b38dba80c64b7734e58ee1db38b8992e/4114",
            "permalink":"https://opensea.io/assets/ethereum/0x8a90cab2b38dba80c64b7734e58ee1db38b8992e/4114",
            "chain":{"name":"ethereum"},
            "metadata":{
                "name":"Wandernaut #4114",
                "description":null,
                "image_url":"https://i.seadn.io/4114.png",
                "animation_url":null,
                "metadata_url":"ipfs://QmExample/4114"
            }
        })";
}

inline std::string payment_token_json() {
    return R"("payment_token":{
        "address":"0x0000000000000000000000000000000000000000",
        "decimals":18,
        "eth_price":"1.000000000000000",
        "name":"Ether",
        "symbol":"ETH",
        "usd_price":1302.51
    })";
}

// Envelope of an item_listed event as published on a collection topic
inline std::string item_listed_json(const std::string& slug = "wandernauts") {
    return R"({"event_type":"item_listed","sent_at":"2022-10-27T14:16:44.137Z","payload":{)" +
           context_json(slug) + "," + payment_token_json() + R"(,
        "event_timestamp":"2022-10-27T14:16:43.000000+00:00",
        "base_price":"250000000000000000",
        "expiration_date":"2022-11-03T14:16:13.000000+00:00",
        "is_private":false,
        "listing_date":"2022-10-27T14:16:13.000000+00:00",
        "listing_type":null,
        "maker":{"address":"0x1a2b3c4d5e6f708192a3b4c5d6e7f8091a2b3c4d"},
        "quantity":1,
        "taker":null
    }})";
}

inline std::string item_sold_json() {
    return R"({"event_type":"item_sold","sent_at":"2022-10-27T14:20:00.000Z","payload":{)" +
           context_json() + "," + payment_token_json() + R"(,
        "event_timestamp":"2022-10-27T14:19:59.000000+00:00",
        "closing_date":"2022-10-27T14:19:59.000000+00:00",
        "is_private":false,
        "listing_type":"dutch",
        "maker":{"address":"0x1111111111111111111111111111111111111111"},
        "quantity":1,
        "sale_price":"115792089237316195423570985008687907853269984665640564039457584007913129639935",
        "taker":{"address":"0x2222222222222222222222222222222222222222"},
        "transaction":{"hash":"0xabc123","timestamp":"2022-10-27T14:19:59.000000+00:00"}
    }})";
}

} // namespace test
} // namespace opensea_stream
