#include <gtest/gtest.h>
#include <opensea_stream/event_decoder.hpp>

#include "common/event_fixtures.hpp"

using namespace opensea_stream;
using opensea_stream::test::parse_json;

TEST(EventDecoderTest, DecodesItemListed) {
    auto event = decode_event(parse_json(test::item_listed_json()), "item_listed");
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->sent_at, "2022-10-27T14:16:44.137Z");

    const auto* listed = std::get_if<ItemListed>(&event->payload);
    ASSERT_NE(listed, nullptr);
    EXPECT_EQ(listed->context.collection_slug, "wandernauts");
    EXPECT_EQ(listed->context.item.chain, Chain::Ethereum);
    EXPECT_EQ(listed->context.item.nft_id.token_id, "4114");
    EXPECT_EQ(listed->context.item.metadata.name, "Wandernaut #4114");
    EXPECT_FALSE(listed->context.item.metadata.description.has_value());
    EXPECT_EQ(listed->base_price, "250000000000000000");
    EXPECT_FALSE(listed->is_private);
    EXPECT_FALSE(listed->listing_type.has_value());
    EXPECT_EQ(listed->maker, "0x1a2b3c4d5e6f708192a3b4c5d6e7f8091a2b3c4d");
    EXPECT_FALSE(listed->taker.has_value());
    EXPECT_EQ(listed->quantity, 1u);
    EXPECT_DOUBLE_EQ(listed->payment_token.eth_price, 1.0);
    EXPECT_DOUBLE_EQ(listed->payment_token.usd_price, 1302.51);
    EXPECT_EQ(listed->payment_token.symbol, "ETH");

    EXPECT_EQ(event_of(event->payload), Event::ItemListed);
}

TEST(EventDecoderTest, DecodesItemSoldWithFullWidthPrice) {
    auto event = decode_event(parse_json(test::item_sold_json()), "item_sold");
    ASSERT_TRUE(event.has_value());

    const auto* sold = std::get_if<ItemSold>(&event->payload);
    ASSERT_NE(sold, nullptr);
    EXPECT_EQ(sold->sale_price,
              "115792089237316195423570985008687907853269984665640564039457584007913129639935");
    EXPECT_EQ(sold->listing_type, ListingType::Dutch);
    EXPECT_EQ(sold->taker, "0x2222222222222222222222222222222222222222");
    EXPECT_EQ(sold->transaction.hash, "0xabc123");
}

TEST(EventDecoderTest, EnvelopeTagWinsOverDeclaredKind) {
    auto event = decode_event(parse_json(test::item_listed_json()), "item_sold");
    ASSERT_TRUE(event.has_value());
    EXPECT_TRUE(std::holds_alternative<ItemListed>(event->payload));
}

TEST(EventDecoderTest, FallsBackToTypeThenDeclaredKind) {
    Json::Value envelope = parse_json(test::item_listed_json());
    envelope.removeMember("event_type");
    envelope["type"] = "item_listed";
    auto by_type = decode_event(envelope, "whatever");
    ASSERT_TRUE(by_type.has_value());
    EXPECT_TRUE(std::holds_alternative<ItemListed>(by_type->payload));

    envelope.removeMember("type");
    auto by_declared = decode_event(envelope, "item_listed");
    ASSERT_TRUE(by_declared.has_value());
    EXPECT_TRUE(std::holds_alternative<ItemListed>(by_declared->payload));
}

TEST(EventDecoderTest, BodyFallsBackToEnvelope) {
    Json::Value envelope = parse_json(test::item_listed_json());
    Json::Value flat = envelope["payload"];
    flat["event_type"] = "item_listed";
    flat["sent_at"] = "2022-10-27T14:16:44.137Z";

    auto event = decode_event(flat, "item_listed");
    ASSERT_TRUE(event.has_value());
    EXPECT_TRUE(std::holds_alternative<ItemListed>(event->payload));
}

TEST(EventDecoderTest, UnknownKindIsUnrecognized) {
    Json::Value envelope(Json::objectValue);
    envelope["event_type"] = "collection_offer";
    envelope["sent_at"] = "2022-10-27T14:16:44.137Z";
    envelope["payload"]["price"] = "1";

    auto event = decode_event(envelope, "collection_offer");
    ASSERT_TRUE(event.has_value());

    const auto* unknown = std::get_if<Unrecognized>(&event->payload);
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(unknown->event_type, "collection_offer");
    EXPECT_EQ(unknown->raw["payload"]["price"].asString(), "1");
    EXPECT_FALSE(event_of(event->payload).has_value());
}

TEST(EventDecoderTest, AbsentOrNonObjectPayload) {
    EXPECT_FALSE(decode_event(std::nullopt, "item_listed").has_value());
    EXPECT_FALSE(decode_event(Json::Value("text"), "item_listed").has_value());
    EXPECT_FALSE(decode_event(Json::Value(Json::arrayValue), "item_listed").has_value());
}

TEST(EventDecoderTest, MalformedKnownKindIsRejected) {
    Json::Value envelope = parse_json(test::item_listed_json());
    envelope["payload"]["quantity"] = "one";
    EXPECT_FALSE(decode_event(envelope, "item_listed").has_value());

    envelope = parse_json(test::item_listed_json());
    envelope["payload"].removeMember("maker");
    EXPECT_FALSE(decode_event(envelope, "item_listed").has_value());

    envelope = parse_json(test::item_listed_json());
    envelope["payload"]["base_price"] = "-5";
    EXPECT_FALSE(decode_event(envelope, "item_listed").has_value());

    envelope = parse_json(test::item_listed_json());
    envelope["payload"]["item"]["nft_id"] = "ethereum";
    EXPECT_FALSE(decode_event(envelope, "item_listed").has_value());
}

TEST(EventDecoderTest, UnknownChainStillDecodes) {
    Json::Value envelope = parse_json(test::item_listed_json());
    envelope["payload"]["item"]["chain"]["name"] = "arbitrum";

    auto event = decode_event(envelope, "item_listed");
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(std::get<ItemListed>(event->payload).context.item.chain, Chain::Unknown);
}

TEST(EventDecoderTest, DecodesTransferAndMetadataUpdate) {
    Json::Value transfer = parse_json(R"({"event_type":"item_transferred","sent_at":"t","payload":{)" +
                                      test::context_json() + R"(,
        "event_timestamp":"2022-10-27T14:16:43+00:00",
        "transaction":{"hash":"0x1","timestamp":"2022-10-27T14:16:43+00:00"},
        "from_account":{"address":"0xfrom"},
        "to_account":{"address":"0xto"},
        "quantity":2}})");
    auto moved = decode_event(transfer, "item_transferred");
    ASSERT_TRUE(moved.has_value());
    const auto& data = std::get<ItemTransferred>(moved->payload);
    EXPECT_EQ(data.from_account, "0xfrom");
    EXPECT_EQ(data.to_account, "0xto");
    EXPECT_EQ(data.quantity, 2u);

    Json::Value update = parse_json(R"({"event_type":"item_metadata_updated","sent_at":"t","payload":{)" +
                                    test::context_json() + R"(,
        "name":"Renamed",
        "traits":[{"trait_type":"Hat","value":"Cap"}]}})");
    auto updated = decode_event(update, "item_metadata_updated");
    ASSERT_TRUE(updated.has_value());
    const auto& meta = std::get<ItemMetadataUpdated>(updated->payload);
    EXPECT_EQ(meta.name, "Renamed");
    EXPECT_FALSE(meta.background_color.has_value());
    ASSERT_EQ(meta.traits.size(), 1u);
    EXPECT_EQ(meta.traits[0]["value"].asString(), "Cap");
}

TEST(EventDecoderTest, DecodesOfferWithNumericPrice) {
    Json::Value offer = parse_json(R"({"event_type":"item_received_offer","sent_at":"t","payload":{)" +
                                   test::context_json() + "," + test::payment_token_json() + R"(,
        "event_timestamp":"2022-10-27T14:16:43+00:00",
        "base_price":5000,
        "created_date":"2022-10-27T14:16:43+00:00",
        "expiration_date":"2022-10-28T14:16:43+00:00",
        "maker":{"address":"0xmaker"},
        "quantity":1,
        "taker":{"address":"0xtaker"}}})");
    auto event = decode_event(offer, "item_received_offer");
    ASSERT_TRUE(event.has_value());
    const auto& data = std::get<ItemReceivedOffer>(event->payload);
    EXPECT_EQ(data.base_price, "5000");
    EXPECT_EQ(data.taker, "0xtaker");
}

TEST(EventDecoderTest, DecodeMessageUsesFrameEvent) {
    Json::Value envelope = parse_json(test::item_listed_json());
    envelope.removeMember("event_type");

    Message message;
    message.topic = "collection:wandernauts";
    message.event = "item_listed";
    message.payload = envelope;

    auto event = decode_message(message);
    ASSERT_TRUE(event.has_value());
    EXPECT_TRUE(std::holds_alternative<ItemListed>(event->payload));
}
