/*
===============================================================================
 protocol::pusher::Codec — Unit Tests
===============================================================================

Scope:
------
Wire encoding of subscribe requests and classification of inbound frames,
independently of any session or transport.

Covered Requirements:
---------------------
P1. Equals filter encoding
P2. In-set filter encoding (order preserved, values escaped)
P3. Optional app key field and custom schema tokens
P4. Pong encodings
P5. Control frame classification (handshake, ack, rejections, pings)
P6. Acks for another channel are not ours; acks without channel are
P7. Channel data and its timestamp lookup order
P8. Invalid JSON and foreign events
P9. URL path template expansion
===============================================================================
*/

#include <iostream>
#include <string>
#include <vector>

#include "simdjson.h"

#include "wireload/core/protocol/pusher/codec.hpp"
#include "common/json_helpers.hpp"
#include "common/test_check.hpp"

using namespace wireload::core::protocol;

static const std::string CHANNEL = "trident_filter_tokens_v1";


namespace {

// Round-trips the encoded request through a JSON parser
simdjson::dom::element parse(simdjson::dom::parser& parser, const std::string& text) {
    simdjson::dom::element doc;
    TEST_CHECK(!parser.parse(text).get(doc));
    return doc;
}

} // namespace


// -----------------------------------------------------------------------------
// P1. Equals
// -----------------------------------------------------------------------------
void test_encode_equals() {
    std::cout << "[TEST] P1: equals filter encoding\n";

    const pusher::Schema schema;
    const pusher::Codec codec(schema, CHANNEL);

    SubscriptionFilter filter{ComparisonMode::Equals, {"0xabc"}};
    const std::string out = codec.encode_subscribe({"app", CHANNEL, filter});

    TEST_CHECK(out == R"({"event":"pusher:subscribe","data":{"channel":"trident_filter_tokens_v1","filter":{"key":"token_address","cmp":"eq","val":"0xabc"}}})");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P2. In-set
// -----------------------------------------------------------------------------
void test_encode_in_set() {
    std::cout << "[TEST] P2: in-set filter encoding\n";

    const pusher::Schema schema;
    const pusher::Codec codec(schema, CHANNEL);

    SubscriptionFilter filter{ComparisonMode::InSet, {"0x01", "0x02", "we\"ird"}};
    const std::string out = codec.encode_subscribe({"app", CHANNEL, filter});

    simdjson::dom::parser parser;
    auto doc = parse(parser, out);

    std::string_view cmp;
    TEST_CHECK(!doc["data"]["filter"]["cmp"].get(cmp));
    TEST_CHECK(cmp == "in");

    simdjson::dom::array vals;
    TEST_CHECK(!doc["data"]["filter"]["vals"].get(vals));
    std::vector<std::string> decoded;
    for (auto v : vals) {
        std::string_view sv;
        TEST_CHECK(!v.get(sv));
        decoded.emplace_back(sv);
    }
    TEST_CHECK(decoded == filter.values);

    simdjson::dom::element val;
    TEST_CHECK(doc["data"]["filter"]["val"].get(val) != simdjson::SUCCESS);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P3. Schema customization
// -----------------------------------------------------------------------------
void test_encode_custom_schema() {
    std::cout << "[TEST] P3: custom schema\n";

    pusher::Schema schema;
    schema.app_key_field = "app_key";
    schema.filter_key = "mint";
    schema.equals_token = "==";

    const pusher::Codec codec(schema, "custom");
    SubscriptionFilter filter{ComparisonMode::Equals, {"So111"}};
    const std::string out = codec.encode_subscribe({"secret-key", "custom", filter});

    simdjson::dom::parser parser;
    auto doc = parse(parser, out);

    std::string_view sv;
    TEST_CHECK(!doc["data"]["app_key"].get(sv));
    TEST_CHECK(sv == "secret-key");
    TEST_CHECK(!doc["data"]["filter"]["key"].get(sv));
    TEST_CHECK(sv == "mint");
    TEST_CHECK(!doc["data"]["filter"]["cmp"].get(sv));
    TEST_CHECK(sv == "==");
    TEST_CHECK(!doc["data"]["channel"].get(sv));
    TEST_CHECK(sv == "custom");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P4. Pongs
// -----------------------------------------------------------------------------
void test_encode_pongs() {
    std::cout << "[TEST] P4: pong encodings\n";

    const pusher::Schema schema;
    const pusher::Codec codec(schema, CHANNEL);

    TEST_CHECK(codec.encode_pong() == R"({"event":"pusher:pong","data":{}})");
    TEST_CHECK(codec.encode_raw_pong() == "pong");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P5. Control frames
// -----------------------------------------------------------------------------
void test_decode_control() {
    std::cout << "[TEST] P5: control frame classification\n";

    const pusher::Schema schema;
    pusher::Codec codec(schema, CHANNEL);

    TEST_CHECK(codec.decode(json::pusher::connection_established()).kind == Inbound::Kind::Handshake);
    TEST_CHECK(codec.decode(json::pusher::subscription_succeeded(CHANNEL)).kind == Inbound::Kind::SubscribeAck);
    TEST_CHECK(codec.decode(json::pusher::error()).kind == Inbound::Kind::SubscribeRejected);
    TEST_CHECK(codec.decode(json::pusher::subscription_error(CHANNEL)).kind == Inbound::Kind::SubscribeRejected);
    TEST_CHECK(codec.decode(json::pusher::ping()).kind == Inbound::Kind::Ping);
    TEST_CHECK(codec.decode("ping").kind == Inbound::Kind::RawPing);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P6. Ack channel matching
// -----------------------------------------------------------------------------
void test_decode_ack_channel() {
    std::cout << "[TEST] P6: ack channel matching\n";

    const pusher::Schema schema;
    pusher::Codec codec(schema, CHANNEL);

    TEST_CHECK(codec.decode(json::pusher::subscription_succeeded("other_channel")).kind == Inbound::Kind::Ignored);
    TEST_CHECK(codec.decode(json::pusher::subscription_succeeded_no_channel()).kind == Inbound::Kind::SubscribeAck);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P7. Channel data
// -----------------------------------------------------------------------------
void test_decode_channel_data() {
    std::cout << "[TEST] P7: channel data and timestamps\n";

    const pusher::Schema schema;
    pusher::Codec codec(schema, CHANNEL);
    const std::uint64_t ts = 1700000000123ULL;

    auto in = codec.decode(json::pusher::data_with_timestamp(CHANNEL, ts));
    TEST_CHECK(in.kind == Inbound::Kind::ChannelData);
    TEST_CHECK(in.timestamp_ms.has());
    TEST_CHECK(in.timestamp_ms.value() == ts);

    in = codec.decode(json::pusher::data_with_string_timestamp(CHANNEL, ts));
    TEST_CHECK(in.timestamp_ms.has() && in.timestamp_ms.value() == ts);

    in = codec.decode(json::pusher::data_with_root_tags(CHANNEL, ts));
    TEST_CHECK(in.timestamp_ms.has() && in.timestamp_ms.value() == ts);

    in = codec.decode(json::pusher::data_with_data_tags(CHANNEL, ts));
    TEST_CHECK(in.timestamp_ms.has() && in.timestamp_ms.value() == ts);

    // Root tags win over data.timestamp
    in = codec.decode(R"({"event":"e","channel":")" + CHANNEL +
                      R"(","tags":{"timestamp":111},"data":{"timestamp":222}})");
    TEST_CHECK(in.timestamp_ms.has() && in.timestamp_ms.value() == 111);

    in = codec.decode(json::pusher::data_without_timestamp(CHANNEL));
    TEST_CHECK(in.kind == Inbound::Kind::ChannelData);
    TEST_CHECK(!in.timestamp_ms.has());

    // Non-numeric timestamp is no timestamp
    in = codec.decode(R"({"event":"e","channel":")" + CHANNEL + R"(","data":{"timestamp":"soon"}})");
    TEST_CHECK(in.kind == Inbound::Kind::ChannelData);
    TEST_CHECK(!in.timestamp_ms.has());

    // Data for another channel
    in = codec.decode(json::pusher::data_with_timestamp("other_channel", ts));
    TEST_CHECK(in.kind == Inbound::Kind::Ignored);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P8. Garbage
// -----------------------------------------------------------------------------
void test_decode_invalid() {
    std::cout << "[TEST] P8: invalid and foreign frames\n";

    const pusher::Schema schema;
    pusher::Codec codec(schema, CHANNEL);

    TEST_CHECK(codec.decode("{not json").kind == Inbound::Kind::InvalidJson);
    TEST_CHECK(codec.decode("").kind == Inbound::Kind::InvalidJson);
    TEST_CHECK(codec.decode("[1,2,3]").kind == Inbound::Kind::Ignored);
    TEST_CHECK(codec.decode(R"({"data":{}})").kind == Inbound::Kind::Ignored);
    TEST_CHECK(codec.decode(R"({"event":"unrelated"})").kind == Inbound::Kind::Ignored);

    // The parser is reused: a valid frame after garbage still decodes
    TEST_CHECK(codec.decode(json::pusher::ping()).kind == Inbound::Kind::Ping);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P9. Path template
// -----------------------------------------------------------------------------
void test_path_template() {
    std::cout << "[TEST] P9: URL path template\n";

    pusher::Schema schema;
    TEST_CHECK(schema.path("knife-library-likely") == "/app/knife-library-likely");

    schema.path_template = "ws/{app_key}/stream";
    TEST_CHECK(schema.path("k") == "/ws/k/stream");

    schema.path_template = "/fixed";
    TEST_CHECK(schema.path("k") == "/fixed");

    std::cout << "[TEST] OK\n";
}


#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Info);

    test_encode_equals();
    test_encode_in_set();
    test_encode_custom_schema();
    test_encode_pongs();
    test_decode_control();
    test_decode_ack_channel();
    test_decode_channel_data();
    test_decode_invalid();
    test_path_template();

    std::cout << "\n[PUSHER CODEC TESTS PASSED]\n";
    return 0;
}
