#include <catch2/catch_test_macros.hpp>

#include <string>

#include <boost/crc.hpp>

#include "bedrockkit/aws/event_stream.hpp"

using namespace bedrockkit;
using namespace bedrockkit::aws;

namespace {

auto chunk_frame(const std::string& payload) -> std::string {
    EventStreamMessage message;
    message.headers[":message-type"] = "event";
    message.headers[":event-type"] = "chunk";
    message.headers[":content-type"] = "application/json";
    message.payload = payload;
    return encode_event_stream_message(message);
}

} // anonymous namespace

TEST_CASE("EventStreamDecoder decodes a complete frame", "[aws][eventstream]") {
    EventStreamDecoder decoder;
    auto result = decoder.feed(chunk_frame(R"({"bytes":"e30="})"));

    REQUIRE(result.has_value());
    REQUIRE(result->size() == 1);
    const auto& message = result->front();
    CHECK(message.header(":message-type") == "event");
    CHECK(message.header(":event-type") == "chunk");
    CHECK(message.header(":missing").empty());
    CHECK(message.payload == R"({"bytes":"e30="})");
    CHECK(decoder.buffered() == 0);
}

TEST_CASE("EventStreamDecoder reassembles frames split across reads", "[aws][eventstream]") {
    auto bytes = chunk_frame("first") + chunk_frame("second");

    EventStreamDecoder decoder;
    std::vector<std::string> payloads;
    for (char c : bytes) {
        auto result = decoder.feed(std::string_view(&c, 1));
        REQUIRE(result.has_value());
        for (const auto& message : *result) {
            payloads.push_back(message.payload);
        }
    }

    REQUIRE(payloads.size() == 2);
    CHECK(payloads[0] == "first");
    CHECK(payloads[1] == "second");
    CHECK(decoder.buffered() == 0);
}

TEST_CASE("EventStreamDecoder keeps partial frames buffered", "[aws][eventstream]") {
    auto frame = chunk_frame("partial");

    EventStreamDecoder decoder;
    auto result = decoder.feed(std::string_view(frame).substr(0, frame.size() - 3));
    REQUIRE(result.has_value());
    CHECK(result->empty());
    CHECK(decoder.buffered() == frame.size() - 3);
}

TEST_CASE("EventStreamDecoder rejects corrupted frames", "[aws][eventstream]") {
    SECTION("payload byte flipped") {
        auto frame = chunk_frame("payload");
        frame[frame.size() - 6] ^= 0x01;

        EventStreamDecoder decoder;
        auto result = decoder.feed(frame);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::MalformedStream);
        CHECK(decoder.failed());

        auto again = decoder.feed(chunk_frame("next"));
        REQUIRE_FALSE(again.has_value());
    }

    SECTION("prelude checksum mismatch") {
        auto frame = chunk_frame("payload");
        frame[1] ^= 0x01;

        EventStreamDecoder decoder;
        auto result = decoder.feed(frame);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::MalformedStream);
    }
}

TEST_CASE("EventStreamDecoder parses typed header values", "[aws][eventstream]") {
    // bool true header "flag" and int32 header "count" = -2
    std::string headers;
    headers += static_cast<char>(4);
    headers += "flag";
    headers += static_cast<char>(0);  // bool true
    headers += static_cast<char>(5);
    headers += "count";
    headers += static_cast<char>(4);  // int32
    headers += std::string("\xff\xff\xff\xfe", 4);

    auto be32 = [](uint32_t v) {
        std::string out;
        for (int shift = 24; shift >= 0; shift -= 8) out += static_cast<char>((v >> shift) & 0xFF);
        return out;
    };
    auto crc = [](std::string_view data) {
        boost::crc_32_type c;
        c.process_bytes(data.data(), data.size());
        return c.checksum();
    };

    auto total = static_cast<uint32_t>(EventStreamDecoder::kMinMessageLength + headers.size() + 1);
    std::string frame = be32(total) + be32(static_cast<uint32_t>(headers.size()));
    frame += be32(crc(frame));
    frame += headers;
    frame += "x";
    frame += be32(crc(frame));

    EventStreamDecoder decoder;
    auto result = decoder.feed(frame);
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 1);
    CHECK(result->front().header("flag") == "true");
    CHECK(result->front().header("count") == "-2");
    CHECK(result->front().payload == "x");
}
