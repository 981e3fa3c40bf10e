#include <catch2/catch_test_macros.hpp>

#include "bedrockkit/aws/runtime_client.hpp"
#include "bedrockkit/core/utils.hpp"

using namespace bedrockkit;
using namespace bedrockkit::aws;

TEST_CASE("Endpoint helpers", "[aws][runtime]") {
    CHECK(default_endpoint("us-east-1") == "https://bedrock-runtime.us-east-1.amazonaws.com");
    CHECK(endpoint_host("https://bedrock-runtime.us-east-1.amazonaws.com") ==
          "bedrock-runtime.us-east-1.amazonaws.com");
    CHECK(endpoint_host("http://localhost:4566/prefix") == "localhost:4566");
    CHECK(endpoint_host("example.com") == "example.com");
}

TEST_CASE("model_path percent-encodes the model id", "[aws][runtime]") {
    CHECK(model_path("anthropic.claude-v2", "invoke") == "/model/anthropic.claude-v2/invoke");
    CHECK(model_path("anthropic.claude-3-sonnet-20240229-v1:0", "invoke-with-response-stream") ==
          "/model/anthropic.claude-3-sonnet-20240229-v1%3A0/invoke-with-response-stream");
}

TEST_CASE("unwrap_chunk extracts event JSON", "[aws][runtime]") {
    SECTION("chunk event") {
        EventStreamMessage message;
        message.headers[":message-type"] = "event";
        message.headers[":event-type"] = "chunk";
        message.payload = json{{"bytes", utils::base64_encode(R"({"type":"ping"})")}}.dump();

        auto chunk = unwrap_chunk(message);
        REQUIRE(chunk.has_value());
        REQUIRE(chunk->has_value());
        CHECK(**chunk == R"({"type":"ping"})");
    }

    SECTION("other events carry nothing") {
        EventStreamMessage message;
        message.headers[":message-type"] = "event";
        message.headers[":event-type"] = "initial-response";

        auto chunk = unwrap_chunk(message);
        REQUIRE(chunk.has_value());
        CHECK_FALSE(chunk->has_value());
    }

    SECTION("exception frames become provider errors") {
        EventStreamMessage message;
        message.headers[":message-type"] = "exception";
        message.headers[":exception-type"] = "throttlingException";
        message.payload = R"({"message":"Too many requests"})";

        auto chunk = unwrap_chunk(message);
        REQUIRE_FALSE(chunk.has_value());
        CHECK(chunk.error().code() == ErrorCode::ProviderError);
        CHECK(chunk.error().message() == "Bedrock stream exception throttlingException");
        CHECK(chunk.error().detail() == "Too many requests");
    }

    SECTION("chunk without bytes is malformed") {
        EventStreamMessage message;
        message.headers[":message-type"] = "event";
        message.headers[":event-type"] = "chunk";
        message.payload = "{}";

        auto chunk = unwrap_chunk(message);
        REQUIRE_FALSE(chunk.has_value());
        CHECK(chunk.error().code() == ErrorCode::MalformedStream);
    }
}

TEST_CASE("error_from_response reads the message field", "[aws][runtime]") {
    auto err = error_from_response(400, R"({"message":"Malformed input request"})");
    CHECK(err.code() == ErrorCode::ProviderError);
    CHECK(err.message() == "Bedrock API error (HTTP 400)");
    CHECK(err.detail() == "Malformed input request");

    auto raw = error_from_response(503, "Service Unavailable");
    CHECK(raw.detail() == "Service Unavailable");

    auto capitalised = error_from_response(403, R"({"Message":"Access denied"})");
    CHECK(capitalised.detail() == "Access denied");

    auto mistyped = error_from_response(500, R"({"message":42})");
    CHECK(mistyped.detail() == R"({"message":42})");
}
