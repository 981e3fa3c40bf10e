#include <catch2/catch_test_macros.hpp>

#include "bedrockkit/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        bedrockkit::Error err(bedrockkit::ErrorCode::InvalidRequest, "messages argument is required");
        CHECK(err.code() == bedrockkit::ErrorCode::InvalidRequest);
        CHECK(err.message() == "messages argument is required");
        CHECK(err.detail() == "");
        CHECK(err.what() == "messages argument is required");
    }

    SECTION("error with detail") {
        bedrockkit::Error err(bedrockkit::ErrorCode::UnsupportedModel,
                              "chat only", "anthropic.claude-3-haiku-20240307-v1:0");
        CHECK(err.code() == bedrockkit::ErrorCode::UnsupportedModel);
        CHECK(err.message() == "chat only");
        CHECK(err.detail() == "anthropic.claude-3-haiku-20240307-v1:0");
        CHECK(err.what() == "chat only: anthropic.claude-3-haiku-20240307-v1:0");
    }
}

TEST_CASE("make_error helpers", "[error]") {
    SECTION("two-argument form") {
        auto err = bedrockkit::make_error(bedrockkit::ErrorCode::MalformedStream, "bad frame");
        CHECK(err.code() == bedrockkit::ErrorCode::MalformedStream);
        CHECK(err.message() == "bad frame");
        CHECK(err.detail() == "");
    }

    SECTION("three-argument form") {
        auto err = bedrockkit::make_error(bedrockkit::ErrorCode::Timeout,
                                          "request timed out", "after 120s");
        CHECK(err.code() == bedrockkit::ErrorCode::Timeout);
        CHECK(err.what() == "request timed out: after 120s");
    }
}

TEST_CASE("Result type success case", "[error]") {
    bedrockkit::Result<int> result = 42;

    REQUIRE(result.has_value());
    CHECK(*result == 42);
}

TEST_CASE("Result type error case", "[error]") {
    bedrockkit::Result<int> result = std::unexpected(
        bedrockkit::make_error(bedrockkit::ErrorCode::UnsupportedProvider, "no chat"));

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == bedrockkit::ErrorCode::UnsupportedProvider);
    CHECK(result.error().message() == "no chat");
}

TEST_CASE("VoidResult success and error", "[error]") {
    SECTION("success") {
        auto result = bedrockkit::ok_result();
        REQUIRE(result.has_value());
    }

    SECTION("error via Fail conversion") {
        bedrockkit::VoidResult result =
            bedrockkit::make_fail(bedrockkit::make_error(bedrockkit::ErrorCode::ConnectionClosed, "aborted"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == bedrockkit::ErrorCode::ConnectionClosed);
    }
}

TEST_CASE("ErrorCode names are stable", "[error]") {
    auto to_int = [](bedrockkit::ErrorCode c) { return static_cast<int>(c); };

    CHECK(to_int(bedrockkit::ErrorCode::Unknown) == 1);
    CHECK(to_int(bedrockkit::ErrorCode::InvalidRequest) == 3);
    CHECK(to_int(bedrockkit::ErrorCode::InternalError) == 12);

    CHECK(bedrockkit::error_code_to_string(bedrockkit::ErrorCode::UnsupportedProvider) == "UNSUPPORTED_PROVIDER");
    CHECK(bedrockkit::error_code_to_string(bedrockkit::ErrorCode::UnsupportedModel) == "UNSUPPORTED_MODEL");
    CHECK(bedrockkit::error_code_to_string(bedrockkit::ErrorCode::InvalidRequest) == "INVALID_REQUEST");
    CHECK(bedrockkit::error_code_to_string(bedrockkit::ErrorCode::MalformedStream) == "MALFORMED_STREAM");
}
