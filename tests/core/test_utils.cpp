#include <catch2/catch_test_macros.hpp>

#include "bedrockkit/core/utils.hpp"

TEST_CASE("trim removes whitespace", "[utils]") {
    SECTION("leading and trailing spaces") {
        REQUIRE(bedrockkit::utils::trim("  hello  ") == "hello");
    }

    SECTION("leading and trailing tabs and newlines") {
        REQUIRE(bedrockkit::utils::trim("\t\nhello\r\n") == "hello");
    }

    SECTION("empty string") {
        REQUIRE(bedrockkit::utils::trim("") == "");
    }

    SECTION("only whitespace") {
        REQUIRE(bedrockkit::utils::trim("   \t\n  ") == "");
    }

    SECTION("internal whitespace preserved") {
        REQUIRE(bedrockkit::utils::trim("  hello world  ") == "hello world");
    }
}

TEST_CASE("split divides string by delimiter", "[utils]") {
    SECTION("basic split") {
        auto parts = bedrockkit::utils::split("/model/x/invoke", '/');
        REQUIRE(parts.size() == 4);
        CHECK(parts[0] == "");
        CHECK(parts[1] == "model");
        CHECK(parts[3] == "invoke");
    }

    SECTION("trailing delimiter") {
        auto parts = bedrockkit::utils::split("a,b,", ',');
        REQUIRE(parts.size() == 2);
    }

    SECTION("empty string") {
        CHECK(bedrockkit::utils::split("", ',').empty());
    }

    SECTION("consecutive delimiters") {
        auto parts = bedrockkit::utils::split("a,,b", ',');
        REQUIRE(parts.size() == 3);
        CHECK(parts[1] == "");
    }
}

TEST_CASE("to_lower", "[utils]") {
    CHECK(bedrockkit::utils::to_lower("X-Amz-Date") == "x-amz-date");
    CHECK(bedrockkit::utils::to_lower("") == "");
}

TEST_CASE("base64 encode and decode", "[utils]") {
    SECTION("known encodings") {
        CHECK(bedrockkit::utils::base64_encode("Man") == "TWFu");
        CHECK(bedrockkit::utils::base64_encode("Ma") == "TWE=");
        CHECK(bedrockkit::utils::base64_encode("M") == "TQ==");
        CHECK(bedrockkit::utils::base64_encode("") == "");
    }

    SECTION("decode of a stream chunk payload") {
        auto decoded = bedrockkit::utils::base64_decode("eyJ0eXBlIjoicGluZyJ9");
        CHECK(decoded == R"({"type":"ping"})");
    }
}

TEST_CASE("hex_encode", "[utils]") {
    CHECK(bedrockkit::utils::hex_encode(std::string("\x00\x0f\xab", 3)) == "000fab");
}

TEST_CASE("sha256 returns lowercase hex digests", "[utils]") {
    CHECK(bedrockkit::utils::sha256("") ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(bedrockkit::utils::sha256("abc") ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("hmac_sha256 matches RFC 4231 test case 2", "[utils]") {
    auto mac = bedrockkit::utils::hmac_sha256("Jefe", "what do ya want for nothing?");
    CHECK(bedrockkit::utils::hex_encode(mac) ==
          "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_CASE("url_encode keeps only unreserved characters", "[utils]") {
    CHECK(bedrockkit::utils::url_encode("abc-._~XYZ019") == "abc-._~XYZ019");
    CHECK(bedrockkit::utils::url_encode("anthropic.claude-3-sonnet-20240229-v1:0") ==
          "anthropic.claude-3-sonnet-20240229-v1%3A0");
    CHECK(bedrockkit::utils::url_encode("a b/c") == "a%20b%2Fc");
}
