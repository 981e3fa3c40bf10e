#include <catch2/catch_test_macros.hpp>

#include "bedrockkit/llm/capabilities.hpp"

using namespace bedrockkit;
using namespace bedrockkit::llm;

TEST_CASE("Capability table", "[llm][capabilities]") {
    SECTION("completion") {
        CHECK(supports(Operation::Completion, Provider::Anthropic));
        CHECK(supports(Operation::Completion, Provider::Cohere));
        CHECK(supports(Operation::Completion, Provider::AI21));
        CHECK_FALSE(supports(Operation::Completion, Provider::Amazon));
    }

    SECTION("chat") {
        CHECK(supports(Operation::Chat, Provider::Anthropic));
        CHECK_FALSE(supports(Operation::Chat, Provider::Cohere));
        CHECK_FALSE(supports(Operation::Chat, Provider::AI21));
        CHECK_FALSE(supports(Operation::Chat, Provider::Amazon));
    }

    SECTION("embedding") {
        CHECK(supports(Operation::Embedding, Provider::Amazon));
        CHECK_FALSE(supports(Operation::Embedding, Provider::Anthropic));
    }

    SECTION("supported_providers keeps declaration order") {
        auto providers = supported_providers(Operation::Completion);
        REQUIRE(providers.size() == 3);
        CHECK(providers[0] == Provider::Anthropic);
        CHECK(providers[1] == Provider::Cohere);
        CHECK(providers[2] == Provider::AI21);
    }
}

TEST_CASE("Provider derivation from model ids", "[llm][capabilities]") {
    CHECK(model_namespace("anthropic.claude-v2") == "anthropic");
    CHECK(model_namespace("no-dot") == "no-dot");
    CHECK(model_namespace("") == "");

    CHECK(provider_for_model("anthropic.claude-v2") == Provider::Anthropic);
    CHECK(provider_for_model("cohere.command-text-v14") == Provider::Cohere);
    CHECK(provider_for_model("ai21.j2-ultra-v1") == Provider::AI21);
    CHECK(provider_for_model("amazon.titan-embed-text-v1") == Provider::Amazon);
    CHECK_FALSE(provider_for_model("meta.llama3-8b-instruct-v1:0").has_value());

    CHECK(parse_provider("AI21") == Provider::AI21);
    CHECK_FALSE(parse_provider("mistral").has_value());

    CHECK(to_string(Provider::AI21) == "ai21");
    CHECK(to_string(Operation::Embedding) == "embedding");
}

TEST_CASE("Chat-only model families", "[llm][capabilities]") {
    CHECK(is_chat_only_model("anthropic.claude-3-sonnet-20240229-v1:0"));
    CHECK(is_chat_only_model("anthropic.claude-3-5-haiku-20241022-v1:0"));
    CHECK(is_chat_only_model("anthropic.claude-sonnet-4-20250514-v1:0"));
    CHECK_FALSE(is_chat_only_model("anthropic.claude-v2"));
    CHECK_FALSE(is_chat_only_model("anthropic.claude-instant-v1"));
    CHECK_FALSE(is_chat_only_model("cohere.command-text-v14"));
}

TEST_CASE("require_support", "[llm][capabilities]") {
    SECTION("supported combination yields the provider") {
        auto provider = require_support(Operation::Chat, "anthropic.claude-3-haiku-20240307-v1:0");
        REQUIRE(provider.has_value());
        CHECK(*provider == Provider::Anthropic);
    }

    SECTION("unsupported operation") {
        auto provider = require_support(Operation::Chat, "cohere.command-text-v14");
        REQUIRE_FALSE(provider.has_value());
        CHECK(provider.error().code() == ErrorCode::UnsupportedProvider);
        CHECK(provider.error().message() == "chat provider cohere is not supported");
        CHECK(provider.error().detail() == "cohere.command-text-v14");
    }

    SECTION("unknown namespace") {
        auto provider = require_support(Operation::Completion, "meta.llama3-8b-instruct-v1:0");
        REQUIRE_FALSE(provider.has_value());
        CHECK(provider.error().code() == ErrorCode::UnsupportedProvider);
    }
}
