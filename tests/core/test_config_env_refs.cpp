#include <catch2/catch_test_macros.hpp>

#include "bedrockkit/core/config.hpp"

#include <cstdlib>

using namespace bedrockkit;

TEST_CASE("Config ${VAR} resolution", "[core][config]") {
    SECTION("Resolves existing env var") {
        setenv("TEST_BEDROCKKIT_VAR", "hello_world", 1);
        auto result = resolve_env_refs("prefix_${TEST_BEDROCKKIT_VAR}_suffix");
        CHECK(result == "prefix_hello_world_suffix");
    }

    SECTION("Preserves unresolved vars") {
        auto result = resolve_env_refs("value=${NONEXISTENT_VAR_12345}");
        CHECK(result == "value=${NONEXISTENT_VAR_12345}");
    }

    SECTION("Handles multiple refs") {
        setenv("TEST_A", "aaa", 1);
        setenv("TEST_B", "bbb", 1);
        auto result = resolve_env_refs("${TEST_A}:${TEST_B}");
        CHECK(result == "aaa:bbb");
    }

    SECTION("No refs returns input unchanged") {
        CHECK(resolve_env_refs("no refs here") == "no refs here");
    }

    SECTION("Empty input") {
        CHECK(resolve_env_refs("").empty());
    }
}

TEST_CASE("Config $${VAR} escaping", "[core][config]") {
    SECTION("Double dollar escapes to literal") {
        CHECK(resolve_env_refs("value=$${LITERAL}") == "value=${LITERAL}");
    }

    SECTION("Mixed escaping and resolution") {
        setenv("TEST_REAL", "resolved", 1);
        auto result = resolve_env_refs("$${ESCAPED} and ${TEST_REAL}");
        CHECK(result == "${ESCAPED} and resolved");
    }
}

TEST_CASE("resolve_env_refs_in walks nested JSON", "[core][config]") {
    setenv("TEST_NESTED_REGION", "eu-north-1", 1);

    json j = {
        {"aws", {{"region", "${TEST_NESTED_REGION}"}, {"timeout_seconds", 30}}},
        {"list", {"${TEST_NESTED_REGION}", "plain"}},
    };
    resolve_env_refs_in(j);

    CHECK(j["aws"]["region"] == "eu-north-1");
    CHECK(j["aws"]["timeout_seconds"] == 30);
    CHECK(j["list"][0] == "eu-north-1");
    CHECK(j["list"][1] == "plain");
}
