#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "bedrockkit/core/config.hpp"

TEST_CASE("default_config returns sane defaults", "[config]") {
    auto cfg = bedrockkit::default_config();

    SECTION("aws defaults") {
        CHECK(cfg.aws.region == "us-east-1");
        CHECK(cfg.aws.access_key_id.empty());
        CHECK_FALSE(cfg.aws.session_token.has_value());
        CHECK_FALSE(cfg.aws.endpoint.has_value());
        CHECK(cfg.aws.timeout_seconds == 120);
        CHECK(cfg.aws.verify_ssl == true);
    }

    SECTION("generation defaults") {
        CHECK(cfg.defaults.completion_model == "anthropic.claude-v2");
        CHECK(cfg.defaults.chat_completion_model == "anthropic.claude-3-sonnet-20240229-v1:0");
        CHECK(cfg.defaults.embedding_model == "amazon.titan-embed-text-v1");
        CHECK(cfg.defaults.max_tokens_to_sample == 300);
        CHECK(cfg.defaults.temperature == 1);
        CHECK(cfg.defaults.top_k == 250);
        CHECK(cfg.defaults.top_p == 0.999);
        REQUIRE(cfg.defaults.stop_sequences.size() == 1);
        CHECK(cfg.defaults.stop_sequences[0] == "\n\nHuman:");
        CHECK(cfg.defaults.anthropic_version == "bedrock-2023-05-31");
    }

    SECTION("penalties are neutral") {
        CHECK(cfg.defaults.count_penalty == bedrockkit::PenaltyConfig{});
        CHECK(cfg.defaults.presence_penalty.scale == 0);
        CHECK_FALSE(cfg.defaults.frequency_penalty.apply_to_emojis);
    }

    SECTION("log level defaults") {
        CHECK(cfg.log_level == "info");
    }
}

TEST_CASE("load_config parses JSON file correctly", "[config]") {
    namespace fs = std::filesystem;

    auto tmp = fs::temp_directory_path() / "bedrockkit_test_config.json";
    {
        std::ofstream out(tmp);
        out << R"({
            "aws": {
                "region": "eu-west-1",
                "endpoint": "http://localhost:4566"
            },
            "defaults": {
                "completion_model": "cohere.command-text-v14",
                "max_tokens_to_sample": 512,
                "count_penalty": { "scale": 0.5, "apply_to_numbers": true }
            },
            "log_level": "debug"
        })";
    }

    auto cfg = bedrockkit::load_config(tmp);

    CHECK(cfg.aws.region == "eu-west-1");
    REQUIRE(cfg.aws.endpoint.has_value());
    CHECK(*cfg.aws.endpoint == "http://localhost:4566");
    CHECK(cfg.defaults.completion_model == "cohere.command-text-v14");
    CHECK(cfg.defaults.max_tokens_to_sample == 512);
    CHECK(cfg.defaults.count_penalty.scale == 0.5);
    CHECK(cfg.defaults.count_penalty.apply_to_numbers);
    CHECK(cfg.log_level == "debug");
    // Non-specified fields keep defaults
    CHECK(cfg.defaults.top_k == 250);
    CHECK(cfg.aws.timeout_seconds == 120);

    fs::remove(tmp);
}

TEST_CASE("load_config resolves env refs in string values", "[config]") {
    namespace fs = std::filesystem;

    ::setenv("BEDROCKKIT_TEST_SECRET", "s3cr3t", 1);

    auto tmp = fs::temp_directory_path() / "bedrockkit_test_config_env.json";
    {
        std::ofstream out(tmp);
        out << R"({ "aws": { "secret_access_key": "${BEDROCKKIT_TEST_SECRET}" } })";
    }

    auto cfg = bedrockkit::load_config(tmp);
    CHECK(cfg.aws.secret_access_key == "s3cr3t");

    fs::remove(tmp);
    ::unsetenv("BEDROCKKIT_TEST_SECRET");
}

TEST_CASE("load_config returns defaults for missing or broken file", "[config]") {
    namespace fs = std::filesystem;

    SECTION("missing file") {
        auto cfg = bedrockkit::load_config("/nonexistent/path/config.json");
        CHECK(cfg.aws.region == "us-east-1");
        CHECK(cfg.log_level == "info");
    }

    SECTION("invalid JSON") {
        auto tmp = fs::temp_directory_path() / "bedrockkit_test_config_bad.json";
        {
            std::ofstream out(tmp);
            out << "{ not json";
        }
        auto cfg = bedrockkit::load_config(tmp);
        CHECK(cfg.defaults.completion_model == "anthropic.claude-v2");
        fs::remove(tmp);
    }
}

TEST_CASE("load_config_from_env reads environment variables", "[config]") {
    ::setenv("AWS_REGION", "ap-southeast-2", 1);
    ::setenv("AWS_ACCESS_KEY_ID", "AKIDTEST", 1);
    ::setenv("AWS_SECRET_ACCESS_KEY", "secret", 1);
    ::setenv("AWS_SESSION_TOKEN", "token", 1);
    ::setenv("BEDROCKKIT_LOG_LEVEL", "trace", 1);
    ::setenv("BEDROCKKIT_CHAT_MODEL", "anthropic.claude-3-haiku-20240307-v1:0", 1);

    auto cfg = bedrockkit::load_config_from_env();

    CHECK(cfg.aws.region == "ap-southeast-2");
    CHECK(cfg.aws.access_key_id == "AKIDTEST");
    CHECK(cfg.aws.secret_access_key == "secret");
    REQUIRE(cfg.aws.session_token.has_value());
    CHECK(*cfg.aws.session_token == "token");
    CHECK(cfg.log_level == "trace");
    CHECK(cfg.defaults.chat_completion_model == "anthropic.claude-3-haiku-20240307-v1:0");
    CHECK(cfg.defaults.completion_model == "anthropic.claude-v2");

    ::unsetenv("AWS_REGION");
    ::unsetenv("AWS_ACCESS_KEY_ID");
    ::unsetenv("AWS_SECRET_ACCESS_KEY");
    ::unsetenv("AWS_SESSION_TOKEN");
    ::unsetenv("BEDROCKKIT_LOG_LEVEL");
    ::unsetenv("BEDROCKKIT_CHAT_MODEL");
}

TEST_CASE("AWS_DEFAULT_REGION is used when AWS_REGION is unset", "[config]") {
    ::unsetenv("AWS_REGION");
    ::setenv("AWS_DEFAULT_REGION", "us-west-2", 1);

    auto cfg = bedrockkit::load_config_from_env();
    CHECK(cfg.aws.region == "us-west-2");

    ::unsetenv("AWS_DEFAULT_REGION");
}

TEST_CASE("Config round-trips through JSON", "[config]") {
    bedrockkit::Config cfg;
    cfg.aws.region = "eu-central-1";
    cfg.log_level = "warn";
    cfg.defaults.presence_penalty.scale = 2;

    bedrockkit::json j = cfg;
    auto restored = j.get<bedrockkit::Config>();

    CHECK(restored.aws.region == "eu-central-1");
    CHECK(restored.log_level == "warn");
    CHECK(restored.defaults.presence_penalty.scale == 2);
    // Other fields keep defaults
    CHECK(restored.defaults.top_p == 0.999);
}
