#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "bedrockkit/core/types.hpp"

namespace bedrockkit {

/// One AI21-style repetition penalty. Replaced as a whole when overridden.
struct PenaltyConfig {
    double scale = 0;
    bool apply_to_whitespaces = false;
    bool apply_to_punctuations = false;
    bool apply_to_numbers = false;
    bool apply_to_stopwords = false;
    bool apply_to_emojis = false;

    auto operator==(const PenaltyConfig&) const -> bool = default;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(PenaltyConfig, scale, apply_to_whitespaces, apply_to_punctuations, apply_to_numbers, apply_to_stopwords, apply_to_emojis)

/// Credentials and transport settings for the Bedrock Runtime endpoint.
struct AwsConfig {
    std::string region = "us-east-1";
    std::string access_key_id;
    std::string secret_access_key;
    std::optional<std::string> session_token;
    std::optional<std::string> endpoint;  // default: https://bedrock-runtime.{region}.amazonaws.com
    int timeout_seconds = 120;
    bool verify_ssl = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AwsConfig, region, access_key_id, secret_access_key, session_token, endpoint, timeout_seconds, verify_ssl)

/// Instance-level generation defaults, fixed when a client is constructed.
struct GenerationDefaults {
    std::string completion_model = "anthropic.claude-v2";
    std::string chat_completion_model = "anthropic.claude-3-sonnet-20240229-v1:0";
    std::string embedding_model = "amazon.titan-embed-text-v1";
    int max_tokens_to_sample = 300;
    double temperature = 1;
    int top_k = 250;
    double top_p = 0.999;
    std::vector<std::string> stop_sequences = {"\n\nHuman:"};
    std::string anthropic_version = "bedrock-2023-05-31";
    PenaltyConfig count_penalty;
    PenaltyConfig presence_penalty;
    PenaltyConfig frequency_penalty;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(GenerationDefaults, completion_model, chat_completion_model, embedding_model, max_tokens_to_sample, temperature, top_k, top_p, stop_sequences, anthropic_version, count_penalty, presence_penalty, frequency_penalty)

struct Config {
    AwsConfig aws;
    GenerationDefaults defaults;
    std::string log_level = "info";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, aws, defaults, log_level)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

/// Applies resolve_env_refs to every string value of a JSON document.
void resolve_env_refs_in(json& j);

} // namespace bedrockkit
