#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "bedrockkit/core/config.hpp"
#include "bedrockkit/core/types.hpp"

namespace bedrockkit::llm {

/// Per-call overrides for a single-shot completion. Unset fields fall back
/// to the client's GenerationDefaults.
struct CompletionOverrides {
    std::optional<int> max_tokens_to_sample;
    std::optional<double> temperature;
    std::optional<int> top_k;
    std::optional<double> top_p;
    std::optional<std::vector<std::string>> stop_sequences;
    std::optional<std::string> anthropic_version;
    std::optional<PenaltyConfig> count_penalty;
    std::optional<PenaltyConfig> presence_penalty;
    std::optional<PenaltyConfig> frequency_penalty;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(CompletionOverrides, max_tokens_to_sample, temperature, top_k, top_p, stop_sequences, anthropic_version, count_penalty, presence_penalty, frequency_penalty)

/// Fully resolved completion parameters for one call.
struct CompletionParameters {
    int max_tokens_to_sample = 0;
    double temperature = 0;
    int top_k = 0;
    double top_p = 0;
    std::vector<std::string> stop_sequences;
    std::string anthropic_version;
    PenaltyConfig count_penalty;
    PenaltyConfig presence_penalty;
    PenaltyConfig frequency_penalty;

    auto operator==(const CompletionParameters&) const -> bool = default;
};

/// Unified chat request. `stop` is an alias of `stop_sequences`; `n` and
/// `user` are accepted for compatibility and never sent.
struct ChatRequest {
    json messages = json::array();
    std::optional<std::string> model;
    std::optional<std::string> system;
    std::optional<int> max_tokens;
    std::optional<double> temperature;
    std::optional<double> top_p;
    std::optional<int> top_k;
    std::optional<std::vector<std::string>> stop;
    std::optional<std::vector<std::string>> stop_sequences;
    std::optional<json> metadata;
    std::optional<json> tools;
    std::optional<json> tool_choice;
    std::optional<std::string> anthropic_version;
    std::optional<int> n;
    std::optional<std::string> user;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ChatRequest, messages, model, system, max_tokens, temperature, top_p, top_k, stop, stop_sequences, metadata, tools, tool_choice, anthropic_version, n, user)

/// Resolved chat parameters for one call. `model` selects the invoked
/// model and is not part of the wire body.
struct ChatParameters {
    std::string model;
    json messages = json::array();
    std::optional<std::string> system;
    int max_tokens = 0;
    std::optional<double> temperature;
    std::optional<double> top_p;
    std::optional<int> top_k;
    std::optional<std::vector<std::string>> stop_sequences;
    std::optional<json> metadata;
    std::optional<json> tools;
    std::optional<json> tool_choice;
    std::string anthropic_version;
};

/// Merges defaults with overrides; set override fields win, penalty
/// objects are taken whole.
auto merge_parameters(const GenerationDefaults& defaults,
                      const CompletionOverrides& overrides) -> CompletionParameters;

/// Resolves a chat request against the defaults: model falls back to
/// chat_completion_model, max_tokens to max_tokens_to_sample, and
/// stop_sequences to `stop` when only the alias is given.
auto merge_parameters(const GenerationDefaults& defaults,
                      const ChatRequest& request) -> ChatParameters;

} // namespace bedrockkit::llm
