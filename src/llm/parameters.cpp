#include "bedrockkit/llm/parameters.hpp"

#include "bedrockkit/core/logger.hpp"

namespace bedrockkit::llm {

auto merge_parameters(const GenerationDefaults& defaults,
                      const CompletionOverrides& overrides) -> CompletionParameters {
    CompletionParameters params;
    params.max_tokens_to_sample = overrides.max_tokens_to_sample.value_or(defaults.max_tokens_to_sample);
    params.temperature = overrides.temperature.value_or(defaults.temperature);
    params.top_k = overrides.top_k.value_or(defaults.top_k);
    params.top_p = overrides.top_p.value_or(defaults.top_p);
    params.stop_sequences = overrides.stop_sequences.value_or(defaults.stop_sequences);
    params.anthropic_version = overrides.anthropic_version.value_or(defaults.anthropic_version);
    params.count_penalty = overrides.count_penalty.value_or(defaults.count_penalty);
    params.presence_penalty = overrides.presence_penalty.value_or(defaults.presence_penalty);
    params.frequency_penalty = overrides.frequency_penalty.value_or(defaults.frequency_penalty);
    return params;
}

auto merge_parameters(const GenerationDefaults& defaults,
                      const ChatRequest& request) -> ChatParameters {
    ChatParameters params;
    params.model = request.model.value_or(defaults.chat_completion_model);
    params.messages = request.messages;
    params.system = request.system;
    params.max_tokens = request.max_tokens.value_or(defaults.max_tokens_to_sample);
    params.temperature = request.temperature;
    params.top_p = request.top_p;
    params.top_k = request.top_k;
    params.stop_sequences = request.stop_sequences.has_value() ? request.stop_sequences
                                                               : request.stop;
    params.metadata = request.metadata;
    params.tools = request.tools;
    params.tool_choice = request.tool_choice;
    params.anthropic_version = request.anthropic_version.value_or(defaults.anthropic_version);

    if (request.n.has_value() || request.user.has_value()) {
        LOG_DEBUG("Chat: dropping parameters not accepted by the Messages API (n, user)");
    }
    return params;
}

} // namespace bedrockkit::llm
