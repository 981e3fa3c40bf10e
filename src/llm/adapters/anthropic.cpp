#include "bedrockkit/llm/adapters/anthropic.hpp"

#include <memory>

namespace bedrockkit::llm {

namespace {

constexpr std::string_view kHumanTurn = "\n\nHuman: ";
constexpr std::string_view kAssistantTurn = "\n\nAssistant:";

} // anonymous namespace

auto AnthropicAdapter::wrap_prompt(std::string_view prompt) const -> std::string {
    std::string wrapped;
    wrapped.reserve(kHumanTurn.size() + prompt.size() + kAssistantTurn.size());
    wrapped += kHumanTurn;
    wrapped += prompt;
    wrapped += kAssistantTurn;
    return wrapped;
}

auto AnthropicAdapter::unwrap_prompt(std::string_view wrapped) const -> std::string {
    if (wrapped.starts_with(kHumanTurn) && wrapped.ends_with(kAssistantTurn) &&
        wrapped.size() >= kHumanTurn.size() + kAssistantTurn.size()) {
        wrapped.remove_prefix(kHumanTurn.size());
        wrapped.remove_suffix(kAssistantTurn.size());
    }
    return std::string(wrapped);
}

auto AnthropicAdapter::completion_body(const CompletionParameters& params,
                                       std::string_view prompt) const -> Result<json> {
    json body;
    body["max_tokens_to_sample"] = params.max_tokens_to_sample;
    body["temperature"] = params.temperature;
    body["top_k"] = params.top_k;
    body["top_p"] = params.top_p;
    body["stop_sequences"] = params.stop_sequences;
    body["anthropic_version"] = params.anthropic_version;
    body["prompt"] = wrap_prompt(prompt);
    return body;
}

auto AnthropicAdapter::decode_completion_body(const json& body) const
    -> Result<DecodedCompletion> {
    if (!body.is_object()) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Anthropic completion body is not an object"));
    }
    DecodedCompletion decoded;
    decoded.params.max_tokens_to_sample = read_field<int>(body, "max_tokens_to_sample");
    decoded.params.temperature = read_field<double>(body, "temperature");
    decoded.params.top_k = read_field<int>(body, "top_k");
    decoded.params.top_p = read_field<double>(body, "top_p");
    decoded.params.stop_sequences = read_field<std::vector<std::string>>(body, "stop_sequences");
    decoded.params.anthropic_version = read_field<std::string>(body, "anthropic_version");
    decoded.prompt = unwrap_prompt(read_field<std::string>(body, "prompt").value_or(""));
    return decoded;
}

auto AnthropicAdapter::chat_body(const ChatParameters& params) const -> Result<json> {
    json body;
    body["messages"] = params.messages;
    body["max_tokens"] = params.max_tokens;
    body["anthropic_version"] = params.anthropic_version;

    if (params.system.has_value()) body["system"] = *params.system;
    if (params.temperature.has_value()) body["temperature"] = *params.temperature;
    if (params.top_p.has_value()) body["top_p"] = *params.top_p;
    if (params.top_k.has_value()) body["top_k"] = *params.top_k;
    if (params.stop_sequences.has_value()) body["stop_sequences"] = *params.stop_sequences;
    if (params.metadata.has_value()) body["metadata"] = *params.metadata;
    if (params.tools.has_value()) body["tools"] = *params.tools;
    if (params.tool_choice.has_value()) body["tool_choice"] = *params.tool_choice;

    return body;
}

auto AnthropicAdapter::wrap_response(json raw) const -> ResponsePtr {
    return std::make_unique<AnthropicResponse>(std::move(raw));
}

} // namespace bedrockkit::llm
