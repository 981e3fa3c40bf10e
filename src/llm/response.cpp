#include "bedrockkit/llm/response.hpp"

#include "bedrockkit/llm/adapter.hpp"
#include "bedrockkit/llm/capabilities.hpp"

namespace bedrockkit::llm {

namespace {

/// Member `key` of `j` when `j` is an object holding it, else null.
auto member(const json& j, const char* key) -> const json& {
    static const json kNull;
    if (!j.is_object()) return kNull;
    auto it = j.find(key);
    return it == j.end() ? kNull : *it;
}

/// Element `index` of `j` when `j` is an array long enough, else null.
auto element(const json& j, size_t index) -> const json& {
    static const json kNull;
    if (!j.is_array() || index >= j.size()) return kNull;
    return j[index];
}

auto string_or_empty(const json& j) -> std::string {
    return j.is_string() ? j.get<std::string>() : std::string();
}

auto int_or_zero(const json& j) -> int {
    return j.is_number() ? j.get<int>() : 0;
}

auto array_size(const json& j) -> int {
    return j.is_array() ? static_cast<int>(j.size()) : 0;
}

} // anonymous namespace

// -- Response ---------------------------------------------------------------

auto Response::model() const -> std::string {
    return string_or_empty(member(raw_, "model"));
}

auto Response::role() const -> std::string {
    return "assistant";
}

auto Response::completions() const -> std::vector<std::string> {
    return {};
}

auto Response::completion() const -> std::string {
    auto all = completions();
    return all.empty() ? std::string() : all.front();
}

auto Response::chat_completion() const -> std::string {
    return {};
}

auto Response::tool_calls() const -> std::vector<json> {
    return {};
}

auto Response::stop_reason() const -> std::string {
    return {};
}

auto Response::prompt_tokens() const -> int {
    return 0;
}

auto Response::completion_tokens() const -> int {
    return 0;
}

auto Response::total_tokens() const -> int {
    return prompt_tokens() + completion_tokens();
}

auto Response::embedding() const -> std::vector<double> {
    return {};
}

// -- AnthropicResponse ------------------------------------------------------

auto AnthropicResponse::role() const -> std::string {
    auto role = string_or_empty(member(raw_, "role"));
    return role.empty() ? Response::role() : role;
}

auto AnthropicResponse::completions() const -> std::vector<std::string> {
    const auto& completion = member(raw_, "completion");
    if (!completion.is_string()) return {};
    return {completion.get<std::string>()};
}

auto AnthropicResponse::chat_completion() const -> std::string {
    const auto& content = member(raw_, "content");
    if (!content.is_array()) return {};
    for (const auto& block : content) {
        if (string_or_empty(member(block, "type")) == "text") {
            return string_or_empty(member(block, "text"));
        }
    }
    return {};
}

auto AnthropicResponse::tool_calls() const -> std::vector<json> {
    std::vector<json> calls;
    const auto& content = member(raw_, "content");
    if (!content.is_array()) return calls;
    for (const auto& block : content) {
        if (string_or_empty(member(block, "type")) == "tool_use") {
            calls.push_back(block);
        }
    }
    return calls;
}

auto AnthropicResponse::stop_reason() const -> std::string {
    return string_or_empty(member(raw_, "stop_reason"));
}

auto AnthropicResponse::prompt_tokens() const -> int {
    return int_or_zero(member(member(raw_, "usage"), "input_tokens"));
}

auto AnthropicResponse::completion_tokens() const -> int {
    return int_or_zero(member(member(raw_, "usage"), "output_tokens"));
}

// -- CohereResponse ---------------------------------------------------------

auto CohereResponse::completions() const -> std::vector<std::string> {
    std::vector<std::string> texts;
    const auto& generations = member(raw_, "generations");
    if (!generations.is_array()) return texts;
    for (const auto& generation : generations) {
        texts.push_back(string_or_empty(member(generation, "text")));
    }
    return texts;
}

auto CohereResponse::stop_reason() const -> std::string {
    return string_or_empty(member(element(member(raw_, "generations"), 0), "finish_reason"));
}

// -- Ai21Response -----------------------------------------------------------

auto Ai21Response::completions() const -> std::vector<std::string> {
    std::vector<std::string> texts;
    const auto& completions = member(raw_, "completions");
    if (!completions.is_array()) return texts;
    for (const auto& completion : completions) {
        texts.push_back(string_or_empty(member(member(completion, "data"), "text")));
    }
    return texts;
}

auto Ai21Response::stop_reason() const -> std::string {
    const auto& first = element(member(raw_, "completions"), 0);
    return string_or_empty(member(member(first, "finishReason"), "reason"));
}

auto Ai21Response::prompt_tokens() const -> int {
    return array_size(member(member(raw_, "prompt"), "tokens"));
}

auto Ai21Response::completion_tokens() const -> int {
    const auto& first = element(member(raw_, "completions"), 0);
    return array_size(member(member(first, "data"), "tokens"));
}

// -- TitanResponse ----------------------------------------------------------

auto TitanResponse::prompt_tokens() const -> int {
    return int_or_zero(member(raw_, "inputTextTokenCount"));
}

auto TitanResponse::embedding() const -> std::vector<double> {
    std::vector<double> values;
    const auto& embedding = member(raw_, "embedding");
    if (!embedding.is_array()) return values;
    values.reserve(embedding.size());
    for (const auto& v : embedding) {
        if (v.is_number()) values.push_back(v.get<double>());
    }
    return values;
}

auto parse_response(json raw, Provider provider) -> Result<ResponsePtr> {
    const auto* adapter = adapter_for(provider);
    if (adapter == nullptr) {
        return std::unexpected(make_error(
            ErrorCode::UnsupportedProvider,
            "No response type registered for provider",
            std::string(to_string(provider))));
    }
    return adapter->wrap_response(std::move(raw));
}

} // namespace bedrockkit::llm
