#include "bedrockkit/llm/adapter.hpp"

#include "bedrockkit/llm/adapters/ai21.hpp"
#include "bedrockkit/llm/adapters/anthropic.hpp"
#include "bedrockkit/llm/adapters/cohere.hpp"
#include "bedrockkit/llm/adapters/titan.hpp"
#include "bedrockkit/llm/capabilities.hpp"

namespace bedrockkit::llm {

auto ModelAdapter::wrap_prompt(std::string_view prompt) const -> std::string {
    return std::string(prompt);
}

auto ModelAdapter::unwrap_prompt(std::string_view wrapped) const -> std::string {
    return std::string(wrapped);
}

auto ModelAdapter::completion_body(const CompletionParameters&, std::string_view) const
    -> Result<json> {
    return std::unexpected(unsupported(Operation::Completion));
}

auto ModelAdapter::decode_completion_body(const json&) const -> Result<DecodedCompletion> {
    return std::unexpected(unsupported(Operation::Completion));
}

auto ModelAdapter::chat_body(const ChatParameters&) const -> Result<json> {
    return std::unexpected(unsupported(Operation::Chat));
}

auto ModelAdapter::embedding_body(std::string_view, const json&) const -> Result<json> {
    return std::unexpected(unsupported(Operation::Embedding));
}

auto ModelAdapter::unsupported(Operation op) const -> Error {
    return make_error(ErrorCode::UnsupportedProvider,
                      std::string(to_string(op)) + " provider " +
                          std::string(to_string(provider())) + " is not supported");
}

auto adapter_for(Provider provider) -> const ModelAdapter* {
    static const AnthropicAdapter anthropic;
    static const CohereAdapter cohere;
    static const Ai21Adapter ai21;
    static const TitanAdapter titan;

    switch (provider) {
        case Provider::Anthropic: return &anthropic;
        case Provider::Cohere: return &cohere;
        case Provider::AI21: return &ai21;
        case Provider::Amazon: return &titan;
    }
    return nullptr;
}

} // namespace bedrockkit::llm
