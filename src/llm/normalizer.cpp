#include "bedrockkit/llm/normalizer.hpp"

#include "bedrockkit/core/logger.hpp"
#include "bedrockkit/llm/capabilities.hpp"

namespace bedrockkit::llm {

namespace {

auto resolve_adapter(Operation op, Provider provider) -> Result<const ModelAdapter*> {
    if (!supports(op, provider)) {
        return std::unexpected(make_error(
            ErrorCode::UnsupportedProvider,
            std::string(to_string(op)) + " provider " +
                std::string(to_string(provider)) + " is not supported"));
    }
    const auto* adapter = adapter_for(provider);
    if (adapter == nullptr) {
        return std::unexpected(make_error(
            ErrorCode::InternalError,
            "No adapter registered for provider",
            std::string(to_string(provider))));
    }
    return adapter;
}

} // anonymous namespace

auto normalize_completion(const CompletionParameters& params,
                          std::string_view prompt,
                          Provider provider) -> Result<json> {
    auto adapter = resolve_adapter(Operation::Completion, provider);
    if (!adapter) return std::unexpected(adapter.error());
    return (*adapter)->completion_body(params, prompt);
}

auto normalize_chat(const ChatParameters& params, Provider provider) -> Result<json> {
    auto adapter = resolve_adapter(Operation::Chat, provider);
    if (!adapter) return std::unexpected(adapter.error());
    return (*adapter)->chat_body(params);
}

auto normalize_embedding(std::string_view text, const json& extra,
                         Provider provider) -> Result<json> {
    auto adapter = resolve_adapter(Operation::Embedding, provider);
    if (!adapter) return std::unexpected(adapter.error());
    return (*adapter)->embedding_body(text, extra);
}

auto check_completion_model(std::string_view model_id) -> VoidResult {
    if (is_chat_only_model(model_id)) {
        LOG_DEBUG("Rejecting completion request for chat-only model {}", model_id);
        return std::unexpected(make_error(
            ErrorCode::UnsupportedModel,
            "Model only supports chat completions, use chat instead",
            std::string(model_id)));
    }
    return {};
}

auto decode_completion(const json& wire, Provider provider) -> Result<DecodedCompletion> {
    auto adapter = resolve_adapter(Operation::Completion, provider);
    if (!adapter) return std::unexpected(adapter.error());
    return (*adapter)->decode_completion_body(wire);
}

} // namespace bedrockkit::llm
