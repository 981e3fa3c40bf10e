#include "bedrockkit/llm/capabilities.hpp"

#include <array>
#include <string>

#include "bedrockkit/core/utils.hpp"

namespace bedrockkit::llm {

namespace {

constexpr std::array kAllProviders = {
    Provider::Anthropic,
    Provider::Cohere,
    Provider::AI21,
    Provider::Amazon,
};

// Claude 3 and later only speak the Messages API.
constexpr std::array<std::string_view, 4> kChatOnlyFamilies = {
    "claude-3",
    "claude-sonnet-4",
    "claude-opus-4",
    "claude-haiku-4",
};

} // anonymous namespace

auto supports(Operation op, Provider provider) noexcept -> bool {
    switch (op) {
        case Operation::Completion:
            return provider == Provider::Anthropic ||
                   provider == Provider::Cohere ||
                   provider == Provider::AI21;
        case Operation::Chat:
            return provider == Provider::Anthropic;
        case Operation::Embedding:
            return provider == Provider::Amazon;
    }
    return false;
}

auto supported_providers(Operation op) -> std::vector<Provider> {
    std::vector<Provider> result;
    for (auto provider : kAllProviders) {
        if (supports(op, provider)) result.push_back(provider);
    }
    return result;
}

auto to_string(Provider provider) noexcept -> std::string_view {
    switch (provider) {
        case Provider::Anthropic: return "anthropic";
        case Provider::Cohere: return "cohere";
        case Provider::AI21: return "ai21";
        case Provider::Amazon: return "amazon";
    }
    return "unknown";
}

auto to_string(Operation op) noexcept -> std::string_view {
    switch (op) {
        case Operation::Completion: return "completion";
        case Operation::Chat: return "chat";
        case Operation::Embedding: return "embedding";
    }
    return "unknown";
}

auto parse_provider(std::string_view name) -> std::optional<Provider> {
    auto lower = utils::to_lower(name);
    for (auto provider : kAllProviders) {
        if (lower == to_string(provider)) return provider;
    }
    return std::nullopt;
}

auto model_namespace(std::string_view model_id) noexcept -> std::string_view {
    return model_id.substr(0, model_id.find('.'));
}

auto provider_for_model(std::string_view model_id) -> std::optional<Provider> {
    return parse_provider(model_namespace(model_id));
}

auto is_chat_only_model(std::string_view model_id) -> bool {
    for (auto family : kChatOnlyFamilies) {
        if (model_id.find(family) != std::string_view::npos) return true;
    }
    return false;
}

auto require_support(Operation op, std::string_view model_id) -> Result<Provider> {
    auto provider = provider_for_model(model_id);
    if (!provider.has_value() || !supports(op, *provider)) {
        return std::unexpected(make_error(
            ErrorCode::UnsupportedProvider,
            std::string(to_string(op)) + " provider " +
                std::string(model_namespace(model_id)) + " is not supported",
            std::string(model_id)));
    }
    return *provider;
}

} // namespace bedrockkit::llm
