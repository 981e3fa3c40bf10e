#pragma once

#include <optional>

#include <nlohmann/json.hpp>

namespace bedrockkit {

using json = nlohmann::json;

/// Model vendors reachable through the Bedrock Runtime endpoint.
enum class Provider {
    Anthropic,
    Cohere,
    AI21,
    Amazon,
};

NLOHMANN_JSON_SERIALIZE_ENUM(Provider, {
    {Provider::Anthropic, "anthropic"},
    {Provider::Cohere, "cohere"},
    {Provider::AI21, "ai21"},
    {Provider::Amazon, "amazon"},
})

enum class Operation {
    Completion,
    Chat,
    Embedding,
};

NLOHMANN_JSON_SERIALIZE_ENUM(Operation, {
    {Operation::Completion, "completion"},
    {Operation::Chat, "chat"},
    {Operation::Embedding, "embedding"},
})

} // namespace bedrockkit

// std::optional serializer for nlohmann/json, so the NLOHMANN_DEFINE macros
// accept optional members.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann
