#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "bedrockkit/core/error.hpp"
#include "bedrockkit/core/types.hpp"

namespace bedrockkit::llm {

/// Whether `provider` serves `op` through the Bedrock Runtime endpoint.
///
///   Completion -> anthropic, cohere, ai21
///   Chat       -> anthropic
///   Embedding  -> amazon
[[nodiscard]] auto supports(Operation op, Provider provider) noexcept -> bool;

/// Providers supporting `op`, in declaration order.
auto supported_providers(Operation op) -> std::vector<Provider>;

[[nodiscard]] auto to_string(Provider provider) noexcept -> std::string_view;
[[nodiscard]] auto to_string(Operation op) noexcept -> std::string_view;

/// Parses a provider tag ("anthropic", "cohere", "ai21", "amazon").
auto parse_provider(std::string_view name) -> std::optional<Provider>;

/// The namespace segment of a Bedrock model id: the text before the first '.'.
[[nodiscard]] auto model_namespace(std::string_view model_id) noexcept -> std::string_view;

/// Provider of a Bedrock model id such as "anthropic.claude-v2".
auto provider_for_model(std::string_view model_id) -> std::optional<Provider>;

/// True for model families that only accept the Messages (chat) API.
[[nodiscard]] auto is_chat_only_model(std::string_view model_id) -> bool;

/// Derives the provider of `model_id` and checks it supports `op`.
/// Fails with UnsupportedProvider otherwise.
auto require_support(Operation op, std::string_view model_id) -> Result<Provider>;

} // namespace bedrockkit::llm
