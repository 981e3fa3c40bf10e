#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

#include "bedrockkit/core/error.hpp"
#include "bedrockkit/core/types.hpp"
#include "bedrockkit/llm/adapter.hpp"
#include "bedrockkit/llm/parameters.hpp"

namespace bedrockkit::llm {

/// Builds the completion wire body for `provider`, with the prompt wrapped
/// in the provider's template. Fails with UnsupportedProvider when the
/// provider does not serve completions.
auto normalize_completion(const CompletionParameters& params,
                          std::string_view prompt,
                          Provider provider) -> Result<json>;

/// Builds the chat (Messages API) wire body for `provider`.
auto normalize_chat(const ChatParameters& params, Provider provider) -> Result<json>;

/// Builds the embedding wire body; `extra` keys are merged over the
/// generated ones.
auto normalize_embedding(std::string_view text, const json& extra,
                         Provider provider) -> Result<json>;

/// Fails with UnsupportedModel when `model_id` only accepts chat requests.
auto check_completion_model(std::string_view model_id) -> VoidResult;

/// Reads a completion wire body back into canonical field names.
auto decode_completion(const json& wire, Provider provider) -> Result<DecodedCompletion>;

} // namespace bedrockkit::llm
