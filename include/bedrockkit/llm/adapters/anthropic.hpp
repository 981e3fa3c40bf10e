#pragma once

#include "bedrockkit/llm/adapter.hpp"

namespace bedrockkit::llm {

/// Anthropic Claude on Bedrock.
///
/// Single-shot completion uses the legacy Text Completions body with the
/// "\n\nHuman: ...\n\nAssistant:" turn template; chat uses the Messages
/// API body. Field names are passed through unchanged.
class AnthropicAdapter final : public ModelAdapter {
public:
    [[nodiscard]] auto provider() const noexcept -> Provider override { return Provider::Anthropic; }

    [[nodiscard]] auto wrap_prompt(std::string_view prompt) const -> std::string override;
    [[nodiscard]] auto unwrap_prompt(std::string_view wrapped) const -> std::string override;

    [[nodiscard]] auto completion_body(const CompletionParameters& params,
                                       std::string_view prompt) const -> Result<json> override;
    [[nodiscard]] auto decode_completion_body(const json& body) const
        -> Result<DecodedCompletion> override;
    [[nodiscard]] auto chat_body(const ChatParameters& params) const -> Result<json> override;
    [[nodiscard]] auto wrap_response(json raw) const -> ResponsePtr override;
};

} // namespace bedrockkit::llm
