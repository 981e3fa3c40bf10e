#pragma once

#include "bedrockkit/llm/adapter.hpp"

namespace bedrockkit::llm {

/// Cohere Command on Bedrock: flat body with `max_tokens`, `p`, `k`.
class CohereAdapter final : public ModelAdapter {
public:
    [[nodiscard]] auto provider() const noexcept -> Provider override { return Provider::Cohere; }

    [[nodiscard]] auto completion_body(const CompletionParameters& params,
                                       std::string_view prompt) const -> Result<json> override;
    [[nodiscard]] auto decode_completion_body(const json& body) const
        -> Result<DecodedCompletion> override;
    [[nodiscard]] auto wrap_response(json raw) const -> ResponsePtr override;
};

} // namespace bedrockkit::llm
