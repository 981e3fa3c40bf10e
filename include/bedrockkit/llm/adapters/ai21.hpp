#pragma once

#include "bedrockkit/llm/adapter.hpp"

namespace bedrockkit::llm {

/// AI21 Jurassic on Bedrock: camelCase fields and nested penalty objects.
class Ai21Adapter final : public ModelAdapter {
public:
    [[nodiscard]] auto provider() const noexcept -> Provider override { return Provider::AI21; }

    [[nodiscard]] auto completion_body(const CompletionParameters& params,
                                       std::string_view prompt) const -> Result<json> override;
    [[nodiscard]] auto decode_completion_body(const json& body) const
        -> Result<DecodedCompletion> override;
    [[nodiscard]] auto wrap_response(json raw) const -> ResponsePtr override;
};

/// `{scale, applyToWhitespaces, ...}` wire form of a penalty.
auto penalty_to_wire(const PenaltyConfig& penalty) -> json;
auto penalty_from_wire(const json& wire) -> PenaltyConfig;

} // namespace bedrockkit::llm
