#pragma once

#include "bedrockkit/llm/adapter.hpp"

namespace bedrockkit::llm {

/// Amazon Titan embeddings: `{"inputText": ...}` plus caller extras.
class TitanAdapter final : public ModelAdapter {
public:
    [[nodiscard]] auto provider() const noexcept -> Provider override { return Provider::Amazon; }

    [[nodiscard]] auto embedding_body(std::string_view text,
                                      const json& extra) const -> Result<json> override;
    [[nodiscard]] auto wrap_response(json raw) const -> ResponsePtr override;
};

} // namespace bedrockkit::llm
