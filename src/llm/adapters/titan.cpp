#include "bedrockkit/llm/adapters/titan.hpp"

#include <memory>

namespace bedrockkit::llm {

auto TitanAdapter::embedding_body(std::string_view text, const json& extra) const
    -> Result<json> {
    if (!extra.is_null() && !extra.is_object()) {
        return std::unexpected(make_error(ErrorCode::InvalidRequest,
                                          "Embedding parameters must be a JSON object"));
    }
    json body;
    body["inputText"] = std::string(text);
    if (extra.is_object()) {
        body.update(extra);
    }
    return body;
}

auto TitanAdapter::wrap_response(json raw) const -> ResponsePtr {
    return std::make_unique<TitanResponse>(std::move(raw));
}

} // namespace bedrockkit::llm
