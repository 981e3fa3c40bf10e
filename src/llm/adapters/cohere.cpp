#include "bedrockkit/llm/adapters/cohere.hpp"

#include <memory>

namespace bedrockkit::llm {

auto CohereAdapter::completion_body(const CompletionParameters& params,
                                    std::string_view prompt) const -> Result<json> {
    json body;
    body["max_tokens"] = params.max_tokens_to_sample;
    body["temperature"] = params.temperature;
    body["p"] = params.top_p;
    body["k"] = params.top_k;
    body["stop_sequences"] = params.stop_sequences;
    body["prompt"] = wrap_prompt(prompt);
    return body;
}

auto CohereAdapter::decode_completion_body(const json& body) const
    -> Result<DecodedCompletion> {
    if (!body.is_object()) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Cohere completion body is not an object"));
    }
    DecodedCompletion decoded;
    decoded.params.max_tokens_to_sample = read_field<int>(body, "max_tokens");
    decoded.params.temperature = read_field<double>(body, "temperature");
    decoded.params.top_p = read_field<double>(body, "p");
    decoded.params.top_k = read_field<int>(body, "k");
    decoded.params.stop_sequences = read_field<std::vector<std::string>>(body, "stop_sequences");
    decoded.prompt = unwrap_prompt(read_field<std::string>(body, "prompt").value_or(""));
    return decoded;
}

auto CohereAdapter::wrap_response(json raw) const -> ResponsePtr {
    return std::make_unique<CohereResponse>(std::move(raw));
}

} // namespace bedrockkit::llm
