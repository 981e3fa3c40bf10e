#include "bedrockkit/llm/adapters/ai21.hpp"

#include <memory>

namespace bedrockkit::llm {

auto penalty_to_wire(const PenaltyConfig& penalty) -> json {
    return json{
        {"scale", penalty.scale},
        {"applyToWhitespaces", penalty.apply_to_whitespaces},
        {"applyToPunctuations", penalty.apply_to_punctuations},
        {"applyToNumbers", penalty.apply_to_numbers},
        {"applyToStopwords", penalty.apply_to_stopwords},
        {"applyToEmojis", penalty.apply_to_emojis},
    };
}

auto penalty_from_wire(const json& wire) -> PenaltyConfig {
    PenaltyConfig penalty;
    if (!wire.is_object()) return penalty;

    auto flag = [&wire](const char* key) {
        auto it = wire.find(key);
        return it != wire.end() && it->is_boolean() && it->get<bool>();
    };
    if (auto it = wire.find("scale"); it != wire.end() && it->is_number()) {
        penalty.scale = it->get<double>();
    }
    penalty.apply_to_whitespaces = flag("applyToWhitespaces");
    penalty.apply_to_punctuations = flag("applyToPunctuations");
    penalty.apply_to_numbers = flag("applyToNumbers");
    penalty.apply_to_stopwords = flag("applyToStopwords");
    penalty.apply_to_emojis = flag("applyToEmojis");
    return penalty;
}

auto Ai21Adapter::completion_body(const CompletionParameters& params,
                                  std::string_view prompt) const -> Result<json> {
    json body;
    body["maxTokens"] = params.max_tokens_to_sample;
    body["temperature"] = params.temperature;
    body["topP"] = params.top_p;
    body["stopSequences"] = params.stop_sequences;
    body["countPenalty"] = penalty_to_wire(params.count_penalty);
    body["presencePenalty"] = penalty_to_wire(params.presence_penalty);
    body["frequencyPenalty"] = penalty_to_wire(params.frequency_penalty);
    body["prompt"] = wrap_prompt(prompt);
    return body;
}

auto Ai21Adapter::decode_completion_body(const json& body) const
    -> Result<DecodedCompletion> {
    if (!body.is_object()) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "AI21 completion body is not an object"));
    }
    DecodedCompletion decoded;
    decoded.params.max_tokens_to_sample = read_field<int>(body, "maxTokens");
    decoded.params.temperature = read_field<double>(body, "temperature");
    decoded.params.top_p = read_field<double>(body, "topP");
    decoded.params.stop_sequences = read_field<std::vector<std::string>>(body, "stopSequences");
    if (body.contains("countPenalty")) {
        decoded.params.count_penalty = penalty_from_wire(body["countPenalty"]);
    }
    if (body.contains("presencePenalty")) {
        decoded.params.presence_penalty = penalty_from_wire(body["presencePenalty"]);
    }
    if (body.contains("frequencyPenalty")) {
        decoded.params.frequency_penalty = penalty_from_wire(body["frequencyPenalty"]);
    }
    decoded.prompt = unwrap_prompt(read_field<std::string>(body, "prompt").value_or(""));
    return decoded;
}

auto Ai21Adapter::wrap_response(json raw) const -> ResponsePtr {
    return std::make_unique<Ai21Response>(std::move(raw));
}

} // namespace bedrockkit::llm
