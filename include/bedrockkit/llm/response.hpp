#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "bedrockkit/core/error.hpp"
#include "bedrockkit/core/types.hpp"
#include "bedrockkit/export.hpp"

namespace bedrockkit::llm {

/// Caller-facing result of a completion, chat, or embedding call.
///
/// Wraps the decoded provider payload verbatim and exposes uniform
/// accessors over it. Accessors tolerate missing fields and return empty
/// values rather than failing.
class BEDROCKKIT_API Response {
public:
    explicit Response(json raw) : raw_(std::move(raw)) {}
    virtual ~Response() = default;

    Response(const Response&) = delete;
    Response& operator=(const Response&) = delete;

    [[nodiscard]] virtual auto provider() const noexcept -> Provider = 0;

    [[nodiscard]] auto raw() const noexcept -> const json& { return raw_; }

    [[nodiscard]] virtual auto model() const -> std::string;
    [[nodiscard]] virtual auto role() const -> std::string;

    /// Texts of all returned completions.
    [[nodiscard]] virtual auto completions() const -> std::vector<std::string>;

    /// The first completion, or an empty string.
    [[nodiscard]] auto completion() const -> std::string;

    /// Text of the first text content block of a chat reply.
    [[nodiscard]] virtual auto chat_completion() const -> std::string;

    /// Tool invocation blocks of a chat reply.
    [[nodiscard]] virtual auto tool_calls() const -> std::vector<json>;

    [[nodiscard]] virtual auto stop_reason() const -> std::string;
    [[nodiscard]] virtual auto prompt_tokens() const -> int;
    [[nodiscard]] virtual auto completion_tokens() const -> int;
    [[nodiscard]] auto total_tokens() const -> int;

    [[nodiscard]] virtual auto embedding() const -> std::vector<double>;

protected:
    json raw_;
};

using ResponsePtr = std::unique_ptr<Response>;
using CompletionResponse = ResponsePtr;
using ChatResponse = ResponsePtr;
using EmbeddingResponse = ResponsePtr;

/// Anthropic Claude: legacy text completions and Messages API replies.
class BEDROCKKIT_API AnthropicResponse final : public Response {
public:
    using Response::Response;

    [[nodiscard]] auto provider() const noexcept -> Provider override { return Provider::Anthropic; }
    [[nodiscard]] auto role() const -> std::string override;
    [[nodiscard]] auto completions() const -> std::vector<std::string> override;
    [[nodiscard]] auto chat_completion() const -> std::string override;
    [[nodiscard]] auto tool_calls() const -> std::vector<json> override;
    [[nodiscard]] auto stop_reason() const -> std::string override;
    [[nodiscard]] auto prompt_tokens() const -> int override;
    [[nodiscard]] auto completion_tokens() const -> int override;
};

/// Cohere Command: `{"generations": [{"text", "finish_reason"}], ...}`.
class BEDROCKKIT_API CohereResponse final : public Response {
public:
    using Response::Response;

    [[nodiscard]] auto provider() const noexcept -> Provider override { return Provider::Cohere; }
    [[nodiscard]] auto completions() const -> std::vector<std::string> override;
    [[nodiscard]] auto stop_reason() const -> std::string override;
};

/// AI21 Jurassic: `{"prompt": {"tokens"}, "completions": [{"data", "finishReason"}]}`.
class BEDROCKKIT_API Ai21Response final : public Response {
public:
    using Response::Response;

    [[nodiscard]] auto provider() const noexcept -> Provider override { return Provider::AI21; }
    [[nodiscard]] auto completions() const -> std::vector<std::string> override;
    [[nodiscard]] auto stop_reason() const -> std::string override;
    [[nodiscard]] auto prompt_tokens() const -> int override;
    [[nodiscard]] auto completion_tokens() const -> int override;
};

/// Amazon Titan embeddings: `{"embedding": [...], "inputTextTokenCount": n}`.
class BEDROCKKIT_API TitanResponse final : public Response {
public:
    using Response::Response;

    [[nodiscard]] auto provider() const noexcept -> Provider override { return Provider::Amazon; }
    [[nodiscard]] auto prompt_tokens() const -> int override;
    [[nodiscard]] auto embedding() const -> std::vector<double> override;
};

/// Wraps a decoded payload in the provider's response type. No further
/// transformation is applied.
auto parse_response(json raw, Provider provider) -> Result<ResponsePtr>;

} // namespace bedrockkit::llm
