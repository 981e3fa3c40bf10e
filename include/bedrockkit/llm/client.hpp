#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>

#include <boost/asio.hpp>

#include "bedrockkit/core/config.hpp"
#include "bedrockkit/core/error.hpp"
#include "bedrockkit/export.hpp"
#include "bedrockkit/llm/invoker.hpp"
#include "bedrockkit/llm/parameters.hpp"
#include "bedrockkit/llm/response.hpp"

namespace bedrockkit::llm {

/// Receives each decoded stream event before it is folded into the
/// response.
using ChunkCallback = std::function<void(const json& event)>;

/// Uniform entry point for completion, chat and embedding requests against
/// Bedrock-hosted models.
///
/// Defaults are fixed at construction and merged with per-call values.
/// Every request is validated before the invoker is touched.
class BEDROCKKIT_API BedrockClient {
public:
    BedrockClient(std::shared_ptr<ModelInvoker> invoker, GenerationDefaults defaults);

    /// Builds a client that talks to the Bedrock Runtime endpoint.
    static auto from_config(boost::asio::io_context& ioc, const Config& config)
        -> BedrockClient;

    /// Single-shot text completion with `defaults.completion_model`.
    auto complete(std::string prompt, CompletionOverrides overrides = {})
        -> boost::asio::awaitable<Result<CompletionResponse>>;

    /// Messages API chat. With `on_chunk` the response is streamed, every
    /// event is passed to the callback and then reassembled.
    auto chat(ChatRequest request, ChunkCallback on_chunk = {})
        -> boost::asio::awaitable<Result<ChatResponse>>;

    /// Embeds `text` with `defaults.embedding_model`; `extra` keys are sent
    /// as-is next to the input.
    auto embed(std::string text, json extra = json::object())
        -> boost::asio::awaitable<Result<EmbeddingResponse>>;

    [[nodiscard]] auto defaults() const -> const GenerationDefaults& { return defaults_; }

private:
    auto invoke_and_parse(InvokeRequest request, Provider provider)
        -> boost::asio::awaitable<Result<ResponsePtr>>;

    std::shared_ptr<ModelInvoker> invoker_;
    GenerationDefaults defaults_;
};

} // namespace bedrockkit::llm
