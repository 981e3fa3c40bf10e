#include "bedrockkit/llm/client.hpp"

#include <optional>
#include <utility>

#include "bedrockkit/aws/runtime_client.hpp"
#include "bedrockkit/core/logger.hpp"
#include "bedrockkit/llm/capabilities.hpp"
#include "bedrockkit/llm/normalizer.hpp"
#include "bedrockkit/llm/stream_accumulator.hpp"

namespace bedrockkit::llm {

namespace {

auto parse_body(std::string_view body) -> Result<json> {
    auto parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError,
            "Failed to parse Bedrock response body"));
    }
    return parsed;
}

} // anonymous namespace

BedrockClient::BedrockClient(std::shared_ptr<ModelInvoker> invoker,
                             GenerationDefaults defaults)
    : invoker_(std::move(invoker)), defaults_(std::move(defaults)) {
    LOG_INFO("Bedrock client ready (completion: {}, chat: {}, embedding: {})",
             defaults_.completion_model, defaults_.chat_completion_model,
             defaults_.embedding_model);
}

auto BedrockClient::from_config(boost::asio::io_context& ioc, const Config& config)
    -> BedrockClient {
    Logger::set_level(config.log_level);
    return BedrockClient(std::make_shared<aws::BedrockRuntimeClient>(ioc, config.aws),
                         config.defaults);
}

auto BedrockClient::complete(std::string prompt, CompletionOverrides overrides)
    -> boost::asio::awaitable<Result<CompletionResponse>> {
    const auto& model = defaults_.completion_model;

    auto provider = require_support(Operation::Completion, model);
    if (!provider) co_return make_fail(provider.error());

    if (auto ok = check_completion_model(model); !ok) {
        co_return make_fail(ok.error());
    }

    auto params = merge_parameters(defaults_, overrides);
    auto body = normalize_completion(params, prompt, *provider);
    if (!body) co_return make_fail(body.error());

    co_return co_await invoke_and_parse(
        InvokeRequest{.model_id = model, .body = body->dump()}, *provider);
}

auto BedrockClient::chat(ChatRequest request, ChunkCallback on_chunk)
    -> boost::asio::awaitable<Result<ChatResponse>> {
    if (!request.messages.is_array() || request.messages.empty()) {
        co_return make_fail(make_error(
            ErrorCode::InvalidRequest, "messages argument is required"));
    }

    auto params = merge_parameters(defaults_, request);

    auto provider = require_support(Operation::Chat, params.model);
    if (!provider) co_return make_fail(provider.error());

    auto body = normalize_chat(params, *provider);
    if (!body) co_return make_fail(body.error());

    InvokeRequest invoke_request{.model_id = params.model, .body = body->dump()};

    if (!on_chunk) {
        co_return co_await invoke_and_parse(std::move(invoke_request), *provider);
    }

    StreamAccumulator acc;
    std::optional<Error> stream_error;

    auto streamed = co_await invoker_->invoke_stream(
        invoke_request,
        [&](std::string_view data) -> bool {
            auto event = json::parse(data, nullptr, false);
            if (event.is_discarded()) {
                stream_error = make_error(ErrorCode::SerializationError,
                                          "Failed to parse stream event",
                                          std::string(data));
                return false;
            }
            try {
                on_chunk(event);
            } catch (const std::exception& e) {
                stream_error = make_error(ErrorCode::InternalError,
                                          "Chunk callback threw", e.what());
                return false;
            }
            if (auto applied = acc.apply(event); !applied) {
                stream_error = applied.error();
                return false;
            }
            return true;
        });

    if (stream_error.has_value()) {
        LOG_WARN("Chat stream aborted: {}", stream_error->what());
        co_return make_fail(std::move(*stream_error));
    }
    if (!streamed) {
        LOG_WARN("Chat stream failed: {}", streamed.error().what());
        co_return make_fail(streamed.error());
    }

    LOG_DEBUG("Chat stream for {} finished after {} events", params.model,
              acc.events_applied());
    auto raw = std::move(acc).finish();
    if (!raw) co_return make_fail(raw.error());

    co_return parse_response(std::move(*raw), *provider);
}

auto BedrockClient::embed(std::string text, json extra)
    -> boost::asio::awaitable<Result<EmbeddingResponse>> {
    const auto& model = defaults_.embedding_model;

    auto provider = require_support(Operation::Embedding, model);
    if (!provider) co_return make_fail(provider.error());

    auto body = normalize_embedding(text, extra, *provider);
    if (!body) co_return make_fail(body.error());

    co_return co_await invoke_and_parse(
        InvokeRequest{.model_id = model, .body = body->dump()}, *provider);
}

auto BedrockClient::invoke_and_parse(InvokeRequest request, Provider provider)
    -> boost::asio::awaitable<Result<ResponsePtr>> {
    LOG_DEBUG("Invoking {} ({} bytes)", request.model_id, request.body.size());

    auto body = co_await invoker_->invoke(request);
    if (!body) co_return make_fail(body.error());

    auto raw = parse_body(*body);
    if (!raw) co_return make_fail(raw.error());

    co_return parse_response(std::move(*raw), provider);
}

} // namespace bedrockkit::llm
