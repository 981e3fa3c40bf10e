#include "bedrockkit/aws/runtime_client.hpp"

#include <chrono>
#include <utility>

#include "bedrockkit/core/logger.hpp"
#include "bedrockkit/core/utils.hpp"

namespace bedrockkit::aws {

namespace {

constexpr auto kService = "bedrock";
constexpr auto kEventStreamContentType = "application/vnd.amazon.eventstream";

auto credentials_from(const AwsConfig& config) -> Credentials {
    return Credentials{
        .access_key_id = config.access_key_id,
        .secret_access_key = config.secret_access_key,
        .session_token = config.session_token,
    };
}

auto resolve_endpoint(const AwsConfig& config) -> std::string {
    auto endpoint = config.endpoint.value_or(default_endpoint(config.region));
    while (!endpoint.empty() && endpoint.back() == '/') {
        endpoint.pop_back();
    }
    return endpoint;
}

/// AWS error bodies spell the field `message` or `Message`.
auto error_message(const json& body, std::string fallback) -> std::string {
    for (const char* key : {"message", "Message"}) {
        if (auto it = body.find(key); it != body.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return fallback;
}

} // anonymous namespace

auto default_endpoint(std::string_view region) -> std::string {
    return "https://bedrock-runtime." + std::string(region) + ".amazonaws.com";
}

auto endpoint_host(std::string_view endpoint) -> std::string {
    if (auto pos = endpoint.find("://"); pos != std::string_view::npos) {
        endpoint.remove_prefix(pos + 3);
    }
    if (auto slash = endpoint.find('/'); slash != std::string_view::npos) {
        endpoint = endpoint.substr(0, slash);
    }
    return std::string(endpoint);
}

auto model_path(std::string_view model_id, std::string_view action) -> std::string {
    return "/model/" + utils::url_encode(model_id) + "/" + std::string(action);
}

auto unwrap_chunk(const EventStreamMessage& message)
    -> Result<std::optional<std::string>> {
    auto message_type = message.header(":message-type");

    if (message_type == "exception" || message_type == "error") {
        std::string kind(message.header(message_type == "error" ? ":error-code"
                                                                : ":exception-type"));
        std::string text(message.header(":error-message"));
        auto body = json::parse(message.payload, nullptr, false);
        if (body.is_object()) {
            text = error_message(body, std::move(text));
        }
        return std::unexpected(make_error(
            ErrorCode::ProviderError,
            "Bedrock stream " + std::string(message_type) +
                (kind.empty() ? std::string() : " " + kind),
            text));
    }

    if (message_type != "event" || message.header(":event-type") != "chunk") {
        LOG_TRACE("Skipping event-stream frame ({}/{})", message_type,
                  message.header(":event-type"));
        return std::optional<std::string>{};
    }

    auto payload = json::parse(message.payload, nullptr, false);
    if (!payload.is_object() || !payload.contains("bytes") || !payload["bytes"].is_string()) {
        return std::unexpected(make_error(
            ErrorCode::MalformedStream,
            "Chunk frame has no base64 bytes field"));
    }
    return std::optional<std::string>(
        utils::base64_decode(payload["bytes"].get_ref<const std::string&>()));
}

auto error_from_response(int status, std::string_view body) -> Error {
    auto detail = std::string(body);
    auto parsed = json::parse(body, nullptr, false);
    if (parsed.is_object()) {
        detail = error_message(parsed, std::move(detail));
    }
    return make_error(ErrorCode::ProviderError,
                      "Bedrock API error (HTTP " + std::to_string(status) + ")",
                      std::move(detail));
}

BedrockRuntimeClient::BedrockRuntimeClient(boost::asio::io_context& ioc,
                                           const AwsConfig& config)
    : endpoint_(resolve_endpoint(config))
    , host_(endpoint_host(endpoint_))
    , signer_(credentials_from(config), config.region, kService)
    , http_(ioc, infra::HttpClientConfig{
          .base_url = endpoint_,
          .timeout_seconds = config.timeout_seconds,
          .verify_ssl = config.verify_ssl,
          .default_headers = {},
      })
{
    if (config.access_key_id.empty() || config.secret_access_key.empty()) {
        LOG_WARN("Bedrock runtime client has no AWS credentials; requests will be rejected");
    }
    LOG_INFO("Bedrock runtime client initialized (endpoint: {}, region: {})",
             endpoint_, config.region);
}

BedrockRuntimeClient::~BedrockRuntimeClient() = default;

auto BedrockRuntimeClient::signed_headers(std::string_view path,
                                          std::string_view payload,
                                          std::string_view accept) const
    -> std::map<std::string, std::string> {
    std::map<std::string, std::string> to_sign{
        {"host", host_},
        {"accept", std::string(accept)},
    };
    auto signed_request = signer_.sign("POST", path, "", to_sign, payload,
                                       std::chrono::system_clock::now());

    auto headers = std::move(signed_request.headers);
    headers["Accept"] = std::string(accept);
    return headers;
}

auto BedrockRuntimeClient::invoke(const llm::InvokeRequest& request)
    -> boost::asio::awaitable<Result<std::string>> {
    auto path = model_path(request.model_id, "invoke");
    LOG_DEBUG("Bedrock invoke: model={} path={}", request.model_id, path);

    auto headers = signed_headers(path, request.body, request.accept);
    auto result = co_await http_.post(path, request.body, request.content_type, headers);
    if (!result.has_value()) {
        LOG_WARN("Bedrock invoke failed: {}", result.error().what());
        co_return make_fail(result.error());
    }

    if (!result->is_success()) {
        co_return make_fail(error_from_response(result->status, result->body));
    }
    co_return std::move(result->body);
}

auto BedrockRuntimeClient::invoke_stream(const llm::InvokeRequest& request,
                                         llm::StreamEventHandler on_event)
    -> boost::asio::awaitable<VoidResult> {
    auto path = model_path(request.model_id, "invoke-with-response-stream");
    LOG_DEBUG("Bedrock stream invoke: model={} path={}", request.model_id, path);

    auto headers = signed_headers(path, request.body, kEventStreamContentType);
    headers["X-Amzn-Bedrock-Accept"] = request.accept;

    EventStreamDecoder decoder;
    std::optional<Error> stream_error;

    auto result = co_await http_.post_stream(
        path, request.body, request.content_type, headers,
        [&](const char* data, size_t length) -> bool {
            auto messages = decoder.feed(std::string_view(data, length));
            if (!messages) {
                stream_error = messages.error();
                return false;
            }
            for (const auto& message : *messages) {
                auto chunk = unwrap_chunk(message);
                if (!chunk) {
                    stream_error = chunk.error();
                    return false;
                }
                if (!chunk->has_value()) continue;
                if (!on_event(**chunk)) {
                    return false;
                }
            }
            return true;
        });

    if (stream_error.has_value()) {
        LOG_WARN("Bedrock stream failed: {}", stream_error->what());
        co_return make_fail(std::move(*stream_error));
    }
    if (!result.has_value()) {
        co_return make_fail(result.error());
    }
    if (!result->is_success()) {
        co_return make_fail(error_from_response(result->status, result->body));
    }
    if (decoder.buffered() > 0) {
        co_return make_fail(make_error(
            ErrorCode::MalformedStream,
            "Stream ended inside an event-stream frame",
            std::to_string(decoder.buffered()) + " bytes pending"));
    }
    co_return ok_result();
}

} // namespace bedrockkit::aws
