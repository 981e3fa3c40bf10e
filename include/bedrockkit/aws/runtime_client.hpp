#pragma once

#include <optional>
#include <string>
#include <utility>
#include <string_view>

#include <boost/asio.hpp>

#include "bedrockkit/aws/event_stream.hpp"
#include "bedrockkit/aws/sigv4.hpp"
#include "bedrockkit/core/config.hpp"
#include "bedrockkit/infra/http_client.hpp"
#include "bedrockkit/llm/invoker.hpp"

namespace bedrockkit::aws {

/// Model invoker backed by the AWS Bedrock Runtime REST API.
///
/// Requests go to `/model/{modelId}/invoke` and
/// `/model/{modelId}/invoke-with-response-stream` on
/// `https://bedrock-runtime.{region}.amazonaws.com` (or the configured
/// endpoint), signed with SigV4. Streamed bodies arrive as binary
/// event-stream frames whose `chunk` events carry base64 JSON.
class BedrockRuntimeClient final : public llm::ModelInvoker {
public:
    BedrockRuntimeClient(boost::asio::io_context& ioc, const AwsConfig& config);
    ~BedrockRuntimeClient() override;

    BedrockRuntimeClient(const BedrockRuntimeClient&) = delete;
    BedrockRuntimeClient& operator=(const BedrockRuntimeClient&) = delete;

    auto invoke(const llm::InvokeRequest& request)
        -> boost::asio::awaitable<Result<std::string>> override;

    auto invoke_stream(const llm::InvokeRequest& request, llm::StreamEventHandler on_event)
        -> boost::asio::awaitable<VoidResult> override;

    [[nodiscard]] auto endpoint() const -> const std::string& { return endpoint_; }

private:
    auto signed_headers(std::string_view path, std::string_view payload,
                        std::string_view accept) const
        -> std::map<std::string, std::string>;

    std::string endpoint_;
    std::string host_;
    SigV4Signer signer_;
    infra::HttpClient http_;
};

/// Default endpoint URL for a region.
auto default_endpoint(std::string_view region) -> std::string;

/// Host part of an endpoint URL, including any port.
auto endpoint_host(std::string_view endpoint) -> std::string;

/// Request path for a model action ("invoke" or
/// "invoke-with-response-stream"), with the model id percent-encoded.
auto model_path(std::string_view model_id, std::string_view action) -> std::string;

/// Extracts the event JSON from one decoded frame. Yields nullopt for frames
/// that carry no model output; exception frames become ProviderError.
auto unwrap_chunk(const EventStreamMessage& message) -> Result<std::optional<std::string>>;

/// Builds an error from a non-2xx Bedrock response body.
auto error_from_response(int status, std::string_view body) -> Error;

} // namespace bedrockkit::aws
