#pragma once

#include <functional>
#include <string>
#include <utility>
#include <string_view>

#include <boost/asio/awaitable.hpp>

#include "bedrockkit/core/error.hpp"

namespace bedrockkit::llm {

/// One model invocation: the target model and its serialized body.
struct InvokeRequest {
    std::string model_id;
    std::string body;
    std::string content_type = "application/json";
    std::string accept = "application/json";
};

/// Receives the JSON bytes of each stream event, in arrival order.
/// Return false to abort the stream.
using StreamEventHandler = std::function<bool(std::string_view event)>;

/// Abstract transport that runs a model on the backend.
///
/// Implementations own retries, signing and framing. invoke_stream calls
/// the handler once per event on a single thread and returns only after
/// the last event (or the first failure).
class ModelInvoker {
public:
    virtual ~ModelInvoker() = default;

    /// Single-shot invocation; yields the raw response body.
    virtual auto invoke(const InvokeRequest& request)
        -> boost::asio::awaitable<Result<std::string>> = 0;

    /// Streaming invocation. A handler returning false ends the call with
    /// a ConnectionClosed error.
    virtual auto invoke_stream(const InvokeRequest& request, StreamEventHandler on_event)
        -> boost::asio::awaitable<VoidResult> = 0;
};

} // namespace bedrockkit::llm
