#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <string_view>

#include <boost/asio.hpp>

#include "bedrockkit/core/error.hpp"

namespace bedrockkit::infra {

/// Callback invoked for each chunk of response data during streaming.
/// Return true to continue receiving data, false to abort the request.
using HttpChunkCallback = std::function<bool(const char* data, size_t length)>;

/// HTTP response from the client.
struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    /// Returns true if the status code indicates success (2xx).
    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }
};

/// Configuration for the HTTP client.
struct HttpClientConfig {
    std::string base_url;
    int timeout_seconds = 30;
    bool verify_ssl = true;
    std::map<std::string, std::string> default_headers;
};

/// Asynchronous HTTP client wrapping cpp-httplib.
///
/// Each request runs the blocking httplib call on its own thread and
/// resumes the awaiting coroutine on the io_context when it completes.
class HttpClient {
public:
    explicit HttpClient(boost::asio::io_context& ioc, HttpClientConfig config);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    /// Performs an HTTP POST and buffers the whole response body.
    auto post(std::string_view path,
              std::string_view body,
              std::string_view content_type = "application/json",
              const std::map<std::string, std::string>& headers = {})
        -> boost::asio::awaitable<Result<HttpResponse>>;

    /// Performs a streaming HTTP POST. The chunk_callback is invoked for each chunk of the response body
    /// as it arrives (on the background thread). For error responses
    /// (non-2xx), the body is buffered and returned in HttpResponse::body.
    /// A callback returning false cancels the transfer and the result is
    /// a ConnectionClosed error.
    auto post_stream(std::string_view path,
                     std::string_view body,
                     std::string_view content_type,
                     const std::map<std::string, std::string>& headers,
                     HttpChunkCallback chunk_callback)
        -> boost::asio::awaitable<Result<HttpResponse>>;

    /// Returns the base URL.
    [[nodiscard]] auto base_url() const -> const std::string&;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bedrockkit::infra
