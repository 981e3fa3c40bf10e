#include "bedrockkit/infra/http_client.hpp"
#include "bedrockkit/core/logger.hpp"

#include <httplib.h>

#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace bedrockkit::infra {

namespace {

auto describe(httplib::Error err) -> std::string {
    switch (err) {
        case httplib::Error::Connection: return "Connection failed";
        case httplib::Error::BindIPAddress: return "Bind IP address failed";
        case httplib::Error::Read: return "Read error";
        case httplib::Error::Write: return "Write error";
        case httplib::Error::ExceedRedirectCount: return "Exceeded redirect count";
        case httplib::Error::Canceled: return "Request canceled";
        case httplib::Error::SSLConnection: return "SSL connection error";
        case httplib::Error::SSLLoadingCerts: return "SSL certificate loading error";
        case httplib::Error::SSLServerVerification: return "SSL server verification failed";
        case httplib::Error::ConnectionTimeout: return "Connection timeout";
        default: return "Unknown HTTP error";
    }
}

auto transport_error(httplib::Error err) -> Error {
    if (err == httplib::Error::ConnectionTimeout) {
        return make_error(ErrorCode::Timeout, "HTTP request timed out", describe(err));
    }
    return make_error(ErrorCode::ConnectionFailed, "HTTP request failed", describe(err));
}

void configure(httplib::Client& client, const HttpClientConfig& config) {
    client.set_connection_timeout(config.timeout_seconds);
    client.set_read_timeout(config.timeout_seconds);
    client.set_write_timeout(config.timeout_seconds);
    if (!config.verify_ssl) {
        client.enable_server_certificate_verification(false);
    }
    httplib::Headers defaults;
    for (const auto& [k, v] : config.default_headers) {
        defaults.emplace(k, v);
    }
    client.set_default_headers(std::move(defaults));
}

/// One POST, run to completion on the calling thread. A null chunk
/// callback buffers the whole body.
auto execute(const HttpClientConfig& config,
             const std::string& path,
             const std::string& body,
             const std::string& content_type,
             const std::map<std::string, std::string>& headers,
             const HttpChunkCallback& chunk_cb) -> Result<HttpResponse> {
    // httplib::Client is not thread-safe; every request gets its own.
    httplib::Client client(config.base_url);
    configure(client, config);

    httplib::Request req;
    req.method = "POST";
    req.path = path;
    for (const auto& [k, v] : headers) {
        req.headers.emplace(k, v);
    }
    req.body = body;
    req.set_header("Content-Type", content_type);

    int status = 0;
    bool aborted = false;
    std::string buffered;

    req.response_handler = [&status](const httplib::Response& r) -> bool {
        status = r.status;
        return true;
    };
    // Error statuses are always buffered so the caller can read the reason.
    req.content_receiver = [&](const char* data, size_t length,
                               uint64_t /*offset*/, uint64_t /*total*/) -> bool {
        if (chunk_cb && status >= 200 && status < 300) {
            if (!chunk_cb(data, length)) {
                aborted = true;
                return false;
            }
            return true;
        }
        buffered.append(data, length);
        return true;
    };

    httplib::Response res;
    httplib::Error error = httplib::Error::Success;
    bool ok = client.send(req, res, error);

    if (aborted) {
        return std::unexpected(make_error(
            ErrorCode::ConnectionClosed, "HTTP streaming request aborted by receiver"));
    }
    if (!ok) {
        return std::unexpected(transport_error(error));
    }

    HttpResponse response;
    response.status = res.status;
    response.body = std::move(buffered);
    for (const auto& [k, v] : res.headers) {
        response.headers[k] = v;
    }
    return response;
}

} // anonymous namespace

struct HttpClient::Impl {
    boost::asio::io_context& ioc;
    HttpClientConfig config;

    /// Runs `execute` on a detached thread and resumes the awaiting
    /// coroutine on the io_context once it finishes.
    auto dispatch(std::string path, std::string body, std::string content_type,
                  std::map<std::string, std::string> headers, HttpChunkCallback chunk_cb)
        -> boost::asio::awaitable<Result<HttpResponse>> {
        struct Outcome {
            std::mutex mtx;
            std::optional<Result<HttpResponse>> result;
        };

        auto outcome = std::make_shared<Outcome>();
        auto timer = std::make_shared<boost::asio::steady_timer>(
            ioc, boost::asio::steady_timer::time_point::max());

        std::thread([outcome, timer, config = config, path = std::move(path),
                     body = std::move(body), content_type = std::move(content_type),
                     headers = std::move(headers), chunk_cb = std::move(chunk_cb)] {
            LOG_DEBUG("POST {}{}", config.base_url, path);
            auto result = execute(config, path, body, content_type, headers, chunk_cb);
            if (result) {
                LOG_DEBUG("POST {}{} -> {}", config.base_url, path, result->status);
            } else {
                LOG_DEBUG("POST {}{} failed: {}", config.base_url, path, result.error().what());
            }
            {
                std::lock_guard lock(outcome->mtx);
                outcome->result = std::move(result);
            }
            boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
        }).detach();

        boost::system::error_code ec;
        co_await timer->async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        std::lock_guard lock(outcome->mtx);
        if (!outcome->result.has_value()) {
            co_return make_fail(make_error(
                ErrorCode::ConnectionClosed, "HTTP request was cancelled", ec.message()));
        }
        co_return std::move(*outcome->result);
    }
};

HttpClient::HttpClient(boost::asio::io_context& ioc, HttpClientConfig config)
    : impl_(std::make_unique<Impl>(Impl{ioc, std::move(config)})) {
    LOG_DEBUG("HTTP client created for {}", impl_->config.base_url);
}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

auto HttpClient::post(std::string_view path,
                      std::string_view body,
                      std::string_view content_type,
                      const std::map<std::string, std::string>& headers)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    co_return co_await impl_->dispatch(std::string(path), std::string(body),
                                       std::string(content_type), headers, {});
}

auto HttpClient::post_stream(std::string_view path,
                             std::string_view body,
                             std::string_view content_type,
                             const std::map<std::string, std::string>& headers,
                             HttpChunkCallback chunk_cb)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    co_return co_await impl_->dispatch(std::string(path), std::string(body),
                                       std::string(content_type), headers,
                                       std::move(chunk_cb));
}

auto HttpClient::base_url() const -> const std::string& {
    return impl_->config.base_url;
}

} // namespace bedrockkit::infra
