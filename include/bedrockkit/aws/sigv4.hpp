#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace bedrockkit::aws {

struct Credentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::optional<std::string> session_token;
};

/// Headers to attach to a signed request.
struct SignedHeaders {
    std::string authorization;
    std::string amz_date;
    std::map<std::string, std::string> headers;  // includes Authorization
};

/// AWS Signature Version 4 request signer for a single region/service pair.
///
/// `path` is the request path exactly as sent on the wire (already
/// percent-encoded once). The canonical URI encodes every path segment a
/// second time, as SigV4 requires for every service except S3.
class SigV4Signer {
public:
    SigV4Signer(Credentials credentials, std::string region, std::string service);

    /// Signs a request. `headers` must contain `host`; header names are
    /// matched case-insensitively.
    [[nodiscard]] auto sign(std::string_view method,
                            std::string_view path,
                            std::string_view query,
                            const std::map<std::string, std::string>& headers,
                            std::string_view payload,
                            std::chrono::system_clock::time_point now) const
        -> SignedHeaders;

    /// The canonical request string for the given inputs (headers already
    /// carrying x-amz-date).
    [[nodiscard]] static auto canonical_request(
        std::string_view method,
        std::string_view path,
        std::string_view query,
        const std::map<std::string, std::string>& headers,
        std::string_view payload) -> std::string;

    /// kSigning = HMAC chain over date, region, service, "aws4_request".
    [[nodiscard]] static auto derive_signing_key(std::string_view secret,
                                                 std::string_view date_stamp,
                                                 std::string_view region,
                                                 std::string_view service)
        -> std::string;

    [[nodiscard]] auto region() const -> const std::string& { return region_; }

private:
    Credentials credentials_;
    std::string region_;
    std::string service_;
};

/// Formats a time point as the SigV4 `YYYYMMDDTHHMMSSZ` and `YYYYMMDD` pair.
auto format_amz_date(std::chrono::system_clock::time_point tp)
    -> std::pair<std::string, std::string>;

} // namespace bedrockkit::aws
