#include "bedrockkit/aws/sigv4.hpp"

#include <algorithm>
#include <ctime>
#include <sstream>
#include <utility>
#include <vector>

#include "bedrockkit/core/utils.hpp"

namespace bedrockkit::aws {

namespace {

constexpr auto kAlgorithm = "AWS4-HMAC-SHA256";

/// Second encoding pass over an already encoded path; '/' separators stay.
auto canonical_uri(std::string_view path) -> std::string {
    if (path.empty()) return "/";
    std::string result;
    result.reserve(path.size());
    size_t start = 0;
    while (start <= path.size()) {
        auto slash = path.find('/', start);
        auto end = slash == std::string_view::npos ? path.size() : slash;
        result += utils::url_encode(path.substr(start, end - start));
        if (slash == std::string_view::npos) break;
        result += '/';
        start = slash + 1;
    }
    return result;
}

/// Canonical query string: parameters sorted by name, then value.
auto canonical_query(std::string_view query) -> std::string {
    if (query.empty()) return "";
    std::vector<std::pair<std::string, std::string>> params;
    for (const auto& part : utils::split(query, '&')) {
        if (part.empty()) continue;
        auto eq = part.find('=');
        if (eq == std::string::npos) {
            params.emplace_back(part, "");
        } else {
            params.emplace_back(part.substr(0, eq), part.substr(eq + 1));
        }
    }
    std::sort(params.begin(), params.end());

    std::string result;
    for (const auto& [k, v] : params) {
        if (!result.empty()) result += '&';
        result += k + "=" + v;
    }
    return result;
}

/// Lower-cased, trimmed, sorted header list.
auto normalized_headers(const std::map<std::string, std::string>& headers)
    -> std::vector<std::pair<std::string, std::string>> {
    std::vector<std::pair<std::string, std::string>> sorted;
    sorted.reserve(headers.size());
    for (const auto& [k, v] : headers) {
        sorted.emplace_back(utils::to_lower(k), utils::trim(v));
    }
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

auto signed_header_list(const std::vector<std::pair<std::string, std::string>>& sorted)
    -> std::string {
    std::string names;
    for (const auto& [k, v] : sorted) {
        if (!names.empty()) names += ";";
        names += k;
    }
    return names;
}

} // anonymous namespace

auto format_amz_date(std::chrono::system_clock::time_point tp)
    -> std::pair<std::string, std::string> {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t);
#else
    gmtime_r(&time_t, &tm_buf);
#endif

    char amz_date[17];  // YYYYMMDDTHHMMSSZ
    std::strftime(amz_date, sizeof(amz_date), "%Y%m%dT%H%M%SZ", &tm_buf);

    char date_stamp[9];  // YYYYMMDD
    std::strftime(date_stamp, sizeof(date_stamp), "%Y%m%d", &tm_buf);

    return {std::string(amz_date), std::string(date_stamp)};
}

SigV4Signer::SigV4Signer(Credentials credentials, std::string region, std::string service)
    : credentials_(std::move(credentials))
    , region_(std::move(region))
    , service_(std::move(service)) {}

auto SigV4Signer::canonical_request(
    std::string_view method,
    std::string_view path,
    std::string_view query,
    const std::map<std::string, std::string>& headers,
    std::string_view payload) -> std::string {

    auto sorted = normalized_headers(headers);

    std::ostringstream canonical;
    canonical << method << "\n";
    canonical << canonical_uri(path) << "\n";
    canonical << canonical_query(query) << "\n";
    for (const auto& [k, v] : sorted) {
        canonical << k << ":" << v << "\n";
    }
    canonical << "\n";
    canonical << signed_header_list(sorted) << "\n";
    canonical << utils::sha256(payload);

    return canonical.str();
}

auto SigV4Signer::derive_signing_key(std::string_view secret,
                                     std::string_view date_stamp,
                                     std::string_view region,
                                     std::string_view service) -> std::string {
    auto k_date = utils::hmac_sha256("AWS4" + std::string(secret), date_stamp);
    auto k_region = utils::hmac_sha256(k_date, region);
    auto k_service = utils::hmac_sha256(k_region, service);
    return utils::hmac_sha256(k_service, "aws4_request");
}

auto SigV4Signer::sign(std::string_view method,
                       std::string_view path,
                       std::string_view query,
                       const std::map<std::string, std::string>& headers,
                       std::string_view payload,
                       std::chrono::system_clock::time_point now) const
    -> SignedHeaders {
    auto [amz_date, date_stamp] = format_amz_date(now);

    std::map<std::string, std::string> sign_headers = headers;
    sign_headers["x-amz-date"] = amz_date;
    if (credentials_.session_token.has_value()) {
        sign_headers["x-amz-security-token"] = *credentials_.session_token;
    }

    auto canonical = canonical_request(method, path, query, sign_headers, payload);
    auto scope = date_stamp + "/" + region_ + "/" + service_ + "/aws4_request";

    std::string string_to_sign = std::string(kAlgorithm) + "\n" + amz_date + "\n" +
                                 scope + "\n" + utils::sha256(canonical);

    auto signing_key = derive_signing_key(credentials_.secret_access_key,
                                          date_stamp, region_, service_);
    auto signature = utils::hex_encode(utils::hmac_sha256(signing_key, string_to_sign));

    SignedHeaders signed_headers;
    signed_headers.amz_date = amz_date;
    signed_headers.authorization =
        std::string(kAlgorithm) + " Credential=" + credentials_.access_key_id + "/" +
        scope + ", SignedHeaders=" + signed_header_list(normalized_headers(sign_headers)) +
        ", Signature=" + signature;

    signed_headers.headers["Authorization"] = signed_headers.authorization;
    signed_headers.headers["X-Amz-Date"] = amz_date;
    if (credentials_.session_token.has_value()) {
        signed_headers.headers["X-Amz-Security-Token"] = *credentials_.session_token;
    }
    return signed_headers;
}

} // namespace bedrockkit::aws
