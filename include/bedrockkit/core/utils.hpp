#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace bedrockkit::utils {

auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;
/// Inverse of base64_decode; builds event-stream chunk payloads in tests.
auto base64_encode(std::string_view data) -> std::string;
auto base64_decode(std::string_view data) -> std::string;
auto hex_encode(std::string_view data) -> std::string;

/// Lowercase hex SHA-256 digest.
auto sha256(std::string_view data) -> std::string;

/// Raw (binary) HMAC-SHA256 of data under key.
auto hmac_sha256(std::string_view key, std::string_view data) -> std::string;

/// RFC 3986 percent-encoding; only unreserved characters pass through.
auto url_encode(std::string_view s) -> std::string;

} // namespace bedrockkit::utils
