#include "bedrockkit/core/utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace bedrockkit::utils {

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto base64_encode(std::string_view data) -> std::string {
    static constexpr std::string_view table =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < data.size()) {
        auto a = static_cast<uint8_t>(data[i++]);
        auto b = static_cast<uint8_t>(data[i++]);
        auto c = static_cast<uint8_t>(data[i++]);
        result += table[(a >> 2) & 0x3F];
        result += table[((a & 0x03) << 4) | ((b >> 4) & 0x0F)];
        result += table[((b & 0x0F) << 2) | ((c >> 6) & 0x03)];
        result += table[c & 0x3F];
    }
    if (i < data.size()) {
        auto a = static_cast<uint8_t>(data[i++]);
        result += table[(a >> 2) & 0x3F];
        if (i < data.size()) {
            auto b = static_cast<uint8_t>(data[i]);
            result += table[((a & 0x03) << 4) | ((b >> 4) & 0x0F)];
            result += table[((b & 0x0F) << 2)];
        } else {
            result += table[(a & 0x03) << 4];
            result += '=';
        }
        result += '=';
    }
    return result;
}

namespace {
constexpr auto make_b64_decode_table() -> std::array<uint8_t, 256> {
    std::array<uint8_t, 256> t{};
    for (int i = 0; i < 26; ++i) t['A' + i] = static_cast<uint8_t>(i);
    for (int i = 0; i < 26; ++i) t['a' + i] = static_cast<uint8_t>(26 + i);
    for (int i = 0; i < 10; ++i) t['0' + i] = static_cast<uint8_t>(52 + i);
    t['+'] = 62;
    t['/'] = 63;
    return t;
}
} // namespace

auto base64_decode(std::string_view data) -> std::string {
    static constexpr auto table = make_b64_decode_table();

    std::string result;
    result.reserve((data.size() / 4) * 3);

    uint32_t buf = 0;
    int bits = 0;
    for (char c : data) {
        if (c == '=' || c == '\n' || c == '\r') continue;
        buf = (buf << 6) | table[static_cast<uint8_t>(c)];
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result += static_cast<char>((buf >> bits) & 0xFF);
        }
    }
    return result;
}

auto hex_encode(std::string_view data) -> std::string {
    std::ostringstream oss;
    for (unsigned char c : data) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(c);
    }
    return oss.str();
}

auto sha256(std::string_view data) -> std::string {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
    EVP_DigestUpdate(ctx, data.data(), data.size());
    EVP_DigestFinal_ex(ctx, hash, &hash_len);
    EVP_MD_CTX_free(ctx);

    return hex_encode(std::string_view(reinterpret_cast<const char*>(hash), hash_len));
}

auto hmac_sha256(std::string_view key, std::string_view data) -> std::string {
    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int result_len = 0;

    HMAC(EVP_sha256(),
         key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()),
         data.size(),
         result, &result_len);

    return std::string(reinterpret_cast<char*>(result), result_len);
}

auto url_encode(std::string_view s) -> std::string {
    std::ostringstream oss;
    for (char c : s) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::hex << std::uppercase << std::setfill('0')
                << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
        }
    }
    return oss.str();
}

} // namespace bedrockkit::utils
