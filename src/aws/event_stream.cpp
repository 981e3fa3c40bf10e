#include "bedrockkit/aws/event_stream.hpp"

#include <boost/crc.hpp>

#include "bedrockkit/core/logger.hpp"
#include "bedrockkit/core/utils.hpp"

namespace bedrockkit::aws {

namespace {

enum class HeaderType : uint8_t {
    BoolTrue = 0,
    BoolFalse = 1,
    Byte = 2,
    Short = 3,
    Integer = 4,
    Long = 5,
    ByteArray = 6,
    String = 7,
    Timestamp = 8,
    Uuid = 9,
};

auto crc32(std::string_view data) -> uint32_t {
    boost::crc_32_type crc;
    crc.process_bytes(data.data(), data.size());
    return crc.checksum();
}

auto read_be(std::string_view data, size_t offset, size_t width) -> uint64_t {
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        value = (value << 8) | static_cast<uint8_t>(data[offset + i]);
    }
    return value;
}

void write_be(std::string& out, uint64_t value, size_t width) {
    for (size_t i = width; i > 0; --i) {
        out += static_cast<char>((value >> ((i - 1) * 8)) & 0xFF);
    }
}

auto signed_value(uint64_t raw, size_t width) -> int64_t {
    auto shift = 64 - width * 8;
    return static_cast<int64_t>(raw << shift) >> shift;
}

auto parse_headers(std::string_view data) -> Result<std::map<std::string, std::string>> {
    std::map<std::string, std::string> headers;
    size_t pos = 0;

    auto need = [&](size_t n) { return pos + n <= data.size(); };
    auto truncated = [] {
        return make_error(ErrorCode::MalformedStream, "Truncated event-stream header");
    };

    while (pos < data.size()) {
        auto name_len = static_cast<uint8_t>(data[pos++]);
        if (name_len == 0 || !need(name_len + 1u)) return std::unexpected(truncated());
        std::string name(data.substr(pos, name_len));
        pos += name_len;

        auto type = static_cast<HeaderType>(static_cast<uint8_t>(data[pos++]));
        std::string value;
        switch (type) {
            case HeaderType::BoolTrue: value = "true"; break;
            case HeaderType::BoolFalse: value = "false"; break;
            case HeaderType::Byte:
            case HeaderType::Short:
            case HeaderType::Integer:
            case HeaderType::Long:
            case HeaderType::Timestamp: {
                size_t width = type == HeaderType::Byte ? 1
                             : type == HeaderType::Short ? 2
                             : type == HeaderType::Integer ? 4 : 8;
                if (!need(width)) return std::unexpected(truncated());
                value = std::to_string(signed_value(read_be(data, pos, width), width));
                pos += width;
                break;
            }
            case HeaderType::ByteArray:
            case HeaderType::String: {
                if (!need(2)) return std::unexpected(truncated());
                auto len = static_cast<size_t>(read_be(data, pos, 2));
                pos += 2;
                if (!need(len)) return std::unexpected(truncated());
                value = std::string(data.substr(pos, len));
                pos += len;
                break;
            }
            case HeaderType::Uuid:
                if (!need(16)) return std::unexpected(truncated());
                value = utils::hex_encode(data.substr(pos, 16));
                pos += 16;
                break;
            default:
                return std::unexpected(make_error(
                    ErrorCode::MalformedStream,
                    "Unknown event-stream header type",
                    std::to_string(static_cast<int>(type))));
        }
        headers[std::move(name)] = std::move(value);
    }
    return headers;
}

} // anonymous namespace

auto EventStreamMessage::header(std::string_view name) const -> std::string_view {
    auto it = headers.find(std::string(name));
    if (it == headers.end()) return {};
    return it->second;
}

auto EventStreamDecoder::feed(std::string_view bytes)
    -> Result<std::vector<EventStreamMessage>> {
    if (failed_) {
        return std::unexpected(make_error(
            ErrorCode::MalformedStream, "Event-stream decoder already failed"));
    }
    buffer_.append(bytes);

    std::vector<EventStreamMessage> messages;
    size_t offset = 0;

    auto fail = [this](Error err) -> Result<std::vector<EventStreamMessage>> {
        failed_ = true;
        buffer_.clear();
        return std::unexpected(std::move(err));
    };

    while (buffer_.size() - offset >= kPreludeLength) {
        std::string_view view(buffer_);
        view.remove_prefix(offset);

        auto total_length = static_cast<uint32_t>(read_be(view, 0, 4));
        auto headers_length = static_cast<uint32_t>(read_be(view, 4, 4));
        auto prelude_crc = static_cast<uint32_t>(read_be(view, 8, 4));

        if (crc32(view.substr(0, 8)) != prelude_crc) {
            return fail(make_error(ErrorCode::MalformedStream,
                                   "Event-stream prelude checksum mismatch"));
        }
        if (total_length < kMinMessageLength || total_length > kMaxMessageLength ||
            headers_length > total_length - kMinMessageLength) {
            return fail(make_error(ErrorCode::MalformedStream,
                                   "Invalid event-stream message length",
                                   std::to_string(total_length)));
        }
        if (view.size() < total_length) break;

        auto message_crc = static_cast<uint32_t>(read_be(view, total_length - 4, 4));
        if (crc32(view.substr(0, total_length - 4)) != message_crc) {
            return fail(make_error(ErrorCode::MalformedStream,
                                   "Event-stream message checksum mismatch"));
        }

        auto headers = parse_headers(view.substr(kPreludeLength, headers_length));
        if (!headers) return fail(headers.error());

        EventStreamMessage message;
        message.headers = std::move(*headers);
        auto payload_length = total_length - kMinMessageLength - headers_length;
        message.payload = std::string(view.substr(kPreludeLength + headers_length, payload_length));
        messages.push_back(std::move(message));

        offset += total_length;
    }

    buffer_.erase(0, offset);
    LOG_TRACE("Event-stream decoder produced {} message(s), {} byte(s) buffered",
              messages.size(), buffer_.size());
    return messages;
}

auto encode_event_stream_message(const EventStreamMessage& message) -> std::string {
    std::string headers;
    for (const auto& [name, value] : message.headers) {
        headers += static_cast<char>(name.size());
        headers += name;
        headers += static_cast<char>(HeaderType::String);
        write_be(headers, value.size(), 2);
        headers += value;
    }

    auto total_length = EventStreamDecoder::kMinMessageLength + headers.size() +
                        message.payload.size();

    std::string frame;
    frame.reserve(total_length);
    write_be(frame, total_length, 4);
    write_be(frame, headers.size(), 4);
    write_be(frame, crc32(frame), 4);
    frame += headers;
    frame += message.payload;
    write_be(frame, crc32(frame), 4);
    return frame;
}

} // namespace bedrockkit::aws
