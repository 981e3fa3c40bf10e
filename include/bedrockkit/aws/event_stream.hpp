#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "bedrockkit/core/error.hpp"

namespace bedrockkit::aws {

/// One message of the `application/vnd.amazon.eventstream` framing.
///
/// Header values of every wire type are kept as strings: strings and byte
/// arrays verbatim, booleans as "true"/"false", integers and timestamps in
/// decimal, UUIDs as 32 lowercase hex digits.
struct EventStreamMessage {
    std::map<std::string, std::string> headers;
    std::string payload;

    /// Value of a header, or an empty view when absent.
    [[nodiscard]] auto header(std::string_view name) const -> std::string_view;
};

/// Incremental decoder for the AWS binary event-stream framing.
///
/// Frame layout (all integers big-endian):
///   total length (u32) | headers length (u32) | prelude CRC32 (u32) |
///   headers | payload | message CRC32 (u32)
///
/// Bytes may arrive split at arbitrary boundaries; complete messages are
/// returned in arrival order. After the first framing error the decoder
/// stays failed.
class EventStreamDecoder {
public:
    static constexpr uint32_t kPreludeLength = 12;
    static constexpr uint32_t kMinMessageLength = 16;
    static constexpr uint32_t kMaxMessageLength = 16 * 1024 * 1024;

    auto feed(std::string_view bytes) -> Result<std::vector<EventStreamMessage>>;

    /// Bytes received but not yet forming a complete message.
    [[nodiscard]] auto buffered() const noexcept -> size_t { return buffer_.size(); }

    [[nodiscard]] auto failed() const noexcept -> bool { return failed_; }

private:
    std::string buffer_;
    bool failed_ = false;
};

/// Encodes a message with string-typed headers. Used to build frames for
/// local endpoints and tests.
auto encode_event_stream_message(const EventStreamMessage& message) -> std::string;

} // namespace bedrockkit::aws
