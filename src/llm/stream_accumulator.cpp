#include "bedrockkit/llm/stream_accumulator.hpp"

#include <optional>

#include "bedrockkit/core/logger.hpp"

namespace bedrockkit::llm {

namespace {

auto malformed(std::string message, std::string detail = {}) -> Error {
    return make_error(ErrorCode::MalformedStream, std::move(message), std::move(detail));
}

/// Reads an optional string member. Absent is empty; any other type is an
/// error.
auto string_field(const json& object, const char* key) -> std::optional<std::string> {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return std::string();
    if (!it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

/// Event and delta kinds; a non-string kind matches nothing.
auto kind_of(const json& object) -> std::string {
    auto it = object.find("type");
    if (it == object.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

auto block_index(const json& event) -> Result<size_t> {
    auto it = event.find("index");
    if (it == event.end() || !it->is_number_integer() || it->get<long long>() < 0) {
        return std::unexpected(malformed(
            "Stream event has no valid content block index", kind_of(event)));
    }
    return static_cast<size_t>(it->get<long long>());
}

} // anonymous namespace

auto StreamAccumulator::apply(const json& event) -> VoidResult {
    if (failed_) {
        return std::unexpected(malformed("Stream accumulator already failed"));
    }
    if (!event.is_object()) {
        failed_ = true;
        return std::unexpected(malformed("Stream event is not a JSON object"));
    }

    auto type = kind_of(event);
    VoidResult result;
    if (type == "message_start") {
        result = on_message_start(event);
    } else if (type == "content_block_start") {
        result = on_content_block_start(event);
    } else if (type == "content_block_delta") {
        result = on_content_block_delta(event);
    } else if (type == "message_delta") {
        result = on_message_delta(event);
    } else {
        LOG_TRACE("Ignoring stream event '{}'", type);
    }

    if (!result) {
        failed_ = true;
        return result;
    }
    ++events_applied_;
    return result;
}

auto StreamAccumulator::on_message_start(const json& event) -> VoidResult {
    auto it = event.find("message");
    if (it == event.end() || !it->is_object()) {
        return std::unexpected(malformed("message_start carries no message object"));
    }
    raw_ = *it;
    partial_json_.clear();
    return {};
}

auto StreamAccumulator::on_content_block_start(const json& event) -> VoidResult {
    auto index = block_index(event);
    if (!index) return std::unexpected(index.error());

    auto block = event.find("content_block");
    if (block == event.end() || !block->is_object()) {
        return std::unexpected(malformed("content_block_start carries no content block"));
    }

    auto& content = raw_["content"];
    if (!content.is_array()) content = json::array();

    if (*index > content.size()) {
        return std::unexpected(malformed(
            "content_block_start skips a block index", std::to_string(*index)));
    }
    if (*index == content.size()) {
        content.push_back(*block);
    } else {
        content[*index] = *block;
    }
    partial_json_.erase(*index);
    return {};
}

auto StreamAccumulator::on_content_block_delta(const json& event) -> VoidResult {
    auto index = block_index(event);
    if (!index) return std::unexpected(index.error());

    auto content = raw_.find("content");
    if (content == raw_.end() || !content->is_array() || *index >= content->size()) {
        return std::unexpected(malformed(
            "content_block_delta for a block that was never started",
            std::to_string(*index)));
    }

    auto delta = event.find("delta");
    if (delta == event.end() || !delta->is_object()) {
        return std::unexpected(malformed("content_block_delta carries no delta"));
    }

    auto delta_type = kind_of(*delta);
    if (delta_type == "text_delta") {
        auto& block = (*content)[*index];
        if (!block.is_object()) {
            return std::unexpected(malformed(
                "text_delta targets a content block that is not an object",
                std::to_string(*index)));
        }
        auto text = string_field(block, "text");
        auto fragment = string_field(*delta, "text");
        if (!text || !fragment) {
            return std::unexpected(malformed(
                "text_delta carries non-string text", std::to_string(*index)));
        }
        block["text"] = std::move(*text) + *fragment;
    } else if (delta_type == "input_json_delta") {
        auto fragment = string_field(*delta, "partial_json");
        if (!fragment) {
            return std::unexpected(malformed(
                "input_json_delta carries non-string partial_json",
                std::to_string(*index)));
        }
        partial_json_[*index] += *fragment;
    } else {
        LOG_TRACE("Ignoring content block delta '{}'", delta_type);
    }
    return {};
}

auto StreamAccumulator::on_message_delta(const json& event) -> VoidResult {
    if (auto delta = event.find("delta"); delta != event.end() && delta->is_object()) {
        for (const auto& [key, value] : delta->items()) {
            raw_[key] = value;
        }
    }
    if (auto usage = event.find("usage"); usage != event.end() && usage->is_object()) {
        auto& current = raw_["usage"];
        if (!current.is_object()) current = json::object();
        current.update(*usage);
    }
    return {};
}

auto StreamAccumulator::finish() && -> Result<json> {
    if (failed_) {
        return std::unexpected(malformed("Stream accumulator already failed"));
    }

    for (auto& [index, fragments] : partial_json_) {
        auto content = raw_.find("content");
        if (content == raw_.end() || !content->is_array() || index >= content->size()
            || !(*content)[index].is_object()) {
            return std::unexpected(malformed(
                "Tool input targets a content block that no longer exists",
                std::to_string(index)));
        }

        json input = json::object();
        if (!fragments.empty()) {
            input = json::parse(fragments, nullptr, false);
            if (input.is_discarded()) {
                return std::unexpected(malformed(
                    "Tool input of content block is not valid JSON",
                    std::to_string(index)));
            }
        }
        (*content)[index]["input"] = std::move(input);
    }

    LOG_TRACE("Stream reassembled from {} events", events_applied_);
    return std::move(raw_);
}

auto reassemble(const std::vector<json>& events) -> Result<json> {
    StreamAccumulator acc;
    for (const auto& event : events) {
        if (auto r = acc.apply(event); !r) {
            return std::unexpected(r.error());
        }
    }
    return std::move(acc).finish();
}

} // namespace bedrockkit::llm
