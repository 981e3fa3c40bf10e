#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "bedrockkit/core/error.hpp"
#include "bedrockkit/core/types.hpp"

namespace bedrockkit::llm {

/// Folds the ordered events of a streamed Messages API response into the
/// JSON shape of the equivalent non-streamed response.
///
/// Each apply() is one step of a left fold. Event kinds other than
/// message_start, content_block_start, content_block_delta and
/// message_delta leave the state untouched. Tool input arrives as partial
/// JSON fragments and is only parsed by finish().
///
/// After the first failed step the accumulator rejects further events.
class StreamAccumulator {
public:
    auto apply(const json& event) -> VoidResult;

    /// Parses buffered tool input and yields the final response. An empty
    /// fragment buffer becomes `{}`.
    auto finish() && -> Result<json>;

    /// Current state, without the buffered tool input.
    [[nodiscard]] auto snapshot() const -> const json& { return raw_; }

    [[nodiscard]] auto events_applied() const noexcept -> size_t { return events_applied_; }

private:
    auto on_message_start(const json& event) -> VoidResult;
    auto on_content_block_start(const json& event) -> VoidResult;
    auto on_content_block_delta(const json& event) -> VoidResult;
    auto on_message_delta(const json& event) -> VoidResult;

    json raw_ = json::object();
    std::map<size_t, std::string> partial_json_;
    size_t events_applied_ = 0;
    bool failed_ = false;
};

/// Applies every event in order and finishes.
auto reassemble(const std::vector<json>& events) -> Result<json>;

} // namespace bedrockkit::llm
