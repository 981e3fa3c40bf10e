#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "bedrockkit/core/error.hpp"
#include "bedrockkit/core/types.hpp"
#include "bedrockkit/llm/parameters.hpp"
#include "bedrockkit/llm/response.hpp"

namespace bedrockkit::llm {

/// A completion wire body read back into canonical terms. Only the
/// fields the provider's body carries are set.
struct DecodedCompletion {
    CompletionOverrides params;
    std::string prompt;
};

/// Abstract base class for per-provider request/response translation.
///
/// Each adapter knows how one Bedrock model vendor names and nests its
/// request fields and which response type wraps its replies. Operations
/// a vendor does not offer fail with UnsupportedProvider.
class ModelAdapter {
public:
    virtual ~ModelAdapter() = default;

    [[nodiscard]] virtual auto provider() const noexcept -> Provider = 0;

    /// Applies the vendor's prompt template for single-shot completion.
    [[nodiscard]] virtual auto wrap_prompt(std::string_view prompt) const -> std::string;

    /// Inverse of wrap_prompt.
    [[nodiscard]] virtual auto unwrap_prompt(std::string_view wrapped) const -> std::string;

    [[nodiscard]] virtual auto completion_body(const CompletionParameters& params,
                                               std::string_view prompt) const -> Result<json>;

    [[nodiscard]] virtual auto decode_completion_body(const json& body) const
        -> Result<DecodedCompletion>;

    [[nodiscard]] virtual auto chat_body(const ChatParameters& params) const -> Result<json>;

    [[nodiscard]] virtual auto embedding_body(std::string_view text,
                                              const json& extra) const -> Result<json>;

    [[nodiscard]] virtual auto wrap_response(json raw) const -> ResponsePtr = 0;

protected:
    [[nodiscard]] auto unsupported(Operation op) const -> Error;

    /// `body[key]` converted to T, or nullopt when absent, null or of
    /// another type.
    template <typename T>
    static auto read_field(const json& body, const char* key) -> std::optional<T> {
        auto it = body.find(key);
        if (it == body.end() || it->is_null()) return std::nullopt;
        try {
            return it->template get<T>();
        } catch (const json::type_error&) {
            return std::nullopt;
        }
    }
};

/// The adapter registered for `provider`, or nullptr.
auto adapter_for(Provider provider) -> const ModelAdapter*;

} // namespace bedrockkit::llm
