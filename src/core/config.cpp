#include "bedrockkit/core/config.hpp"
#include "bedrockkit/core/logger.hpp"

#include <cstdlib>
#include <fstream>

namespace bedrockkit {

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        resolve_env_refs_in(j);

        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto* val = std::getenv("AWS_REGION")) {
        config.aws.region = val;
    } else if (auto* fallback = std::getenv("AWS_DEFAULT_REGION")) {
        config.aws.region = fallback;
    }
    if (auto* val = std::getenv("AWS_ACCESS_KEY_ID")) {
        config.aws.access_key_id = val;
    }
    if (auto* val = std::getenv("AWS_SECRET_ACCESS_KEY")) {
        config.aws.secret_access_key = val;
    }
    if (auto* val = std::getenv("AWS_SESSION_TOKEN")) {
        config.aws.session_token = val;
    }
    if (auto* val = std::getenv("BEDROCKKIT_ENDPOINT")) {
        config.aws.endpoint = val;
    }
    if (auto* val = std::getenv("BEDROCKKIT_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("BEDROCKKIT_COMPLETION_MODEL")) {
        config.defaults.completion_model = val;
    }
    if (auto* val = std::getenv("BEDROCKKIT_CHAT_MODEL")) {
        config.defaults.chat_completion_model = val;
    }
    if (auto* val = std::getenv("BEDROCKKIT_EMBEDDING_MODEL")) {
        config.defaults.embedding_model = val;
    }

    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // $${VAR} -> literal ${VAR}
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                auto var_name = input.substr(i + 2, close - i - 2);
                std::string var_name_str(var_name);

                if (auto* val = std::getenv(var_name_str.c_str())) {
                    result += val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

void resolve_env_refs_in(json& j) {
    if (j.is_string()) {
        j = resolve_env_refs(j.get_ref<const std::string&>());
    } else if (j.is_structured()) {
        for (auto& child : j) {
            resolve_env_refs_in(child);
        }
    }
}

} // namespace bedrockkit
