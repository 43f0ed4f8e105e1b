#include "slackline/core/config.hpp"
#include "slackline/core/logger.hpp"

#include <cstdlib>
#include <fstream>

namespace slackline {

namespace {

/// Expands env refs in every string value of a parsed config document.
auto resolve_env_refs_in(json& j) -> void {
    if (j.is_string()) {
        j = resolve_env_refs(j.get<std::string>());
    } else if (j.is_object() || j.is_array()) {
        for (auto& elem : j) {
            resolve_env_refs_in(elem);
        }
    }
}

} // namespace

void to_json(json& j, const SlackConfig& c) {
    j = c.access;
    j["bot_user_id"] = c.bot_user_id;
    j["reply_in_thread"] = c.reply_in_thread;
}

void from_json(const json& j, SlackConfig& c) {
    c.bot_user_id = j.value("bot_user_id", "");
    c.reply_in_thread = j.value("reply_in_thread", true);
    c.access = j.get<channels::AccessPolicy>();
}

void to_json(json& j, const Config& c) {
    j = json{
        {"log_level", c.log_level},
        {"slack", c.slack},
    };
}

void from_json(const json& j, Config& c) {
    c.log_level = j.value("log_level", "info");
    if (j.contains("slack")) {
        j.at("slack").get_to(c.slack);
    }
}

auto load_config(const std::filesystem::path& path) -> Result<Config> {
    if (!std::filesystem::exists(path)) {
        return std::unexpected(
            make_error(ErrorCode::NotFound, "Config file not found", path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(
            make_error(ErrorCode::IoError, "Cannot open config file", path.string()));
    }

    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            return std::unexpected(
                make_error(ErrorCode::InvalidConfig, "Config root must be an object",
                           path.string()));
        }
        resolve_env_refs_in(j);

        auto config = j.get<Config>();
        if (config.slack.access.dm.policy == channels::DmPolicy::Unknown) {
            LOG_WARN("Config: unrecognised slack.dm.policy, direct messages will be ignored");
        }
        if (config.slack.access.group_policy == channels::GroupPolicy::Unknown) {
            LOG_WARN("Config: unrecognised slack.group_policy, channel messages will be ignored");
        }
        if (config.slack.bot_user_id.empty()) {
            LOG_WARN("Config: slack.bot_user_id is empty, mention handling is disabled");
        }
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config {}: {}", path.string(), e.what());
        return std::unexpected(
            make_error(ErrorCode::InvalidConfig, "Failed to parse config", e.what()));
    }
}

auto load_config_from_env(Config base) -> Config {
    if (auto* val = std::getenv("SLACKLINE_LOG_LEVEL")) {
        base.log_level = val;
    }
    if (auto* val = std::getenv("SLACKLINE_BOT_USER_ID")) {
        base.slack.bot_user_id = val;
    }
    return base;
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
        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '$' &&
            input[i + 2] == '{') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string var_name(input.substr(i + 2, close - i - 2));

                if (auto* val = std::getenv(var_name.c_str())) {
                    result += val;
                } else {
                    // Unresolved refs stay verbatim.
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

} // namespace slackline
