#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "slackline/channels/auth_policy.hpp"
#include "slackline/core/error.hpp"

namespace slackline {

using json = nlohmann::json;

/// Slack adapter settings. The access policy keys (`dm`, `group_policy`,
/// `group_allow_from`) sit directly in the `slack` object.
struct SlackConfig {
    std::string bot_user_id;       // U..., resolved by the transport via auth.test
    bool reply_in_thread = true;   // replies to channel messages go into the thread
    channels::AccessPolicy access;
};

void to_json(json& j, const SlackConfig& c);
void from_json(const json& j, SlackConfig& c);

struct Config {
    std::string log_level = "info";
    SlackConfig slack;
};

void to_json(json& j, const Config& c);
void from_json(const json& j, Config& c);

/// Loads a JSON config file. String values may reference environment
/// variables as `${VAR}`.
auto load_config(const std::filesystem::path& path) -> Result<Config>;

/// Overlays SLACKLINE_LOG_LEVEL and SLACKLINE_BOT_USER_ID onto `base`.
auto load_config_from_env(Config base = {}) -> Config;

auto default_config() -> Config;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace slackline
