#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "slackline/cli/app.hpp"
#include "slackline/core/error.hpp"

namespace slackline::cli {

/// Register the `render` subcommand.
/// Converts markdown from a file or stdin and prints the chat.postMessage body.
auto register_render_command(CLI::App& app) -> CommandHandler;

/// Register the `admit` subcommand.
/// Runs a Slack event envelope through the admission filter and prints the decision.
auto register_admit_command(CLI::App& app) -> CommandHandler;

/// Register the `config` subcommand.
/// Shows or validates the current configuration.
auto register_config_command(CLI::App& app) -> CommandHandler;

/// Register the `version` subcommand.
/// Prints the build version and exits.
auto register_version_command(CLI::App& app) -> CommandHandler;

/// Reads a whole file, or stdin when `path` is empty or "-".
auto read_input(const std::string& path) -> Result<std::string>;

} // namespace slackline::cli
