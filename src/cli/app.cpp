#include "slackline/cli/app.hpp"
#include "slackline/cli/commands.hpp"
#include "slackline/core/logger.hpp"

#include <filesystem>
#include <iostream>

// Version string; typically injected by CMake via -DSLACKLINE_VERSION_STRING=...
#ifndef SLACKLINE_VERSION_STRING
#define SLACKLINE_VERSION_STRING "0.1.0-dev"
#endif

namespace slackline::cli {

App::App()
    : cli_("slackline", "Slack markdown rendering and event admission")
{
    cli_.set_version_flag("--version", SLACKLINE_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", context_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("SLACKLINE_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override. Empty means "from config".
    cli_.add_option("--log-level", context_.log_level,
                    "Log level (trace, debug, info, warn, error, critical)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical"}));

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    Logger::init("slackline", context_.log_level.empty() ? "info" : context_.log_level);

    if (!load_context()) {
        return 1;
    }

    for (const auto* sub : cli_.get_subcommands()) {
        auto it = handlers_.find(sub->get_name());
        if (it != handlers_.end()) {
            int code = it->second(context_);
            Logger::flush();
            return code;
        }
    }
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::context() const -> const Context& {
    return context_;
}

auto App::load_context() -> bool {
    Config base = default_config();

    if (!context_.config_path.empty()) {
        LOG_INFO("Loading configuration from: {}", context_.config_path);
        auto loaded = load_config(std::filesystem::path(context_.config_path));
        if (!loaded) {
            LOG_ERROR("Configuration error: {}", loaded.error().what());
            std::cerr << "error: " << loaded.error().what() << "\n";
            return false;
        }
        base = std::move(*loaded);
    }

    context_.config = load_config_from_env(std::move(base));
    if (!context_.log_level.empty()) {
        context_.config.log_level = context_.log_level;
    }
    Logger::set_level(context_.config.log_level);
    return true;
}

void App::setup_commands() {
    handlers_["render"] = register_render_command(cli_);
    handlers_["admit"] = register_admit_command(cli_);
    handlers_["config"] = register_config_command(cli_);
    handlers_["version"] = register_version_command(cli_);
}

} // namespace slackline::cli
