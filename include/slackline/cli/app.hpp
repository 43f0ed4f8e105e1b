#pragma once

#include <functional>
#include <map>
#include <string>

#include <CLI/CLI.hpp>

#include "slackline/core/config.hpp"

namespace slackline::cli {

/// State shared by every subcommand. Filled in by App::run() after argument
/// parsing and before the selected subcommand runs.
struct Context {
    Config config;
    std::string config_path;
    std::string log_level;
};

/// Runs a parsed subcommand and returns the process exit code.
using CommandHandler = std::function<int(const Context&)>;

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, loads the configuration and
/// dispatches to the selected subcommand (render, admit, config, version).
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    [[nodiscard]] auto context() const -> const Context&;

private:
    /// Register all subcommands on the CLI11 app.
    void setup_commands();

    /// Config file when one was given, otherwise defaults. Environment
    /// overrides and --log-level apply on top.
    auto load_context() -> bool;

    CLI::App cli_;
    Context context_;
    std::map<std::string, CommandHandler> handlers_;
};

} // namespace slackline::cli
