#include "slackline/cli/commands.hpp"
#include "slackline/channels/admission.hpp"
#include "slackline/channels/slack_event.hpp"
#include "slackline/core/logger.hpp"
#include "slackline/format/post_message.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>

#include <nlohmann/json.hpp>

// Version string; typically injected by CMake via -D, fallback to a default.
#ifndef SLACKLINE_VERSION_STRING
#define SLACKLINE_VERSION_STRING "0.1.0-dev"
#endif

namespace slackline::cli {

using json = nlohmann::json;

namespace {

auto report(const Error& err) -> int {
    LOG_ERROR("{} ({})", err.what(), error_code_to_string(err.code()));
    std::cerr << "error: " << err.what() << "\n";
    return 1;
}

auto decision_to_json(const channels::AdmissionDecision& decision) -> json {
    if (const auto* admitted = std::get_if<channels::Admitted>(&decision)) {
        return json{
            {"admitted", true},
            {"text", admitted->text},
            {"sender_id", admitted->sender_id},
            {"chat_id", admitted->chat_id},
            {"channel_type", channels::to_string(admitted->channel_type)},
            {"thread_ts", admitted->thread_ts},
        };
    }
    const auto& ignored = std::get<channels::Ignored>(decision);
    return json{
        {"admitted", false},
        {"reason", channels::to_string(ignored.reason)},
    };
}

} // anonymous namespace

auto read_input(const std::string& path) -> Result<std::string> {
    if (path.empty() || path == "-") {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        return buffer.str();
    }

    if (!std::filesystem::exists(path)) {
        return std::unexpected(make_error(ErrorCode::NotFound, "Input file not found", path));
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::IoError, "Cannot open input file", path));
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

// ---------------------------------------------------------------------------
// render command
// ---------------------------------------------------------------------------

auto register_render_command(CLI::App& app) -> CommandHandler {
    struct Options {
        std::string input;
        std::string channel = "C00000000";
        std::string thread_ts;
        bool direct = false;
        std::size_t max_block_length = format::kMaxBlockLength;
        std::size_t max_blocks = format::kMaxBlocks;
    };
    auto opts = std::make_shared<Options>();

    auto* sub = app.add_subcommand("render", "Render markdown as a chat.postMessage body");
    sub->add_option("input", opts->input, "Markdown file (default: stdin)");
    sub->add_option("--channel", opts->channel, "Target conversation id")
        ->capture_default_str();
    sub->add_option("--thread-ts", opts->thread_ts, "Timestamp of the message being answered");
    sub->add_flag("--dm", opts->direct, "Target is a direct message (never threaded)");
    sub->add_option("--max-block-length", opts->max_block_length, "Characters per block")
        ->check(CLI::Range(format::kEllipsis.size() + 1, format::kMaxBlockLength))
        ->capture_default_str();
    sub->add_option("--max-blocks", opts->max_blocks, "Blocks per message")
        ->check(CLI::Range(std::size_t{1}, format::kMaxBlocks))
        ->capture_default_str();

    return [opts](const Context& ctx) -> int {
        auto content = read_input(opts->input);
        if (!content) {
            return report(content.error());
        }

        format::OutboundReply reply;
        reply.channel = opts->channel;
        reply.content = std::move(*content);
        if (!opts->thread_ts.empty()) {
            reply.thread_ts = opts->thread_ts;
        }
        reply.is_direct = opts->direct ||
            channels::channel_type_from_string("", opts->channel) == channels::ChannelType::Im;
        reply.reply_in_thread = ctx.config.slack.reply_in_thread;

        format::ChunkLimits limits{opts->max_block_length, opts->max_blocks};
        std::cout << format::build_post_message(reply, limits).dump(2) << "\n";
        return 0;
    };
}

// ---------------------------------------------------------------------------
// admit command
// ---------------------------------------------------------------------------

auto register_admit_command(CLI::App& app) -> CommandHandler {
    struct Options {
        std::string input;
        std::string bot_id;
    };
    auto opts = std::make_shared<Options>();

    auto* sub = app.add_subcommand("admit", "Run a Slack event through the admission filter");
    sub->add_option("input", opts->input, "Event or envelope JSON file (default: stdin)");
    sub->add_option("--bot-id", opts->bot_id, "Bot user id (overrides config)");

    return [opts](const Context& ctx) -> int {
        auto content = read_input(opts->input);
        if (!content) {
            return report(content.error());
        }

        auto document = json::parse(*content, nullptr, false);
        if (document.is_discarded()) {
            return report(make_error(ErrorCode::SerializationError, "Input is not valid JSON",
                                     opts->input.empty() ? "<stdin>" : opts->input));
        }

        auto event = channels::parse_slack_envelope(document);
        if (!event) {
            return report(event.error());
        }

        auto bot_id = opts->bot_id.empty() ? ctx.config.slack.bot_user_id : opts->bot_id;
        channels::AdmissionFilter filter(ctx.config.slack.access, bot_id);
        std::cout << decision_to_json(filter.decide(*event)).dump(2) << "\n";
        return 0;
    };
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

auto register_config_command(CLI::App& app) -> CommandHandler {
    struct Options {
        bool validate_only = false;
        std::string config_file;
    };
    auto opts = std::make_shared<Options>();

    auto* sub = app.add_subcommand("config", "Show or validate configuration");
    sub->add_flag("--validate", opts->validate_only,
                  "Validate configuration without printing");
    sub->add_option("-f,--file", opts->config_file,
                    "Path to configuration file to inspect")
        ->check(CLI::ExistingFile);

    return [opts](const Context& ctx) -> int {
        Config cfg = ctx.config;

        // If a specific file was given, load that instead.
        if (!opts->config_file.empty()) {
            auto loaded = load_config(std::filesystem::path(opts->config_file));
            if (!loaded) {
                return report(loaded.error());
            }
            cfg = load_config_from_env(std::move(*loaded));
        }

        if (opts->validate_only) {
            std::cout << "Configuration is valid.\n";
            return 0;
        }

        json j = cfg;
        std::cout << j.dump(2) << "\n";
        return 0;
    };
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

auto register_version_command(CLI::App& app) -> CommandHandler {
    app.add_subcommand("version", "Print version information");

    return [](const Context&) -> int {
        std::cout << "slackline " << SLACKLINE_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
        return 0;
    };
}

} // namespace slackline::cli
