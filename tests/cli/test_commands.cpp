#include <catch2/catch_test_macros.hpp>

#include "slackline/cli/app.hpp"
#include "slackline/cli/commands.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

auto write_temp(const std::string& name, const std::string& content) -> std::filesystem::path {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
}

/// Captures std::cout for the lifetime of the object.
class CoutCapture {
public:
    CoutCapture() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(previous_); }

    [[nodiscard]] auto str() const -> std::string { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

auto run_app(std::vector<std::string> args, std::string& output) -> int {
    args.insert(args.begin(), "slackline");
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());

    slackline::cli::App app;
    CoutCapture capture;
    int code = app.run(static_cast<int>(argv.size()), argv.data());
    output = capture.str();
    return code;
}

} // namespace

TEST_CASE("read_input", "[cli]") {
    SECTION("reads a whole file") {
        auto path = write_temp("slackline_cli_input.md", "line one\n\nline two\n");
        auto content = slackline::cli::read_input(path.string());
        REQUIRE(content.has_value());
        CHECK(*content == "line one\n\nline two\n");
        std::filesystem::remove(path);
    }

    SECTION("missing file") {
        auto content = slackline::cli::read_input("/nonexistent/input.md");
        REQUIRE_FALSE(content.has_value());
        CHECK(content.error().code() == slackline::ErrorCode::NotFound);
    }
}

TEST_CASE("render prints a postMessage body", "[cli]") {
    auto path = write_temp("slackline_cli_render.md", "# Hi\n\n**there**");

    std::string output;
    int code = run_app({"render", path.string(), "--channel", "C42", "--thread-ts", "1.5"},
                       output);
    REQUIRE(code == 0);

    auto payload = json::parse(output);
    CHECK(payload["channel"] == "C42");
    CHECK(payload["text"] == "*Hi*\n\n*there*");
    CHECK(payload["thread_ts"] == "1.5");
    REQUIRE(payload["blocks"].size() == 1);

    SECTION("DM targets are not threaded") {
        code = run_app({"render", path.string(), "--channel", "D42", "--thread-ts", "1.5"},
                       output);
        REQUIRE(code == 0);
        CHECK_FALSE(json::parse(output).contains("thread_ts"));
    }

    std::filesystem::remove(path);
}

TEST_CASE("admit prints the decision", "[cli]") {
    auto path = write_temp("slackline_cli_event.json", R"({
        "type": "event_callback",
        "event": {"type": "app_mention", "user": "U1", "channel": "C1",
                  "text": "<@UBOT> deploy status", "ts": "10.1"}
    })");

    std::string output;
    int code = run_app({"admit", path.string(), "--bot-id", "UBOT"}, output);
    REQUIRE(code == 0);

    auto decision = json::parse(output);
    CHECK(decision["admitted"] == true);
    CHECK(decision["text"] == "deploy status");
    CHECK(decision["thread_ts"] == "10.1");
    CHECK(decision["channel_type"] == "channel");

    std::filesystem::remove(path);
}

TEST_CASE("admit reports ignored events", "[cli]") {
    auto path = write_temp("slackline_cli_chatter.json",
        R"({"type": "message", "user": "U1", "channel": "C1", "text": "lunch?", "ts": "1"})");

    std::string output;
    int code = run_app({"admit", path.string()}, output);
    REQUIRE(code == 0);

    auto decision = json::parse(output);
    CHECK(decision["admitted"] == false);
    CHECK(decision["reason"] == "mention required");

    std::filesystem::remove(path);
}

TEST_CASE("admit rejects invalid JSON", "[cli]") {
    auto path = write_temp("slackline_cli_bad.json", "{oops");

    std::string output;
    CHECK(run_app({"admit", path.string()}, output) == 1);
    CHECK(output.empty());

    std::filesystem::remove(path);
}

TEST_CASE("config validates and prints", "[cli]") {
    auto path = write_temp("slackline_cli_config.json",
        R"({"slack": {"bot_user_id": "UBOT", "group_policy": "open"}})");

    std::string output;
    REQUIRE(run_app({"--config", path.string(), "config", "--validate"}, output) == 0);
    CHECK(output == "Configuration is valid.\n");

    REQUIRE(run_app({"--config", path.string(), "config"}, output) == 0);
    auto printed = json::parse(output);
    CHECK(printed["slack"]["bot_user_id"] == "UBOT");
    CHECK(printed["slack"]["group_policy"] == "open");

    std::filesystem::remove(path);
}

TEST_CASE("config reports a broken file", "[cli]") {
    auto path = write_temp("slackline_cli_broken.json", "[not an object]");

    std::string output;
    CHECK(run_app({"--config", path.string(), "config", "--validate"}, output) == 1);

    std::filesystem::remove(path);
}
