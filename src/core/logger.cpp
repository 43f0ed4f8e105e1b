#include "slackline/core/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace slackline {

namespace {
    std::shared_ptr<spdlog::logger> g_logger;
    std::once_flag g_default_once;

    auto parse_level(std::string_view level) -> spdlog::level::level_enum {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "info") return spdlog::level::info;
        if (level == "warn") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        return spdlog::level::info;
    }
}

void Logger::init(std::string_view name, std::string_view level) {
    // Re-initialising replaces the registered logger of the same name.
    spdlog::drop(std::string(name));
    // stderr keeps stdout free for rendered payloads.
    auto logger = spdlog::stderr_color_mt(std::string(name));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    logger->set_level(parse_level(level));
    g_logger = std::move(logger);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    // Library calls may arrive from many threads before anyone called
    // init(); the default logger is created exactly once.
    std::call_once(g_default_once, [] {
        if (!g_logger) {
            init();
        }
    });
    return g_logger;
}

void Logger::set_level(std::string_view level) {
    get()->set_level(parse_level(level));
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
}

} // namespace slackline
