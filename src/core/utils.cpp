#include "slackline/core/utils.hpp"

namespace slackline::utils {

namespace {

constexpr auto is_continuation(char c) -> bool {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

/// Byte offset just past the code point starting at `i`. A lead byte only
/// claims the continuation bytes that are actually present.
auto next_code_point(std::string_view s, size_t i) -> size_t {
    auto b = static_cast<unsigned char>(s[i]);
    size_t width = b >= 0xF0 ? 4 : b >= 0xE0 ? 3 : b >= 0xC0 ? 2 : 1;
    size_t end = i + 1;
    while (end < s.size() && end < i + width && is_continuation(s[end])) ++end;
    return end;
}

} // namespace

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, std::string_view delim) -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    if (delim.empty()) {
        parts.push_back(s);
        return parts;
    }
    size_t pos = 0;
    while (true) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.push_back(s.substr(pos));
            break;
        }
        parts.push_back(s.substr(pos, next - pos));
        pos = next + delim.size();
    }
    return parts;
}

auto replace_all(std::string s, std::string_view from, std::string_view to) -> std::string {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

auto utf8_length(std::string_view s) -> std::size_t {
    std::size_t count = 0;
    for (size_t i = 0; i < s.size(); i = next_code_point(s, i)) {
        ++count;
    }
    return count;
}

auto utf8_prefix(std::string_view s, std::size_t max_code_points) -> std::string_view {
    std::size_t seen = 0;
    size_t i = 0;
    while (i < s.size() && seen < max_code_points) {
        i = next_code_point(s, i);
        ++seen;
    }
    return s.substr(0, i);
}

} // namespace slackline::utils
