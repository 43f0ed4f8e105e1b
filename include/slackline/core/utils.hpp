#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace slackline::utils {

auto trim(std::string_view s) -> std::string;

/// Splits on every occurrence of `delim`, keeping empty pieces, so that
/// joining the result with `delim` reproduces the input exactly.
auto split(std::string_view s, std::string_view delim) -> std::vector<std::string_view>;

auto replace_all(std::string s, std::string_view from, std::string_view to) -> std::string;

/// Number of code points in a UTF-8 string. Stray continuation bytes count
/// as one code point each.
auto utf8_length(std::string_view s) -> std::size_t;

/// Longest prefix of `s` holding at most `max_code_points` code points,
/// never ending inside a multi-byte sequence.
auto utf8_prefix(std::string_view s, std::size_t max_code_points) -> std::string_view;

} // namespace slackline::utils
