#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace slackline::format {

/// Converts generic markdown to Slack mrkdwn.
///
/// Conversions, applied in this order:
/// - `# Header` lines           -> `*Header*`
/// - `[label](url)`             -> `<url|label>`
/// - `~~strike~~`               -> `~strike~`
/// - `**bold**` / `__bold__`    -> `*bold*`
/// - `*italic*`                 -> `_italic_` (`_italic_` is kept as is)
/// - `- bullet`                 -> `* bullet`
///
/// Inline code and fenced code blocks pass through untouched. Unbalanced
/// markers are left as literal text. Never throws.
auto to_mrkdwn(std::string_view markdown) -> std::string;

/// A delimited span `open body close`. The body must be non-empty and
/// contain none of `body_excludes`; the first excluded character ends the
/// body, so `close` has to start with one of them.
struct SpanRule {
    std::string_view open;
    std::string_view close;
    std::string_view body_excludes;
    /// Delimiters may not touch another copy of the delimiter character
    /// (`*a*` matches, `**a*` and `*a**` do not).
    bool isolated = false;
    /// The body may not start or end with whitespace (`2 * 3 * 4` stays
    /// literal).
    bool tight = false;
};

using SpanRewriter = std::function<std::string(std::string_view body)>;

/// Replaces every non-overlapping span matching `rule`, scanning left to
/// right, with `rewrite(body)`. Text outside matches is copied verbatim.
auto replace_spans(std::string_view text, const SpanRule& rule,
                   const SpanRewriter& rewrite) -> std::string;

} // namespace slackline::format
