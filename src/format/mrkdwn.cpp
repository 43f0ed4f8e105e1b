#include "slackline/format/mrkdwn.hpp"
#include "slackline/core/utils.hpp"

#include <vector>

namespace slackline::format {

namespace {

// Reserved control characters. Both are stripped from the input first, so
// every occurrence in the working text was put there by the converter.
constexpr char kBoldMark = '\x1F';
constexpr char kTokenMark = '\x1A';

constexpr std::string_view kBoldMarkStr{"\x1F"};
constexpr std::string_view kFence{"```"};

/// Ordered list of held-back text fragments. Each fragment is replaced by a
/// token `<mark><kind><index><mark>` that no markdown stage reacts to.
class PlaceholderTable {
public:
    explicit PlaceholderTable(char kind) : kind_(kind) {}

    auto hold(std::string original) -> std::string {
        std::string token;
        token += kTokenMark;
        token += kind_;
        token += std::to_string(held_.size());
        token += kTokenMark;
        held_.push_back(std::move(original));
        return token;
    }

    /// Puts every held fragment back. Fragments may themselves contain
    /// tokens of this table, which are restored as well.
    [[nodiscard]] auto restore(std::string_view text) const -> std::string {
        std::string out;
        out.reserve(text.size());
        size_t i = 0;
        while (i < text.size()) {
            if (text[i] == kTokenMark && i + 1 < text.size() && text[i + 1] == kind_) {
                size_t digits = i + 2;
                size_t end = digits;
                while (end < text.size() && text[end] >= '0' && text[end] <= '9') ++end;
                if (end > digits && end < text.size() && text[end] == kTokenMark) {
                    auto index = std::stoul(std::string(text.substr(digits, end - digits)));
                    if (index < held_.size()) {
                        out += restore(held_[index]);
                        i = end + 1;
                        continue;
                    }
                }
            }
            out += text[i];
            ++i;
        }
        return out;
    }

private:
    char kind_;
    std::vector<std::string> held_;
};

auto is_blank(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\r';
}

auto is_whitespace(char c) -> bool {
    return is_blank(c) || c == '\n';
}

/// Applies `fn` to every line independently, keeping the line breaks.
template <typename Fn>
auto transform_lines(std::string_view text, Fn&& fn) -> std::string {
    std::string out;
    out.reserve(text.size());
    bool first = true;
    for (auto line : utils::split(text, "\n")) {
        if (!first) out += '\n';
        first = false;
        out += fn(line);
    }
    return out;
}

auto strip_reserved(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c != kBoldMark && c != kTokenMark) out += c;
    }
    return out;
}

/// Holds fenced code blocks and inline code spans.
auto hold_code(std::string_view text, PlaceholderTable& code) -> std::string {
    std::string fenced;
    fenced.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text.substr(i).starts_with(kFence)) {
            auto close = text.find(kFence, i + kFence.size());
            if (close != std::string_view::npos) {
                auto end = close + kFence.size();
                fenced += code.hold(std::string(text.substr(i, end - i)));
                i = end;
                continue;
            }
        }
        fenced += text[i];
        ++i;
    }

    return replace_spans(fenced, SpanRule{"`", "`", "`\n"},
        [&code](std::string_view body) {
            return code.hold("`" + std::string(body) + "`");
        });
}

/// `**x**` or `__x__` around a whole header collapses to `x`, so the header
/// renders as one bold span.
auto unwrap_emphasis(std::string title) -> std::string {
    for (std::string_view marker : {std::string_view{"**"}, std::string_view{"__"}}) {
        if (title.size() > 2 * marker.size() && title.starts_with(marker) &&
            title.ends_with(marker)) {
            auto inner = title.substr(marker.size(), title.size() - 2 * marker.size());
            if (inner.find(marker.front()) == std::string::npos) {
                return inner;
            }
        }
    }
    return title;
}

auto header_to_bold(std::string_view line) -> std::string {
    size_t hashes = 0;
    while (hashes < line.size() && line[hashes] == '#') ++hashes;
    if (hashes == 0 || hashes > 6 || hashes >= line.size() || !is_blank(line[hashes])) {
        return std::string(line);
    }

    auto title = utils::trim(line.substr(hashes));
    if (title.empty()) {
        return std::string(line);
    }
    // The whole line is bold already; inner `**` or `__` would split the span.
    title = utils::replace_all(unwrap_emphasis(std::move(title)), "**", "");
    title = utils::replace_all(std::move(title), "__", "");
    if (utils::trim(title).empty()) {
        return std::string(line);
    }
    return std::string(kBoldMarkStr) + title + std::string(kBoldMarkStr);
}

auto convert_links(std::string_view text, PlaceholderTable& urls) -> std::string {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '[') {
            auto label_end = text.find(']', i + 1);
            if (label_end != std::string_view::npos && label_end > i + 1 &&
                label_end + 1 < text.size() && text[label_end + 1] == '(') {
                auto url_start = label_end + 2;
                auto url_end = text.find(')', url_start);
                auto line_end = text.find('\n', url_start);
                // A link URL never spans lines.
                if (url_end != std::string_view::npos && url_end > url_start &&
                    url_end < line_end) {
                    out += '<';
                    out += urls.hold(std::string(text.substr(url_start, url_end - url_start)));
                    out += '|';
                    out += text.substr(i + 1, label_end - i - 1);
                    out += '>';
                    i = url_end + 1;
                    continue;
                }
            }
        }
        out += text[i];
        ++i;
    }
    return out;
}

auto convert_bold(std::string_view text) -> std::string {
    auto to_mark = [](std::string_view body) {
        return std::string(kBoldMarkStr) + std::string(body) + std::string(kBoldMarkStr);
    };
    auto starred = replace_spans(text, SpanRule{"**", "**", "*"}, to_mark);
    return replace_spans(starred, SpanRule{"__", "__", "_"}, to_mark);
}

/// Protect the bold spans produced so far, turn the remaining single-star
/// spans into italics, then put the bold spans back.
auto convert_italic(std::string_view text) -> std::string {
    PlaceholderTable bold('B');
    auto bold_mark_rule = SpanRule{kBoldMarkStr, kBoldMarkStr, "\x1F\n"};
    auto protected_text = replace_spans(text, bold_mark_rule,
        [&bold](std::string_view body) {
            return bold.hold("*" + std::string(body) + "*");
        });

    auto italic = replace_spans(protected_text, SpanRule{"*", "*", "*\n", true, true},
        [](std::string_view body) {
            return "_" + std::string(body) + "_";
        });

    // Bold spans that crossed a line break were never protected.
    return utils::replace_all(bold.restore(italic), kBoldMarkStr, "*");
}

auto bullet_line(std::string_view line) -> std::string {
    size_t indent = 0;
    while (indent < line.size() && is_blank(line[indent])) ++indent;
    if (line.substr(indent).starts_with("- ")) {
        return std::string(line.substr(0, indent)) + "* " + std::string(line.substr(indent + 2));
    }
    return std::string(line);
}

} // namespace

auto replace_spans(std::string_view text, const SpanRule& rule,
                   const SpanRewriter& rewrite) -> std::string {
    std::string out;
    out.reserve(text.size());
    if (rule.open.empty() || rule.close.empty()) {
        out.append(text);
        return out;
    }

    size_t i = 0;
    while (i < text.size()) {
        bool opens = text.substr(i).starts_with(rule.open) &&
            (!rule.isolated || i == 0 || text[i - 1] != rule.open.front());
        if (opens) {
            size_t body_start = i + rule.open.size();
            size_t body_end = body_start;
            while (body_end < text.size() &&
                   rule.body_excludes.find(text[body_end]) == std::string_view::npos) {
                ++body_end;
            }
            size_t after = body_end + rule.close.size();
            bool closed = body_end > body_start &&
                text.substr(body_end).starts_with(rule.close);
            if (closed && rule.isolated && after < text.size() &&
                text[after] == rule.close.back()) {
                closed = false;
            }
            if (closed && rule.tight &&
                (is_whitespace(text[body_start]) || is_whitespace(text[body_end - 1]))) {
                closed = false;
            }
            if (closed) {
                out += rewrite(text.substr(body_start, body_end - body_start));
                i = after;
                continue;
            }
        }
        out += text[i];
        ++i;
    }
    return out;
}

auto to_mrkdwn(std::string_view markdown) -> std::string {
    if (markdown.empty()) {
        return {};
    }

    PlaceholderTable code('C');
    PlaceholderTable urls('L');

    auto text = hold_code(strip_reserved(markdown), code);
    text = transform_lines(text, header_to_bold);
    text = convert_links(text, urls);
    text = replace_spans(text, SpanRule{"~~", "~~", "~"},
        [](std::string_view body) {
            return "~" + std::string(body) + "~";
        });
    text = convert_bold(text);
    text = convert_italic(text);
    text = transform_lines(text, bullet_line);

    return code.restore(urls.restore(text));
}

} // namespace slackline::format
