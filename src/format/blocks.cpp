#include "slackline/format/blocks.hpp"
#include "slackline/core/logger.hpp"
#include "slackline/core/utils.hpp"

#include <algorithm>

namespace slackline::format {

namespace {

constexpr std::string_view kParagraphBreak = "\n\n";
constexpr std::string_view kLineBreak = "\n";

/// Emits a finished chunk. Empty and whitespace-only chunks are dropped,
/// Slack rejects section blocks without visible text.
auto emit(std::vector<std::string>& chunks, std::string chunk) -> void {
    if (utils::trim(chunk).empty()) {
        LOG_TRACE("[format] Dropping blank chunk of {} bytes", chunk.size());
        return;
    }
    chunks.push_back(std::move(chunk));
}

/// Greedily joins pieces with a separator while the joined length stays
/// within the limit.
class ChunkAccumulator {
public:
    ChunkAccumulator(std::string_view separator, std::size_t limit,
                     std::vector<std::string>& chunks)
        : separator_(separator)
        , separator_length_(utils::utf8_length(separator))
        , limit_(limit)
        , chunks_(chunks)
    {
    }

    [[nodiscard]] auto fits(std::size_t piece_length) const -> bool {
        return !open_ || length_ + separator_length_ + piece_length <= limit_;
    }

    auto add(std::string_view piece, std::size_t piece_length) -> void {
        if (open_) {
            current_ += separator_;
            length_ += separator_length_;
        }
        current_ += piece;
        length_ += piece_length;
        open_ = true;
    }

    auto flush() -> void {
        if (!open_) return;
        emit(chunks_, std::move(current_));
        current_.clear();
        length_ = 0;
        open_ = false;
    }

private:
    std::string_view separator_;
    std::size_t separator_length_;
    std::size_t limit_;
    std::vector<std::string>& chunks_;
    std::string current_;
    std::size_t length_ = 0;
    bool open_ = false;
};

auto truncate_line(std::string_view line, std::size_t limit) -> std::string {
    if (limit <= kEllipsis.size()) {
        return std::string(utils::utf8_prefix(line, limit));
    }
    return std::string(utils::utf8_prefix(line, limit - kEllipsis.size())) +
           std::string(kEllipsis);
}

auto split_paragraph(std::string_view paragraph, std::size_t limit,
                     std::vector<std::string>& chunks) -> void {
    ChunkAccumulator lines(kLineBreak, limit, chunks);
    for (auto line : utils::split(paragraph, kLineBreak)) {
        auto length = utils::utf8_length(line);
        if (length > limit) {
            lines.flush();
            LOG_DEBUG("[format] Cutting a {}-character line to {}", length, limit);
            emit(chunks, truncate_line(line, limit));
            continue;
        }
        if (!lines.fits(length)) {
            lines.flush();
        }
        lines.add(line, length);
    }
    lines.flush();
}

} // namespace

auto split_chunks(std::string_view text, std::size_t max_block_length)
    -> std::vector<std::string>
{
    std::vector<std::string> chunks;
    if (utils::utf8_length(text) <= max_block_length) {
        chunks.emplace_back(text);
        return chunks;
    }

    ChunkAccumulator paragraphs(kParagraphBreak, max_block_length, chunks);
    for (auto paragraph : utils::split(text, kParagraphBreak)) {
        auto length = utils::utf8_length(paragraph);
        if (length > max_block_length) {
            paragraphs.flush();
            split_paragraph(paragraph, max_block_length, chunks);
            continue;
        }
        if (!paragraphs.fits(length)) {
            paragraphs.flush();
        }
        paragraphs.add(paragraph, length);
    }
    paragraphs.flush();

    return chunks;
}

auto chunk(std::string_view text, const ChunkLimits& limits) -> ChunkPlan {
    auto chunks = split_chunks(text, limits.max_block_length);
    auto max_blocks = std::max<std::size_t>(limits.max_blocks, 1);

    ChunkPlan plan;
    if (chunks.size() <= max_blocks) {
        plan.reserve(chunks.size());
        for (auto& body : chunks) {
            plan.push_back(RenderedBlock{BlockKind::Text, std::move(body)});
        }
        return plan;
    }

    // One slot goes to the note, so the plan never exceeds max_blocks.
    auto kept = max_blocks - 1;
    auto omitted = chunks.size() - kept;
    LOG_WARN("[format] Message needs {} blocks, rendering {} and omitting {}",
             chunks.size(), kept, omitted);

    plan.reserve(max_blocks);
    for (std::size_t i = 0; i < kept; ++i) {
        plan.push_back(RenderedBlock{BlockKind::Text, std::move(chunks[i])});
    }
    plan.push_back(RenderedBlock{BlockKind::Note, truncation_note(omitted)});
    return plan;
}

auto truncation_note(std::size_t omitted) -> std::string {
    return "_Message truncated (" + std::to_string(omitted) + " blocks omitted)_";
}

} // namespace slackline::format
