#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace slackline::format {

/// Slack limit on the text of a single section block, in characters.
inline constexpr std::size_t kMaxBlockLength = 3000;

/// Slack limit on the number of blocks in a single message.
inline constexpr std::size_t kMaxBlocks = 50;

/// Appended to a line that had to be cut to fit a block.
inline constexpr std::string_view kEllipsis = "...";

enum class BlockKind {
    Text,   // rendered mrkdwn content
    Note,   // synthetic annotation, only used to report truncation
};

struct RenderedBlock {
    BlockKind kind = BlockKind::Text;
    std::string body;
};

/// Ordered blocks of one outbound message.
using ChunkPlan = std::vector<RenderedBlock>;

struct ChunkLimits {
    std::size_t max_block_length = kMaxBlockLength;
    std::size_t max_blocks = kMaxBlocks;
};

/// Splits text into chunks of at most `max_block_length` code points,
/// preferring paragraph breaks, then line breaks. A single line longer than
/// the limit is cut and marked with kEllipsis; the rest of it is dropped.
/// Text that fits is returned whole.
auto split_chunks(std::string_view text, std::size_t max_block_length = kMaxBlockLength)
    -> std::vector<std::string>;

/// Splits text into a chunk plan of at most `limits.max_blocks` blocks. When
/// there are more chunks, the last block is a Note reporting how many were
/// left out. The Note takes the last slot, so `max_blocks - 1` Text blocks
/// are kept and the reported count is `total - (max_blocks - 1)`, not
/// `total - max_blocks`.
auto chunk(std::string_view text, const ChunkLimits& limits = {}) -> ChunkPlan;

/// Body of the Note block appended when `omitted` chunks were dropped.
auto truncation_note(std::size_t omitted) -> std::string;

} // namespace slackline::format
