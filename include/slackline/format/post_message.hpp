#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "slackline/format/blocks.hpp"

namespace slackline::format {

using json = nlohmann::json;

/// An agent reply addressed to one Slack conversation.
struct OutboundReply {
    std::string channel;                    // conversation id (C..., D..., G...)
    std::string content;                    // generic markdown
    std::optional<std::string> thread_ts;   // thread of the message being answered
    bool is_direct = false;                 // DMs are never threaded
    bool reply_in_thread = true;
};

/// Text -> `section` block with mrkdwn text, Note -> `context` block.
auto block_to_json(const RenderedBlock& block) -> json;

/// Builds the chat.postMessage body: converted fallback `text`, the chunked
/// `blocks`, and `thread_ts` when the reply belongs in a thread.
auto build_post_message(const OutboundReply& reply, const ChunkLimits& limits = {}) -> json;

} // namespace slackline::format
