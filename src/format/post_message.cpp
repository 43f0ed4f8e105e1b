#include "slackline/format/post_message.hpp"
#include "slackline/format/mrkdwn.hpp"
#include "slackline/core/logger.hpp"

namespace slackline::format {

auto block_to_json(const RenderedBlock& block) -> json {
    json text = {
        {"type", "mrkdwn"},
        {"text", block.body},
    };

    if (block.kind == BlockKind::Note) {
        return json{
            {"type", "context"},
            {"elements", json::array({text})},
        };
    }
    return json{
        {"type", "section"},
        {"text", text},
    };
}

auto build_post_message(const OutboundReply& reply, const ChunkLimits& limits) -> json {
    auto rendered = to_mrkdwn(reply.content);
    auto plan = chunk(rendered, limits);

    json blocks = json::array();
    for (const auto& block : plan) {
        blocks.push_back(block_to_json(block));
    }

    json payload = {
        {"channel", reply.channel},
        {"text", rendered},  // notification fallback
        {"blocks", std::move(blocks)},
    };

    bool use_thread = reply.thread_ts && !reply.thread_ts->empty() &&
                      reply.reply_in_thread && !reply.is_direct;
    if (use_thread) {
        payload["thread_ts"] = *reply.thread_ts;
    }

    LOG_DEBUG("[slack] Rendered reply to {}: {} blocks, {} bytes{}",
              reply.channel, plan.size(), rendered.size(),
              use_thread ? " (threaded)" : "");
    return payload;
}

} // namespace slackline::format
