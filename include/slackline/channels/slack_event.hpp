#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "slackline/core/error.hpp"

namespace slackline::channels {

using json = nlohmann::json;

enum class EventType {
    Message,      // generic `message` event
    AppMention,   // dedicated `app_mention` event
    Other,
};

enum class ChannelType {
    Im,
    Channel,
    Group,
};

/// One inbound Slack event, reduced to the fields admission needs.
struct InboundEvent {
    EventType event_type = EventType::Other;
    std::string type_name;                  // raw `type`, kept for logging
    std::string sender_id;                  // `user`
    std::string chat_id;                    // `channel`
    ChannelType channel_type = ChannelType::Channel;
    std::string text;
    std::optional<std::string> subtype;
    bool has_attachments = false;           // non-empty `files`
    std::string ts;
    std::optional<std::string> thread_ts;
};

auto event_type_from_string(std::string_view type) -> EventType;

/// Maps Slack's `channel_type`. When it is missing or unrecognised the
/// conversation id prefix decides: D... is a DM, G... a private group.
auto channel_type_from_string(std::string_view channel_type, std::string_view chat_id)
    -> ChannelType;

auto to_string(EventType type) -> std::string_view;
auto to_string(ChannelType type) -> std::string_view;

/// Parses a bare Slack event object.
auto parse_slack_event(const json& event) -> Result<InboundEvent>;

/// Parses a Socket Mode envelope (`events_api`), an Events API callback
/// (`event_callback`) or a bare event object.
auto parse_slack_envelope(const json& envelope) -> Result<InboundEvent>;

} // namespace slackline::channels
