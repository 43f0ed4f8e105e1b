#include "slackline/channels/slack_event.hpp"
#include "slackline/core/logger.hpp"

namespace slackline::channels {

namespace {

/// Reads a string field; missing, null or non-string values read as empty.
auto string_field(const json& j, std::string_view key) -> std::string {
    auto it = j.find(std::string(key));
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

auto optional_string_field(const json& j, std::string_view key) -> std::optional<std::string> {
    auto value = string_field(j, key);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

auto event_type_from_string(std::string_view type) -> EventType {
    if (type == "message") return EventType::Message;
    if (type == "app_mention") return EventType::AppMention;
    return EventType::Other;
}

auto channel_type_from_string(std::string_view channel_type, std::string_view chat_id)
    -> ChannelType
{
    if (channel_type == "im") return ChannelType::Im;
    if (channel_type == "mpim" || channel_type == "group") return ChannelType::Group;
    if (channel_type == "channel") return ChannelType::Channel;

    if (chat_id.starts_with("D")) return ChannelType::Im;
    if (chat_id.starts_with("G")) return ChannelType::Group;
    return ChannelType::Channel;
}

auto to_string(EventType type) -> std::string_view {
    switch (type) {
        case EventType::Message: return "message";
        case EventType::AppMention: return "app_mention";
        default: return "other";
    }
}

auto to_string(ChannelType type) -> std::string_view {
    switch (type) {
        case ChannelType::Im: return "im";
        case ChannelType::Group: return "group";
        default: return "channel";
    }
}

auto parse_slack_event(const json& event) -> Result<InboundEvent> {
    if (!event.is_object()) {
        return std::unexpected(
            make_error(ErrorCode::SerializationError, "Slack event must be a JSON object"));
    }

    InboundEvent parsed;
    parsed.type_name = string_field(event, "type");
    parsed.event_type = event_type_from_string(parsed.type_name);
    parsed.sender_id = string_field(event, "user");
    parsed.chat_id = string_field(event, "channel");
    parsed.channel_type = channel_type_from_string(
        string_field(event, "channel_type"), parsed.chat_id);
    parsed.text = string_field(event, "text");
    parsed.subtype = optional_string_field(event, "subtype");
    parsed.ts = string_field(event, "ts");
    parsed.thread_ts = optional_string_field(event, "thread_ts");

    auto files = event.find("files");
    parsed.has_attachments = files != event.end() && files->is_array() && !files->empty();

    LOG_TRACE("[slack] Parsed event type={} subtype={} user={} channel={} channel_type={}",
              parsed.type_name, parsed.subtype.value_or(""), parsed.sender_id,
              parsed.chat_id, to_string(parsed.channel_type));
    return parsed;
}

auto parse_slack_envelope(const json& envelope) -> Result<InboundEvent> {
    if (!envelope.is_object()) {
        return std::unexpected(
            make_error(ErrorCode::SerializationError, "Slack envelope must be a JSON object"));
    }

    auto type = string_field(envelope, "type");

    if (type == "events_api") {
        auto payload = envelope.find("payload");
        if (payload == envelope.end() || !payload->is_object()) {
            return std::unexpected(
                make_error(ErrorCode::SerializationError, "events_api envelope has no payload"));
        }
        auto event = payload->find("event");
        if (event != payload->end() && event->is_object()) {
            return parse_slack_event(*event);
        }
        return parse_slack_envelope(*payload);
    }

    if (type == "event_callback") {
        auto event = envelope.find("event");
        if (event == envelope.end()) {
            return std::unexpected(
                make_error(ErrorCode::SerializationError, "event_callback has no event"));
        }
        return parse_slack_event(*event);
    }

    if (type == "hello" || type == "disconnect" || type == "slash_commands" ||
        type == "interactive" || type == "url_verification") {
        return std::unexpected(
            make_error(ErrorCode::InvalidArgument, "Not an event envelope", type));
    }

    return parse_slack_event(envelope);
}

} // namespace slackline::channels
