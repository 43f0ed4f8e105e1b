#include "slackline/channels/admission.hpp"
#include "slackline/core/logger.hpp"
#include "slackline/core/utils.hpp"

namespace slackline::channels {

namespace {

auto ignore(const InboundEvent& event, IgnoreReason reason) -> AdmissionDecision {
    LOG_DEBUG("[slack] Ignoring {} event from '{}' in '{}': {}",
              event.type_name, event.sender_id, event.chat_id, to_string(reason));
    return Ignored{reason};
}

/// Access check for a direct message. Empty result means admitted.
auto check_dm(const InboundEvent& event, const AccessPolicy& policy)
    -> std::optional<IgnoreReason>
{
    if (!policy.dm.enabled) {
        return IgnoreReason::DmDisabled;
    }
    switch (policy.dm.policy) {
        case DmPolicy::Open:
            return std::nullopt;
        case DmPolicy::Allowlist:
            if (policy.is_dm_sender_listed(event.sender_id)) return std::nullopt;
            return IgnoreReason::SenderNotAllowed;
        default:
            return IgnoreReason::NoMatchingPolicy;
    }
}

/// Access check for a channel or group message.
auto check_group(const InboundEvent& event, const AccessPolicy& policy,
                 std::string_view bot_user_id) -> std::optional<IgnoreReason>
{
    switch (policy.group_policy) {
        case GroupPolicy::Open:
            return std::nullopt;
        case GroupPolicy::Mention:
            if (event.event_type == EventType::AppMention ||
                mentions_bot(event.text, bot_user_id)) {
                return std::nullopt;
            }
            return IgnoreReason::MentionRequired;
        case GroupPolicy::Allowlist:
            if (policy.is_group_listed(event.chat_id)) return std::nullopt;
            return IgnoreReason::ChatNotAllowed;
        default:
            return IgnoreReason::NoMatchingPolicy;
    }
}

} // namespace

auto to_string(IgnoreReason reason) -> std::string_view {
    switch (reason) {
        case IgnoreReason::UnsupportedEventType: return "unsupported event type";
        case IgnoreReason::SystemSubtype: return "system/edit subtype";
        case IgnoreReason::SelfAuthored: return "self-authored";
        case IgnoreReason::SupersededByMention: return "superseded by mention event";
        case IgnoreReason::MissingIdentity: return "missing identity";
        case IgnoreReason::DmDisabled: return "dm disabled";
        case IgnoreReason::SenderNotAllowed: return "sender not in dm allowlist";
        case IgnoreReason::MentionRequired: return "mention required";
        case IgnoreReason::ChatNotAllowed: return "chat not in group allowlist";
        case IgnoreReason::NoMatchingPolicy: return "no matching policy";
        default: return "unknown";
    }
}

auto mention_token(std::string_view bot_user_id) -> std::string {
    if (bot_user_id.empty()) {
        return {};
    }
    return "<@" + std::string(bot_user_id) + ">";
}

auto mentions_bot(std::string_view text, std::string_view bot_user_id) -> bool {
    auto token = mention_token(bot_user_id);
    return !token.empty() && text.find(token) != std::string_view::npos;
}

auto strip_bot_mention(std::string_view text, std::string_view bot_user_id) -> std::string {
    auto token = mention_token(bot_user_id);
    if (token.empty()) {
        return utils::trim(text);
    }

    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        auto next = text.find(token, pos);
        if (next == std::string_view::npos) {
            out += text.substr(pos);
            break;
        }
        out += text.substr(pos, next - pos);
        pos = next + token.size();
        if (pos < text.size() && text[pos] == ' ') {
            ++pos;
        }
    }
    return utils::trim(out);
}

auto decide(const InboundEvent& event, const AccessPolicy& policy,
            std::string_view bot_user_id) -> AdmissionDecision
{
    if (event.event_type != EventType::Message && event.event_type != EventType::AppMention) {
        return ignore(event, IgnoreReason::UnsupportedEventType);
    }

    if (event.subtype && *event.subtype != kFileShareSubtype) {
        return ignore(event, IgnoreReason::SystemSubtype);
    }

    if (!bot_user_id.empty() && event.sender_id == bot_user_id) {
        return ignore(event, IgnoreReason::SelfAuthored);
    }

    // Slack sends both `message` and `app_mention` for a mention in a
    // channel. Only `message` carries files, so it wins when files exist.
    if (event.event_type == EventType::Message && !event.has_attachments &&
        mentions_bot(event.text, bot_user_id)) {
        return ignore(event, IgnoreReason::SupersededByMention);
    }

    if (event.sender_id.empty() || event.chat_id.empty()) {
        return ignore(event, IgnoreReason::MissingIdentity);
    }

    auto denied = event.channel_type == ChannelType::Im
        ? check_dm(event, policy)
        : check_group(event, policy, bot_user_id);
    if (denied) {
        return ignore(event, *denied);
    }

    Admitted admitted;
    admitted.text = strip_bot_mention(event.text, bot_user_id);
    admitted.sender_id = event.sender_id;
    admitted.chat_id = event.chat_id;
    admitted.channel_type = event.channel_type;
    admitted.thread_ts = event.thread_ts.value_or(event.ts);

    LOG_DEBUG("[slack] Admitted {} event from '{}' in '{}' ({})",
              event.type_name, event.sender_id, event.chat_id,
              to_string(event.channel_type));
    return admitted;
}

AdmissionFilter::AdmissionFilter(AccessPolicy policy, std::string bot_user_id)
    : policy_(std::move(policy))
    , bot_user_id_(std::move(bot_user_id))
{
    LOG_INFO("[slack] Admission filter ready: bot={} dm={} ({}) group={}",
             bot_user_id_.empty() ? "<unknown>" : bot_user_id_,
             policy_.dm.enabled ? "enabled" : "disabled",
             to_string(policy_.dm.policy), to_string(policy_.group_policy));
}

auto AdmissionFilter::decide(const InboundEvent& event) const -> AdmissionDecision {
    return channels::decide(event, policy_, bot_user_id_);
}

} // namespace slackline::channels
