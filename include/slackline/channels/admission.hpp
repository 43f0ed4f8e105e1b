#pragma once

#include <string>
#include <string_view>
#include <variant>

#include "slackline/channels/auth_policy.hpp"
#include "slackline/channels/slack_event.hpp"

namespace slackline::channels {

/// The only subtype that still carries a user message (an upload with text).
inline constexpr std::string_view kFileShareSubtype = "file_share";

enum class IgnoreReason {
    UnsupportedEventType,
    SystemSubtype,          // edits, deletions, joins, bot messages...
    SelfAuthored,
    SupersededByMention,    // the matching app_mention event is admitted instead
    MissingIdentity,
    DmDisabled,
    SenderNotAllowed,
    MentionRequired,
    ChatNotAllowed,
    NoMatchingPolicy,
};

auto to_string(IgnoreReason reason) -> std::string_view;

/// An event to forward to the agent.
struct Admitted {
    std::string text;        // bot mention removed, trimmed
    std::string sender_id;
    std::string chat_id;
    ChannelType channel_type = ChannelType::Channel;
    std::string thread_ts;   // the event's own ts when it is not a reply
};

struct Ignored {
    IgnoreReason reason;
};

using AdmissionDecision = std::variant<Admitted, Ignored>;

[[nodiscard]] inline auto is_admitted(const AdmissionDecision& decision) -> bool {
    return std::holds_alternative<Admitted>(decision);
}

/// `<@BOT>`, or an empty string when the bot identity is unknown.
auto mention_token(std::string_view bot_user_id) -> std::string;

auto mentions_bot(std::string_view text, std::string_view bot_user_id) -> bool;

/// Removes every bot mention together with one following space, then trims.
auto strip_bot_mention(std::string_view text, std::string_view bot_user_id) -> std::string;

/// Decides whether an inbound event reaches the agent. Rules apply in a
/// fixed order and the first one that matches wins:
///  1. only `message` and `app_mention` events
///  2. no subtype other than `file_share`
///  3. nothing the bot wrote itself
///  4. a `message` mentioning the bot without files is dropped in favour of
///     its `app_mention` twin; only `message` events carry files, so those
///     are kept
///  5. sender and conversation must be known
///  6. the DM or group access policy
/// Pure: the result depends only on the arguments.
auto decide(const InboundEvent& event, const AccessPolicy& policy,
            std::string_view bot_user_id) -> AdmissionDecision;

/// decide() bound to a fixed policy and bot identity.
class AdmissionFilter {
public:
    AdmissionFilter(AccessPolicy policy, std::string bot_user_id);

    [[nodiscard]] auto decide(const InboundEvent& event) const -> AdmissionDecision;

    [[nodiscard]] auto policy() const noexcept -> const AccessPolicy& { return policy_; }
    [[nodiscard]] auto bot_user_id() const noexcept -> std::string_view { return bot_user_id_; }

private:
    const AccessPolicy policy_;
    const std::string bot_user_id_;
};

} // namespace slackline::channels
