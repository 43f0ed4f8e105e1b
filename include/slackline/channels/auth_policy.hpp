#pragma once

#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace slackline::channels {

using json = nlohmann::json;

/// DM authorization mode. Unrecognised strings in configuration load as
/// Unknown, which denies every DM.
enum class DmPolicy {
    Unknown,
    Open,
    Allowlist,
};

NLOHMANN_JSON_SERIALIZE_ENUM(DmPolicy, {
    {DmPolicy::Unknown, nullptr},
    {DmPolicy::Open, "open"},
    {DmPolicy::Allowlist, "allowlist"},
})

/// Group/channel authorization mode. Unknown denies every group event.
enum class GroupPolicy {
    Unknown,
    Open,
    Mention,
    Allowlist,
};

NLOHMANN_JSON_SERIALIZE_ENUM(GroupPolicy, {
    {GroupPolicy::Unknown, nullptr},
    {GroupPolicy::Open, "open"},
    {GroupPolicy::Mention, "mention"},
    {GroupPolicy::Allowlist, "allowlist"},
})

struct DmAccess {
    bool enabled = true;
    DmPolicy policy = DmPolicy::Open;
    std::set<std::string> allow_from;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(DmAccess, enabled, policy, allow_from)

/// Channel access policy, loaded once at startup and never mutated.
struct AccessPolicy {
    DmAccess dm;
    GroupPolicy group_policy = GroupPolicy::Mention;
    std::set<std::string> group_allow_from;

    [[nodiscard]] auto is_dm_sender_listed(std::string_view sender_id) const -> bool {
        return dm.allow_from.contains(std::string(sender_id));
    }

    [[nodiscard]] auto is_group_listed(std::string_view chat_id) const -> bool {
        return group_allow_from.contains(std::string(chat_id));
    }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AccessPolicy, dm, group_policy, group_allow_from)

auto to_string(DmPolicy policy) -> std::string_view;
auto to_string(GroupPolicy policy) -> std::string_view;

} // namespace slackline::channels
