#include "slackline/channels/auth_policy.hpp"

namespace slackline::channels {

auto to_string(DmPolicy policy) -> std::string_view {
    switch (policy) {
        case DmPolicy::Open: return "open";
        case DmPolicy::Allowlist: return "allowlist";
        default: return "unknown";
    }
}

auto to_string(GroupPolicy policy) -> std::string_view {
    switch (policy) {
        case GroupPolicy::Open: return "open";
        case GroupPolicy::Mention: return "mention";
        case GroupPolicy::Allowlist: return "allowlist";
        default: return "unknown";
    }
}

} // namespace slackline::channels
