#include "vouchnet/trust/GroupPolicy.hpp"

#include <tuple>

namespace vouchnet::trust {

const GroupPolicy& newer_policy(const GroupPolicy& lhs, const GroupPolicy& rhs) {
    const auto key = [](const GroupPolicy& policy) {
        return std::make_tuple(policy.updated_at,
                               policy.min_vouch_threshold,
                               static_cast<std::uint8_t>(policy.cross_cluster_mode),
                               static_cast<std::uint8_t>(policy.bridge_vouch_policy));
    };
    return key(lhs) >= key(rhs) ? lhs : rhs;
}

std::string_view cross_cluster_mode_name(CrossClusterMode mode) {
    switch (mode) {
        case CrossClusterMode::Off:
            return "off";
        case CrossClusterMode::Admission:
            return "admission";
        case CrossClusterMode::Strict:
            return "strict";
    }
    return "admission";
}

std::string_view bridge_vouch_policy_name(BridgeVouchPolicy policy) {
    switch (policy) {
        case BridgeVouchPolicy::Reject:
            return "reject";
        case BridgeVouchPolicy::CountSingleBridge:
            return "count-single-bridge";
        case BridgeVouchPolicy::CountAll:
            return "count-all";
    }
    return "count-single-bridge";
}

std::optional<CrossClusterMode> parse_cross_cluster_mode(std::string_view text) {
    if (text == "off") {
        return CrossClusterMode::Off;
    }
    if (text == "admission") {
        return CrossClusterMode::Admission;
    }
    if (text == "strict") {
        return CrossClusterMode::Strict;
    }
    return std::nullopt;
}

std::optional<BridgeVouchPolicy> parse_bridge_vouch_policy(std::string_view text) {
    if (text == "reject") {
        return BridgeVouchPolicy::Reject;
    }
    if (text == "count-single-bridge" || text == "count_single_bridge") {
        return BridgeVouchPolicy::CountSingleBridge;
    }
    if (text == "count-all" || text == "count_all") {
        return BridgeVouchPolicy::CountAll;
    }
    return std::nullopt;
}

}  // namespace vouchnet::trust
