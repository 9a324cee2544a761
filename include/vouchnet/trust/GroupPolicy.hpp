#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace vouchnet::trust {

// How the cross-cluster vouching rule is enforced once the vouch graph
// has split into two or more tight clusters.
enum class CrossClusterMode : std::uint8_t {
    // Every valid vouch counts regardless of cluster membership.
    Off = 0,
    // Newly admitted members need vouchers drawn from two different
    // clusters; existing members are grandfathered.
    Admission = 1,
    // validate() requires threshold cross-cluster vouches for every member.
    Strict = 2
};

// Whether vouches touching a bridge node (a member that belongs to no
// tight cluster) satisfy the cross-cluster rule.
enum class BridgeVouchPolicy : std::uint8_t {
    Reject = 0,
    CountSingleBridge = 1,
    CountAll = 2
};

// Replicated with the trust state; merges resolve conflicts by updated_at.
struct GroupPolicy {
    std::uint32_t min_vouch_threshold{2};
    CrossClusterMode cross_cluster_mode{CrossClusterMode::Admission};
    BridgeVouchPolicy bridge_vouch_policy{BridgeVouchPolicy::CountSingleBridge};
    std::uint64_t updated_at{0};

    bool operator==(const GroupPolicy&) const = default;
};

// Deterministic last-writer-wins choice between two policies.
const GroupPolicy& newer_policy(const GroupPolicy& lhs, const GroupPolicy& rhs);

std::string_view cross_cluster_mode_name(CrossClusterMode mode);
std::string_view bridge_vouch_policy_name(BridgeVouchPolicy policy);
std::optional<CrossClusterMode> parse_cross_cluster_mode(std::string_view text);
std::optional<BridgeVouchPolicy> parse_bridge_vouch_policy(std::string_view text);

}  // namespace vouchnet::trust
