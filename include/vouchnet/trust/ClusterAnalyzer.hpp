#pragma once

#include "vouchnet/Types.hpp"
#include "vouchnet/trust/GroupPolicy.hpp"
#include "vouchnet/trust/TrustState.hpp"

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace vouchnet::trust {

// Partition of the undirected vouch graph into tight clusters (2-edge-connected
// components of size two or more) and bridge nodes (everything else).
class ClusterAnalysis {
public:
    using ClusterId = std::size_t;

    // Uses valid vouches between active members.
    static ClusterAnalysis analyze(const TrustState& state);
    static ClusterAnalysis analyze_edges(const std::vector<MemberId>& nodes, const std::vector<Edge>& edges);

    std::size_t tight_cluster_count() const noexcept { return clusters_.size(); }
    std::optional<ClusterId> cluster_of(const MemberId& member) const;
    bool is_bridge_node(const MemberId& member) const;

    // Cluster ids are ordered by their smallest member.
    const std::vector<std::vector<MemberId>>& clusters() const noexcept { return clusters_; }
    const std::vector<Edge>& bridges() const noexcept { return bridges_; }
    const std::vector<MemberId>& bridge_nodes() const noexcept { return bridge_nodes_; }

    // Two or more clusters exist, so the group should announce the cross-cluster rule.
    bool needs_announcement() const noexcept { return clusters_.size() >= 2; }

    bool is_cross_cluster(const MemberId& a, const MemberId& b, BridgeVouchPolicy policy) const;

private:
    struct IdHash {
        std::size_t operator()(const MemberId& id) const noexcept;
    };

    std::vector<std::vector<MemberId>> clusters_;
    std::vector<Edge> bridges_;
    std::vector<MemberId> bridge_nodes_;
    std::unordered_map<MemberId, ClusterId, IdHash> membership_;
};

// Valid vouchers of `member` whose vouch satisfies the cross-cluster rule relative to it.
std::size_t cross_cluster_vouch_count(const TrustState& state,
                                      const ClusterAnalysis& analysis,
                                      const MemberId& member);

}  // namespace vouchnet::trust
