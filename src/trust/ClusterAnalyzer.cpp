#include "vouchnet/trust/ClusterAnalyzer.hpp"

#include <algorithm>
#include <cstring>
#include <map>
#include <set>
#include <utility>

namespace vouchnet::trust {

namespace {

struct Adjacent {
    std::size_t node;
    std::size_t edge;
};

struct Frame {
    std::size_t node;
    std::size_t parent_edge;
    std::size_t next{0};
};

constexpr std::size_t kNoEdge = static_cast<std::size_t>(-1);

std::size_t find_root(std::vector<std::size_t>& parent, std::size_t node) {
    while (parent[node] != node) {
        parent[node] = parent[parent[node]];
        node = parent[node];
    }
    return node;
}

}  // namespace

std::size_t ClusterAnalysis::IdHash::operator()(const MemberId& id) const noexcept {
    std::size_t value = 0;
    std::memcpy(&value, id.data(), sizeof(value));
    return value;
}

ClusterAnalysis ClusterAnalysis::analyze(const TrustState& state) {
    std::vector<MemberId> nodes(state.active.begin(), state.active.end());
    std::vector<Edge> edges;
    for (const auto& member : state.active) {
        for (const auto& voucher : valid_vouchers(state, member)) {
            edges.push_back(Edge{voucher, member});
        }
    }
    return analyze_edges(nodes, edges);
}

ClusterAnalysis ClusterAnalysis::analyze_edges(const std::vector<MemberId>& nodes, const std::vector<Edge>& edges) {
    std::map<MemberId, std::size_t> index;
    std::vector<MemberId> ids;
    for (const auto& node : nodes) {
        if (index.emplace(node, ids.size()).second) {
            ids.push_back(node);
        }
    }

    // Mutual vouches collapse into one undirected edge.
    std::set<std::pair<std::size_t, std::size_t>> unique_edges;
    for (const auto& edge : edges) {
        const auto from = index.find(edge.from);
        const auto to = index.find(edge.to);
        if (from == index.end() || to == index.end() || from->second == to->second) {
            continue;
        }
        unique_edges.emplace(std::min(from->second, to->second), std::max(from->second, to->second));
    }

    const std::vector<std::pair<std::size_t, std::size_t>> edge_list(unique_edges.begin(), unique_edges.end());
    std::vector<std::vector<Adjacent>> adjacency(ids.size());
    for (std::size_t e = 0; e < edge_list.size(); ++e) {
        adjacency[edge_list[e].first].push_back({edge_list[e].second, e});
        adjacency[edge_list[e].second].push_back({edge_list[e].first, e});
    }

    // Iterative Tarjan: discovery time and low-link per node, zero = unvisited.
    std::vector<std::size_t> discovery(ids.size(), 0);
    std::vector<std::size_t> low(ids.size(), 0);
    std::vector<bool> is_bridge(edge_list.size(), false);
    std::size_t timer = 0;

    for (std::size_t root = 0; root < ids.size(); ++root) {
        if (discovery[root] != 0) {
            continue;
        }
        std::vector<Frame> stack;
        discovery[root] = low[root] = ++timer;
        stack.push_back({root, kNoEdge});

        while (!stack.empty()) {
            auto& frame = stack.back();
            if (frame.next < adjacency[frame.node].size()) {
                const auto adjacent = adjacency[frame.node][frame.next++];
                if (adjacent.edge == frame.parent_edge) {
                    continue;
                }
                if (discovery[adjacent.node] == 0) {
                    discovery[adjacent.node] = low[adjacent.node] = ++timer;
                    stack.push_back({adjacent.node, adjacent.edge});
                } else {
                    low[frame.node] = std::min(low[frame.node], discovery[adjacent.node]);
                }
                continue;
            }

            const auto finished = frame;
            stack.pop_back();
            if (stack.empty()) {
                continue;
            }
            const auto parent = stack.back().node;
            low[parent] = std::min(low[parent], low[finished.node]);
            if (low[finished.node] > discovery[parent]) {
                is_bridge[finished.parent_edge] = true;
            }
        }
    }

    std::vector<std::size_t> parent(ids.size());
    for (std::size_t i = 0; i < parent.size(); ++i) {
        parent[i] = i;
    }
    ClusterAnalysis analysis;
    for (std::size_t e = 0; e < edge_list.size(); ++e) {
        const auto [a, b] = edge_list[e];
        if (is_bridge[e]) {
            const auto lo = std::min(ids[a], ids[b]);
            const auto hi = std::max(ids[a], ids[b]);
            analysis.bridges_.push_back(Edge{lo, hi});
            continue;
        }
        parent[find_root(parent, a)] = find_root(parent, b);
    }
    std::sort(analysis.bridges_.begin(), analysis.bridges_.end());

    std::map<std::size_t, std::vector<MemberId>> components;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        components[find_root(parent, i)].push_back(ids[i]);
    }
    for (auto& [root_index, members] : components) {
        std::sort(members.begin(), members.end());
        if (members.size() >= 2) {
            analysis.clusters_.push_back(std::move(members));
        } else {
            analysis.bridge_nodes_.push_back(members.front());
        }
    }
    std::sort(analysis.clusters_.begin(), analysis.clusters_.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.front() < rhs.front();
    });
    std::sort(analysis.bridge_nodes_.begin(), analysis.bridge_nodes_.end());

    for (ClusterId id = 0; id < analysis.clusters_.size(); ++id) {
        for (const auto& member : analysis.clusters_[id]) {
            analysis.membership_.emplace(member, id);
        }
    }
    return analysis;
}

std::optional<ClusterAnalysis::ClusterId> ClusterAnalysis::cluster_of(const MemberId& member) const {
    const auto it = membership_.find(member);
    if (it == membership_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ClusterAnalysis::is_bridge_node(const MemberId& member) const {
    return std::binary_search(bridge_nodes_.begin(), bridge_nodes_.end(), member);
}

bool ClusterAnalysis::is_cross_cluster(const MemberId& a, const MemberId& b, BridgeVouchPolicy policy) const {
    const auto cluster_a = cluster_of(a);
    const auto cluster_b = cluster_of(b);
    if (cluster_a && cluster_b) {
        return *cluster_a != *cluster_b;
    }
    if (cluster_a || cluster_b) {
        return policy != BridgeVouchPolicy::Reject;
    }
    // Members unknown to the analysis (admitted later) are treated as bridge nodes.
    return policy == BridgeVouchPolicy::CountAll;
}

std::size_t cross_cluster_vouch_count(const TrustState& state,
                                      const ClusterAnalysis& analysis,
                                      const MemberId& member) {
    const auto vouchers = valid_vouchers(state, member);
    return static_cast<std::size_t>(std::count_if(vouchers.begin(), vouchers.end(), [&](const MemberId& voucher) {
        return analysis.is_cross_cluster(voucher, member, state.policy.bridge_vouch_policy);
    }));
}

}  // namespace vouchnet::trust
