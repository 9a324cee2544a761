#include "vouchnet/persistence/HolderAssignment.hpp"

#include "vouchnet/crypto/Sha256.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace vouchnet::persistence {

Digest rendezvous_score(const MemberId& owner, std::uint32_t chunk_index, const PeerId& candidate, std::uint64_t epoch) {
    crypto::Sha256 hasher;
    hasher.update(owner);
    hasher.update_u32(chunk_index);
    hasher.update(candidate);
    hasher.update_u64(epoch);
    return hasher.finalize();
}

std::vector<PeerId> rank_candidates(const MemberId& owner,
                                    std::uint32_t chunk_index,
                                    const std::vector<PeerId>& peers,
                                    std::uint64_t epoch) {
    const std::set<PeerId> unique(peers.begin(), peers.end());
    std::vector<std::pair<Digest, PeerId>> scored;
    scored.reserve(unique.size());
    for (const auto& peer : unique) {
        if (peer == owner) {
            continue;
        }
        scored.emplace_back(rendezvous_score(owner, chunk_index, peer, epoch), peer);
    }
    std::sort(scored.begin(), scored.end(), [](const auto& lhs, const auto& rhs) {
        if (lhs.first != rhs.first) {
            return lhs.first > rhs.first;
        }
        return lhs.second < rhs.second;
    });

    std::vector<PeerId> ranked;
    ranked.reserve(scored.size());
    for (const auto& [score, peer] : scored) {
        ranked.push_back(peer);
    }
    return ranked;
}

std::vector<PeerId> holders(const MemberId& owner,
                            std::uint32_t chunk_index,
                            const std::vector<PeerId>& peers,
                            std::uint64_t epoch,
                            std::size_t replica_factor) {
    auto ranked = rank_candidates(owner, chunk_index, peers, epoch);
    if (ranked.size() > replica_factor) {
        ranked.resize(replica_factor);
    }
    return ranked;
}

bool HolderPlan::complete(std::size_t replica_factor) const {
    return std::all_of(holders.begin(), holders.end(), [replica_factor](const auto& chunk_holders) {
        return chunk_holders.size() >= replica_factor;
    });
}

HolderPlan assign_all(const MemberId& owner,
                      std::uint32_t chunk_count,
                      const std::vector<PeerId>& peers,
                      std::uint64_t epoch,
                      std::size_t replica_factor) {
    HolderPlan plan;
    plan.epoch = epoch;
    plan.holders.reserve(chunk_count);
    for (std::uint32_t index = 0; index < chunk_count; ++index) {
        plan.holders.push_back(holders(owner, index, peers, epoch, replica_factor));
    }
    return plan;
}

}  // namespace vouchnet::persistence
