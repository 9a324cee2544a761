#pragma once

#include "vouchnet/Types.hpp"

#include <cstdint>
#include <vector>

namespace vouchnet::persistence {

// Rendezvous score of `candidate` for one chunk of `owner` at `epoch`.
Digest rendezvous_score(const MemberId& owner, std::uint32_t chunk_index, const PeerId& candidate, std::uint64_t epoch);

// Every candidate except the owner, highest score first, ties by peer id.
// Duplicate candidates are ignored.
std::vector<PeerId> rank_candidates(const MemberId& owner,
                                    std::uint32_t chunk_index,
                                    const std::vector<PeerId>& peers,
                                    std::uint64_t epoch);

// Top `replica_factor` of rank_candidates; shorter when there are not enough peers.
std::vector<PeerId> holders(const MemberId& owner,
                            std::uint32_t chunk_index,
                            const std::vector<PeerId>& peers,
                            std::uint64_t epoch,
                            std::size_t replica_factor);

struct HolderPlan {
    std::uint64_t epoch{0};
    // Indexed by chunk.
    std::vector<std::vector<PeerId>> holders;

    bool complete(std::size_t replica_factor) const;
};

HolderPlan assign_all(const MemberId& owner,
                      std::uint32_t chunk_count,
                      const std::vector<PeerId>& peers,
                      std::uint64_t epoch,
                      std::size_t replica_factor);

}  // namespace vouchnet::persistence
