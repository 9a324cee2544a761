#pragma once

#include "vouchnet/Types.hpp"
#include "vouchnet/persistence/ChunkCodec.hpp"
#include "vouchnet/security/CapacityProof.hpp"
#include "vouchnet/security/PossessionVerifier.hpp"

#include <cstdint>
#include <optional>

namespace vouchnet::persistence {

struct PushRequest {
    MemberId owner{};
    std::uint64_t epoch{0};
    Chunk chunk;
};

// Holder's acknowledgement of a stored chunk.
struct PushReceipt {
    PeerId holder{};
    std::uint32_t chunk_index{0};
    Digest content_hash{};
};

struct FetchRequest {
    MemberId owner{};
    std::uint32_t chunk_index{0};
};

// Opaque messaging to one peer. std::nullopt means the peer did not answer in
// time or refused; callers never learn why. Implementations must be safe to
// call from several threads at once.
class PeerChannel {
public:
    virtual ~PeerChannel() = default;

    virtual std::optional<PushReceipt> push(const PeerId& peer, const PushRequest& request) = 0;
    virtual std::optional<Chunk> fetch(const PeerId& peer, const FetchRequest& request) = 0;
    virtual std::optional<security::PossessionResponse> challenge(const PeerId& peer,
                                                                  const security::PossessionChallenge& challenge) = 0;
    virtual std::optional<security::CapacityResponse> capacity(const PeerId& peer,
                                                               const security::CapacityChallenge& challenge) = 0;
};

}  // namespace vouchnet::persistence
