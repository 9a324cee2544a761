#pragma once

#include "vouchnet/Config.hpp"
#include "vouchnet/Types.hpp"
#include "vouchnet/persistence/PeerChannel.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace vouchnet::storage {

struct HeldChunk {
    MemberId owner{};
    std::uint64_t epoch{0};
    persistence::Chunk chunk;
};

// What a holder peer keeps on behalf of other owners. Only sealed chunk bytes
// ever reach it; an owner's newer epoch replaces everything held for that owner.
class HolderStore {
public:
    HolderStore(const Config& config, const PeerId& self);

    struct SnapshotEntry {
        MemberId owner{};
        std::uint32_t index{0};
        std::uint64_t epoch{0};
        std::size_t size{0};
    };

    // nullopt when the chunk fails its hash, is older than what is held, or would exceed capacity.
    std::optional<persistence::PushReceipt> accept(const persistence::PushRequest& request);
    std::optional<persistence::Chunk> fetch(const persistence::FetchRequest& request) const;
    std::optional<security::PossessionResponse> answer(const security::PossessionChallenge& challenge,
                                                       Timestamp responded_at) const;
    security::CapacityResponse prove_capacity(const security::CapacityChallenge& challenge, Timestamp now) const;

    bool drop_owner(const MemberId& owner);

    const PeerId& self() const noexcept { return self_; }
    std::size_t bytes_used() const;
    std::size_t size() const;
    std::vector<SnapshotEntry> snapshot() const;

private:
    using Key = std::pair<MemberId, std::uint32_t>;

    void erase_owner_locked(const MemberId& owner);

    Config config_;
    PeerId self_;
    std::map<Key, HeldChunk> chunks_;
    std::map<MemberId, std::uint64_t> owner_epochs_;
    std::size_t bytes_used_{0};
    mutable std::mutex chunks_mutex_;
};

}  // namespace vouchnet::storage
