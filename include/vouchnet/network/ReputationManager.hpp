#pragma once

#include "vouchnet/Config.hpp"
#include "vouchnet/Types.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>

namespace vouchnet::network {

struct ReputationRecord {
    PeerId peer{};
    std::uint64_t successes{0};
    std::uint64_t failures{0};
    std::uint32_t consecutive_failures{0};
    Timestamp registered_at{};
    std::uint64_t chunks_held{0};
    bool capacity_verified{false};
};

// Mutated only by verification outcomes; never by a peer's own claims.
class ReputationManager {
public:
    explicit ReputationManager(const Config& config);

    void track(const PeerId& peer, Timestamp registered_at);
    void forget(const PeerId& peer);

    void record_success(const PeerId& peer);
    void record_failure(const PeerId& peer);
    void record_chunk_held(const PeerId& peer);
    void set_capacity_verified(const PeerId& peer, bool verified);

    std::optional<ReputationRecord> record(const PeerId& peer) const;
    // 0 for unknown peers.
    double score(const PeerId& peer, Timestamp now) const;
    std::size_t peer_count() const;

    static double compute_score(const ReputationRecord& record, Timestamp now, const Config& config);

private:
    Config config_;
    std::map<PeerId, ReputationRecord> records_;
    mutable std::mutex mutex_;
};

}  // namespace vouchnet::network
