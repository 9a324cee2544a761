#pragma once

#include "vouchnet/Config.hpp"
#include "vouchnet/Errors.hpp"
#include "vouchnet/Types.hpp"
#include "vouchnet/crypto/ChaCha20.hpp"
#include "vouchnet/network/DiscoveryRegistry.hpp"
#include "vouchnet/network/ReputationManager.hpp"
#include "vouchnet/persistence/Attestation.hpp"
#include "vouchnet/persistence/ChunkManifest.hpp"
#include "vouchnet/persistence/PeerChannel.hpp"
#include "vouchnet/persistence/ReplicationHealth.hpp"
#include "vouchnet/persistence/TransferPool.hpp"
#include "vouchnet/security/PossessionVerifier.hpp"
#include "vouchnet/security/SybilGate.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace vouchnet::persistence {

struct DistributionReport {
    // Every chunk reached replica_factor confirmed holders.
    bool complete{false};
    // Not enough eligible peers; nothing was pushed.
    bool deferred{false};
    std::optional<ErrorCode> code;
    std::string reason;

    std::uint64_t epoch{0};
    std::uint32_t chunk_count{0};
    std::size_t eligible_peers{0};
    std::size_t pushes_attempted{0};
    std::size_t pushes_confirmed{0};
    std::size_t fallbacks_used{0};
    std::vector<std::uint32_t> under_replicated;

    std::vector<Attestation> attestations;
    ChunkManifest manifest;
    ReplicationStatus health{ReplicationStatus::Initializing};
};

struct AuditReport {
    std::size_t verified{0};
    std::size_t failed{0};
    // Holders whose probes ran out; they were not challenged.
    std::size_t unchecked{0};
};

// Owner side of replication: pushes sealed snapshot chunks to rendezvous-ranked,
// Sybil-eligible peers and keeps the bookkeeping for later recovery.
class Distributor {
public:
    Distributor(const Config& config,
                PeerChannel& channel,
                network::DiscoveryRegistry& registry,
                network::ReputationManager& reputation,
                const security::SybilGate& gate,
                const crypto::Key& attestation_key);

    // Throws VouchnetError(InvalidState) unless `epoch` is newer than the last distribution.
    DistributionReport distribute(const MemberId& owner,
                                  std::span<const std::uint8_t> sealed_snapshot,
                                  std::uint64_t epoch,
                                  Timestamp now);

    // Periodic possession check of the manifest's holders; consumes one probe per holder.
    AuditReport audit(ChunkManifest& manifest, Timestamp now);

    const ReplicationHealth& health() const noexcept { return health_; }
    std::optional<std::uint64_t> last_epoch() const;

private:
    struct Slot {
        std::size_t chunk;
        PeerId peer;
    };

    void note_outcome(const PeerId& peer, bool ok);

    Config config_;
    PeerChannel& channel_;
    network::DiscoveryRegistry& registry_;
    network::ReputationManager& reputation_;
    const security::SybilGate& gate_;
    crypto::Key attestation_key_;
    security::PossessionVerifier verifier_;
    ReplicationHealth health_;
    TransferPool pool_;

    mutable std::mutex mutex_;
    std::optional<std::uint64_t> last_epoch_;
};

}  // namespace vouchnet::persistence
