#pragma once

#include "vouchnet/Config.hpp"
#include "vouchnet/Errors.hpp"
#include "vouchnet/Types.hpp"
#include "vouchnet/persistence/ChunkManifest.hpp"
#include "vouchnet/persistence/PeerChannel.hpp"
#include "vouchnet/persistence/TransferPool.hpp"
#include "vouchnet/security/PossessionVerifier.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace vouchnet::persistence {

struct RecoveryStats {
    std::size_t challenges_sent{0};
    std::size_t challenges_passed{0};
    std::size_t fetch_attempts{0};
    std::size_t fallbacks{0};
    std::size_t failures{0};
    // Chunk combinations joined and handed to the authenticator.
    std::size_t assemblies_tried{0};
    std::chrono::milliseconds elapsed{0};
};

// True when a joined sealed snapshot is genuine, e.g. SnapshotCipher::open succeeds.
using SnapshotAuthenticator = std::function<bool(std::span<const std::uint8_t>)>;

struct RecoveryReport {
    bool complete{false};
    // RecoveryIncomplete when any chunk had no source.
    std::optional<ErrorCode> code;
    std::vector<std::uint32_t> missing;
    // Every chunk had a source but no combination of the copies authenticated.
    bool authentication_failed{false};
    // Joined sealed snapshot; only set when complete.
    std::optional<Bytes> sealed;
    RecoveryStats stats;
};

// Pull-based reconstruction after the owner lost its local state. Never
// retries beyond the candidate list; gaps are reported, not thrown.
class Recovery {
public:
    Recovery(const Config& config, PeerChannel& channel);

    // Consumes one probe per challenged holder so probes are never replayed.
    RecoveryReport recover(ChunkManifest& manifest, Timestamp now);

    // Without a manifest there are no commitments to challenge against. Holders
    // are recomputed by rendezvous over `peers`, every ranked holder is asked for
    // its copy, and combinations of the distinct copies are joined until one
    // passes `authenticate` (at most Config::recovery_max_assemblies).
    // Throws std::invalid_argument when `authenticate` is empty.
    RecoveryReport recover(const MemberId& owner,
                           std::uint32_t chunk_count,
                           const std::vector<PeerId>& peers,
                           std::uint64_t epoch,
                           const SnapshotAuthenticator& authenticate);

private:
    // candidates[i] are the sources for chunk i in the order they should be tried.
    RecoveryReport fetch_all(const ChunkManifest& manifest,
                             const std::vector<std::vector<PeerId>>& candidates,
                             RecoveryStats stats,
                             std::chrono::steady_clock::time_point started);

    Config config_;
    PeerChannel& channel_;
    security::PossessionVerifier verifier_;
    TransferPool pool_;
};

}  // namespace vouchnet::persistence
