#pragma once

#include "vouchnet/Types.hpp"
#include "vouchnet/crypto/SnapshotCipher.hpp"
#include "vouchnet/persistence/Distributor.hpp"
#include "vouchnet/persistence/Recovery.hpp"
#include "vouchnet/trust/TrustState.hpp"

#include <optional>
#include <span>

namespace vouchnet::persistence {

struct RestoreResult {
    RecoveryReport report;
    // Set only when every chunk came back and the snapshot authenticated.
    std::optional<trust::TrustState> state;
};

// Ties the trust ledger to the persistence network for one owner.
class SnapshotVault {
public:
    SnapshotVault(const MemberId& owner,
                  std::span<const std::uint8_t> owner_secret,
                  Distributor& distributor,
                  Recovery& recovery);

    // Seals the encoded state and distributes it under the state's epoch.
    DistributionReport persist(const trust::TrustState& state, Timestamp now);

    // Throws VouchnetError(CorruptChunk) when the chunks match the manifest but
    // the snapshot does not open under this owner's secret.
    RestoreResult restore(ChunkManifest& manifest, Timestamp now);
    // Copies that fail to open are skipped; when none combine into a snapshot
    // that opens, the report carries RecoveryIncomplete.
    RestoreResult restore(std::uint32_t chunk_count, const std::vector<PeerId>& peers, std::uint64_t epoch);

    const crypto::SnapshotCipher& cipher() const noexcept { return cipher_; }

private:
    RestoreResult open(RecoveryReport report) const;

    MemberId owner_;
    crypto::SnapshotCipher cipher_;
    Distributor& distributor_;
    Recovery& recovery_;
};

}  // namespace vouchnet::persistence
