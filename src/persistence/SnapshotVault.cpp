#include "vouchnet/persistence/SnapshotVault.hpp"

#include "vouchnet/log/StructuredLogger.hpp"
#include "vouchnet/trust/StateCodec.hpp"

#include <stdexcept>

namespace vouchnet::persistence {

SnapshotVault::SnapshotVault(const MemberId& owner,
                             std::span<const std::uint8_t> owner_secret,
                             Distributor& distributor,
                             Recovery& recovery)
    : owner_(owner),
      cipher_(owner_secret),
      distributor_(distributor),
      recovery_(recovery) {}

DistributionReport SnapshotVault::persist(const trust::TrustState& state, Timestamp now) {
    const auto sealed = cipher_.seal(trust::encode_state(state));
    return distributor_.distribute(owner_, sealed, state.epoch, now);
}

RestoreResult SnapshotVault::restore(ChunkManifest& manifest, Timestamp now) {
    return open(recovery_.recover(manifest, now));
}

RestoreResult SnapshotVault::restore(std::uint32_t chunk_count, const std::vector<PeerId>& peers, std::uint64_t epoch) {
    const auto authentic = [this](std::span<const std::uint8_t> sealed) {
        return cipher_.open(sealed).has_value();
    };
    return open(recovery_.recover(owner_, chunk_count, peers, epoch, authentic));
}

RestoreResult SnapshotVault::open(RecoveryReport report) const {
    RestoreResult result;
    if (report.complete && report.sealed) {
        const auto plaintext = cipher_.open(*report.sealed);
        if (!plaintext) {
            log::StructuredLogger::instance().error("vault.snapshot_rejected", {{"owner", short_id(owner_)}});
            throw VouchnetError(ErrorCode::CorruptChunk, "recovered snapshot failed authentication");
        }
        try {
            result.state = trust::decode_state(*plaintext);
        } catch (const std::invalid_argument& ex) {
            throw VouchnetError(ErrorCode::CorruptChunk, std::string("recovered snapshot is malformed: ") + ex.what());
        }
    }
    result.report = std::move(report);
    return result;
}

}  // namespace vouchnet::persistence
