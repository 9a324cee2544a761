#pragma once

#include "vouchnet/trust/ClaimIntake.hpp"
#include "vouchnet/trust/TrustState.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vouchnet::trust {

struct DeltaRecord {
    std::uint64_t epoch{0};
    StateDelta delta;
};

struct MergeResult {
    bool changed{false};
    ValidationReport report;
    // Removal delta for every finding in the merged state; empty when nothing needs ejecting.
    StateDelta ejection;
};

// Consulted before every local write. Merges from other replicas are never blocked.
class WriteGuard {
public:
    virtual ~WriteGuard() = default;

    // Why writes are refused right now, or nullopt when they may proceed.
    virtual std::optional<std::string> write_block_reason() const = 0;
};

// Single point of truth for one replica. Commits are serialized; readers get
// immutable snapshots that stay valid after later commits.
class TrustStore {
public:
    explicit TrustStore(TrustState initial);

    DeltaOutcome apply(const StateDelta& delta);
    DeltaOutcome submit_claims(const std::vector<ClaimOutcome>& outcomes);

    // Throws VouchnetError(InvalidState) when the remote state or the merge
    // result has structural violations; the local state is left untouched.
    MergeResult merge_remote(const TrustState& remote);

    std::shared_ptr<const TrustState> snapshot() const;
    std::uint64_t epoch() const;
    std::vector<DeltaRecord> log() const;

    // The guard must outlive the store; nullptr removes it.
    void set_write_guard(const WriteGuard* guard);

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const TrustState> current_;
    std::vector<DeltaRecord> log_;
    const WriteGuard* guard_{nullptr};
};

}  // namespace vouchnet::trust
