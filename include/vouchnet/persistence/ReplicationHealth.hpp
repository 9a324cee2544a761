#pragma once

#include "vouchnet/Types.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string_view>
#include <vector>

namespace vouchnet::persistence {

enum class ReplicationStatus {
    // No chunks tracked yet.
    Initializing,
    // Every chunk has at least replica_factor confirmed holders.
    Replicated,
    // Every chunk has a holder, some fewer than replica_factor.
    Partial,
    // Some chunk has no confirmed holder.
    AtRisk
};

std::string_view replication_status_name(ReplicationStatus status);

// Whether the owner may keep changing its trust state. The owner's local copy
// counts as one replica, so a chunk with no confirmed remote holder is at risk.
enum class WriteBlockingState {
    // Nothing distributed yet, or the network size is unknown.
    Provisional,
    // Every chunk has a confirmed remote holder.
    Active,
    // Some chunk is at risk while other peers exist; writes wait for replication.
    Degraded,
    // The owner is alone on the network; nothing can be replicated.
    Isolated
};

std::string_view write_blocking_state_name(WriteBlockingState state);
bool allows_writes(WriteBlockingState state) noexcept;

class ReplicationHealth {
public:
    explicit ReplicationHealth(std::size_t replica_factor);

    // Starts tracking a fresh chunk set; previous confirmations are dropped.
    void reset(std::uint32_t chunk_count);
    void record(std::uint32_t chunk_index, const PeerId& holder, bool confirmed);
    void forget_holder(const PeerId& holder);

    ReplicationStatus status() const;
    std::size_t confirmed_replicas(std::uint32_t chunk_index) const;
    // Fraction of chunks with a full replica set.
    double ratio() const;
    // `network_size` counts the owner itself.
    WriteBlockingState write_state(std::size_t network_size) const;
    bool can_write(std::size_t network_size) const;
    std::vector<std::uint32_t> at_risk_chunks() const;

private:
    std::size_t confirmed_locked(std::uint32_t chunk_index) const;

    std::size_t replica_factor_;
    std::uint32_t chunk_count_{0};
    std::map<std::uint32_t, std::map<PeerId, bool>> confirmations_;
    mutable std::mutex mutex_;
};

}  // namespace vouchnet::persistence
