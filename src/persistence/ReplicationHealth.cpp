#include "vouchnet/persistence/ReplicationHealth.hpp"

#include <algorithm>

namespace vouchnet::persistence {

std::string_view replication_status_name(ReplicationStatus status) {
    switch (status) {
        case ReplicationStatus::Initializing:
            return "initializing";
        case ReplicationStatus::Replicated:
            return "replicated";
        case ReplicationStatus::Partial:
            return "partial";
        case ReplicationStatus::AtRisk:
            return "at_risk";
    }
    return "initializing";
}

std::string_view write_blocking_state_name(WriteBlockingState state) {
    switch (state) {
        case WriteBlockingState::Provisional:
            return "provisional";
        case WriteBlockingState::Active:
            return "active";
        case WriteBlockingState::Degraded:
            return "degraded";
        case WriteBlockingState::Isolated:
            return "isolated";
    }
    return "provisional";
}

bool allows_writes(WriteBlockingState state) noexcept {
    return state != WriteBlockingState::Degraded;
}

ReplicationHealth::ReplicationHealth(std::size_t replica_factor)
    : replica_factor_(std::max<std::size_t>(replica_factor, 1)) {}

void ReplicationHealth::reset(std::uint32_t chunk_count) {
    std::scoped_lock lock(mutex_);
    chunk_count_ = chunk_count;
    confirmations_.clear();
}

void ReplicationHealth::record(std::uint32_t chunk_index, const PeerId& holder, bool confirmed) {
    std::scoped_lock lock(mutex_);
    confirmations_[chunk_index][holder] = confirmed;
}

void ReplicationHealth::forget_holder(const PeerId& holder) {
    std::scoped_lock lock(mutex_);
    for (auto& [index, holders] : confirmations_) {
        holders.erase(holder);
    }
}

std::size_t ReplicationHealth::confirmed_locked(std::uint32_t chunk_index) const {
    const auto it = confirmations_.find(chunk_index);
    if (it == confirmations_.end()) {
        return 0;
    }
    return static_cast<std::size_t>(std::count_if(it->second.begin(), it->second.end(), [](const auto& entry) {
        return entry.second;
    }));
}

ReplicationStatus ReplicationHealth::status() const {
    std::scoped_lock lock(mutex_);
    if (chunk_count_ == 0) {
        return ReplicationStatus::Initializing;
    }
    bool all_replicated = true;
    for (std::uint32_t index = 0; index < chunk_count_; ++index) {
        const auto replicas = confirmed_locked(index);
        if (replicas == 0) {
            return ReplicationStatus::AtRisk;
        }
        all_replicated = all_replicated && replicas >= replica_factor_;
    }
    return all_replicated ? ReplicationStatus::Replicated : ReplicationStatus::Partial;
}

std::size_t ReplicationHealth::confirmed_replicas(std::uint32_t chunk_index) const {
    std::scoped_lock lock(mutex_);
    return confirmed_locked(chunk_index);
}

double ReplicationHealth::ratio() const {
    std::scoped_lock lock(mutex_);
    if (chunk_count_ == 0) {
        return 0.0;
    }
    std::uint32_t full = 0;
    for (std::uint32_t index = 0; index < chunk_count_; ++index) {
        full += confirmed_locked(index) >= replica_factor_ ? 1u : 0u;
    }
    return static_cast<double>(full) / chunk_count_;
}

WriteBlockingState ReplicationHealth::write_state(std::size_t network_size) const {
    const auto current = status();
    if (current == ReplicationStatus::Initializing || network_size == 0) {
        return WriteBlockingState::Provisional;
    }
    if (network_size == 1) {
        return WriteBlockingState::Isolated;
    }
    return current == ReplicationStatus::AtRisk ? WriteBlockingState::Degraded : WriteBlockingState::Active;
}

bool ReplicationHealth::can_write(std::size_t network_size) const {
    return allows_writes(write_state(network_size));
}

std::vector<std::uint32_t> ReplicationHealth::at_risk_chunks() const {
    std::scoped_lock lock(mutex_);
    std::vector<std::uint32_t> out;
    for (std::uint32_t index = 0; index < chunk_count_; ++index) {
        if (confirmed_locked(index) == 0) {
            out.push_back(index);
        }
    }
    return out;
}

}  // namespace vouchnet::persistence
