#include "vouchnet/network/ReputationManager.hpp"

#include <algorithm>

namespace vouchnet::network {

ReputationManager::ReputationManager(const Config& config)
    : config_(config) {}

void ReputationManager::track(const PeerId& peer, Timestamp registered_at) {
    std::scoped_lock lock(mutex_);
    auto [it, inserted] = records_.try_emplace(peer);
    if (inserted) {
        it->second.peer = peer;
        it->second.registered_at = registered_at;
    }
}

void ReputationManager::forget(const PeerId& peer) {
    std::scoped_lock lock(mutex_);
    records_.erase(peer);
}

void ReputationManager::record_success(const PeerId& peer) {
    std::scoped_lock lock(mutex_);
    const auto it = records_.find(peer);
    if (it == records_.end()) {
        return;
    }
    ++it->second.successes;
    it->second.consecutive_failures = 0;
}

void ReputationManager::record_failure(const PeerId& peer) {
    std::scoped_lock lock(mutex_);
    const auto it = records_.find(peer);
    if (it == records_.end()) {
        return;
    }
    ++it->second.failures;
    ++it->second.consecutive_failures;
}

void ReputationManager::record_chunk_held(const PeerId& peer) {
    std::scoped_lock lock(mutex_);
    const auto it = records_.find(peer);
    if (it != records_.end()) {
        ++it->second.chunks_held;
    }
}

void ReputationManager::set_capacity_verified(const PeerId& peer, bool verified) {
    std::scoped_lock lock(mutex_);
    const auto it = records_.find(peer);
    if (it != records_.end()) {
        it->second.capacity_verified = verified;
    }
}

std::optional<ReputationRecord> ReputationManager::record(const PeerId& peer) const {
    std::scoped_lock lock(mutex_);
    const auto it = records_.find(peer);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

double ReputationManager::score(const PeerId& peer, Timestamp now) const {
    std::scoped_lock lock(mutex_);
    const auto it = records_.find(peer);
    if (it == records_.end()) {
        return 0.0;
    }
    return compute_score(it->second, now, config_);
}

std::size_t ReputationManager::peer_count() const {
    std::scoped_lock lock(mutex_);
    return records_.size();
}

double ReputationManager::compute_score(const ReputationRecord& record, Timestamp now, const Config& config) {
    const auto s = static_cast<double>(record.successes);
    const auto f = static_cast<double>(record.failures);
    const double success_ratio = s / (s + f + 1.0);

    const auto age = std::chrono::duration<double>(std::max(now - record.registered_at, Timestamp::duration::zero()));
    const auto saturation = std::chrono::duration<double>(config.reputation_age_saturation);
    const double age_ratio = saturation.count() > 0.0 ? std::min(age / saturation, 1.0) : 1.0;

    const double activity_ratio =
        config.reputation_chunk_saturation > 0
            ? std::min(static_cast<double>(record.chunks_held) / config.reputation_chunk_saturation, 1.0)
            : 1.0;

    return config.reputation_weight_success * success_ratio + config.reputation_weight_age * age_ratio +
           config.reputation_weight_activity * activity_ratio;
}

}  // namespace vouchnet::network
