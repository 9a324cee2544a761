#include "vouchnet/security/SybilGate.hpp"

#include "vouchnet/log/StructuredLogger.hpp"

namespace vouchnet::security {

std::string_view ineligible_reason_name(IneligibleReason reason) {
    switch (reason) {
        case IneligibleReason::NotRegistered:
            return "not_registered";
        case IneligibleReason::TooYoung:
            return "too_young";
        case IneligibleReason::CapacityUnverified:
            return "capacity_unverified";
        case IneligibleReason::LowReputation:
            return "low_reputation";
        case IneligibleReason::TooManyFailures:
            return "too_many_failures";
    }
    return "unknown";
}

SybilGate::SybilGate(const Config& config,
                     const network::DiscoveryRegistry& registry,
                     network::ReputationManager& reputation)
    : config_(config),
      registry_(registry),
      reputation_(reputation) {}

EligibilityVerdict SybilGate::evaluate(const PeerId& peer, Timestamp now) const {
    EligibilityVerdict verdict{};
    const auto entry = registry_.find(peer);
    const auto record = reputation_.record(peer);
    if (!entry || !record) {
        verdict.reason = IneligibleReason::NotRegistered;
        return verdict;
    }
    verdict.score = network::ReputationManager::compute_score(*record, now, config_);

    if (now - record->registered_at < config_.min_holder_age) {
        verdict.reason = IneligibleReason::TooYoung;
    } else if (!record->capacity_verified) {
        verdict.reason = IneligibleReason::CapacityUnverified;
    } else if (record->consecutive_failures >= config_.max_consecutive_failures) {
        verdict.reason = IneligibleReason::TooManyFailures;
    } else if (verdict.score < config_.reputation_floor) {
        verdict.reason = IneligibleReason::LowReputation;
    } else {
        verdict.eligible = true;
    }
    return verdict;
}

std::vector<PeerId> SybilGate::eligible_peers(const std::vector<network::RegistryEntry>& candidates,
                                              Timestamp now) const {
    std::vector<PeerId> eligible;
    for (const auto& candidate : candidates) {
        if (evaluate(candidate.peer, now)) {
            eligible.push_back(candidate.peer);
        }
    }
    return eligible;
}

CapacityChallenge SybilGate::issue_capacity_challenge(const PeerId& peer, std::uint64_t claimed_bytes, Timestamp now) {
    auto challenge = security::issue_capacity_challenge(peer, claimed_bytes, now);
    std::scoped_lock lock(pending_mutex_);
    pending_.insert_or_assign(peer, challenge);
    return challenge;
}

void SybilGate::settle_capacity(const PeerId& peer, const CapacityResponse& response, Timestamp now) {
    CapacityChallenge challenge{};
    {
        std::scoped_lock lock(pending_mutex_);
        const auto it = pending_.find(peer);
        if (it == pending_.end()) {
            throw VouchnetError(ErrorCode::RegistrationRejected, "no capacity challenge pending for " + short_id(peer));
        }
        challenge = it->second;
        pending_.erase(it);
    }

    const auto result = verify_capacity(challenge, response, now, config_.capacity_challenge_window);
    reputation_.set_capacity_verified(peer, result.passed);
    auto& logger = log::StructuredLogger::instance();
    if (!result) {
        logger.warning("sybil.capacity_rejected", {{"peer", short_id(peer)}, {"reason", result.reason}});
        throw VouchnetError(ErrorCode::RegistrationRejected, "capacity proof failed: " + result.reason);
    }
    logger.info("sybil.capacity_verified",
                {{"peer", short_id(peer)}, {"bytes", std::to_string(challenge.claimed_bytes)}});
}

}  // namespace vouchnet::security
