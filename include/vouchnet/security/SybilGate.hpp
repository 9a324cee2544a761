#pragma once

#include "vouchnet/Config.hpp"
#include "vouchnet/Errors.hpp"
#include "vouchnet/Types.hpp"
#include "vouchnet/network/DiscoveryRegistry.hpp"
#include "vouchnet/network/ReputationManager.hpp"
#include "vouchnet/security/CapacityProof.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace vouchnet::security {

enum class IneligibleReason {
    NotRegistered,
    TooYoung,
    CapacityUnverified,
    LowReputation,
    TooManyFailures
};

std::string_view ineligible_reason_name(IneligibleReason reason);

struct EligibilityVerdict {
    bool eligible{false};
    std::optional<IneligibleReason> reason;
    double score{0.0};

    explicit operator bool() const noexcept { return eligible; }
};

// Decides which registered peers may hold chunks. Eligibility is evaluated
// on every call, so a peer that degrades drops out without explicit revocation.
class SybilGate {
public:
    SybilGate(const Config& config,
              const network::DiscoveryRegistry& registry,
              network::ReputationManager& reputation);

    EligibilityVerdict evaluate(const PeerId& peer, Timestamp now) const;
    std::vector<PeerId> eligible_peers(const std::vector<network::RegistryEntry>& candidates, Timestamp now) const;

    CapacityChallenge issue_capacity_challenge(const PeerId& peer, std::uint64_t claimed_bytes, Timestamp now);
    // Throws VouchnetError(RegistrationRejected) when the proof fails or no challenge is pending.
    void settle_capacity(const PeerId& peer, const CapacityResponse& response, Timestamp now);

private:
    Config config_;
    const network::DiscoveryRegistry& registry_;
    network::ReputationManager& reputation_;

    std::mutex pending_mutex_;
    std::map<PeerId, CapacityChallenge> pending_;
};

}  // namespace vouchnet::security
