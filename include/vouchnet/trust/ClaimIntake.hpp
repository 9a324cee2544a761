#pragma once

#include "vouchnet/Types.hpp"
#include "vouchnet/trust/TrustState.hpp"

#include <vector>

namespace vouchnet::trust {

// Semantic payload of a claim whose proof was checked outside the core.
struct VerifiedClaim {
    enum class Kind {
        Admission,
        Vouch,
        Flag
    };

    Kind kind{Kind::Vouch};
    MemberId endorser{};
    MemberId subject{};
};

struct ClaimOutcome {
    bool verified{false};
    VerifiedClaim claim{};
};

// Admission claims add the subject and record the endorser's vouch.
// Unverified outcomes are dropped.
StateDelta delta_from_claims(const std::vector<ClaimOutcome>& outcomes);

}  // namespace vouchnet::trust
