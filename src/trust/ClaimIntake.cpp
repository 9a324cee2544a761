#include "vouchnet/trust/ClaimIntake.hpp"

#include <set>

namespace vouchnet::trust {

StateDelta delta_from_claims(const std::vector<ClaimOutcome>& outcomes) {
    StateDelta delta;
    std::set<MemberId> admitted;
    std::set<Edge> vouches;
    std::set<Edge> flags;

    for (const auto& outcome : outcomes) {
        if (!outcome.verified) {
            continue;
        }
        const auto& claim = outcome.claim;
        const Edge edge{claim.endorser, claim.subject};
        switch (claim.kind) {
            case VerifiedClaim::Kind::Admission:
                if (admitted.insert(claim.subject).second) {
                    delta.members_added.push_back(claim.subject);
                }
                if (vouches.insert(edge).second) {
                    delta.vouches_added.push_back(edge);
                }
                break;
            case VerifiedClaim::Kind::Vouch:
                if (vouches.insert(edge).second) {
                    delta.vouches_added.push_back(edge);
                }
                break;
            case VerifiedClaim::Kind::Flag:
                if (flags.insert(edge).second) {
                    delta.flags_added.push_back(edge);
                }
                break;
        }
    }
    return delta;
}

}  // namespace vouchnet::trust
