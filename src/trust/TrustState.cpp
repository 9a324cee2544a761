#include "vouchnet/trust/TrustState.hpp"

#include "vouchnet/trust/ClusterAnalyzer.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace vouchnet::trust {

namespace {

const MemberSet& empty_set() {
    static const MemberSet kEmpty;
    return kEmpty;
}

void merge_edges(EdgeMap& into, const EdgeMap& from) {
    for (const auto& [target, sources] : from) {
        into[target].insert(sources.begin(), sources.end());
    }
}

void add_edge(EdgeMap& map, const Edge& edge) {
    map[edge.to].insert(edge.from);
}

std::vector<Edge> edges_missing_from(const EdgeMap& base, const EdgeMap& next) {
    std::vector<Edge> out;
    for (const auto& [target, sources] : next) {
        const auto& known = [&]() -> const MemberSet& {
            const auto it = base.find(target);
            return it == base.end() ? empty_set() : it->second;
        }();
        for (const auto& source : sources) {
            if (!known.contains(source)) {
                out.push_back(Edge{source, target});
            }
        }
    }
    return out;
}

DeltaOutcome reject(RejectReason reason, std::string detail, std::optional<MemberId> member = std::nullopt) {
    DeltaOutcome outcome;
    outcome.reason = reason;
    outcome.member = member;
    outcome.detail = std::move(detail);
    return outcome;
}

bool has_cross_cluster_pair(const MemberSet& vouchers, const ClusterAnalysis& analysis, BridgeVouchPolicy policy) {
    for (auto first = vouchers.begin(); first != vouchers.end(); ++first) {
        for (auto second = std::next(first); second != vouchers.end(); ++second) {
            if (analysis.is_cross_cluster(*first, *second, policy)) {
                return true;
            }
        }
    }
    return false;
}

}  // namespace

const MemberSet& TrustState::vouchers_of(const MemberId& id) const {
    const auto it = vouches.find(id);
    return it == vouches.end() ? empty_set() : it->second;
}

const MemberSet& TrustState::flaggers_of(const MemberId& id) const {
    const auto it = flags.find(id);
    return it == flags.end() ? empty_set() : it->second;
}

bool TrustState::has_vouch(const MemberId& voucher, const MemberId& vouchee) const {
    return vouchers_of(vouchee).contains(voucher);
}

bool TrustState::has_flag(const MemberId& flagger, const MemberId& flagged) const {
    return flaggers_of(flagged).contains(flagger);
}

std::string_view reject_reason_name(RejectReason reason) {
    switch (reason) {
        case RejectReason::EmptyDelta:
            return "EmptyDelta";
        case RejectReason::ConflictingDelta:
            return "ConflictingDelta";
        case RejectReason::TombstonedIdentity:
            return "TombstonedIdentity";
        case RejectReason::SelfEdge:
            return "SelfEdge";
        case RejectReason::InactiveEndorser:
            return "InactiveEndorser";
        case RejectReason::InsufficientVouches:
            return "InsufficientVouches";
        case RejectReason::CrossClusterRequired:
            return "CrossClusterRequired";
        case RejectReason::InvalidResultingState:
            return "InvalidResultingState";
        case RejectReason::WritesBlocked:
            return "WritesBlocked";
    }
    return "Unknown";
}

std::string_view violation_kind_name(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::ActiveAndRemoved:
            return "ActiveAndRemoved";
        case ViolationKind::SelfVouch:
            return "SelfVouch";
        case ViolationKind::SelfFlag:
            return "SelfFlag";
        case ViolationKind::ZeroThreshold:
            return "ZeroThreshold";
    }
    return "Unknown";
}

std::string_view finding_kind_name(FindingKind kind) {
    switch (kind) {
        case FindingKind::BelowThreshold:
            return "BelowThreshold";
        case FindingKind::NegativeStanding:
            return "NegativeStanding";
        case FindingKind::CrossClusterDeficit:
            return "CrossClusterDeficit";
    }
    return "Unknown";
}

const MemberFinding* ValidationReport::finding_for(const MemberId& member) const {
    const auto it = std::find_if(findings.begin(), findings.end(), [&](const MemberFinding& finding) {
        return finding.member == member;
    });
    return it == findings.end() ? nullptr : &*it;
}

bool vouch_counts(const TrustState& state, const MemberId& voucher, const MemberId& vouchee) {
    return voucher != vouchee && state.is_active(voucher) && state.has_vouch(voucher, vouchee) &&
           !state.has_flag(voucher, vouchee) && !state.has_flag(vouchee, voucher);
}

bool flag_counts(const TrustState& state, const MemberId& flagger, const MemberId& flagged) {
    return flagger != flagged && state.is_active(flagger) && state.has_flag(flagger, flagged) &&
           !state.has_vouch(flagger, flagged);
}

MemberSet valid_vouchers(const TrustState& state, const MemberId& member) {
    MemberSet out;
    for (const auto& voucher : state.vouchers_of(member)) {
        if (vouch_counts(state, voucher, member)) {
            out.insert(voucher);
        }
    }
    return out;
}

Standing standing(const TrustState& state, const MemberId& member) {
    Standing result{};
    result.valid_vouches = static_cast<std::uint32_t>(valid_vouchers(state, member).size());
    for (const auto& flagger : state.flaggers_of(member)) {
        if (flag_counts(state, flagger, member)) {
            ++result.counted_flags;
        }
    }
    result.standing = static_cast<std::int64_t>(result.valid_vouches) - static_cast<std::int64_t>(result.counted_flags);
    return result;
}

TrustState merge(const TrustState& lhs, const TrustState& rhs) {
    TrustState merged;
    merged.removed = lhs.removed;
    merged.removed.insert(rhs.removed.begin(), rhs.removed.end());

    for (const auto* side : {&lhs.active, &rhs.active}) {
        for (const auto& member : *side) {
            if (!merged.removed.contains(member)) {
                merged.active.insert(member);
            }
        }
    }

    merged.vouches = lhs.vouches;
    merge_edges(merged.vouches, rhs.vouches);
    merged.flags = lhs.flags;
    merge_edges(merged.flags, rhs.flags);

    merged.policy = newer_policy(lhs.policy, rhs.policy);
    merged.epoch = std::max(lhs.epoch, rhs.epoch);
    return merged;
}

DeltaOutcome apply_delta(const TrustState& state, const StateDelta& delta) {
    if (delta.empty()) {
        return reject(RejectReason::EmptyDelta, "delta carries no changes");
    }

    const MemberSet removing(delta.members_removed.begin(), delta.members_removed.end());
    for (const auto& member : delta.members_added) {
        if (removing.contains(member)) {
            return reject(RejectReason::ConflictingDelta, "member both added and removed", member);
        }
        if (state.is_removed(member)) {
            return reject(RejectReason::TombstonedIdentity, "removed identities cannot rejoin", member);
        }
    }
    for (const auto& edge : delta.vouches_added) {
        if (state.is_removed(edge.to)) {
            return reject(RejectReason::TombstonedIdentity, "vouch targets a removed identity", edge.to);
        }
    }

    for (const auto* edges : {&delta.vouches_added, &delta.flags_added}) {
        for (const auto& edge : *edges) {
            if (edge.from == edge.to) {
                return reject(RejectReason::SelfEdge, "members cannot vouch for or flag themselves", edge.from);
            }
        }
    }

    TrustState next = state;
    for (const auto& member : delta.members_removed) {
        next.active.erase(member);
        next.removed.insert(member);
    }
    MemberSet newcomers;
    for (const auto& member : delta.members_added) {
        if (next.active.insert(member).second) {
            newcomers.insert(member);
        }
    }
    for (const auto& edge : delta.vouches_added) {
        add_edge(next.vouches, edge);
    }
    for (const auto& edge : delta.flags_added) {
        add_edge(next.flags, edge);
    }
    if (delta.policy) {
        next.policy = newer_policy(next.policy, *delta.policy);
    }
    next.epoch = state.epoch + 1;

    for (const auto* edges : {&delta.vouches_added, &delta.flags_added}) {
        for (const auto& edge : *edges) {
            if (!next.is_active(edge.from)) {
                return reject(RejectReason::InactiveEndorser, "endorser is not an active member", edge.from);
            }
        }
    }

    const auto threshold = next.policy.min_vouch_threshold;
    for (const auto& member : newcomers) {
        const auto count = valid_vouchers(next, member).size();
        if (count < threshold) {
            return reject(RejectReason::InsufficientVouches,
                          "has " + std::to_string(count) + " valid vouches, needs " + std::to_string(threshold),
                          member);
        }
    }

    if (!newcomers.empty() && next.policy.cross_cluster_mode != CrossClusterMode::Off) {
        const auto before = ClusterAnalysis::analyze(state);
        if (before.tight_cluster_count() >= 2) {
            for (const auto& member : newcomers) {
                if (!has_cross_cluster_pair(valid_vouchers(next, member), before, next.policy.bridge_vouch_policy)) {
                    return reject(RejectReason::CrossClusterRequired,
                                  "vouchers must come from different clusters",
                                  member);
                }
            }
        }
    }

    const auto report = validate(next);
    if (!report.acceptable()) {
        return reject(RejectReason::InvalidResultingState,
                      std::string("resulting state has violation ") +
                          std::string(violation_kind_name(report.violations.front().kind)),
                      report.violations.front().member);
    }
    for (const auto& member : newcomers) {
        if (const auto* finding = report.finding_for(member)) {
            const auto reason = finding->kind == FindingKind::CrossClusterDeficit ? RejectReason::CrossClusterRequired
                                                                                  : RejectReason::InvalidResultingState;
            return reject(reason, std::string("admitted member would be ") + std::string(finding_kind_name(finding->kind)),
                          member);
        }
    }

    DeltaOutcome outcome;
    outcome.accepted = true;
    outcome.state = std::move(next);
    return outcome;
}

ValidationReport validate(const TrustState& state) {
    ValidationReport report;
    if (state.policy.min_vouch_threshold == 0) {
        report.violations.push_back({ViolationKind::ZeroThreshold, MemberId{}});
    }
    for (const auto& member : state.active) {
        if (state.is_removed(member)) {
            report.violations.push_back({ViolationKind::ActiveAndRemoved, member});
        }
    }
    for (const auto& [target, sources] : state.vouches) {
        if (sources.contains(target)) {
            report.violations.push_back({ViolationKind::SelfVouch, target});
        }
    }
    for (const auto& [target, sources] : state.flags) {
        if (sources.contains(target)) {
            report.violations.push_back({ViolationKind::SelfFlag, target});
        }
    }

    std::optional<ClusterAnalysis> analysis;
    if (state.policy.cross_cluster_mode == CrossClusterMode::Strict) {
        analysis = ClusterAnalysis::analyze(state);
        if (analysis->tight_cluster_count() < 2) {
            analysis.reset();
        }
    }

    const auto threshold = state.policy.min_vouch_threshold;
    for (const auto& member : state.active) {
        MemberFinding finding{};
        finding.member = member;
        finding.standing = standing(state, member);
        if (finding.standing.valid_vouches < threshold) {
            finding.kind = FindingKind::BelowThreshold;
        } else if (finding.standing.standing < 0) {
            finding.kind = FindingKind::NegativeStanding;
        } else if (analysis) {
            finding.cross_cluster_vouches = static_cast<std::uint32_t>(cross_cluster_vouch_count(state, *analysis, member));
            if (finding.cross_cluster_vouches >= threshold) {
                continue;
            }
            finding.kind = FindingKind::CrossClusterDeficit;
        } else {
            continue;
        }
        report.findings.push_back(finding);
    }
    return report;
}

StateDelta ejection_delta(const ValidationReport& report) {
    StateDelta delta;
    MemberSet seen;
    for (const auto& finding : report.findings) {
        if (seen.insert(finding.member).second) {
            delta.members_removed.push_back(finding.member);
        }
    }
    return delta;
}

TrustState genesis(const std::vector<MemberId>& founders, const GroupPolicy& policy) {
    const MemberSet unique(founders.begin(), founders.end());
    if (policy.min_vouch_threshold == 0) {
        throw std::invalid_argument("vouch threshold must be positive");
    }
    if (unique.size() <= policy.min_vouch_threshold) {
        throw std::invalid_argument("genesis needs more founders than the vouch threshold");
    }

    TrustState state;
    state.active = unique;
    state.policy = policy;
    state.epoch = 1;
    for (const auto& vouchee : unique) {
        for (const auto& voucher : unique) {
            if (voucher != vouchee) {
                state.vouches[vouchee].insert(voucher);
            }
        }
    }
    return state;
}

StateDelta diff(const TrustState& from, const TrustState& to) {
    StateDelta delta;
    std::set_difference(to.active.begin(), to.active.end(), from.active.begin(), from.active.end(),
                        std::back_inserter(delta.members_added));
    std::set_difference(to.removed.begin(), to.removed.end(), from.removed.begin(), from.removed.end(),
                        std::back_inserter(delta.members_removed));
    delta.vouches_added = edges_missing_from(from.vouches, to.vouches);
    delta.flags_added = edges_missing_from(from.flags, to.flags);
    if (!(from.policy == to.policy)) {
        delta.policy = to.policy;
    }
    return delta;
}

bool same_content(const TrustState& lhs, const TrustState& rhs) {
    return lhs.active == rhs.active && lhs.removed == rhs.removed && lhs.vouches == rhs.vouches &&
           lhs.flags == rhs.flags && lhs.policy == rhs.policy;
}

}  // namespace vouchnet::trust
