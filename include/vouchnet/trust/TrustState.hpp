#pragma once

#include "vouchnet/Errors.hpp"
#include "vouchnet/Types.hpp"
#include "vouchnet/trust/GroupPolicy.hpp"

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace vouchnet::trust {

using MemberSet = std::set<MemberId>;
// Keyed by the endorsed member; values are the endorsers.
using EdgeMap = std::map<MemberId, MemberSet>;

struct Edge {
    MemberId from{};
    MemberId to{};

    auto operator<=>(const Edge&) const = default;
};

struct TrustState {
    MemberSet active;
    MemberSet removed;
    EdgeMap vouches;
    EdgeMap flags;
    GroupPolicy policy{};
    std::uint64_t epoch{0};

    bool is_active(const MemberId& id) const { return active.contains(id); }
    bool is_removed(const MemberId& id) const { return removed.contains(id); }

    const MemberSet& vouchers_of(const MemberId& id) const;
    const MemberSet& flaggers_of(const MemberId& id) const;
    bool has_vouch(const MemberId& voucher, const MemberId& vouchee) const;
    bool has_flag(const MemberId& flagger, const MemberId& flagged) const;

    bool operator==(const TrustState&) const = default;
};

struct StateDelta {
    std::vector<MemberId> members_added;
    std::vector<MemberId> members_removed;
    std::vector<Edge> vouches_added;
    std::vector<Edge> flags_added;
    std::optional<GroupPolicy> policy;

    bool empty() const {
        return members_added.empty() && members_removed.empty() && vouches_added.empty() && flags_added.empty() &&
               !policy.has_value();
    }
};

enum class RejectReason {
    EmptyDelta,
    ConflictingDelta,
    TombstonedIdentity,
    SelfEdge,
    InactiveEndorser,
    InsufficientVouches,
    CrossClusterRequired,
    InvalidResultingState,
    // Refused by the store before any rule ran; see TrustStore::set_write_guard.
    WritesBlocked
};

std::string_view reject_reason_name(RejectReason reason);

// Either the accepted successor state or the first rule the delta broke.
struct DeltaOutcome {
    bool accepted{false};
    std::optional<TrustState> state;
    std::optional<RejectReason> reason;
    std::optional<MemberId> member;
    std::string detail;

    ErrorCode code() const noexcept { return ErrorCode::InvalidDelta; }
    explicit operator bool() const noexcept { return accepted; }
};

struct Standing {
    std::uint32_t valid_vouches{0};
    std::uint32_t counted_flags{0};
    std::int64_t standing{0};
};

enum class ViolationKind {
    ActiveAndRemoved,
    SelfVouch,
    SelfFlag,
    ZeroThreshold
};

struct Violation {
    ViolationKind kind{ViolationKind::ActiveAndRemoved};
    MemberId member{};
};

enum class FindingKind {
    BelowThreshold,
    NegativeStanding,
    CrossClusterDeficit
};

struct MemberFinding {
    MemberId member{};
    FindingKind kind{FindingKind::BelowThreshold};
    Standing standing{};
    std::uint32_t cross_cluster_vouches{0};
};

// Violations make a state unacceptable; findings name members that should be ejected.
struct ValidationReport {
    std::vector<Violation> violations;
    std::vector<MemberFinding> findings;

    bool acceptable() const noexcept { return violations.empty(); }
    bool valid() const noexcept { return violations.empty() && findings.empty(); }
    const MemberFinding* finding_for(const MemberId& member) const;
};

std::string_view violation_kind_name(ViolationKind kind);
std::string_view finding_kind_name(FindingKind kind);

// A vouch counts when the voucher is active, distinct from the vouchee, and
// neither side flags the other.
bool vouch_counts(const TrustState& state, const MemberId& voucher, const MemberId& vouchee);
// Flags from active members who do not also vouch for the flagged member.
bool flag_counts(const TrustState& state, const MemberId& flagger, const MemberId& flagged);
MemberSet valid_vouchers(const TrustState& state, const MemberId& member);
Standing standing(const TrustState& state, const MemberId& member);

TrustState merge(const TrustState& lhs, const TrustState& rhs);
DeltaOutcome apply_delta(const TrustState& state, const StateDelta& delta);
ValidationReport validate(const TrustState& state);
StateDelta ejection_delta(const ValidationReport& report);

// Every founder vouches for every other founder. Throws std::invalid_argument
// unless there are more founders than the vouch threshold.
TrustState genesis(const std::vector<MemberId>& founders, const GroupPolicy& policy);

// Grow-only difference from `from` to `to`, suitable for the delta log.
StateDelta diff(const TrustState& from, const TrustState& to);
// Equality ignoring the epoch counter.
bool same_content(const TrustState& lhs, const TrustState& rhs);

}  // namespace vouchnet::trust
