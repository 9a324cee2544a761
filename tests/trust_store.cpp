#include "vouchnet/Errors.hpp"
#include "vouchnet/trust/ClaimIntake.hpp"
#include "vouchnet/trust/TrustStore.hpp"
#include "vouchnet/trust/ValidationHooks.hpp"

#include "memory_store.hpp"
#include "test_support.hpp"

#include <cassert>
#include <optional>
#include <string>
#include <vector>

using namespace vouchnet;
using namespace vouchnet::trust;

namespace {

const MemberId kA = test::member("ana");
const MemberId kB = test::member("ben");
const MemberId kC = test::member("cai");
const MemberId kD = test::member("dee");
const MemberId kX = test::member("xia");
const MemberId kY = test::member("yan");

TrustState founders() {
    GroupPolicy policy{};
    policy.min_vouch_threshold = 2;
    return genesis({kA, kB, kC, kD}, policy);
}

StateDelta admit_x() {
    StateDelta delta;
    delta.members_added.push_back(kX);
    delta.vouches_added = {Edge{kA, kX}, Edge{kB, kX}};
    return delta;
}

StateDelta remove_d() {
    StateDelta delta;
    delta.members_removed.push_back(kD);
    return delta;
}

StateDelta relax_policy() {
    StateDelta delta;
    GroupPolicy policy{};
    policy.min_vouch_threshold = 2;
    policy.cross_cluster_mode = CrossClusterMode::Off;
    policy.updated_at = 7;
    delta.policy = policy;
    return delta;
}

void replicas_converge_through_store() {
    TrustStore first(founders());
    TrustStore second(founders());
    TrustStore third(founders());

    assert(first.apply(admit_x()).accepted);
    assert(second.apply(remove_d()).accepted);
    assert(third.apply(relax_policy()).accepted);
    assert(!first.apply(StateDelta{}).accepted);
    assert(first.log().size() == 1);

    // Different exchange orders.
    (void)first.merge_remote(*second.snapshot());
    (void)first.merge_remote(*third.snapshot());

    (void)third.merge_remote(*first.snapshot());
    const auto result = second.merge_remote(*third.snapshot());
    assert(result.changed);
    assert(result.report.valid());
    assert(result.ejection.members_removed.empty());

    (void)second.merge_remote(*first.snapshot());
    (void)first.merge_remote(*second.snapshot());

    const auto a = first.snapshot();
    const auto b = second.snapshot();
    const auto c = third.snapshot();
    assert(same_content(*a, *b));
    assert(same_content(*b, *c));
    assert(a->is_active(kX));
    assert(a->is_removed(kD));
    assert(a->policy.cross_cluster_mode == CrossClusterMode::Off);

    // A merge that changes nothing leaves the epoch alone.
    const auto before = first.epoch();
    const auto noop = first.merge_remote(*third.snapshot());
    assert(!noop.changed);
    assert(first.epoch() == before);

    // The merge advanced past both inputs and was recorded.
    assert(second.epoch() > 2);
    assert(!second.log().empty());
}

void merge_surfaces_ejections() {
    TrustStore local(founders());
    TrustStore remote(founders());
    assert(local.apply(admit_x()).accepted);

    StateDelta remove_a;
    remove_a.members_removed.push_back(kA);
    assert(remote.apply(remove_a).accepted);

    const auto result = local.merge_remote(*remote.snapshot());
    assert(result.changed);
    assert(result.report.acceptable());
    assert(result.report.finding_for(kX) != nullptr);
    assert(result.ejection.members_removed == std::vector<MemberId>{kX});

    assert(local.apply(result.ejection).accepted);
    assert(!local.snapshot()->is_active(kX));
}

void structural_violations_throw() {
    auto broken = founders();
    broken.removed.insert(kA);

    bool threw = false;
    try {
        TrustStore store(broken);
    } catch (const VouchnetError& error) {
        threw = error.code() == ErrorCode::InvalidState;
    }
    assert(threw);

    TrustStore store(founders());
    const auto epoch = store.epoch();
    threw = false;
    try {
        (void)store.merge_remote(broken);
    } catch (const VouchnetError& error) {
        threw = error.code() == ErrorCode::InvalidState;
    }
    assert(threw);
    assert(store.epoch() == epoch);
    assert(store.snapshot()->is_active(kA));
}

void claims() {
    TrustStore store(founders());
    std::vector<ClaimOutcome> outcomes{
        {true, {VerifiedClaim::Kind::Admission, kA, kY}},
        {true, {VerifiedClaim::Kind::Admission, kB, kY}},
        {true, {VerifiedClaim::Kind::Admission, kB, kY}},
        {false, {VerifiedClaim::Kind::Flag, kC, kY}},
    };
    const auto delta = delta_from_claims(outcomes);
    assert(delta.members_added.size() == 1);
    assert(delta.vouches_added.size() == 2);
    assert(delta.flags_added.empty());

    const auto outcome = store.submit_claims(outcomes);
    assert(outcome.accepted);
    assert(store.snapshot()->is_active(kY));

    // Only the verified flag lands.
    const auto flagged = store.submit_claims({{true, {VerifiedClaim::Kind::Flag, kC, kY}}});
    assert(flagged.accepted);
    assert(store.snapshot()->has_flag(kC, kY));

    const auto nothing = store.submit_claims({{false, {VerifiedClaim::Kind::Vouch, kC, kY}}});
    assert(!nothing.accepted);
    assert(nothing.reason == RejectReason::EmptyDelta);
}

void snapshots_are_stable() {
    TrustStore store(founders());
    const auto old = store.snapshot();
    assert(store.apply(admit_x()).accepted);
    assert(!old->is_active(kX));
    assert(store.snapshot()->is_active(kX));
}

class SwitchGuard final : public WriteGuard {
public:
    std::optional<std::string> write_block_reason() const override {
        if (!blocked) {
            return std::nullopt;
        }
        return std::string("replication pending");
    }

    bool blocked{false};
};

void guarded_writes() {
    TrustStore store(founders());
    SwitchGuard guard;
    store.set_write_guard(&guard);

    guard.blocked = true;
    const auto refused = store.apply(admit_x());
    assert(!refused.accepted);
    assert(refused.reason == RejectReason::WritesBlocked);
    assert(refused.detail == "replication pending");
    assert(!refused.state);
    assert(!store.snapshot()->is_active(kX));
    assert(store.log().empty());

    const auto claimed = store.submit_claims({{true, {VerifiedClaim::Kind::Flag, kC, kD}}});
    assert(claimed.reason == RejectReason::WritesBlocked);

    // Remote states still merge while local writes wait.
    TrustStore remote(founders());
    assert(remote.apply(admit_x()).accepted);
    const auto merged = store.merge_remote(*remote.snapshot());
    assert(merged.changed);
    assert(store.snapshot()->is_active(kX));

    guard.blocked = false;
    assert(store.apply(remove_d()).accepted);

    store.set_write_guard(nullptr);
    guard.blocked = true;
    assert(store.apply(relax_policy()).accepted);
}

void hooks_drive_external_store() {
    TrustContract contract;
    test::MemoryStateStore left(founders(), contract);
    test::MemoryStateStore right(founders(), contract);

    StateDelta one_vouch;
    one_vouch.members_added.push_back(kY);
    one_vouch.vouches_added.push_back(Edge{kC, kY});
    assert(!left.propose(one_vouch));

    assert(left.propose(admit_x()));
    assert(right.propose(remove_d()));
    assert(left.absorb(right));
    assert(right.absorb(left));
    assert(left.state() == right.state());
    assert(contract.validate(left.state()));

    auto corrupted = left.state();
    corrupted.vouches[kA].insert(kA);
    assert(!contract.validate(corrupted));
}

}  // namespace

int main() {
    test::quiet_logs();
    replicas_converge_through_store();
    merge_surfaces_ejections();
    structural_violations_throw();
    claims();
    snapshots_are_stable();
    guarded_writes();
    hooks_drive_external_store();
    return 0;
}
