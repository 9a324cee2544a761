#include "vouchnet/trust/TrustStore.hpp"

#include "vouchnet/Errors.hpp"
#include "vouchnet/log/StructuredLogger.hpp"

#include <algorithm>
#include <string>

namespace vouchnet::trust {

namespace {

std::string describe_violation(const ValidationReport& report) {
    const auto& first = report.violations.front();
    return std::string(violation_kind_name(first.kind)) + " for " + short_id(first.member);
}

}  // namespace

TrustStore::TrustStore(TrustState initial)
    : current_(std::make_shared<const TrustState>(std::move(initial))) {
    const auto report = validate(*current_);
    if (!report.acceptable()) {
        throw VouchnetError(ErrorCode::InvalidState, "initial trust state: " + describe_violation(report));
    }
}

DeltaOutcome TrustStore::apply(const StateDelta& delta) {
    std::scoped_lock lock(mutex_);
    auto& logger = log::StructuredLogger::instance();
    if (guard_ != nullptr) {
        if (auto blocked = guard_->write_block_reason()) {
            logger.warning("trust.write_blocked", {{"detail", *blocked}, {"epoch", std::to_string(current_->epoch)}});
            DeltaOutcome outcome;
            outcome.reason = RejectReason::WritesBlocked;
            outcome.detail = std::move(*blocked);
            return outcome;
        }
    }
    auto outcome = apply_delta(*current_, delta);
    if (!outcome.accepted) {
        log::StructuredLogger::FieldList fields{{"reason", std::string(reject_reason_name(*outcome.reason))},
                                                {"detail", outcome.detail}};
        if (outcome.member) {
            fields.emplace_back("member", short_id(*outcome.member));
        }
        logger.warning("trust.delta_rejected", std::move(fields));
        return outcome;
    }

    current_ = std::make_shared<const TrustState>(*outcome.state);
    log_.push_back({current_->epoch, delta});
    logger.info("trust.delta_applied",
                {{"epoch", std::to_string(current_->epoch)},
                 {"added", std::to_string(delta.members_added.size())},
                 {"removed", std::to_string(delta.members_removed.size())},
                 {"active", std::to_string(current_->active.size())}});
    return outcome;
}

DeltaOutcome TrustStore::submit_claims(const std::vector<ClaimOutcome>& outcomes) {
    const auto ignored = std::count_if(outcomes.begin(), outcomes.end(), [](const ClaimOutcome& outcome) {
        return !outcome.verified;
    });
    if (ignored > 0) {
        log::StructuredLogger::instance().warning("trust.claims_unverified", {{"count", std::to_string(ignored)}});
    }
    return apply(delta_from_claims(outcomes));
}

MergeResult TrustStore::merge_remote(const TrustState& remote) {
    const auto remote_report = validate(remote);
    if (!remote_report.acceptable()) {
        log::StructuredLogger::instance().error("trust.merge_rejected", {{"violation", describe_violation(remote_report)}});
        throw VouchnetError(ErrorCode::InvalidState, "remote trust state: " + describe_violation(remote_report));
    }

    std::scoped_lock lock(mutex_);
    auto merged = merge(*current_, remote);
    MergeResult result;
    result.report = validate(merged);
    if (!result.report.acceptable()) {
        throw VouchnetError(ErrorCode::InvalidState, "merged trust state: " + describe_violation(result.report));
    }
    result.ejection = ejection_delta(result.report);
    result.changed = !same_content(*current_, merged);

    if (result.changed) {
        merged.epoch = std::max(current_->epoch, remote.epoch) + 1;
        auto delta = diff(*current_, merged);
        current_ = std::make_shared<const TrustState>(std::move(merged));
        log_.push_back({current_->epoch, std::move(delta)});
    }
    log::StructuredLogger::instance().info("trust.merge_applied",
                                           {{"changed", result.changed ? "true" : "false"},
                                            {"epoch", std::to_string(current_->epoch)},
                                            {"findings", std::to_string(result.report.findings.size())}});
    return result;
}

std::shared_ptr<const TrustState> TrustStore::snapshot() const {
    std::scoped_lock lock(mutex_);
    return current_;
}

std::uint64_t TrustStore::epoch() const {
    std::scoped_lock lock(mutex_);
    return current_->epoch;
}

std::vector<DeltaRecord> TrustStore::log() const {
    std::scoped_lock lock(mutex_);
    return log_;
}

void TrustStore::set_write_guard(const WriteGuard* guard) {
    std::scoped_lock lock(mutex_);
    guard_ = guard;
}

}  // namespace vouchnet::trust
