#include "vouchnet/trust/ValidationHooks.hpp"

#include "vouchnet/log/StructuredLogger.hpp"

namespace vouchnet::trust {

bool TrustContract::accept_delta(const TrustState& state, const StateDelta& delta) {
    const auto outcome = apply_delta(state, delta);
    if (!outcome.accepted) {
        log::StructuredLogger::instance().warning(
            "trust.hook.delta_refused",
            {{"reason", std::string(reject_reason_name(*outcome.reason))}, {"detail", outcome.detail}});
    }
    return outcome.accepted;
}

bool TrustContract::validate(const TrustState& state) {
    return trust::validate(state).acceptable();
}

}  // namespace vouchnet::trust
