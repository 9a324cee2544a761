#pragma once

#include "vouchnet/trust/TrustState.hpp"

namespace vouchnet::trust {

// Entry points the external shared-state store calls before admitting a
// delta and after merging replicas.
class StateValidationHooks {
public:
    virtual ~StateValidationHooks() = default;

    virtual bool accept_delta(const TrustState& state, const StateDelta& delta) = 0;
    virtual bool validate(const TrustState& state) = 0;
};

class TrustContract final : public StateValidationHooks {
public:
    bool accept_delta(const TrustState& state, const StateDelta& delta) override;
    // Merged states may still name members for ejection; only structural violations fail.
    bool validate(const TrustState& state) override;
};

}  // namespace vouchnet::trust
