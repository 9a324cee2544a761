#pragma once

#include "vouchnet/Types.hpp"
#include "vouchnet/network/DiscoveryRegistry.hpp"
#include "vouchnet/persistence/ReplicationHealth.hpp"
#include "vouchnet/trust/TrustStore.hpp"

#include <optional>
#include <string>

namespace vouchnet::persistence {

// Blocks local trust writes while the last distribution left a chunk without
// a remote copy and there are peers that could hold one.
class WriteBlockingMonitor final : public trust::WriteGuard {
public:
    WriteBlockingMonitor(const ReplicationHealth& health,
                         const network::DiscoveryRegistry& registry,
                         const MemberId& owner);

    // Live registered peers other than the owner, plus the owner.
    std::size_t network_size() const;
    WriteBlockingState state() const;

    std::optional<std::string> write_block_reason() const override;

private:
    const ReplicationHealth& health_;
    const network::DiscoveryRegistry& registry_;
    MemberId owner_;
};

}  // namespace vouchnet::persistence
