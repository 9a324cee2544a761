#include "vouchnet/persistence/WriteBlocking.hpp"

#include <algorithm>

namespace vouchnet::persistence {

WriteBlockingMonitor::WriteBlockingMonitor(const ReplicationHealth& health,
                                           const network::DiscoveryRegistry& registry,
                                           const MemberId& owner)
    : health_(health),
      registry_(registry),
      owner_(owner) {}

std::size_t WriteBlockingMonitor::network_size() const {
    const auto live = registry_.discover_live();
    const auto others = std::count_if(live.begin(), live.end(), [this](const network::RegistryEntry& entry) {
        return entry.peer != owner_;
    });
    return static_cast<std::size_t>(others) + 1;
}

WriteBlockingState WriteBlockingMonitor::state() const {
    return health_.write_state(network_size());
}

std::optional<std::string> WriteBlockingMonitor::write_block_reason() const {
    const auto size = network_size();
    if (allows_writes(health_.write_state(size))) {
        return std::nullopt;
    }
    return std::to_string(health_.at_risk_chunks().size()) + " chunk(s) without a remote replica while " +
           std::to_string(size - 1) + " peer(s) are available";
}

}  // namespace vouchnet::persistence
