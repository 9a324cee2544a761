#include "vouchnet/network/DiscoveryRegistry.hpp"
#include "vouchnet/security/RegistrationProof.hpp"

#include "test_support.hpp"

#include <cassert>
#include <stdexcept>

using namespace vouchnet;
using namespace vouchnet::network;

namespace {

Config registry_config() {
    Config config{};
    config.registration_pow_difficulty = 8;
    config.registry_shards = 4;
    config.registry_stale_after_failures = 2;
    config.registry_epoch_churn_ratio = 0.5;
    config.replica_factor = 3;
    return config;
}

RegistrationRequest request_for(const PeerId& peer, std::uint8_t difficulty) {
    RegistrationRequest request{};
    request.entry.peer = peer;
    request.entry.chunk_count = 4;
    request.entry.size_bucket = SizeBucket::Medium;
    request.entry.registered_at = test::fixed_now();
    const auto nonce = security::compute_registration_pow(peer, difficulty);
    assert(nonce.has_value());
    request.pow_nonce = *nonce;
    return request;
}

void proof_of_work() {
    const auto peer = test::peer(7);
    const auto nonce = security::compute_registration_pow(peer, 8);
    assert(nonce.has_value());
    assert(security::registration_pow_valid(peer, *nonce, 8));
    assert(security::leading_zero_bits(security::registration_pow_digest(peer, *nonce)) >= 8);
    assert(security::registration_pow_valid(peer, 12345, 0));

    const Digest zeros{};
    assert(security::leading_zero_bits(zeros) == 256);
    Digest half{};
    half[1] = 0x10;
    assert(security::leading_zero_bits(half) == 11);

    // A budget of one attempt rarely suffices at difficulty 20; either way any answer must verify.
    const auto limited = security::compute_registration_pow(peer, 20, 1);
    assert(!limited || security::registration_pow_valid(peer, *limited, 20));
}

void registration() {
    const auto config = registry_config();
    DiscoveryRegistry registry(config);

    auto forged = request_for(test::peer(1), 8);
    std::uint64_t bad_nonce = 0;
    while (security::registration_pow_valid(forged.entry.peer, bad_nonce, 8)) {
        ++bad_nonce;
    }
    forged.pow_nonce = bad_nonce;
    const auto refused = registry.register_peer(forged);
    assert(!refused.accepted);
    assert(refused.code == ErrorCode::RegistrationRejected);
    assert(registry.network_size() == 0);

    const auto first = registry.register_peer(request_for(test::peer(1), 8));
    assert(first.accepted);
    assert(first.persistence_deferred);
    assert(!first.updated);
    assert(registry.epoch() == 1);

    assert(registry.register_peer(request_for(test::peer(2), 8)).accepted);
    assert(registry.epoch() == 2);
    const auto third = registry.register_peer(request_for(test::peer(3), 8));
    assert(!third.persistence_deferred);
    assert(registry.epoch() == 2);
    assert(registry.register_peer(request_for(test::peer(4), 8)).accepted);
    assert(registry.epoch() == 3);
    assert(registry.network_size() == 4);

    auto refresh = request_for(test::peer(4), 8);
    refresh.entry.chunk_count = 9;
    const auto updated = registry.register_peer(refresh);
    assert(updated.accepted && updated.updated);
    assert(registry.network_size() == 4);
    assert(registry.epoch() == 3);
    assert(registry.find(test::peer(4))->chunk_count == 9);

    const auto listed = registry.discover();
    assert(listed.size() == 4);
    for (std::size_t i = 1; i < listed.size(); ++i) {
        assert(listed[i - 1].peer < listed[i].peer);
    }

    // Clean exit tombstones the key.
    assert(registry.unregister(test::peer(1)));
    assert(!registry.unregister(test::peer(1)));
    assert(registry.is_tombstoned(test::peer(1)));
    assert(!registry.find(test::peer(1)));
    assert(registry.network_size() == 3);
    assert(registry.epoch() == 3);
    const auto rejoin = registry.register_peer(request_for(test::peer(1), 8));
    assert(!rejoin.accepted);
    assert(rejoin.code == ErrorCode::RegistrationRejected);
}

void staleness() {
    DiscoveryRegistry registry(registry_config());
    for (std::uint8_t tag = 10; tag < 14; ++tag) {
        assert(registry.register_peer(request_for(test::peer(tag), 8)).accepted);
    }

    registry.mark_failure(test::peer(10));
    assert(!registry.find(test::peer(10))->stale);
    assert(registry.discover_live().size() == 4);
    registry.mark_failure(test::peer(10));
    assert(registry.find(test::peer(10))->stale);
    assert(registry.discover_live().size() == 3);
    assert(registry.discover().size() == 4);

    registry.mark_success(test::peer(10));
    assert(!registry.find(test::peer(10))->stale);
    assert(registry.find(test::peer(10))->consecutive_failures == 0);
    assert(registry.discover_live().size() == 4);

    // Unknown peers are ignored.
    registry.mark_failure(test::peer(200));
    assert(!registry.find(test::peer(200)));
}

void entry_codec() {
    RegistryEntry entry{};
    entry.peer = test::peer(42);
    entry.chunk_count = 17;
    entry.size_bucket = SizeBucket::Large;
    entry.registered_at = test::fixed_now();
    entry.consecutive_failures = 5;

    const auto encoded = encode_registry_entry(entry);
    const auto decoded = decode_registry_entry(encoded);
    assert(decoded.peer == entry.peer);
    assert(decoded.chunk_count == 17);
    assert(decoded.size_bucket == SizeBucket::Large);
    assert(decoded.registered_at == entry.registered_at);
    assert(decoded.consecutive_failures == 0);

    auto bad_bucket = encoded;
    bad_bucket[1 + 32 + 4] = 9;
    bool threw = false;
    try {
        (void)decode_registry_entry(bad_bucket);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    assert(size_bucket_for(0) == SizeBucket::Small);
    assert(size_bucket_for(49) == SizeBucket::Small);
    assert(size_bucket_for(50) == SizeBucket::Medium);
    assert(size_bucket_for(200) == SizeBucket::Medium);
    assert(size_bucket_for(201) == SizeBucket::Large);
    assert(size_bucket_name(SizeBucket::Medium) == "medium");
}

}  // namespace

int main() {
    test::quiet_logs();
    proof_of_work();
    registration();
    staleness();
    entry_codec();
    return 0;
}
