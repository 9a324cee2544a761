#include "vouchnet/Errors.hpp"
#include "vouchnet/network/DiscoveryRegistry.hpp"
#include "vouchnet/network/ReputationManager.hpp"
#include "vouchnet/persistence/Distributor.hpp"
#include "vouchnet/persistence/HolderAssignment.hpp"
#include "vouchnet/persistence/Recovery.hpp"
#include "vouchnet/persistence/SnapshotVault.hpp"
#include "vouchnet/persistence/WriteBlocking.hpp"
#include "vouchnet/security/SybilGate.hpp"
#include "vouchnet/storage/HolderStore.hpp"
#include "vouchnet/trust/StateCodec.hpp"
#include "vouchnet/trust/TrustState.hpp"
#include "vouchnet/trust/TrustStore.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <span>
#include <stdexcept>
#include <string>

using namespace vouchnet;
using namespace std::chrono_literals;

namespace {

// Peers living in one process. Offline peers never answer.
class MemoryNetwork final : public persistence::PeerChannel {
public:
    explicit MemoryNetwork(const Config& config)
        : config_(config) {}

    void add(const PeerId& peer) {
        std::scoped_lock lock(mutex_);
        stores_.emplace(peer, std::make_unique<storage::HolderStore>(config_, peer));
    }

    void set_offline(const PeerId& peer, bool offline) {
        std::scoped_lock lock(mutex_);
        if (offline) {
            offline_.insert(peer);
        } else {
            offline_.erase(peer);
        }
    }

    storage::HolderStore& store(const PeerId& peer) {
        std::scoped_lock lock(mutex_);
        return *stores_.at(peer);
    }

    std::optional<persistence::PushReceipt> push(const PeerId& peer, const persistence::PushRequest& request) override {
        auto* target = reachable(peer);
        return target == nullptr ? std::nullopt : target->accept(request);
    }

    std::optional<persistence::Chunk> fetch(const PeerId& peer, const persistence::FetchRequest& request) override {
        auto* target = reachable(peer);
        return target == nullptr ? std::nullopt : target->fetch(request);
    }

    std::optional<security::PossessionResponse> challenge(const PeerId& peer,
                                                          const security::PossessionChallenge& challenge) override {
        auto* target = reachable(peer);
        return target == nullptr ? std::nullopt : target->answer(challenge, challenge.issued_at);
    }

    std::optional<security::CapacityResponse> capacity(const PeerId& peer,
                                                       const security::CapacityChallenge& challenge) override {
        auto* target = reachable(peer);
        if (target == nullptr) {
            return std::nullopt;
        }
        return target->prove_capacity(challenge, challenge.issued_at);
    }

private:
    storage::HolderStore* reachable(const PeerId& peer) {
        std::scoped_lock lock(mutex_);
        if (offline_.contains(peer)) {
            return nullptr;
        }
        const auto it = stores_.find(peer);
        return it == stores_.end() ? nullptr : it->second.get();
    }

    Config config_;
    std::mutex mutex_;
    std::map<PeerId, std::unique_ptr<storage::HolderStore>> stores_;
    std::set<PeerId> offline_;
};

// Relays to the real network, but forgers hand out junk in place of the chunks
// they hold, with a content hash that matches the junk.
class ForgingChannel final : public persistence::PeerChannel {
public:
    explicit ForgingChannel(MemoryNetwork& network)
        : network_(network) {}

    void forge(const PeerId& peer) { forgers_.insert(peer); }

    std::optional<persistence::PushReceipt> push(const PeerId& peer, const persistence::PushRequest& request) override {
        return network_.push(peer, request);
    }

    std::optional<persistence::Chunk> fetch(const PeerId& peer, const persistence::FetchRequest& request) override {
        auto chunk = network_.fetch(peer, request);
        if (chunk && forgers_.contains(peer)) {
            std::fill(chunk->data.begin(), chunk->data.end(), std::uint8_t{0xEE});
            chunk->content_hash = persistence::chunk_hash(chunk->data);
        }
        return chunk;
    }

    std::optional<security::PossessionResponse> challenge(const PeerId& peer,
                                                          const security::PossessionChallenge& challenge) override {
        return network_.challenge(peer, challenge);
    }

    std::optional<security::CapacityResponse> capacity(const PeerId& peer,
                                                       const security::CapacityChallenge& challenge) override {
        return network_.capacity(peer, challenge);
    }

private:
    MemoryNetwork& network_;
    std::set<PeerId> forgers_;
};

Config network_config() {
    Config config{};
    config.chunk_size = 256;
    config.replica_factor = 2;
    config.distribution_fallback_depth = 3;
    config.probes_per_chunk = 4;
    config.possession_sample_length = 32;
    config.transfer_timeout = 5000ms;
    config.registration_pow_difficulty = 0;
    config.capacity_buffer_bytes = 4096;
    config.reputation_floor = 0.1;
    return config;
}

// Owner-side stack wired to an in-memory network of `peer_count` verified peers.
struct Harness {
    explicit Harness(std::uint8_t peer_count, Config cfg = network_config())
        : config(cfg),
          network(config),
          reputation(config),
          registry(config, &reputation),
          gate(config, registry, reputation),
          distributor(config, network, registry, reputation, gate, attestation_key()),
          recovery(config, network) {
        for (std::uint8_t tag = 1; tag <= peer_count; ++tag) {
            onboard(test::peer(tag));
        }
    }

    static crypto::Key attestation_key() {
        crypto::Key key{};
        key.bytes.fill(0x5C);
        return key;
    }

    void onboard(const PeerId& peer) {
        network.add(peer);
        network::RegistrationRequest request{};
        request.entry.peer = peer;
        request.entry.registered_at = test::fixed_now() - std::chrono::hours(24 * 60);
        const auto registered = registry.register_peer(request);
        assert(registered.accepted);
        assert(reputation.record(peer).has_value());

        const auto challenge = gate.issue_capacity_challenge(peer, config.capacity_buffer_bytes, test::fixed_now());
        const auto response = network.capacity(peer, challenge);
        assert(response.has_value());
        gate.settle_capacity(peer, *response, test::fixed_now());
        assert(gate.evaluate(peer, test::fixed_now()).eligible);
    }

    std::vector<PeerId> peers() const {
        std::vector<PeerId> out;
        for (const auto& entry : registry.discover()) {
            out.push_back(entry.peer);
        }
        return out;
    }

    Config config;
    MemoryNetwork network;
    network::ReputationManager reputation;
    network::DiscoveryRegistry registry;
    security::SybilGate gate;
    persistence::Distributor distributor;
    persistence::Recovery recovery;
};

const MemberId kOwner = test::member("owner");

Bytes sealed_blob(std::size_t size, unsigned seed) {
    Bytes data(size);
    std::mt19937 rng(seed);
    for (auto& byte : data) {
        byte = static_cast<std::uint8_t>(rng());
    }
    return data;
}

persistence::SnapshotAuthenticator matches(const Bytes& expected) {
    return [expected](std::span<const std::uint8_t> sealed) {
        return std::equal(sealed.begin(), sealed.end(), expected.begin(), expected.end());
    };
}

bool holds(const persistence::ManifestEntry& entry, const PeerId& peer) {
    return std::find(entry.holders.begin(), entry.holders.end(), peer) != entry.holders.end();
}

void deferred_until_enough_peers() {
    Harness harness(1);
    const auto blob = sealed_blob(1000, 1);
    const auto report = harness.distributor.distribute(kOwner, blob, 1, test::fixed_now());
    assert(report.deferred);
    assert(!report.complete);
    assert(report.code == ErrorCode::InsufficientPeers);
    assert(report.eligible_peers == 1);
    assert(report.pushes_attempted == 0);
    assert(!harness.distributor.last_epoch());

    // The owner's own registration does not count as a holder.
    harness.onboard(kOwner);
    assert(harness.distributor.distribute(kOwner, blob, 1, test::fixed_now()).deferred);

    harness.onboard(test::peer(2));
    const auto retried = harness.distributor.distribute(kOwner, blob, 1, test::fixed_now());
    assert(!retried.deferred);
    assert(retried.complete);
    for (const auto& entry : retried.manifest.entries) {
        assert(!holds(entry, kOwner));
    }
}

void distribute_audit_and_recover() {
    Harness harness(6);
    const auto offline = test::peer(3);
    harness.network.set_offline(offline, true);

    const auto blob = sealed_blob(1000, 2);
    const auto now = test::fixed_now();
    const auto report = harness.distributor.distribute(kOwner, blob, 1, now);
    assert(!report.deferred);
    assert(report.complete);
    assert(report.chunk_count == 4);
    assert(report.eligible_peers == 6);
    assert(report.pushes_confirmed == 8);
    assert(report.pushes_attempted == 8 + report.fallbacks_used);
    assert(report.under_replicated.empty());
    assert(report.health == persistence::ReplicationStatus::Replicated);
    assert(harness.distributor.health().can_write(harness.registry.network_size()));
    assert(harness.distributor.last_epoch() == 1u);

    // Fallbacks happen exactly where the offline peer ranked in the top two.
    const auto peers = harness.peers();
    std::size_t expected_fallbacks = 0;
    for (std::uint32_t index = 0; index < report.chunk_count; ++index) {
        const auto top = persistence::holders(kOwner, index, peers, 1, 2);
        expected_fallbacks += std::count(top.begin(), top.end(), offline);
    }
    assert(report.fallbacks_used == expected_fallbacks);
    if (expected_fallbacks > 0) {
        assert(harness.reputation.record(offline)->failures == expected_fallbacks);
    }

    const auto& manifest = report.manifest;
    assert(manifest.owner == kOwner);
    assert(manifest.epoch == 1);
    assert(manifest.total_size == blob.size());
    assert(manifest.entries.size() == 4);
    for (const auto& entry : manifest.entries) {
        assert(entry.holders.size() == 2);
        assert(!holds(entry, offline));
        assert(entry.probes.size() == 4);
        for (const auto& holder : entry.holders) {
            assert(harness.network.store(holder).fetch({kOwner, entry.index}).has_value());
        }
    }

    assert(report.attestations.size() == 8);
    crypto::Key wrong_key{};
    for (const auto& attestation : report.attestations) {
        assert(persistence::verify_attestation(Harness::attestation_key(), attestation, now, 1h).passed);
        assert(!persistence::verify_attestation(wrong_key, attestation, now, 1h).passed);
        assert(holds(manifest.entries[attestation.chunk_index], attestation.holder));
    }

    // Epochs only move forward.
    bool threw = false;
    try {
        (void)harness.distributor.distribute(kOwner, blob, 1, now);
    } catch (const VouchnetError& error) {
        threw = error.code() == ErrorCode::InvalidState;
    }
    assert(threw);

    // Audits consume probes; a holder that lost the data fails.
    auto audited = manifest;
    const auto first = harness.distributor.audit(audited, now + 1min);
    assert(first.verified == 8 && first.failed == 0 && first.unchecked == 0);
    assert(audited.entries[0].probes.size() == 2);

    const auto forgetful = manifest.entries[0].holders.front();
    assert(harness.network.store(forgetful).drop_owner(kOwner));
    std::size_t forgetful_entries = 0;
    for (const auto& entry : manifest.entries) {
        forgetful_entries += holds(entry, forgetful) ? 1 : 0;
    }
    const auto second = harness.distributor.audit(audited, now + 2min);
    assert(second.failed == forgetful_entries);
    assert(second.verified == 8 - forgetful_entries);
    assert(harness.distributor.health().status() == persistence::ReplicationStatus::Partial);

    const auto third = harness.distributor.audit(audited, now + 3min);
    assert(third.unchecked == 8);
    assert(third.verified == 0 && third.failed == 0);

    // Recovery with the manifest skips the holder that failed its challenge.
    auto recovery_manifest = manifest;
    const auto recovered = harness.recovery.recover(recovery_manifest, now + 4min);
    assert(recovered.complete);
    assert(!recovered.code);
    assert(recovered.sealed == blob);
    assert(recovered.stats.challenges_sent == 8);
    assert(recovered.stats.challenges_passed == 8 - forgetful_entries);
    assert(recovered.stats.fetch_attempts == 4);
    assert(recovery_manifest.entries[0].probes.size() == 2);

    // Without a manifest the holders are recomputed by rendezvous; gaps are filled by fallback.
    const auto rediscovered = harness.recovery.recover(kOwner, 4, harness.peers(), 1, matches(blob));
    assert(rediscovered.complete);
    assert(rediscovered.sealed == blob);
    assert(rediscovered.stats.fetch_attempts >= 4);

    // Newer epochs supersede what holders keep.
    const auto newer_blob = sealed_blob(600, 3);
    const auto newer = harness.distributor.distribute(kOwner, newer_blob, 2, now + 5min);
    assert(newer.complete);
    assert(newer.chunk_count == 3);
    auto newer_manifest = newer.manifest;
    const auto restored = harness.recovery.recover(newer_manifest, now + 6min);
    assert(restored.complete);
    assert(restored.sealed == newer_blob);
    for (const auto& entry : newer.manifest.entries) {
        for (const auto& holder : entry.holders) {
            for (const auto& held : harness.network.store(holder).snapshot()) {
                assert(held.owner != kOwner || held.epoch == 2);
            }
        }
    }
}

void incomplete_recovery() {
    Harness harness(4);
    const auto blob = sealed_blob(700, 4);
    const auto report = harness.distributor.distribute(kOwner, blob, 1, test::fixed_now());
    assert(report.complete);

    for (const auto& holder : report.manifest.entries[1].holders) {
        harness.network.set_offline(holder, true);
    }

    auto manifest = report.manifest;
    const auto result = harness.recovery.recover(manifest, test::fixed_now());
    assert(!result.complete);
    assert(result.code == ErrorCode::RecoveryIncomplete);
    assert(!result.sealed);
    assert(std::find(result.missing.begin(), result.missing.end(), 1u) != result.missing.end());
    assert(result.stats.failures >= 2);

    // Nobody online holds chunk 1; rendezvous recovery reports the same gap.
    for (std::uint8_t tag = 1; tag <= 4; ++tag) {
        if (!holds(report.manifest.entries[1], test::peer(tag))) {
            (void)harness.network.store(test::peer(tag)).drop_owner(kOwner);
        }
    }
    const auto blind = harness.recovery.recover(kOwner, report.chunk_count, harness.peers(), 1, matches(blob));
    assert(!blind.complete);
    assert(blind.code == ErrorCode::RecoveryIncomplete);
    assert(blind.missing.size() == report.chunk_count);
    assert(!blind.authentication_failed);
    assert(blind.stats.assemblies_tried == 0);
}

void snapshot_vault_round_trip() {
    Harness harness(5);
    const Bytes secret(32, 0x21);
    persistence::SnapshotVault vault(kOwner, secret, harness.distributor, harness.recovery);

    trust::GroupPolicy policy{};
    policy.min_vouch_threshold = 2;
    auto state = trust::genesis({test::member("a"), test::member("b"), test::member("c")}, policy);
    state.flags[test::member("a")].insert(test::member("c"));

    const auto report = vault.persist(state, test::fixed_now());
    assert(report.complete);
    assert(report.epoch == state.epoch);

    // Holders only ever saw ciphertext.
    const auto plain = trust::encode_state(state);
    for (const auto& entry : report.manifest.entries) {
        const auto chunk = harness.network.store(entry.holders.front()).fetch({kOwner, entry.index});
        assert(chunk.has_value());
        assert(std::search(plain.begin(), plain.end(), chunk->data.begin(), chunk->data.end()) == plain.end() ||
               chunk->data.size() < 8);
    }

    auto manifest = report.manifest;
    const auto restored = vault.restore(manifest, test::fixed_now());
    assert(restored.report.complete);
    assert(restored.state.has_value());
    assert(*restored.state == state);

    const auto blind = vault.restore(report.chunk_count, harness.peers(), state.epoch);
    assert(blind.state.has_value());
    assert(*blind.state == state);

    // A different secret cannot open the snapshot.
    const Bytes other_secret(32, 0x22);
    persistence::SnapshotVault impostor(kOwner, other_secret, harness.distributor, harness.recovery);
    const auto refused = impostor.restore(report.chunk_count, harness.peers(), state.epoch);
    assert(!refused.state);
    assert(!refused.report.complete);
    assert(refused.report.code == ErrorCode::RecoveryIncomplete);
    assert(refused.report.authentication_failed);
    assert(refused.report.missing.empty());
    assert(refused.report.stats.assemblies_tried == 1);

    auto impostor_manifest = report.manifest;
    bool threw = false;
    try {
        (void)impostor.restore(impostor_manifest, test::fixed_now());
    } catch (const VouchnetError& error) {
        threw = error.code() == ErrorCode::CorruptChunk;
    }
    assert(threw);

    // Stale epochs are refused by the distributor.
    threw = false;
    try {
        (void)vault.persist(state, test::fixed_now());
    } catch (const VouchnetError& error) {
        threw = error.code() == ErrorCode::InvalidState;
    }
    assert(threw);
}

void forged_copies_are_skipped() {
    Harness harness(3);
    const Bytes secret(32, 0x31);
    persistence::SnapshotVault vault(kOwner, secret, harness.distributor, harness.recovery);

    trust::GroupPolicy policy{};
    policy.min_vouch_threshold = 2;
    const auto state = trust::genesis({test::member("a"), test::member("b"), test::member("c")}, policy);
    const auto report = vault.persist(state, test::fixed_now());
    assert(report.complete);
    assert(report.chunk_count >= 2);

    // The best-ranked holder of chunk 0 rewrites everything it serves.
    const auto forger = report.manifest.entries[0].holders.front();
    ForgingChannel forging(harness.network);
    forging.forge(forger);
    persistence::Recovery recovery(harness.config, forging);
    persistence::SnapshotVault owner_again(kOwner, secret, harness.distributor, recovery);

    const auto blind = owner_again.restore(report.chunk_count, harness.peers(), state.epoch);
    assert(blind.report.complete);
    assert(blind.state.has_value());
    assert(*blind.state == state);
    assert(blind.report.stats.assemblies_tried >= 2);
    assert(blind.report.stats.fallbacks == blind.report.stats.assemblies_tried - 1);

    // With the manifest the forged copy fails its commitment and the next holder serves.
    auto manifest = report.manifest;
    const auto guided = owner_again.restore(manifest, test::fixed_now());
    assert(guided.state.has_value());
    assert(*guided.state == state);
    assert(guided.report.stats.fallbacks >= 1);
    assert(guided.report.stats.failures >= 1);

    // Nothing genuine left anywhere.
    for (std::uint8_t tag = 1; tag <= 3; ++tag) {
        forging.forge(test::peer(tag));
    }
    const auto lost = owner_again.restore(report.chunk_count, harness.peers(), state.epoch);
    assert(!lost.state);
    assert(lost.report.code == ErrorCode::RecoveryIncomplete);
    assert(lost.report.authentication_failed);
    assert(lost.report.stats.assemblies_tried == 1);

    // A raw recovery refuses to run without a way to authenticate.
    bool threw = false;
    try {
        (void)recovery.recover(kOwner, report.chunk_count, harness.peers(), state.epoch, {});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

void registration_starts_reputation() {
    Harness harness(0);
    const auto peer = test::peer(7);
    harness.network.add(peer);

    network::RegistrationRequest request{};
    request.entry.peer = peer;
    request.entry.registered_at = test::fixed_now() - std::chrono::hours(24 * 90);
    assert(harness.registry.register_peer(request).accepted);

    const auto record = harness.reputation.record(peer);
    assert(record.has_value());
    assert(record->registered_at == request.entry.registered_at);
    assert(harness.gate.evaluate(peer, test::fixed_now()).reason == security::IneligibleReason::CapacityUnverified);

    // Re-registering cannot reset or backdate the age.
    auto refresh = request;
    refresh.entry.registered_at = test::fixed_now() - std::chrono::hours(24 * 400);
    assert(harness.registry.register_peer(refresh).updated);
    assert(harness.reputation.record(peer)->registered_at == request.entry.registered_at);

    assert(harness.registry.unregister(peer));
    assert(!harness.reputation.record(peer));
    assert(harness.gate.evaluate(peer, test::fixed_now()).reason == security::IneligibleReason::NotRegistered);
}

trust::StateDelta admit(const std::string& name) {
    trust::StateDelta delta;
    const auto member = test::member(name);
    delta.members_added.push_back(member);
    delta.vouches_added = {trust::Edge{test::member("a"), member}, trust::Edge{test::member("b"), member}};
    return delta;
}

void write_blocking_follows_replication() {
    Harness harness(4);
    trust::GroupPolicy policy{};
    policy.min_vouch_threshold = 2;
    trust::TrustStore store(trust::genesis({test::member("a"), test::member("b"), test::member("c")}, policy));
    persistence::WriteBlockingMonitor monitor(harness.distributor.health(), harness.registry, kOwner);
    store.set_write_guard(&monitor);

    // Nothing distributed yet.
    assert(monitor.state() == persistence::WriteBlockingState::Provisional);
    assert(monitor.network_size() == 5);
    assert(store.apply(admit("d")).accepted);

    const auto now = test::fixed_now();
    // One chunk, so no peer collects enough failures to go stale below.
    const auto blob = sealed_blob(200, 5);
    assert(harness.distributor.distribute(kOwner, blob, 1, now).complete);
    assert(monitor.state() == persistence::WriteBlockingState::Active);
    assert(!monitor.write_block_reason());
    assert(store.apply(admit("e")).accepted);

    for (std::uint8_t tag = 1; tag <= 4; ++tag) {
        harness.network.set_offline(test::peer(tag), true);
    }
    const auto failed = harness.distributor.distribute(kOwner, blob, 2, now);
    assert(!failed.complete);
    assert(failed.health == persistence::ReplicationStatus::AtRisk);
    assert(monitor.network_size() == 5);
    assert(monitor.state() == persistence::WriteBlockingState::Degraded);
    assert(monitor.write_block_reason().has_value());

    const auto epoch_before = store.epoch();
    const auto log_before = store.log().size();
    const auto blocked = store.apply(admit("f"));
    assert(!blocked.accepted);
    assert(blocked.reason == trust::RejectReason::WritesBlocked);
    assert(trust::reject_reason_name(*blocked.reason) == "WritesBlocked");
    assert(store.epoch() == epoch_before);
    assert(store.log().size() == log_before);

    // Replication succeeds again and writes resume.
    for (std::uint8_t tag = 1; tag <= 4; ++tag) {
        harness.network.set_offline(test::peer(tag), false);
    }
    assert(harness.distributor.distribute(kOwner, blob, 3, now).complete);
    assert(monitor.state() == persistence::WriteBlockingState::Active);
    assert(store.apply(admit("f")).accepted);

    // Alone on the network nothing can be replicated, so writes are allowed.
    for (std::uint8_t tag = 1; tag <= 4; ++tag) {
        harness.network.set_offline(test::peer(tag), true);
    }
    assert(!harness.distributor.distribute(kOwner, blob, 4, now).complete);
    assert(monitor.state() == persistence::WriteBlockingState::Degraded);
    for (std::uint8_t tag = 1; tag <= 4; ++tag) {
        assert(harness.registry.unregister(test::peer(tag)));
    }
    assert(monitor.network_size() == 1);
    assert(monitor.state() == persistence::WriteBlockingState::Isolated);
    assert(store.apply(admit("g")).accepted);

    store.set_write_guard(nullptr);
}

}  // namespace

int main() {
    test::quiet_logs();
    deferred_until_enough_peers();
    distribute_audit_and_recover();
    incomplete_recovery();
    snapshot_vault_round_trip();
    forged_copies_are_skipped();
    registration_starts_reputation();
    write_blocking_follows_replication();
    return 0;
}
