#include "vouchnet/persistence/Attestation.hpp"
#include "vouchnet/persistence/ChunkCodec.hpp"
#include "vouchnet/persistence/ReplicationHealth.hpp"
#include "vouchnet/security/CapacityProof.hpp"
#include "vouchnet/storage/HolderStore.hpp"

#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <stdexcept>
#include <vector>

using namespace vouchnet;
using namespace std::chrono_literals;

namespace {

persistence::PushRequest push_of(const MemberId& owner, std::uint64_t epoch, const persistence::Chunk& chunk) {
    return persistence::PushRequest{owner, epoch, chunk};
}

void holder_store() {
    Config config{};
    config.holder_capacity_bytes = 1000;
    storage::HolderStore store(config, test::peer(1));
    const auto owner = test::member("owner");
    const auto other = test::member("other");
    const auto chunks = persistence::split(test::bytes_of(std::string(900, 'x')), 300);
    assert(chunks.size() == 3);

    const auto receipt = store.accept(push_of(owner, 2, chunks[0]));
    assert(receipt.has_value());
    assert(receipt->holder == test::peer(1));
    assert(receipt->chunk_index == 0);
    assert(receipt->content_hash == chunks[0].content_hash);
    assert(store.accept(push_of(owner, 2, chunks[1])).has_value());
    assert(store.bytes_used() == 600);

    // Re-pushing the same chunk does not double count.
    assert(store.accept(push_of(owner, 2, chunks[1])).has_value());
    assert(store.bytes_used() == 600);

    // Hash must match the bytes.
    auto forged = chunks[2];
    forged.data[0] = 'y';
    assert(!store.accept(push_of(owner, 2, forged)));

    // Older epochs are refused; capacity is enforced.
    assert(!store.accept(push_of(owner, 1, chunks[2])));
    assert(store.accept(push_of(other, 1, chunks[0])).has_value());
    assert(store.bytes_used() == 900);
    assert(!store.accept(push_of(owner, 2, chunks[2])));
    assert(store.size() == 3);

    const auto fetched = store.fetch({owner, 1});
    assert(fetched && fetched->data == chunks[1].data);
    assert(!store.fetch({owner, 2}));
    assert(!store.fetch({test::member("nobody"), 0}));

    // A newer epoch replaces everything held for that owner.
    const auto next = persistence::split(test::bytes_of("fresh"), 300);
    assert(store.accept(push_of(owner, 3, next[0])).has_value());
    assert(store.bytes_used() == 305);
    assert(!store.fetch({owner, 1}));
    assert(store.fetch({owner, 0})->data == next[0].data);

    const auto snapshot = store.snapshot();
    assert(snapshot.size() == 2);
    for (const auto& entry : snapshot) {
        assert(entry.owner == owner ? entry.epoch == 3 : entry.epoch == 1);
    }

    // Possession answers come from the stored bytes.
    security::PossessionChallenge challenge{};
    challenge.owner = owner;
    challenge.chunk_index = 0;
    challenge.offset = 1;
    challenge.length = 3;
    challenge.issued_at = test::fixed_now();
    const auto answer = store.answer(challenge, test::fixed_now());
    assert(answer.has_value());
    const auto expected = security::possession_digest(challenge.nonce, std::span<const std::uint8_t>(next[0].data).subspan(1, 3));
    assert(answer->hash == expected);
    challenge.chunk_index = 7;
    assert(!store.answer(challenge, test::fixed_now()));

    const auto capacity_challenge = security::issue_capacity_challenge(store.self(), 2048, test::fixed_now());
    const auto proof = store.prove_capacity(capacity_challenge, test::fixed_now());
    assert(security::verify_capacity(capacity_challenge, proof, test::fixed_now(), 1min).passed);

    assert(store.drop_owner(owner));
    assert(!store.drop_owner(owner));
    assert(store.bytes_used() == 300);
    assert(store.size() == 1);
}

void replication_health() {
    persistence::ReplicationHealth health(2);
    assert(health.status() == persistence::ReplicationStatus::Initializing);
    assert(health.ratio() == 0.0);
    assert(health.write_state(5) == persistence::WriteBlockingState::Provisional);

    health.reset(2);
    assert(health.status() == persistence::ReplicationStatus::AtRisk);
    assert(health.write_state(5) == persistence::WriteBlockingState::Degraded);
    assert(health.write_state(1) == persistence::WriteBlockingState::Isolated);
    assert(health.write_state(0) == persistence::WriteBlockingState::Provisional);
    assert(persistence::write_blocking_state_name(health.write_state(5)) == "degraded");
    assert((health.at_risk_chunks() == std::vector<std::uint32_t>{0, 1}));
    assert(!health.can_write(5));
    assert(health.can_write(1));

    health.record(0, test::peer(1), true);
    assert(health.write_state(5) == persistence::WriteBlockingState::Degraded);
    assert((health.at_risk_chunks() == std::vector<std::uint32_t>{1}));

    health.record(0, test::peer(1), true);
    health.record(1, test::peer(2), true);
    assert(health.status() == persistence::ReplicationStatus::Partial);
    assert(health.write_state(5) == persistence::WriteBlockingState::Active);
    assert(health.at_risk_chunks().empty());
    assert(health.can_write(5));
    assert(health.ratio() == 0.0);

    health.record(0, test::peer(3), true);
    health.record(1, test::peer(4), false);
    assert(health.confirmed_replicas(0) == 2);
    assert(health.confirmed_replicas(1) == 1);
    assert(health.ratio() == 0.5);

    health.record(1, test::peer(4), true);
    assert(health.status() == persistence::ReplicationStatus::Replicated);
    assert(persistence::replication_status_name(health.status()) == "replicated");

    health.forget_holder(test::peer(2));
    assert(health.status() == persistence::ReplicationStatus::Partial);
    health.record(1, test::peer(4), false);
    assert(health.status() == persistence::ReplicationStatus::AtRisk);

    health.reset(1);
    assert(health.confirmed_replicas(0) == 0);
}

void attestations() {
    crypto::Key key{};
    key.bytes.fill(0x33);
    crypto::Key other_key{};
    other_key.bytes.fill(0x44);
    const auto now = test::fixed_now() + 250ms;
    const Digest content = persistence::chunk_hash(test::bytes_of("chunk"));

    const auto attestation =
        persistence::sign_attestation(key, test::member("owner"), 4, content, test::peer(6), 9, now);
    assert(attestation.timestamp == test::fixed_now());
    assert(persistence::verify_attestation(key, attestation, now, 1h).passed);
    assert(!persistence::verify_attestation(other_key, attestation, now, 1h).passed);
    assert(!persistence::verify_attestation(key, attestation, now + 2h, 1h).passed);
    assert(!persistence::verify_attestation(key, attestation, now - 1min, 1h).passed);

    auto altered = attestation;
    altered.holder = test::peer(7);
    assert(!persistence::verify_attestation(key, altered, now, 1h).passed);

    const auto encoded = persistence::encode_attestation(attestation);
    const auto decoded = persistence::decode_attestation(encoded);
    assert(decoded.mac == attestation.mac);
    assert(decoded.epoch == 9);
    assert(persistence::verify_attestation(key, decoded, now, 1h).passed);

    bool threw = false;
    try {
        (void)persistence::decode_attestation(Bytes(encoded.begin(), encoded.begin() + 20));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

}  // namespace

int main() {
    test::quiet_logs();
    holder_store();
    replication_health();
    attestations();
    return 0;
}
