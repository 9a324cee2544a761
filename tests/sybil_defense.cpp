#include "vouchnet/Errors.hpp"
#include "vouchnet/network/DiscoveryRegistry.hpp"
#include "vouchnet/network/ReputationManager.hpp"
#include "vouchnet/security/CapacityProof.hpp"
#include "vouchnet/security/SybilGate.hpp"

#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>

using namespace vouchnet;
using namespace std::chrono_literals;

namespace {

Config gate_config() {
    Config config{};
    config.registration_pow_difficulty = 0;
    config.min_holder_age = 1h;
    config.capacity_challenge_window = 5min;
    config.reputation_floor = 0.3;
    config.max_consecutive_failures = 3;
    return config;
}

bool near(double lhs, double rhs) {
    return std::fabs(lhs - rhs) < 1e-9;
}

void register_peer(network::DiscoveryRegistry& registry, const PeerId& peer, Timestamp registered_at) {
    network::RegistrationRequest request{};
    request.entry.peer = peer;
    request.entry.registered_at = registered_at;
    const auto result = registry.register_peer(request);
    assert(result.accepted);
}

bool settle_throws(security::SybilGate& gate, const PeerId& peer, const security::CapacityResponse& response, Timestamp now) {
    try {
        gate.settle_capacity(peer, response, now);
    } catch (const VouchnetError& error) {
        return error.code() == ErrorCode::RegistrationRejected;
    }
    return false;
}

void capacity_proof() {
    const auto now = test::fixed_now();
    const auto challenge = security::issue_capacity_challenge(test::peer(1), 100'000, now);
    const auto buffer = security::materialize_capacity_buffer(challenge);
    assert(buffer.size() == 100'000);

    const auto response = security::respond_capacity(challenge, buffer, now + 1s);
    assert(security::verify_capacity(challenge, response, now + 2s, 5min).passed);

    auto tampered = buffer;
    tampered[70'000] ^= 0x01;
    const auto forged = security::respond_capacity(challenge, tampered, now + 1s);
    assert(!security::verify_capacity(challenge, forged, now + 2s, 5min).passed);

    // A buffer generated for another challenge does not help.
    const auto other = security::issue_capacity_challenge(test::peer(1), 100'000, now);
    const auto replayed = security::respond_capacity(challenge, security::materialize_capacity_buffer(other), now);
    assert(!security::verify_capacity(challenge, replayed, now, 5min).passed);

    const auto late = security::verify_capacity(challenge, response, now + 10min, 5min);
    assert(!late.passed);
    assert(!late.reason.empty());

    const auto empty = security::issue_capacity_challenge(test::peer(1), 0, now);
    assert(!security::verify_capacity(empty, security::respond_capacity(empty, {}, now), now, 5min).passed);
}

void reputation_formula() {
    const auto config = gate_config();
    const auto now = test::fixed_now();

    network::ReputationRecord fresh{};
    fresh.registered_at = now;
    assert(near(network::ReputationManager::compute_score(fresh, now, config), 0.0));

    network::ReputationRecord veteran{};
    veteran.successes = 4;
    veteran.registered_at = now - std::chrono::hours(24 * 60);
    veteran.chunks_held = 25;
    assert(near(network::ReputationManager::compute_score(veteran, now, config), 0.5 * 0.8 + 0.3 + 0.2));

    network::ReputationRecord halfway{};
    halfway.successes = 1;
    halfway.failures = 2;
    halfway.registered_at = now - std::chrono::hours(24 * 15);
    halfway.chunks_held = 5;
    assert(near(network::ReputationManager::compute_score(halfway, now, config), 0.5 * 0.25 + 0.3 * 0.5 + 0.2 * 0.5));

    network::ReputationManager manager(config);
    assert(manager.score(test::peer(9), now) == 0.0);
    manager.track(test::peer(9), now - 1h);
    manager.track(test::peer(9), now);
    assert(manager.record(test::peer(9))->registered_at == now - 1h);
    manager.record_failure(test::peer(9));
    manager.record_failure(test::peer(9));
    assert(manager.record(test::peer(9))->consecutive_failures == 2);
    manager.record_success(test::peer(9));
    assert(manager.record(test::peer(9))->consecutive_failures == 0);
    assert(manager.record(test::peer(9))->failures == 2);
    assert(manager.peer_count() == 1);
    manager.forget(test::peer(9));
    assert(manager.peer_count() == 0);
}

void gate_decisions() {
    const auto config = gate_config();
    const auto now = test::fixed_now();
    network::ReputationManager reputation(config);
    network::DiscoveryRegistry registry(config, &reputation);
    security::SybilGate gate(config, registry, reputation);

    const auto stranger = test::peer(1);
    const auto departed = test::peer(2);
    const auto newcomer = test::peer(3);
    const auto veteran = test::peer(4);

    assert(gate.evaluate(stranger, now).reason == security::IneligibleReason::NotRegistered);

    // Reputation only knows peers the registry knows.
    register_peer(registry, departed, now - std::chrono::hours(24 * 60));
    assert(reputation.record(departed).has_value());
    assert(registry.unregister(departed));
    assert(!reputation.record(departed));
    assert(gate.evaluate(departed, now).reason == security::IneligibleReason::NotRegistered);

    // Tracked without registering does not count either.
    reputation.track(stranger, now - std::chrono::hours(24 * 60));
    assert(gate.evaluate(stranger, now).reason == security::IneligibleReason::NotRegistered);
    reputation.forget(stranger);

    register_peer(registry, newcomer, now - 10min);
    assert(gate.evaluate(newcomer, now).reason == security::IneligibleReason::TooYoung);

    register_peer(registry, veteran, now - std::chrono::hours(24 * 60));
    assert(gate.evaluate(veteran, now).reason == security::IneligibleReason::CapacityUnverified);

    // No challenge outstanding.
    assert(settle_throws(gate, veteran, security::CapacityResponse{}, now));

    auto challenge = gate.issue_capacity_challenge(veteran, 4096, now);
    auto wrong = security::respond_capacity(challenge, Bytes(4096, 0), now);
    assert(settle_throws(gate, veteran, wrong, now));
    assert(!reputation.record(veteran)->capacity_verified);
    // The failed attempt consumed the challenge.
    assert(settle_throws(gate, veteran, wrong, now));

    challenge = gate.issue_capacity_challenge(veteran, 4096, now);
    const auto answer = security::respond_capacity(challenge, security::materialize_capacity_buffer(challenge), now + 1s);
    assert(settle_throws(gate, veteran, answer, now + 10min));

    challenge = gate.issue_capacity_challenge(veteran, 4096, now);
    gate.settle_capacity(veteran,
                         security::respond_capacity(challenge, security::materialize_capacity_buffer(challenge), now),
                         now);
    assert(reputation.record(veteran)->capacity_verified);

    for (int i = 0; i < 3; ++i) {
        reputation.record_success(veteran);
    }
    const auto verdict = gate.evaluate(veteran, now);
    assert(verdict.eligible);
    assert(near(verdict.score, 0.5 * 0.75 + 0.3));

    const auto eligible = gate.eligible_peers(registry.discover(), now);
    assert(eligible.size() == 1 && eligible.front() == veteran);

    for (int i = 0; i < 3; ++i) {
        reputation.record_failure(veteran);
    }
    assert(gate.evaluate(veteran, now).reason == security::IneligibleReason::TooManyFailures);

    // Successes reset the streak but the failures still weigh on the score.
    reputation.record_success(veteran);
    const auto recovered = gate.evaluate(veteran, now);
    assert(recovered.eligible);

    // Old enough and verified, but nothing else to show for it.
    const auto idle = test::peer(5);
    register_peer(registry, idle, now - 2h);
    auto idle_challenge = gate.issue_capacity_challenge(idle, 1024, now);
    gate.settle_capacity(idle,
                         security::respond_capacity(idle_challenge, security::materialize_capacity_buffer(idle_challenge), now),
                         now);
    const auto low = gate.evaluate(idle, now);
    assert(low.reason == security::IneligibleReason::LowReputation);
    assert(security::ineligible_reason_name(*low.reason) == "low_reputation");
}

}  // namespace

int main() {
    test::quiet_logs();
    capacity_proof();
    reputation_formula();
    gate_decisions();
    return 0;
}
