#include "vouchnet/trust/StateCodec.hpp"

#include "vouchnet/Wire.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace vouchnet::trust {

namespace {

constexpr std::uint8_t kMagic[] = {'V', 'N', 'T', 'S'};
constexpr std::uint8_t kStateVersion = 1;

void write_members(Bytes& buffer, const MemberSet& members) {
    wire::append_u32(buffer, static_cast<std::uint32_t>(members.size()));
    for (const auto& member : members) {
        wire::append_bytes(buffer, member);
    }
}

MemberSet read_members(wire::Reader& reader) {
    const auto count = reader.u32();
    if (count > reader.remaining() / sizeof(MemberId)) {
        throw std::invalid_argument("trust state member count exceeds payload");
    }
    MemberSet members;
    MemberId previous{};
    for (std::uint32_t i = 0; i < count; ++i) {
        const auto member = reader.fixed<32>();
        if (i > 0 && !(previous < member)) {
            throw std::invalid_argument("trust state members are not strictly ordered");
        }
        members.insert(member);
        previous = member;
    }
    return members;
}

void write_edges(Bytes& buffer, const EdgeMap& edges) {
    std::uint32_t populated = 0;
    for (const auto& [target, sources] : edges) {
        populated += sources.empty() ? 0u : 1u;
    }
    wire::append_u32(buffer, populated);
    for (const auto& [target, sources] : edges) {
        if (sources.empty()) {
            continue;
        }
        wire::append_bytes(buffer, target);
        write_members(buffer, sources);
    }
}

EdgeMap read_edges(wire::Reader& reader) {
    const auto count = reader.u32();
    EdgeMap edges;
    for (std::uint32_t i = 0; i < count; ++i) {
        const auto target = reader.fixed<32>();
        auto sources = read_members(reader);
        if (sources.empty() || !edges.emplace(target, std::move(sources)).second) {
            throw std::invalid_argument("trust state edge list is malformed");
        }
    }
    return edges;
}

}  // namespace

Bytes encode_state(const TrustState& state) {
    Bytes buffer;
    wire::append_bytes(buffer, kMagic);
    wire::append_u8(buffer, kStateVersion);
    wire::append_u64(buffer, state.epoch);

    wire::append_u32(buffer, state.policy.min_vouch_threshold);
    wire::append_u8(buffer, static_cast<std::uint8_t>(state.policy.cross_cluster_mode));
    wire::append_u8(buffer, static_cast<std::uint8_t>(state.policy.bridge_vouch_policy));
    wire::append_u64(buffer, state.policy.updated_at);

    write_members(buffer, state.active);
    write_members(buffer, state.removed);
    write_edges(buffer, state.vouches);
    write_edges(buffer, state.flags);
    return buffer;
}

TrustState decode_state(std::span<const std::uint8_t> encoded) {
    wire::Reader reader(encoded, "trust state");
    const auto magic = reader.fixed<4>();
    if (!std::equal(magic.begin(), magic.end(), std::begin(kMagic))) {
        throw std::invalid_argument("trust state has bad magic");
    }
    if (reader.u8() != kStateVersion) {
        throw std::invalid_argument("unsupported trust state version");
    }

    TrustState state;
    state.epoch = reader.u64();
    state.policy.min_vouch_threshold = reader.u32();
    const auto mode = reader.u8();
    const auto bridge = reader.u8();
    if (mode > static_cast<std::uint8_t>(CrossClusterMode::Strict) ||
        bridge > static_cast<std::uint8_t>(BridgeVouchPolicy::CountAll)) {
        throw std::invalid_argument("trust state carries an unknown policy");
    }
    state.policy.cross_cluster_mode = static_cast<CrossClusterMode>(mode);
    state.policy.bridge_vouch_policy = static_cast<BridgeVouchPolicy>(bridge);
    state.policy.updated_at = reader.u64();

    state.active = read_members(reader);
    state.removed = read_members(reader);
    state.vouches = read_edges(reader);
    state.flags = read_edges(reader);
    reader.expect_done();
    return state;
}

}  // namespace vouchnet::trust
