#include "vouchnet/persistence/Attestation.hpp"

#include "vouchnet/Wire.hpp"
#include "vouchnet/crypto/HmacSha256.hpp"

#include <stdexcept>

namespace vouchnet::persistence {

namespace {

constexpr std::uint8_t kAttestationVersion = 1;
constexpr std::string_view kAttestationDomain = "vouchnet-attestation-record-v1";

Digest attestation_mac(const crypto::Key& key, const Attestation& attestation) {
    crypto::HmacSha256 mac(key.bytes);
    mac.update(kAttestationDomain);
    mac.update(attestation.owner);
    mac.update_u32(attestation.chunk_index);
    mac.update(attestation.content_hash);
    mac.update(attestation.holder);
    mac.update_u64(attestation.epoch);
    mac.update_u64(to_unix_seconds(attestation.timestamp));
    return mac.finalize();
}

}  // namespace

Attestation sign_attestation(const crypto::Key& key,
                             const MemberId& owner,
                             std::uint32_t chunk_index,
                             const Digest& content_hash,
                             const PeerId& holder,
                             std::uint64_t epoch,
                             Timestamp now) {
    Attestation attestation{};
    attestation.owner = owner;
    attestation.chunk_index = chunk_index;
    attestation.content_hash = content_hash;
    attestation.holder = holder;
    attestation.epoch = epoch;
    // Whole seconds only, so encoded records verify after a round trip.
    attestation.timestamp = from_unix_seconds(to_unix_seconds(now));
    attestation.mac = attestation_mac(key, attestation);
    return attestation;
}

VerificationResult verify_attestation(const crypto::Key& key,
                                      const Attestation& attestation,
                                      Timestamp now,
                                      std::chrono::seconds max_age) {
    if (!crypto::HmacSha256::equal(attestation_mac(key, attestation), attestation.mac)) {
        return VerificationResult::fail("attestation signature mismatch");
    }
    if (attestation.timestamp > now + std::chrono::seconds(1)) {
        return VerificationResult::fail("attestation is from the future");
    }
    if (now - attestation.timestamp > max_age) {
        return VerificationResult::fail("attestation expired");
    }
    return VerificationResult::ok();
}

Bytes encode_attestation(const Attestation& attestation) {
    Bytes buffer;
    wire::append_u8(buffer, kAttestationVersion);
    wire::append_bytes(buffer, attestation.owner);
    wire::append_u32(buffer, attestation.chunk_index);
    wire::append_bytes(buffer, attestation.content_hash);
    wire::append_bytes(buffer, attestation.holder);
    wire::append_u64(buffer, attestation.epoch);
    wire::append_u64(buffer, to_unix_seconds(attestation.timestamp));
    wire::append_bytes(buffer, attestation.mac);
    return buffer;
}

Attestation decode_attestation(std::span<const std::uint8_t> encoded) {
    wire::Reader reader(encoded, "attestation");
    if (reader.u8() != kAttestationVersion) {
        throw std::invalid_argument("unsupported attestation version");
    }
    Attestation attestation{};
    attestation.owner = reader.fixed<32>();
    attestation.chunk_index = reader.u32();
    attestation.content_hash = reader.fixed<32>();
    attestation.holder = reader.fixed<32>();
    attestation.epoch = reader.u64();
    attestation.timestamp = from_unix_seconds(reader.u64());
    attestation.mac = reader.fixed<32>();
    reader.expect_done();
    return attestation;
}

}  // namespace vouchnet::persistence
