#pragma once

#include "vouchnet/Types.hpp"
#include "vouchnet/crypto/ChaCha20.hpp"

#include <optional>
#include <span>
#include <string_view>

namespace vouchnet::crypto {

void random_bytes(std::span<std::uint8_t> buffer);

// Encrypt-then-MAC sealing of trust snapshots. Layout of a sealed blob:
// nonce (12) | ChaCha20 ciphertext | HMAC-SHA256 tag (32) over nonce and ciphertext.
// Holders only ever see the sealed form.
class SnapshotCipher {
public:
    static constexpr std::size_t kNonceSize = 12;
    static constexpr std::size_t kTagSize = 32;
    static constexpr std::size_t kOverhead = kNonceSize + kTagSize;

    explicit SnapshotCipher(std::span<const std::uint8_t> owner_secret);
    ~SnapshotCipher();

    [[nodiscard]] Bytes seal(std::span<const std::uint8_t> plaintext) const;
    [[nodiscard]] std::optional<Bytes> open(std::span<const std::uint8_t> sealed) const;

    // Key for attestations the owner signs after each confirmed push.
    const Key& attestation_key() const noexcept { return attestation_key_; }

    static Key derive_key(std::span<const std::uint8_t> secret, std::string_view context);

private:
    Key encryption_key_{};
    Key mac_key_{};
    Key attestation_key_{};
};

}  // namespace vouchnet::crypto
