#include "vouchnet/crypto/SnapshotCipher.hpp"

#include "vouchnet/crypto/HmacSha256.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>

namespace vouchnet::crypto {

namespace {
constexpr std::string_view kEncryptionContext = "vouchnet-snapshot-encryption-v1";
constexpr std::string_view kMacContext = "vouchnet-snapshot-mac-v1";
constexpr std::string_view kAttestationContext = "vouchnet-attestation-v1";
}

void random_bytes(std::span<std::uint8_t> buffer) {
    std::random_device device;
    std::size_t index = 0;
    while (index < buffer.size()) {
        auto word = device();
        for (std::size_t i = 0; i < sizeof(word) && index < buffer.size(); ++i) {
            buffer[index++] = static_cast<std::uint8_t>(word & 0xFFu);
            word >>= 8;
        }
    }
}

SnapshotCipher::SnapshotCipher(std::span<const std::uint8_t> owner_secret) {
    if (owner_secret.size() < 16) {
        throw std::invalid_argument("owner secret must be at least 16 bytes");
    }
    encryption_key_ = derive_key(owner_secret, kEncryptionContext);
    mac_key_ = derive_key(owner_secret, kMacContext);
    attestation_key_ = derive_key(owner_secret, kAttestationContext);
}

SnapshotCipher::~SnapshotCipher() {
    encryption_key_.bytes.fill(0);
    mac_key_.bytes.fill(0);
    attestation_key_.bytes.fill(0);
}

Key SnapshotCipher::derive_key(std::span<const std::uint8_t> secret, std::string_view context) {
    HmacSha256 mac(secret);
    mac.update(context);
    Key key{};
    key.bytes = mac.finalize();
    return key;
}

Bytes SnapshotCipher::seal(std::span<const std::uint8_t> plaintext) const {
    Nonce nonce{};
    random_bytes(nonce.bytes);

    Bytes sealed(kNonceSize + plaintext.size() + kTagSize);
    std::copy(nonce.bytes.begin(), nonce.bytes.end(), sealed.begin());

    const ChaCha20 cipher(encryption_key_, nonce, 1);
    const auto body = std::span<std::uint8_t>(sealed).subspan(kNonceSize, plaintext.size());
    cipher.transform(0, plaintext, body);

    const auto tag = HmacSha256::compute(mac_key_.bytes, std::span<const std::uint8_t>(sealed).first(kNonceSize + plaintext.size()));
    std::copy(tag.begin(), tag.end(), sealed.end() - static_cast<std::ptrdiff_t>(kTagSize));
    return sealed;
}

std::optional<Bytes> SnapshotCipher::open(std::span<const std::uint8_t> sealed) const {
    if (sealed.size() < kOverhead) {
        return std::nullopt;
    }
    const auto authenticated = sealed.first(sealed.size() - kTagSize);
    const auto tag = sealed.last(kTagSize);
    if (!HmacSha256::verify(mac_key_.bytes, authenticated, tag)) {
        return std::nullopt;
    }

    Nonce nonce{};
    std::copy_n(sealed.begin(), kNonceSize, nonce.bytes.begin());
    const auto body = authenticated.subspan(kNonceSize);

    Bytes plaintext(body.size());
    const ChaCha20 cipher(encryption_key_, nonce, 1);
    cipher.transform(0, body, plaintext);
    return plaintext;
}

}  // namespace vouchnet::crypto
