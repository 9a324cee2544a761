#include "vouchnet/crypto/HmacSha256.hpp"

#include <algorithm>

namespace vouchnet::crypto {

HmacSha256::HmacSha256(std::span<const std::uint8_t> key) {
    std::array<std::uint8_t, kBlockSize> block{};
    if (key.size() > kBlockSize) {
        const auto folded = Sha256::digest(key);
        std::copy(folded.begin(), folded.end(), block.begin());
    } else {
        std::copy(key.begin(), key.end(), block.begin());
    }

    std::array<std::uint8_t, kBlockSize> inner_pad{};
    for (std::size_t i = 0; i < kBlockSize; ++i) {
        inner_pad[i] = static_cast<std::uint8_t>(block[i] ^ 0x36u);
        outer_pad_[i] = static_cast<std::uint8_t>(block[i] ^ 0x5cu);
    }
    inner_.update(inner_pad);
    block.fill(0);
}

HmacSha256& HmacSha256::update(std::span<const std::uint8_t> data) {
    inner_.update(data);
    return *this;
}

HmacSha256& HmacSha256::update(std::string_view text) {
    inner_.update(text);
    return *this;
}

HmacSha256& HmacSha256::update_u32(std::uint32_t value) {
    inner_.update_u32(value);
    return *this;
}

HmacSha256& HmacSha256::update_u64(std::uint64_t value) {
    inner_.update_u64(value);
    return *this;
}

HmacSha256::Output HmacSha256::finalize() {
    const auto inner_digest = inner_.finalize();
    Sha256 outer;
    outer.update(outer_pad_);
    outer.update(inner_digest);
    outer_pad_.fill(0);
    return outer.finalize();
}

HmacSha256::Output HmacSha256::compute(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) {
    HmacSha256 mac(key);
    mac.update(data);
    return mac.finalize();
}

bool HmacSha256::verify(std::span<const std::uint8_t> key,
                        std::span<const std::uint8_t> data,
                        std::span<const std::uint8_t> mac) {
    const auto expected = compute(key, data);
    return equal(expected, mac);
}

bool HmacSha256::equal(std::span<const std::uint8_t> lhs, std::span<const std::uint8_t> rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    std::uint8_t diff = 0;
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        diff |= static_cast<std::uint8_t>(lhs[i] ^ rhs[i]);
    }
    return diff == 0;
}

}  // namespace vouchnet::crypto
