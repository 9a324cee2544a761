#pragma once

#include "vouchnet/crypto/Sha256.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace vouchnet::crypto {

// Incremental HMAC-SHA256; records are MACed field by field without an
// intermediate buffer.
class HmacSha256 {
public:
    static constexpr std::size_t kBlockSize = Sha256::kBlockSize;
    static constexpr std::size_t kDigestSize = Sha256::kDigestSize;

    using Output = Sha256::Output;

    explicit HmacSha256(std::span<const std::uint8_t> key);

    HmacSha256& update(std::span<const std::uint8_t> data);
    HmacSha256& update(std::string_view text);
    HmacSha256& update_u32(std::uint32_t value);
    HmacSha256& update_u64(std::uint64_t value);

    [[nodiscard]] Output finalize();

    static Output compute(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data);
    static bool verify(std::span<const std::uint8_t> key,
                       std::span<const std::uint8_t> data,
                       std::span<const std::uint8_t> mac);

    // Constant-time comparison of two equally sized tags.
    static bool equal(std::span<const std::uint8_t> lhs, std::span<const std::uint8_t> rhs) noexcept;

private:
    Sha256 inner_;
    std::array<std::uint8_t, kBlockSize> outer_pad_{};
};

}  // namespace vouchnet::crypto
