#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace vouchnet::crypto {

class Sha256 {
public:
    static constexpr std::size_t kDigestSize = 32;
    static constexpr std::size_t kBlockSize = 64;

    using Output = std::array<std::uint8_t, kDigestSize>;

    Sha256();

    Sha256& update(std::span<const std::uint8_t> data);
    Sha256& update(std::string_view text);
    // Fixed-width big-endian integers keep hash inputs unambiguous.
    Sha256& update_u32(std::uint32_t value);
    Sha256& update_u64(std::uint64_t value);
    // u32 length prefix followed by the bytes.
    Sha256& update_framed(std::span<const std::uint8_t> data);

    [[nodiscard]] Output finalize();

    static Output digest(std::span<const std::uint8_t> data);

private:
    void compress(const std::uint8_t* block);

    std::array<std::uint32_t, 8> h_{};
    std::array<std::uint8_t, kBlockSize> pending_{};
    std::size_t pending_len_{0};
    std::uint64_t total_bytes_{0};
};

}  // namespace vouchnet::crypto
