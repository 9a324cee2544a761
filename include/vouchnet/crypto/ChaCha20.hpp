#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace vouchnet::crypto {

struct Key {
    std::array<std::uint8_t, 32> bytes{};
};

struct Nonce {
    std::array<std::uint8_t, 12> bytes{};
};

// RFC 8439 ChaCha20 with random access into the keystream. Capacity
// proofs read arbitrary windows of a seeded stream without generating
// the prefix.
class ChaCha20 {
public:
    static constexpr std::size_t kBlockSize = 64;

    ChaCha20(const Key& key, const Nonce& nonce, std::uint32_t initial_counter = 0);
    ~ChaCha20();

    ChaCha20(const ChaCha20&) = delete;
    ChaCha20& operator=(const ChaCha20&) = delete;

    // Writes keystream bytes starting at stream byte `offset`.
    void keystream(std::uint64_t offset, std::span<std::uint8_t> out) const;

    // XORs `input` with the keystream starting at `offset` into `output`.
    void transform(std::uint64_t offset, std::span<const std::uint8_t> input, std::span<std::uint8_t> output) const;

    static std::vector<std::uint8_t> apply(const Key& key,
                                           const Nonce& nonce,
                                           std::span<const std::uint8_t> input,
                                           std::uint32_t initial_counter = 0);

private:
    void block(std::uint32_t counter, std::array<std::uint8_t, kBlockSize>& out) const;

    std::array<std::uint32_t, 16> input_{};
};

}  // namespace vouchnet::crypto
