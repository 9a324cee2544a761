#include "vouchnet/crypto/ChaCha20.hpp"

#include <algorithm>
#include <stdexcept>

namespace vouchnet::crypto {

namespace {

inline std::uint32_t rotl(std::uint32_t value, unsigned shift) noexcept {
    return (value << shift) | (value >> (32u - shift));
}

inline std::uint32_t read_le(const std::uint8_t* p) noexcept {
    return std::uint32_t{p[0]} | (std::uint32_t{p[1]} << 8) | (std::uint32_t{p[2]} << 16) | (std::uint32_t{p[3]} << 24);
}

inline void mix(std::array<std::uint32_t, 16>& x, std::size_t a, std::size_t b, std::size_t c, std::size_t d) noexcept {
    x[a] += x[b]; x[d] = rotl(x[d] ^ x[a], 16);
    x[c] += x[d]; x[b] = rotl(x[b] ^ x[c], 12);
    x[a] += x[b]; x[d] = rotl(x[d] ^ x[a], 8);
    x[c] += x[d]; x[b] = rotl(x[b] ^ x[c], 7);
}

}  // namespace

ChaCha20::ChaCha20(const Key& key, const Nonce& nonce, std::uint32_t initial_counter) {
    input_[0] = 0x61707865u;
    input_[1] = 0x3320646eu;
    input_[2] = 0x79622d32u;
    input_[3] = 0x6b206574u;
    for (std::size_t i = 0; i < 8; ++i) {
        input_[4 + i] = read_le(key.bytes.data() + i * 4);
    }
    input_[12] = initial_counter;
    for (std::size_t i = 0; i < 3; ++i) {
        input_[13 + i] = read_le(nonce.bytes.data() + i * 4);
    }
}

ChaCha20::~ChaCha20() {
    input_.fill(0);
}

void ChaCha20::block(std::uint32_t counter, std::array<std::uint8_t, kBlockSize>& out) const {
    auto state = input_;
    state[12] = counter;
    auto working = state;

    for (int round = 0; round < 10; ++round) {
        mix(working, 0, 4, 8, 12);
        mix(working, 1, 5, 9, 13);
        mix(working, 2, 6, 10, 14);
        mix(working, 3, 7, 11, 15);
        mix(working, 0, 5, 10, 15);
        mix(working, 1, 6, 11, 12);
        mix(working, 2, 7, 8, 13);
        mix(working, 3, 4, 9, 14);
    }

    for (std::size_t i = 0; i < 16; ++i) {
        const auto word = working[i] + state[i];
        out[i * 4] = static_cast<std::uint8_t>(word);
        out[i * 4 + 1] = static_cast<std::uint8_t>(word >> 8);
        out[i * 4 + 2] = static_cast<std::uint8_t>(word >> 16);
        out[i * 4 + 3] = static_cast<std::uint8_t>(word >> 24);
    }
}

void ChaCha20::keystream(std::uint64_t offset, std::span<std::uint8_t> out) const {
    const auto last_block = (offset + out.size()) / kBlockSize + input_[12];
    if (last_block > 0xFFFFFFFFull) {
        throw std::length_error("ChaCha20 keystream exhausted");
    }

    std::array<std::uint8_t, kBlockSize> buffer{};
    std::size_t written = 0;
    while (written < out.size()) {
        const auto position = offset + written;
        const auto counter = static_cast<std::uint32_t>(input_[12] + position / kBlockSize);
        const auto skip = static_cast<std::size_t>(position % kBlockSize);
        block(counter, buffer);
        const auto take = std::min(kBlockSize - skip, out.size() - written);
        std::copy_n(buffer.begin() + static_cast<std::ptrdiff_t>(skip), take, out.begin() + static_cast<std::ptrdiff_t>(written));
        written += take;
    }
    buffer.fill(0);
}

void ChaCha20::transform(std::uint64_t offset, std::span<const std::uint8_t> input, std::span<std::uint8_t> output) const {
    if (output.size() < input.size()) {
        throw std::invalid_argument("ChaCha20 output buffer too small");
    }
    keystream(offset, output.first(input.size()));
    for (std::size_t i = 0; i < input.size(); ++i) {
        output[i] ^= input[i];
    }
}

std::vector<std::uint8_t> ChaCha20::apply(const Key& key,
                                          const Nonce& nonce,
                                          std::span<const std::uint8_t> input,
                                          std::uint32_t initial_counter) {
    std::vector<std::uint8_t> output(input.size());
    const ChaCha20 cipher(key, nonce, initial_counter);
    cipher.transform(0, input, output);
    return output;
}

}  // namespace vouchnet::crypto
