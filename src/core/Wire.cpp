#include "vouchnet/Wire.hpp"

#include <stdexcept>

namespace vouchnet::wire {

namespace {
constexpr char kBase64Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
}

void append_u8(Bytes& buffer, std::uint8_t value) {
    buffer.push_back(value);
}

void append_u16(Bytes& buffer, std::uint16_t value) {
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void append_u32(Bytes& buffer, std::uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buffer.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
    }
}

void append_u64(Bytes& buffer, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
    }
}

void append_bytes(Bytes& buffer, std::span<const std::uint8_t> data) {
    buffer.insert(buffer.end(), data.begin(), data.end());
}

void append_blob(Bytes& buffer, std::span<const std::uint8_t> data) {
    if (data.size() > 0xFFFFFFFFull) {
        throw std::length_error("blob exceeds u32 framing");
    }
    append_u32(buffer, static_cast<std::uint32_t>(data.size()));
    append_bytes(buffer, data);
}

Reader::Reader(std::span<const std::uint8_t> data, std::string_view what)
    : data_(data),
      what_(what) {}

void Reader::require(std::size_t length) const {
    if (length > data_.size() - offset_) {
        throw std::invalid_argument(what_ + " truncated");
    }
}

std::uint8_t Reader::u8() {
    require(1);
    return data_[offset_++];
}

std::uint16_t Reader::u16() {
    require(2);
    const auto value = static_cast<std::uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
    offset_ += 2;
    return value;
}

std::uint32_t Reader::u32() {
    require(4);
    std::uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | data_[offset_++];
    }
    return value;
}

std::uint64_t Reader::u64() {
    require(8);
    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | data_[offset_++];
    }
    return value;
}

Bytes Reader::bytes(std::size_t length) {
    require(length);
    Bytes out(data_.begin() + static_cast<std::ptrdiff_t>(offset_),
              data_.begin() + static_cast<std::ptrdiff_t>(offset_ + length));
    offset_ += length;
    return out;
}

Bytes Reader::blob() {
    const auto length = u32();
    return bytes(length);
}

void Reader::expect_done() const {
    if (!done()) {
        throw std::invalid_argument(what_ + " has trailing bytes");
    }
}

std::string base64_encode(std::span<const std::uint8_t> input) {
    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 2 < input.size(); i += 3) {
        const auto triple = (static_cast<std::uint32_t>(input[i]) << 16) |
                            (static_cast<std::uint32_t>(input[i + 1]) << 8) |
                            static_cast<std::uint32_t>(input[i + 2]);
        output.push_back(kBase64Alphabet[(triple >> 18) & 0x3F]);
        output.push_back(kBase64Alphabet[(triple >> 12) & 0x3F]);
        output.push_back(kBase64Alphabet[(triple >> 6) & 0x3F]);
        output.push_back(kBase64Alphabet[triple & 0x3F]);
    }

    const auto tail = input.size() - i;
    if (tail > 0) {
        std::uint32_t triple = static_cast<std::uint32_t>(input[i]) << 16;
        if (tail == 2) {
            triple |= static_cast<std::uint32_t>(input[i + 1]) << 8;
        }
        output.push_back(kBase64Alphabet[(triple >> 18) & 0x3F]);
        output.push_back(kBase64Alphabet[(triple >> 12) & 0x3F]);
        output.push_back(tail == 2 ? kBase64Alphabet[(triple >> 6) & 0x3F] : '=');
        output.push_back('=');
    }
    return output;
}

Bytes base64_decode(std::string_view input) {
    if (input.size() % 4 != 0) {
        throw std::invalid_argument("invalid base64 input length");
    }

    std::array<int, 256> table{};
    table.fill(-1);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kBase64Alphabet[i])] = i;
    }

    Bytes output;
    output.reserve((input.size() / 4) * 3);
    for (std::size_t i = 0; i < input.size(); i += 4) {
        const bool last = i + 4 == input.size();
        const bool pad2 = last && input[i + 2] == '=';
        const bool pad3 = last && input[i + 3] == '=';
        if (pad2 && !pad3) {
            throw std::invalid_argument("invalid base64 padding");
        }
        const auto a = table[static_cast<unsigned char>(input[i])];
        const auto b = table[static_cast<unsigned char>(input[i + 1])];
        const auto c = pad2 ? 0 : table[static_cast<unsigned char>(input[i + 2])];
        const auto d = pad3 ? 0 : table[static_cast<unsigned char>(input[i + 3])];
        if (a < 0 || b < 0 || c < 0 || d < 0) {
            throw std::invalid_argument("invalid base64 character");
        }

        const auto triple = static_cast<std::uint32_t>((a << 18) | (b << 12) | (c << 6) | d);
        output.push_back(static_cast<std::uint8_t>((triple >> 16) & 0xFF));
        if (!pad2) {
            output.push_back(static_cast<std::uint8_t>((triple >> 8) & 0xFF));
        }
        if (!pad3) {
            output.push_back(static_cast<std::uint8_t>(triple & 0xFF));
        }
    }
    return output;
}

}  // namespace vouchnet::wire
