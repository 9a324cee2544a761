#pragma once

#include "vouchnet/Types.hpp"
#include "vouchnet/trust/TrustState.hpp"

#include <span>

namespace vouchnet::trust {

// Deterministic binary snapshot: equal states always encode to equal bytes.
Bytes encode_state(const TrustState& state);
// Throws std::invalid_argument on malformed or unsupported input.
TrustState decode_state(std::span<const std::uint8_t> encoded);

}  // namespace vouchnet::trust
