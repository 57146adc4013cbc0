// ============================================================================
// value_codec.cpp: implementation for value_codec.hpp
// ============================================================================

#include "ebc/value_codec.hpp"

namespace ebc {

static constexpr int32_t GROUP_SIZE  = 240;  // values per high-byte step
static constexpr int32_t GROUP_SHIFT = 16;   // offset added per group

Error encode_value(int32_t value, uint8_t out[2]) {
    if (value < 0 || value > VALUE_MAX) return Error::OutOfRange;

    const int32_t group   = value / GROUP_SIZE;
    const int32_t encoded = value + GROUP_SHIFT * group;   // group 0 stays as-is

    out[0] = static_cast<uint8_t>((encoded >> 8) & 0xFF);
    out[1] = static_cast<uint8_t>(encoded & 0xFF);
    return Error::None;
}

Error decode_value(const uint8_t* data, std::size_t len, uint16_t& out) {
    if (!data || len != 2) return Error::InvalidLength;

    const uint16_t msb = data[0];
    const uint16_t lsb = data[1];
    const uint16_t encoded = static_cast<uint16_t>((msb << 8) | lsb);

    out = static_cast<uint16_t>(encoded - GROUP_SHIFT * msb);
    return Error::None;
}

} // namespace ebc
