#pragma once
/**
 * @file value_codec.hpp
 * @brief The EBC 16-bit value encoding that keeps payload bytes out of F0..FF.
 *
 * @details
 * HOW IT WORKS
 * ------------
 * Values are split into groups of 240. Group g is shifted up by 16*g, which
 * pushes each group onto its own high byte and leaves the low byte in 0..239:
 *
 *   value  0..239   -> 0x0000..0x00EF
 *   value  240..479 -> 0x0100..0x01EF
 *   value  480      -> 0x0200
 *   value  57599    -> 0xEFEF   (largest encodable)
 *
 * Decoding undoes the shift using the high byte: decoded = encoded - 16*msb.
 * Any two bytes decode to some number; corrupt input is not detected here.
 */

#include <cstddef>
#include <cstdint>

#include "ebc/error.hpp"

namespace ebc {

static constexpr int32_t VALUE_MAX = 57599;

/**
 * @brief Encode one value into two big-endian bytes.
 * @param value  0..VALUE_MAX
 * @param out    receives MSB, LSB
 * @return Error::None, or Error::OutOfRange (out untouched).
 */
Error encode_value(int32_t value, uint8_t out[2]);

/**
 * @brief Decode two bytes produced by encode_value().
 * @return Error::None, or Error::InvalidLength when len != 2.
 */
Error decode_value(const uint8_t* data, std::size_t len, uint16_t& out);

} // namespace ebc
