#pragma once
/**
 * @page ebc-frames EBC Frame Codec
 * @file frame_codec.hpp
 * @brief Build 10-byte command frames and parse 19-byte response frames.
 *
 * @details
 * PURPOSE
 * -------
 * This is the only place that knows the byte layout of a frame. The session
 * layer asks for "mode 7, command 1, these six bytes" and gets a ready frame;
 * it hands back 19 raw bytes and gets a Measurement or nothing.
 *
 * BUILDING
 * --------
 * - Payload is always exactly six bytes: shorter input is zero-padded on the
 *   right, longer input is truncated.
 * - The checksum and the END byte are always produced here. Callers cannot
 *   pass their own.
 *
 * PARSING
 * -------
 * - Empty input (read timeout) or a length other than 19: no data.
 * - Wrong INIT or END byte: no data, logged at ERROR.
 * - Checksum mismatch: logged at WARNING and the frame is STILL decoded and
 *   returned. Real devices occasionally send frames like this and the values
 *   in them are good; rejecting them would change what users see.
 *
 * EXAMPLE
 * -------
 * @code
 *   std::vector<uint8_t> f;
 *   ebc::build_command(ebc::MODE_SYS, ebc::CMD_CONNECT, {}, f);
 *   // f == FA 05 00 00 00 00 00 00 05 F8
 * @endcode
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ebc/error.hpp"
#include "ebc/measurement.hpp"

namespace ebc {

class Logger;

/// XOR of every byte in [data, data+len).
uint8_t xor_checksum(const uint8_t* data, std::size_t len);

/**
 * @brief Assemble one command frame.
 * @param mode     0..15
 * @param command  0..15
 * @param data     payload, fitted to six bytes
 * @param out      cleared, then filled with the 10-byte frame
 * @return Error::None or Error::InvalidNibble (out left empty).
 */
Error build_command(int mode, int command, const std::vector<uint8_t>& data,
                    std::vector<uint8_t>& out);

/**
 * @brief Decode one response frame.
 * @return the Measurement, or std::nullopt for empty/short/badly framed input.
 */
std::optional<Measurement> parse_response(const std::vector<uint8_t>& frame, Logger& log);

/// Lowercase hex, no separators ("fa05...").
std::string to_hex(const uint8_t* data, std::size_t len);
inline std::string to_hex(const std::vector<uint8_t>& v) { return to_hex(v.data(), v.size()); }

} // namespace ebc
