// ============================================================================
// frame_codec.cpp: implementation for frame_codec.hpp
// For the byte layout see protocol.hpp. For usage examples, check tests/.
// ============================================================================

#include "ebc/frame_codec.hpp"
#include "ebc/log.hpp"
#include "ebc/protocol.hpp"
#include "ebc/value_codec.hpp"

#include <algorithm>      // std::min, std::copy_n
#include <iomanip>        // std::setw, std::setfill, std::hex
#include <sstream>

namespace ebc {

// Offsets inside the 19-byte response.
static constexpr std::size_t R_REGIME   = 1;
static constexpr std::size_t R_I_MEAS   = 2;
static constexpr std::size_t R_U_MEAS   = 4;
static constexpr std::size_t R_CHARGE   = 6;
static constexpr std::size_t R_UNKNOWN  = 8;
static constexpr std::size_t R_I_SET    = 10;
static constexpr std::size_t R_U_CUTOFF = 12;
static constexpr std::size_t R_MAX_TIME = 14;
static constexpr std::size_t R_IDENT    = 16;
static constexpr std::size_t R_CHECKSUM = 17;

uint8_t xor_checksum(const uint8_t* data, std::size_t len) {
    uint8_t x = 0;
    for (std::size_t i = 0; i < len; ++i) x ^= data[i];
    return x;
}

std::string to_hex(const uint8_t* data, std::size_t len) {
    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) os << std::setw(2) << unsigned(data[i]);
    return os.str();
}

// ---------------------------------------------------------------------------
// build_command()
// ---------------
// Layout: [INIT][CC][D0..D5][XX][END]
// The checksum covers CC and the six payload bytes, nothing else.
// ---------------------------------------------------------------------------
Error build_command(int mode, int command, const std::vector<uint8_t>& data,
                    std::vector<uint8_t>& out) {
    out.clear();
    if (mode < 0 || mode > 0xF || command < 0 || command > 0xF)
        return Error::InvalidNibble;

    out.reserve(COMMAND_LENGTH);
    out.push_back(INIT_BYTE);
    out.push_back(static_cast<uint8_t>((mode << 4) | command));

    uint8_t payload[COMMAND_DATA] = {0, 0, 0, 0, 0, 0};       // zero pad
    std::copy_n(data.begin(), std::min(data.size(), COMMAND_DATA), payload);  // truncate
    out.insert(out.end(), payload, payload + COMMAND_DATA);

    out.push_back(xor_checksum(&out[1], 1 + COMMAND_DATA));
    out.push_back(END_BYTE);
    return Error::None;
}

// Decode a 2-byte field that is known to be in bounds.
static uint16_t field(const std::vector<uint8_t>& f, std::size_t off) {
    uint16_t v = 0;
    if (decode_value(&f[off], 2, v) != Error::None) return 0;
    return v;
}

// ---------------------------------------------------------------------------
// parse_response()
// ----------------
// Phases:
//   1) length gate (empty = timeout, silent; anything else but 19 = logged),
//   2) sentinel gate (INIT/END),
//   3) checksum check (warning only),
//   4) field decode.
// ---------------------------------------------------------------------------
std::optional<Measurement> parse_response(const std::vector<uint8_t>& f, Logger& log) {
    if (f.empty()) return std::nullopt;                       // read timed out

    if (f.size() != RESPONSE_LENGTH) {
        log.error("Invalid response length: expected " + std::to_string(RESPONSE_LENGTH) +
                  ", got " + std::to_string(f.size()));
        return std::nullopt;
    }

    if (f.front() != INIT_BYTE || f.back() != END_BYTE) {
        log.error("Invalid response format: expected " + hex_byte(INIT_BYTE) + "..." +
                  hex_byte(END_BYTE) + ", got " + to_hex(f));
        return std::nullopt;
    }

    const uint8_t expected = xor_checksum(&f[R_REGIME], R_CHECKSUM - R_REGIME);
    if (f[R_CHECKSUM] != expected) {
        log.warning("Checksum mismatch: expected " + hex_byte(expected) +
                    ", got " + hex_byte(f[R_CHECKSUM]));
    }

    Measurement m;
    m.regime        = f[R_REGIME];
    m.mode          = static_cast<uint8_t>(m.regime % 10);
    m.state         = static_cast<uint8_t>(m.regime / 10);
    m.i_measured    = field(f, R_I_MEAS) / I_MEASURED_DIV;
    m.u_measured    = field(f, R_U_MEAS) / U_MEASURED_DIV;
    m.stored_charge = field(f, R_CHARGE);
    m.unk1          = to_hex(&f[R_UNKNOWN], 2);              // opaque, always 0000 so far
    m.i_setting     = field(f, R_I_SET) / I_SETTING_DIV;
    m.u_cutoff      = field(f, R_U_CUTOFF) / U_CUTOFF_DIV;
    m.max_time      = field(f, R_MAX_TIME);
    m.ident         = f[R_IDENT];
    m.raw           = to_hex(f);
    return m;
}

} // namespace ebc
