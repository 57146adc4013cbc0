#pragma once
/**
 * @page ebc-protocol EBC-Axx Wire Protocol Constants
 * @file protocol.hpp
 * @brief Framing bytes, mode/command nibbles, unit multipliers and timing.
 *
 * @details
 * WIRE SHAPE
 * ----------
 * Host -> device, always 10 bytes:
 *
 *   FA CC D0 D1 D2 D3 D4 D5 XX F8
 *
 *   CC = (mode << 4) | command
 *   XX = CC ^ D0 ^ D1 ^ D2 ^ D3 ^ D4 ^ D5
 *
 * Device -> host, always 19 bytes, pushed on the device's own schedule:
 *
 *   FA RR I0 I1 U0 U1 C0 C1 K0 K1 S0 S1 V0 V1 T0 T1 ID XX F8
 *
 *   RR = regime (mode = RR % 10, state = RR / 10)
 *   XX = XOR of RR..ID
 *
 * Every 16-bit quantity travels through value_codec.hpp so no payload byte
 * lands in the F0..FF range the framing bytes live in.
 *
 * TIMING
 * ------
 * The firmware needs slack after each command. These waits are not
 * negotiable by the protocol; they were found on real hardware. Keep them
 * named here so control code never carries magic sleeps.
 */

#include <cstddef>
#include <cstdint>

namespace ebc {

// =============================== Framing ===============================
static constexpr uint8_t INIT_BYTE = 0xFA;
static constexpr uint8_t END_BYTE  = 0xF8;

static constexpr std::size_t COMMAND_LENGTH  = 10;
static constexpr std::size_t COMMAND_DATA    = 6;
static constexpr std::size_t RESPONSE_LENGTH = 19;

// ============================= Mode nibbles ============================
/**
 * @name Mode nibbles
 * @brief High nibble of the command byte. The system mode and CC discharge
 *        share nibble 0; the command nibble tells them apart.
 */
enum : uint8_t {
  MODE_SYS    = 0x0,
  MODE_D_CC   = 0x0,
  MODE_D_CP   = 0x1,
  MODE_C_NIMH = 0x2,
  MODE_C_NICD = 0x3,
  MODE_C_LIPO = 0x4,
  MODE_C_LIFE = 0x5,
  MODE_C_PB   = 0x6,
  MODE_C_CCCV = 0x7
};

// =========================== Command nibbles ===========================
enum : uint8_t {
  CMD_START      = 0x1,
  CMD_STOP       = 0x2,   // system mode, zero payload
  CMD_CONNECT    = 0x5,   // system mode, zero payload
  CMD_DISCONNECT = 0x6,   // system mode, zero payload
  CMD_ADJUST     = 0x7,
  CMD_CONTINUE   = 0x8
};

// =========================== Response states ===========================
enum : uint8_t {
  STATE_IDLE      = 0,
  STATE_WORKING   = 1,
  STATE_COMPLETED = 2
};

// ============================ Unit scaling =============================
// Physical units -> protocol integers. Conversion truncates toward zero.
static constexpr double I_MULT = 1000.0;  // A  -> mA
static constexpr double V_MULT = 100.0;   // V  -> 10 mV
static constexpr double P_MULT = 100.0;   // W  -> 10 mW

// Response scaling (device -> host).
static constexpr double I_MEASURED_DIV = 1000.0;
static constexpr double U_MEASURED_DIV = 1000.0;
static constexpr double I_SETTING_DIV  = 1000.0;
static constexpr double U_CUTOFF_DIV   = 100.0;

// =============================== Timing ================================
static constexpr uint32_t SETTLE_MS          = 100;   // after every command write
static constexpr uint32_t CONNECT_SETTLE_MS  = 500;   // before and after CONNECT
static constexpr uint32_t STOP_SETTLE_MS     = 1000;  // after the safety STOP
static constexpr uint32_t START_SETTLE_MS    = 2500;  // after START/ADJUST of an operation
static constexpr uint32_t POLL_INTERVAL_MS   = 1000;  // measurement polling cadence
static constexpr int      DEFAULT_TIMEOUT_MS = 1000;  // transport read timeout
static constexpr int      DEFAULT_BAUD       = 9600;

// Terminal reads needed before run_until_complete() returns.
static constexpr unsigned TERMINAL_READS_REQUIRED = 4;

} // namespace ebc
