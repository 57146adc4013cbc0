// ============================================================================
// device_session.cpp: implementation for device_session.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file device_session.cpp
 */

#include "ebc/device_session.hpp"
#include "ebc/frame_codec.hpp"     // build_command(), parse_response(), to_hex()
#include "ebc/log.hpp"
#include "ebc/pacer.hpp"
#include "ebc/value_codec.hpp"     // encode_value() for send_command16()

#include <cmath>          // std::isfinite
#include <utility>

namespace ebc {

DeviceSession::DeviceSession(std::unique_ptr<transport::ITransport> link, Logger& log,
                             Pacer& pacer, SessionConfig cfg)
  : link_(std::move(link)), log_(log), pacer_(pacer), cfg_(std::move(cfg)) {
  log_.info("Initializing EBC device on port " + cfg_.port + " with baudrate " +
            std::to_string(cfg_.baud));
}

DeviceSession::~DeviceSession() {
  if (disconnect() != Error::None)
    log_.warning("Disconnect on teardown did not reach the device");
}

bool DeviceSession::is_connected() const {
  return link_ && link_->is_open();
}

// ---------------------------------------------------------------------------
// connect()
// ---------
// Open 8E1, let the adapter settle, say CONNECT, let the firmware settle.
// Any failure here is fatal for the caller: nothing else works without it.
// ---------------------------------------------------------------------------
Error DeviceSession::connect() {
  log_.debug("Attempting to connect to " + cfg_.port);

  transport::PortConfig pc;
  pc.path       = cfg_.port;
  pc.baud       = cfg_.baud;
  pc.parity     = transport::Parity::Even;
  pc.timeout_ms = cfg_.timeout_ms;

  if (!link_ || !link_->open(pc)) {
    log_.error("Connection failed: cannot open " + cfg_.port);
    return Error::ConnectionError;
  }
  state_ = SessionState::Connected;
  pacer_.settle_ms(CONNECT_SETTLE_MS);                   // device init after open

  if (Error e = send_command(MODE_SYS, CMD_CONNECT); e != Error::None) {
    log_.error(std::string("Connection failed: handshake ") + to_string(e));
    link_->close();
    state_ = SessionState::Disconnected;
    return Error::ConnectionError;
  }
  pacer_.settle_ms(CONNECT_SETTLE_MS);

  log_.info("Successfully connected to device on " + cfg_.port);
  return Error::None;
}

Error DeviceSession::disconnect() {
  if (!is_connected()) return Error::None;

  log_.debug("Disconnecting from device");
  Error e = send_command(MODE_SYS, CMD_DISCONNECT);
  link_->close();                                        // close even if the goodbye failed
  state_ = SessionState::Disconnected;
  log_.info("Device disconnected");
  return e;
}

// ---------------------------------------------------------------------------
// send_command()
// --------------
// Validate, frame, write, settle. No retry: a failed write aborts whatever
// operation issued it.
// ---------------------------------------------------------------------------
Error DeviceSession::send_command(int mode, int command, const std::vector<uint8_t>& data) {
  if (!is_connected()) {
    log_.error("Cannot send command - device is not connected");
    return Error::NotConnected;
  }

  std::vector<uint8_t> frame;
  if (Error e = build_command(mode, command, data, frame); e != Error::None) {
    log_.error("Invalid mode/command code: " + std::to_string(mode) + "/" + std::to_string(command));
    return e;
  }

  const uint8_t code = frame[1];
  log_.debug("Sending command: " + hex_byte(code) + ", data: " + to_hex(&frame[2], COMMAND_DATA));
  log_.debug("Full packet: " + to_hex(frame));

  if (link_->write(frame.data(), frame.size()) != transport::TxResult::Ok) {
    log_.error("Failed to send command " + hex_byte(code));
    return Error::CommunicationError;
  }
  log_.info("Command " + hex_byte(code) + " sent successfully");

  pacer_.settle_ms(SETTLE_MS);                           // firmware processing slack
  return Error::None;
}

Error DeviceSession::send_command16(int mode, int command, int32_t arg1, int32_t arg2, int32_t arg3) {
  std::vector<uint8_t> data(COMMAND_DATA, 0);
  const int32_t args[3] = {arg1, arg2, arg3};
  for (int i = 0; i < 3; ++i) {
    if (encode_value(args[i], &data[2 * i]) != Error::None) {
      log_.error("Value must be between 0 and " + std::to_string(VALUE_MAX) +
                 ", got " + std::to_string(args[i]));
      return Error::OutOfRange;
    }
  }
  return send_command(mode, command, data);
}

Error DeviceSession::send_stop() {
  log_.debug("Sending stop command");
  return send_command(MODE_SYS, CMD_STOP);
}

// ============================================================================
// Typed command builders
// ---------------------------------------------------------------------------
// Each pair (start/adjust) shares one private helper that differs only in the
// command nibble. Arguments go out in the order the firmware expects them.
// ============================================================================

// Anything that can't truncate into 0..VALUE_MAX (negative, huge, NaN) becomes
// -1, which send_command16() then rejects as OutOfRange.
static int32_t to_units(double v, double mult) {
  const double x = v * mult;
  if (!std::isfinite(x) || x < 0.0 || x >= VALUE_MAX + 1.0) return -1;
  return static_cast<int32_t>(x);                        // truncate toward zero
}

static int32_t to_minutes(std::chrono::seconds t) {
  const auto m = t.count() / 60;
  if (m < 0 || m > VALUE_MAX) return -1;
  return static_cast<int32_t>(m);
}

bool is_charge_chemistry(int mode) {
  return mode == MODE_C_NIMH || mode == MODE_C_NICD || mode == MODE_C_LIPO ||
         mode == MODE_C_LIFE || mode == MODE_C_PB;
}

Error DeviceSession::charge_predefined(int command, int mode, double current_a, int cells,
                                       std::chrono::seconds timeout) {
  if (!is_charge_chemistry(mode)) {
    log_.error("Invalid mode for charge operation: " + std::to_string(mode));
    return Error::InvalidMode;
  }
  return send_command16(mode, command, to_units(current_a, I_MULT), cells, to_minutes(timeout));
}

Error DeviceSession::charge_cccv(int command, double voltage_v, double current_a,
                                 std::chrono::seconds timeout) {
  return send_command16(MODE_C_CCCV, command, to_units(current_a, I_MULT),
                        to_units(voltage_v, V_MULT), to_minutes(timeout));
}

Error DeviceSession::discharge_cc(int command, double current_a, double cutoff_v,
                                  std::chrono::seconds timeout) {
  return send_command16(MODE_D_CC, command, to_units(current_a, I_MULT),
                        to_units(cutoff_v, V_MULT), to_minutes(timeout));
}

Error DeviceSession::discharge_cp(int command, double power_w, double cutoff_v,
                                  std::chrono::seconds timeout) {
  return send_command16(MODE_D_CP, command, to_units(power_w, P_MULT),
                        to_units(cutoff_v, V_MULT), to_minutes(timeout));
}

Error DeviceSession::start_charge_predefined(int mode, double current_a, int cells, std::chrono::seconds timeout) {
  return charge_predefined(CMD_START, mode, current_a, cells, timeout);
}
Error DeviceSession::adjust_charge_predefined(int mode, double current_a, int cells, std::chrono::seconds timeout) {
  return charge_predefined(CMD_ADJUST, mode, current_a, cells, timeout);
}

Error DeviceSession::start_charge_cccv(double voltage_v, double current_a, std::chrono::seconds timeout) {
  return charge_cccv(CMD_START, voltage_v, current_a, timeout);
}
Error DeviceSession::adjust_charge_cccv(double voltage_v, double current_a, std::chrono::seconds timeout) {
  return charge_cccv(CMD_ADJUST, voltage_v, current_a, timeout);
}

Error DeviceSession::start_discharge_cc(double current_a, double cutoff_v, std::chrono::seconds timeout) {
  return discharge_cc(CMD_START, current_a, cutoff_v, timeout);
}
Error DeviceSession::adjust_discharge_cc(double current_a, double cutoff_v, std::chrono::seconds timeout) {
  return discharge_cc(CMD_ADJUST, current_a, cutoff_v, timeout);
}

Error DeviceSession::start_discharge_cp(double power_w, double cutoff_v, std::chrono::seconds timeout) {
  return discharge_cp(CMD_START, power_w, cutoff_v, timeout);
}
Error DeviceSession::adjust_discharge_cp(double power_w, double cutoff_v, std::chrono::seconds timeout) {
  return discharge_cp(CMD_ADJUST, power_w, cutoff_v, timeout);
}

// ============================================================================
// Measurements
// ============================================================================

std::optional<Measurement> DeviceSession::read_measurement() {
  if (!is_connected()) return std::nullopt;

  std::vector<uint8_t> buf(RESPONSE_LENGTH, 0);
  std::size_t got = 0;
  const transport::RxResult r = link_->read(buf.data(), buf.size(), got);
  if (r == transport::RxResult::Error) {
    log_.error("Read from " + std::string(link_->name()) + " failed");
    return std::nullopt;
  }
  buf.resize(got);                                       // short read stays short

  log_.debug("Received data: " + to_hex(buf));
  return parse_response(buf, log_);
}

void DeviceSession::discard_unread() {
  if (!is_connected()) return;
  log_.debug("Discarding unread data from serial buffer");
  link_->reset_input();
}

// ============================================================================
// OperationGuard
// ============================================================================

OperationGuard::OperationGuard(DeviceSession& s) : s_(s) {
  s_.busy_ = true;
  entry_ = s_.send_stop();
  s_.pacer_.settle_ms(STOP_SETTLE_MS);
}

OperationGuard::~OperationGuard() {
  if (s_.is_connected() && s_.send_stop() != Error::None)
    s_.log_.warning("Stop on exit did not reach the device");
  if (s_.disconnect() != Error::None)
    s_.log_.warning("Disconnect on exit did not reach the device");
  s_.busy_ = false;
}

} // namespace ebc
