#pragma once
/**
 * @page ebc-session EBC Device Session
 * @file device_session.hpp
 * @brief Owns the transport, runs the connect/disconnect handshakes, and turns
 *        typed requests ("charge CCCV at 4.2 V, 1 A") into command frames.
 *
 * @details
 * ROLE
 * ----
 *   [controller] -> DeviceSession -> frame_codec -> ITransport -> device
 *                        ^                                          |
 *                        +---- read_measurement() <-----------------+
 *
 * The protocol has no request/response pairing. Commands go out and nothing
 * comes back for them; the device streams measurement frames on its own and
 * the host polls them with read_measurement(). One session drives one device
 * and only one command is ever in flight.
 *
 * STATE
 * -----
 *   NotConnected --connect()--> Connected --disconnect()--> Disconnected
 *
 * busy() is true while an OperationGuard is alive.
 *
 * UNITS
 * -----
 * The typed builders convert physical units to protocol integers and truncate
 * toward zero: current x1000 (mA), voltage x100, power x100, timeout in whole
 * minutes. A converted value outside 0..57599 is Error::OutOfRange and nothing
 * is written.
 *
 * CLEANUP
 * -------
 * Wrap every operation in an OperationGuard. It sends STOP on entry (safety
 * reset) and STOP + DISCONNECT on exit, however the scope is left.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ebc/error.hpp"
#include "ebc/measurement.hpp"
#include "ebc/protocol.hpp"
#include "ebc/transport/transport_base.hpp"

namespace ebc {

class Logger;
class Pacer;

struct SessionConfig {
  std::string port{"/dev/ttyUSB0"};
  int baud{DEFAULT_BAUD};
  int timeout_ms{DEFAULT_TIMEOUT_MS};
};

enum class SessionState : uint8_t { NotConnected = 0, Connected = 1, Disconnected = 2 };

class DeviceSession {
public:
  DeviceSession(std::unique_ptr<transport::ITransport> link, Logger& log, Pacer& pacer,
                SessionConfig cfg = {});
  ~DeviceSession();

  DeviceSession(const DeviceSession&) = delete;
  DeviceSession& operator=(const DeviceSession&) = delete;

  // -------- lifecycle --------
  Error connect();
  Error disconnect();                 // no-op when already closed
  bool  is_connected() const;
  SessionState state() const { return state_; }
  bool  busy() const { return busy_; }
  const SessionConfig& config() const { return cfg_; }

  // -------- raw commands --------
  Error send_command(int mode, int command, const std::vector<uint8_t>& data = {});
  Error send_command16(int mode, int command, int32_t arg1 = 0, int32_t arg2 = 0, int32_t arg3 = 0);
  Error send_stop();

  // -------- typed commands --------
  Error start_charge_predefined(int mode, double current_a, int cells = 1,
                                std::chrono::seconds timeout = std::chrono::seconds(0));
  Error adjust_charge_predefined(int mode, double current_a, int cells = 1,
                                 std::chrono::seconds timeout = std::chrono::seconds(0));

  Error start_charge_cccv(double voltage_v, double current_a,
                          std::chrono::seconds timeout = std::chrono::seconds(0));
  Error adjust_charge_cccv(double voltage_v, double current_a,
                           std::chrono::seconds timeout = std::chrono::seconds(0));

  Error start_discharge_cc(double current_a, double cutoff_v,
                           std::chrono::seconds timeout = std::chrono::seconds(0));
  Error adjust_discharge_cc(double current_a, double cutoff_v,
                            std::chrono::seconds timeout = std::chrono::seconds(0));

  Error start_discharge_cp(double power_w, double cutoff_v,
                           std::chrono::seconds timeout = std::chrono::seconds(0));
  Error adjust_discharge_cp(double power_w, double cutoff_v,
                            std::chrono::seconds timeout = std::chrono::seconds(0));

  // -------- measurements --------
  /// One frame or nothing. "Nothing" is the normal result when polling faster than the device reports.
  std::optional<Measurement> read_measurement();
  void discard_unread();

private:
  friend class OperationGuard;

  Error charge_predefined(int command, int mode, double current_a, int cells, std::chrono::seconds timeout);
  Error charge_cccv(int command, double voltage_v, double current_a, std::chrono::seconds timeout);
  Error discharge_cc(int command, double current_a, double cutoff_v, std::chrono::seconds timeout);
  Error discharge_cp(int command, double power_w, double cutoff_v, std::chrono::seconds timeout);

  std::unique_ptr<transport::ITransport> link_;
  Logger&       log_;
  Pacer&        pacer_;
  SessionConfig cfg_;
  SessionState  state_{SessionState::NotConnected};
  bool          busy_{false};
};

/// True for the predefined charge chemistries (NiMH, NiCd, LiPo, LiFe, Pb).
bool is_charge_chemistry(int mode);

/**
 * @brief Scoped release around one operation.
 *
 * Constructor: STOP, settle, mark busy. Destructor: STOP, DISCONNECT, clear
 * busy. Errors on the way out are logged; there is nobody left to return them to.
 */
class OperationGuard {
public:
  explicit OperationGuard(DeviceSession& s);
  ~OperationGuard();

  OperationGuard(const OperationGuard&) = delete;
  OperationGuard& operator=(const OperationGuard&) = delete;

  /// Result of the safety STOP sent on entry.
  Error entry_status() const { return entry_; }

private:
  DeviceSession& s_;
  Error entry_{Error::None};
};

} // namespace ebc
