// ============================================================================
// operation_controller.cpp: implementation for operation_controller.hpp
// ============================================================================

#include "ebc/operation_controller.hpp"
#include "ebc/device_session.hpp"
#include "ebc/log.hpp"
#include "ebc/measurement.hpp"
#include "ebc/pacer.hpp"
#include "ebc/protocol.hpp"

namespace ebc {

OperationController::OperationController(DeviceSession& session, Logger& log, Pacer& pacer)
  : s_(session), log_(log), pacer_(pacer) {}

Error OperationController::run_until_complete(MeasurementSink& sink) {
  phase_ = Phase::Polling;
  terminal_reads_ = 0;
  s_.discard_unread();

  while (terminal_reads_ < TERMINAL_READS_REQUIRED) {
    if (!pacer_.wait_ms(POLL_INTERVAL_MS)) return Error::Interrupted;
    if (!s_.is_connected()) return Error::NotConnected;

    auto m = s_.read_measurement();
    if (!m) continue;                                   // device hasn't reported yet

    log_.debug("Got data: " + m->raw);
    sink.on_measurement(*m);
    if (m->is_terminal()) ++terminal_reads_;            // not reset on WORKING
  }

  phase_ = Phase::Settled;
  return Error::None;
}

// Shared tail of every fixed-parameter operation.
Error OperationController::after_start(Error started, MeasurementSink& sink) {
  if (started != Error::None) return started;
  pacer_.settle_ms(START_SETTLE_MS);
  s_.discard_unread();
  return run_until_complete(sink);
}

Error OperationController::charge_cccv(double voltage_v, double current_a,
                                       std::chrono::seconds timeout, MeasurementSink& sink) {
  phase_ = Phase::Issued;
  return after_start(s_.start_charge_cccv(voltage_v, current_a, timeout), sink);
}

Error OperationController::charge_predefined(int mode, double current_a, int cells,
                                             std::chrono::seconds timeout, MeasurementSink& sink) {
  phase_ = Phase::Issued;
  return after_start(s_.start_charge_predefined(mode, current_a, cells, timeout), sink);
}

Error OperationController::discharge_cc(double current_a, double cutoff_v,
                                        std::chrono::seconds timeout, MeasurementSink& sink) {
  phase_ = Phase::Issued;
  return after_start(s_.start_discharge_cc(current_a, cutoff_v, timeout), sink);
}

Error OperationController::discharge_cp(double power_w, double cutoff_v,
                                        std::chrono::seconds timeout, MeasurementSink& sink) {
  phase_ = Phase::Issued;
  return after_start(s_.start_discharge_cp(power_w, cutoff_v, timeout), sink);
}

Error OperationController::monitor(MeasurementSink& sink) {
  phase_ = Phase::Polling;
  while (pacer_.wait_ms(POLL_INTERVAL_MS)) {
    if (!s_.is_connected()) return Error::NotConnected;
    if (auto m = s_.read_measurement()) sink.on_measurement(*m);
  }
  return Error::Interrupted;
}

} // namespace ebc
