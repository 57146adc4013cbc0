// ============================================================================
// ramp_controller.cpp: implementation for ramp_controller.hpp
// For the procedure see the matching .hpp. For a worked run, check tests/.
// ============================================================================

#include "ebc/ramp_controller.hpp"
#include "ebc/device_session.hpp"
#include "ebc/log.hpp"
#include "ebc/measurement.hpp"
#include "ebc/pacer.hpp"
#include "ebc/protocol.hpp"

namespace ebc {

RampController::RampController(DeviceSession& session, Logger& log, Pacer& pacer, RampParams params)
  : s_(session), log_(log), pacer_(pacer), params_(params) {}

Error RampController::ramp_discharge_to_voltage(double target_v, MeasurementSink& sink, RampReport* report) {
  RampReport local;
  Error e = ramp(Direction::Discharge, target_v, sink, local);
  if (report) *report = local;
  return e;
}

Error RampController::ramp_charge_to_voltage(double target_v, MeasurementSink& sink, RampReport* report) {
  RampReport local;
  Error e = ramp(Direction::Charge, target_v, sink, local);
  if (report) *report = local;
  return e;
}

// START or ADJUST in the direction's mode: CC discharge with the target as
// cutoff, or CCCV charge with the target as the CV voltage.
Error RampController::issue(Direction dir, bool start, double current_a, double target_v) {
  if (dir == Direction::Discharge)
    return start ? s_.start_discharge_cc(current_a, target_v)
                 : s_.adjust_discharge_cc(current_a, target_v);
  return start ? s_.start_charge_cccv(target_v, current_a)
               : s_.adjust_charge_cccv(target_v, current_a);
}

// ---------------------------------------------------------------------------
// ramp()
// ------
// Phases:
//   1) pre-check: first frame decides whether there is anything to do,
//   2) START at the seed current,
//   3) poll; each terminal frame steps the current down or ends the run.
// ---------------------------------------------------------------------------
Error RampController::ramp(Direction dir, double target_v, MeasurementSink& sink, RampReport& report) {
  const char* verb = (dir == Direction::Discharge) ? "discharge" : "charge";
  double current = params_.seed_a;
  report.final_current_a = current;

  // Phase 1: pre-check
  s_.discard_unread();
  Measurement first;
  for (;;) {
    if (!s_.is_connected()) return Error::NotConnected;
    if (auto m = s_.read_measurement()) { first = *m; break; }
    if (!pacer_.wait_ms(0)) return Error::Interrupted;
  }

  const bool there = (dir == Direction::Discharge) ? first.u_measured < target_v
                                                   : first.u_measured > target_v;
  if (there) {
    log_.warning("Voltage " + fixed3(first.u_measured) + "V is already " +
                 (dir == Direction::Discharge ? "below" : "above") +
                 " target " + fixed3(target_v) + "V");
    report.already_at_target = true;
    return Error::None;
  }

  // Phase 2: start
  log_.info(std::string("Starting ") + verb + " to " + fixed3(target_v) +
            "V with initial current " + fixed3(current) + "A");
  if (Error e = issue(dir, true, current, target_v); e != Error::None) return e;
  pacer_.settle_ms(START_SETTLE_MS);
  s_.discard_unread();

  // Phase 3: poll and step
  for (;;) {
    if (!pacer_.wait_ms(POLL_INTERVAL_MS)) return Error::Interrupted;
    if (!s_.is_connected()) return Error::NotConnected;

    auto m = s_.read_measurement();
    if (!m) continue;
    sink.on_measurement(*m);
    if (!m->is_terminal()) continue;

    current *= params_.decay;
    report.final_current_a = current;
    if (current < params_.floor_a) break;                // ramp finished

    log_.info(std::string("Adjusting ") + verb + " current to " + fixed3(current) + "A");
    if (Error e = issue(dir, false, current, target_v); e != Error::None) return e;
    ++report.adjustments;
    pacer_.settle_ms(START_SETTLE_MS);
    s_.discard_unread();
  }

  log_.info(std::string("Ramp ") + verb + " to " + fixed3(target_v) + "V finished after " +
            std::to_string(report.adjustments) + " adjustments");
  return Error::None;
}

} // namespace ebc
