#pragma once
/**
 * @page ebc-ramp EBC Ramp Controller
 * @file ramp_controller.hpp
 * @brief Charge or discharge to a target voltage by stepping the current down.
 *
 * @details
 * A plain CC discharge to a cutoff stops as soon as the loaded voltage dips
 * below the cutoff, while the resting voltage is still above it. The ramp
 * keeps going: every time the device reports IDLE or COMPLETED, the current
 * is multiplied by `decay` and the operation is re-armed with ADJUST at the
 * same target. It ends when the next current would fall below `floor_a`.
 *
 * PROCEDURE
 * ---------
 *   1) drop stale bytes, read until one frame arrives;
 *      already at target (below for discharge, above for charge)?
 *      -> warn, return, nothing sent;
 *   2) START at seed_a (discharge-CC or charge-CCCV), settle, drop stale bytes;
 *   3) every POLL_INTERVAL_MS read a frame and forward it to the sink;
 *      on IDLE/COMPLETED: current *= decay; below floor -> done,
 *      else ADJUST, settle, drop stale bytes.
 *
 * One terminal frame is enough to step; unlike run_until_complete() there is
 * no repeat count. With the defaults (5.0 A, x0.8, 0.05 A) a run is one START
 * and twenty ADJUSTs: 5.0, 4.0, 3.2, ... 0.058, then 0.046 ends it.
 *
 * As with run_until_complete(), a device that never goes terminal is polled
 * indefinitely; only the driver's Pacer can end that.
 */

#include <cstdint>

#include "ebc/error.hpp"

namespace ebc {

class DeviceSession;
class Logger;
class MeasurementSink;
class Pacer;

struct RampParams {
  double seed_a{5.0};    // first current, both directions
  double decay{0.8};     // factor applied on every terminal frame
  double floor_a{0.05};  // stop once the current would drop below this
};

struct RampReport {
  bool     already_at_target{false};
  unsigned adjustments{0};      // ADJUST commands sent
  double   final_current_a{0};  // last current computed (below floor when finished)
};

class RampController {
public:
  RampController(DeviceSession& session, Logger& log, Pacer& pacer, RampParams params = {});

  Error ramp_discharge_to_voltage(double target_v, MeasurementSink& sink, RampReport* report = nullptr);
  Error ramp_charge_to_voltage(double target_v, MeasurementSink& sink, RampReport* report = nullptr);

  const RampParams& params() const { return params_; }

private:
  enum class Direction : uint8_t { Discharge, Charge };

  Error ramp(Direction dir, double target_v, MeasurementSink& sink, RampReport& report);
  Error issue(Direction dir, bool start, double current_a, double target_v);

  DeviceSession& s_;
  Logger&    log_;
  Pacer&     pacer_;
  RampParams params_;
};

} // namespace ebc
