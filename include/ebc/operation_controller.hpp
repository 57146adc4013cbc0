#pragma once
/**
 * @page ebc-operation EBC Operation Controller
 * @file operation_controller.hpp
 * @brief Issue one charge/discharge command and poll until the device is done.
 *
 * @details
 * STATE MACHINE
 * -------------
 *   Issued --> Polling --> Settled
 *
 * run_until_complete():
 *   1) drop stale bytes,
 *   2) every POLL_INTERVAL_MS read one frame; no frame -> keep polling,
 *   3) forward every decoded frame to the sink,
 *   4) count frames whose state is IDLE or COMPLETED,
 *   5) settle once the count reaches TERMINAL_READS_REQUIRED.
 *
 * The count is never reset by a WORKING frame: four terminal frames anywhere
 * in the run end it, contiguous or not.
 *
 * There is no wall-clock limit. A device that never reports a terminal state
 * is polled forever; the only ways out are the device's own max-time field
 * or the driver interrupting the Pacer.
 */

#include <chrono>
#include <cstdint>

#include "ebc/error.hpp"

namespace ebc {

class DeviceSession;
class Logger;
class MeasurementSink;
class Pacer;

class OperationController {
public:
  enum class Phase : uint8_t { Issued = 0, Polling = 1, Settled = 2 };

  OperationController(DeviceSession& session, Logger& log, Pacer& pacer);

  Error run_until_complete(MeasurementSink& sink);

  // Start + settle + run_until_complete().
  Error charge_cccv(double voltage_v, double current_a, std::chrono::seconds timeout,
                    MeasurementSink& sink);
  Error charge_predefined(int mode, double current_a, int cells, std::chrono::seconds timeout,
                          MeasurementSink& sink);
  Error discharge_cc(double current_a, double cutoff_v, std::chrono::seconds timeout,
                     MeasurementSink& sink);
  Error discharge_cp(double power_w, double cutoff_v, std::chrono::seconds timeout,
                     MeasurementSink& sink);

  /// Forward samples until interrupted. Always ends with Error::Interrupted unless the link fails.
  Error monitor(MeasurementSink& sink);

  Phase    phase() const { return phase_; }
  unsigned terminal_reads() const { return terminal_reads_; }

private:
  Error after_start(Error started, MeasurementSink& sink);

  DeviceSession& s_;
  Logger&  log_;
  Pacer&   pacer_;
  Phase    phase_{Phase::Issued};
  unsigned terminal_reads_{0};
};

} // namespace ebc
