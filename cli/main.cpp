/**
 * @file main.cpp
 * @brief ebc-cli: drive a ZKE EBC-Axx load/charger from the shell and log samples.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11): port, output, logging, one action plus its parameters.
 *  - Refuse to clobber an existing output file unless -f or -a is given.
 *  - Connect, wrap the action in an OperationGuard (STOP before, STOP + DISCONNECT after).
 *  - Stream every sample to CSV or JSON lines (file or stdout).
 *  - Ctrl-C / SIGTERM end the polling loop; cleanup still runs.
 *
 * Exit codes:
 *  0 done or interrupted, 1 I/O or device failure, 2 bad arguments.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>

#include <signal.h>   // sigaction

#include "CLI/CLI11.hpp"

#include "ebc/cli_support.hpp"    // select_action(), open_output(), exit_code_for()
#include "ebc/device_session.hpp"
#include "ebc/log.hpp"
#include "ebc/operation_controller.hpp"
#include "ebc/pacer.hpp"
#include "ebc/protocol.hpp"
#include "ebc/ramp_controller.hpp"
#include "ebc/sample_writer.hpp"
#include "ebc/transport/transport_linux_serial.hpp"

using namespace ebc;

// ---------- small utilities ----------

static std::atomic<bool> g_running{true};

static void on_signal(int) { g_running.store(false); }

// No SA_RESTART: a blocked poll() in the transport returns EINTR right away.
static void install_signal_handlers() {
  struct sigaction sa{};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

static const std::map<std::string, int> CHEMISTRIES = {
  {"nimh", MODE_C_NIMH},
  {"nicd", MODE_C_NICD},
  {"lipo", MODE_C_LIPO},
  {"life", MODE_C_LIFE},
  {"pb",   MODE_C_PB},
};

// ---------- main ----------

int main(int argc, char** argv) {
  // output / logging
  std::string opt_output;
  bool opt_force = false, opt_append = false;
  std::string opt_format = "csv";
  bool opt_debug = false;
  std::string opt_debug_file;

  // device
  SessionConfig cfg;

  // actions (at most one; monitor when none)
  ActionFlags acts;

  // parameters
  double current = 1.0, voltage = 4.0, power = 5.0;
  std::string chemistry = "lipo";
  int cells = 1;
  int max_time_min = 0;

  CLI::App app{"ZKE EBC-Axx electronic load CLI"};

  app.add_option("-o,--output", opt_output, "Output file (stdout if absent)");
  app.add_flag("-f,--force", opt_force, "Overwrite the output file if it exists");
  app.add_flag("-a,--append", opt_append, "Append to the output file instead of overwriting");
  app.add_option("--format", opt_format, "Output format: csv|json")->check(CLI::IsMember({"csv", "json"}));
  app.add_flag("-d,--debug", opt_debug, "Enable debug logging");
  app.add_option("--debug-file", opt_debug_file, "Write debug logs to this file instead of the console");

  app.add_option("--port", cfg.port, "Serial port device")->capture_default_str();
  app.add_option("--baud", cfg.baud, "Baud rate")->capture_default_str();
  app.add_option("--timeout", cfg.timeout_ms, "Read timeout (ms)")->capture_default_str()->check(CLI::PositiveNumber);

  app.add_flag("--charge-cccv", acts.charge_cccv, "Charge CC-CV at --current up to --voltage");
  app.add_flag("--charge-cv", acts.charge_cv, "Charge to --voltage, ramping the current down");
  app.add_flag("--charge", acts.charge, "Charge with a predefined --chemistry program");
  app.add_flag("--discharge-cc", acts.discharge_cc, "Discharge at constant --current down to --voltage");
  app.add_flag("--discharge-cp", acts.discharge_cp, "Discharge at constant --power down to --voltage");
  app.add_flag("--discharge-cv", acts.discharge_cv, "Discharge to --voltage, ramping the current down");
  app.add_flag("--monitor", acts.monitor, "Only log samples (default)");

  app.add_option("-c,--current", current, "Current in amperes")->capture_default_str();
  app.add_option("-v,--voltage", voltage, "Voltage in volts")->capture_default_str();
  app.add_option("-p,--power", power, "Power in watts for CP discharge")->capture_default_str();
  app.add_option("--chemistry", chemistry, "Chemistry for --charge: nimh|nicd|lipo|life|pb")
      ->capture_default_str()->check(CLI::IsMember({"nimh", "nicd", "lipo", "life", "pb"}));
  app.add_option("--cells", cells, "Cells in series for --charge")->capture_default_str()->check(CLI::Range(1, 99));
  app.add_option("--max-time", max_time_min, "Device-side time limit in minutes (0 = none)")
      ->capture_default_str()->check(CLI::Range(0, 57599));

  CLI11_PARSE(app, argc, argv);

  // -------- choose at most one action --------
  Action action = Action::Monitor;
  if (Error e = select_action(acts, action); e != Error::None) {
    std::cerr << "status=error reason=" << to_string(e) << "\n";
    return exit_code_for(e);
  }

  // -------- logging --------
  StreamLogger log(std::cerr, LogLevel::Info);
  std::ofstream debug_out;
  if (opt_debug) {
    if (!opt_debug_file.empty()) {
      debug_out.open(opt_debug_file, std::ios::app);
      if (!debug_out) {
        std::cerr << "status=error reason=debug_file_open_failed path=" << opt_debug_file << "\n";
        return 1;
      }
      log.set_tee(&debug_out, LogLevel::Debug);
    } else {
      log.set_console_level(LogLevel::Debug);
    }
  }

  // -------- output --------
  std::ofstream file_out;
  bool write_header = true;
  if (!opt_output.empty()) {
    const Error e = open_output(opt_output, output_policy(opt_force, opt_append), file_out, write_header);
    if (e == Error::OutputExists) {
      std::cerr << "Error: Output file '" << opt_output
                << "' already exists. Use -f/--force to overwrite or -a/--append to append.\n";
      return exit_code_for(e);
    }
    if (e != Error::None) {
      std::cerr << "status=error reason=" << to_string(e) << " path=" << opt_output << "\n";
      return exit_code_for(e);
    }
  }
  std::ostream& out = opt_output.empty() ? std::cout : file_out;

  std::unique_ptr<MeasurementSink> sink;
  if (opt_format == "json") sink = std::make_unique<JsonLinesSampleWriter>(out);
  else                      sink = std::make_unique<CsvSampleWriter>(out, write_header);

  // -------- device --------
  install_signal_handlers();
  SteadyPacer pacer(&g_running);
  DeviceSession session(std::make_unique<transport::LinuxSerial>(), log, pacer, cfg);

  if (session.connect() != Error::None) {
    std::cerr << "status=error reason=" << to_string(Error::ConnectionError)
              << " dev=" << cfg.port << "\n";
    return 1;
  }

  const std::chrono::seconds max_time = std::chrono::minutes(max_time_min);
  Error result = Error::None;
  {
    OperationGuard guard(session);
    result = guard.entry_status();

    if (result == Error::None) {
      OperationController op(session, log, pacer);
      RampController ramp(session, log, pacer);

      switch (action) {
        case Action::ChargeCccv:
          log.info("Starting charge CC-CV... Current: " + fixed3(current) + "A, Voltage: " + fixed3(voltage) + "V");
          result = op.charge_cccv(voltage, current, max_time, *sink);
          break;
        case Action::ChargeCv:
          log.info("Starting charge CV... Voltage: " + fixed3(voltage) + "V");
          result = ramp.ramp_charge_to_voltage(voltage, *sink);
          break;
        case Action::Charge:
          log.info("Starting charge " + chemistry + "... Current: " + fixed3(current) + "A, Cells: " +
                   std::to_string(cells));
          result = op.charge_predefined(CHEMISTRIES.at(chemistry), current, cells, max_time, *sink);
          break;
        case Action::DischargeCc:
          log.info("Starting discharge CC... Current: " + fixed3(current) + "A, Cutoff: " + fixed3(voltage) + "V");
          result = op.discharge_cc(current, voltage, max_time, *sink);
          break;
        case Action::DischargeCp:
          log.info("Starting discharge CP... Power: " + fixed3(power) + "W, Cutoff: " + fixed3(voltage) + "V");
          result = op.discharge_cp(power, voltage, max_time, *sink);
          break;
        case Action::DischargeCv:
          log.info("Starting discharge CV... Voltage: " + fixed3(voltage) + "V");
          result = ramp.ramp_discharge_to_voltage(voltage, *sink);
          break;
        case Action::Monitor:
          log.info("Starting monitoring mode...");
          result = op.monitor(*sink);
          break;
      }
    }
  } // guard: STOP + DISCONNECT

  if (result == Error::Interrupted) {
    log.info("Operation interrupted by user");
  } else if (result != Error::None) {
    log.warning(std::string("Error: ") + to_string(result));
    std::cerr << "status=error reason=" << to_string(result) << "\n";
  }
  return exit_code_for(result);
}
