// ============================================================================
// cli_support.cpp: implementation for cli_support.hpp
// ============================================================================

#include "ebc/cli_support.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace ebc {

Error select_action(const ActionFlags& f, Action& out) {
  const int n = int(f.charge_cccv) + int(f.charge_cv) + int(f.charge) +
                int(f.discharge_cc) + int(f.discharge_cp) + int(f.discharge_cv) +
                int(f.monitor);
  if (n > 1) return Error::ConflictingActions;

  if      (f.charge_cccv)  out = Action::ChargeCccv;
  else if (f.charge_cv)    out = Action::ChargeCv;
  else if (f.charge)       out = Action::Charge;
  else if (f.discharge_cc) out = Action::DischargeCc;
  else if (f.discharge_cp) out = Action::DischargeCp;
  else if (f.discharge_cv) out = Action::DischargeCv;
  else                     out = Action::Monitor;
  return Error::None;
}

OutputPolicy output_policy(bool force, bool append) {
  if (append) return OutputPolicy::Append;
  return force ? OutputPolicy::Overwrite : OutputPolicy::Refuse;
}

// ---------------------------------------------------------------------------
// open_output()
// -------------
// The header decision is made before opening: once the stream is open in
// truncate mode the old size is gone.
// ---------------------------------------------------------------------------
Error open_output(const std::string& path, OutputPolicy policy, std::ofstream& out,
                  bool& write_header) {
  std::error_code ec;
  const bool exists = fs::exists(path, ec);
  if (exists && policy == OutputPolicy::Refuse) return Error::OutputExists;

  const bool appending = exists && policy == OutputPolicy::Append;
  write_header = true;
  if (appending) {
    const auto size = fs::file_size(path, ec);
    if (!ec && size > 0) write_header = false;
  }

  out.open(path, appending ? std::ios::app : std::ios::trunc);
  if (!out) return Error::OutputOpenFailed;
  return Error::None;
}

int exit_code_for(Error e) {
  switch (e) {
    case Error::None:
    case Error::Interrupted:
      return 0;
    case Error::InvalidNibble:
    case Error::OutOfRange:
    case Error::InvalidLength:
    case Error::InvalidMode:
    case Error::ConflictingActions:
      return 2;
    default:
      return 1;
  }
}

} // namespace ebc
