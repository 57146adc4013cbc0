#pragma once
/**
 * @file cli_support.hpp
 * @brief Decisions ebc-cli makes before touching the device.
 *
 * Kept out of main() so the rules can be tested without a serial port:
 *  - select_action(): at most one action flag, monitor when none.
 *  - open_output(): overwrite/append policy for the sample file.
 *  - exit_code_for(): Error -> process exit code.
 */

#include <cstdint>
#include <fstream>
#include <string>

#include "ebc/error.hpp"

namespace ebc {

enum class Action : uint8_t {
  Monitor = 0,
  ChargeCccv,
  ChargeCv,
  Charge,
  DischargeCc,
  DischargeCp,
  DischargeCv
};

/// One bool per action option, as CLI11 fills them.
struct ActionFlags {
  bool charge_cccv{false};
  bool charge_cv{false};
  bool charge{false};
  bool discharge_cc{false};
  bool discharge_cp{false};
  bool discharge_cv{false};
  bool monitor{false};
};

/// Error::ConflictingActions when more than one flag is set; Monitor when none.
Error select_action(const ActionFlags& flags, Action& out);

enum class OutputPolicy : uint8_t {
  Refuse = 0,   // existing file is an error
  Overwrite,    // -f
  Append        // -a (wins over -f)
};

OutputPolicy output_policy(bool force, bool append);

/**
 * @brief Open `path` for sample output.
 *
 * - Refuse + existing file -> Error::OutputExists, file untouched.
 * - Append keeps existing content; write_header is false only when the file
 *   already has bytes in it.
 * - Overwrite (or a new file) truncates; write_header is true.
 * - Error::OutputOpenFailed when the stream won't open.
 */
Error open_output(const std::string& path, OutputPolicy policy, std::ofstream& out,
                  bool& write_header);

/// 0 done or interrupted, 2 bad arguments or values, 1 everything else.
int exit_code_for(Error e);

} // namespace ebc
