// ============================================================================
// measurement.cpp: implementation for measurement.hpp
// ============================================================================

#include "ebc/measurement.hpp"
#include "ebc/protocol.hpp"

#include <iomanip>
#include <sstream>

namespace ebc {

std::string mode_name(uint8_t mode) {
  switch (mode) {
    case MODE_D_CC:   return "D_CC";      // shared with MODE_SYS
    case MODE_D_CP:   return "D_CP";
    case MODE_C_NIMH: return "C_NIMH";
    case MODE_C_NICD: return "C_NICD";
    case MODE_C_LIPO: return "C_LIPO";
    case MODE_C_LIFE: return "C_LIFE";
    case MODE_C_PB:   return "C_PB";
    case MODE_C_CCCV: return "C_CCCV";
    default:          return "UNKNOWN_" + std::to_string(unsigned(mode));
  }
}

std::string state_name(uint8_t state) {
  switch (state) {
    case STATE_IDLE:      return "IDLE";
    case STATE_WORKING:   return "WORKING";
    case STATE_COMPLETED: return "COMPLETED";
    default:              return "UNKNOWN_" + std::to_string(unsigned(state));
  }
}

static std::string hex2(uint8_t b) {
  std::ostringstream os;
  os << std::hex << std::setw(2) << std::setfill('0') << unsigned(b);
  return os.str();
}

// Plain shortest-ish decimal: 4.2 stays "4.2", 0.5 stays "0.5".
static std::string num(double v) {
  std::ostringstream os;
  os << std::setprecision(10) << v;
  return os.str();
}

std::string Measurement::regime_hex() const { return hex2(regime); }
std::string Measurement::ident_hex() const  { return hex2(ident); }

bool Measurement::is_terminal() const {
  return state == STATE_COMPLETED || state == STATE_IDLE;
}

std::vector<std::pair<std::string, std::string>> Measurement::fields() const {
  return {
    {"regime",        regime_hex()},
    {"mode",          mode_str()},
    {"state",         state_str()},
    {"i_measured",    num(i_measured)},
    {"u_measured",    num(u_measured)},
    {"stored_charge", std::to_string(stored_charge)},
    {"i_setting",     num(i_setting)},
    {"u_cutoff",      num(u_cutoff)},
    {"max_time",      std::to_string(max_time)},
    {"ident",         ident_hex()},
    {"unk1",          unk1},
    {"raw_data",      raw},
  };
}

} // namespace ebc
