// ============================================================================
// log.cpp: implementation for log.hpp
// ============================================================================

#include "ebc/log.hpp"

#include <chrono>         // system_clock for the timestamp prefix
#include <ctime>          // localtime_r, std::tm
#include <iomanip>        // std::put_time, std::setprecision, std::setw
#include <ostream>
#include <sstream>

namespace ebc {

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:   return "DEBUG";
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error:   return "ERROR";
  }
  return "?";
}

// ---------------------------------------------------------------------------
// stamp()
// -------
// Local wall-clock time as "YYYY-mm-dd HH:MM:SS". localtime_r keeps this
// reentrant; the session is single-threaded but the CLI signal path is not.
// ---------------------------------------------------------------------------
static std::string stamp() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&now, &tm);
  std::ostringstream os;
  os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return os.str();
}

StreamLogger::StreamLogger(std::ostream& console, LogLevel console_level)
  : console_(console), console_level_(console_level) {}

void StreamLogger::set_tee(std::ostream* tee, LogLevel tee_level) {
  tee_ = tee;
  tee_level_ = tee_level;
}

void StreamLogger::write(LogLevel level, const std::string& msg) {
  const bool to_console = level >= console_level_;
  const bool to_tee     = tee_ && level >= tee_level_;
  if (!to_console && !to_tee) return;                  // skip the clock call

  const std::string line = stamp() + " [" + to_string(level) + "] " + msg + "\n";
  if (to_console) { console_ << line; console_.flush(); }
  if (to_tee)     { *tee_ << line;    tee_->flush(); }
}

std::string fixed3(double v) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(3) << v;
  return os.str();
}

std::string hex_byte(uint8_t b) {
  std::ostringstream os;
  os << "0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << unsigned(b);
  return os.str();
}

} // namespace ebc
