#pragma once
/**
 * @file log.hpp
 * @brief Injected logger used by the codec, the session and the controllers.
 *
 * @details
 * There is no global logger. Whoever builds a DeviceSession or a controller
 * hands it a Logger&. The CLI uses StreamLogger on std::cerr (plus an
 * optional debug file); tests use NullLogger or a capturing subclass.
 *
 * Line format (StreamLogger):
 *   2026-10-19 14:03:11 [INFO] Command 0x05 sent successfully
 */

#include <cstdint>
#include <iosfwd>
#include <string>

namespace ebc {

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warning = 2, Error = 3 };

const char* to_string(LogLevel level);

class Logger {
public:
  virtual ~Logger() = default;

  virtual void write(LogLevel level, const std::string& msg) = 0;

  void debug(const std::string& msg)   { write(LogLevel::Debug, msg); }
  void info(const std::string& msg)    { write(LogLevel::Info, msg); }
  void warning(const std::string& msg) { write(LogLevel::Warning, msg); }
  void error(const std::string& msg)   { write(LogLevel::Error, msg); }
};

class NullLogger final : public Logger {
public:
  void write(LogLevel, const std::string&) override {}
};

/**
 * @brief Timestamped text logger over one console stream and an optional tee.
 *
 * The console and the tee have independent thresholds, so "--debug-file"
 * can capture DEBUG lines while the terminal stays at INFO.
 */
class StreamLogger final : public Logger {
public:
  explicit StreamLogger(std::ostream& console, LogLevel console_level = LogLevel::Info);

  void set_console_level(LogLevel level) { console_level_ = level; }
  void set_tee(std::ostream* tee, LogLevel tee_level = LogLevel::Debug);

  void write(LogLevel level, const std::string& msg) override;

private:
  std::ostream& console_;
  LogLevel      console_level_;
  std::ostream* tee_{nullptr};
  LogLevel      tee_level_{LogLevel::Debug};
};

// Small formatting helpers for log messages.
std::string fixed3(double v);                     // "%.3f"
std::string hex_byte(uint8_t b);                  // "0x05"

} // namespace ebc
