#pragma once
/**
 * @file measurement.hpp
 * @brief One decoded response frame, and the sink interface that consumes it.
 *
 * A Measurement is a value: it is produced per successful read, handed to a
 * MeasurementSink, and forgotten. Nothing in the core keeps it.
 */

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ebc {

/// Mode name for the low decimal digit of the regime byte ("D_CC", "C_LIPO", ... or "UNKNOWN_<n>").
std::string mode_name(uint8_t mode);

/// State name for the high decimal digit of the regime byte ("IDLE", "WORKING", "COMPLETED" or "UNKNOWN_<n>").
std::string state_name(uint8_t state);

struct Measurement {
  uint8_t  regime{0};          // raw regime byte
  uint8_t  mode{0};            // regime % 10
  uint8_t  state{0};           // regime / 10

  double   i_measured{0};      // A
  double   u_measured{0};      // V
  uint16_t stored_charge{0};   // raw decoded units
  double   i_setting{0};       // A
  double   u_cutoff{0};        // V
  uint16_t max_time{0};        // raw decoded units
  uint8_t  ident{0};

  std::string unk1;            // two opaque bytes, hex
  std::string raw;             // whole frame, hex

  std::string regime_hex() const;
  std::string ident_hex() const;
  std::string mode_str() const  { return mode_name(mode); }
  std::string state_str() const { return state_name(state); }

  /// IDLE or COMPLETED: the device is no longer charging or discharging.
  bool is_terminal() const;

  /**
   * @brief Ordered (name, text) pairs in wire order:
   *        regime, mode, state, i_measured, u_measured, stored_charge,
   *        i_setting, u_cutoff, max_time, ident, unk1, raw_data.
   */
  std::vector<std::pair<std::string, std::string>> fields() const;
};

/**
 * @brief Consumer of decoded samples. Called synchronously from the polling
 *        loop, once per successful read.
 */
class MeasurementSink {
public:
  virtual ~MeasurementSink() = default;
  virtual void on_measurement(const Measurement& m) = 0;
};

} // namespace ebc
