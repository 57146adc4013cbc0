#pragma once
/**
 * @file sample_writer.hpp
 * @brief MeasurementSink implementations that write rows to a stream.
 *
 * Both writers prefix a "time" column (Unix epoch seconds, fractional) and
 * flush after every row, so `tail -f` on the output shows each sample as the
 * device reports it.
 *
 *   CsvSampleWriter        header once, then one CSV row per sample
 *   JsonLinesSampleWriter  one JSON object per line, numbers kept numeric
 */

#include <cstddef>
#include <functional>
#include <iosfwd>

#include "ebc/measurement.hpp"

namespace ebc {

using EpochClock = std::function<double()>;

/// Wall-clock seconds since the Unix epoch.
double epoch_seconds();

class CsvSampleWriter final : public MeasurementSink {
public:
  /// @param write_header false when appending to a file that already has one.
  explicit CsvSampleWriter(std::ostream& out, bool write_header = true,
                           EpochClock clock = epoch_seconds);

  void on_measurement(const Measurement& m) override;

  std::size_t rows() const { return rows_; }

private:
  std::ostream& out_;
  bool          header_pending_;
  EpochClock    clock_;
  std::size_t   rows_{0};
};

class JsonLinesSampleWriter final : public MeasurementSink {
public:
  explicit JsonLinesSampleWriter(std::ostream& out, EpochClock clock = epoch_seconds);

  void on_measurement(const Measurement& m) override;

  std::size_t rows() const { return rows_; }

private:
  std::ostream& out_;
  EpochClock    clock_;
  std::size_t   rows_{0};
};

} // namespace ebc
