// ============================================================================
// sample_writer.cpp: implementation for sample_writer.hpp
// ============================================================================

#include "ebc/sample_writer.hpp"

#include <chrono>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

#include "nlohmann/json.hpp"

namespace ebc {

double epoch_seconds() {
  using namespace std::chrono;
  return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count() / 1e6;
}

static std::string time_text(double t) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(6) << t;
  return os.str();
}

// Quote only when the cell would break the row.
static std::string csv_cell(const std::string& s) {
  if (s.find_first_of(",\"\r\n") == std::string::npos) return s;
  std::string q = "\"";
  for (char c : s) {
    if (c == '"') q += '"';
    q += c;
  }
  q += '"';
  return q;
}

// ---------------------------------------------------------------------------
// CsvSampleWriter
// ---------------------------------------------------------------------------

CsvSampleWriter::CsvSampleWriter(std::ostream& out, bool write_header, EpochClock clock)
  : out_(out), header_pending_(write_header), clock_(std::move(clock)) {}

void CsvSampleWriter::on_measurement(const Measurement& m) {
  const auto cols = m.fields();

  if (header_pending_) {
    out_ << "time";
    for (const auto& kv : cols) out_ << ',' << kv.first;
    out_ << "\r\n";                                    // same line ending as Python's csv module
    header_pending_ = false;
  }

  out_ << time_text(clock_());
  for (const auto& kv : cols) out_ << ',' << csv_cell(kv.second);
  out_ << "\r\n";
  out_.flush();
  ++rows_;
}

// ---------------------------------------------------------------------------
// JsonLinesSampleWriter
// ---------------------------------------------------------------------------

JsonLinesSampleWriter::JsonLinesSampleWriter(std::ostream& out, EpochClock clock)
  : out_(out), clock_(std::move(clock)) {}

void JsonLinesSampleWriter::on_measurement(const Measurement& m) {
  nlohmann::ordered_json j;
  j["time"]          = clock_();
  j["regime"]        = m.regime_hex();
  j["mode"]          = m.mode_str();
  j["state"]         = m.state_str();
  j["i_measured"]    = m.i_measured;
  j["u_measured"]    = m.u_measured;
  j["stored_charge"] = m.stored_charge;
  j["i_setting"]     = m.i_setting;
  j["u_cutoff"]      = m.u_cutoff;
  j["max_time"]      = m.max_time;
  j["ident"]         = m.ident_hex();
  j["unk1"]          = m.unk1;
  j["raw_data"]      = m.raw;

  out_ << j.dump() << "\n";
  out_.flush();
  ++rows_;
}

} // namespace ebc
