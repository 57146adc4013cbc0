#pragma once
// Test doubles shared by the session/controller tests:
//   ScriptedTransport  in-memory link; records writes, replays queued frames
//   RecordingPacer     no real sleeping; records waits, can simulate Ctrl-C
//   CapturingLogger    keeps every line for assertions
//   VectorSink         keeps every sample
//   make_response()    builds a well-formed 19-byte device frame

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ebc/device_session.hpp"
#include "ebc/frame_codec.hpp"
#include "ebc/log.hpp"
#include "ebc/measurement.hpp"
#include "ebc/pacer.hpp"
#include "ebc/protocol.hpp"
#include "ebc/transport/transport_base.hpp"
#include "ebc/value_codec.hpp"

namespace ebc::test {

using Bytes = std::vector<uint8_t>;

class ScriptedTransport : public transport::ITransport {
public:
  // knobs
  bool open_ok{true};
  transport::TxResult tx_result{transport::TxResult::Ok};
  std::deque<Bytes> frames;          // served in order; an empty entry is a read timeout
  std::optional<Bytes> repeat;       // served once `frames` runs dry

  // observations
  bool opened{false};
  int opens{0};
  int closes{0};
  int resets{0};
  int reads{0};
  transport::PortConfig last_cfg;
  std::vector<Bytes> writes;

  bool open(const transport::PortConfig& cfg) override {
    ++opens;
    last_cfg = cfg;
    opened = open_ok;
    return open_ok;
  }
  void close() override {
    if (opened) ++closes;
    opened = false;
  }
  bool is_open() const override { return opened; }

  transport::TxResult write(const uint8_t* data, std::size_t len) override {
    if (tx_result == transport::TxResult::Ok) writes.emplace_back(data, data + len);
    return tx_result;
  }

  transport::RxResult read(uint8_t* out, std::size_t want, std::size_t& got) override {
    ++reads;
    got = 0;
    Bytes next;
    if (!frames.empty()) { next = frames.front(); frames.pop_front(); }
    else if (repeat)     { next = *repeat; }
    if (next.empty()) return transport::RxResult::None;
    got = next.size() < want ? next.size() : want;
    for (std::size_t i = 0; i < got; ++i) out[i] = next[i];
    return transport::RxResult::Ok;
  }

  void reset_input() override { ++resets; }
  const char* name() const override { return "scripted"; }

  // Command bytes (frame[1]) of everything written so far.
  std::vector<uint8_t> codes() const {
    std::vector<uint8_t> c;
    for (const auto& w : writes) c.push_back(w.size() > 1 ? w[1] : 0);
    return c;
  }
};

class RecordingPacer : public Pacer {
public:
  std::vector<uint32_t> settles;
  std::vector<uint32_t> waits;
  std::size_t wait_budget{100000};   // wait_ms() starts returning false past this many calls

  void settle_ms(uint32_t ms) override { settles.push_back(ms); }
  bool wait_ms(uint32_t ms) override {
    waits.push_back(ms);
    return waits.size() <= wait_budget;
  }
};

class CapturingLogger : public Logger {
public:
  std::vector<std::pair<LogLevel, std::string>> lines;
  void write(LogLevel level, const std::string& msg) override { lines.emplace_back(level, msg); }

  std::size_t count(LogLevel level) const {
    std::size_t n = 0;
    for (const auto& l : lines) if (l.first == level) ++n;
    return n;
  }
};

class VectorSink : public MeasurementSink {
public:
  std::vector<Measurement> samples;
  void on_measurement(const Measurement& m) override { samples.push_back(m); }
};

// Raw protocol integers, not physical units: u_mv=4150 is 4.150 V.
struct Reading {
  uint8_t regime{0};
  int32_t i_ma{0};
  int32_t u_mv{0};
  int32_t charge{0};
  int32_t i_set_ma{0};
  int32_t u_cut{0};      // 10 mV units
  int32_t max_time{0};
  uint8_t ident{0x05};
};

inline Bytes make_response(const Reading& r, bool bad_checksum = false) {
  Bytes f(RESPONSE_LENGTH, 0);
  f[0] = INIT_BYTE;
  f[1] = r.regime;
  const int32_t vals[] = {r.i_ma, r.u_mv, r.charge};
  for (int i = 0; i < 3; ++i) encode_value(vals[i], &f[2 + 2 * i]);
  f[8] = 0x00;
  f[9] = 0x00;
  const int32_t set[] = {r.i_set_ma, r.u_cut, r.max_time};
  for (int i = 0; i < 3; ++i) encode_value(set[i], &f[10 + 2 * i]);
  f[16] = r.ident;
  f[17] = xor_checksum(&f[1], 16);
  if (bad_checksum) f[17] ^= 0x5A;
  f[18] = END_BYTE;
  return f;
}

// regime = state * 10 + mode
inline Bytes frame(uint8_t state, uint8_t mode, int32_t u_mv) {
  Reading r;
  r.regime = static_cast<uint8_t>(state * 10 + mode);
  r.u_mv = u_mv;
  return make_response(r);
}

// Decode the three 16-bit arguments of a written command frame.
inline std::vector<uint16_t> args_of(const Bytes& cmd) {
  std::vector<uint16_t> a;
  for (int i = 0; i < 3; ++i) {
    uint16_t v = 0;
    decode_value(&cmd[2 + 2 * i], 2, v);
    a.push_back(v);
  }
  return a;
}

// A session over a ScriptedTransport. Members are ordered so the session is
// destroyed before the logger and pacer it references.
struct Rig {
  CapturingLogger log;
  RecordingPacer pacer;
  ScriptedTransport* link{nullptr};
  std::unique_ptr<DeviceSession> session;

  explicit Rig(SessionConfig cfg = {}) {
    auto l = std::make_unique<ScriptedTransport>();
    link = l.get();
    session = std::make_unique<DeviceSession>(std::move(l), log, pacer, cfg);
  }

  // Connect and forget the handshake traffic.
  bool connect() {
    if (session->connect() != Error::None) return false;
    link->writes.clear();
    pacer.settles.clear();
    return true;
  }
};

} // namespace ebc::test
