#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal duplex byte channel the DeviceSession talks through.
 *
 * Header-only on purpose. The session never sees a file descriptor; tests
 * swap in a scripted in-memory channel.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace ebc::transport {

// Return codes kept simple.
enum class TxResult : uint8_t { Ok=0, Short=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

enum class Parity : uint8_t { None=0, Even=1, Odd=2 };

struct PortConfig {
  std::string path;              // e.g. /dev/ttyUSB0
  int baud{9600};
  Parity parity{Parity::Even};   // the EBC family talks 8E1
  int timeout_ms{1000};          // per read() call
};

/**
 * @brief Transport trait every implementation can rely on.
 *
 * Contract:
 *  - open(cfg) configures 8 data bits, cfg.parity, 1 stop bit, no flow control.
 *  - write(buf,len) sends the whole buffer or reports Short/Error.
 *  - read(out,want,got) blocks until `want` bytes arrived or the timeout
 *    expired; Ok with got>0 may still be short. None means nothing arrived.
 *  - reset_input() drops bytes received but not yet read.
 *  - close() is idempotent.
 *  - name() is a short identifier for logs.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool        open(const PortConfig& cfg) = 0;
  virtual void        close() = 0;
  virtual bool        is_open() const = 0;
  virtual TxResult    write(const uint8_t* data, std::size_t len) = 0;
  virtual RxResult    read(uint8_t* out, std::size_t want, std::size_t& got) = 0;
  virtual void        reset_input() = 0;
  virtual const char* name() const = 0;
};

} // namespace ebc::transport
