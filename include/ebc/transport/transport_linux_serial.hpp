#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux USB/tty transport (header-only, termios, poll-based timeouts).
 *
 * Depends on: unistd.h, fcntl.h, termios.h, poll.h.
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "ebc/transport/transport_base.hpp"
#include <chrono>
#include <string>
#include <unistd.h>
#include <fcntl.h>
#include <termios.h>
#include <poll.h>
#include <cerrno>

namespace ebc::transport {

class LinuxSerial : public ITransport {
public:
  LinuxSerial() = default;
  ~LinuxSerial() override { close(); }

  LinuxSerial(const LinuxSerial&) = delete;
  LinuxSerial& operator=(const LinuxSerial&) = delete;

  bool open(const PortConfig& cfg) override {
    close();
    if (cfg.path.empty()) return false;
    timeout_ms_ = cfg.timeout_ms;

    fd_ = ::open(cfg.path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) return false;

    termios tio{};
    if (::tcgetattr(fd_, &tio) != 0) { close(); return false; }
    ::cfmakeraw(&tio);

    speed_t sp = B9600;
    switch (cfg.baud) {
      case 1200:   sp = B1200; break;
      case 2400:   sp = B2400; break;
      case 4800:   sp = B4800; break;
      case 9600:   sp = B9600; break;
      case 19200:  sp = B19200; break;
      case 38400:  sp = B38400; break;
      case 57600:  sp = B57600; break;
      case 115200: sp = B115200; break;
      default:     sp = B9600; break;
    }
    ::cfsetispeed(&tio, sp);
    ::cfsetospeed(&tio, sp);

    tio.c_cflag = (tio.c_cflag & ~CSIZE) | CS8;
    tio.c_cflag &= ~(PARENB | PARODD);
    if (cfg.parity == Parity::Even) tio.c_cflag |= PARENB;
    if (cfg.parity == Parity::Odd)  tio.c_cflag |= PARENB | PARODD;
    tio.c_cflag &= ~CSTOPB;        // 1 stop bit
    tio.c_cflag &= ~CRTSCTS;       // no hardware flow control
    tio.c_cflag |= CLOCAL | CREAD; // enable receiver, ignore modem ctrl
    tio.c_cc[VMIN]  = 0;           // poll() does the waiting
    tio.c_cc[VTIME] = 0;

    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) { close(); return false; }
    ::tcflush(fd_, TCIOFLUSH);
    return true;
  }

  void close() override {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  }

  bool is_open() const override { return fd_ >= 0; }

  TxResult write(const uint8_t* data, std::size_t len) override {
    if (fd_ < 0 || !data || !len) return TxResult::Error;
    ssize_t w = ::write(fd_, data, len);
    if (w < 0) return TxResult::Error;
    ::tcdrain(fd_);
    return (static_cast<std::size_t>(w) == len) ? TxResult::Ok : TxResult::Short;
  }

  // Accumulate until `want` bytes or the deadline, like a blocking read(n).
  RxResult read(uint8_t* out, std::size_t want, std::size_t& got) override {
    got = 0;
    if (fd_ < 0 || !out || want == 0) return RxResult::Error;

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms_);

    while (got < want) {
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - clock::now()).count();
      if (left <= 0) break;

      pollfd pfd{fd_, POLLIN, 0};
      int pr = ::poll(&pfd, 1, static_cast<int>(left));
      if (pr == 0) break;                          // timeout
      if (pr < 0) {
        if (errno == EINTR) break;                 // signal: let the caller look at its flag
        return RxResult::Error;
      }
      ssize_t n = ::read(fd_, out + got, want - got);
      if (n > 0) got += static_cast<std::size_t>(n);
      else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) return RxResult::Error;
    }
    return got > 0 ? RxResult::Ok : RxResult::None;
  }

  void reset_input() override {
    if (fd_ >= 0) ::tcflush(fd_, TCIFLUSH);
  }

  const char* name() const override { return "linux-serial"; }

private:
  int fd_{-1};
  int timeout_ms_{1000};
};

} // namespace ebc::transport
