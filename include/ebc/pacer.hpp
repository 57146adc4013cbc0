#pragma once
/**
 * @file pacer.hpp
 * @brief Where the session and the controllers wait.
 *
 * @details
 * Two kinds of wait:
 *   - settle_ms(): slack the firmware needs after a command. Always served in
 *     full, even while shutting down, so a STOP followed by DISCONNECT still
 *     reaches the device in order.
 *   - wait_ms():   the polling cadence. Returns false when the driver has
 *     been asked to stop; the caller unwinds with Error::Interrupted.
 *     wait_ms(0) is a pure "should I keep going?" check.
 *
 * SteadyPacer is the real clock. It sleeps in 50 ms slices and watches an
 * atomic run flag that the CLI's signal handler clears.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>

namespace ebc {

class Pacer {
public:
  virtual ~Pacer() = default;
  virtual void settle_ms(uint32_t ms) = 0;
  virtual bool wait_ms(uint32_t ms) = 0;
};

class SteadyPacer final : public Pacer {
public:
  explicit SteadyPacer(const std::atomic<bool>* running = nullptr) : running_(running) {}

  void settle_ms(uint32_t ms) override {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  }

  bool wait_ms(uint32_t ms) override {
    uint32_t left = ms;
    while (keep_going()) {
      if (left == 0) return true;
      const uint32_t step = left < SLICE_MS ? left : SLICE_MS;
      std::this_thread::sleep_for(std::chrono::milliseconds(step));
      left -= step;
    }
    return false;
  }

private:
  static constexpr uint32_t SLICE_MS = 50;

  bool keep_going() const { return !running_ || running_->load(); }

  const std::atomic<bool>* running_;
};

} // namespace ebc
