#pragma once

#include <chrono>

#include "wifitrack/core/Types.hpp"

namespace wifitrack {

// Monotonic time source injected into scan sources and the driver loop.
class IClock {
public:
  virtual ~IClock() = default;
  virtual Timestamp now() const = 0;
  virtual void sleepFor(Seconds duration) = 0;
};

// Wall-clock independent; now() counts from construction.
class SteadyClock : public IClock {
public:
  SteadyClock();

  Timestamp now() const override;
  void sleepFor(Seconds duration) override;

private:
  std::chrono::steady_clock::time_point origin;
};

// Deterministic clock for tests. sleepFor() advances time instead of blocking.
class ManualClock : public IClock {
public:
  explicit ManualClock(Timestamp start = 0.0) : current(start) {}

  Timestamp now() const override { return current; }
  void sleepFor(Seconds duration) override { advance(duration); }

  void set(Timestamp value) { current = value; }
  void advance(Seconds duration) {
    if (duration > 0.0) {
      current += duration;
    }
  }

private:
  Timestamp current = 0.0;
};

} // namespace wifitrack
